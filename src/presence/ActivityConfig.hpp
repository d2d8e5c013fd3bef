#ifndef __DRP_ACTIVITY_CONFIG__
#define __DRP_ACTIVITY_CONFIG__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PresenceError.hpp"

namespace drp {
/**
 * @brief Presence settings read from an INI file (see drp.cfg).
 *
 * Sections: [Presence] client_id; [Activity] state, details, start, end,
 * large_image, large_text, small_image, small_text, buttonN_label,
 * buttonN_url; [Debug] verbose, logdir.  Empty values count as unset.
 */
struct ActivityConfig {
  /** @brief Discord accepts at most this many buttons. */
  static const int MAX_BUTTONS = 2;

  struct Button {
    string label;
    string url;
  };

  string clientId;

  string state;
  string details;
  optional<int64_t> start;
  optional<int64_t> end;
  string largeImage;
  string largeText;
  string smallImage;
  string smallText;
  vector<Button> buttons;

  optional<int> verbose;
  string logdir;

  /** @brief Loads a config file.  @throws ConfigError */
  static ActivityConfig loadFile(const string& filename);
  /** @brief Loads config text held in memory.  @throws ConfigError */
  static ActivityConfig loadString(const string& data);

  /**
   * @brief Builds the activity payload.  Returns JSON null when no activity
   * field is set.
   */
  json toActivity() const;
};
}  // namespace drp

#endif  // __DRP_ACTIVITY_CONFIG__
