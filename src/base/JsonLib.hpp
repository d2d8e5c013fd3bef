#pragma once

#include "nlohmann/json.hpp"

/**
 * @brief Lightweight wrapper that exposes `nlohmann::json` as `json`.
 */
using json = nlohmann::json;
