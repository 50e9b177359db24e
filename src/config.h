#pragma once

#include "session.h"

#include <filesystem>
#include <string_view>

namespace cascade {

// Evaluates a Lua configuration file and overlays the settings it defines on `base`.
// Recognized globals: timeout_ms, max_output_bytes, max_rows, max_array_elements.
// Throws std::runtime_error on script errors, wrong types or non-positive values.
session_cfg config_load(std::filesystem::path const &path, session_cfg base = {});
session_cfg config_load(std::string_view script,
                        std::filesystem::path const &path,
                        session_cfg base = {});

}  // namespace cascade
