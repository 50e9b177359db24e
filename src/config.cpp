#include "config.h"

#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cascade {
namespace {

std::optional<std::int64_t> positive(sol::table const &globals,
                                     std::string_view key,
                                     std::string const &context) {
  auto const value{ sol_util_get_optional<std::int64_t>(globals, key, context) };
  if (value && *value <= 0) {
    throw std::runtime_error(context + ": " + std::string{ key } + " must be positive");
  }
  return value;
}

}  // namespace

session_cfg config_load(std::filesystem::path const &path, session_cfg base) {
  tui::debug("Loading config from file: %s", path.string().c_str());
  return config_load(util_load_text_file(path), path, std::move(base));
}

session_cfg config_load(std::string_view script,
                        std::filesystem::path const &path,
                        session_cfg base) {
  auto state{ sol_util_make_lua_state() };
  std::string const context{ path.filename().string() };

  if (sol::protected_function_result const result{
          state->safe_script(script, sol::script_pass_on_error, "@" + path.string()) };
      !result.valid()) {
    sol::error err = result;
    throw std::runtime_error("Failed to execute config script: " + std::string{ err.what() });
  }

  sol::table const globals{ state->globals() };
  session_cfg cfg{ std::move(base) };

  if (auto const v{ positive(globals, "timeout_ms", context) }) {
    cfg.kernel.timeout = std::chrono::milliseconds{ *v };
  }
  if (auto const v{ positive(globals, "max_output_bytes", context) }) {
    cfg.kernel.max_output_bytes = static_cast<std::size_t>(*v);
  }
  if (auto const v{ positive(globals, "max_rows", context) }) {
    cfg.kernel.rich.max_rows = static_cast<std::size_t>(*v);
  }
  if (auto const v{ positive(globals, "max_array_elements", context) }) {
    cfg.kernel.rich.max_array_elements = static_cast<std::size_t>(*v);
  }

  tui::debug("config %s: timeout %lld ms, output cap %zu bytes",
             context.c_str(),
             static_cast<long long>(cfg.kernel.timeout.count()),
             cfg.kernel.max_output_bytes);
  return cfg;
}

}  // namespace cascade
