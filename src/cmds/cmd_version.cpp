#include "cmd_version.h"

#include "tui.h"

#include "CLI11.hpp"
#include "sol/sol.hpp"

extern "C" {
#include "lua.h"
}

#ifndef CASCADE_VERSION_STR
#error "CASCADE_VERSION_STR must be defined by the build system"
#endif

namespace cascade {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg, session_cfg const & /*session*/)
    : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("cascade version %s", CASCADE_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace cascade
