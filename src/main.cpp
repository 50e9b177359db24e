#include "cli.h"
#include "tui.h"

#include <cstdlib>
#include <variant>

int main(int argc, char **argv) {
  cascade::tui::init();

  auto args{ cascade::cli_parse(argc, argv) };
  cascade::tui::configure_trace_outputs(args.trace_outputs);
  cascade::tui::scope tui_scope{ args.verbosity, args.decorated_logging };

  if (!args.cli_output.empty()) {
    if (!args.cmd_cfg.has_value()) {
      cascade::tui::error("%s", args.cli_output.c_str());
      return EXIT_FAILURE;
    }
    cascade::tui::info("%s", args.cli_output.c_str());
  }

  if (!args.cmd_cfg.has_value()) { return EXIT_FAILURE; }

  bool ok{ false };
  try {
    auto const session{ cascade::cli_session_cfg(args) };
    auto cmd{ std::visit([&session](auto const &cfg) { return cascade::cmd::create(cfg, session); },
                         *args.cmd_cfg) };
    ok = cmd->execute();
  } catch (std::exception const &ex) {
    cascade::tui::error("Execution failed: %s", ex.what());
    return EXIT_FAILURE;
  }

  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
