#pragma once

#include "cmds/cmd_run.h"
#include "cmds/cmd_serve.h"
#include "cmds/cmd_version.h"
#include "tui.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cascade {

struct cli_args {
  using cmd_cfg_t = std::variant<cmd_run::cfg, cmd_serve::cfg, cmd_version::cfg>;

  std::optional<cmd_cfg_t> cmd_cfg;
  std::optional<std::filesystem::path> config_path;
  std::optional<std::int64_t> timeout_ms;  // overrides the config file
  std::optional<tui::level> verbosity;
  bool decorated_logging{ false };
  std::vector<tui::trace_output_spec> trace_outputs;
  std::string cli_output;
};

cli_args cli_parse(int argc, char **argv);

// Defaults, then the config file, then command-line overrides.
session_cfg cli_session_cfg(cli_args const &args);

}  // namespace cascade
