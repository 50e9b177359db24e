#include "cli.h"

#include "config.h"
#include "tui.h"

#include "CLI11.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cascade {

cli_args cli_parse(int argc, char **argv) {
  CLI::App app{ "cascade - reactive Lua notebooks" };

  bool verbose{ false };
  app.add_flag(
      "--verbose",
      verbose,
      "Enable decorated verbose logging (prefix stderr with timestamp and level)");

  std::string trace_spec;
  auto *trace_option{ app.add_option("--trace",
                                     trace_spec,
                                     "Enable trace logging. Provide a comma-separated "
                                     "list: 'stderr' for human-readable stderr and/or "
                                     "'file:<path>' for JSONL file output. Defaults to "
                                     "stderr if no value provided.") };
  trace_option->expected(0, 1);

  std::string config_path;
  auto *config_option{
    app.add_option("--config", config_path, "Lua configuration file")->check(CLI::ExistingFile)
  };

  std::int64_t timeout_ms{ 0 };
  auto *timeout_option{ app.add_option("--timeout", timeout_ms, "Per-cell timeout in ms")
                            ->check(CLI::PositiveNumber) };

  bool version_flag{ false };
  app.add_flag("-v,--version", version_flag, "Show version information");

  std::optional<cli_args::cmd_cfg_t> cmd_cfg;
  cmd_serve::register_cli(app, [&cmd_cfg](cmd_serve::cfg cfg) { cmd_cfg = cfg; });
  cmd_run::register_cli(app, [&cmd_cfg](cmd_run::cfg cfg) { cmd_cfg = std::move(cfg); });
  cmd_version::register_cli(app, [&cmd_cfg](cmd_version::cfg cfg) { cmd_cfg = cfg; });

  cli_args args{};

  try {
    app.parse(argc, argv);
  } catch (CLI::CallForHelp const &) {
    args.cli_output = app.help();
  } catch (CLI::ParseError const &e) { args.cli_output = std::string(e.what()); }

  if (config_option->count() > 0) { args.config_path = std::filesystem::path{ config_path }; }
  if (timeout_option->count() > 0) { args.timeout_ms = timeout_ms; }

  // --trace defaults to stderr if no value provided
  bool const trace_requested{ trace_option->count() > 0 };
  std::vector<std::string> trace_specs_tokens;

  if (trace_requested) {
    if (trace_spec.empty()) {
      trace_specs_tokens.push_back("stderr");
    } else {
      for (std::string_view sv{ trace_spec }; !sv.empty();) {
        auto const pos{ sv.find(',') };
        auto const token{ sv.substr(0, pos) };
        if (!token.empty()) { trace_specs_tokens.emplace_back(token); }
        sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
      }
    }
  }

  if (!trace_specs_tokens.empty()) {
    args.verbosity = tui::level::TUI_TRACE;
    args.decorated_logging = true;
    for (auto const &spec : trace_specs_tokens) {
      if (spec == "stderr") {
        args.trace_outputs.push_back({ tui::trace_output_type::std_err, std::nullopt });
      } else if (spec.starts_with("file:") && spec.size() > 5) {
        args.trace_outputs.push_back(
            { tui::trace_output_type::file, std::filesystem::path{ spec.substr(5) } });
      } else {
        args.cli_output = "Invalid trace output spec: " + spec;
        args.trace_outputs.clear();
        cmd_cfg.reset();
        version_flag = false;
        break;
      }
    }
  } else if (verbose) {
    args.verbosity = tui::level::TUI_DEBUG;
    args.decorated_logging = true;
  } else {
    args.verbosity = tui::level::TUI_INFO;
    args.decorated_logging = false;
  }

  if (version_flag) {
    args.cmd_cfg = cmd_version::cfg{};
    return args;
  }

  if (cmd_cfg) {
    args.cmd_cfg = std::move(*cmd_cfg);
  } else if (args.cli_output.empty()) {
    args.cli_output = app.help();
  }

  return args;
}

session_cfg cli_session_cfg(cli_args const &args) {
  session_cfg cfg{};
  if (args.config_path) { cfg = config_load(*args.config_path, cfg); }
  if (args.timeout_ms) { cfg.kernel.timeout = std::chrono::milliseconds{ *args.timeout_ms }; }
  return cfg;
}

}  // namespace cascade
