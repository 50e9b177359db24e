#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace cascade {

// Runs every cell of a notebook file once, in dependency order.
class cmd_run : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_run> {
    std::filesystem::path notebook_path;
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_run(cfg cfg, session_cfg const &session);

  bool execute() override;

 private:
  cfg cfg_;
  session_cfg session_cfg_;
};

}  // namespace cascade
