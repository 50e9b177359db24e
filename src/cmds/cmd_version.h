#pragma once

#include "cmd.h"

#include <functional>

namespace CLI { class App; }

namespace cascade {

class cmd_version : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_version> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_version(cfg cfg, session_cfg const &session);

  bool execute() override;

 private:
  cfg cfg_;
};

}  // namespace cascade
