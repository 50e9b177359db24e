#pragma once

#include "cmd.h"

#include <cstddef>
#include <functional>
#include <istream>
#include <string_view>

namespace CLI { class App; }

namespace cascade {

// JSON-lines adapter: one command per input line, one event per output line.
class cmd_serve : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_serve> {};

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  cmd_serve(cfg cfg, session_cfg const &session);

  bool execute() override;

  // Serves until `in` is exhausted, then waits for pending runs. Returns the number of
  // lines that were rejected.
  std::size_t serve(std::istream &in, std::function<void(std::string_view)> const &write);

 private:
  cfg cfg_;
  session_cfg session_cfg_;
};

}  // namespace cascade
