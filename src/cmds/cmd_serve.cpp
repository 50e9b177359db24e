#include "cmd_serve.h"

#include "protocol.h"
#include "tui.h"

#include "CLI11.hpp"

#include <iostream>
#include <string>

namespace cascade {

void cmd_serve::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("serve", "Serve a notebook over JSON lines on stdin/stdout") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_serve::cmd_serve(cmd_serve::cfg cfg, session_cfg const &session)
    : cfg_{ std::move(cfg) }, session_cfg_{ session } {}

bool cmd_serve::execute() {
  if (tui::is_tty()) { tui::info("reading JSON commands from stdin, one per line (Ctrl-D ends)"); }
  serve(std::cin, [](std::string_view line) { tui::write_stdout(line); });
  return true;
}

std::size_t cmd_serve::serve(std::istream &in,
                             std::function<void(std::string_view)> const &write) {
  session s{ session_cfg_, [&write](session_event const &event) {
              write(protocol_event_to_json(event) + "\n");
            } };

  std::size_t rejected{ 0 };
  std::size_t line_no{ 0 };
  for (std::string line; std::getline(in, line);) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) { continue; }
    try {
      protocol_apply(s, protocol_parse_command(line));
    } catch (protocol_error const &e) {
      ++rejected;
      tui::warn("line %zu: %s", line_no, e.what());
    } catch (std::invalid_argument const &e) {
      ++rejected;
      tui::warn("line %zu: %s", line_no, e.what());
    }
  }

  tui::debug("input closed after %zu lines, waiting for pending runs", line_no);
  s.wait_idle();
  return rejected;
}

}  // namespace cascade
