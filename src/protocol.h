#pragma once

#include "session.h"
#include "session_events.h"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace cascade {

namespace session_commands {

struct edit_cell {
  std::string cell_id;
  std::string source;
};

struct execute_cell {
  std::string cell_id;
};

struct add_cell {
  std::optional<std::size_t> position;
  std::optional<std::string> cell_id;
  std::string source;
};

struct delete_cell {
  std::string cell_id;
};

struct interrupt {};
struct execute_all {};
struct reset {};

}  // namespace session_commands

using session_command = std::variant<session_commands::edit_cell,
                                     session_commands::execute_cell,
                                     session_commands::add_cell,
                                     session_commands::delete_cell,
                                     session_commands::interrupt,
                                     session_commands::execute_all,
                                     session_commands::reset>;

class protocol_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// One JSON object per line: {"type":"edit_cell","cell_id":"a","source":"x = 1"}.
session_command protocol_parse_command(std::string_view line);

// Single-line JSON rendering of an event.
std::string protocol_event_to_json(session_event const &event);

// Forwards a command to the session. Throws std::invalid_argument for unknown cells.
void protocol_apply(session &s, session_command const &command);

}  // namespace cascade
