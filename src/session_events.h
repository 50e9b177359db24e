#pragma once

#include "kernel.h"

#include <cstddef>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace cascade {

namespace session_events {

struct cell_added {
  std::string cell_id;
  std::size_t position;
};

struct cell_deleted {
  std::string cell_id;
};

struct plan_queued {
  std::vector<std::string> cell_ids;  // run order
};

struct execution_started {
  std::string cell_id;
};

struct execution_result {
  std::string cell_id;
  ::cascade::execution_result result;
};

struct structural_error {
  std::string kind;  // "duplicate_symbol" or "circular_dependency"
  std::string detail;
  std::vector<std::string> cell_ids;
};

struct plan_abandoned {
  std::string failed_cell_id;
  std::vector<std::string> cell_ids;  // never started
};

}  // namespace session_events

using session_event = std::variant<session_events::cell_added,
                                   session_events::cell_deleted,
                                   session_events::plan_queued,
                                   session_events::execution_started,
                                   session_events::execution_result,
                                   session_events::structural_error,
                                   session_events::plan_abandoned>;

// Receives every event in emission order. Called from the editing thread and from the
// executor thread, never concurrently. Must not block on the session.
using session_sink = std::function<void(session_event const &)>;

}  // namespace cascade
