#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace cascade {

namespace trace_events {

struct cell_analyzed {
  std::string cell;
  std::int64_t defines;
  std::int64_t uses;
  bool ok;
};

struct graph_validated {
  std::string cell;
  bool ok;
  std::string fault;
};

struct plan_computed {
  std::string trigger;
  std::string cells;  // comma separated, in run order
  std::int64_t count;
};

struct plan_abandoned {
  std::string failed_cell;
  std::int64_t remaining;
};

struct request_coalesced {
  std::string cell;
};

struct cell_run_start {
  std::string cell;
};

struct cell_run_complete {
  std::string cell;
  std::string status;
  std::int64_t duration_ms;
};

struct worker_spawned {
  std::string cell;
  std::int64_t pid;
};

struct worker_exited {
  std::string cell;
  std::int64_t pid;
  int exit_code;
  std::int64_t duration_ms;
};

struct worker_killed {
  std::string cell;
  std::int64_t pid;
  std::string reason;  // "timeout" or "interrupt"
};

struct namespace_committed {
  std::string cell;
  std::int64_t symbols;
  std::int64_t bytes;
};

struct symbols_retired {
  std::string cell;
  std::int64_t count;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::cell_analyzed,
                                   trace_events::graph_validated,
                                   trace_events::plan_computed,
                                   trace_events::plan_abandoned,
                                   trace_events::request_coalesced,
                                   trace_events::cell_run_start,
                                   trace_events::cell_run_complete,
                                   trace_events::worker_spawned,
                                   trace_events::worker_exited,
                                   trace_events::worker_killed,
                                   trace_events::namespace_committed,
                                   trace_events::symbols_retired>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

// Emits cell_run_start on construction and cell_run_complete on destruction.
struct cell_run_trace_scope {
  std::string cell;
  std::string status{ "error" };
  std::chrono::steady_clock::time_point start;

  explicit cell_run_trace_scope(std::string cell_id);
  ~cell_run_trace_scope();
};

}  // namespace cascade

#define CASCADE_TRACE_UNLIKELY [[unlikely]]

#define CASCADE_TRACE_EMIT(event_expr) \
  do { \
    if (::cascade::tui::g_trace_enabled) CASCADE_TRACE_UNLIKELY { \
        ::cascade::tui::trace event_expr; \
      } \
  } while (0)

#define CASCADE_TRACE_CELL_ANALYZED(cell_value, defines_value, uses_value, ok_value) \
  CASCADE_TRACE_EMIT((::cascade::trace_events::cell_analyzed{ \
      .cell = (cell_value), \
      .defines = static_cast<std::int64_t>(defines_value), \
      .uses = static_cast<std::int64_t>(uses_value), \
      .ok = (ok_value), \
  }))

#define CASCADE_TRACE_GRAPH_VALIDATED(cell_value, ok_value, fault_value) \
  CASCADE_TRACE_EMIT((::cascade::trace_events::graph_validated{ \
      .cell = (cell_value), \
      .ok = (ok_value), \
      .fault = (fault_value), \
  }))

#define CASCADE_TRACE_PLAN_COMPUTED(trigger_value, cells_value, count_value) \
  CASCADE_TRACE_EMIT((::cascade::trace_events::plan_computed{ \
      .trigger = (trigger_value), \
      .cells = (cells_value), \
      .count = static_cast<std::int64_t>(count_value), \
  }))

#define CASCADE_TRACE_PLAN_ABANDONED(failed_cell_value, remaining_value) \
  CASCADE_TRACE_EMIT((::cascade::trace_events::plan_abandoned{ \
      .failed_cell = (failed_cell_value), \
      .remaining = static_cast<std::int64_t>(remaining_value), \
  }))

#define CASCADE_TRACE_REQUEST_COALESCED(cell_value) \
  CASCADE_TRACE_EMIT((::cascade::trace_events::request_coalesced{ \
      .cell = (cell_value), \
  }))

#define CASCADE_TRACE_WORKER_SPAWNED(cell_value, pid_value) \
  CASCADE_TRACE_EMIT((::cascade::trace_events::worker_spawned{ \
      .cell = (cell_value), \
      .pid = static_cast<std::int64_t>(pid_value), \
  }))

#define CASCADE_TRACE_WORKER_EXITED(cell_value, pid_value, exit_code_value, duration_value) \
  CASCADE_TRACE_EMIT((::cascade::trace_events::worker_exited{ \
      .cell = (cell_value), \
      .pid = static_cast<std::int64_t>(pid_value), \
      .exit_code = (exit_code_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define CASCADE_TRACE_WORKER_KILLED(cell_value, pid_value, reason_value) \
  CASCADE_TRACE_EMIT((::cascade::trace_events::worker_killed{ \
      .cell = (cell_value), \
      .pid = static_cast<std::int64_t>(pid_value), \
      .reason = (reason_value), \
  }))

#define CASCADE_TRACE_NAMESPACE_COMMITTED(cell_value, symbols_value, bytes_value) \
  CASCADE_TRACE_EMIT((::cascade::trace_events::namespace_committed{ \
      .cell = (cell_value), \
      .symbols = static_cast<std::int64_t>(symbols_value), \
      .bytes = static_cast<std::int64_t>(bytes_value), \
  }))

#define CASCADE_TRACE_SYMBOLS_RETIRED(cell_value, count_value) \
  CASCADE_TRACE_EMIT((::cascade::trace_events::symbols_retired{ \
      .cell = (cell_value), \
      .count = static_cast<std::int64_t>(count_value), \
  }))
