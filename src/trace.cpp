#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace cascade {

namespace {

std::string_view bool_string(bool value) { return value ? "true" : "false"; }

std::tm make_utc_tm(std::time_t time) {
  std::tm result{};

#if defined(_WIN32)
  gmtime_s(&result, &time);
#else
  gmtime_r(&time, &result);
#endif

  return result;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm const utc_tm{ make_utc_tm(timestamp) };

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

void append_kv(std::string &out, char const *key, bool value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(value ? "true" : "false");
}

}  // namespace

cell_run_trace_scope::cell_run_trace_scope(std::string cell_id)
    : cell{ std::move(cell_id) }, start{ std::chrono::steady_clock::now() } {
  CASCADE_TRACE_EMIT((trace_events::cell_run_start{ .cell = cell }));
}

cell_run_trace_scope::~cell_run_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  CASCADE_TRACE_EMIT((trace_events::cell_run_complete{
      .cell = cell,
      .status = status,
      .duration_ms = static_cast<std::int64_t>(duration_ms),
  }));
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(match{
                        TRACE_NAME(cell_analyzed),
                        TRACE_NAME(graph_validated),
                        TRACE_NAME(plan_computed),
                        TRACE_NAME(plan_abandoned),
                        TRACE_NAME(request_coalesced),
                        TRACE_NAME(cell_run_start),
                        TRACE_NAME(cell_run_complete),
                        TRACE_NAME(worker_spawned),
                        TRACE_NAME(worker_exited),
                        TRACE_NAME(worker_killed),
                        TRACE_NAME(namespace_committed),
                        TRACE_NAME(symbols_retired),
                    },
                    event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::cell_analyzed const &value) {
            std::ostringstream oss;
            oss << "cell_analyzed cell=" << value.cell << " defines=" << value.defines
                << " uses=" << value.uses << " ok=" << bool_string(value.ok);
            return oss.str();
          },
          [](trace_events::graph_validated const &value) {
            std::ostringstream oss;
            oss << "graph_validated cell=" << value.cell << " ok=" << bool_string(value.ok);
            if (!value.ok) { oss << " fault=" << value.fault; }
            return oss.str();
          },
          [](trace_events::plan_computed const &value) {
            std::ostringstream oss;
            oss << "plan_computed trigger=" << value.trigger << " count=" << value.count
                << " cells=[" << value.cells << "]";
            return oss.str();
          },
          [](trace_events::plan_abandoned const &value) {
            std::ostringstream oss;
            oss << "plan_abandoned failed_cell=" << value.failed_cell
                << " remaining=" << value.remaining;
            return oss.str();
          },
          [](trace_events::request_coalesced const &value) {
            return "request_coalesced cell=" + value.cell;
          },
          [](trace_events::cell_run_start const &value) {
            return "cell_run_start cell=" + value.cell;
          },
          [](trace_events::cell_run_complete const &value) {
            std::ostringstream oss;
            oss << "cell_run_complete cell=" << value.cell << " status=" << value.status
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::worker_spawned const &value) {
            std::ostringstream oss;
            oss << "worker_spawned cell=" << value.cell << " pid=" << value.pid;
            return oss.str();
          },
          [](trace_events::worker_exited const &value) {
            std::ostringstream oss;
            oss << "worker_exited cell=" << value.cell << " pid=" << value.pid
                << " exit_code=" << value.exit_code << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::worker_killed const &value) {
            std::ostringstream oss;
            oss << "worker_killed cell=" << value.cell << " pid=" << value.pid
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::namespace_committed const &value) {
            std::ostringstream oss;
            oss << "namespace_committed cell=" << value.cell << " symbols=" << value.symbols
                << " bytes=" << value.bytes;
            return oss.str();
          },
          [](trace_events::symbols_retired const &value) {
            std::ostringstream oss;
            oss << "symbols_retired cell=" << value.cell << " count=" << value.count;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  auto const append_cell{ [&](std::string_view value) { append_kv(output, "cell", value); } };

  std::visit(match{
                 [&](trace_events::cell_analyzed const &value) {
                   append_cell(value.cell);
                   append_kv(output, "defines", value.defines);
                   append_kv(output, "uses", value.uses);
                   append_kv(output, "ok", value.ok);
                 },
                 [&](trace_events::graph_validated const &value) {
                   append_cell(value.cell);
                   append_kv(output, "ok", value.ok);
                   if (!value.ok) { append_kv(output, "fault", value.fault); }
                 },
                 [&](trace_events::plan_computed const &value) {
                   append_kv(output, "trigger", value.trigger);
                   append_kv(output, "cells", value.cells);
                   append_kv(output, "count", value.count);
                 },
                 [&](trace_events::plan_abandoned const &value) {
                   append_kv(output, "failed_cell", value.failed_cell);
                   append_kv(output, "remaining", value.remaining);
                 },
                 [&](trace_events::request_coalesced const &value) {
                   append_cell(value.cell);
                 },
                 [&](trace_events::cell_run_start const &value) { append_cell(value.cell); },
                 [&](trace_events::cell_run_complete const &value) {
                   append_cell(value.cell);
                   append_kv(output, "status", value.status);
                   append_kv(output, "duration_ms", value.duration_ms);
                 },
                 [&](trace_events::worker_spawned const &value) {
                   append_cell(value.cell);
                   append_kv(output, "pid", value.pid);
                 },
                 [&](trace_events::worker_exited const &value) {
                   append_cell(value.cell);
                   append_kv(output, "pid", value.pid);
                   append_kv(output, "exit_code", static_cast<std::int64_t>(value.exit_code));
                   append_kv(output, "duration_ms", value.duration_ms);
                 },
                 [&](trace_events::worker_killed const &value) {
                   append_cell(value.cell);
                   append_kv(output, "pid", value.pid);
                   append_kv(output, "reason", value.reason);
                 },
                 [&](trace_events::namespace_committed const &value) {
                   append_cell(value.cell);
                   append_kv(output, "symbols", value.symbols);
                   append_kv(output, "bytes", value.bytes);
                 },
                 [&](trace_events::symbols_retired const &value) {
                   append_cell(value.cell);
                   append_kv(output, "count", value.count);
                 },
             },
             event);

  output.push_back('}');
  return output;
}

}  // namespace cascade
