#include "protocol.h"

#include "picojson.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace cascade {
namespace {

picojson::object parse_object(std::string_view line) {
  picojson::value root;
  std::string const err{ picojson::parse(root, std::string{ line }) };
  if (!err.empty()) { throw protocol_error("invalid JSON: " + err); }
  if (!root.is<picojson::object>()) { throw protocol_error("command must be a JSON object"); }
  return root.get<picojson::object>();
}

picojson::value const *field(picojson::object const &obj, char const *key) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || it->second.is<picojson::null>()) { return nullptr; }
  return &it->second;
}

std::optional<std::string> optional_string(picojson::object const &obj, char const *key) {
  auto const *v{ field(obj, key) };
  if (!v) { return std::nullopt; }
  if (!v->is<std::string>()) { throw protocol_error(std::string{ key } + " must be a string"); }
  return v->get<std::string>();
}

std::string required_string(picojson::object const &obj, char const *key) {
  auto value{ optional_string(obj, key) };
  if (!value) { throw protocol_error(std::string{ key } + " is required"); }
  return std::move(*value);
}

std::optional<std::size_t> optional_index(picojson::object const &obj, char const *key) {
  auto const *v{ field(obj, key) };
  if (!v) { return std::nullopt; }
  // JSON numbers are doubles; beyond 2^53 they no longer name a unique integer.
  double const limit{ std::min(9007199254740992.0,
                               static_cast<double>(std::numeric_limits<std::size_t>::max())) };
  if (!v->is<double>() || !(v->get<double>() >= 0) || v->get<double>() > limit ||
      std::trunc(v->get<double>()) != v->get<double>()) {
    throw protocol_error(std::string{ key } + " must be a non-negative integer");
  }
  return static_cast<std::size_t>(v->get<double>());
}

picojson::value id_array(std::vector<std::string> const &ids) {
  picojson::array out;
  out.reserve(ids.size());
  for (auto const &id : ids) { out.emplace_back(id); }
  return picojson::value{ std::move(out) };
}

picojson::value rich_value(std::optional<std::string> const &rich) {
  if (!rich) { return picojson::value{}; }
  picojson::value parsed;
  if (!picojson::parse(parsed, *rich).empty()) { return picojson::value{ *rich }; }
  return parsed;
}

picojson::object typed(char const *type) {
  picojson::object obj;
  obj["type"] = picojson::value{ type };
  return obj;
}

}  // namespace

session_command protocol_parse_command(std::string_view line) {
  auto const obj{ parse_object(line) };
  auto const type{ required_string(obj, "type") };

  if (type == "edit_cell") {
    return session_commands::edit_cell{ required_string(obj, "cell_id"),
                                        optional_string(obj, "source").value_or("") };
  }
  if (type == "execute_cell") {
    return session_commands::execute_cell{ required_string(obj, "cell_id") };
  }
  if (type == "add_cell") {
    return session_commands::add_cell{ optional_index(obj, "position"),
                                       optional_string(obj, "cell_id"),
                                       optional_string(obj, "source").value_or("") };
  }
  if (type == "delete_cell") {
    return session_commands::delete_cell{ required_string(obj, "cell_id") };
  }
  if (type == "interrupt") { return session_commands::interrupt{}; }
  if (type == "execute_all") { return session_commands::execute_all{}; }
  if (type == "reset") { return session_commands::reset{}; }

  throw protocol_error("unknown command type '" + type + "'");
}

std::string protocol_event_to_json(session_event const &event) {
  auto const obj{ std::visit(
      match{
          [](session_events::cell_added const &e) {
            auto o{ typed("cell_added") };
            o["cell_id"] = picojson::value{ e.cell_id };
            o["position"] = picojson::value{ static_cast<double>(e.position) };
            return o;
          },
          [](session_events::cell_deleted const &e) {
            auto o{ typed("cell_deleted") };
            o["cell_id"] = picojson::value{ e.cell_id };
            return o;
          },
          [](session_events::plan_queued const &e) {
            auto o{ typed("plan_queued") };
            o["cell_ids"] = id_array(e.cell_ids);
            return o;
          },
          [](session_events::execution_started const &e) {
            auto o{ typed("execution_started") };
            o["cell_id"] = picojson::value{ e.cell_id };
            return o;
          },
          [](session_events::execution_result const &e) {
            auto o{ typed("execution_result") };
            o["cell_id"] = picojson::value{ e.cell_id };
            o["status"] = picojson::value{ execution_status_name(e.result.status) };
            o["output"] = picojson::value{ e.result.output_text };
            o["rich_output"] = rich_value(e.result.rich_output);
            if (e.result.error) {
              picojson::object err;
              err["kind"] = picojson::value{ fault_kind_name(e.result.error->kind) };
              err["message"] = picojson::value{ e.result.error->message };
              o["error"] = picojson::value{ std::move(err) };
            } else {
              o["error"] = picojson::value{};
            }
            return o;
          },
          [](session_events::structural_error const &e) {
            auto o{ typed("structural_error") };
            o["kind"] = picojson::value{ e.kind };
            o["detail"] = picojson::value{ e.detail };
            o["cell_ids"] = id_array(e.cell_ids);
            return o;
          },
          [](session_events::plan_abandoned const &e) {
            auto o{ typed("plan_abandoned") };
            o["failed_cell_id"] = picojson::value{ e.failed_cell_id };
            o["cell_ids"] = id_array(e.cell_ids);
            return o;
          },
      },
      event) };
  return picojson::value{ obj }.serialize();
}

void protocol_apply(session &s, session_command const &command) {
  std::visit(match{
                 [&s](session_commands::edit_cell const &c) { s.cell_edited(c.cell_id, c.source); },
                 [&s](session_commands::execute_cell const &c) { s.execute_cell(c.cell_id); },
                 [&s](session_commands::add_cell const &c) {
                   s.cell_added(c.position, c.cell_id, c.source);
                 },
                 [&s](session_commands::delete_cell const &c) { s.cell_deleted(c.cell_id); },
                 [&s](session_commands::interrupt const &) { s.interrupt(); },
                 [&s](session_commands::execute_all const &) { s.execute_all(); },
                 [&s](session_commands::reset const &) { s.reset(); },
             },
             command);
}

}  // namespace cascade
