#include "tui.h"

#include "doctest.h"

#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

TEST_CASE("tui init can only run once") {
  CHECK_THROWS_AS(cascade::tui::init(), std::logic_error);
}

TEST_CASE("tui allows handler changes while idle") {
  CHECK_NOTHROW(cascade::tui::set_output_handler([](std::string_view) {}));
  CHECK_NOTHROW(cascade::tui::set_output_handler([](std::string_view) {}));
}

TEST_CASE("tui enforces run/shutdown sequencing") {
  auto const handler{ [](std::string_view) {} };
  CHECK_NOTHROW(cascade::tui::set_output_handler(handler));
  CHECK_NOTHROW(cascade::tui::run(cascade::tui::level::TUI_INFO));
  CHECK_NOTHROW(cascade::tui::shutdown());

  CHECK_NOTHROW(cascade::tui::run(std::nullopt));
  CHECK_THROWS_AS(cascade::tui::set_output_handler(handler), std::logic_error);
  CHECK_THROWS_AS(cascade::tui::run(std::nullopt), std::logic_error);

  CHECK_NOTHROW(cascade::tui::shutdown());
  CHECK_THROWS_AS(cascade::tui::shutdown(), std::logic_error);

  CHECK_NOTHROW(cascade::tui::set_output_handler(handler));
}

namespace {

struct captured_output {
  std::vector<std::string> messages;

  captured_output() {
    cascade::tui::set_output_handler(
        [this](std::string_view value) { messages.emplace_back(value); });
  }

  ~captured_output() {
    try {
      cascade::tui::set_output_handler([](std::string_view) {});
    } catch (std::logic_error const &error) {
      FAIL("set_output_handler should not throw during teardown: " << error.what());
    }
  }
};

void expect_json_tokens(cascade::trace_event_t const &event,
                        std::vector<std::string> tokens) {
  auto const json{ cascade::trace_event_to_json(event) };
  CHECK_MESSAGE(json.find("\"ts\"") != std::string::npos, "missing timestamp in json");
  tokens.emplace_back(std::string{ "\"event\":\"" } +
                      std::string(cascade::trace_event_name(event)) + "\"");
  for (auto const &token : tokens) {
    CHECK_MESSAGE(json.find(token) != std::string::npos,
                  "missing token: " << token << " in json: " << json);
  }
}

}  // namespace

TEST_CASE_FIXTURE(captured_output, "tui unstructured logs are raw messages") {
  REQUIRE(messages.empty());

  CHECK_NOTHROW(cascade::tui::run(std::nullopt));

  cascade::tui::debug("hello %s", "world");
  cascade::tui::info("value %d", 42);
  cascade::tui::warn("three %d", 3);
  cascade::tui::error("boom");

  CHECK_NOTHROW(cascade::tui::shutdown());

  REQUIRE(messages.size() == 4);
  CHECK(messages[0] == "hello world\n");
  CHECK(messages[1] == "value 42\n");
  CHECK(messages[2] == "three 3\n");
  CHECK(messages[3] == "boom\n");
}

TEST_CASE_FIXTURE(captured_output, "tui structured logs include prefix") {
  CHECK_NOTHROW(cascade::tui::run(cascade::tui::level::TUI_DEBUG, true));
  cascade::tui::info("structured %d", 7);
  CHECK_NOTHROW(cascade::tui::shutdown());

  REQUIRE(messages.size() == 1);
  auto const &line{ messages[0] };
  CHECK(line.find("[INF") != std::string::npos);
  CHECK(line.rfind("structured 7\n") ==
        line.size() - std::string("structured 7\n").size());
}

TEST_CASE_FIXTURE(captured_output, "tui severity filtering honors threshold") {
  CHECK_NOTHROW(cascade::tui::run(cascade::tui::level::TUI_WARN, true));
  cascade::tui::debug("debug");
  cascade::tui::info("info");
  cascade::tui::warn("warn");
  cascade::tui::error("error");
  CHECK_NOTHROW(cascade::tui::shutdown());

  REQUIRE(messages.size() == 2);
  CHECK(messages[0].find("WRN") != std::string::npos);
  CHECK(messages[0].find("warn") != std::string::npos);
  CHECK(messages[1].find("ERR") != std::string::npos);
  CHECK(messages[1].find("error") != std::string::npos);
}

TEST_CASE_FIXTURE(captured_output, "tui trace events reach handler") {
  cascade::tui::configure_trace_outputs(
      { { cascade::tui::trace_output_type::std_err, std::nullopt } });
  CHECK_NOTHROW(cascade::tui::run(cascade::tui::level::TUI_TRACE, false));

  cascade::tui::trace(cascade::trace_events::worker_spawned{
      .cell = "cell-a",
      .pid = 1234,
  });

  CHECK_NOTHROW(cascade::tui::shutdown());
  REQUIRE_FALSE(messages.empty());
  CHECK(messages[0].find("worker_spawned") != std::string::npos);
  CHECK(messages[0].find("cell=cell-a") != std::string::npos);
  CHECK(messages[0].find("pid=1234") != std::string::npos);

  cascade::tui::configure_trace_outputs({});
}

TEST_CASE("trace_event_to_json serializes all event types") {
  using namespace cascade::trace_events;

  expect_json_tokens(cell_analyzed{ .cell = "c1", .defines = 2, .uses = 3, .ok = true },
                     { "\"cell\":\"c1\"", "\"defines\":2", "\"uses\":3", "\"ok\":true" });
  expect_json_tokens(graph_validated{ .cell = "c1", .ok = false, .fault = "cycle" },
                     { "\"cell\":\"c1\"", "\"ok\":false", "\"fault\":\"cycle\"" });
  expect_json_tokens(plan_computed{ .trigger = "c1", .cells = "c1,c2", .count = 2 },
                     { "\"trigger\":\"c1\"", "\"cells\":\"c1,c2\"", "\"count\":2" });
  expect_json_tokens(plan_abandoned{ .failed_cell = "c2", .remaining = 4 },
                     { "\"failed_cell\":\"c2\"", "\"remaining\":4" });
  expect_json_tokens(request_coalesced{ .cell = "c3" }, { "\"cell\":\"c3\"" });
  expect_json_tokens(cell_run_start{ .cell = "c4" }, { "\"cell\":\"c4\"" });
  expect_json_tokens(
      cell_run_complete{ .cell = "c4", .status = "success", .duration_ms = 12 },
      { "\"status\":\"success\"", "\"duration_ms\":12" });
  expect_json_tokens(worker_spawned{ .cell = "c5", .pid = 77 }, { "\"pid\":77" });
  expect_json_tokens(
      worker_exited{ .cell = "c5", .pid = 77, .exit_code = 0, .duration_ms = 9 },
      { "\"pid\":77", "\"exit_code\":0", "\"duration_ms\":9" });
  expect_json_tokens(worker_killed{ .cell = "c5", .pid = 77, .reason = "timeout" },
                     { "\"reason\":\"timeout\"" });
  expect_json_tokens(namespace_committed{ .cell = "c6", .symbols = 3, .bytes = 128 },
                     { "\"symbols\":3", "\"bytes\":128" });
  expect_json_tokens(symbols_retired{ .cell = "c6", .count = 1 }, { "\"count\":1" });
}

TEST_CASE("trace_event_to_json escapes special characters") {
  auto json{ cascade::trace_event_to_json(
      cascade::trace_events::request_coalesced{ .cell = "c\\back" }) };
  CHECK(json.find("c\\\\back") != std::string::npos);

  json = cascade::trace_event_to_json(
      cascade::trace_events::request_coalesced{ .cell = "c\"quote" });
  CHECK(json.find("c\\\"quote") != std::string::npos);

  json = cascade::trace_event_to_json(
      cascade::trace_events::request_coalesced{ .cell = "c\nline\ttab" });
  CHECK(json.find("c\\nline\\ttab") != std::string::npos);

  json = cascade::trace_event_to_json(
      cascade::trace_events::request_coalesced{ .cell = std::string("c\x01x", 3) });
  CHECK(json.find("c\\u0001x") != std::string::npos);
}

TEST_CASE("trace_event_to_json produces valid ISO8601 timestamps") {
  auto const json{ cascade::trace_event_to_json(
      cascade::trace_events::cell_run_start{ .cell = "test" }) };

  auto const ts_start{ json.find("\"ts\":\"") };
  REQUIRE(ts_start != std::string::npos);

  auto const ts_value_start{ ts_start + 6 };
  auto const ts_end{ json.find("\"", ts_value_start) };
  REQUIRE(ts_end != std::string::npos);

  auto const timestamp{ json.substr(ts_value_start, ts_end - ts_value_start) };

  // YYYY-MM-DDTHH:MM:SS.sssZ
  CHECK(timestamp.size() == 24);
  CHECK(timestamp[4] == '-');
  CHECK(timestamp[10] == 'T');
  CHECK(timestamp[19] == '.');
  CHECK(timestamp[23] == 'Z');

  for (int i : { 0, 1, 2, 3, 5, 6, 8, 9, 11, 12, 14, 15, 17, 18, 20, 21, 22 }) {
    CHECK_MESSAGE(std::isdigit(static_cast<unsigned char>(timestamp[i])),
                  "Position " << i << " should be digit, got: " << timestamp[i]);
  }
}

TEST_CASE("g_trace_enabled controls trace event processing") {
  CHECK_FALSE(cascade::tui::g_trace_enabled);

  cascade::tui::configure_trace_outputs(
      { { cascade::tui::trace_output_type::std_err, std::nullopt } });
  CHECK(cascade::tui::g_trace_enabled);

  cascade::tui::configure_trace_outputs({});
  CHECK_FALSE(cascade::tui::g_trace_enabled);

  cascade::tui::configure_trace_outputs(
      { { cascade::tui::trace_output_type::file,
          std::filesystem::temp_directory_path() / "cascade_test_trace.jsonl" } });
  CHECK(cascade::tui::g_trace_enabled);

  cascade::tui::configure_trace_outputs({});
  CHECK_FALSE(cascade::tui::g_trace_enabled);
}

TEST_CASE("trace_event_to_string formats human-readable output") {
  auto output{ cascade::trace_event_to_string(cascade::trace_events::graph_validated{
      .cell = "cell-1",
      .ok = false,
      .fault = "circular_dependency",
  }) };
  CHECK(output == "graph_validated cell=cell-1 ok=false fault=circular_dependency");

  output = cascade::trace_event_to_string(cascade::trace_events::plan_computed{
      .trigger = "a",
      .cells = "a,b",
      .count = 2,
  });
  CHECK(output == "plan_computed trigger=a count=2 cells=[a,b]");

  output = cascade::trace_event_to_string(cascade::trace_events::worker_killed{
      .cell = "slow",
      .pid = 42,
      .reason = "interrupt",
  });
  CHECK(output == "worker_killed cell=slow pid=42 reason=interrupt");
}

TEST_CASE("trace event macros work with g_trace_enabled") {
  cascade::tui::configure_trace_outputs({});
  CHECK_FALSE(cascade::tui::g_trace_enabled);

  bool evaluated{ false };
  auto const cell_name{ [&] {
    evaluated = true;
    return std::string{ "cell" };
  } };
  CASCADE_TRACE_PLAN_ABANDONED(cell_name(), 3);
  CHECK_FALSE(evaluated);
}

TEST_CASE("trace file output writes JSONL format") {
  auto const trace_path{ std::filesystem::temp_directory_path() /
                         "cascade_test_trace_file.jsonl" };
  std::error_code ec;
  std::filesystem::remove(trace_path, ec);

  cascade::tui::configure_trace_outputs(
      { { cascade::tui::trace_output_type::file, trace_path } });
  CHECK(cascade::tui::g_trace_enabled);

  CHECK_NOTHROW(cascade::tui::run(cascade::tui::level::TUI_TRACE, false));

  CASCADE_TRACE_WORKER_SPAWNED("cell-x", 99);
  CASCADE_TRACE_NAMESPACE_COMMITTED("cell-x", 4, 512);
  {
    cascade::cell_run_trace_scope scope{ "cell-x" };
    scope.status = "success";
  }

  CHECK_NOTHROW(cascade::tui::shutdown());

  REQUIRE(std::filesystem::exists(trace_path));

  std::ifstream file{ trace_path };
  REQUIRE(file.is_open());

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty()) { lines.push_back(line); }
  }
  file.close();

  REQUIRE(lines.size() == 4);
  for (auto const &json_line : lines) {
    CHECK(json_line.front() == '{');
    CHECK(json_line.back() == '}');
  }
  CHECK(lines[0].find("\"event\":\"worker_spawned\"") != std::string::npos);
  CHECK(lines[1].find("\"bytes\":512") != std::string::npos);
  CHECK(lines[2].find("\"event\":\"cell_run_start\"") != std::string::npos);
  CHECK(lines[3].find("\"status\":\"success\"") != std::string::npos);

  std::filesystem::remove(trace_path, ec);
  cascade::tui::configure_trace_outputs({});
}

TEST_CASE("configure_trace_outputs rejects multiple file outputs") {
  auto const path1{ std::filesystem::temp_directory_path() / "cascade_trace1.jsonl" };
  auto const path2{ std::filesystem::temp_directory_path() / "cascade_trace2.jsonl" };

  CHECK_THROWS_AS(cascade::tui::configure_trace_outputs(
                      { { cascade::tui::trace_output_type::file, path1 },
                        { cascade::tui::trace_output_type::file, path2 } }),
                  std::logic_error);

  cascade::tui::configure_trace_outputs({});
}
