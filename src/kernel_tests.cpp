#include "kernel.h"

#include "symbol_extract.h"

#include "doctest.h"

#include <chrono>
#include <thread>

namespace cascade {
namespace {

run_request make_request(std::string id,
                         std::string source,
                         std::vector<std::string> retired = {}) {
  auto const symbols{ symbol_extract(source) };
  return { .cell_id = std::move(id),
           .source = std::move(source),
           .trailing_expr_offset = symbols.trailing_expr_offset,
           .retired_symbols = std::move(retired) };
}

kernel_cfg fast_cfg() {
  kernel_cfg cfg;
  cfg.timeout = std::chrono::milliseconds{ 3000 };
  return cfg;
}

}  // namespace

TEST_CASE("kernel runs a cell and commits its namespace") {
  kernel k{ fast_cfg() };
  namespace_store ns;

  auto const first{ k.run(make_request("a", "x = 10"), ns) };
  REQUIRE(first.ok());
  CHECK(first.output_text.empty());
  CHECK_FALSE(first.error.has_value());
  REQUIRE(ns.find("x") != nullptr);
  CHECK(std::get<std::int64_t>(*ns.find("x")) == 10);

  auto const second{ k.run(make_request("b", "result = x * 2\nresult"), ns) };
  REQUIRE(second.ok());
  CHECK(second.output_text == "20");
  CHECK(std::get<std::int64_t>(*ns.find("result")) == 20);
}

TEST_CASE("kernel captures printed output before the displayed value") {
  kernel k{ fast_cfg() };
  namespace_store ns;

  auto const r{ k.run(make_request("a", "print('hello')\nprint('world')\n1 + 1"), ns) };
  REQUIRE(r.ok());
  CHECK(r.output_text == "hello\nworld\n2");
}

TEST_CASE("kernel omits nil display values") {
  kernel k{ fast_cfg() };
  namespace_store ns;

  auto const r{ k.run(make_request("a", "print('only output')"), ns) };
  REQUIRE(r.ok());
  CHECK(r.output_text == "only output");

  auto const multi{ k.run(make_request("b", "local a, b = 1, 'two'\nreturn a, b"), ns) };
  REQUIRE(multi.ok());
  CHECK(multi.output_text == "1\t\"two\"");
}

TEST_CASE("kernel keeps functions across runs") {
  kernel k{ fast_cfg() };
  namespace_store ns;

  REQUIRE(k.run(make_request("a", "function double(v) return v * 2 end"), ns).ok());
  auto const r{ k.run(make_request("b", "double(21)"), ns) };
  REQUIRE(r.ok());
  CHECK(r.output_text == "42");
}

TEST_CASE("kernel rolls back the namespace on a runtime fault") {
  kernel k{ fast_cfg() };
  namespace_store ns;
  ns.set("x", std::int64_t{ 1 });

  auto const r{ k.run(make_request("a", "x = 2\nprint('before')\nerror('boom')"), ns) };
  CHECK(r.status == execution_status::error);
  REQUIRE(r.error.has_value());
  CHECK(r.error->kind == fault_kind::runtime);
  CHECK(r.error->message == "RuntimeError: boom (line 3)");
  CHECK(r.output_text == "before");
  CHECK(std::get<std::int64_t>(*ns.find("x")) == 1);
}

TEST_CASE("kernel reports unresolved symbols") {
  kernel k{ fast_cfg() };
  namespace_store ns;

  auto const r{ k.run(make_request("a", "y = missing + 1"), ns) };
  REQUIRE(r.error.has_value());
  CHECK(r.error->kind == fault_kind::unresolved_symbol);
  CHECK(r.error->message == "UnresolvedSymbol: 'missing' is not defined (line 1)");
  CHECK(ns.empty());
}

TEST_CASE("kernel reports syntax errors without touching the namespace") {
  kernel k{ fast_cfg() };
  namespace_store ns;
  ns.set("keep", true);

  run_request const request{ .cell_id = "a", .source = "x = = 1" };
  auto const r{ k.run(request, ns) };
  REQUIRE(r.error.has_value());
  CHECK(r.error->kind == fault_kind::syntax);
  CHECK(r.error->message.starts_with("SyntaxError: "));
  CHECK(r.error->message.ends_with("(line 1)"));
  CHECK(ns.size() == 1);
}

TEST_CASE("kernel retires symbols before running") {
  kernel k{ fast_cfg() };
  namespace_store ns;
  ns.set("old", std::int64_t{ 5 });

  auto const r{ k.run(make_request("a", "old", { "old" }), ns) };
  REQUIRE(r.error.has_value());
  CHECK(r.error->kind == fault_kind::unresolved_symbol);
  CHECK(ns.find("old") != nullptr);

  REQUIRE(k.run(make_request("a", "fresh = 1", { "old" }), ns).ok());
  CHECK(ns.find("old") == nullptr);
  CHECK(ns.find("fresh") != nullptr);
}

TEST_CASE("kernel times out and stays usable") {
  kernel k{ fast_cfg() };
  namespace_store ns;
  ns.set("x", std::int64_t{ 7 });

  auto const start{ std::chrono::steady_clock::now() };
  auto const r{
    k.run(make_request("spin", "x = 100\nwhile true do end"), ns, std::chrono::milliseconds{ 200 })
  };
  auto const elapsed{ std::chrono::steady_clock::now() - start };

  CHECK(r.status == execution_status::error);
  REQUIRE(r.error.has_value());
  CHECK(r.error->kind == fault_kind::timeout);
  CHECK(r.error->message == "TimeoutError: cell execution timed out after 200 ms");
  CHECK(elapsed < std::chrono::seconds{ 2 });
  CHECK(std::get<std::int64_t>(*ns.find("x")) == 7);
  CHECK_FALSE(k.busy());

  auto const next{ k.run(make_request("next", "y = x + 1\ny"), ns) };
  REQUIRE(next.ok());
  CHECK(next.output_text == "8");
}

TEST_CASE("kernel interrupt from another thread") {
  kernel k{ kernel_cfg{ .timeout = std::chrono::milliseconds{ 10000 } } };
  namespace_store ns;

  std::thread interrupter{ [&k] {
    auto const give_up{ std::chrono::steady_clock::now() + std::chrono::seconds{ 5 } };
    while (!k.busy() && std::chrono::steady_clock::now() < give_up) {
      std::this_thread::sleep_for(std::chrono::milliseconds{ 5 });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{ 50 });
    k.interrupt();
  } };

  auto const r{ k.run(make_request("spin", "while true do end"), ns) };
  interrupter.join();

  CHECK(r.status == execution_status::interrupted);
  REQUIRE(r.error.has_value());
  CHECK(r.error->kind == fault_kind::interrupted);
  CHECK(r.error->message == "InterruptedError: execution interrupted");
  CHECK(ns.empty());

  CHECK(k.run(make_request("after", "z = 1"), ns).ok());
}

TEST_CASE("kernel honors an interrupt requested before the worker starts") {
  kernel k{ kernel_cfg{ .timeout = std::chrono::milliseconds{ 10000 } } };
  namespace_store ns;

  CHECK_FALSE(k.interrupt());
  auto const r{ k.run(make_request("spin", "while true do end"), ns) };
  CHECK(r.status == execution_status::interrupted);
  REQUIRE(r.error.has_value());
  CHECK(r.error->kind == fault_kind::interrupted);

  // Consumed by the run above.
  auto const next{ k.run(make_request("next", "x = 1"), ns) };
  CHECK(next.ok());
  CHECK(std::get<std::int64_t>(*ns.find("x")) == 1);
}

TEST_CASE("kernel clear_interrupt drops a pending interrupt") {
  kernel k{ fast_cfg() };
  namespace_store ns;

  k.interrupt();
  k.clear_interrupt();
  CHECK(k.run(make_request("a", "x = 2"), ns).ok());
  CHECK(std::get<std::int64_t>(*ns.find("x")) == 2);
}

TEST_CASE("kernel reports a worker that exits early") {
  kernel k{ fast_cfg() };
  namespace_store ns;

  auto const r{ k.run(make_request("a", "x = 1\nos.exit(3)"), ns) };
  REQUIRE(r.error.has_value());
  CHECK(r.error->kind == fault_kind::worker_crash);
  CHECK(r.error->message.find("code 3") != std::string::npos);
  CHECK(ns.empty());
}

TEST_CASE("kernel rejects values that cannot be kept") {
  kernel k{ fast_cfg() };
  namespace_store ns;

  auto const r{ k.run(make_request("a", "co = coroutine.create(function() end)"), ns) };
  REQUIRE(r.error.has_value());
  CHECK(r.error->kind == fault_kind::namespace_error);
  CHECK(r.error->message.starts_with("NamespaceError: value of 'co'"));
  CHECK(ns.empty());
}

TEST_CASE("kernel caps captured output") {
  kernel_cfg cfg{ fast_cfg() };
  cfg.max_output_bytes = 10;
  kernel k{ cfg };
  namespace_store ns;

  auto const r{ k.run(make_request("a", "io.write(string.rep('a', 100000))"), ns) };
  REQUIRE(r.ok());
  CHECK(r.output_text == "aaaaaaaaaa\n... output truncated");
}

TEST_CASE("kernel returns rich output for notebook values") {
  kernel k{ fast_cfg() };
  namespace_store ns;

  auto const r{ k.run(make_request("a", "s = nb.series({1, 2, 3}, 'n')\ns"), ns) };
  REQUIRE(r.ok());
  CHECK(r.output_text == "series 'n' (3 values)");
  REQUIRE(r.rich_output.has_value());
  CHECK(r.rich_output->find("\"type\":\"series\"") != std::string::npos);

  // the series (and its metatable) survives in the namespace
  auto const again{ k.run(make_request("b", "s"), ns) };
  REQUIRE(again.ok());
  CHECK(again.output_text == "series 'n' (3 values)");
}

TEST_CASE("status and fault names") {
  CHECK(std::string{ execution_status_name(execution_status::success) } == "success");
  CHECK(std::string{ execution_status_name(execution_status::interrupted) } == "interrupted");
  CHECK(std::string{ fault_kind_name(fault_kind::timeout) } == "TimeoutError");
  CHECK(std::string{ fault_kind_name(fault_kind::worker_crash) } == "WorkerCrash");
}

}  // namespace cascade
