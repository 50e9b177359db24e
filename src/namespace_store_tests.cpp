#include "namespace_store.h"

#include "doctest.h"

#include <cmath>
#include <cstdint>
#include <string>
#include <variant>

TEST_CASE("namespace_store set find erase") {
  cascade::namespace_store ns;
  CHECK(ns.empty());
  ns.set("x", std::int64_t{ 10 });
  ns.set("name", std::string{ "ada" });
  CHECK(ns.size() == 2);

  auto const *x{ ns.find("x") };
  REQUIRE(x != nullptr);
  CHECK(std::get<std::int64_t>(*x) == 10);
  CHECK(ns.find("missing") == nullptr);

  CHECK(ns.erase("x"));
  CHECK_FALSE(ns.erase("x"));
  CHECK(ns.size() == 1);

  ns.clear();
  CHECK(ns.empty());
}

TEST_CASE("namespace_store encode decode preserves scalar values") {
  cascade::namespace_store ns;
  ns.set("nothing", std::monostate{});
  ns.set("yes", true);
  ns.set("no", false);
  ns.set("big", std::int64_t{ -9007199254740993 });
  ns.set("pi", 3.25);
  ns.set("inf", HUGE_VAL);
  ns.set("text", std::string{ "line\nwith\0nul", 13 });
  ns.set("sine", cascade::ns_builtin_ref{ "math.sin" });

  auto const decoded{ cascade::namespace_store::decode(ns.encode()) };
  CHECK(decoded.globals() == ns.globals());
  CHECK(std::get<std::string>(*decoded.find("text")).size() == 13);
}

TEST_CASE("namespace_store encode decode preserves shared and cyclic tables") {
  cascade::namespace_store ns;
  auto const shared{ ns.add_table({}) };
  auto const node{ ns.add_table({}) };

  ns.table(shared).entries.emplace_back(std::string{ "value" }, std::int64_t{ 1 });
  ns.table(node).entries.emplace_back(std::string{ "self" }, cascade::ns_table_ref{ node });
  ns.table(node).entries.emplace_back(std::int64_t{ 1 }, cascade::ns_table_ref{ shared });
  ns.table(node).metatable = cascade::ns_table_ref{ shared };

  ns.set("a", cascade::ns_table_ref{ shared });
  ns.set("b", cascade::ns_table_ref{ shared });
  ns.set("loop", cascade::ns_table_ref{ node });

  auto const decoded{ cascade::namespace_store::decode(ns.encode()) };
  REQUIRE(decoded.table_count() == 2);

  auto const a{ std::get<cascade::ns_table_ref>(*decoded.find("a")) };
  auto const b{ std::get<cascade::ns_table_ref>(*decoded.find("b")) };
  CHECK(a == b);

  auto const loop{ std::get<cascade::ns_table_ref>(*decoded.find("loop")) };
  auto const &t{ decoded.table(loop.id) };
  REQUIRE(t.entries.size() == 2);
  CHECK(std::get<cascade::ns_table_ref>(t.entries[0].second) == loop);
  REQUIRE(t.metatable);
  CHECK(std::get<cascade::ns_table_ref>(*t.metatable) == a);
}

TEST_CASE("namespace_store encode decode preserves functions") {
  cascade::namespace_store ns;
  cascade::ns_function fn;
  fn.bytecode = std::string{ "\x1bLua\x54\x00", 6 };
  fn.upvalues.push_back(cascade::ns_upvalue{ .is_env = true, .slot = 0, .value = {} });
  fn.upvalues.push_back(
      cascade::ns_upvalue{ .is_env = false, .slot = 7, .value = std::int64_t{ 3 } });
  auto const id{ ns.add_function(std::move(fn)) };
  ns.set("f", cascade::ns_function_ref{ id });

  auto const decoded{ cascade::namespace_store::decode(ns.encode()) };
  REQUIRE(decoded.function_count() == 1);
  auto const &f{ decoded.function(0) };
  CHECK(f.bytecode.size() == 6);
  REQUIRE(f.upvalues.size() == 2);
  CHECK(f.upvalues[0].is_env);
  CHECK(f.upvalues[1].slot == 7);
  CHECK(std::get<std::int64_t>(f.upvalues[1].value) == 3);
}

TEST_CASE("namespace_store decode rejects malformed input") {
  cascade::namespace_store ns;
  auto const t{ ns.add_table({}) };
  ns.set("t", cascade::ns_table_ref{ t });
  auto const good{ ns.encode() };

  CHECK_THROWS_AS(cascade::namespace_store::decode(""), cascade::namespace_decode_error);
  CHECK_THROWS_AS(cascade::namespace_store::decode("XXXX\x01"),
                  cascade::namespace_decode_error);
  CHECK_THROWS_AS(cascade::namespace_store::decode(good.substr(0, good.size() - 1)),
                  cascade::namespace_decode_error);
  CHECK_THROWS_AS(cascade::namespace_store::decode(good + "x"),
                  cascade::namespace_decode_error);

  // Point the global at a table id that does not exist.
  auto dangling{ good };
  dangling[dangling.size() - 4] = '\x05';
  CHECK_THROWS_AS(cascade::namespace_store::decode(dangling),
                  cascade::namespace_decode_error);

  // Huge element count with no data behind it.
  std::string const huge{ "CSNS\x01\xff\xff\xff\xff\x00\x00\x00\x00", 13 };
  CHECK_THROWS_AS(cascade::namespace_store::decode(huge), cascade::namespace_decode_error);
}

TEST_CASE("ns_value_type_name") {
  CHECK(std::string{ cascade::ns_value_type_name(std::monostate{}) } == "nil");
  CHECK(std::string{ cascade::ns_value_type_name(std::int64_t{ 1 }) } == "integer");
  CHECK(std::string{ cascade::ns_value_type_name(1.5) } == "number");
  CHECK(std::string{ cascade::ns_value_type_name(cascade::ns_table_ref{ 0 }) } == "table");
}
