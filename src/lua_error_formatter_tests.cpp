#include "lua_error_formatter.h"

#include "doctest.h"

namespace cascade {

// ============================================================================
// extract_line_number() tests
// ============================================================================

TEST_CASE("extract_line_number extracts line from a cell error") {
  auto line_num = extract_line_number("cell-1:42: assertion failed");
  REQUIRE(line_num.has_value());
  CHECK(*line_num == 42);
}

TEST_CASE("extract_line_number handles loadstring chunk names") {
  auto line_num = extract_line_number("[string \"x = 1...\"]:1234: some error");
  REQUIRE(line_num.has_value());
  CHECK(*line_num == 1234);
}

TEST_CASE("extract_line_number returns nullopt without a location") {
  CHECK_FALSE(extract_line_number("generic error message").has_value());
  CHECK_FALSE(extract_line_number("cell:42").has_value());
  CHECK_FALSE(extract_line_number("cell:abc: error").has_value());
  CHECK_FALSE(extract_line_number("some words: 12: error").has_value());
}

// ============================================================================
// parse_lua_error() tests
// ============================================================================

TEST_CASE("parse_lua_error splits location and text") {
  auto const info{ parse_lua_error("a:3: attempt to perform arithmetic on a nil value",
                                   "RuntimeError") };
  CHECK(info.kind == "RuntimeError");
  CHECK(info.chunk == "a");
  CHECK(info.line == 3);
  CHECK(info.message == "attempt to perform arithmetic on a nil value");
}

TEST_CASE("parse_lua_error recognizes unresolved symbols") {
  auto const info{ parse_lua_error("a:1: UnresolvedSymbol: 'x' is not defined",
                                   "RuntimeError") };
  CHECK(info.kind == "UnresolvedSymbol");
  CHECK(info.message == "'x' is not defined");
  CHECK(info.line == 1);
}

TEST_CASE("parse_lua_error keeps messages without location") {
  auto const info{ parse_lua_error("boom", "RuntimeError") };
  CHECK(info.kind == "RuntimeError");
  CHECK(info.message == "boom");
  CHECK(info.chunk.empty());
  CHECK_FALSE(info.line.has_value());
}

TEST_CASE("parse_lua_error keeps multi-line messages") {
  auto const info{ parse_lua_error("a:2: first\nsecond", "RuntimeError") };
  CHECK(info.message == "first\nsecond");
}

// ============================================================================
// format_lua_error() tests
// ============================================================================

TEST_CASE("format_lua_error appends the line") {
  auto const info{ parse_lua_error("a:2: unexpected symbol near '@'", "SyntaxError") };
  CHECK(format_lua_error(info, "a") == "SyntaxError: unexpected symbol near '@' (line 2)");
}

TEST_CASE("format_lua_error names the defining cell for foreign chunks") {
  auto const info{ parse_lua_error("b:7: bad argument", "RuntimeError") };
  CHECK(format_lua_error(info, "a") == "RuntimeError: bad argument (cell b, line 7)");
}

TEST_CASE("format_lua_error without a line") {
  auto const info{ parse_lua_error("boom", "RuntimeError") };
  CHECK(format_lua_error(info, "a") == "RuntimeError: boom");
}

}  // namespace cascade
