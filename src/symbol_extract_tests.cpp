#include "symbol_extract.h"

#include "doctest.h"

#include <set>
#include <string>

namespace {

using names = std::set<std::string>;

}  // namespace

TEST_CASE("symbol_extract simple define and use") {
  auto const a{ cascade::symbol_extract("x = 10") };
  CHECK(a.defines == names{ "x" });
  CHECK(a.uses.empty());

  auto const b{ cascade::symbol_extract("y = x + 5") };
  CHECK(b.defines == names{ "y" });
  CHECK(b.uses == names{ "x" });
}

TEST_CASE("symbol_extract multiple assignment") {
  auto const s{ cascade::symbol_extract("a, b = f(c), d") };
  CHECK(s.defines == names{ "a", "b" });
  CHECK(s.uses == names{ "f", "c", "d" });
}

TEST_CASE("symbol_extract excludes builtins from uses") {
  auto const s{ cascade::symbol_extract(
      "n = math.floor(tonumber(s))\nprint(string.format('%d', n), nb)") };
  CHECK(s.defines == names{ "n" });
  CHECK(s.uses == names{ "s", "n" });
}

TEST_CASE("symbol_extract locals are private to the cell") {
  auto const s{ cascade::symbol_extract("local t = {}\nlocal u <const> = t\nv = u") };
  CHECK(s.defines == names{ "v" });
  CHECK(s.uses.empty());
}

TEST_CASE("symbol_extract local initializer sees outer binding") {
  auto const s{ cascade::symbol_extract("local x = x + 1\nresult = x") };
  CHECK(s.defines == names{ "result" });
  CHECK(s.uses == names{ "x" });
}

TEST_CASE("symbol_extract function definitions") {
  SUBCASE("global function defines its name") {
    auto const s{ cascade::symbol_extract(
        "function square(n)\n  return n * n + offset\nend") };
    CHECK(s.defines == names{ "square" });
    CHECK(s.uses == names{ "offset" });
  }

  SUBCASE("local function is private and may recurse") {
    auto const s{ cascade::symbol_extract(
        "local function fact(n)\n  if n <= 1 then return 1 end\n"
        "  return n * fact(n - 1)\nend\nanswer = fact(5)") };
    CHECK(s.defines == names{ "answer" });
    CHECK(s.uses.empty());
  }

  SUBCASE("method definition reads the table") {
    auto const s{ cascade::symbol_extract("function Account:deposit(v)\n"
                                          "  self.balance = self.balance + v\nend") };
    CHECK(s.defines.empty());
    CHECK(s.uses == names{ "Account" });
  }

  SUBCASE("anonymous function parameters shadow globals") {
    auto const s{ cascade::symbol_extract(
        "double = function(value, ...) return value * factor end") };
    CHECK(s.defines == names{ "double" });
    CHECK(s.uses == names{ "factor" });
  }
}

TEST_CASE("symbol_extract global writes in nested blocks define") {
  auto const s{ cascade::symbol_extract("if flag then\n  mode = 'on'\nelse\n"
                                        "  local tmp = 1\n  mode = 'off'\nend\n"
                                        "function setup()\n  configured = true\nend") };
  CHECK(s.defines == names{ "mode", "setup", "configured" });
  CHECK(s.uses == names{ "flag" });
}

TEST_CASE("symbol_extract field assignment reads the table") {
  auto const s{ cascade::symbol_extract("config.depth = 3\nitems[#items + 1] = k") };
  CHECK(s.defines.empty());
  CHECK(s.uses == names{ "config", "items", "k" });
}

TEST_CASE("symbol_extract loop variables are scoped") {
  auto const s{ cascade::symbol_extract("total = 0\nfor i = 1, limit do\n"
                                        "  total = total + i\nend\n"
                                        "for k, v in pairs(data) do\n  last = k .. v\nend\n"
                                        "use = i") };
  CHECK(s.defines == names{ "total", "last", "use" });
  CHECK(s.uses == names{ "limit", "total", "data", "i" });
}

TEST_CASE("symbol_extract repeat until sees body locals") {
  auto const s{ cascade::symbol_extract(
      "repeat\n  local done = step()\nuntil done") };
  CHECK(s.uses == names{ "step" });
}

TEST_CASE("symbol_extract table constructor keys are not reads") {
  auto const s{ cascade::symbol_extract("point = { x = px, y = 2, [key] = val; 4 }") };
  CHECK(s.defines == names{ "point" });
  CHECK(s.uses == names{ "px", "key", "val" });
}

TEST_CASE("symbol_extract underscore names are untracked") {
  auto const s{ cascade::symbol_extract("_scratch = value\nresult = _scratch") };
  CHECK(s.defines == names{ "result" });
  CHECK(s.uses == names{ "value" });
}

TEST_CASE("symbol_extract self reference counts as use") {
  auto const s{ cascade::symbol_extract("x = x + 1") };
  CHECK(s.defines == names{ "x" });
  CHECK(s.uses == names{ "x" });
}

TEST_CASE("symbol_extract trailing expression offset") {
  SUBCASE("bare expression") {
    std::string const source{ "x = 10\nx + 5" };
    auto const s{ cascade::symbol_extract(source) };
    REQUIRE(s.trailing_expr_offset);
    CHECK(*s.trailing_expr_offset == 7);
    CHECK(s.uses == names{ "x" });
  }

  SUBCASE("bare name") {
    auto const s{ cascade::symbol_extract("result") };
    REQUIRE(s.trailing_expr_offset);
    CHECK(*s.trailing_expr_offset == 0);
    CHECK(s.uses == names{ "result" });
  }

  SUBCASE("table literal") {
    auto const s{ cascade::symbol_extract("{1, 2, 3}") };
    REQUIRE(s.trailing_expr_offset);
    CHECK(*s.trailing_expr_offset == 0);
  }

  SUBCASE("final call is displayed") {
    auto const s{ cascade::symbol_extract("local y = 2\nf(y);") };
    REQUIRE(s.trailing_expr_offset);
    CHECK(*s.trailing_expr_offset == 12);
  }

  SUBCASE("call followed by operator is an expression") {
    auto const s{ cascade::symbol_extract("f(1) * 2") };
    REQUIRE(s.trailing_expr_offset);
    CHECK(*s.trailing_expr_offset == 0);
  }

  SUBCASE("calls before the end are statements") {
    auto const s{ cascade::symbol_extract("print(1)\nx = 2") };
    CHECK_FALSE(s.trailing_expr_offset);
  }

  SUBCASE("explicit return needs no injection") {
    auto const s{ cascade::symbol_extract("return a, b") };
    CHECK_FALSE(s.trailing_expr_offset);
    CHECK(s.uses == names{ "a", "b" });
  }
}

TEST_CASE("symbol_extract accepts the full grammar") {
  auto const s{ cascade::symbol_extract(R"lua(
local f <close> = nil
::top::
local bits = (mask & 0xff) | (flags ~ 1) << 2 >> 1
local q = 7 // 2 % 3 ^ 2
local s = [==[raw ]] text]==] .. "x"
while bits > 0 do
  bits = bits - 1
  if bits == 3 then goto continue end
  ::continue::
end
do local inner = ~bits end
obj:method "arg"
obj.field { 1, 2 }
out = #s > 0 and not false or nil
)lua") };
  CHECK(s.defines == names{ "out" });
  CHECK(s.uses == names{ "mask", "flags", "obj" });
  CHECK_FALSE(s.trailing_expr_offset);
}

TEST_CASE("symbol_extract reports syntax errors with lines") {
  SUBCASE("missing end") {
    try {
      cascade::symbol_extract("function f()\n  return 1\n");
      FAIL("expected analysis_error");
    } catch (cascade::analysis_error const &e) {
      CHECK(e.line() == 3);
      CHECK(std::string{ e.what() } ==
            "'end' expected (to close 'function' at line 1) near <eof>");
    }
  }

  SUBCASE("dangling operator") {
    CHECK_THROWS_AS(cascade::symbol_extract("x = "), cascade::analysis_error);
  }

  SUBCASE("bare expression before other statements") {
    try {
      cascade::symbol_extract("x + 1\ny = 2");
      FAIL("expected analysis_error");
    } catch (cascade::analysis_error const &e) {
      CHECK(e.line() == 2);
      CHECK(std::string{ e.what() } == "syntax error near 'y'");
    }
  }

  SUBCASE("expression statement inside a block") {
    CHECK_THROWS_AS(cascade::symbol_extract("if a then b end"), cascade::analysis_error);
  }

  SUBCASE("unknown local attribute") {
    CHECK_THROWS_AS(cascade::symbol_extract("local x <weird> = 1"),
                    cascade::analysis_error);
  }
}

TEST_CASE("symbol_is_builtin and symbol_is_private") {
  CHECK(cascade::symbol_is_builtin("print"));
  CHECK(cascade::symbol_is_builtin("math"));
  CHECK(cascade::symbol_is_builtin("nb"));
  CHECK_FALSE(cascade::symbol_is_builtin("x"));
  CHECK(cascade::symbol_is_private("_tmp"));
  CHECK_FALSE(cascade::symbol_is_private("tmp"));
  CHECK_FALSE(cascade::symbol_is_private(""));
}
