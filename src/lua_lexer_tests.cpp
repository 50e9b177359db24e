#include "lua_lexer.h"

#include "doctest.h"

#include <string>
#include <vector>

namespace {

std::vector<std::string> texts(std::vector<cascade::lua_token> const &tokens) {
  std::vector<std::string> out;
  for (auto const &t : tokens) { out.push_back(t.text); }
  return out;
}

}  // namespace

TEST_CASE("lua_lex splits names keywords and symbols") {
  auto const tokens{ cascade::lua_lex("local x = y .. z ... w // 2") };
  CHECK(texts(tokens) == std::vector<std::string>{ "local", "x", "=", "y", "..", "z",
                                                   "...", "w", "//", "2", "<eof>" });
  CHECK(tokens[0].kind == cascade::lua_token_kind::keyword);
  CHECK(tokens[1].kind == cascade::lua_token_kind::name);
  CHECK(tokens[2].kind == cascade::lua_token_kind::symbol);
  CHECK(tokens.back().kind == cascade::lua_token_kind::eof);
}

TEST_CASE("lua_lex tracks lines and offsets") {
  auto const tokens{ cascade::lua_lex("a = 1\r\nb = 2\n\nc") };
  REQUIRE(tokens.size() == 8);
  CHECK(tokens[0].line == 1);
  CHECK(tokens[3].line == 2);
  CHECK(tokens[3].offset == 7);
  CHECK(tokens[6].text == "c");
  CHECK(tokens[6].line == 4);
  CHECK(tokens[6].offset == 14);
}

TEST_CASE("lua_lex skips comments") {
  auto const tokens{ cascade::lua_lex("-- line comment\nx --[==[ long\n comment ]==] y") };
  CHECK(texts(tokens) == std::vector<std::string>{ "x", "y", "<eof>" });
  CHECK(tokens[1].line == 3);
}

TEST_CASE("lua_lex reads numerals in all forms") {
  auto const tokens{ cascade::lua_lex("3 3.0 3.1416 314.16e-2 0.31416E1 34e1 0xff "
                                      "0x0.1E 0xA23p-4 0X1.921FB54442D18P+1 .5") };
  REQUIRE(tokens.size() == 12);
  for (std::size_t i{ 0 }; i < 11; ++i) {
    CHECK(tokens[i].kind == cascade::lua_token_kind::number);
  }
  CHECK(tokens[7].text == "0x0.1E");
  CHECK(tokens[10].text == ".5");
}

TEST_CASE("lua_lex reads short and long strings") {
  auto const tokens{ cascade::lua_lex(
      "'a\\'b' \"tab\\t\\x41\\u{48}\\065\" [[long\nstring]] [=[with ]] inside]=] x") };
  REQUIRE(tokens.size() == 6);
  CHECK(tokens[0].kind == cascade::lua_token_kind::string);
  CHECK(tokens[1].kind == cascade::lua_token_kind::string);
  CHECK(tokens[2].text == "[[long\nstring]]");
  CHECK(tokens[3].text == "[=[with ]] inside]=]");
  CHECK(tokens[4].text == "x");
  CHECK(tokens[4].line == 2);
}

TEST_CASE("lua_lex skips a leading shebang line") {
  auto const tokens{ cascade::lua_lex("#!/usr/bin/lua\nx") };
  CHECK(texts(tokens) == std::vector<std::string>{ "x", "<eof>" });
}

TEST_CASE("lua_lex rejects malformed input") {
  SUBCASE("unfinished string") {
    try {
      cascade::lua_lex("x = 'abc\ny = 2");
      FAIL("expected analysis_error");
    } catch (cascade::analysis_error const &e) {
      CHECK(e.line() == 1);
      CHECK(std::string{ e.what() }.find("unfinished string") != std::string::npos);
    }
  }

  SUBCASE("unfinished long string") {
    CHECK_THROWS_AS(cascade::lua_lex("x = [[never closed"), cascade::analysis_error);
  }

  SUBCASE("malformed number") {
    CHECK_THROWS_WITH_AS(cascade::lua_lex("x = 3abc"),
                         "malformed number near '3abc'",
                         cascade::analysis_error);
  }

  SUBCASE("unexpected character") {
    CHECK_THROWS_WITH_AS(cascade::lua_lex("x = @"),
                         "unexpected symbol near '@'",
                         cascade::analysis_error);
  }

  SUBCASE("invalid escape") {
    CHECK_THROWS_AS(cascade::lua_lex("x = '\\q'"), cascade::analysis_error);
  }
}

TEST_CASE("lua_token_near quotes tokens") {
  auto const tokens{ cascade::lua_lex("end") };
  CHECK(cascade::lua_token_near(tokens[0]) == "'end'");
  CHECK(cascade::lua_token_near(tokens[1]) == "<eof>");
}
