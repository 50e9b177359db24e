#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cascade {

// Raised when cell source cannot be tokenized or parsed. Reported to users as
// "SyntaxError: <message> (line N)".
class analysis_error : public std::runtime_error {
 public:
  analysis_error(int line, std::string const &message);

  int line() const { return line_; }

 private:
  int line_;
};

enum class lua_token_kind { name, keyword, number, string, symbol, eof };

struct lua_token {
  lua_token_kind kind;
  std::string text;  // raw source text; "<eof>" for the end marker
  int line;
  std::size_t offset;  // byte offset of the first character in the source

  bool is(lua_token_kind k, std::string_view t) const { return kind == k && text == t; }
  bool is_symbol(std::string_view t) const { return is(lua_token_kind::symbol, t); }
  bool is_keyword(std::string_view t) const { return is(lua_token_kind::keyword, t); }
};

// Tokenizes a Lua 5.4 chunk. Comments and whitespace are dropped; the returned vector
// always ends with an eof token. Throws analysis_error on malformed input.
std::vector<lua_token> lua_lex(std::string_view source);

bool lua_is_keyword(std::string_view word);

// Text used in "near ..." diagnostics: quoted token text, or <eof>.
std::string lua_token_near(lua_token const &token);

}  // namespace cascade
