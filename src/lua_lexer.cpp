#include "lua_lexer.h"

#include <array>
#include <cctype>

namespace cascade {

namespace {

constexpr std::array<std::string_view, 22> kKeywords{
  "and",   "break", "do",     "else",   "elseif", "end",  "false", "for",
  "function", "goto", "if",   "in",     "local",  "nil",  "not",   "or",
  "repeat", "return", "then", "true",   "until",  "while",
};

// Longest first so "..." wins over ".." and ".".
constexpr std::array<std::string_view, 10> kMultiCharSymbols{
  "...", "..", "==", "~=", "<=", ">=", "<<", ">>", "//", "::",
};

constexpr std::string_view kSingleCharSymbols{ "+-*/%^#&~|<>=(){}[];:,." };

bool is_name_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

bool is_hex_digit(char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; }

class lexer {
 public:
  explicit lexer(std::string_view source) : src_{ source } {}

  std::vector<lua_token> run() {
    std::vector<lua_token> tokens;
    skip_shebang();

    for (;;) {
      skip_whitespace_and_comments();
      if (at_end()) { break; }
      tokens.push_back(next_token());
    }

    tokens.push_back(lua_token{ .kind = lua_token_kind::eof,
                                .text = "<eof>",
                                .line = line_,
                                .offset = src_.size() });
    return tokens;
  }

 private:
  std::string_view src_;
  std::size_t pos_{ 0 };
  int line_{ 1 };

  bool at_end() const { return pos_ >= src_.size(); }
  char peek(std::size_t ahead = 0) const {
    return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
  }

  [[noreturn]] void fail(std::string const &message) const {
    throw analysis_error{ line_, message };
  }

  void consume_newline() {
    char const first{ src_[pos_++] };
    // \r\n and \n\r count as one line break
    if (!at_end() && (src_[pos_] == '\n' || src_[pos_] == '\r') && src_[pos_] != first) {
      ++pos_;
    }
    ++line_;
  }

  void skip_shebang() {
    if (peek() == '#') {
      while (!at_end() && peek() != '\n' && peek() != '\r') { ++pos_; }
    }
  }

  void skip_whitespace_and_comments() {
    while (!at_end()) {
      char const c{ peek() };
      if (c == '\n' || c == '\r') {
        consume_newline();
      } else if (c == ' ' || c == '\t' || c == '\f' || c == '\v') {
        ++pos_;
      } else if (c == '-' && peek(1) == '-') {
        pos_ += 2;
        if (peek() == '[') {
          std::size_t const level{ long_bracket_level() };
          if (level != kNotLongBracket) {
            skip_long_bracket(level, "comment");
            continue;
          }
        }
        while (!at_end() && peek() != '\n' && peek() != '\r') { ++pos_; }
      } else {
        break;
      }
    }
  }

  static constexpr std::size_t kNotLongBracket{ static_cast<std::size_t>(-1) };

  // At '[': returns the number of '=' in an opening long bracket, or kNotLongBracket.
  std::size_t long_bracket_level() const {
    std::size_t i{ 1 };
    while (peek(i) == '=') { ++i; }
    if (peek(i) == '[') { return i - 1; }
    if (i > 1) {
      fail("invalid long string delimiter near '" + std::string(src_.substr(pos_, i)) + "'");
    }
    return kNotLongBracket;
  }

  void skip_long_bracket(std::size_t level, char const *what) {
    int const start_line{ line_ };
    pos_ += level + 2;
    for (;;) {
      if (at_end()) {
        fail(std::string{ "unfinished long " } + what + " (starting at line " +
             std::to_string(start_line) + ") near '<eof>'");
      }
      char const c{ peek() };
      if (c == ']') {
        std::size_t i{ 1 };
        while (peek(i) == '=') { ++i; }
        if (i - 1 == level && peek(i) == ']') {
          pos_ += i + 1;
          return;
        }
        ++pos_;
      } else if (c == '\n' || c == '\r') {
        consume_newline();
      } else {
        ++pos_;
      }
    }
  }

  lua_token make(lua_token_kind kind, std::size_t start, int line) const {
    return lua_token{ .kind = kind,
                      .text = std::string{ src_.substr(start, pos_ - start) },
                      .line = line,
                      .offset = start };
  }

  lua_token next_token() {
    std::size_t const start{ pos_ };
    int const line{ line_ };
    char const c{ peek() };

    if (is_name_start(c)) {
      while (!at_end() && is_name_char(peek())) { ++pos_; }
      auto token{ make(lua_token_kind::name, start, line) };
      if (lua_is_keyword(token.text)) { token.kind = lua_token_kind::keyword; }
      return token;
    }

    if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
      read_number();
      return make(lua_token_kind::number, start, line);
    }

    if (c == '"' || c == '\'') {
      read_short_string(c);
      return make(lua_token_kind::string, start, line);
    }

    if (c == '[') {
      std::size_t const level{ long_bracket_level() };
      if (level != kNotLongBracket) {
        skip_long_bracket(level, "string");
        return make(lua_token_kind::string, start, line);
      }
    }

    for (auto const symbol : kMultiCharSymbols) {
      if (src_.substr(pos_, symbol.size()) == symbol) {
        pos_ += symbol.size();
        return make(lua_token_kind::symbol, start, line);
      }
    }

    if (kSingleCharSymbols.find(c) != std::string_view::npos) {
      ++pos_;
      return make(lua_token_kind::symbol, start, line);
    }

    fail("unexpected symbol near '" + std::string(1, c) + "'");
  }

  void read_number() {
    std::size_t const start{ pos_ };
    bool const hex{ peek() == '0' && (peek(1) == 'x' || peek(1) == 'X') };
    char exp_lower{ 'e' };
    if (hex) {
      pos_ += 2;
      exp_lower = 'p';
    }

    for (;;) {
      char const c{ peek() };
      if (std::tolower(static_cast<unsigned char>(c)) == exp_lower) {
        ++pos_;
        if (peek() == '+' || peek() == '-') { ++pos_; }
      } else if ((hex ? is_hex_digit(c) : is_digit(c)) || c == '.') {
        ++pos_;
      } else {
        break;
      }
    }

    // A numeral running straight into a name is malformed ("3x", "0xg").
    if (is_name_char(peek())) {
      while (!at_end() && is_name_char(peek())) { ++pos_; }
      fail("malformed number near '" + std::string(src_.substr(start, pos_ - start)) + "'");
    }
  }

  void read_short_string(char quote) {
    ++pos_;
    for (;;) {
      if (at_end()) { fail("unfinished string near '<eof>'"); }
      char const c{ peek() };
      if (c == quote) {
        ++pos_;
        return;
      }
      if (c == '\n' || c == '\r') {
        fail("unfinished string near '" + current_fragment() + "'");
      }
      if (c == '\\') {
        read_escape();
      } else {
        ++pos_;
      }
    }
  }

  std::string current_fragment() const {
    std::size_t begin{ pos_ };
    while (begin > 0 && src_[begin - 1] != '\n' && src_[begin - 1] != '\r') { --begin; }
    return std::string{ src_.substr(begin, pos_ - begin) };
  }

  void read_escape() {
    ++pos_;  // backslash
    if (at_end()) { fail("unfinished string near '<eof>'"); }
    char const c{ peek() };
    switch (c) {
      case 'a': case 'b': case 'f': case 'n': case 'r': case 't': case 'v':
      case '\\': case '"': case '\'':
        ++pos_;
        return;
      case '\n':
      case '\r': consume_newline(); return;
      case 'x':
        ++pos_;
        for (int i{ 0 }; i < 2; ++i) {
          if (!is_hex_digit(peek())) { fail("hexadecimal digit expected near '\\x'"); }
          ++pos_;
        }
        return;
      case 'z':
        ++pos_;
        while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) {
          if (peek() == '\n' || peek() == '\r') {
            consume_newline();
          } else {
            ++pos_;
          }
        }
        return;
      case 'u':
        ++pos_;
        if (peek() != '{') { fail("missing '{' in \\u{xxxx}"); }
        ++pos_;
        if (!is_hex_digit(peek())) { fail("hexadecimal digit expected near '\\u{'"); }
        while (is_hex_digit(peek())) { ++pos_; }
        if (peek() != '}') { fail("missing '}' in \\u{xxxx}"); }
        ++pos_;
        return;
      default:
        if (is_digit(c)) {
          int value{ 0 };
          for (int i{ 0 }; i < 3 && is_digit(peek()); ++i) {
            value = value * 10 + (peek() - '0');
            ++pos_;
          }
          if (value > 255) { fail("decimal escape too large"); }
          return;
        }
        fail("invalid escape sequence '\\" + std::string(1, c) + "'");
    }
  }
};

}  // namespace

analysis_error::analysis_error(int line, std::string const &message)
    : std::runtime_error{ message }, line_{ line } {}

bool lua_is_keyword(std::string_view word) {
  for (auto const keyword : kKeywords) {
    if (keyword == word) { return true; }
  }
  return false;
}

std::string lua_token_near(lua_token const &token) {
  if (token.kind == lua_token_kind::eof) { return "<eof>"; }
  return "'" + token.text + "'";
}

std::vector<lua_token> lua_lex(std::string_view source) { return lexer{ source }.run(); }

}  // namespace cascade
