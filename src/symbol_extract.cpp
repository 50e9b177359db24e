#include "symbol_extract.h"

#include <algorithm>
#include <array>
#include <optional>
#include <utility>
#include <vector>

namespace cascade {

namespace {

constexpr std::array<std::string_view, 36> kBuiltins{
  "assert",   "collectgarbage", "dofile",   "error",    "getmetatable", "ipairs",
  "load",     "loadfile",       "next",     "pairs",    "pcall",        "print",
  "rawequal", "rawget",         "rawlen",   "rawset",   "require",      "select",
  "setmetatable", "tonumber",   "tostring", "type",     "warn",         "xpcall",
  "coroutine", "debug",         "io",       "math",     "os",           "package",
  "string",   "table",          "utf8",     "nb",       "_G",           "_VERSION",
};

struct binary_priority {
  int left;
  int right;
};

constexpr int kUnaryPriority{ 12 };

std::optional<binary_priority> binary_priority_of(lua_token const &token) {
  if (token.kind == lua_token_kind::keyword) {
    if (token.text == "and") { return binary_priority{ 2, 2 }; }
    if (token.text == "or") { return binary_priority{ 1, 1 }; }
    return std::nullopt;
  }
  if (token.kind != lua_token_kind::symbol) { return std::nullopt; }

  std::string_view const op{ token.text };
  if (op == "+" || op == "-") { return binary_priority{ 10, 10 }; }
  if (op == "*" || op == "/" || op == "//" || op == "%") { return binary_priority{ 11, 11 }; }
  if (op == "^") { return binary_priority{ 14, 13 }; }  // right associative
  if (op == "..") { return binary_priority{ 9, 8 }; }   // right associative
  if (op == "<<" || op == ">>") { return binary_priority{ 7, 7 }; }
  if (op == "&") { return binary_priority{ 6, 6 }; }
  if (op == "~") { return binary_priority{ 5, 5 }; }
  if (op == "|") { return binary_priority{ 4, 4 }; }
  if (op == "==" || op == "~=" || op == "<" || op == "<=" || op == ">" || op == ">=") {
    return binary_priority{ 3, 3 };
  }
  return std::nullopt;
}

bool is_unary_operator(lua_token const &token) {
  return token.is_keyword("not") || token.is_symbol("-") || token.is_symbol("#") ||
         token.is_symbol("~");
}

// Result of parsing a suffixed expression. A bare name is reported without recording
// a read so the caller can decide between assignment target and value.
struct exp_info {
  enum class kind { name, indexed, call, other };

  kind k{ kind::other };
  std::string name;
};

class parser {
 public:
  explicit parser(std::vector<lua_token> tokens) : toks_{ std::move(tokens) } {}

  cell_symbols run() {
    open_scope();
    while (cur().kind != lua_token_kind::eof) {
      if (cur().is_keyword("return")) {
        return_stat();
        break;
      }
      top_statement();
    }
    if (cur().kind != lua_token_kind::eof) { error_near("'<eof>' expected"); }
    close_scope();
    return std::move(result_);
  }

 private:
  std::vector<lua_token> toks_;
  std::size_t pos_{ 0 };
  std::vector<std::set<std::string>> scopes_;
  cell_symbols result_;

  lua_token const &cur() const { return toks_[pos_]; }

  lua_token const &ahead(std::size_t n) const {
    return toks_[std::min(pos_ + n, toks_.size() - 1)];
  }

  void advance() {
    if (cur().kind != lua_token_kind::eof) { ++pos_; }
  }

  [[noreturn]] void error_near(std::string const &message) const {
    throw analysis_error{ cur().line, message + " near " + lua_token_near(cur()) };
  }

  void check_symbol(std::string_view symbol) {
    if (!cur().is_symbol(symbol)) { error_near("'" + std::string{ symbol } + "' expected"); }
    advance();
  }

  void check_keyword(std::string_view keyword) {
    if (!cur().is_keyword(keyword)) {
      error_near("'" + std::string{ keyword } + "' expected");
    }
    advance();
  }

  // Closing token for a construct opened at `line`; mirrors the Lua compiler's wording.
  void check_match(std::string_view what, std::string_view who, int line) {
    bool const matches{ cur().is(lua_token_kind::keyword, what) ||
                        cur().is(lua_token_kind::symbol, what) };
    if (matches) {
      advance();
      return;
    }
    if (line == cur().line) { error_near("'" + std::string{ what } + "' expected"); }
    error_near("'" + std::string{ what } + "' expected (to close '" + std::string{ who } +
               "' at line " + std::to_string(line) + ")");
  }

  std::string check_name() {
    if (cur().kind != lua_token_kind::name) { error_near("<name> expected"); }
    std::string name{ cur().text };
    advance();
    return name;
  }

  void open_scope() { scopes_.emplace_back(); }
  void close_scope() { scopes_.pop_back(); }
  void declare_local(std::string name) { scopes_.back().insert(std::move(name)); }

  bool is_local(std::string const &name) const {
    for (auto it{ scopes_.rbegin() }; it != scopes_.rend(); ++it) {
      if (it->contains(name)) { return true; }
    }
    return false;
  }

  void note_read(std::string const &name) {
    if (is_local(name) || symbol_is_builtin(name) || symbol_is_private(name)) { return; }
    result_.uses.insert(name);
  }

  void note_write(std::string const &name) {
    if (is_local(name) || symbol_is_private(name)) { return; }
    result_.defines.insert(name);
  }

  void resolve_pending(exp_info &info) {
    if (info.k == exp_info::kind::name) { note_read(info.name); }
    info.k = exp_info::kind::other;
  }

  bool block_follow(bool with_until) const {
    auto const &t{ cur() };
    if (t.kind == lua_token_kind::eof) { return true; }
    if (t.is_keyword("else") || t.is_keyword("elseif") || t.is_keyword("end")) {
      return true;
    }
    return with_until && t.is_keyword("until");
  }

  bool at_chunk_end() {
    while (cur().is_symbol(";")) { advance(); }
    return cur().kind == lua_token_kind::eof;
  }

  // Tokens that can only begin an expression, never a statement.
  bool starts_bare_expression() const {
    auto const &t{ cur() };
    switch (t.kind) {
      case lua_token_kind::number:
      case lua_token_kind::string: return true;
      case lua_token_kind::keyword:
        return t.text == "nil" || t.text == "true" || t.text == "false" ||
               t.text == "not" || (t.text == "function" && ahead(1).is_symbol("("));
      case lua_token_kind::symbol:
        return t.text == "{" || t.text == "-" || t.text == "#" || t.text == "~" ||
               t.text == "...";
      default: return false;
    }
  }

  void block() {
    while (!block_follow(true)) {
      if (cur().is_keyword("return")) {
        return_stat();
        return;
      }
      statement();
    }
  }

  void scoped_block() {
    open_scope();
    block();
    close_scope();
  }

  void return_stat() {
    advance();
    if (!block_follow(true) && !cur().is_symbol(";")) { expr_list(); }
    if (cur().is_symbol(";")) { advance(); }
  }

  // A top-level statement may also be the trailing display expression.
  void top_statement() {
    std::size_t const start{ pos_ };

    if (starts_bare_expression()) {
      trailing_expression(start);
      return;
    }

    if (cur().kind == lua_token_kind::name || cur().is_symbol("(")) {
      auto info{ suffixed_exp() };
      if (cur().is_symbol("=") || cur().is_symbol(",")) {
        assignment(std::move(info));
        return;
      }
      if (info.k == exp_info::kind::call && !binary_priority_of(cur())) {
        if (at_chunk_end()) { result_.trailing_expr_offset = toks_[start].offset; }
        return;
      }
      pos_ = start;
      trailing_expression(start);
      return;
    }

    statement();
  }

  void trailing_expression(std::size_t start) {
    expr();
    if (!at_chunk_end()) { error_near("syntax error"); }
    result_.trailing_expr_offset = toks_[start].offset;
  }

  void statement() {
    int const line{ cur().line };
    auto const &t{ cur() };

    if (t.is_symbol(";")) {
      advance();
    } else if (t.is_symbol("::")) {
      advance();
      check_name();
      check_symbol("::");
    } else if (t.is_keyword("if")) {
      if_stat(line);
    } else if (t.is_keyword("while")) {
      advance();
      expr();
      check_keyword("do");
      scoped_block();
      check_match("end", "while", line);
    } else if (t.is_keyword("do")) {
      advance();
      scoped_block();
      check_match("end", "do", line);
    } else if (t.is_keyword("for")) {
      for_stat(line);
    } else if (t.is_keyword("repeat")) {
      advance();
      open_scope();  // the until condition sees the body's locals
      block();
      check_match("until", "repeat", line);
      expr();
      close_scope();
    } else if (t.is_keyword("function")) {
      function_stat(line);
    } else if (t.is_keyword("local")) {
      advance();
      if (cur().is_keyword("function")) {
        advance();
        declare_local(check_name());
        function_body(false, line);
      } else {
        local_stat();
      }
    } else if (t.is_keyword("break")) {
      advance();
    } else if (t.is_keyword("goto")) {
      advance();
      check_name();
    } else {
      expression_stat();
    }
  }

  void if_stat(int line) {
    advance();
    expr();
    check_keyword("then");
    scoped_block();
    while (cur().is_keyword("elseif")) {
      advance();
      expr();
      check_keyword("then");
      scoped_block();
    }
    if (cur().is_keyword("else")) {
      advance();
      scoped_block();
    }
    check_match("end", "if", line);
  }

  void for_stat(int line) {
    advance();
    std::string first{ check_name() };

    if (cur().is_symbol("=")) {
      advance();
      expr();
      check_symbol(",");
      expr();
      if (cur().is_symbol(",")) {
        advance();
        expr();
      }
      check_keyword("do");
      open_scope();
      declare_local(std::move(first));
      block();
      close_scope();
    } else if (cur().is_symbol(",") || cur().is_keyword("in")) {
      std::vector<std::string> names{ std::move(first) };
      while (cur().is_symbol(",")) {
        advance();
        names.push_back(check_name());
      }
      check_keyword("in");
      expr_list();
      check_keyword("do");
      open_scope();
      for (auto &name : names) { declare_local(std::move(name)); }
      block();
      close_scope();
    } else {
      error_near("'=' or 'in' expected");
    }

    check_match("end", "for", line);
  }

  void function_stat(int line) {
    advance();
    std::string const root{ check_name() };
    bool is_field{ false };
    bool is_method{ false };
    while (cur().is_symbol(".")) {
      advance();
      check_name();
      is_field = true;
    }
    if (cur().is_symbol(":")) {
      advance();
      check_name();
      is_field = true;
      is_method = true;
    }

    if (is_field) {
      note_read(root);
    } else {
      note_write(root);
    }
    function_body(is_method, line);
  }

  void local_stat() {
    std::vector<std::string> names;
    do {
      if (!names.empty()) { advance(); }
      names.push_back(check_name());
      if (cur().is_symbol("<")) {
        advance();
        std::string const attribute{ check_name() };
        if (attribute != "const" && attribute != "close") {
          throw analysis_error{ cur().line, "unknown attribute '" + attribute + "'" };
        }
        check_symbol(">");
      }
    } while (cur().is_symbol(","));

    if (cur().is_symbol("=")) {
      advance();
      expr_list();
    }

    // Initializers are evaluated before the new locals come into scope.
    for (auto &name : names) { declare_local(std::move(name)); }
  }

  void expression_stat() {
    auto info{ suffixed_exp() };
    if (cur().is_symbol("=") || cur().is_symbol(",")) {
      assignment(std::move(info));
    } else if (info.k != exp_info::kind::call) {
      error_near("syntax error");
    }
  }

  void assignment(exp_info first) {
    std::vector<exp_info> targets;
    targets.push_back(std::move(first));
    for (;;) {
      auto const k{ targets.back().k };
      if (k != exp_info::kind::name && k != exp_info::kind::indexed) {
        error_near("syntax error");
      }
      if (!cur().is_symbol(",")) { break; }
      advance();
      targets.push_back(suffixed_exp());
    }

    check_symbol("=");
    expr_list();

    for (auto const &target : targets) {
      if (target.k == exp_info::kind::name) { note_write(target.name); }
    }
  }

  void function_body(bool is_method, int line) {
    open_scope();
    if (is_method) { declare_local("self"); }

    check_symbol("(");
    if (!cur().is_symbol(")")) {
      for (;;) {
        if (cur().kind == lua_token_kind::name) {
          declare_local(check_name());
        } else if (cur().is_symbol("...")) {
          advance();
          break;
        } else {
          error_near("<name> expected");
        }
        if (!cur().is_symbol(",")) { break; }
        advance();
      }
    }
    check_symbol(")");

    block();
    check_match("end", "function", line);
    close_scope();
  }

  void call_args() {
    int const line{ cur().line };
    if (cur().kind == lua_token_kind::string) {
      advance();
    } else if (cur().is_symbol("{")) {
      table_constructor();
    } else if (cur().is_symbol("(")) {
      advance();
      if (!cur().is_symbol(")")) { expr_list(); }
      check_match(")", "(", line);
    } else {
      error_near("function arguments expected");
    }
  }

  exp_info suffixed_exp() {
    exp_info info;

    if (cur().kind == lua_token_kind::name) {
      info.k = exp_info::kind::name;
      info.name = cur().text;
      advance();
    } else if (cur().is_symbol("(")) {
      int const line{ cur().line };
      advance();
      expr();
      check_match(")", "(", line);
    } else {
      error_near("unexpected symbol");
    }

    for (;;) {
      auto const &t{ cur() };
      if (t.is_symbol(".")) {
        resolve_pending(info);
        advance();
        check_name();
        info.k = exp_info::kind::indexed;
      } else if (t.is_symbol("[")) {
        resolve_pending(info);
        advance();
        expr();
        check_symbol("]");
        info.k = exp_info::kind::indexed;
      } else if (t.is_symbol(":")) {
        resolve_pending(info);
        advance();
        check_name();
        call_args();
        info.k = exp_info::kind::call;
      } else if (t.is_symbol("(") || t.is_symbol("{") || t.kind == lua_token_kind::string) {
        resolve_pending(info);
        call_args();
        info.k = exp_info::kind::call;
      } else {
        return info;
      }
    }
  }

  void table_constructor() {
    int const line{ cur().line };
    check_symbol("{");
    while (!cur().is_symbol("}")) {
      if (cur().kind == lua_token_kind::name && ahead(1).is_symbol("=")) {
        advance();  // field name is a key, not a read
        advance();
        expr();
      } else if (cur().is_symbol("[")) {
        advance();
        expr();
        check_symbol("]");
        check_symbol("=");
        expr();
      } else {
        expr();
      }

      if (cur().is_symbol(",") || cur().is_symbol(";")) {
        advance();
      } else {
        break;
      }
    }
    check_match("}", "{", line);
  }

  void simple_exp() {
    auto const &t{ cur() };
    if (t.kind == lua_token_kind::number || t.kind == lua_token_kind::string ||
        t.is_keyword("nil") || t.is_keyword("true") || t.is_keyword("false") ||
        t.is_symbol("...")) {
      advance();
    } else if (t.is_symbol("{")) {
      table_constructor();
    } else if (t.is_keyword("function")) {
      int const line{ t.line };
      advance();
      function_body(false, line);
    } else {
      auto info{ suffixed_exp() };
      resolve_pending(info);
    }
  }

  void sub_expr(int limit) {
    if (is_unary_operator(cur())) {
      advance();
      sub_expr(kUnaryPriority);
    } else {
      simple_exp();
    }

    for (auto prio{ binary_priority_of(cur()) }; prio && prio->left > limit;
         prio = binary_priority_of(cur())) {
      advance();
      sub_expr(prio->right);
    }
  }

  void expr() { sub_expr(0); }

  void expr_list() {
    expr();
    while (cur().is_symbol(",")) {
      advance();
      expr();
    }
  }
};

}  // namespace

bool symbol_is_builtin(std::string_view name) {
  for (auto const builtin : kBuiltins) {
    if (builtin == name) { return true; }
  }
  return false;
}

bool symbol_is_private(std::string_view name) { return !name.empty() && name[0] == '_'; }

cell_symbols symbol_extract(std::string_view source) {
  return parser{ lua_lex(source) }.run();
}

}  // namespace cascade
