#pragma once

#include "lua_lexer.h"

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace cascade {

struct cell_symbols {
  std::set<std::string> defines;  // globals the cell assigns
  std::set<std::string> uses;     // free globals the cell reads (builtins excluded)

  // Byte offset of a trailing bare expression or call; the kernel runs the cell with
  // "return " injected here so the value is displayed.
  std::optional<std::size_t> trailing_expr_offset;
};

// Static analysis of one cell. Never executes code. Throws analysis_error when the
// source does not parse.
cell_symbols symbol_extract(std::string_view source);

// True for names provided by the runtime (Lua standard globals and the nb helpers).
bool symbol_is_builtin(std::string_view name);

// Names starting with '_' are scratch names that never take part in dependencies.
bool symbol_is_private(std::string_view name);

}  // namespace cascade
