#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace cascade {

struct lua_error_info {
  std::string kind;     // "RuntimeError", "SyntaxError", "UnresolvedSymbol"
  std::string message;  // without the location prefix
  std::string chunk;    // chunk that raised the error, empty when unknown
  std::optional<int> line;
};

// Line number of a Lua error message of the form "<chunk>:<line>: <text>".
// Example: "cell-1:42: attempt to call a nil value" -> 42
std::optional<int> extract_line_number(std::string_view error_msg);

// Splits a raw Lua error message into location and text. Messages raised by strict
// namespace lookups ("UnresolvedSymbol: ...") take that kind; everything else takes
// `default_kind`.
lua_error_info parse_lua_error(std::string_view error_msg, std::string_view default_kind);

// "Kind: message (line N)". A line in a chunk other than `cell_chunk` (a function
// defined by another cell) is qualified with that chunk's name.
std::string format_lua_error(lua_error_info const &info, std::string_view cell_chunk);

}  // namespace cascade
