#include "lua_error_formatter.h"

#include <charconv>

namespace cascade {
namespace {

constexpr std::string_view kUnresolvedPrefix{ "UnresolvedSymbol: " };

struct error_location {
  std::string_view chunk;
  int line;
  std::size_t text_start;
};

// Recognizes "<chunk>:<line>:" and "[string \"<chunk>\"]:<line>:" prefixes.
std::optional<error_location> split_location(std::string_view msg) {
  std::string_view chunk;
  std::size_t pos{ 0 };

  if (msg.starts_with("[string \"")) {
    auto const close{ msg.find("\"]:") };
    if (close == std::string_view::npos) { return std::nullopt; }
    chunk = msg.substr(9, close - 9);
    pos = close + 3;
  } else {
    auto const colon{ msg.find(':') };
    if (colon == std::string_view::npos || colon == 0) { return std::nullopt; }
    chunk = msg.substr(0, colon);
    if (chunk.find_first_of(" \n") != std::string_view::npos) { return std::nullopt; }
    pos = colon + 1;
  }

  auto const end_pos{ msg.find(':', pos) };
  if (end_pos == std::string_view::npos || end_pos == pos) { return std::nullopt; }

  int line{ 0 };
  auto const digits{ msg.substr(pos, end_pos - pos) };
  auto const [ptr, ec]{ std::from_chars(digits.data(), digits.data() + digits.size(), line) };
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) { return std::nullopt; }

  std::size_t text_start{ end_pos + 1 };
  if (text_start < msg.size() && msg[text_start] == ' ') { ++text_start; }
  return error_location{ chunk, line, text_start };
}

}  // namespace

std::optional<int> extract_line_number(std::string_view error_msg) {
  if (auto const loc{ split_location(error_msg) }) { return loc->line; }
  return std::nullopt;
}

lua_error_info parse_lua_error(std::string_view error_msg, std::string_view default_kind) {
  lua_error_info info{ .kind = std::string{ default_kind } };

  std::string_view text{ error_msg };
  if (auto const loc{ split_location(error_msg) }) {
    info.chunk = loc->chunk;
    info.line = loc->line;
    text = error_msg.substr(loc->text_start);
  }

  if (text.starts_with(kUnresolvedPrefix)) {
    info.kind = "UnresolvedSymbol";
    text.remove_prefix(kUnresolvedPrefix.size());
  }

  info.message = text;
  return info;
}

std::string format_lua_error(lua_error_info const &info, std::string_view cell_chunk) {
  std::string out{ info.kind + ": " + info.message };
  if (info.line) {
    out += " (";
    if (!info.chunk.empty() && info.chunk != cell_chunk) { out += "cell " + info.chunk + ", "; }
    out += "line " + std::to_string(*info.line) + ")";
  }
  return out;
}

}  // namespace cascade
