#include "notebook.h"

#include "util.h"

#include <set>
#include <stdexcept>

namespace cascade {
namespace {

constexpr std::string_view kCellMarker{ "-- %%" };

std::string_view trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\r") - start + 1);
}

bool blank(std::string_view s) { return s.find_first_not_of(" \t\r\n") == std::string_view::npos; }

}  // namespace

std::vector<notebook_cell> notebook_parse(std::string_view text) {
  std::vector<notebook_cell> cells;
  std::string preamble;
  std::string *current{ &preamble };

  for (std::string_view rest{ text }; !rest.empty();) {
    auto const eol{ rest.find('\n') };
    auto const line{ rest.substr(0, eol) };
    rest = (eol == std::string_view::npos) ? std::string_view{} : rest.substr(eol + 1);

    if (line.starts_with(kCellMarker)) {
      auto name{ trim(line.substr(kCellMarker.size())) };
      cells.push_back({ name.empty() ? std::string{} : std::string{ name }, {} });
      current = &cells.back().source;
      continue;
    }
    current->append(line);
    current->push_back('\n');
  }

  if (!blank(preamble)) { cells.insert(cells.begin(), notebook_cell{ {}, std::move(preamble) }); }

  std::set<std::string> seen;
  for (std::size_t i{ 0 }; i < cells.size(); ++i) {
    auto &c{ cells[i] };
    if (c.id.empty()) { c.id = "cell" + std::to_string(i + 1); }
    if (!seen.insert(c.id).second) {
      throw std::runtime_error("notebook: duplicate cell name '" + c.id + "'");
    }
    c.source = std::string{ util_trim_trailing_newlines(c.source) };
  }
  return cells;
}

std::vector<notebook_cell> notebook_load(std::filesystem::path const &path) {
  return notebook_parse(util_load_text_file(path));
}

}  // namespace cascade
