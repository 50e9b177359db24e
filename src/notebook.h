#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cascade {

struct notebook_cell {
  std::string id;
  std::string source;
};

// Splits notebook text into cells. A line starting with "-- %%" opens a cell; the rest
// of that line, trimmed, names it (default "cell<N>"). Text before the first marker is
// a cell only when it is not blank. Throws std::runtime_error on duplicate names.
std::vector<notebook_cell> notebook_parse(std::string_view text);

std::vector<notebook_cell> notebook_load(std::filesystem::path const &path);

}  // namespace cascade
