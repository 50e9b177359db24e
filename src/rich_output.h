#pragma once

#include "picojson.h"

extern "C" {
#include "lua.h"
}

#include <cstddef>
#include <optional>
#include <stdexcept>

namespace cascade {

struct rich_limits {
  std::size_t max_rows{ 100 };
  std::size_t max_array_elements{ 1000 };
};

// A rich value whose contents cannot be projected (ragged arrays).
class rich_output_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Installs the global `nb` table with the frame, series and array constructors.
// Throws std::runtime_error if the helper chunk fails to load.
void rich_output_install(lua_State *L);

// Size-capped JSON projection of the value at `idx`, or nullopt when it was not built
// by one of the `nb` constructors.
std::optional<picojson::value> rich_output_project(lua_State *L,
                                                   int idx,
                                                   rich_limits const &limits);

}  // namespace cascade
