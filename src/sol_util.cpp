#include "sol_util.h"

namespace cascade {

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base, sol::lib::string, sol::lib::math, sol::lib::table);

  // Configuration files describe values; they never load code or touch the filesystem.
  lua->script(R"lua(
dofile = nil
loadfile = nil
load = nil
)lua");

  return lua;
}

}  // namespace cascade
