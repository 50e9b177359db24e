#pragma once

#include "namespace_store.h"

extern "C" {
#include "lua.h"
}

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace cascade {

struct lua_deleter {
  void operator()(lua_State *lua) const;
};
using lua_state_ptr = std::unique_ptr<lua_State, lua_deleter>;

// New state with the standard libraries opened. Throws std::runtime_error.
lua_state_ptr lua_make();

// A value left in the namespace that cannot be transferred (userdata, coroutine,
// foreign C function). The message is user-facing.
class namespace_capture_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Records every value reachable from _G at the top level and one level into its
// tables under a dotted path ("print", "math.sin"). Call once all globals are in
// place; the first path found for a value wins.
void lua_register_builtins(lua_State *L);

// Pushes the builtin registered under `path`. Returns false and pushes nothing when
// the path is unknown.
bool lua_push_builtin(lua_State *L, std::string const &path);

std::optional<std::string> lua_builtin_path(lua_State *L, int idx);

// Pushes a fresh environment table populated from `ns`. Reading a name that is
// neither in the environment nor a global of the state raises
// "UnresolvedSymbol: 'x' is not defined". Throws std::runtime_error if a stored
// function cannot be loaded or a builtin path is unknown.
void lua_push_namespace_env(lua_State *L, namespace_store const &ns);

// Snapshot of the string-keyed entries of the environment table at `env_idx`.
// Throws namespace_capture_error for values that cannot be transferred.
namespace_store lua_capture_namespace(lua_State *L, int env_idx);

// REPL-style rendering: 15, 2.5, "text", {1, 2, a = 3}, <function>.
std::string lua_render_value(lua_State *L, int idx);

}  // namespace cascade
