#pragma once

#include "sol/sol.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

namespace cascade {

using sol_state_ptr = std::unique_ptr<sol::state>;
// Sandboxed state for configuration files: base, string, math and table only.
sol_state_ptr sol_util_make_lua_state();

// Lua type named in "<context>: <key> must be a <type>" errors.
template <typename T>
constexpr char const *sol_util_expected_type() {
  if constexpr (std::is_same_v<T, bool>) { return "boolean"; }
  if constexpr (std::is_arithmetic_v<T>) { return "number"; }
  if constexpr (std::is_convertible_v<T, std::string_view>) { return "string"; }
  return "value";
}

// Nil and absent keys read as nullopt. Throws std::runtime_error when the value has
// another type.
template <typename T>
std::optional<T> sol_util_get_optional(sol::table const &table,
                                       std::string_view key,
                                       std::string_view context) {
  sol::object const obj = table[key];
  if (!obj.valid() || obj.get_type() == sol::type::lua_nil) { return std::nullopt; }

  if (!obj.is<T>()) {
    throw std::runtime_error(std::string{ context } + ": " + std::string{ key } +
                             " must be a " + sol_util_expected_type<T>());
  }
  return obj.as<T>();
}

}  // namespace cascade
