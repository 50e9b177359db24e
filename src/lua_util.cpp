#include "lua_util.h"

#include "lua_lexer.h"
#include "util.h"

extern "C" {
#include "lauxlib.h"
#include "lua.h"
#include "lualib.h"
}

#include <algorithm>
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <unordered_map>
#include <vector>

namespace cascade {
namespace {

constexpr char kBuiltinByValue[]{ "cascade.builtin_by_value" };
constexpr char kBuiltinByPath[]{ "cascade.builtin_by_path" };
constexpr char kEnvPath[]{ "_ENV" };

constexpr int kMaxCaptureDepth{ 200 };
constexpr int kMaxRenderDepth{ 4 };
constexpr int kMaxRenderEntries{ 100 };

// __index of namespace environments: fall back to the state's globals, otherwise fail
// with the location of the offending read.
int strict_index(lua_State *L) {
  lua_pushvalue(L, 2);
  lua_rawget(L, lua_upvalueindex(1));
  if (!lua_isnil(L, -1)) { return 1; }
  lua_pop(L, 1);

  luaL_where(L, 1);
  if (lua_type(L, 2) == LUA_TSTRING) {
    lua_pushfstring(L, "UnresolvedSymbol: '%s' is not defined", lua_tostring(L, 2));
  } else {
    lua_pushfstring(L, "UnresolvedSymbol: %s is not defined", luaL_typename(L, 2));
  }
  lua_concat(L, 2);
  return lua_error(L);
}

int dump_writer(lua_State *, void const *p, size_t size, void *ud) {
  static_cast<std::string *>(ud)->append(static_cast<char const *>(p), size);
  return 0;
}

void push_registry_table(lua_State *L, char const *key) {
  if (lua_getfield(L, LUA_REGISTRYINDEX, key) != LUA_TTABLE) {
    lua_pop(L, 1);
    lua_newtable(L);
    lua_pushvalue(L, -1);
    lua_setfield(L, LUA_REGISTRYINDEX, key);
  }
}

void register_builtin(lua_State *L, int by_value, int by_path, std::string const &path) {
  lua_pushvalue(L, -1);
  if (lua_rawget(L, by_value) != LUA_TNIL) {
    lua_pop(L, 1);
    return;
  }
  lua_pop(L, 1);

  lua_pushvalue(L, -1);
  lua_pushlstring(L, path.data(), path.size());
  lua_rawset(L, by_value);

  lua_pushlstring(L, path.data(), path.size());
  lua_pushvalue(L, -2);
  lua_rawset(L, by_path);
}

bool is_registrable(int type) {
  return type == LUA_TFUNCTION || type == LUA_TTABLE || type == LUA_TUSERDATA;
}

std::vector<std::string> sorted_string_keys(lua_State *L, int table) {
  std::vector<std::string> keys;
  lua_pushnil(L);
  while (lua_next(L, table) != 0) {
    if (lua_type(L, -2) == LUA_TSTRING) {
      std::size_t len{ 0 };
      char const *s{ lua_tolstring(L, -2, &len) };
      keys.emplace_back(s, len);
    }
    lua_pop(L, 1);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

class namespace_capture : unmovable {
 public:
  namespace_capture(lua_State *L, int env) : L_{ L }, env_{ env } {
    lua_newtable(L_);
    table_memo_ = lua_gettop(L_);
    lua_newtable(L_);
    function_memo_ = lua_gettop(L_);
  }

  ~namespace_capture() { lua_settop(L_, table_memo_ - 1); }

  namespace_store run() {
    for (auto const &name : sorted_string_keys(L_, env_)) {
      current_global_ = name;
      lua_pushlstring(L_, name.data(), name.size());
      lua_rawget(L_, env_);
      auto value{ capture(-1, 0) };
      lua_pop(L_, 1);
      ns_.set(name, std::move(value));
    }
    return std::move(ns_);
  }

 private:
  [[noreturn]] void reject(char const *what) {
    throw namespace_capture_error("NamespaceError: value of '" + current_global_ + "' is " +
                                  what + " and cannot be kept in the namespace");
  }

  std::optional<std::uint32_t> memo_lookup(int memo, int idx) {
    lua_pushvalue(L_, idx);
    std::optional<std::uint32_t> result;
    if (lua_rawget(L_, memo) == LUA_TNUMBER) {
      result = static_cast<std::uint32_t>(lua_tointeger(L_, -1));
    }
    lua_pop(L_, 1);
    return result;
  }

  void memo_store(int memo, int idx, std::uint32_t id) {
    lua_pushvalue(L_, idx);
    lua_pushinteger(L_, static_cast<lua_Integer>(id));
    lua_rawset(L_, memo);
  }

  ns_value capture(int idx, int depth) {
    idx = lua_absindex(L_, idx);
    if (depth > kMaxCaptureDepth) { reject("nested too deeply"); }
    if (!lua_checkstack(L_, 8)) { reject("nested too deeply"); }

    switch (lua_type(L_, idx)) {
      case LUA_TNIL: return std::monostate{};
      case LUA_TBOOLEAN: return lua_toboolean(L_, idx) != 0;
      case LUA_TNUMBER:
        if (lua_isinteger(L_, idx)) {
          return static_cast<std::int64_t>(lua_tointeger(L_, idx));
        }
        return static_cast<double>(lua_tonumber(L_, idx));
      case LUA_TSTRING: {
        std::size_t len{ 0 };
        char const *s{ lua_tolstring(L_, idx, &len) };
        return std::string{ s, len };
      }
      case LUA_TTABLE: return capture_table(idx, depth);
      case LUA_TFUNCTION: return capture_function(idx, depth);
      case LUA_TUSERDATA:
      case LUA_TLIGHTUSERDATA:
        if (auto path{ lua_builtin_path(L_, idx) }) { return ns_builtin_ref{ *path }; }
        reject("a userdata");
      case LUA_TTHREAD: reject("a coroutine");
    }
    reject("of an unknown type");
  }

  ns_value capture_table(int idx, int depth) {
    if (lua_rawequal(L_, idx, env_)) { return ns_builtin_ref{ kEnvPath }; }
    if (auto path{ lua_builtin_path(L_, idx) }) { return ns_builtin_ref{ *path }; }
    if (auto id{ memo_lookup(table_memo_, idx) }) { return ns_table_ref{ *id }; }

    auto const id{ ns_.add_table({}) };
    memo_store(table_memo_, idx, id);

    ns_table table;
    lua_pushnil(L_);
    while (lua_next(L_, idx) != 0) {
      auto key{ capture(-2, depth + 1) };
      auto val{ capture(-1, depth + 1) };
      table.entries.emplace_back(std::move(key), std::move(val));
      lua_pop(L_, 1);
    }
    if (lua_getmetatable(L_, idx)) {
      table.metatable = capture(-1, depth + 1);
      lua_pop(L_, 1);
    }

    ns_.table(id) = std::move(table);
    return ns_table_ref{ id };
  }

  ns_value capture_function(int idx, int depth) {
    if (auto path{ lua_builtin_path(L_, idx) }) { return ns_builtin_ref{ *path }; }
    if (lua_iscfunction(L_, idx)) { reject("a native function"); }
    if (auto id{ memo_lookup(function_memo_, idx) }) { return ns_function_ref{ *id }; }

    auto const id{ ns_.add_function({}) };
    memo_store(function_memo_, idx, id);

    ns_function fn;
    lua_pushvalue(L_, idx);
    int const dump_status{ lua_dump(L_, dump_writer, &fn.bytecode, 0) };
    lua_pop(L_, 1);
    if (dump_status != 0) { reject("a function that cannot be serialized"); }

    for (int n{ 1 };; ++n) {
      if (!lua_getupvalue(L_, idx, n)) { break; }
      void *const uv_id{ lua_upvalueid(L_, idx, n) };

      ns_upvalue uv;
      auto [it, inserted]{ upvalue_slots_.try_emplace(uv_id, next_slot_) };
      if (inserted) { ++next_slot_; }
      uv.slot = it->second;

      if (lua_rawequal(L_, -1, env_)) {
        uv.is_env = true;
      } else {
        uv.value = capture(-1, depth + 1);
      }
      lua_pop(L_, 1);
      fn.upvalues.push_back(std::move(uv));
    }

    ns_.function(id) = std::move(fn);
    return ns_function_ref{ id };
  }

  lua_State *L_;
  int env_;
  int table_memo_{ 0 };
  int function_memo_{ 0 };
  namespace_store ns_;
  std::string current_global_;
  std::unordered_map<void *, std::uint32_t> upvalue_slots_;
  std::uint32_t next_slot_{ 1 };
};

}  // namespace

void lua_deleter::operator()(lua_State *lua) const {
  if (lua) lua_close(lua);
}

lua_state_ptr lua_make() {
  lua_State *lua{ luaL_newstate() };
  if (!lua) { throw std::runtime_error("Failed to create Lua state"); }

  luaL_openlibs(lua);
  return lua_state_ptr{ lua };
}

void lua_register_builtins(lua_State *L) {
  int const top{ lua_gettop(L) };
  push_registry_table(L, kBuiltinByValue);
  int const by_value{ lua_gettop(L) };
  push_registry_table(L, kBuiltinByPath);
  int const by_path{ lua_gettop(L) };
  lua_pushglobaltable(L);
  int const globals{ lua_gettop(L) };

  auto const top_level{ sorted_string_keys(L, globals) };
  for (auto const &name : top_level) {
    lua_getfield(L, globals, name.c_str());
    if (is_registrable(lua_type(L, -1))) { register_builtin(L, by_value, by_path, name); }
    lua_pop(L, 1);
  }

  for (auto const &name : top_level) {
    if (lua_getfield(L, globals, name.c_str()) == LUA_TTABLE) {
      int const lib{ lua_gettop(L) };
      for (auto const &member : sorted_string_keys(L, lib)) {
        lua_getfield(L, lib, member.c_str());
        if (is_registrable(lua_type(L, -1))) {
          register_builtin(L, by_value, by_path, name + "." + member);
        }
        lua_pop(L, 1);
      }
    }
    lua_pop(L, 1);
  }

  lua_settop(L, top);
}

bool lua_push_builtin(lua_State *L, std::string const &path) {
  if (lua_getfield(L, LUA_REGISTRYINDEX, kBuiltinByPath) != LUA_TTABLE) {
    lua_pop(L, 1);
    return false;
  }
  lua_pushlstring(L, path.data(), path.size());
  if (lua_rawget(L, -2) == LUA_TNIL) {
    lua_pop(L, 2);
    return false;
  }
  lua_remove(L, -2);
  return true;
}

std::optional<std::string> lua_builtin_path(lua_State *L, int idx) {
  idx = lua_absindex(L, idx);
  if (lua_getfield(L, LUA_REGISTRYINDEX, kBuiltinByValue) != LUA_TTABLE) {
    lua_pop(L, 1);
    return std::nullopt;
  }
  lua_pushvalue(L, idx);
  std::optional<std::string> result;
  if (lua_rawget(L, -2) == LUA_TSTRING) {
    std::size_t len{ 0 };
    char const *s{ lua_tolstring(L, -1, &len) };
    result.emplace(s, len);
  }
  lua_pop(L, 2);
  return result;
}

void lua_push_namespace_env(lua_State *L, namespace_store const &ns) {
  if (!lua_checkstack(L, 16)) { throw std::runtime_error("namespace: Lua stack exhausted"); }

  lua_newtable(L);
  int const env{ lua_gettop(L) };

  lua_createtable(L, static_cast<int>(ns.table_count()), 0);
  int const tables{ lua_gettop(L) };
  for (std::size_t i{ 0 }; i < ns.table_count(); ++i) {
    lua_newtable(L);
    lua_rawseti(L, tables, static_cast<lua_Integer>(i + 1));
  }

  lua_createtable(L, static_cast<int>(ns.function_count()), 0);
  int const functions{ lua_gettop(L) };
  for (std::size_t i{ 0 }; i < ns.function_count(); ++i) {
    auto const &bytecode{ ns.function(static_cast<std::uint32_t>(i)).bytecode };
    if (luaL_loadbufferx(L, bytecode.data(), bytecode.size(), "=namespace", "b") !=
        LUA_OK) {
      std::string const err{ lua_tostring(L, -1) ? lua_tostring(L, -1) : "unknown error" };
      lua_settop(L, env - 1);
      throw std::runtime_error("namespace: cannot load function: " + err);
    }
    lua_rawseti(L, functions, static_cast<lua_Integer>(i + 1));
  }

  auto const push_value{ [&](ns_value const &value) {
    std::visit(match{
                   [&](std::monostate) { lua_pushnil(L); },
                   [&](bool b) { lua_pushboolean(L, b ? 1 : 0); },
                   [&](std::int64_t i) { lua_pushinteger(L, static_cast<lua_Integer>(i)); },
                   [&](double d) { lua_pushnumber(L, static_cast<lua_Number>(d)); },
                   [&](std::string const &s) { lua_pushlstring(L, s.data(), s.size()); },
                   [&](ns_table_ref r) {
                     lua_rawgeti(L, tables, static_cast<lua_Integer>(r.id) + 1);
                   },
                   [&](ns_function_ref r) {
                     lua_rawgeti(L, functions, static_cast<lua_Integer>(r.id) + 1);
                   },
                   [&](ns_builtin_ref const &r) {
                     if (r.path == kEnvPath) {
                       lua_pushvalue(L, env);
                     } else if (!lua_push_builtin(L, r.path)) {
                       lua_settop(L, env - 1);
                       throw std::runtime_error("namespace: unknown builtin '" + r.path +
                                                "'");
                     }
                   },
               },
               value);
  } };

  for (std::size_t i{ 0 }; i < ns.table_count(); ++i) {
    auto const &table{ ns.table(static_cast<std::uint32_t>(i)) };
    lua_rawgeti(L, tables, static_cast<lua_Integer>(i + 1));
    int const t{ lua_gettop(L) };
    for (auto const &[key, val] : table.entries) {
      push_value(key);
      push_value(val);
      lua_rawset(L, t);
    }
    if (table.metatable) {
      push_value(*table.metatable);
      if (lua_istable(L, -1)) {
        lua_setmetatable(L, t);
      } else {
        lua_pop(L, 1);
      }
    }
    lua_pop(L, 1);
  }

  // Upvalues sharing a slot are joined to the first closure that carried it.
  std::unordered_map<std::uint32_t, std::pair<std::uint32_t, int>> slot_owner;
  for (std::size_t i{ 0 }; i < ns.function_count(); ++i) {
    auto const fn_id{ static_cast<std::uint32_t>(i) };
    auto const &fn{ ns.function(fn_id) };
    lua_rawgeti(L, functions, static_cast<lua_Integer>(i + 1));
    int const f{ lua_gettop(L) };

    for (std::size_t u{ 0 }; u < fn.upvalues.size(); ++u) {
      auto const &uv{ fn.upvalues[u] };
      int const n{ static_cast<int>(u + 1) };

      if (auto const owner{ uv.slot ? slot_owner.find(uv.slot) : slot_owner.end() };
          owner != slot_owner.end()) {
        lua_rawgeti(L, functions, static_cast<lua_Integer>(owner->second.first) + 1);
        lua_upvaluejoin(L, f, n, -1, owner->second.second);
        lua_pop(L, 1);
        continue;
      }

      if (uv.is_env) {
        lua_pushvalue(L, env);
      } else {
        push_value(uv.value);
      }
      if (!lua_setupvalue(L, f, n)) { lua_pop(L, 1); }
      if (uv.slot) { slot_owner.emplace(uv.slot, std::make_pair(fn_id, n)); }
    }
    lua_pop(L, 1);
  }

  for (auto const &[name, value] : ns.globals()) {
    lua_pushlstring(L, name.data(), name.size());
    push_value(value);
    lua_rawset(L, env);
  }

  lua_settop(L, env);

  lua_createtable(L, 0, 1);
  lua_pushglobaltable(L);
  lua_pushcclosure(L, strict_index, 1);
  lua_setfield(L, -2, "__index");
  lua_setmetatable(L, env);
}

namespace_store lua_capture_namespace(lua_State *L, int env_idx) {
  env_idx = lua_absindex(L, env_idx);
  if (!lua_istable(L, env_idx)) {
    throw std::invalid_argument("lua_capture_namespace: environment is not a table");
  }
  namespace_capture capture{ L, env_idx };
  return capture.run();
}

namespace {

std::string format_number(lua_State *L, int idx) {
  char buf[64];
  if (lua_isinteger(L, idx)) {
    std::snprintf(buf,
                  sizeof(buf),
                  "%" PRId64,
                  static_cast<std::int64_t>(lua_tointeger(L, idx)));
    return buf;
  }

  double const d{ static_cast<double>(lua_tonumber(L, idx)) };
  if (std::isnan(d)) { return "nan"; }
  if (std::isinf(d)) { return d > 0 ? "inf" : "-inf"; }
  std::snprintf(buf, sizeof(buf), "%.14g", d);
  std::string out{ buf };
  if (out.find_first_not_of("-0123456789") == std::string::npos) { out += ".0"; }
  return out;
}

std::string quote_string(std::string_view s) {
  std::string out{ "\"" };
  for (unsigned char const c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20 || c == 0x7f) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\%d", static_cast<int>(c));
          out += buf;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  out += '"';
  return out;
}

bool is_identifier(std::string_view s) {
  if (s.empty() || lua_is_keyword(s)) { return false; }
  auto const ident_char{ [](char c, bool first) {
    return c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (!first && c >= '0' && c <= '9');
  } };
  for (std::size_t i{ 0 }; i < s.size(); ++i) {
    if (!ident_char(s[i], i == 0)) { return false; }
  }
  return true;
}

// Runs luaL_tolstring in protected mode so a failing __tostring cannot unwind
// through C++ frames.
int tostring_thunk(lua_State *L) {
  luaL_tolstring(L, 1, nullptr);
  return 1;
}

class value_renderer {
 public:
  explicit value_renderer(lua_State *L) : L_{ L } {}

  std::string render(int idx, int depth) {
    idx = lua_absindex(L_, idx);
    if (!lua_checkstack(L_, 8)) { return "<...>"; }

    switch (lua_type(L_, idx)) {
      case LUA_TNIL: return "nil";
      case LUA_TBOOLEAN: return lua_toboolean(L_, idx) ? "true" : "false";
      case LUA_TNUMBER: return format_number(L_, idx);
      case LUA_TSTRING: {
        std::size_t len{ 0 };
        char const *s{ lua_tolstring(L_, idx, &len) };
        return quote_string({ s, len });
      }
      case LUA_TTABLE: return render_table(idx, depth);
      case LUA_TFUNCTION: return "<function>";
      case LUA_TTHREAD: return "<thread>";
      default: return "<userdata>";
    }
  }

 private:
  std::optional<std::string> custom_tostring(int idx) {
    if (luaL_getmetafield(L_, idx, "__tostring") == LUA_TNIL) { return std::nullopt; }
    lua_pop(L_, 1);

    lua_pushcfunction(L_, tostring_thunk);
    lua_pushvalue(L_, idx);
    if (lua_pcall(L_, 1, 1, 0) != LUA_OK) {
      lua_pop(L_, 1);
      return "<error in __tostring>";
    }
    std::size_t len{ 0 };
    char const *s{ lua_tolstring(L_, -1, &len) };
    std::string out{ s ? std::string{ s, len } : std::string{} };
    lua_pop(L_, 1);
    return out;
  }

  std::string render_table(int idx, int depth) {
    if (auto custom{ custom_tostring(idx) }) { return *custom; }

    void const *self{ lua_topointer(L_, idx) };
    if (std::find(path_.begin(), path_.end(), self) != path_.end()) { return "<cycle>"; }
    if (depth >= kMaxRenderDepth) { return "{...}"; }
    path_.push_back(self);

    std::vector<std::string> parts;
    bool truncated{ false };

    lua_Integer const array_len{ static_cast<lua_Integer>(lua_rawlen(L_, idx)) };
    for (lua_Integer i{ 1 }; i <= array_len; ++i) {
      if (static_cast<int>(parts.size()) >= kMaxRenderEntries) {
        truncated = true;
        break;
      }
      lua_rawgeti(L_, idx, i);
      parts.push_back(render(-1, depth + 1));
      lua_pop(L_, 1);
    }

    std::vector<std::string> keyed;
    lua_pushnil(L_);
    while (lua_next(L_, idx) != 0) {
      if (lua_isinteger(L_, -2)) {
        lua_Integer const k{ lua_tointeger(L_, -2) };
        if (k >= 1 && k <= array_len) {
          lua_pop(L_, 1);
          continue;
        }
      }

      std::string entry;
      if (lua_type(L_, -2) == LUA_TSTRING) {
        std::size_t len{ 0 };
        char const *s{ lua_tolstring(L_, -2, &len) };
        std::string_view const key{ s, len };
        entry = is_identifier(key) ? std::string{ key } : "[" + quote_string(key) + "]";
      } else {
        entry = "[" + render(-2, depth + 1) + "]";
      }
      entry += " = " + render(-1, depth + 1);
      keyed.push_back(std::move(entry));
      lua_pop(L_, 1);
    }
    std::sort(keyed.begin(), keyed.end());

    for (auto &entry : keyed) {
      if (static_cast<int>(parts.size()) >= kMaxRenderEntries) {
        truncated = true;
        break;
      }
      parts.push_back(std::move(entry));
    }

    path_.pop_back();

    std::string out{ "{" };
    for (std::size_t i{ 0 }; i < parts.size(); ++i) {
      if (i) { out += ", "; }
      out += parts[i];
    }
    if (truncated) { out += ", ..."; }
    out += "}";
    return out;
  }

  lua_State *L_;
  std::vector<void const *> path_;
};

}  // namespace

std::string lua_render_value(lua_State *L, int idx) {
  value_renderer renderer{ L };
  return renderer.render(idx, 0);
}

}  // namespace cascade
