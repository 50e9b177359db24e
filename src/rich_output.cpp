#include "rich_output.h"

#include "lua_util.h"

extern "C" {
#include "lauxlib.h"
#include "lua.h"
}

#include <algorithm>
#include <cmath>
#include <string>
#include <string_view>
#include <vector>

namespace cascade {
namespace {

constexpr char kNotebookLua[] = R"lua(
local nb = {}

local function shape_of(data)
  local dims = {}
  local t = data
  while type(t) == "table" and getmetatable(t) == nil do
    dims[#dims + 1] = #t
    if #t == 0 then break end
    t = t[1]
  end
  return dims
end

local frame_mt = { __rich = "frame" }
frame_mt.__tostring = function(f)
  return string.format("frame(%d rows x %d columns)", f.rows, #f.order)
end

local series_mt = { __rich = "series" }
series_mt.__tostring = function(s)
  if s.name ~= nil then
    return string.format("series '%s' (%d values)", tostring(s.name), s.n)
  end
  return string.format("series (%d values)", s.n)
end

local array_mt = { __rich = "array" }
array_mt.__tostring = function(a)
  return "array(" .. table.concat(shape_of(a.data), "x") .. ")"
end

nb._frame_mt = frame_mt
nb._series_mt = series_mt
nb._array_mt = array_mt

function nb.frame(columns, order)
  if type(columns) ~= "table" then
    error("nb.frame: columns must be a table of arrays", 2)
  end
  if order == nil then
    order = {}
    for name in pairs(columns) do order[#order + 1] = name end
    table.sort(order, function(a, b) return tostring(a) < tostring(b) end)
  elseif type(order) ~= "table" then
    error("nb.frame: column order must be an array of names", 2)
  end

  local rows
  for _, name in ipairs(order) do
    local col = columns[name]
    if type(col) ~= "table" then
      error("nb.frame: column '" .. tostring(name) .. "' must be an array", 2)
    end
    if rows == nil then
      rows = #col
    elseif #col ~= rows then
      error(string.format("nb.frame: column '%s' has %d rows, expected %d",
                          tostring(name), #col, rows), 2)
    end
  end

  return setmetatable({ columns = columns, order = order, rows = rows or 0 }, frame_mt)
end

function nb.series(values, name)
  if type(values) ~= "table" then error("nb.series: values must be an array", 2) end
  return setmetatable({ values = values, name = name, n = #values }, series_mt)
end

function nb.array(data)
  if type(data) ~= "table" then error("nb.array: data must be a nested array", 2) end
  return setmetatable({ data = data }, array_mt)
end

return nb
)lua";

enum class rich_kind { frame, series, array };

std::optional<rich_kind> rich_kind_of(lua_State *L, int idx) {
  if (!lua_istable(L, idx) || !lua_getmetatable(L, idx)) { return std::nullopt; }
  lua_pushliteral(L, "__rich");
  lua_rawget(L, -2);
  std::optional<rich_kind> kind;
  if (lua_type(L, -1) == LUA_TSTRING) {
    std::string_view const tag{ lua_tostring(L, -1) };
    if (tag == "frame") {
      kind = rich_kind::frame;
    } else if (tag == "series") {
      kind = rich_kind::series;
    } else if (tag == "array") {
      kind = rich_kind::array;
    }
  }
  lua_pop(L, 2);
  return kind;
}

// Pushes t[key] without metamethods.
int raw_field(lua_State *L, int idx, char const *key) {
  lua_pushstring(L, key);
  return lua_rawget(L, idx);
}

std::size_t raw_len(lua_State *L, int idx) {
  return static_cast<std::size_t>(lua_rawlen(L, idx));
}

class dtype_tracker {
 public:
  void observe(lua_State *L, int idx) {
    switch (lua_type(L, idx)) {
      case LUA_TNUMBER: (lua_isinteger(L, idx) ? ints_ : floats_) = true; break;
      case LUA_TBOOLEAN: bools_ = true; break;
      case LUA_TSTRING: strings_ = true; break;
      default: other_ = true; break;
    }
  }

  char const *name() const {
    bool const numeric{ ints_ || floats_ };
    if (other_ || (numeric && (bools_ || strings_)) || (bools_ && strings_)) {
      return "object";
    }
    if (floats_) { return "float64"; }
    if (ints_) { return "int64"; }
    if (bools_) { return "bool"; }
    if (strings_) { return "string"; }
    return "object";
  }

 private:
  bool ints_{ false };
  bool floats_{ false };
  bool bools_{ false };
  bool strings_{ false };
  bool other_{ false };
};

picojson::value leaf_to_json(lua_State *L, int idx) {
  switch (lua_type(L, idx)) {
    case LUA_TNIL: return picojson::value{};
    case LUA_TBOOLEAN: return picojson::value{ lua_toboolean(L, idx) != 0 };
    case LUA_TNUMBER: {
      double const d{ static_cast<double>(lua_tonumber(L, idx)) };
      if (std::isnan(d)) { return picojson::value{ "NaN" }; }
      if (std::isinf(d)) { return picojson::value{ d > 0 ? "Infinity" : "-Infinity" }; }
      return picojson::value{ d };
    }
    case LUA_TSTRING: {
      std::size_t len{ 0 };
      char const *s{ lua_tolstring(L, idx, &len) };
      return picojson::value{ std::string{ s, len } };
    }
    default: return picojson::value{ lua_render_value(L, idx) };
  }
}

std::string key_text(lua_State *L, int idx) {
  if (lua_type(L, idx) == LUA_TSTRING) {
    std::size_t len{ 0 };
    char const *s{ lua_tolstring(L, idx, &len) };
    return { s, len };
  }
  return lua_render_value(L, idx);
}

picojson::array index_array(std::size_t n) {
  picojson::array index;
  index.reserve(n);
  for (std::size_t i{ 1 }; i <= n; ++i) { index.emplace_back(static_cast<double>(i)); }
  return index;
}

picojson::array shape_array(std::vector<std::size_t> const &dims) {
  picojson::array shape;
  for (auto const d : dims) { shape.emplace_back(static_cast<double>(d)); }
  return shape;
}

picojson::value project_frame(lua_State *L, int idx, rich_limits const &limits) {
  raw_field(L, idx, "columns");
  int const columns{ lua_gettop(L) };
  raw_field(L, idx, "order");
  int const order{ lua_gettop(L) };
  raw_field(L, idx, "rows");
  std::size_t const rows{ static_cast<std::size_t>(lua_tointeger(L, -1)) };
  lua_pop(L, 1);

  if (!lua_istable(L, columns) || !lua_istable(L, order)) {
    lua_settop(L, columns - 1);
    throw rich_output_error("nb.frame: malformed frame");
  }

  std::size_t const shown{ std::min(rows, limits.max_rows) };
  std::size_t const ncols{ raw_len(L, order) };

  picojson::array names;
  picojson::object dtypes;
  std::vector<picojson::object> records(shown);

  for (std::size_t c{ 1 }; c <= ncols; ++c) {
    lua_rawgeti(L, order, static_cast<lua_Integer>(c));
    std::string const name{ key_text(L, -1) };
    lua_rawget(L, columns);  // replaces the name with the column
    if (!lua_istable(L, -1)) {
      lua_settop(L, columns - 1);
      throw rich_output_error("nb.frame: column '" + name + "' is not an array");
    }
    int const col{ lua_gettop(L) };

    dtype_tracker dtype;
    for (std::size_t r{ 1 }; r <= rows; ++r) {
      lua_rawgeti(L, col, static_cast<lua_Integer>(r));
      dtype.observe(L, -1);
      if (r <= shown) { records[r - 1][name] = leaf_to_json(L, -1); }
      lua_pop(L, 1);
    }
    lua_pop(L, 1);

    names.emplace_back(name);
    dtypes[name] = picojson::value{ dtype.name() };
  }
  lua_settop(L, columns - 1);

  picojson::array data;
  data.reserve(records.size());
  for (auto &record : records) { data.emplace_back(std::move(record)); }

  picojson::object out;
  out["type"] = picojson::value{ "dataframe" };
  out["columns"] = picojson::value{ std::move(names) };
  out["data"] = picojson::value{ std::move(data) };
  out["dtypes"] = picojson::value{ std::move(dtypes) };
  out["index"] = picojson::value{ index_array(shown) };
  out["shape"] = picojson::value{ shape_array({ rows, ncols }) };
  out["truncated"] = picojson::value{ rows > limits.max_rows };
  return picojson::value{ std::move(out) };
}

picojson::value project_series(lua_State *L, int idx, rich_limits const &limits) {
  raw_field(L, idx, "values");
  int const values{ lua_gettop(L) };
  if (!lua_istable(L, values)) {
    lua_settop(L, values - 1);
    throw rich_output_error("nb.series: malformed series");
  }
  raw_field(L, idx, "name");
  picojson::value name{ lua_isnil(L, -1) ? picojson::value{}
                                         : picojson::value{ key_text(L, -1) } };
  lua_pop(L, 1);

  std::size_t const n{ raw_len(L, values) };
  std::size_t const shown{ std::min(n, limits.max_rows) };

  dtype_tracker dtype;
  picojson::object data;
  for (std::size_t i{ 1 }; i <= n; ++i) {
    lua_rawgeti(L, values, static_cast<lua_Integer>(i));
    dtype.observe(L, -1);
    if (i <= shown) { data[std::to_string(i)] = leaf_to_json(L, -1); }
    lua_pop(L, 1);
  }
  lua_settop(L, values - 1);

  picojson::object out;
  out["type"] = picojson::value{ "series" };
  out["name"] = std::move(name);
  out["data"] = picojson::value{ std::move(data) };
  out["dtype"] = picojson::value{ dtype.name() };
  out["index"] = picojson::value{ index_array(shown) };
  out["shape"] = picojson::value{ shape_array({ n }) };
  out["truncated"] = picojson::value{ n > limits.max_rows };
  return picojson::value{ std::move(out) };
}

bool is_nested_level(lua_State *L, int idx) {
  if (!lua_istable(L, idx)) { return false; }
  if (!lua_getmetatable(L, idx)) { return true; }
  lua_pop(L, 1);
  return false;
}

class array_projector {
 public:
  array_projector(lua_State *L, rich_limits const &limits) : L_{ L }, limits_{ limits } {}

  picojson::value project(int data) {
    for (int t{ data };;) {
      std::size_t const n{ raw_len(L_, t) };
      dims_.push_back(n);
      if (n == 0) { break; }
      lua_rawgeti(L_, t, 1);
      if (!is_nested_level(L_, -1)) {
        lua_pop(L_, 1);
        break;
      }
      t = lua_gettop(L_);
    }
    lua_settop(L_, data);

    check(data, 0);

    picojson::value values;
    bool truncated{ false };
    if (dims_.size() == 1) {
      std::size_t const shown{ std::min(dims_[0], limits_.max_array_elements) };
      picojson::array row;
      for (std::size_t i{ 1 }; i <= shown; ++i) {
        lua_rawgeti(L_, data, static_cast<lua_Integer>(i));
        row.push_back(leaf_to_json(L_, -1));
        lua_pop(L_, 1);
      }
      values = picojson::value{ std::move(row) };
      truncated = dims_[0] > shown;
    } else if (dims_.size() == 2) {
      auto const side{ static_cast<std::size_t>(
          std::sqrt(static_cast<double>(limits_.max_array_elements))) };
      std::size_t const rows{ std::min(dims_[0], side) };
      std::size_t const cols{ std::min(dims_[1], side) };
      picojson::array matrix;
      for (std::size_t r{ 1 }; r <= rows; ++r) {
        lua_rawgeti(L_, data, static_cast<lua_Integer>(r));
        int const row_idx{ lua_gettop(L_) };
        picojson::array row;
        for (std::size_t c{ 1 }; c <= cols; ++c) {
          lua_rawgeti(L_, row_idx, static_cast<lua_Integer>(c));
          row.push_back(leaf_to_json(L_, -1));
          lua_pop(L_, 1);
        }
        lua_pop(L_, 1);
        matrix.emplace_back(std::move(row));
      }
      values = picojson::value{ std::move(matrix) };
      truncated = dims_[0] > rows || dims_[1] > cols;
    } else {
      picojson::array flat;
      flatten(data, 0, flat);
      std::size_t total{ 1 };
      for (auto const d : dims_) { total *= d; }
      truncated = total > flat.size();
      values = picojson::value{ std::move(flat) };
    }

    picojson::object out;
    out["type"] = picojson::value{ "ndarray" };
    out["data"] = std::move(values);
    out["dtype"] = picojson::value{ dtype_.name() };
    out["shape"] = picojson::value{ shape_array(dims_) };
    out["truncated"] = picojson::value{ truncated };
    return picojson::value{ std::move(out) };
  }

 private:
  // Every level must match the shape found along the first elements.
  void check(int t, std::size_t depth) {
    if (!lua_checkstack(L_, 4)) { throw rich_output_error("nb.array: nested too deeply"); }
    if (raw_len(L_, t) != dims_[depth]) {
      throw rich_output_error("nb.array: ragged nested arrays cannot be shown as an array");
    }
    bool const leaves{ depth + 1 == dims_.size() };
    for (std::size_t i{ 1 }; i <= dims_[depth]; ++i) {
      lua_rawgeti(L_, t, static_cast<lua_Integer>(i));
      bool const nested{ is_nested_level(L_, -1) };
      if (nested == leaves) {
        lua_pop(L_, 1);
        throw rich_output_error(
            "nb.array: ragged nested arrays cannot be shown as an array");
      }
      if (leaves) {
        dtype_.observe(L_, -1);
      } else {
        check(lua_gettop(L_), depth + 1);
      }
      lua_pop(L_, 1);
    }
  }

  void flatten(int t, std::size_t depth, picojson::array &out) {
    for (std::size_t i{ 1 }; i <= dims_[depth]; ++i) {
      if (out.size() >= limits_.max_array_elements) { return; }
      lua_rawgeti(L_, t, static_cast<lua_Integer>(i));
      if (depth + 1 == dims_.size()) {
        out.push_back(leaf_to_json(L_, -1));
      } else {
        flatten(lua_gettop(L_), depth + 1, out);
      }
      lua_pop(L_, 1);
    }
  }

  lua_State *L_;
  rich_limits const &limits_;
  std::vector<std::size_t> dims_;
  dtype_tracker dtype_;
};

picojson::value project_array(lua_State *L, int idx, rich_limits const &limits) {
  raw_field(L, idx, "data");
  int const data{ lua_gettop(L) };
  if (!lua_istable(L, data)) {
    lua_settop(L, data - 1);
    throw rich_output_error("nb.array: malformed array");
  }

  array_projector projector{ L, limits };
  try {
    auto out{ projector.project(data) };
    lua_settop(L, data - 1);
    return out;
  } catch (rich_output_error const &) {
    lua_settop(L, data - 1);
    throw;
  }
}

}  // namespace

void rich_output_install(lua_State *L) {
  if (luaL_loadbuffer(L, kNotebookLua, sizeof(kNotebookLua) - 1, "=nb") != LUA_OK) {
    std::string const err{ lua_tostring(L, -1) ? lua_tostring(L, -1) : "unknown error" };
    lua_pop(L, 1);
    throw std::runtime_error("Failed to load nb helpers: " + err);
  }
  if (lua_pcall(L, 0, 1, 0) != LUA_OK) {
    std::string const err{ lua_tostring(L, -1) ? lua_tostring(L, -1) : "unknown error" };
    lua_pop(L, 1);
    throw std::runtime_error("Failed to initialize nb helpers: " + err);
  }
  lua_setglobal(L, "nb");
}

std::optional<picojson::value> rich_output_project(lua_State *L,
                                                   int idx,
                                                   rich_limits const &limits) {
  idx = lua_absindex(L, idx);
  auto const kind{ rich_kind_of(L, idx) };
  if (!kind) { return std::nullopt; }
  if (!lua_checkstack(L, 16)) { throw rich_output_error("rich output: Lua stack exhausted"); }

  switch (*kind) {
    case rich_kind::frame: return project_frame(L, idx, limits);
    case rich_kind::series: return project_series(L, idx, limits);
    case rich_kind::array: return project_array(L, idx, limits);
  }
  return std::nullopt;
}

}  // namespace cascade
