#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace cascade {

struct ns_table_ref {
  std::uint32_t id;
  bool operator==(ns_table_ref const &) const = default;
};

struct ns_function_ref {
  std::uint32_t id;
  bool operator==(ns_function_ref const &) const = default;
};

// A standard library value referenced by path ("print", "math.sin", "_G").
struct ns_builtin_ref {
  std::string path;
  bool operator==(ns_builtin_ref const &) const = default;
};

using ns_value = std::variant<std::monostate,
                              bool,
                              std::int64_t,
                              double,
                              std::string,
                              ns_table_ref,
                              ns_function_ref,
                              ns_builtin_ref>;

struct ns_table {
  std::vector<std::pair<ns_value, ns_value>> entries;
  std::optional<ns_value> metatable;
};

struct ns_upvalue {
  bool is_env{ false };  // rebound to the namespace environment when loaded
  std::uint32_t slot{ 0 };  // upvalues shared between closures carry the same slot
  ns_value value;
};

struct ns_function {
  std::string bytecode;
  std::vector<ns_upvalue> upvalues;
};

// Thrown by namespace_store::decode on malformed input.
class namespace_decode_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Transferable snapshot of the notebook's global namespace. Tables and functions live
// in arenas addressed by id so shared and cyclic references survive a round trip.
class namespace_store {
 public:
  std::map<std::string, ns_value> const &globals() const { return globals_; }
  ns_value const *find(std::string const &name) const;
  void set(std::string const &name, ns_value value);
  bool erase(std::string const &name);
  void clear();

  std::size_t size() const { return globals_.size(); }
  bool empty() const { return globals_.empty(); }

  std::uint32_t add_table(ns_table table);
  std::uint32_t add_function(ns_function function);
  ns_table const &table(std::uint32_t id) const;
  ns_table &table(std::uint32_t id);
  ns_function const &function(std::uint32_t id) const;
  ns_function &function(std::uint32_t id);
  std::size_t table_count() const { return tables_.size(); }
  std::size_t function_count() const { return functions_.size(); }

  std::string encode() const;
  static namespace_store decode(std::string_view bytes);

 private:
  std::map<std::string, ns_value> globals_;
  std::vector<ns_table> tables_;
  std::vector<ns_function> functions_;
};

// Short type name for diagnostics ("nil", "integer", "table", ...).
char const *ns_value_type_name(ns_value const &value);

}  // namespace cascade
