#include "namespace_store.h"

#include "util.h"

#include <bit>

namespace cascade {

namespace {

constexpr char kMagic[4]{ 'C', 'S', 'N', 'S' };
constexpr std::uint8_t kFormatVersion{ 1 };

enum class value_tag : std::uint8_t {
  nil = 0,
  boolean_false = 1,
  boolean_true = 2,
  integer = 3,
  number = 4,
  string = 5,
  table = 6,
  function = 7,
  builtin = 8,
};

class byte_writer {
 public:
  void u8(std::uint8_t v) { out_.push_back(static_cast<char>(v)); }

  void u32(std::uint32_t v) {
    for (int i{ 0 }; i < 4; ++i) { u8(static_cast<std::uint8_t>(v >> (8 * i))); }
  }

  void u64(std::uint64_t v) {
    for (int i{ 0 }; i < 8; ++i) { u8(static_cast<std::uint8_t>(v >> (8 * i))); }
  }

  void str(std::string_view s) {
    u32(static_cast<std::uint32_t>(s.size()));
    out_.append(s);
  }

  void value(ns_value const &v) {
    std::visit(match{
                   [&](std::monostate) { tag(value_tag::nil); },
                   [&](bool b) {
                     tag(b ? value_tag::boolean_true : value_tag::boolean_false);
                   },
                   [&](std::int64_t i) {
                     tag(value_tag::integer);
                     u64(static_cast<std::uint64_t>(i));
                   },
                   [&](double d) {
                     tag(value_tag::number);
                     u64(std::bit_cast<std::uint64_t>(d));
                   },
                   [&](std::string const &s) {
                     tag(value_tag::string);
                     str(s);
                   },
                   [&](ns_table_ref r) {
                     tag(value_tag::table);
                     u32(r.id);
                   },
                   [&](ns_function_ref r) {
                     tag(value_tag::function);
                     u32(r.id);
                   },
                   [&](ns_builtin_ref const &r) {
                     tag(value_tag::builtin);
                     str(r.path);
                   },
               },
               v);
  }

  std::string take() { return std::move(out_); }

 private:
  void tag(value_tag t) { u8(static_cast<std::uint8_t>(t)); }

  std::string out_;
};

class byte_reader {
 public:
  explicit byte_reader(std::string_view in) : in_{ in } {}

  void set_limits(std::uint32_t table_count, std::uint32_t function_count) {
    table_count_ = table_count;
    function_count_ = function_count;
  }

  std::uint8_t u8() {
    need(1);
    return static_cast<std::uint8_t>(in_[pos_++]);
  }

  std::uint32_t u32() {
    std::uint32_t v{ 0 };
    for (int i{ 0 }; i < 4; ++i) { v |= static_cast<std::uint32_t>(u8()) << (8 * i); }
    return v;
  }

  std::uint64_t u64() {
    std::uint64_t v{ 0 };
    for (int i{ 0 }; i < 8; ++i) { v |= static_cast<std::uint64_t>(u8()) << (8 * i); }
    return v;
  }

  std::string str() {
    std::uint32_t const size{ u32() };
    need(size);
    std::string s{ in_.substr(pos_, size) };
    pos_ += size;
    return s;
  }

  // Element counts are bounded by the remaining input so a corrupt count cannot
  // trigger a huge allocation.
  std::uint32_t count(std::size_t min_element_size) {
    std::uint32_t const n{ u32() };
    if (min_element_size && n > (in_.size() - pos_) / min_element_size) {
      throw namespace_decode_error("namespace decode: count exceeds input size");
    }
    return n;
  }

  ns_value value() {
    auto const raw{ u8() };
    switch (static_cast<value_tag>(raw)) {
      case value_tag::nil: return std::monostate{};
      case value_tag::boolean_false: return false;
      case value_tag::boolean_true: return true;
      case value_tag::integer: return static_cast<std::int64_t>(u64());
      case value_tag::number: return std::bit_cast<double>(u64());
      case value_tag::string: return str();
      case value_tag::table: {
        auto const id{ u32() };
        if (id >= table_count_) {
          throw namespace_decode_error("namespace decode: table reference out of range");
        }
        return ns_table_ref{ id };
      }
      case value_tag::function: {
        auto const id{ u32() };
        if (id >= function_count_) {
          throw namespace_decode_error("namespace decode: function reference out of range");
        }
        return ns_function_ref{ id };
      }
      case value_tag::builtin: return ns_builtin_ref{ str() };
    }
    throw namespace_decode_error("namespace decode: unknown value tag " +
                                 std::to_string(static_cast<int>(raw)));
  }

  bool at_end() const { return pos_ == in_.size(); }

 private:
  void need(std::size_t n) const {
    if (in_.size() - pos_ < n) {
      throw namespace_decode_error("namespace decode: truncated input");
    }
  }

  std::string_view in_;
  std::size_t pos_{ 0 };
  std::uint32_t table_count_{ 0 };
  std::uint32_t function_count_{ 0 };
};

}  // namespace

ns_value const *namespace_store::find(std::string const &name) const {
  auto const it{ globals_.find(name) };
  return it == globals_.end() ? nullptr : &it->second;
}

void namespace_store::set(std::string const &name, ns_value value) {
  globals_[name] = std::move(value);
}

bool namespace_store::erase(std::string const &name) { return globals_.erase(name) > 0; }

void namespace_store::clear() {
  globals_.clear();
  tables_.clear();
  functions_.clear();
}

std::uint32_t namespace_store::add_table(ns_table table) {
  tables_.push_back(std::move(table));
  return static_cast<std::uint32_t>(tables_.size() - 1);
}

std::uint32_t namespace_store::add_function(ns_function function) {
  functions_.push_back(std::move(function));
  return static_cast<std::uint32_t>(functions_.size() - 1);
}

ns_table const &namespace_store::table(std::uint32_t id) const { return tables_.at(id); }

ns_table &namespace_store::table(std::uint32_t id) { return tables_.at(id); }

ns_function const &namespace_store::function(std::uint32_t id) const {
  return functions_.at(id);
}

ns_function &namespace_store::function(std::uint32_t id) { return functions_.at(id); }

std::string namespace_store::encode() const {
  byte_writer w;
  for (char const c : kMagic) { w.u8(static_cast<std::uint8_t>(c)); }
  w.u8(kFormatVersion);

  w.u32(static_cast<std::uint32_t>(tables_.size()));
  w.u32(static_cast<std::uint32_t>(functions_.size()));

  for (auto const &t : tables_) {
    w.u32(static_cast<std::uint32_t>(t.entries.size()));
    for (auto const &[key, val] : t.entries) {
      w.value(key);
      w.value(val);
    }
    w.u8(t.metatable ? 1 : 0);
    if (t.metatable) { w.value(*t.metatable); }
  }

  for (auto const &f : functions_) {
    w.str(f.bytecode);
    w.u32(static_cast<std::uint32_t>(f.upvalues.size()));
    for (auto const &uv : f.upvalues) {
      w.u8(uv.is_env ? 1 : 0);
      w.u32(uv.slot);
      w.value(uv.value);
    }
  }

  w.u32(static_cast<std::uint32_t>(globals_.size()));
  for (auto const &[name, val] : globals_) {
    w.str(name);
    w.value(val);
  }

  return w.take();
}

namespace_store namespace_store::decode(std::string_view bytes) {
  byte_reader r{ bytes };
  for (char const c : kMagic) {
    if (r.u8() != static_cast<std::uint8_t>(c)) {
      throw namespace_decode_error("namespace decode: bad magic");
    }
  }
  if (auto const version{ r.u8() }; version != kFormatVersion) {
    throw namespace_decode_error("namespace decode: unsupported version " +
                                 std::to_string(version));
  }

  // Smallest encodings: table = count + meta flag, function = empty bytecode + count.
  std::uint32_t const table_count{ r.count(5) };
  std::uint32_t const function_count{ r.count(8) };
  r.set_limits(table_count, function_count);

  namespace_store ns;
  ns.tables_.reserve(table_count);
  ns.functions_.reserve(function_count);

  for (std::uint32_t i{ 0 }; i < table_count; ++i) {
    ns_table t;
    std::uint32_t const entries{ r.count(2) };
    t.entries.reserve(entries);
    for (std::uint32_t e{ 0 }; e < entries; ++e) {
      auto key{ r.value() };
      if (std::holds_alternative<std::monostate>(key)) {
        throw namespace_decode_error("namespace decode: nil table key");
      }
      auto val{ r.value() };
      t.entries.emplace_back(std::move(key), std::move(val));
    }
    if (r.u8() != 0) { t.metatable = r.value(); }
    ns.tables_.push_back(std::move(t));
  }

  for (std::uint32_t i{ 0 }; i < function_count; ++i) {
    ns_function f;
    f.bytecode = r.str();
    std::uint32_t const upvalues{ r.count(6) };
    f.upvalues.reserve(upvalues);
    for (std::uint32_t u{ 0 }; u < upvalues; ++u) {
      ns_upvalue uv;
      uv.is_env = r.u8() != 0;
      uv.slot = r.u32();
      uv.value = r.value();
      f.upvalues.push_back(std::move(uv));
    }
    ns.functions_.push_back(std::move(f));
  }

  std::uint32_t const global_count{ r.count(5) };
  for (std::uint32_t i{ 0 }; i < global_count; ++i) {
    auto name{ r.str() };
    ns.globals_[std::move(name)] = r.value();
  }

  if (!r.at_end()) { throw namespace_decode_error("namespace decode: trailing bytes"); }
  return ns;
}

char const *ns_value_type_name(ns_value const &value) {
  return std::visit(match{
                        [](std::monostate) { return "nil"; },
                        [](bool) { return "boolean"; },
                        [](std::int64_t) { return "integer"; },
                        [](double) { return "number"; },
                        [](std::string const &) { return "string"; },
                        [](ns_table_ref) { return "table"; },
                        [](ns_function_ref) { return "function"; },
                        [](ns_builtin_ref const &) { return "builtin"; },
                    },
                    value);
}

}  // namespace cascade
