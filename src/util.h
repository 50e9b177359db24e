#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cascade {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

template <typename... Ts>
struct match : Ts... {
  using Ts::operator()...;
};

template <typename... Ts>
match(Ts...) -> match<Ts...>;

// Convert bytes to lowercase hex string
std::string util_bytes_to_hex(void const *data, size_t length);

// Random lowercase hex string of `digits` characters (not cryptographic)
std::string util_random_hex(std::size_t digits);

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as text.
// Throws std::runtime_error if file cannot be opened or read.
std::string util_load_text_file(std::filesystem::path const &path);

// Human-readable byte formatter (B, KB, MB, GB, TB). B uses integer form, higher
// units use two decimal places (e.g., 1536 -> "1.50KB").
std::string util_format_bytes(std::uint64_t bytes);

// Strip trailing '\n' / '\r\n' sequences.
std::string_view util_trim_trailing_newlines(std::string_view text);

}  // namespace cascade
