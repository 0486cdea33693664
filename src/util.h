#pragma once

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scout {

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

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as bytes.
// Throws std::runtime_error if file cannot be opened or read.
std::vector<unsigned char> util_load_file(std::filesystem::path const &path);

// Load entire file as text. Same failure behavior as util_load_file.
std::string util_load_text(std::filesystem::path const &path);

// Write (truncate) text to a file. Throws std::runtime_error on failure.
void util_write_file(std::filesystem::path const &path, std::string_view content);

// Environment lookup; nullopt when unset.
std::optional<std::string> util_getenv(char const *name);

// Parse common boolean spellings (1/0, true/false, yes/no, on/off), case-insensitive.
std::optional<bool> util_parse_bool(std::string_view value);

}  // namespace scout
