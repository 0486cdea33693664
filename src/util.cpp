#include "util.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace scout {

std::string util_bytes_to_hex(void const *data, size_t length) {
  static constexpr char hex_chars[] = "0123456789abcdef";

  auto const bytes = static_cast<unsigned char const *>(data);
  std::string result;
  result.reserve(length * 2);

  for (size_t i{}; i < length; ++i) {
    result += hex_chars[(bytes[i] >> 4) & 0xf];
    result += hex_chars[bytes[i] & 0xf];
  }

  return result;
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
}

std::vector<unsigned char> util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::vector<unsigned char> buffer(static_cast<size_t>(file_size));
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_load_text(std::filesystem::path const &path) {
  auto const bytes{ util_load_file(path) };
  return std::string{ bytes.begin(), bytes.end() };
}

void util_write_file(std::filesystem::path const &path, std::string_view content) {
  auto file{ util_open_file(path, "wb") };
  if (!file) {
    throw std::runtime_error("util_write_file: failed to open file: " + path.string());
  }

  if (!content.empty() &&
      std::fwrite(content.data(), 1, content.size(), file.get()) != content.size()) {
    throw std::runtime_error("util_write_file: failed to write file: " + path.string());
  }
}

std::optional<std::string> util_getenv(char const *name) {
  char const *const value{ std::getenv(name) };
  if (!value) { return std::nullopt; }
  return std::string{ value };
}

std::optional<bool> util_parse_bool(std::string_view value) {
  std::string lowered{ value };
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
    return true;
  }
  if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
    return false;
  }
  return std::nullopt;
}

}  // namespace scout
