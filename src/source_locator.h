#pragma once

#include "discovery_options.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace scout {

struct located_source {
  std::filesystem::path path;
  std::string package_module;  // dotted package that contains `path`
  std::string strategy;        // entry_points | direct | subdirectory
  std::optional<std::string> entry_point;  // function named by the entry point, if any
};

// `name = module:symbol` from entry_points.txt.
struct entry_point_ref {
  std::string module;
  std::string symbol;
};

// Find the registration file for `package_name` under `package_root`.
// Throws discovery_error(SOURCE_NOT_FOUND) when nothing matches or the match is ambiguous.
located_source source_locate(std::filesystem::path const &package_root,
                             std::string_view package_name,
                             discovery_options const &options);

// "r2x-reeds" -> "r2x_reeds" (PEP 503 style, lowercased, runs of -_. to one '_').
std::string source_normalize_name(std::string_view package_name);

// First `name = module:symbol` entry in `[group]`. The value may be quoted.
std::optional<entry_point_ref> source_parse_entry_points(std::string_view content,
                                                         std::string_view group);

// Dotted package of a file, derived from enclosing directories that carry __init__.py.
std::string source_package_module(std::filesystem::path const &file);

}  // namespace scout
