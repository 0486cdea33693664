#pragma once

#include "discovery_error.h"
#include "discovery_options.h"
#include "registration_site.h"
#include "symbol_resolver.h"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scout {

enum class field_shape { STRING, REFERENCE, IO_TYPE, BOOL };

struct manifest_field {
  std::string_view name;
  field_shape shape;
  bool required;
};

// Constructor keywords accepted for `kind`, in serialization order.
std::vector<manifest_field> const &manifest_fields(plugin_kind kind);

struct discovery_plugin {
  std::string name;
  plugin_kind kind;
  std::vector<resolved_argument> constructor_args;  // source order, validated
  std::optional<resolved_reference> config;
};

struct package {
  std::string name;
  std::vector<discovery_plugin> plugins;
  std::vector<std::pair<std::string, std::string>> metadata;  // caller supplied, e.g. version
};

// Validate one site's resolved arguments against its kind's schema.
// Throws discovery_error(UNKNOWN_PLUGIN_KIND | MISSING_REQUIRED_ARGUMENT |
// REQUIRES_RUNTIME_INSPECTION).
discovery_plugin manifest_build_plugin(registration_site const &site,
                                       std::vector<resolved_argument> args,
                                       discovery_options const &options);

package manifest_build_package(std::string name,
                               std::vector<discovery_plugin> plugins,
                               std::vector<std::pair<std::string, std::string>> metadata);

// Compact JSON with sorted keys; absent optional fields are explicit nulls.
std::string manifest_to_json(package const &pkg);

// Semantic comparison (objects by key, arrays by position). Returns a SCHEMA_MISMATCH
// failure naming the JSON path of the first difference, or nullopt when equal.
std::optional<discovery_failure> manifest_compare(std::string const &static_json,
                                                  std::string const &dynamic_json);

}  // namespace scout
