#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace scout {

enum class discovery_error_kind {
  SOURCE_NOT_FOUND,
  REGISTRATION_FUNCTION_NOT_FOUND,
  UNRECOGNIZED_IMPORT_SYNTAX,  // warning level; never aborts discovery
  UNRESOLVED_SYMBOL,
  REQUIRES_RUNTIME_INSPECTION,
  UNKNOWN_PLUGIN_KIND,
  STRUCTURAL_MATCH_TOOL_FAILURE,
  SCHEMA_MISMATCH,  // oracle comparison only
  MALFORMED_REGISTRATION_SITE,
  MISSING_REQUIRED_ARGUMENT,
};

std::string_view discovery_error_kind_name(discovery_error_kind kind);

// Value returned across the engine boundary.
struct discovery_failure {
  discovery_error_kind kind;
  std::string message;

  std::string describe() const;
};

// Thrown inside the pipeline stages; converted to discovery_failure at the boundary.
class discovery_error : public std::runtime_error {
 public:
  discovery_error(discovery_error_kind kind, std::string const &message);

  discovery_error_kind kind() const { return kind_; }
  discovery_failure to_failure() const;

 private:
  discovery_error_kind kind_;
};

}  // namespace scout
