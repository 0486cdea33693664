#include "discovery_error.h"

namespace scout {

std::string_view discovery_error_kind_name(discovery_error_kind kind) {
  switch (kind) {
    case discovery_error_kind::SOURCE_NOT_FOUND: return "SourceNotFound";
    case discovery_error_kind::REGISTRATION_FUNCTION_NOT_FOUND:
      return "RegistrationFunctionNotFound";
    case discovery_error_kind::UNRECOGNIZED_IMPORT_SYNTAX:
      return "UnrecognizedImportSyntax";
    case discovery_error_kind::UNRESOLVED_SYMBOL: return "UnresolvedSymbol";
    case discovery_error_kind::REQUIRES_RUNTIME_INSPECTION:
      return "RequiresRuntimeInspection";
    case discovery_error_kind::UNKNOWN_PLUGIN_KIND: return "UnknownPluginKind";
    case discovery_error_kind::STRUCTURAL_MATCH_TOOL_FAILURE:
      return "StructuralMatchToolFailure";
    case discovery_error_kind::SCHEMA_MISMATCH: return "SchemaMismatch";
    case discovery_error_kind::MALFORMED_REGISTRATION_SITE:
      return "MalformedRegistrationSite";
    case discovery_error_kind::MISSING_REQUIRED_ARGUMENT: return "MissingRequiredArgument";
  }
  return "Unknown";
}

std::string discovery_failure::describe() const {
  std::string result{ discovery_error_kind_name(kind) };
  result.append(": ");
  result.append(message);
  return result;
}

discovery_error::discovery_error(discovery_error_kind kind, std::string const &message)
    : std::runtime_error{ message }, kind_{ kind } {}

discovery_failure discovery_error::to_failure() const {
  return { .kind = kind_, .message = what() };
}

}  // namespace scout
