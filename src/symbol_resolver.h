#pragma once

#include "argument.h"
#include "discovery_options.h"
#include "import_map.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace scout {

enum class object_kind { CLASS, FUNCTION };

char const *object_kind_name(object_kind kind);

struct resolved_reference {
  std::string module;
  std::string name;
  object_kind kind;

  bool operator==(resolved_reference const &) const = default;
};

using resolved_value = std::variant<std::nullptr_t,
                                    bool,
                                    std::int64_t,
                                    double,
                                    std::string,
                                    resolved_reference,
                                    unsupported_value>;

struct resolved_argument {
  std::string name;
  resolved_value value;
};

// Resolve one classified value against the file's imports. Literals and unsupported
// values pass through. Throws discovery_error(UNRESOLVED_SYMBOL) for names that are
// not imported and discovery_error(REQUIRES_RUNTIME_INSPECTION) for values only an
// interpreter could compute.
resolved_value symbol_resolve(argument_value const &value,
                              import_map const &imports,
                              discovery_options const &options);

// Resolve every argument of a site; errors name the offending keyword.
std::vector<resolved_argument> symbol_resolve_arguments(std::vector<argument> const &args,
                                                        import_map const &imports,
                                                        discovery_options const &options);

// Class when the name starts uppercase, otherwise function.
object_kind symbol_object_kind(std::string_view name);

}  // namespace scout
