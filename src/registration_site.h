#pragma once

#include "import_map.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scout {

enum class plugin_kind { PARSER, UPGRADER, EXPORTER, BASE };

char const *plugin_kind_name(plugin_kind kind);

// Closed mapping from descriptor constructor name to kind.
std::optional<plugin_kind> plugin_kind_from_constructor(std::string_view constructor);

struct source_span {
  std::size_t begin;
  std::size_t end;

  bool empty() const { return begin >= end; }
};

struct registration_site {
  std::string constructor;  // name as written at the call site
  std::string descriptor;   // constructor name after following import aliases
  std::optional<plugin_kind> kind;
  std::string text;       // full call expression
  std::string arguments;  // text between the call parentheses
  std::size_t begin;
  std::size_t end;
  std::size_t line_number;
};

// Body span of the last `def function_name(...)` (or `async def`) in `content`.
// Throws discovery_error(REGISTRATION_FUNCTION_NOT_FOUND).
source_span registration_find_entry_point(std::string_view content,
                                          std::string_view function_name);

// Body span of the function whose header starts inside `function_span`, as
// reported by an external structural matcher.
source_span registration_body_of(std::string_view content, source_span function_span);

// Descriptor constructor calls inside `body`, in source order. Nested calls inside a
// site's arguments belong to that site.
// Throws discovery_error(MALFORMED_REGISTRATION_SITE) for unbalanced calls.
std::vector<registration_site> registration_extract_sites(std::string_view content,
                                                          source_span body,
                                                          import_map const &imports);

}  // namespace scout
