#pragma once

#include "registration_site.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scout {

struct string_literal {
  std::string value;
};

struct bool_literal {
  bool value;
};

struct none_literal {};

struct integer_literal {
  std::int64_t value;
};

struct float_literal {
  double value;
};

struct bare_identifier {
  std::string symbol;
};

struct attribute_access {
  std::string base;
  std::vector<std::string> chain;  // never empty
};

// Anything that needs evaluation: calls, collections, f-strings, operators.
struct unsupported_value {
  std::string raw;
};

using argument_value = std::variant<string_literal,
                                    bool_literal,
                                    none_literal,
                                    integer_literal,
                                    float_literal,
                                    bare_identifier,
                                    attribute_access,
                                    unsupported_value>;

struct argument {
  std::string name;
  argument_value value;
};

// Keyword arguments of a descriptor call, in source order.
// Throws discovery_error(MALFORMED_REGISTRATION_SITE) for positional, starred or
// duplicate arguments.
std::vector<argument> argument_parse(registration_site const &site);

// Classify one argument value expression.
argument_value argument_classify(std::string_view text);

// Decode the body of a non-raw Python string literal; nullopt on an escape that cannot
// be decoded statically.
std::optional<std::string> argument_decode_escapes(std::string_view body);

}  // namespace scout
