#include "symbol_resolver.h"

#include "discovery_error.h"
#include "util.h"

#include <cctype>
#include <map>
#include <string>
#include <variant>

namespace scout {

namespace {

[[noreturn]] void throw_runtime_only(std::string const &what) {
  throw discovery_error(discovery_error_kind::REQUIRES_RUNTIME_INSPECTION, what);
}

std::string describe(attribute_access const &access) {
  std::string result{ access.base };
  for (auto const &part : access.chain) { result.append(".").append(part); }
  return result;
}

resolved_value enum_member(std::string const &symbol,
                           std::map<std::string, std::string> const &members,
                           std::string const &member,
                           std::string const &expression) {
  auto const it{ members.find(member) };
  if (it == members.end()) {
    throw_runtime_only("'" + expression + "' is not a known member of enumeration " + symbol);
  }
  return it->second;
}

// `module_path` followed by `chain` (which names at least one attribute).
resolved_value resolve_module_chain(std::string module_path,
                                    std::vector<std::string> const &chain,
                                    std::string const &expression,
                                    discovery_options const &options) {
  if (chain.size() >= 2) {
    auto const &owner{ chain[chain.size() - 2] };
    if (auto const e{ options.enumerations.find(owner) }; e != options.enumerations.end()) {
      return enum_member(owner, e->second, chain.back(), expression);
    }
  }

  for (size_t i{ 0 }; i + 1 < chain.size(); ++i) {
    if (symbol_object_kind(chain[i]) == object_kind::CLASS) {
      throw_runtime_only("'" + expression + "' reads an attribute of class " + chain[i]);
    }
    module_path.append(".").append(chain[i]);
  }

  return resolved_reference{ .module = std::move(module_path),
                             .name = chain.back(),
                             .kind = symbol_object_kind(chain.back()) };
}

resolved_value resolve_identifier(bare_identifier const &id, import_map const &imports) {
  auto const *origin{ imports.find(id.symbol) };
  if (!origin) {
    throw discovery_error(discovery_error_kind::UNRESOLVED_SYMBOL,
                          "'" + id.symbol + "' is not imported");
  }
  if (origin->is_local()) {
    throw discovery_error(discovery_error_kind::UNRESOLVED_SYMBOL,
                          "'" + id.symbol + "' is defined in the registration file, not imported");
  }
  if (origin->is_module()) {
    throw_runtime_only("'" + id.symbol + "' names module " + origin->module_path);
  }

  return resolved_reference{ .module = origin->module_path,
                             .name = origin->original_name,
                             .kind = symbol_object_kind(origin->original_name) };
}

resolved_value resolve_attribute(attribute_access const &access,
                                 import_map const &imports,
                                 discovery_options const &options) {
  auto const expression{ describe(access) };

  auto const *origin{ imports.find(access.base) };
  if (!origin) {
    throw discovery_error(discovery_error_kind::UNRESOLVED_SYMBOL,
                          "'" + access.base + "' in '" + expression + "' is not imported");
  }
  if (origin->is_local()) {
    throw discovery_error(discovery_error_kind::UNRESOLVED_SYMBOL,
                          "'" + access.base + "' in '" + expression +
                              "' is defined in the registration file, not imported");
  }

  if (origin->is_module()) {
    return resolve_module_chain(origin->module_path, access.chain, expression, options);
  }

  if (auto const e{ options.enumerations.find(origin->original_name) };
      e != options.enumerations.end()) {
    if (access.chain.size() != 1) {
      throw_runtime_only("'" + expression + "' reads an attribute of an enumeration member");
    }
    return enum_member(origin->original_name, e->second, access.chain.front(), expression);
  }

  // `from pkg import submodule` binds a module under a lowercase name
  if (symbol_object_kind(origin->original_name) == object_kind::FUNCTION) {
    return resolve_module_chain(origin->module_path + "." + origin->original_name,
                                access.chain,
                                expression,
                                options);
  }

  throw_runtime_only("'" + expression + "' reads an attribute of class " +
                     origin->original_name);
}

}  // namespace

char const *object_kind_name(object_kind kind) {
  switch (kind) {
    case object_kind::CLASS: return "class";
    case object_kind::FUNCTION: return "function";
  }
  return "unknown";
}

object_kind symbol_object_kind(std::string_view name) {
  return !name.empty() && std::isupper(static_cast<unsigned char>(name.front()))
             ? object_kind::CLASS
             : object_kind::FUNCTION;
}

resolved_value symbol_resolve(argument_value const &value,
                              import_map const &imports,
                              discovery_options const &options) {
  return std::visit(
      match{
          [](string_literal const &v) -> resolved_value { return v.value; },
          [](bool_literal const &v) -> resolved_value { return v.value; },
          [](none_literal const &) -> resolved_value { return nullptr; },
          [](integer_literal const &v) -> resolved_value { return v.value; },
          [](float_literal const &v) -> resolved_value { return v.value; },
          [&](bare_identifier const &v) -> resolved_value {
            return resolve_identifier(v, imports);
          },
          [&](attribute_access const &v) -> resolved_value {
            return resolve_attribute(v, imports, options);
          },
          [](unsupported_value const &v) -> resolved_value { return v; },
      },
      value);
}

std::vector<resolved_argument> symbol_resolve_arguments(std::vector<argument> const &args,
                                                        import_map const &imports,
                                                        discovery_options const &options) {
  std::vector<resolved_argument> result;
  result.reserve(args.size());

  for (auto const &arg : args) {
    try {
      result.push_back({ .name = arg.name, .value = symbol_resolve(arg.value, imports, options) });
    } catch (discovery_error const &e) {
      throw discovery_error(e.kind(), "argument '" + arg.name + "': " + e.what());
    }
  }

  return result;
}

}  // namespace scout
