#include "manifest.h"

#include "tui.h"
#include "util.h"

#include "picojson.h"

#include <algorithm>
#include <set>
#include <string>
#include <variant>

namespace scout {

namespace {

std::vector<manifest_field> const kCommonFields{
  { .name = "name", .shape = field_shape::STRING, .required = true },
  { .name = "obj", .shape = field_shape::REFERENCE, .required = true },
  { .name = "config", .shape = field_shape::REFERENCE, .required = false },
  { .name = "call_method", .shape = field_shape::STRING, .required = false },
  { .name = "io_type", .shape = field_shape::IO_TYPE, .required = false },
  { .name = "requires_store", .shape = field_shape::BOOL, .required = false },
  { .name = "description", .shape = field_shape::STRING, .required = false },
};

std::vector<manifest_field> make_upgrader_fields() {
  auto fields{ kCommonFields };
  fields.push_back({ .name = "version_strategy", .shape = field_shape::REFERENCE, .required = false });
  fields.push_back({ .name = "version_reader", .shape = field_shape::REFERENCE, .required = false });
  return fields;
}

manifest_field const *find_field(plugin_kind kind, std::string_view name) {
  auto const &fields{ manifest_fields(kind) };
  auto const it{ std::find_if(fields.begin(), fields.end(), [&](manifest_field const &f) {
    return f.name == name;
  }) };
  return it == fields.end() ? nullptr : &*it;
}

bool shape_matches(field_shape shape, resolved_value const &value) {
  switch (shape) {
    case field_shape::STRING: return std::holds_alternative<std::string>(value);
    case field_shape::REFERENCE: return std::holds_alternative<resolved_reference>(value);
    case field_shape::BOOL: return std::holds_alternative<bool>(value);
    case field_shape::IO_TYPE:
      if (auto const *s{ std::get_if<std::string>(&value) }) {
        return *s == "stdin" || *s == "stdout" || *s == "both";
      }
      return false;
  }
  return false;
}

char const *shape_name(field_shape shape) {
  switch (shape) {
    case field_shape::STRING: return "a string";
    case field_shape::REFERENCE: return "an importable class or function";
    case field_shape::IO_TYPE: return "an IOType member";
    case field_shape::BOOL: return "a bool";
  }
  return "unknown";
}

picojson::value reference_to_json(resolved_reference const &ref) {
  picojson::object obj;
  obj["module"] = picojson::value(ref.module);
  obj["name"] = picojson::value(ref.name);
  obj["kind"] = picojson::value(std::string{ object_kind_name(ref.kind) });
  return picojson::value(std::move(obj));
}

picojson::value value_to_json(resolved_value const &value) {
  return std::visit(
      match{
          [](std::nullptr_t) { return picojson::value(); },
          [](bool v) { return picojson::value(v); },
          [](std::int64_t v) { return picojson::value(v); },
          [](double v) { return picojson::value(v); },
          [](std::string const &v) { return picojson::value(v); },
          [](resolved_reference const &v) { return reference_to_json(v); },
          [](unsupported_value const &) { return picojson::value(); },
      },
      value);
}

picojson::value plugin_to_json(discovery_plugin const &plugin) {
  picojson::object obj;
  for (auto const &field : manifest_fields(plugin.kind)) {
    obj[std::string{ field.name }] = picojson::value();
  }
  for (auto const &arg : plugin.constructor_args) { obj[arg.name] = value_to_json(arg.value); }
  obj["plugin_kind"] = picojson::value(std::string{ plugin_kind_name(plugin.kind) });
  return picojson::value(std::move(obj));
}

std::string json_type_name(picojson::value const &v) {
  if (v.is<picojson::null>()) { return "null"; }
  if (v.is<bool>()) { return "bool"; }
  if (v.is<double>()) { return "number"; }
  if (v.is<std::string>()) { return "string"; }
  if (v.is<picojson::array>()) { return "array"; }
  return "object";
}

// Path of the first difference between `a` and `b`, or nullopt.
std::optional<std::string> first_difference(picojson::value const &a,
                                            picojson::value const &b,
                                            std::string const &path) {
  if (json_type_name(a) != json_type_name(b)) {
    return path + " (" + json_type_name(a) + " vs " + json_type_name(b) + ")";
  }

  if (a.is<picojson::object>()) {
    auto const &oa{ a.get<picojson::object>() };
    auto const &ob{ b.get<picojson::object>() };

    std::set<std::string> keys;
    for (auto const &[k, _] : oa) { keys.insert(k); }
    for (auto const &[k, _] : ob) { keys.insert(k); }

    for (auto const &key : keys) {
      auto const ia{ oa.find(key) };
      auto const ib{ ob.find(key) };
      if (ia == oa.end()) { return path + "." + key + " (missing in static manifest)"; }
      if (ib == ob.end()) { return path + "." + key + " (missing in dynamic manifest)"; }
      if (auto diff{ first_difference(ia->second, ib->second, path + "." + key) }) {
        return diff;
      }
    }
    return std::nullopt;
  }

  if (a.is<picojson::array>()) {
    auto const &aa{ a.get<picojson::array>() };
    auto const &ab{ b.get<picojson::array>() };
    for (size_t i{ 0 }; i < std::min(aa.size(), ab.size()); ++i) {
      if (auto diff{ first_difference(aa[i], ab[i], path + "[" + std::to_string(i) + "]") }) {
        return diff;
      }
    }
    if (aa.size() != ab.size()) {
      return path + " (length " + std::to_string(aa.size()) + " vs " +
             std::to_string(ab.size()) + ")";
    }
    return std::nullopt;
  }

  if (a.is<std::int64_t>() && b.is<std::int64_t>()) {
    if (a.get<std::int64_t>() == b.get<std::int64_t>()) { return std::nullopt; }
    return path + " (" + a.serialize() + " vs " + b.serialize() + ")";
  }

  if (a == b) { return std::nullopt; }
  return path + " (" + a.serialize() + " vs " + b.serialize() + ")";
}

}  // namespace

std::vector<manifest_field> const &manifest_fields(plugin_kind kind) {
  static std::vector<manifest_field> const upgrader_fields{ make_upgrader_fields() };
  return kind == plugin_kind::UPGRADER ? upgrader_fields : kCommonFields;
}

discovery_plugin manifest_build_plugin(registration_site const &site,
                                       std::vector<resolved_argument> args,
                                       discovery_options const &options) {
  if (!site.kind) {
    throw discovery_error(discovery_error_kind::UNKNOWN_PLUGIN_KIND,
                          "'" + site.descriptor + "' at line " +
                              std::to_string(site.line_number) +
                              " is not a known plugin descriptor");
  }
  plugin_kind const kind{ *site.kind };

  auto const where{ [&](std::string_view field) {
    return site.constructor + " at line " + std::to_string(site.line_number) + ": '" +
           std::string{ field } + "'";
  } };

  for (auto &arg : args) {
    auto const *field{ find_field(kind, arg.name) };
    if (!field) {
      throw discovery_error(discovery_error_kind::REQUIRES_RUNTIME_INSPECTION,
                            where(arg.name) + " is not a " + plugin_kind_name(kind) + " field");
    }

    if (auto const *unsupported{ std::get_if<unsupported_value>(&arg.value) }) {
      if (field->required || !options.tolerant_fields.contains(arg.name)) {
        throw discovery_error(discovery_error_kind::REQUIRES_RUNTIME_INSPECTION,
                              where(arg.name) + " needs evaluation: " + unsupported->raw);
      }
      tui::warn("manifest: %s serialized as null (value '%s' needs evaluation)",
                where(arg.name).c_str(),
                unsupported->raw.c_str());
      arg.value = nullptr;
      continue;
    }

    if (std::holds_alternative<std::nullptr_t>(arg.value)) {
      if (field->required) {
        throw discovery_error(discovery_error_kind::MISSING_REQUIRED_ARGUMENT,
                              where(arg.name) + " is required but None");
      }
      continue;
    }

    if (!shape_matches(field->shape, arg.value)) {
      throw discovery_error(discovery_error_kind::REQUIRES_RUNTIME_INSPECTION,
                            where(arg.name) + " must be " + shape_name(field->shape));
    }
  }

  for (auto const &field : manifest_fields(kind)) {
    if (!field.required) { continue; }
    bool const present{ std::any_of(args.begin(), args.end(), [&](resolved_argument const &a) {
      return a.name == field.name;
    }) };
    if (!present) {
      throw discovery_error(discovery_error_kind::MISSING_REQUIRED_ARGUMENT,
                            where(field.name) + " is required");
    }
  }

  discovery_plugin plugin{ .name = {}, .kind = kind, .constructor_args = {}, .config = {} };
  for (auto const &arg : args) {
    if (arg.name == "name") { plugin.name = std::get<std::string>(arg.value); }
    if (auto const *ref{ std::get_if<resolved_reference>(&arg.value) }; ref && arg.name == "config") {
      plugin.config = *ref;
    }
  }
  plugin.constructor_args = std::move(args);
  return plugin;
}

package manifest_build_package(std::string name,
                               std::vector<discovery_plugin> plugins,
                               std::vector<std::pair<std::string, std::string>> metadata) {
  return package{ .name = std::move(name),
                  .plugins = std::move(plugins),
                  .metadata = std::move(metadata) };
}

std::string manifest_to_json(package const &pkg) {
  picojson::array plugins;
  plugins.reserve(pkg.plugins.size());
  for (auto const &plugin : pkg.plugins) { plugins.push_back(plugin_to_json(plugin)); }

  picojson::object metadata;
  for (auto const &[key, value] : pkg.metadata) { metadata[key] = picojson::value(value); }

  picojson::object root;
  root["name"] = picojson::value(pkg.name);
  root["plugins"] = picojson::value(std::move(plugins));
  root["metadata"] = picojson::value(std::move(metadata));
  return picojson::value(std::move(root)).serialize();
}

std::optional<discovery_failure> manifest_compare(std::string const &static_json,
                                                  std::string const &dynamic_json) {
  picojson::value lhs;
  picojson::value rhs;

  if (auto const err{ picojson::parse(lhs, static_json) }; !err.empty()) {
    return discovery_failure{ .kind = discovery_error_kind::SCHEMA_MISMATCH,
                              .message = "static manifest is not valid JSON: " + err };
  }
  if (auto const err{ picojson::parse(rhs, dynamic_json) }; !err.empty()) {
    return discovery_failure{ .kind = discovery_error_kind::SCHEMA_MISMATCH,
                              .message = "dynamic manifest is not valid JSON: " + err };
  }

  if (auto diff{ first_difference(lhs, rhs, "$") }) {
    return discovery_failure{ .kind = discovery_error_kind::SCHEMA_MISMATCH,
                              .message = "manifests differ at " + *diff };
  }
  return std::nullopt;
}

}  // namespace scout
