#include "discovery_options.h"

#include "util.h"

#include "picojson.h"

#include <stdexcept>
#include <string>

namespace scout {

namespace {

std::string expect_string(picojson::value const &v, std::string const &key) {
  if (!v.is<std::string>()) {
    throw std::runtime_error("options: '" + key + "' must be a string");
  }
  return v.get<std::string>();
}

std::vector<std::string> expect_string_array(picojson::value const &v,
                                             std::string const &key) {
  if (!v.is<picojson::array>()) {
    throw std::runtime_error("options: '" + key + "' must be an array of strings");
  }
  std::vector<std::string> result;
  for (auto const &item : v.get<picojson::array>()) {
    result.push_back(expect_string(item, key));
  }
  return result;
}

match_tool_options parse_match_tool(picojson::value const &v) {
  if (!v.is<picojson::object>()) {
    throw std::runtime_error("options: 'match_tool' must be an object");
  }

  match_tool_options result;
  for (auto const &[key, value] : v.get<picojson::object>()) {
    if (key == "argv") {
      result.argv = expect_string_array(value, "match_tool.argv");
    } else if (key == "timeout_ms") {
      if (!value.is<std::int64_t>() || value.get<std::int64_t>() <= 0) {
        throw std::runtime_error("options: 'match_tool.timeout_ms' must be a positive integer");
      }
      result.timeout_ms = value.get<std::int64_t>();
    } else {
      throw std::runtime_error("options: unknown key 'match_tool." + key + "'");
    }
  }

  if (result.argv.empty()) {
    throw std::runtime_error("options: 'match_tool.argv' must not be empty");
  }
  return result;
}

}  // namespace

discovery_options discovery_options_parse(std::string const &json) {
  picojson::value root;
  std::string const err{ picojson::parse(root, json) };
  if (!err.empty()) { throw std::runtime_error("options: invalid JSON: " + err); }
  if (!root.is<picojson::object>()) {
    throw std::runtime_error("options: top-level value must be an object");
  }

  discovery_options opts;
  for (auto const &[key, value] : root.get<picojson::object>()) {
    if (key == "static_discovery") {
      if (!value.is<bool>()) {
        throw std::runtime_error("options: 'static_discovery' must be a boolean");
      }
      opts.static_discovery = value.get<bool>();
    } else if (key == "entry_point") {
      opts.entry_point = expect_string(value, key);
    } else if (key == "registration_files") {
      opts.registration_files = expect_string_array(value, key);
    } else if (key == "entry_point_group") {
      opts.entry_point_group = expect_string(value, key);
    } else if (key == "enumerations") {
      if (!value.is<picojson::object>()) {
        throw std::runtime_error("options: 'enumerations' must be an object");
      }
      opts.enumerations.clear();
      for (auto const &[symbol, members] : value.get<picojson::object>()) {
        if (!members.is<picojson::object>()) {
          throw std::runtime_error("options: enumeration '" + symbol +
                                   "' must map members to strings");
        }
        auto &target{ opts.enumerations[symbol] };
        for (auto const &[member, serialized] : members.get<picojson::object>()) {
          target[member] = expect_string(serialized, "enumerations." + symbol + "." + member);
        }
      }
    } else if (key == "tolerant_fields") {
      auto const fields{ expect_string_array(value, key) };
      opts.tolerant_fields = { fields.begin(), fields.end() };
    } else if (key == "match_tool") {
      if (!value.is<picojson::null>()) { opts.match_tool = parse_match_tool(value); }
    } else {
      throw std::runtime_error("options: unknown key '" + key + "'");
    }
  }

  if (opts.entry_point.empty()) {
    throw std::runtime_error("options: 'entry_point' must not be empty");
  }
  if (opts.registration_files.empty()) {
    throw std::runtime_error("options: 'registration_files' must not be empty");
  }

  return opts;
}

discovery_options discovery_options_load(std::filesystem::path const &path) {
  auto opts{ discovery_options_parse(util_load_text(path)) };
  discovery_options_apply_env(opts);
  return opts;
}

void discovery_options_apply_env(discovery_options &options) {
  auto const value{ util_getenv("SCOUT_STATIC_DISCOVERY") };
  if (!value) { return; }

  auto const parsed{ util_parse_bool(*value) };
  if (!parsed) {
    throw std::runtime_error("options: SCOUT_STATIC_DISCOVERY must be 0 or 1, got '" +
                             *value + "'");
  }
  options.static_discovery = *parsed;
}

}  // namespace scout
