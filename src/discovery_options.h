#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace scout {

// External structural matcher (ast-grep compatible command line).
struct match_tool_options {
  std::vector<std::string> argv;  // argv[0] must be an absolute path or on PATH
  std::int64_t timeout_ms{ 5000 };
};

struct discovery_options {
  bool static_discovery{ true };
  std::string entry_point{ "register_plugin" };
  std::vector<std::string> registration_files{ "plugins.py", "plugin.py" };
  std::string entry_point_group{ "r2x_plugin" };

  // Enumeration symbol -> (member -> serialized value).
  std::map<std::string, std::map<std::string, std::string>> enumerations{
    { "IOType", { { "STDIN", "stdin" }, { "STDOUT", "stdout" }, { "BOTH", "both" } } },
  };

  // Optional fields whose unsupported values serialize as null instead of failing.
  std::set<std::string> tolerant_fields;

  std::optional<match_tool_options> match_tool;
};

// Parse options from JSON text. Unknown keys are rejected so typos surface early.
// Throws std::runtime_error with the offending key on malformed input.
discovery_options discovery_options_parse(std::string const &json);

// Load from a JSON file, then apply environment overrides.
discovery_options discovery_options_load(std::filesystem::path const &path);

// SCOUT_STATIC_DISCOVERY=0|1 overrides `static_discovery`.
void discovery_options_apply_env(discovery_options &options);

}  // namespace scout
