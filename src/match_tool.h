#pragma once

#include "discovery_options.h"
#include "registration_site.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace scout {

struct match_tool_output {
  int exit_code;  // 128 + signal when the child was killed
  std::string out;
  std::string err;
};

// Run `argv` with stdin at /dev/null and capture both streams. The child is killed
// once `timeout_ms` elapses. argv[0] is looked up on PATH.
// Throws discovery_error(STRUCTURAL_MATCH_TOOL_FAILURE) on timeout or spawn failure.
match_tool_output match_tool_exec(std::vector<std::string> const &argv, std::int64_t timeout_ms);

// Byte spans of `--json=compact` output: [{"range":{"byteOffset":{"start":N,"end":M}}}...].
// Throws discovery_error(STRUCTURAL_MATCH_TOOL_FAILURE) on malformed output.
std::vector<source_span> match_tool_parse_output(std::string const &json);

// `<argv> --pattern <pattern> --json=compact <file>`; non-zero exit is a failure.
std::vector<source_span> match_tool_find(match_tool_options const &tool,
                                         std::string const &pattern,
                                         std::filesystem::path const &file);

}  // namespace scout
