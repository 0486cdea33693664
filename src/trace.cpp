#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <sstream>
#include <string>

namespace scout {

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(tp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(seconds) };
  std::tm utc_tm{};
  gmtime_r(&timestamp, &utc_tm);

  char base[32]{};
  if (std::strftime(base, sizeof base, "%Y-%m-%dT%H:%M:%S", &utc_tm) == 0) { return {}; }

  char buffer[64]{};
  int const written{ std::snprintf(buffer,
                                   sizeof buffer,
                                   "%s.%03lldZ",
                                   base,
                                   static_cast<long long>(millis)) };
  if (written <= 0) { return {}; }

  return std::string{ buffer, static_cast<std::size_t>(written) };
}

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

}  // namespace

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(discovery_start),
          TRACE_NAME(source_located),
          TRACE_NAME(import_skipped),
          TRACE_NAME(site_extracted),
          TRACE_NAME(discovery_complete),
          TRACE_NAME(discovery_failed),
          TRACE_NAME(fallback_invoked),
          TRACE_NAME(cache_hit),
          TRACE_NAME(cache_miss),
          TRACE_NAME(match_tool_run),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  std::ostringstream oss;
  oss << trace_event_name(event);

  std::visit(match{
                 [&](trace_events::discovery_start const &value) {
                   oss << " package=" << value.package << " root=" << value.root;
                 },
                 [&](trace_events::source_located const &value) {
                   oss << " package=" << value.package << " path=" << value.path
                       << " strategy=" << value.strategy;
                 },
                 [&](trace_events::import_skipped const &value) {
                   oss << " package=" << value.package << " line=" << value.line
                       << " reason=" << value.reason;
                 },
                 [&](trace_events::site_extracted const &value) {
                   oss << " package=" << value.package
                       << " constructor=" << value.constructor << " span=["
                       << value.begin << "," << value.end << ")";
                 },
                 [&](trace_events::discovery_complete const &value) {
                   oss << " package=" << value.package
                       << " plugins=" << value.plugin_count
                       << " duration_ms=" << value.duration_ms;
                 },
                 [&](trace_events::discovery_failed const &value) {
                   oss << " package=" << value.package << " kind=" << value.error_kind
                       << " message=" << value.message;
                 },
                 [&](trace_events::fallback_invoked const &value) {
                   oss << " package=" << value.package << " reason=" << value.reason;
                 },
                 [&](trace_events::cache_hit const &value) {
                   oss << " package=" << value.package
                       << " fingerprint=" << value.fingerprint;
                 },
                 [&](trace_events::cache_miss const &value) {
                   oss << " package=" << value.package
                       << " fingerprint=" << value.fingerprint;
                 },
                 [&](trace_events::match_tool_run const &value) {
                   oss << " file=" << value.file << " exit_code=" << value.exit_code
                       << " duration_ms=" << value.duration_ms;
                 },
             },
             event);

  return oss.str();
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  std::visit(
      match{
          [&](trace_events::discovery_start const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "root", value.root);
          },
          [&](trace_events::source_located const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "path", value.path);
            append_kv(output, "strategy", value.strategy);
          },
          [&](trace_events::import_skipped const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "line", value.line);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::site_extracted const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "constructor", value.constructor);
            append_kv(output, "begin", value.begin);
            append_kv(output, "end", value.end);
          },
          [&](trace_events::discovery_complete const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "plugin_count", value.plugin_count);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::discovery_failed const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "error_kind", value.error_kind);
            append_kv(output, "message", value.message);
          },
          [&](trace_events::fallback_invoked const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::cache_hit const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "fingerprint", value.fingerprint);
          },
          [&](trace_events::cache_miss const &value) {
            append_kv(output, "package", value.package);
            append_kv(output, "fingerprint", value.fingerprint);
          },
          [&](trace_events::match_tool_run const &value) {
            append_kv(output, "file", value.file);
            append_kv(output, "pattern", value.pattern);
            append_kv(output, "exit_code", static_cast<std::int64_t>(value.exit_code));
            append_kv(output, "duration_ms", value.duration_ms);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace scout
