#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace scout {

namespace trace_events {

struct discovery_start {
  std::string package;
  std::string root;
};

struct source_located {
  std::string package;
  std::string path;
  std::string strategy;  // entry_points | direct | subdirectory | inline
};

struct import_skipped {
  std::string package;
  std::int64_t line;
  std::string reason;
};

struct site_extracted {
  std::string package;
  std::string constructor;
  std::int64_t begin;
  std::int64_t end;
};

struct discovery_complete {
  std::string package;
  std::int64_t plugin_count;
  std::int64_t duration_ms;
};

struct discovery_failed {
  std::string package;
  std::string error_kind;
  std::string message;
};

struct fallback_invoked {
  std::string package;
  std::string reason;
};

struct cache_hit {
  std::string package;
  std::string fingerprint;
};

struct cache_miss {
  std::string package;
  std::string fingerprint;
};

struct match_tool_run {
  std::string file;
  std::string pattern;
  int exit_code;
  std::int64_t duration_ms;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::discovery_start,
                                   trace_events::source_located,
                                   trace_events::import_skipped,
                                   trace_events::site_extracted,
                                   trace_events::discovery_complete,
                                   trace_events::discovery_failed,
                                   trace_events::fallback_invoked,
                                   trace_events::cache_hit,
                                   trace_events::cache_miss,
                                   trace_events::match_tool_run>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

}  // namespace scout

#define SCOUT_TRACE_UNLIKELY [[unlikely]]

#define SCOUT_TRACE_EMIT(event_expr) \
  do { \
    if (::scout::tui::g_trace_enabled) SCOUT_TRACE_UNLIKELY { \
        ::scout::tui::trace event_expr; \
      } \
  } while (0)

#define SCOUT_TRACE_DISCOVERY_START(package_value, root_value) \
  SCOUT_TRACE_EMIT((::scout::trace_events::discovery_start{ \
      .package = (package_value), \
      .root = (root_value), \
  }))

#define SCOUT_TRACE_SOURCE_LOCATED(package_value, path_value, strategy_value) \
  SCOUT_TRACE_EMIT((::scout::trace_events::source_located{ \
      .package = (package_value), \
      .path = (path_value), \
      .strategy = (strategy_value), \
  }))

#define SCOUT_TRACE_IMPORT_SKIPPED(package_value, line_value, reason_value) \
  SCOUT_TRACE_EMIT((::scout::trace_events::import_skipped{ \
      .package = (package_value), \
      .line = (line_value), \
      .reason = (reason_value), \
  }))

#define SCOUT_TRACE_SITE_EXTRACTED(package_value, constructor_value, begin_value, end_value) \
  SCOUT_TRACE_EMIT((::scout::trace_events::site_extracted{ \
      .package = (package_value), \
      .constructor = (constructor_value), \
      .begin = (begin_value), \
      .end = (end_value), \
  }))

#define SCOUT_TRACE_DISCOVERY_COMPLETE(package_value, count_value, duration_value) \
  SCOUT_TRACE_EMIT((::scout::trace_events::discovery_complete{ \
      .package = (package_value), \
      .plugin_count = (count_value), \
      .duration_ms = (duration_value), \
  }))

#define SCOUT_TRACE_DISCOVERY_FAILED(package_value, kind_value, message_value) \
  SCOUT_TRACE_EMIT((::scout::trace_events::discovery_failed{ \
      .package = (package_value), \
      .error_kind = (kind_value), \
      .message = (message_value), \
  }))

#define SCOUT_TRACE_FALLBACK_INVOKED(package_value, reason_value) \
  SCOUT_TRACE_EMIT((::scout::trace_events::fallback_invoked{ \
      .package = (package_value), \
      .reason = (reason_value), \
  }))

#define SCOUT_TRACE_CACHE_HIT(package_value, fingerprint_value) \
  SCOUT_TRACE_EMIT((::scout::trace_events::cache_hit{ \
      .package = (package_value), \
      .fingerprint = (fingerprint_value), \
  }))

#define SCOUT_TRACE_CACHE_MISS(package_value, fingerprint_value) \
  SCOUT_TRACE_EMIT((::scout::trace_events::cache_miss{ \
      .package = (package_value), \
      .fingerprint = (fingerprint_value), \
  }))

#define SCOUT_TRACE_MATCH_TOOL_RUN(file_value, pattern_value, exit_value, duration_value) \
  SCOUT_TRACE_EMIT((::scout::trace_events::match_tool_run{ \
      .file = (file_value), \
      .pattern = (pattern_value), \
      .exit_code = (exit_value), \
      .duration_ms = (duration_value), \
  }))
