#include "discovery_cache.h"

#include "blake3_util.h"
#include "source_locator.h"
#include "trace.h"
#include "tui.h"

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace scout {

std::optional<std::string> discovery_cache::lookup(std::string const &package_name,
                                                   std::string const &fingerprint) const {
  typename decltype(entries_)::const_accessor acc;
  if (!entries_.find(acc, package_name)) { return std::nullopt; }
  if (acc->second.fingerprint != fingerprint) { return std::nullopt; }
  return acc->second.json;
}

void discovery_cache::store(std::string const &package_name, entry e) {
  typename decltype(entries_)::accessor acc;
  entries_.insert(acc, package_name);
  acc->second = std::move(e);
}

bool discovery_cache::invalidate(std::string const &package_name) {
  return entries_.erase(package_name);
}

size_t discovery_cache::size() const { return entries_.size(); }

namespace {

// Everything besides the file content that shapes the manifest: where the file
// came from, the caller's metadata, and the options analysis reads.
std::string fingerprint_input(discovery_request const &request,
                              located_source const &located,
                              std::string_view content,
                              discovery_options const &options) {
  std::string out;
  auto const field{ [&](std::string_view value) {
    out.append(std::to_string(value.size())).push_back(':');
    out.append(value);
  } };

  field(content);
  field(request.package_root.string());
  field(located.path.string());
  field(located.package_module);
  field(located.entry_point.value_or(options.entry_point));
  for (auto const &[key, value] : request.metadata) {
    field(key);
    field(value);
  }
  out.push_back('|');
  for (auto const &[symbol, members] : options.enumerations) {
    field(symbol);
    for (auto const &[member, value] : members) {
      field(member);
      field(value);
    }
  }
  out.push_back('|');
  for (auto const &name : options.tolerant_fields) { field(name); }
  out.push_back('|');
  if (options.match_tool) {
    for (auto const &arg : options.match_tool->argv) { field(arg); }
  }
  return out;
}

}  // namespace

cached_manifest discover_manifest_cached(discovery_cache &cache,
                                         discovery_request const &request,
                                         discovery_options const &options,
                                         dynamic_discovery_fn const &dynamic_fn) {
  if (!options.static_discovery) {
    return { .outcome = discover_manifest(request, options, dynamic_fn), .cache_hit = false };
  }

  located_source located;
  std::string content;
  try {
    located = source_locate(request.package_root, request.package_name, options);
    content = util_load_text(located.path);
  } catch (std::exception const &e) {
    tui::debug("%s: not cacheable: %s", request.package_name.c_str(), e.what());
    return { .outcome = discover_manifest(request, options, dynamic_fn), .cache_hit = false };
  }

  // The analyzed bytes are the fingerprinted bytes; the file is read once.
  auto const fingerprint{
    blake3_fingerprint(fingerprint_input(request, located, content, options))
  };

  if (auto json{ cache.lookup(request.package_name, fingerprint) }) {
    SCOUT_TRACE_CACHE_HIT(request.package_name, fingerprint);
    return { .outcome = { .json = std::move(*json),
                          .used_fallback = false,
                          .static_failure = std::nullopt },
             .cache_hit = true };
  }

  SCOUT_TRACE_CACHE_MISS(request.package_name, fingerprint);
  SCOUT_TRACE_DISCOVERY_START(request.package_name, request.package_root.string());
  auto outcome{ discover_manifest_from(request,
                                       discover_located(request, located, content, options),
                                       dynamic_fn) };
  if (outcome.used_fallback) {
    cache.invalidate(request.package_name);
  } else {
    cache.store(request.package_name, { .fingerprint = fingerprint, .json = outcome.json });
  }
  return { .outcome = std::move(outcome), .cache_hit = false };
}

}  // namespace scout
