#include "discovery.h"

#include "argument.h"
#include "import_map.h"
#include "match_tool.h"
#include "registration_site.h"
#include "source_locator.h"
#include "symbol_resolver.h"
#include "trace.h"
#include "tui.h"
#include "util.h"

#include "tbb/task_group.h"

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>

namespace scout {

namespace {

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start)
      .count();
}

package analyze(std::string_view content,
                std::string const &package_name,
                std::string const &package_module,
                discovery_options const &options,
                std::string const &entry_point,
                std::vector<std::pair<std::string, std::string>> metadata,
                std::optional<source_span> body) {
  auto const imports{ import_map::build(content, package_module) };
  for (auto const &w : imports.warnings()) {
    tui::warn("%s: line %zu: skipped import '%s' (%s)",
              package_name.c_str(),
              w.line_number,
              w.text.c_str(),
              w.reason.c_str());
    SCOUT_TRACE_IMPORT_SKIPPED(package_name, static_cast<std::int64_t>(w.line_number), w.reason);
  }

  if (!body) { body = registration_find_entry_point(content, entry_point); }

  std::vector<discovery_plugin> plugins;
  for (auto const &site : registration_extract_sites(content, *body, imports)) {
    SCOUT_TRACE_SITE_EXTRACTED(package_name,
                               site.constructor,
                               static_cast<std::int64_t>(site.begin),
                               static_cast<std::int64_t>(site.end));

    auto resolved{ symbol_resolve_arguments(argument_parse(site), imports, options) };
    plugins.push_back(manifest_build_plugin(site, std::move(resolved), options));
  }

  return manifest_build_package(package_name, std::move(plugins), std::move(metadata));
}

std::string read_source(std::filesystem::path const &path) {
  try {
    return util_load_text(path);
  } catch (std::exception const &e) {
    throw discovery_error(discovery_error_kind::SOURCE_NOT_FOUND, e.what());
  }
}

// ast-grep patterns only match the annotation shape they spell out, so ask for both.
source_span match_entry_point(std::string_view content,
                              std::filesystem::path const &path,
                              match_tool_options const &tool,
                              std::string const &entry_point) {
  std::string const patterns[]{ "def " + entry_point + "($$$ARGS): $$$BODY",
                                "def " + entry_point + "($$$ARGS) -> $RET: $$$BODY" };

  std::optional<source_span> last;
  for (auto const &pattern : patterns) {
    std::vector<source_span> spans;
    try {
      spans = match_tool_find(tool, pattern, path);
    } catch (discovery_error const &) {
      throw;
    } catch (std::exception const &e) {
      throw discovery_error(discovery_error_kind::STRUCTURAL_MATCH_TOOL_FAILURE, e.what());
    }
    for (auto const &span : spans) {
      if (!last || span.begin > last->begin) { last = span; }  // later definitions rebind
    }
  }

  if (!last) {
    throw discovery_error(discovery_error_kind::REGISTRATION_FUNCTION_NOT_FOUND,
                          "no definition of '" + entry_point + "' matched in " + path.string());
  }
  return registration_body_of(content, *last);
}

discovery_failure record_failure(std::string const &package_name, discovery_error const &e) {
  auto failure{ e.to_failure() };
  SCOUT_TRACE_DISCOVERY_FAILED(package_name,
                               std::string{ discovery_error_kind_name(failure.kind) },
                               failure.message);
  tui::debug("%s: static discovery failed: %s", package_name.c_str(), failure.describe().c_str());
  return failure;
}

}  // namespace

discovery_result discover_package(discovery_request const &request,
                                  discovery_options const &options) {
  SCOUT_TRACE_DISCOVERY_START(request.package_name, request.package_root.string());

  located_source located;
  std::string content;
  try {
    try {
      located = source_locate(request.package_root, request.package_name, options);
    } catch (discovery_error const &) {
      throw;
    } catch (std::exception const &e) {
      throw discovery_error(discovery_error_kind::SOURCE_NOT_FOUND, e.what());
    }
    content = read_source(located.path);
  } catch (discovery_error const &e) {
    return record_failure(request.package_name, e);
  }

  return discover_located(request, located, content, options);
}

discovery_result discover_located(discovery_request const &request,
                                  located_source const &located,
                                  std::string_view content,
                                  discovery_options const &options) {
  auto const start{ std::chrono::steady_clock::now() };
  SCOUT_TRACE_SOURCE_LOCATED(request.package_name, located.path.string(), located.strategy);

  try {
    auto const &entry_point{ located.entry_point ? *located.entry_point : options.entry_point };

    std::optional<source_span> body;
    if (options.match_tool) {
      body = match_entry_point(content, located.path, *options.match_tool, entry_point);
    }

    auto pkg{ analyze(content,
                      request.package_name,
                      located.package_module,
                      options,
                      entry_point,
                      request.metadata,
                      body) };

    SCOUT_TRACE_DISCOVERY_COMPLETE(request.package_name,
                                   static_cast<std::int64_t>(pkg.plugins.size()),
                                   elapsed_ms(start));
    return pkg;
  } catch (discovery_error const &e) {
    return record_failure(request.package_name, e);
  } catch (std::exception const &e) {
    return record_failure(request.package_name,
                          discovery_error(discovery_error_kind::REQUIRES_RUNTIME_INSPECTION,
                                          std::string{ "static analysis aborted: " } + e.what()));
  }
}

discovery_result discover_source(std::string_view content,
                                 std::string const &package_name,
                                 std::string const &package_module,
                                 discovery_options const &options,
                                 std::vector<std::pair<std::string, std::string>> metadata) {
  try {
    return analyze(content,
                   package_name,
                   package_module,
                   options,
                   options.entry_point,
                   std::move(metadata),
                   {});
  } catch (discovery_error const &e) {
    return record_failure(package_name, e);
  } catch (std::exception const &e) {
    return record_failure(package_name,
                          discovery_error(discovery_error_kind::REQUIRES_RUNTIME_INSPECTION,
                                          std::string{ "static analysis aborted: " } + e.what()));
  }
}

manifest_outcome discover_manifest(discovery_request const &request,
                                   discovery_options const &options,
                                   dynamic_discovery_fn const &dynamic_fn) {
  if (!options.static_discovery) {
    if (!dynamic_fn) {
      throw std::invalid_argument("discover_manifest: static discovery disabled and no dynamic path");
    }
    SCOUT_TRACE_FALLBACK_INVOKED(request.package_name, "static discovery disabled");
    return { .json = dynamic_fn(request), .used_fallback = true, .static_failure = std::nullopt };
  }

  return discover_manifest_from(request, discover_package(request, options), dynamic_fn);
}

manifest_outcome discover_manifest_from(discovery_request const &request,
                                        discovery_result result,
                                        dynamic_discovery_fn const &dynamic_fn) {
  if (auto const *pkg{ std::get_if<package>(&result) }) {
    return { .json = manifest_to_json(*pkg), .used_fallback = false, .static_failure = std::nullopt };
  }

  auto failure{ std::get<discovery_failure>(std::move(result)) };
  if (!dynamic_fn) { throw discovery_error(failure.kind, failure.message); }

  tui::info("%s: falling back to dynamic discovery (%s)",
            request.package_name.c_str(),
            failure.describe().c_str());
  SCOUT_TRACE_FALLBACK_INVOKED(request.package_name, failure.describe());

  return { .json = dynamic_fn(request), .used_fallback = true, .static_failure = std::move(failure) };
}

std::vector<discovery_result> discover_packages(std::vector<discovery_request> const &requests,
                                                discovery_options const &options) {
  std::vector<discovery_result> results(requests.size());

  tbb::task_group tg;
  for (size_t i{}; i < requests.size(); ++i) {
    tg.run([&, i]() { results[i] = discover_package(requests[i], options); });
  }
  tg.wait();

  return results;
}

}  // namespace scout
