#pragma once

#include "discovery_error.h"
#include "discovery_options.h"
#include "manifest.h"
#include "source_locator.h"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace scout {

struct discovery_request {
  std::filesystem::path package_root;
  std::string package_name;
  std::vector<std::pair<std::string, std::string>> metadata;
};

using discovery_result = std::variant<package, discovery_failure>;

// Locate, read and analyze one installed package. Never throws for discovery problems;
// every failure comes back as a discovery_failure.
discovery_result discover_package(discovery_request const &request,
                                  discovery_options const &options);

// Analyze a registration file that was already located and read.
discovery_result discover_located(discovery_request const &request,
                                  located_source const &located,
                                  std::string_view content,
                                  discovery_options const &options);

// Analyze registration file text that is already in memory.
discovery_result discover_source(std::string_view content,
                                 std::string const &package_name,
                                 std::string const &package_module,
                                 discovery_options const &options,
                                 std::vector<std::pair<std::string, std::string>> metadata = {});

// Interpreter-backed discovery supplied by the caller; returns manifest JSON.
using dynamic_discovery_fn = std::function<std::string(discovery_request const &)>;

struct manifest_outcome {
  std::string json;
  bool used_fallback;
  std::optional<discovery_failure> static_failure;  // why the fallback ran, if it did
};

// Static discovery with fallback to `dynamic_fn`. With static discovery disabled the
// dynamic path runs directly. Exceptions from `dynamic_fn` propagate; without a
// `dynamic_fn` a static failure is thrown as discovery_error.
manifest_outcome discover_manifest(discovery_request const &request,
                                   discovery_options const &options,
                                   dynamic_discovery_fn const &dynamic_fn);

// Manifest JSON for a finished static attempt, or `dynamic_fn` when it failed.
manifest_outcome discover_manifest_from(discovery_request const &request,
                                        discovery_result result,
                                        dynamic_discovery_fn const &dynamic_fn);

// One task per request; results are in request order.
std::vector<discovery_result> discover_packages(std::vector<discovery_request> const &requests,
                                                discovery_options const &options);

}  // namespace scout
