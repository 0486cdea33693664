#pragma once

#include "discovery.h"
#include "util.h"

#include <tbb/concurrent_hash_map.h>

#include <cstddef>
#include <optional>
#include <string>

namespace scout {

// Manifest JSON keyed by package name, valid while its fingerprint is unchanged. Safe to share between discovery tasks.
class discovery_cache : unmovable {
 public:
  struct entry {
    std::string fingerprint;
    std::string json;
  };

  std::optional<std::string> lookup(std::string const &package_name,
                                    std::string const &fingerprint) const;
  void store(std::string const &package_name, entry e);
  bool invalidate(std::string const &package_name);
  size_t size() const;

 private:
  tbb::concurrent_hash_map<std::string, entry> entries_;
};

struct cached_manifest {
  manifest_outcome outcome;
  bool cache_hit;
};

// Fingerprint the registration file together with the request metadata, package
// root and analysis options, and serve the manifest from `cache` when it matches; otherwise run discover_manifest and remember its result.
// Fallback results are not cached. A package whose source cannot be located
// bypasses the cache entirely.
cached_manifest discover_manifest_cached(discovery_cache &cache,
                                         discovery_request const &request,
                                         discovery_options const &options,
                                         dynamic_discovery_fn const &dynamic_fn);

}  // namespace scout
