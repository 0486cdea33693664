#include "source_locator.h"

#include "discovery_error.h"
#include "source_scan.h"
#include "tui.h"
#include "util.h"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <vector>

namespace scout {

namespace fs = std::filesystem;

namespace {

bool is_file(fs::path const &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

std::vector<fs::path> list_directories(fs::path const &dir) {
  std::vector<fs::path> result;
  std::error_code ec;
  for (fs::directory_iterator it{ dir, ec }, end; !ec && it != end; it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_directory(type_ec)) { result.push_back(it->path()); }
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::vector<fs::path> candidates_in(fs::path const &dir, discovery_options const &options) {
  std::vector<fs::path> found;
  for (auto const &name : options.registration_files) {
    if (auto const candidate{ dir / name }; is_file(candidate)) {
      found.push_back(candidate);
    }
  }
  return found;
}

std::string describe(std::vector<fs::path> const &paths) {
  std::string result;
  for (auto const &p : paths) {
    if (!result.empty()) { result.append(", "); }
    result.append(p.string());
  }
  return result;
}

[[noreturn]] void throw_ambiguous(std::vector<fs::path> const &paths) {
  throw discovery_error(discovery_error_kind::SOURCE_NOT_FOUND,
                        "ambiguous registration file candidates: " + describe(paths));
}

std::optional<located_source> locate_via_entry_points(fs::path const &package_root,
                                                      std::string const &normalized,
                                                      discovery_options const &options) {
  std::vector<fs::path> dist_infos;
  for (auto const &dir : { package_root, package_root.parent_path() }) {
    for (auto const &sub : list_directories(dir)) {
      auto const name{ sub.filename().string() };
      if (!name.ends_with(".dist-info")) { continue; }
      auto const dash{ name.find('-') };
      if (dash == std::string::npos) { continue; }
      if (source_normalize_name(name.substr(0, dash)) != normalized) { continue; }
      auto canonical{ fs::weakly_canonical(sub) };
      if (std::find(dist_infos.begin(), dist_infos.end(), canonical) == dist_infos.end()) {
        dist_infos.push_back(std::move(canonical));
      }
    }
  }

  if (dist_infos.size() != 1) {
    if (dist_infos.size() > 1) {
      tui::debug("source_locate: %zu dist-info directories match %s, ignoring entry points",
                 dist_infos.size(),
                 normalized.c_str());
    }
    return std::nullopt;
  }

  auto const entry_points_file{ dist_infos.front() / "entry_points.txt" };
  if (!is_file(entry_points_file)) { return std::nullopt; }

  auto const entry{ source_parse_entry_points(util_load_text(entry_points_file),
                                              options.entry_point_group) };
  if (!entry) { return std::nullopt; }

  auto const site_packages{ dist_infos.front().parent_path() };
  std::string relative{ entry->module };
  std::replace(relative.begin(), relative.end(), '.', '/');

  for (auto const &candidate :
       { site_packages / (relative + ".py"), site_packages / relative / "__init__.py" }) {
    if (!is_file(candidate)) { continue; }
    // `module:obj.attr` names something other than a function; keep the configured one
    return located_source{ .path = candidate,
                           .package_module = source_package_module(candidate),
                           .strategy = "entry_points",
                           .entry_point = scan_is_identifier(entry->symbol)
                                              ? std::optional{ entry->symbol }
                                              : std::nullopt };
  }

  tui::debug("source_locate: entry point module %s has no source file",
             entry->module.c_str());
  return std::nullopt;
}

}  // namespace

std::string source_normalize_name(std::string_view package_name) {
  std::string result;
  result.reserve(package_name.size());
  for (char const c : package_name) {
    if (c == '-' || c == '_' || c == '.') {
      if (result.empty() || result.back() != '_') { result.push_back('_'); }
    } else {
      result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return result;
}

std::optional<entry_point_ref> source_parse_entry_points(std::string_view content,
                                                         std::string_view group) {
  bool in_group{ false };

  while (!content.empty()) {
    auto const newline{ content.find('\n') };
    auto const line{ scan_trim(content.substr(0, newline)) };
    content = newline == std::string_view::npos ? std::string_view{}
                                                : content.substr(newline + 1);

    if (line.empty() || line.front() == '#' || line.front() == ';') { continue; }

    if (line.front() == '[') {
      if (in_group) { break; }
      in_group = line.size() >= 2 && line.back() == ']' &&
                 scan_trim(line.substr(1, line.size() - 2)) == group;
      continue;
    }
    if (!in_group) { continue; }

    auto const eq{ line.find('=') };
    if (eq == std::string_view::npos) { continue; }
    auto value{ scan_trim(line.substr(eq + 1)) };
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = scan_trim(value.substr(1, value.size() - 2));
    }

    auto const colon{ value.find(':') };
    if (colon == std::string_view::npos) { continue; }
    auto const module{ scan_trim(value.substr(0, colon)) };
    auto const symbol{ scan_trim(value.substr(colon + 1)) };
    if (scan_is_dotted_name(module) && !symbol.empty()) {
      return entry_point_ref{ .module = std::string{ module }, .symbol = std::string{ symbol } };
    }
  }

  return std::nullopt;
}

std::string source_package_module(fs::path const &file) {
  std::vector<std::string> parts;
  for (auto dir{ file.parent_path() }; !dir.empty() && is_file(dir / "__init__.py");
       dir = dir.parent_path()) {
    parts.push_back(dir.filename().string());
    if (dir == dir.parent_path()) { break; }
  }

  if (parts.empty()) { return file.parent_path().filename().string(); }

  std::string result;
  for (auto it{ parts.rbegin() }; it != parts.rend(); ++it) {
    if (!result.empty()) { result.push_back('.'); }
    result.append(*it);
  }
  return result;
}

located_source source_locate(fs::path const &package_root,
                             std::string_view package_name,
                             discovery_options const &options) {
  std::error_code ec;
  if (!fs::is_directory(package_root, ec)) {
    throw discovery_error(discovery_error_kind::SOURCE_NOT_FOUND,
                          "package root is not a directory: " + package_root.string());
  }

  auto root{ fs::absolute(package_root).lexically_normal() };
  if (root.filename().empty()) { root = root.parent_path(); }

  auto const normalized{ source_normalize_name(package_name) };

  if (auto located{ locate_via_entry_points(root, normalized, options) }) {
    return std::move(*located);
  }

  auto const make{ [](fs::path const &path, char const *strategy) {
    return located_source{ .path = path,
                           .package_module = source_package_module(path),
                           .strategy = strategy,
                           .entry_point = std::nullopt };
  } };

  if (auto const direct{ candidates_in(root, options) }; !direct.empty()) {
    if (direct.size() > 1) { throw_ambiguous(direct); }
    return make(direct.front(), "direct");
  }

  if (auto const named{ candidates_in(root / normalized, options) };
      !named.empty()) {
    if (named.size() > 1) { throw_ambiguous(named); }
    return make(named.front(), "subdirectory");
  }

  std::vector<fs::path> nested;
  for (auto const &sub : list_directories(root)) {
    auto const name{ sub.filename().string() };
    if (name.ends_with(".dist-info") || name == "__pycache__" || name.starts_with('.')) {
      continue;
    }
    auto const found{ candidates_in(sub, options) };
    nested.insert(nested.end(), found.begin(), found.end());
  }

  if (nested.size() > 1) { throw_ambiguous(nested); }
  if (nested.size() == 1) { return make(nested.front(), "subdirectory"); }

  std::string names;
  for (auto const &n : options.registration_files) {
    if (!names.empty()) { names.append(", "); }
    names.append(n);
  }
  throw discovery_error(discovery_error_kind::SOURCE_NOT_FOUND,
                        "no registration file (" + names + ") under " + root.string());
}

}  // namespace scout
