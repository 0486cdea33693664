#include "import_map.h"

#include "source_scan.h"

#include <cctype>
#include <optional>
#include <utility>
#include <variant>

namespace scout {

namespace {

struct parse_failure {
  std::string reason;
};

using bindings_t = std::vector<std::pair<std::string, import_origin>>;

size_t skip_whitespace(std::string_view s, size_t pos) {
  while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) { ++pos; }
  return pos;
}

// Match `keyword` at `pos` when followed by whitespace, '(' or end of input.
bool parse_keyword(std::string_view s, size_t &pos, std::string_view keyword) {
  if (s.substr(pos, keyword.size()) != keyword) { return false; }
  size_t const end{ pos + keyword.size() };
  if (end < s.size() && scan_is_identifier_char(s[end])) { return false; }
  pos = end;
  return true;
}

std::string_view parse_module_token(std::string_view s, size_t &pos) {
  size_t const start{ pos };
  while (pos < s.size() && (scan_is_identifier_char(s[pos]) || s[pos] == '.')) { ++pos; }
  return s.substr(start, pos - start);
}

// "NAME" or "NAME as ALIAS" -> (name, alias); alias empty when absent.
std::optional<std::pair<std::string, std::string>> parse_import_item(std::string_view item,
                                                                     bool dotted) {
  size_t pos{ 0 };
  auto const name{ parse_module_token(item, pos) };
  if (dotted ? !scan_is_dotted_name(name) : !scan_is_identifier(name)) {
    return std::nullopt;
  }

  pos = skip_whitespace(item, pos);
  if (pos == item.size()) { return std::pair{ std::string{ name }, std::string{} }; }

  if (pos == name.size() || !parse_keyword(item, pos, "as")) { return std::nullopt; }
  pos = skip_whitespace(item, pos);
  auto const alias{ item.substr(pos) };
  if (!scan_is_identifier(alias)) { return std::nullopt; }

  return std::pair{ std::string{ name }, std::string{ alias } };
}

std::string resolve_relative(std::string_view module,
                             std::string_view package_module,
                             std::optional<parse_failure> &failure) {
  size_t level{ 0 };
  while (level < module.size() && module[level] == '.') { ++level; }
  if (level == 0) { return std::string{ module }; }

  auto const rest{ module.substr(level) };
  if (package_module.empty()) {
    failure = parse_failure{ "relative import without a package context" };
    return {};
  }

  std::string base{ package_module };
  for (size_t up{ 1 }; up < level; ++up) {
    auto const dot{ base.rfind('.') };
    if (dot == std::string::npos) {
      failure = parse_failure{ "relative import escapes the top-level package" };
      return {};
    }
    base.resize(dot);
  }

  if (rest.empty()) { return base; }
  return base + "." + std::string{ rest };
}

std::variant<bindings_t, parse_failure> parse_from_import(std::string_view stmt,
                                                          std::string_view package_module) {
  size_t pos{ 0 };
  parse_keyword(stmt, pos, "from");
  pos = skip_whitespace(stmt, pos);

  auto const module_token{ parse_module_token(stmt, pos) };
  size_t dots{ 0 };
  while (dots < module_token.size() && module_token[dots] == '.') { ++dots; }
  auto const module_name{ module_token.substr(dots) };
  if (module_token.empty() || (!module_name.empty() && !scan_is_dotted_name(module_name)) ||
      (dots == 0 && module_name.empty())) {
    return parse_failure{ "malformed module name" };
  }

  pos = skip_whitespace(stmt, pos);
  if (!parse_keyword(stmt, pos, "import")) { return parse_failure{ "expected 'import'" }; }

  auto names{ scan_trim(stmt.substr(pos)) };
  if (names == "*") { return parse_failure{ "star import" }; }

  if (!names.empty() && names.front() == '(') {
    if (names.back() != ')') { return parse_failure{ "unbalanced parenthesized import" }; }
    names = scan_trim(names.substr(1, names.size() - 2));
  }

  std::optional<parse_failure> failure;
  auto const module{ resolve_relative(module_token, package_module, failure) };
  if (failure) { return *failure; }

  auto const items{ scan_split_top_level(names, ',') };
  if (items.empty()) { return parse_failure{ "empty import list" }; }

  bindings_t bindings;
  for (auto const item : items) {
    auto const parsed{ parse_import_item(item, false) };
    if (!parsed) { return parse_failure{ "malformed import item '" + std::string{ item } + "'" }; }

    auto const &[name, alias] = *parsed;
    bindings.emplace_back(alias.empty() ? name : alias,
                          import_origin{ .module_path = module,
                                         .original_name = name,
                                         .alias = alias.empty() ? alias_kind::DIRECT
                                                                : alias_kind::ALIASED });
  }
  return bindings;
}

std::variant<bindings_t, parse_failure> parse_plain_import(std::string_view stmt) {
  size_t pos{ 0 };
  parse_keyword(stmt, pos, "import");

  auto const items{ scan_split_top_level(stmt.substr(pos), ',') };
  if (items.empty()) { return parse_failure{ "empty import list" }; }

  bindings_t bindings;
  for (auto const item : items) {
    auto const parsed{ parse_import_item(item, true) };
    if (!parsed) { return parse_failure{ "malformed import item '" + std::string{ item } + "'" }; }

    auto const &[name, alias] = *parsed;
    if (alias.empty()) {  // "import a.b" binds "a"
      auto const top{ name.substr(0, name.find('.')) };
      bindings.emplace_back(
          top,
          import_origin{ .module_path = top, .original_name = {}, .alias = alias_kind::DIRECT });
    } else {
      bindings.emplace_back(
          alias,
          import_origin{ .module_path = name, .original_name = {}, .alias = alias_kind::ALIASED });
    }
  }
  return bindings;
}

// Names bound by a top-level `def`, `class` or plain assignment statement.
std::vector<std::string> parse_local_bindings(std::string_view stmt) {
  size_t pos{ 0 };
  if (parse_keyword(stmt, pos, "async")) { pos = skip_whitespace(stmt, pos); }
  if (parse_keyword(stmt, pos, "def") || parse_keyword(stmt, pos, "class")) {
    pos = skip_whitespace(stmt, pos);
    size_t const start{ pos };
    while (pos < stmt.size() && scan_is_identifier_char(stmt[pos])) { ++pos; }
    auto const name{ stmt.substr(start, pos - start) };
    if (!scan_is_identifier(name)) { return {}; }
    return { std::string{ name } };
  }

  // `a = b = value` binds every target; comparisons and augmented assignments bind nothing new.
  std::vector<std::string> names;
  size_t start{ 0 };
  for (auto eq{ scan_find_top_level(stmt, '=') }; eq != std::string_view::npos;
       eq = scan_find_top_level(stmt, '=', start)) {
    bool const is_operator{ (eq + 1 < stmt.size() && stmt[eq + 1] == '=') ||
                            (eq > 0 && std::string_view{ "=!<>+-*/%&|^@:" }.find(
                                           stmt[eq - 1]) != std::string_view::npos) };
    if (is_operator) { break; }

    auto target{ scan_trim(stmt.substr(start, eq - start)) };
    if (auto const colon{ scan_find_top_level(target, ':') }; colon != std::string_view::npos) {
      target = scan_trim(target.substr(0, colon));  // `name: T = value`
    }
    for (auto const piece : scan_split_top_level(target, ',')) {
      if (scan_is_identifier(piece)) { names.emplace_back(piece); }
    }
    start = eq + 1;
  }
  return names;
}

}  // namespace

import_map import_map::build(std::string_view content, std::string_view package_module) {
  import_map result;

  for (auto const &line : scan_logical_lines(content)) {
    for (auto const stmt : scan_split_top_level(line.text, ';')) {
      size_t probe{ 0 };
      bool const is_from{ parse_keyword(stmt, probe, "from") };
      probe = 0;
      bool const is_import{ !is_from && parse_keyword(stmt, probe, "import") };
      if (!is_from && !is_import) {
        if (line.indent != 0) { continue; }
        for (auto &name : parse_local_bindings(stmt)) {
          import_origin local{ .module_path = {},
                               .original_name = name,
                               .alias = alias_kind::LOCAL };
          result.symbols_.insert_or_assign(std::move(name), std::move(local));
        }
        continue;
      }

      auto parsed{ is_from ? parse_from_import(stmt, package_module)
                           : parse_plain_import(stmt) };

      if (auto const *failure{ std::get_if<parse_failure>(&parsed) }) {
        result.warnings_.push_back({ .line_number = line.line_number,
                                     .text = std::string{ stmt },
                                     .reason = failure->reason });
        continue;
      }

      for (auto &[local, origin] : std::get<bindings_t>(parsed)) {
        result.symbols_.insert_or_assign(std::move(local), std::move(origin));
      }
    }
  }

  return result;
}

import_origin const *import_map::find(std::string_view local_name) const {
  auto const it{ symbols_.find(local_name) };
  return it == symbols_.end() ? nullptr : &it->second;
}

}  // namespace scout
