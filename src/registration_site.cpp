#include "registration_site.h"

#include "discovery_error.h"
#include "source_scan.h"

#include <algorithm>
#include <array>
#include <string>
#include <utility>

namespace scout {

namespace {

constexpr std::array<std::pair<std::string_view, plugin_kind>, 4> kDescriptors{ {
    { "ParserPlugin", plugin_kind::PARSER },
    { "UpgraderPlugin", plugin_kind::UPGRADER },
    { "ExporterPlugin", plugin_kind::EXPORTER },
    { "BasePlugin", plugin_kind::BASE },
} };

size_t skip_blanks(std::string_view s, size_t pos) {
  while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) { ++pos; }
  return pos;
}

size_t skip_identifier(std::string_view s, size_t pos) {
  while (pos < s.size() && scan_is_identifier_char(s[pos])) { ++pos; }
  return pos;
}

bool consume_word(std::string_view s, size_t &pos, std::string_view word) {
  if (s.substr(pos, word.size()) != word) { return false; }
  size_t const end{ pos + word.size() };
  if (end < s.size() && scan_is_identifier_char(s[end])) { return false; }
  pos = end;
  return true;
}

// Offset of the '(' after `def <name>` when the line defines `function_name`.
std::optional<size_t> match_def(std::string_view content,
                                logical_line const &line,
                                std::string_view function_name) {
  size_t pos{ line.offset };
  if (consume_word(content, pos, "async")) { pos = skip_blanks(content, pos); }
  if (!consume_word(content, pos, "def")) { return std::nullopt; }

  pos = skip_blanks(content, pos);
  size_t const name_end{ skip_identifier(content, pos) };
  if (content.substr(pos, name_end - pos) != function_name) { return std::nullopt; }

  pos = skip_blanks(content, name_end);
  if (pos >= content.size() || content[pos] != '(') { return std::nullopt; }
  return pos;
}

source_span body_after_header(std::string_view content,
                              std::vector<logical_line> const &lines,
                              size_t header_index,
                              size_t open_paren) {
  auto const &header{ lines[header_index] };

  auto const close{ scan_find_closing(content, open_paren) };
  if (!close) {
    throw discovery_error(discovery_error_kind::REGISTRATION_FUNCTION_NOT_FOUND,
                          "unbalanced parameter list at line " +
                              std::to_string(header.line_number));
  }

  auto const colon{ scan_find_top_level(content.substr(0, header.end), ':', *close + 1) };
  if (colon == std::string_view::npos) {
    throw discovery_error(discovery_error_kind::REGISTRATION_FUNCTION_NOT_FOUND,
                          "function header without ':' at line " +
                              std::to_string(header.line_number));
  }

  auto const inline_body{ content.substr(colon + 1, header.end - colon - 1) };
  if (!scan_trim(scan_strip_comments(inline_body)).empty()) {
    return source_span{ .begin = colon + 1, .end = header.end };
  }

  source_span body{ .begin = header.end, .end = header.end };
  for (size_t i{ header_index + 1 }; i < lines.size() && lines[i].indent > header.indent; ++i) {
    if (i == header_index + 1) { body.begin = lines[i].offset; }
    body.end = lines[i].end;
  }
  return body;
}

bool follows_definition_keyword(std::string_view content, size_t pos) {
  while (pos > 0 && (content[pos - 1] == ' ' || content[pos - 1] == '\t')) { --pos; }
  size_t start{ pos };
  while (start > 0 && scan_is_identifier_char(content[start - 1])) { --start; }
  auto const word{ content.substr(start, pos - start) };
  return word == "class" || word == "def";
}

// Descriptor constructor named by the call `chain(`, or empty when it is not one.
std::string descriptor_for(std::string_view chain, import_map const &imports) {
  if (chain.find('.') == std::string_view::npos) {
    auto const *origin{ imports.find(chain) };
    if (origin && !origin->is_module() && !origin->is_local()) {
      if (plugin_kind_from_constructor(origin->original_name)) {
        return origin->original_name;
      }
    }
  }

  auto const dot{ chain.rfind('.') };
  auto const last{ dot == std::string_view::npos ? chain : chain.substr(dot + 1) };
  if (last.ends_with("Plugin")) { return std::string{ last }; }
  return {};
}

}  // namespace

char const *plugin_kind_name(plugin_kind kind) {
  switch (kind) {
    case plugin_kind::PARSER: return "parser";
    case plugin_kind::UPGRADER: return "upgrader";
    case plugin_kind::EXPORTER: return "exporter";
    case plugin_kind::BASE: return "base";
  }
  return "unknown";
}

std::optional<plugin_kind> plugin_kind_from_constructor(std::string_view constructor) {
  for (auto const &[name, kind] : kDescriptors) {
    if (name == constructor) { return kind; }
  }
  return std::nullopt;
}

source_span registration_find_entry_point(std::string_view content,
                                          std::string_view function_name) {
  auto const lines{ scan_logical_lines(content) };

  std::optional<source_span> found;
  for (size_t i{ 0 }; i < lines.size(); ++i) {
    if (auto const paren{ match_def(content, lines[i], function_name) }) {
      found = body_after_header(content, lines, i, *paren);  // later definitions rebind
    }
  }

  if (!found) {
    throw discovery_error(discovery_error_kind::REGISTRATION_FUNCTION_NOT_FOUND,
                          "no function '" + std::string{ function_name } + "' defined");
  }
  return *found;
}

source_span registration_body_of(std::string_view content, source_span function_span) {
  auto const lines{ scan_logical_lines(content) };

  for (size_t i{ 0 }; i < lines.size(); ++i) {
    if (lines[i].offset < function_span.begin) { continue; }
    if (lines[i].offset >= function_span.end) { break; }

    size_t pos{ lines[i].offset };
    if (consume_word(content, pos, "async")) { pos = skip_blanks(content, pos); }
    if (!consume_word(content, pos, "def")) { continue; }

    pos = skip_identifier(content, skip_blanks(content, pos));
    pos = skip_blanks(content, pos);
    if (pos < content.size() && content[pos] == '(') {
      return body_after_header(content, lines, i, pos);
    }
  }

  throw discovery_error(discovery_error_kind::STRUCTURAL_MATCH_TOOL_FAILURE,
                        "matched span [" + std::to_string(function_span.begin) + ", " +
                            std::to_string(function_span.end) +
                            ") does not contain a function definition");
}

std::vector<registration_site> registration_extract_sites(std::string_view content,
                                                          source_span body,
                                                          import_map const &imports) {
  std::vector<registration_site> sites;
  size_t const limit{ std::min(body.end, content.size()) };
  size_t i{ body.begin };

  while (i < limit) {
    char const c{ content[i] };

    if (c == '#') {
      while (i < limit && content[i] != '\n') { ++i; }
      continue;
    }

    if (auto const tok{ scan_string_at(content, i) }) {
      i = tok->end;
      continue;
    }

    bool const token_start{ i == 0 || !scan_is_identifier_char(content[i - 1]) };
    if (!scan_is_identifier_start(c) || !token_start) {
      ++i;
      continue;
    }

    size_t chain_end{ skip_identifier(content, i) };
    while (chain_end + 1 < limit && content[chain_end] == '.' &&
           scan_is_identifier_start(content[chain_end + 1])) {
      chain_end = skip_identifier(content, chain_end + 1);
    }

    auto const chain{ content.substr(i, chain_end - i) };
    size_t const open{ skip_blanks(content, chain_end) };
    bool const is_call{ open < limit && content[open] == '(' };

    auto descriptor{ is_call && !follows_definition_keyword(content, i)
                         ? descriptor_for(chain, imports)
                         : std::string{} };
    if (descriptor.empty()) {
      i = chain_end;
      continue;
    }

    auto const close{ scan_find_closing(content, open) };
    if (!close || *close >= limit) {
      throw discovery_error(discovery_error_kind::MALFORMED_REGISTRATION_SITE,
                            "unbalanced call to " + std::string{ chain } + " at line " +
                                std::to_string(scan_line_number(content, i)));
    }

    auto kind{ plugin_kind_from_constructor(descriptor) };
    sites.push_back(registration_site{
        .constructor = std::string{ chain },
        .descriptor = std::move(descriptor),
        .kind = kind,
        .text = std::string{ content.substr(i, *close + 1 - i) },
        .arguments = std::string{ content.substr(open + 1, *close - open - 1) },
        .begin = i,
        .end = *close + 1,
        .line_number = scan_line_number(content, i) });

    i = *close + 1;
  }

  return sites;
}

}  // namespace scout
