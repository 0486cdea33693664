#include "source_scan.h"

#include <algorithm>
#include <cctype>

namespace scout {

namespace {

bool is_string_prefix_char(char c) {
  switch (c) {
    case 'r': case 'R': case 'b': case 'B': case 'u': case 'U': case 'f': case 'F':
      return true;
    default: return false;
  }
}

bool is_open_bracket(char c) { return c == '(' || c == '[' || c == '{'; }
bool is_close_bracket(char c) { return c == ')' || c == ']' || c == '}'; }

char closer_for(char open) {
  switch (open) {
    case '(': return ')';
    case '[': return ']';
    default: return '}';
  }
}

std::size_t skip_comment(std::string_view content, std::size_t pos) {
  auto const newline{ content.find('\n', pos) };
  return newline == std::string_view::npos ? content.size() : newline;
}

std::size_t skip_identifier(std::string_view content, std::size_t pos) {
  while (pos < content.size() && scan_is_identifier_char(content[pos])) { ++pos; }
  return pos;
}

// Skip one opaque token (comment, string literal, identifier) starting at `pos`.
// Returns nullopt when `pos` starts none of them.
std::optional<std::size_t> skip_opaque(std::string_view content, std::size_t pos) {
  char const c{ content[pos] };
  if (c == '#') { return skip_comment(content, pos); }
  if (c == '"' || c == '\'' || is_string_prefix_char(c)) {
    if (auto const tok{ scan_string_at(content, pos) }) { return tok->end; }
  }
  if (scan_is_identifier_start(c)) { return skip_identifier(content, pos); }
  return std::nullopt;
}

}  // namespace

bool scan_is_identifier_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_' ||
         static_cast<unsigned char>(c) >= 0x80;
}

bool scan_is_identifier_char(char c) {
  return scan_is_identifier_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

bool scan_is_identifier(std::string_view s) {
  if (s.empty() || !scan_is_identifier_start(s.front())) { return false; }
  return std::all_of(s.begin(), s.end(), scan_is_identifier_char);
}

bool scan_is_dotted_name(std::string_view s) {
  if (s.empty()) { return false; }
  for (std::size_t start{ 0 };;) {
    auto const dot{ s.find('.', start) };
    auto const part{ s.substr(start, dot == std::string_view::npos ? s.npos : dot - start) };
    if (!scan_is_identifier(part)) { return false; }
    if (dot == std::string_view::npos) { return true; }
    start = dot + 1;
  }
}

std::string_view scan_trim(std::string_view s) {
  auto const is_space{ [](char c) { return std::isspace(static_cast<unsigned char>(c)); } };
  while (!s.empty() && is_space(s.front())) { s.remove_prefix(1); }
  while (!s.empty() && is_space(s.back())) { s.remove_suffix(1); }
  return s;
}

std::optional<string_token> scan_string_at(std::string_view content, std::size_t pos) {
  if (pos >= content.size()) { return std::nullopt; }

  std::size_t p{ pos };
  while (p < content.size() && p - pos < 2 && is_string_prefix_char(content[p])) { ++p; }
  if (p >= content.size() || (content[p] != '"' && content[p] != '\'')) {
    return std::nullopt;
  }
  if (p > pos && pos > 0 && scan_is_identifier_char(content[pos - 1])) {
    return std::nullopt;  // tail of a longer identifier
  }

  char const quote{ content[p] };
  bool const triple{ p + 2 < content.size() && content[p + 1] == quote &&
                     content[p + 2] == quote };

  string_token tok{ .begin = pos,
                    .end = content.size(),
                    .body_begin = p + (triple ? 3 : 1),
                    .body_end = content.size(),
                    .prefix = content.substr(pos, p - pos),
                    .quote = quote,
                    .triple = triple,
                    .terminated = false };

  for (std::size_t i{ tok.body_begin }; i < content.size();) {
    char const c{ content[i] };
    if (c == '\\') {
      i += 2;
      continue;
    }
    if (triple) {
      if (c == quote && i + 2 < content.size() && content[i + 1] == quote &&
          content[i + 2] == quote) {
        tok.body_end = i;
        tok.end = i + 3;
        tok.terminated = true;
        return tok;
      }
    } else if (c == quote) {
      tok.body_end = i;
      tok.end = i + 1;
      tok.terminated = true;
      return tok;
    } else if (c == '\n') {
      tok.body_end = i;
      tok.end = i;
      return tok;
    }
    ++i;
  }

  return tok;
}

std::optional<std::size_t> scan_find_closing(std::string_view content, std::size_t open) {
  if (open >= content.size() || !is_open_bracket(content[open])) { return std::nullopt; }

  std::vector<char> expected{ closer_for(content[open]) };

  for (std::size_t i{ open + 1 }; i < content.size();) {
    char const c{ content[i] };

    if (c == '"' || c == '\'' || is_string_prefix_char(c)) {
      if (auto const tok{ scan_string_at(content, i) }) {
        if (!tok->terminated) { return std::nullopt; }
        i = tok->end;
        continue;
      }
    }

    if (auto const next{ skip_opaque(content, i) }) {
      i = *next;
      continue;
    }

    if (is_open_bracket(c)) {
      expected.push_back(closer_for(c));
    } else if (is_close_bracket(c)) {
      if (c != expected.back()) { return std::nullopt; }
      expected.pop_back();
      if (expected.empty()) { return i; }
    }
    ++i;
  }

  return std::nullopt;
}

std::size_t scan_find_top_level(std::string_view text, char sep, std::size_t from) {
  int depth{ 0 };
  for (std::size_t i{ from }; i < text.size();) {
    char const c{ text[i] };
    if (depth == 0 && c == sep) { return i; }

    if (auto const next{ skip_opaque(text, i) }) {
      i = *next;
      continue;
    }

    if (is_open_bracket(c)) {
      ++depth;
    } else if (is_close_bracket(c) && depth > 0) {
      --depth;
    }
    ++i;
  }
  return std::string_view::npos;
}

std::vector<std::string_view> scan_split_top_level(std::string_view text, char sep) {
  std::vector<std::string_view> pieces;
  std::size_t start{ 0 };

  while (true) {
    auto const pos{ scan_find_top_level(text, sep, start) };
    if (pos == std::string_view::npos) {
      auto const last{ scan_trim(text.substr(start)) };
      if (!last.empty()) { pieces.push_back(last); }
      break;
    }
    pieces.push_back(scan_trim(text.substr(start, pos - start)));
    start = pos + 1;
  }

  return pieces;
}

std::string scan_strip_comments(std::string_view text) {
  std::string result;
  result.reserve(text.size());

  for (std::size_t i{ 0 }; i < text.size();) {
    char const c{ text[i] };
    if (c == '#') {
      i = skip_comment(text, i);
      continue;
    }
    if (c == '"' || c == '\'' || is_string_prefix_char(c)) {
      if (auto const tok{ scan_string_at(text, i) }) {
        result.append(text.substr(tok->begin, tok->end - tok->begin));
        i = tok->end;
        continue;
      }
    }
    if (scan_is_identifier_start(c)) {
      auto const end{ skip_identifier(text, i) };
      result.append(text.substr(i, end - i));
      i = end;
      continue;
    }
    result.push_back(c);
    ++i;
  }

  return result;
}

std::vector<logical_line> scan_logical_lines(std::string_view content) {
  std::vector<logical_line> lines;
  std::size_t line_number{ 1 };
  std::size_t i{ 0 };

  while (i < content.size()) {
    std::size_t indent{ 0 };
    while (i < content.size() &&
           (content[i] == ' ' || content[i] == '\t' || content[i] == '\f' ||
            content[i] == '\r')) {
      if (content[i] == ' ') { ++indent; }
      if (content[i] == '\t') { indent = (indent / 8 + 1) * 8; }
      ++i;
    }
    if (i >= content.size()) { break; }

    if (content[i] == '\n') {
      ++line_number;
      ++i;
      continue;
    }
    if (content[i] == '#') {
      i = skip_comment(content, i);
      continue;
    }

    logical_line line{ .offset = i,
                       .end = content.size(),
                       .line_number = line_number,
                       .indent = indent,
                       .text = {} };
    int depth{ 0 };

    while (i < content.size()) {
      char const c{ content[i] };

      if (c == '\n') {
        if (depth == 0) { break; }
        line.text.push_back(' ');
        ++line_number;
        ++i;
        continue;
      }

      if (c == '\\') {
        std::size_t next{ i + 1 };
        if (next < content.size() && content[next] == '\r') { ++next; }
        if (next < content.size() && content[next] == '\n') {
          line.text.push_back(' ');
          ++line_number;
          i = next + 1;
          continue;
        }
      }

      if (c == '#') {
        i = skip_comment(content, i);
        continue;
      }

      if (c == '"' || c == '\'' || is_string_prefix_char(c)) {
        if (auto const tok{ scan_string_at(content, i) }) {
          auto const raw{ content.substr(tok->begin, tok->end - tok->begin) };
          line.text.append(raw);
          line_number += static_cast<std::size_t>(std::count(raw.begin(), raw.end(), '\n'));
          i = tok->end;
          continue;
        }
      }

      if (scan_is_identifier_start(c)) {
        auto const end{ skip_identifier(content, i) };
        line.text.append(content.substr(i, end - i));
        i = end;
        continue;
      }

      if (is_open_bracket(c)) {
        ++depth;
      } else if (is_close_bracket(c) && depth > 0) {
        --depth;
      }
      if (c != '\r') { line.text.push_back(c); }
      ++i;
    }

    line.end = i;
    line.text = std::string{ scan_trim(line.text) };
    if (!line.text.empty()) { lines.push_back(std::move(line)); }
  }

  return lines;
}

std::size_t scan_line_number(std::string_view content, std::size_t pos) {
  pos = std::min(pos, content.size());
  return 1 + static_cast<std::size_t>(
                 std::count(content.begin(), content.begin() + static_cast<long>(pos), '\n'));
}

}  // namespace scout
