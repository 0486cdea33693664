#pragma once

// Lexical helpers for the subset of Python that registration files use.
// Everything here works on byte offsets into the original file content so that
// diagnostics can point back at the source.

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scout {

struct string_token {
  std::size_t begin;       // first prefix character or opening quote
  std::size_t end;         // one past the closing quote
  std::size_t body_begin;  // first character inside the quotes
  std::size_t body_end;    // closing quote position
  std::string_view prefix;
  char quote;
  bool triple;
  bool terminated;
};

// Statement-level line with continuations joined. Blank and comment-only lines are
// never produced.
struct logical_line {
  std::size_t offset;       // first non-blank character
  std::size_t end;          // terminating newline (or content size)
  std::size_t line_number;  // 1-based physical line of `offset`
  std::size_t indent;       // columns of leading whitespace, tabs to multiples of 8
  std::string text;         // comments removed; continuation breaks collapsed to a space
};

bool scan_is_identifier_start(char c);
bool scan_is_identifier_char(char c);
bool scan_is_identifier(std::string_view s);
bool scan_is_dotted_name(std::string_view s);

std::string_view scan_trim(std::string_view s);

// Recognize a string literal starting at `pos`, including r/b/u/f prefixes (up to two
// letters) and triple quotes. An unterminated single-quoted literal ends at the newline,
// an unterminated triple-quoted literal at the end of content.
std::optional<string_token> scan_string_at(std::string_view content, std::size_t pos);

// `content[open]` must be one of ( [ {. Returns the index of the matching closer,
// skipping string literals and comments. nullopt when unbalanced or mismatched.
std::optional<std::size_t> scan_find_closing(std::string_view content, std::size_t open);

// Index of the first `sep` outside brackets, strings and comments; npos if none.
std::size_t scan_find_top_level(std::string_view text, char sep, std::size_t from = 0);

// Split on top-level `sep`. Pieces are trimmed; a trailing empty piece (trailing
// separator) is dropped, interior empty pieces are kept.
std::vector<std::string_view> scan_split_top_level(std::string_view text, char sep);

// Remove `#` comments outside string literals. Line breaks are preserved.
std::string scan_strip_comments(std::string_view text);

std::vector<logical_line> scan_logical_lines(std::string_view content);

// 1-based line number of byte offset `pos`.
std::size_t scan_line_number(std::string_view content, std::size_t pos);

}  // namespace scout
