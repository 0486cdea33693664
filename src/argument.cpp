#include "argument.h"

#include "discovery_error.h"
#include "source_scan.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <functional>
#include <set>
#include <string>

namespace scout {

namespace {

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::optional<std::uint32_t> parse_hex(std::string_view digits) {
  std::uint32_t value{ 0 };
  auto const [ptr, ec]{ std::from_chars(digits.data(), digits.data() + digits.size(), value, 16) };
  if (ec != std::errc{} || ptr != digits.data() + digits.size()) { return std::nullopt; }
  return value;
}

std::optional<argument_value> classify_string(std::string_view text) {
  auto const tok{ scan_string_at(text, 0) };
  if (!tok) { return std::nullopt; }

  if (!tok->terminated || tok->end != text.size()) {
    return unsupported_value{ std::string{ text } };  // implicit concatenation or junk
  }

  bool raw{ false };
  for (char const c : tok->prefix) {
    char const lower{ static_cast<char>(std::tolower(static_cast<unsigned char>(c))) };
    if (lower == 'f' || lower == 'b') { return unsupported_value{ std::string{ text } }; }
    if (lower == 'r') { raw = true; }
  }

  auto const body{ text.substr(tok->body_begin, tok->body_end - tok->body_begin) };
  if (raw) { return string_literal{ std::string{ body } }; }

  auto decoded{ argument_decode_escapes(body) };
  if (!decoded) { return unsupported_value{ std::string{ text } }; }
  return string_literal{ std::move(*decoded) };
}

std::optional<argument_value> classify_number(std::string_view text) {
  std::string digits;
  digits.reserve(text.size());
  for (size_t i{ 0 }; i < text.size(); ++i) {
    char const c{ text[i] };
    if (c == '_') {  // PEP 515 separators sit between digits only
      if (i == 0 || i + 1 == text.size() || !std::isdigit(static_cast<unsigned char>(text[i - 1])) ||
          !std::isdigit(static_cast<unsigned char>(text[i + 1]))) {
        return std::nullopt;
      }
      continue;
    }
    digits.push_back(c);
  }

  std::string_view number{ digits };
  if (!number.empty() && number.front() == '+') { number.remove_prefix(1); }
  auto const unsigned_part{ number.starts_with('-') ? number.substr(1) : number };
  if (unsigned_part.empty() || unsigned_part.front() == '+' || unsigned_part.front() == '-') {
    return std::nullopt;
  }

  bool const is_int{ std::all_of(unsigned_part.begin(), unsigned_part.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c));
  }) };

  if (is_int) {
    if (unsigned_part.size() > 1 && unsigned_part.front() == '0' &&
        unsigned_part.find_first_not_of('0') != std::string_view::npos) {
      return std::nullopt;  // "007" is a syntax error in Python 3
    }
    std::int64_t value{ 0 };
    auto const [ptr, ec]{ std::from_chars(number.data(), number.data() + number.size(), value) };
    if (ec != std::errc{} || ptr != number.data() + number.size()) {
      return unsupported_value{ std::string{ text } };  // outside 64-bit range
    }
    return integer_literal{ value };
  }

  bool const float_chars{ std::all_of(unsigned_part.begin(), unsigned_part.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == 'e' || c == 'E' ||
           c == '+' || c == '-';
  }) };
  if (!float_chars ||
      (!std::isdigit(static_cast<unsigned char>(unsigned_part.back())) &&
       unsigned_part.back() != '.') ||
      (!std::isdigit(static_cast<unsigned char>(unsigned_part.front())) &&
       unsigned_part.front() != '.')) {
    return std::nullopt;
  }

  double value{ 0 };
  auto const [ptr, ec]{ std::from_chars(number.data(), number.data() + number.size(), value) };
  if (ec != std::errc{} || ptr != number.data() + number.size()) { return std::nullopt; }
  return float_literal{ value };
}

std::optional<argument_value> classify_name(std::string_view text) {
  if (text == "True") { return bool_literal{ true }; }
  if (text == "False") { return bool_literal{ false }; }
  if (text == "None") { return none_literal{}; }

  if (scan_is_identifier(text)) { return bare_identifier{ std::string{ text } }; }
  if (!scan_is_dotted_name(text)) { return std::nullopt; }

  attribute_access access;
  size_t start{ 0 };
  for (size_t dot{ text.find('.') };; dot = text.find('.', start)) {
    auto const part{ text.substr(start, dot == std::string_view::npos ? text.npos : dot - start) };
    if (access.base.empty()) {
      access.base = std::string{ part };
    } else {
      access.chain.emplace_back(part);
    }
    if (dot == std::string_view::npos) { break; }
    start = dot + 1;
  }
  return access;
}

bool starts_with_keyword_name(std::string_view piece, std::string_view &name,
                              std::string_view &value) {
  size_t end{ 0 };
  if (piece.empty() || !scan_is_identifier_start(piece.front())) { return false; }
  while (end < piece.size() && scan_is_identifier_char(piece[end])) { ++end; }

  size_t eq{ end };
  while (eq < piece.size() && std::isspace(static_cast<unsigned char>(piece[eq]))) { ++eq; }
  if (eq >= piece.size() || piece[eq] != '=') { return false; }
  if (eq + 1 < piece.size() && piece[eq + 1] == '=') { return false; }

  name = piece.substr(0, end);
  value = scan_trim(piece.substr(eq + 1));
  return true;
}

}  // namespace

std::optional<std::string> argument_decode_escapes(std::string_view body) {
  std::string out;
  out.reserve(body.size());

  for (size_t i{ 0 }; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 >= body.size()) {
      out.push_back(body[i]);
      continue;
    }

    char const e{ body[++i] };
    switch (e) {
      case '\n': break;
      case '\\': out.push_back('\\'); break;
      case '\'': out.push_back('\''); break;
      case '"': out.push_back('"'); break;
      case 'a': out.push_back('\a'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'v': out.push_back('\v'); break;
      case 'x':
      case 'u':
      case 'U': {
        size_t const width{ e == 'x' ? 2u : e == 'u' ? 4u : 8u };
        if (i + width >= body.size()) { return std::nullopt; }
        auto const cp{ parse_hex(body.substr(i + 1, width)) };
        if (!cp || *cp > 0x10FFFF) { return std::nullopt; }
        append_utf8(out, *cp);
        i += width;
        break;
      }
      case 'N': return std::nullopt;  // named escapes need the unicode database
      default:
        if (e >= '0' && e <= '7') {
          std::uint32_t cp{ 0 };
          size_t n{ 0 };
          for (; n < 3 && i + n < body.size() && body[i + n] >= '0' && body[i + n] <= '7'; ++n) {
            cp = cp * 8 + static_cast<std::uint32_t>(body[i + n] - '0');
          }
          append_utf8(out, cp);
          i += n - 1;
        } else {
          out.push_back('\\');  // unknown escapes are kept verbatim
          out.push_back(e);
        }
    }
  }
  return out;
}

argument_value argument_classify(std::string_view text) {
  text = scan_trim(text);

  if (!text.empty() && text.front() == '(') {
    if (auto const close{ scan_find_closing(text, 0) }; close && *close == text.size() - 1) {
      auto const inner{ scan_trim(text.substr(1, text.size() - 2)) };
      if (!inner.empty() && scan_find_top_level(inner, ',') == std::string_view::npos) {
        return argument_classify(inner);
      }
    }
    return unsupported_value{ std::string{ text } };
  }

  if (auto str{ classify_string(text) }) { return std::move(*str); }
  if (auto name{ classify_name(text) }) { return std::move(*name); }
  if (auto num{ classify_number(text) }) { return std::move(*num); }
  return unsupported_value{ std::string{ text } };
}

std::vector<argument> argument_parse(registration_site const &site) {
  auto const text{ scan_strip_comments(site.arguments) };
  auto const pieces{ scan_split_top_level(text, ',') };

  auto const malformed{ [&](std::string const &why) {
    return discovery_error(discovery_error_kind::MALFORMED_REGISTRATION_SITE,
                           site.constructor + " at line " + std::to_string(site.line_number) +
                               ": " + why);
  } };

  std::vector<argument> result;
  std::set<std::string, std::less<>> seen;

  for (auto const piece : pieces) {
    if (piece.empty()) { throw malformed("empty argument"); }
    if (piece.front() == '*') {
      throw malformed("unpacked argument '" + std::string{ piece } + "'");
    }

    std::string_view name;
    std::string_view value;
    if (!starts_with_keyword_name(piece, name, value)) {
      throw malformed("positional argument '" + std::string{ piece } + "'");
    }
    if (value.empty()) { throw malformed("keyword '" + std::string{ name } + "' has no value"); }
    if (!seen.emplace(name).second) {
      throw malformed("duplicate keyword '" + std::string{ name } + "'");
    }

    result.push_back(argument{ .name = std::string{ name }, .value = argument_classify(value) });
  }

  return result;
}

}  // namespace scout
