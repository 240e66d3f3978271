#include <algorithm>
#include <array>
#include <stdexcept>

#include "text.hpp"

#include <fmt/format.h>

namespace adx
{

namespace
{

constexpr char32_t escape_base = 0xDC00;

// Upper-case code points [first, last] map to lower case by adding delta.
struct case_offset
{
  char32_t first;
  char32_t last;
  char32_t delta;
};

// Inclusive range; as a case table, alternating upper/lower pairs starting
// at first.
struct code_range
{
  char32_t first;
  char32_t last;
};

// NOLINTBEGIN(*magic-numbers*)
constexpr std::array<case_offset, 14> offsets {{
    {0x0041, 0x005A, 32},
    {0x00C0, 0x00D6, 32},
    {0x00D8, 0x00DE, 32},
    {0x0386, 0x0386, 38},
    {0x0388, 0x038A, 37},
    {0x038C, 0x038C, 64},
    {0x038E, 0x038F, 63},
    {0x0391, 0x03A1, 32},
    {0x03A3, 0x03AB, 32},
    {0x0400, 0x040F, 80},
    {0x0410, 0x042F, 32},
    {0x0531, 0x0556, 48},
    {0x10A0, 0x10C5, 7264},
    {0xFF21, 0xFF3A, 32},
}};

constexpr std::array<code_range, 15> pairs {{
    {0x0100, 0x012F},
    {0x0132, 0x0137},
    {0x0139, 0x0148},
    {0x014A, 0x0177},
    {0x0179, 0x017E},
    {0x01CD, 0x01DC},
    {0x01DE, 0x01EF},
    {0x01F8, 0x021F},
    {0x0222, 0x0233},
    {0x0460, 0x0481},
    {0x048A, 0x04BF},
    {0x04C1, 0x04CE},
    {0x04D0, 0x052F},
    {0x1E00, 0x1E95},
    {0x1EA0, 0x1EFF},
}};

// Blocks holding only punctuation, symbols, marks or private use.
constexpr std::array<code_range, 15> non_alnum {{
    {0x0080, 0x00BF},
    {0x00D7, 0x00D7},
    {0x00F7, 0x00F7},
    {0x02B0, 0x036F},
    {0x2000, 0x2BFF},
    {0x2E00, 0x2E7F},
    {0x3000, 0x303F},
    {0xD800, 0xF8FF},
    {0xFE00, 0xFE6F},
    {0xFF00, 0xFF0F},
    {0xFF1A, 0xFF20},
    {0xFF3B, 0xFF40},
    {0xFF5B, 0xFF65},
    {0xFFF0, 0xFFFF},
    {0x1F000, 0x1FAFF},
}};
// NOLINTEND(*magic-numbers*)

auto in(char32_t code, char32_t first, char32_t last) -> bool
{
  return code >= first && code <= last;
}

// Length of the well-formed sequence starting at text[pos], or 0.
auto sequence_length(std::string_view text, std::size_t pos) -> std::size_t
{
  const auto byte = [&](std::size_t offset)
  { return static_cast<unsigned char>(text[pos + offset]); };

  // NOLINTBEGIN(*magic-numbers*)
  const auto lead = byte(0);
  std::size_t length = 0;
  unsigned char low = 0x80;
  unsigned char high = 0xBF;
  if (lead < 0x80) {
    return 1;
  }
  if (in(lead, 0xC2, 0xDF)) {
    length = 2;
  } else if (in(lead, 0xE0, 0xEF)) {
    length = 3;
    low = lead == 0xE0 ? 0xA0 : low;
    high = lead == 0xED ? 0x9F : high;
  } else if (in(lead, 0xF0, 0xF4)) {
    length = 4;
    low = lead == 0xF0 ? 0x90 : low;
    high = lead == 0xF4 ? 0x8F : high;
  } else {
    return 0;
  }
  if (pos + length > text.size() || !in(byte(1), low, high)) {
    return 0;
  }
  for (std::size_t i = 2; i < length; ++i) {
    if (!in(byte(i), 0x80, 0xBF)) {
      return 0;
    }
  }
  // NOLINTEND(*magic-numbers*)
  return length;
}

void append_utf8(std::string& out, char32_t code)
{
  // NOLINTBEGIN(*magic-numbers*)
  if (in(code, escape_base + 0x80, escape_base + 0xFF)) {
    out.push_back(static_cast<char>(code - escape_base));
  } else if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
  // NOLINTEND(*magic-numbers*)
}

auto hex_digit(char chr) -> unsigned
{
  if (chr >= '0' && chr <= '9') {
    return static_cast<unsigned>(chr - '0');
  }
  if (chr >= 'a' && chr <= 'f') {
    return static_cast<unsigned>(chr - 'a' + 10);  // NOLINT(*magic-numbers*)
  }
  if (chr >= 'A' && chr <= 'F') {
    return static_cast<unsigned>(chr - 'A' + 10);  // NOLINT(*magic-numbers*)
  }
  throw std::invalid_argument {fmt::format("not a hex digit: '{}'", chr)};
}

}  // namespace

auto decode_utf8(std::string_view text) -> std::u32string
{
  std::u32string result;
  result.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto length = sequence_length(text, pos);
    const auto lead = static_cast<unsigned char>(text[pos]);
    if (length == 0) {
      result.push_back(escape_base + lead);
      ++pos;
      continue;
    }
    // NOLINTBEGIN(*magic-numbers*)
    char32_t code = length == 1 ? lead : lead & (0x7FU >> length);
    for (std::size_t i = 1; i < length; ++i) {
      code = (code << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3FU);
    }
    // NOLINTEND(*magic-numbers*)
    result.push_back(code);
    pos += length;
  }
  return result;
}

auto encode_utf8(std::u32string_view text) -> std::string
{
  std::string result;
  result.reserve(text.size());
  for (const auto code : text) {
    append_utf8(result, code);
  }
  return result;
}

auto is_valid_utf8(std::string_view text) -> bool
{
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto length = sequence_length(text, pos);
    if (length == 0) {
      return false;
    }
    pos += length;
  }
  return true;
}

auto fold_case(char32_t code) -> char32_t
{
  for (const auto& range : offsets) {
    if (in(code, range.first, range.last)) {
      return code + range.delta;
    }
  }
  for (const auto& range : pairs) {
    if (in(code, range.first, range.last)) {
      return (code - range.first) % 2 == 0 ? code + 1 : code;
    }
  }
  // NOLINTBEGIN(*magic-numbers*)
  switch (code) {
    case 0x0130:
      return U'i';
    case 0x0178:
      return 0x00FF;
    case 0x03C2:
      return 0x03C3;
    case 0x04C0:
      return 0x04CF;
    case 0x1E9E:
      return 0x00DF;
    default:
      return code;
  }
  // NOLINTEND(*magic-numbers*)
}

auto upper_case(char32_t code) -> char32_t
{
  for (const auto& range : offsets) {
    if (in(code, range.first + range.delta, range.last + range.delta)) {
      return code - range.delta;
    }
  }
  for (const auto& range : pairs) {
    if (in(code, range.first, range.last)) {
      return (code - range.first) % 2 == 1 ? code - 1 : code;
    }
  }
  // NOLINTBEGIN(*magic-numbers*)
  switch (code) {
    case 0x00FF:
      return 0x0178;
    case 0x0131:
      return U'I';
    case 0x03C2:
      return 0x03A3;
    case 0x04CF:
      return 0x04C0;
    default:
      return code;
  }
  // NOLINTEND(*magic-numbers*)
}

auto is_space(char32_t code) -> bool
{
  // NOLINTBEGIN(*magic-numbers*)
  return code == U' ' || in(code, 0x09, 0x0D) || code == 0x85 || code == 0xA0
      || code == 0x1680 || in(code, 0x2000, 0x200A) || code == 0x2028
      || code == 0x2029 || code == 0x202F || code == 0x205F || code == 0x3000;
  // NOLINTEND(*magic-numbers*)
}

auto is_alnum(char32_t code) -> bool
{
  // NOLINTNEXTLINE(*magic-numbers*)
  if (code < 0x80) {
    return in(code, U'0', U'9') || in(code, U'a', U'z') || in(code, U'A', U'Z');
  }
  return std::none_of(non_alnum.begin(),
                      non_alnum.end(),
                      [&](const code_range& block)
                      { return in(code, block.first, block.last); });
}

auto to_lower(std::string_view text) -> std::string
{
  auto codes = decode_utf8(text);
  std::transform(codes.begin(), codes.end(), codes.begin(), fold_case);
  return encode_utf8(codes);
}

auto normalize_name(std::string_view text) -> std::string
{
  std::u32string result;
  result.reserve(text.size());
  bool pending_space = false;
  for (const auto code : decode_utf8(text)) {
    if (is_space(code)) {
      pending_space = !result.empty();
      continue;
    }
    if (pending_space) {
      result.push_back(U' ');
      pending_space = false;
    }
    result.push_back(fold_case(code));
  }
  return encode_utf8(result);
}

auto contains_ignore_case(std::string_view haystack, std::string_view needle)
    -> bool
{
  if (needle.empty()) {
    return true;
  }
  const auto folded = decode_utf8(to_lower(haystack));
  return folded.find(decode_utf8(to_lower(needle))) != std::u32string::npos;
}

auto split(std::string_view text, char delimiter) -> std::vector<std::string>
{
  std::vector<std::string> parts;
  while (true) {
    const auto pos = text.find(delimiter);
    parts.emplace_back(text.substr(0, pos));
    if (pos == std::string_view::npos) {
      break;
    }
    text = text.substr(pos + 1);
  }
  return parts;
}

auto fnv1a(std::string_view data, std::uint64_t seed) -> std::uint64_t
{
  // NOLINTNEXTLINE(*magic-numbers*)
  constexpr std::uint64_t prime = 0x100000001b3ULL;
  auto hash = seed;
  for (const auto chr : data) {
    hash ^= static_cast<unsigned char>(chr);
    hash *= prime;
  }
  return hash;
}

auto to_hex(std::uint64_t value) -> std::string
{
  return fmt::format("{:016x}", value);
}

auto bytes_to_hex(std::string_view bytes) -> std::string
{
  std::string result;
  result.reserve(bytes.size() * 2);
  for (const auto chr : bytes) {
    result += fmt::format("{:02x}", static_cast<unsigned char>(chr));
  }
  return result;
}

auto hex_to_bytes(std::string_view digits) -> std::string
{
  if (digits.size() % 2 != 0) {
    throw std::invalid_argument {"hex string has odd length"};
  }
  std::string result;
  result.reserve(digits.size() / 2);
  for (std::size_t i = 0; i < digits.size(); i += 2) {
    // NOLINTNEXTLINE(*magic-numbers*)
    result.push_back(static_cast<char>(hex_digit(digits[i]) * 16 + hex_digit(digits[i + 1])));
  }
  return result;
}

}  // namespace adx
