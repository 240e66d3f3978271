#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace adx
{

// Code points of a UTF-8 string. A byte that does not start a well-formed
// sequence decodes to U+DC80 + byte, which no well-formed text contains, so
// stray bytes never compare equal to real characters.
auto decode_utf8(std::string_view text) -> std::u32string;

// Inverse of decode_utf8: escaped bytes are written back unchanged.
auto encode_utf8(std::u32string_view text) -> std::string;

auto is_valid_utf8(std::string_view text) -> bool;

// Simple case folding for Latin, Greek, Cyrillic, Armenian, Georgian and
// fullwidth Latin. Other code points are returned unchanged.
auto fold_case(char32_t code) -> char32_t;
auto upper_case(char32_t code) -> char32_t;

auto is_space(char32_t code) -> bool;

// Letters and digits of any script; punctuation, symbols, marks and escaped
// bytes are not.
auto is_alnum(char32_t code) -> bool;

// Case-folded copy of a UTF-8 string.
auto to_lower(std::string_view text) -> std::string;

// Case-folds, collapses whitespace runs into one space and trims both ends.
auto normalize_name(std::string_view text) -> std::string;

auto contains_ignore_case(std::string_view haystack, std::string_view needle)
    -> bool;

auto split(std::string_view text, char delimiter) -> std::vector<std::string>;

// 64-bit FNV-1a. Stable across runs and platforms, unlike std::hash.
auto fnv1a(std::string_view data, std::uint64_t seed = 0xcbf29ce484222325ULL)
    -> std::uint64_t;

auto to_hex(std::uint64_t value) -> std::string;

auto bytes_to_hex(std::string_view bytes) -> std::string;

// Throws std::invalid_argument on odd length or non-hex digits.
auto hex_to_bytes(std::string_view digits) -> std::string;

}  // namespace adx
