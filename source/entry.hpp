#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace adx
{

// Where an entry was found. Closed set; lower rank wins on collision.
enum class entry_origin : std::uint8_t
{
  start_menu,
  program_files,
  extra_path,
};

constexpr auto origin_rank(entry_origin origin) -> int
{
  return static_cast<int>(origin);
}

constexpr auto outranks(entry_origin lhs, entry_origin rhs) -> bool
{
  return origin_rank(lhs) < origin_rank(rhs);
}

auto to_string(entry_origin origin) -> std::string_view;
auto origin_from_string(std::string_view text) -> std::optional<entry_origin>;

// An image extracted from the program, owned by the icon resolver's cache.
struct bitmap_icon
{
  std::filesystem::path path;

  auto operator==(const bitmap_icon& other) const -> bool
  {
    return path == other.path;
  }
};

// Letter on a colored tile, fully determined by the entry name.
struct placeholder_icon
{
  std::string letter = "?";  // one code point, UTF-8
  std::uint32_t color = 0;  // 0xRRGGBB

  auto operator==(const placeholder_icon& other) const -> bool
  {
    return letter == other.letter && color == other.color;
  }
};

using icon_reference = std::variant<placeholder_icon, bitmap_icon>;

struct entry
{
  std::string name;
  std::string normalized_name;
  std::filesystem::path launch_target;
  entry_origin origin = entry_origin::extra_path;
  // The shortcut or executable discovery found on disk.
  std::filesystem::path source_path;
  // Icon hint carried by shortcut metadata, may be empty.
  std::string icon_name;
  icon_reference icon;
};

auto make_entry(std::string name,
                std::filesystem::path launch_target,
                entry_origin origin,
                std::filesystem::path source_path = {},
                std::string icon_name = {}) -> entry;

}  // namespace adx
