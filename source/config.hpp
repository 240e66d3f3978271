#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "entry.hpp"

namespace adx
{

enum class sort_order : std::uint8_t
{
  alphabetical,
  random,
};

struct scan_root
{
  std::filesystem::path path;
  entry_origin origin = entry_origin::extra_path;
};

struct config
{
  // UI-only, handed to the presentation layer untouched.
  std::uint16_t search_icon_size = 18;
  std::uint16_t program_icon_size = 42;

  std::size_t max_results = 10;
  std::vector<std::filesystem::path> extra_index_paths;
  std::vector<std::filesystem::path> exclude_paths;
  sort_order initial_sort = sort_order::alphabetical;
  bool enable_cache = true;

  std::filesystem::path cache_dir;
  bool include_default_roots = true;
  std::vector<std::string> skip_name_patterns {
      "uninstall", "uninst", "update", "updater", "setup"};
  std::string log_level = "info";
};

// Missing file yields defaults; a malformed one is logged and yields defaults.
auto load_config(const std::filesystem::path& path) -> config;

auto parse_config(std::string_view json_text) -> config;

auto default_cache_dir() -> std::filesystem::path;

// Start Menu and Program Files locations of the running platform.
auto default_scan_roots() -> std::vector<scan_root>;

// Default roots (when enabled) followed by extra_index_paths.
auto scan_roots(const config& cfg) -> std::vector<scan_root>;

}  // namespace adx
