#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "config.hpp"
#include "entry.hpp"
#include "shortcut.hpp"

namespace adx
{

struct discovery_warning
{
  std::filesystem::path path;
  std::string message;
};

struct discovery_report
{
  std::vector<entry> entries;
  std::vector<discovery_warning> warnings;
};

struct discovery_options
{
  std::vector<std::filesystem::path> exclude_paths;
  std::vector<std::string> skip_name_patterns;
};

// True when path equals one of the prefixes or lies beneath it, comparing
// whole path components.
auto is_excluded(const std::filesystem::path& path,
                 const std::vector<std::filesystem::path>& exclude_paths)
    -> bool;

using directory_visitor = std::function<void(const std::filesystem::path&)>;
using file_visitor =
    std::function<void(const std::filesystem::directory_entry&)>;

// Depth-first walk below root following directory symlinks. Excluded
// subtrees are pruned and each canonical directory is entered once, which
// breaks symlink loops. Unreadable directories become warnings.
void walk_tree(const std::filesystem::path& root,
               const std::vector<std::filesystem::path>& exclude_paths,
               const directory_visitor& on_directory,
               const file_visitor& on_file,
               std::vector<discovery_warning>& warnings);

// Keeps one entry per launch_target: the highest-priority origin, then the
// smaller name, then the smaller source path. Sorted by launch_target.
auto collapse_duplicates(std::vector<entry> entries) -> std::vector<entry>;

auto discover(const std::vector<scan_root>& roots,
              const discovery_options& options,
              const shortcut_resolver& resolver) -> discovery_report;

}  // namespace adx
