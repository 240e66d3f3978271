#include <algorithm>
#include <chrono>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "discovery.hpp"

#include <spdlog/spdlog.h>

#include "text.hpp"

namespace adx
{

namespace fs = std::filesystem;

namespace
{

auto components(const fs::path& path) -> std::vector<fs::path>
{
  std::vector<fs::path> parts;
  for (const auto& part : path.lexically_normal()) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

// Exclude rules are matched against both spellings of a path.
auto expand_excludes(const std::vector<fs::path>& exclude_paths)
    -> std::vector<fs::path>
{
  std::vector<fs::path> expanded;
  for (const auto& path : exclude_paths) {
    expanded.push_back(path);
    std::error_code error;
    auto canonical = fs::weakly_canonical(path, error);
    if (!error && canonical != path) {
      expanded.push_back(std::move(canonical));
    }
  }
  return expanded;
}

enum class file_kind
{
  other,
  shortcut,
  executable,
};

auto classify(const fs::directory_entry& item) -> file_kind
{
  const auto extension = to_lower(item.path().extension().u8string());
  if (extension == ".lnk" || extension == ".desktop") {
    return file_kind::shortcut;
  }
  if (extension == ".exe" || extension == ".appimage") {
    return file_kind::executable;
  }
#ifndef _WIN32
  if (extension.empty() && is_executable_file(item.path())) {
    return file_kind::executable;
  }
#endif
  return file_kind::other;
}

auto matches_any(std::string_view name, const std::vector<std::string>& patterns)
    -> bool
{
  return std::any_of(patterns.begin(),
                     patterns.end(),
                     [&](const std::string& pattern)
                     { return contains_ignore_case(name, pattern); });
}

}  // namespace

auto is_excluded(const fs::path& path, const std::vector<fs::path>& exclude_paths)
    -> bool
{
  const auto path_parts = components(path);
  return std::any_of(exclude_paths.begin(),
                     exclude_paths.end(),
                     [&](const fs::path& prefix)
                     {
                       const auto prefix_parts = components(prefix);
                       if (prefix_parts.empty()
                           || prefix_parts.size() > path_parts.size())
                       {
                         return false;
                       }
                       return std::equal(prefix_parts.begin(),
                                         prefix_parts.end(),
                                         path_parts.begin());
                     });
}

void walk_tree(const fs::path& root,
               const std::vector<fs::path>& exclude_paths,
               const directory_visitor& on_directory,
               const file_visitor& on_file,
               std::vector<discovery_warning>& warnings)
{
  const auto excludes = expand_excludes(exclude_paths);
  std::unordered_set<std::string> visited;
  std::vector<fs::path> pending {root};

  while (!pending.empty()) {
    const auto dir = std::move(pending.back());
    pending.pop_back();
    if (is_excluded(dir, excludes)) {
      continue;
    }

    std::error_code error;
    const auto canonical = fs::canonical(dir, error);
    if (error) {
      warnings.push_back({dir, error.message()});
      continue;
    }
    if (is_excluded(canonical, excludes)) {
      continue;
    }
    if (!visited.insert(canonical.u8string()).second) {
      warnings.push_back({dir, "directory already visited, symlink loop?"});
      continue;
    }

    fs::directory_iterator iter {dir, error};
    if (error) {
      warnings.push_back({dir, error.message()});
      continue;
    }
    if (on_directory) {
      on_directory(dir);
    }
    for (; iter != fs::directory_iterator {}; iter.increment(error)) {
      if (error) {
        break;
      }
      const auto& item = *iter;
      std::error_code type_error;
      if (item.is_directory(type_error)) {
        pending.push_back(item.path());
      } else if (item.is_regular_file(type_error) && on_file) {
        on_file(item);
      }
    }
    if (error) {
      warnings.push_back({dir, error.message()});
    }
  }
}

auto collapse_duplicates(std::vector<entry> entries) -> std::vector<entry>
{
  auto better = [](const entry& lhs, const entry& rhs)
  {
    return std::forward_as_tuple(origin_rank(lhs.origin), lhs.name, lhs.source_path)
        < std::forward_as_tuple(origin_rank(rhs.origin), rhs.name, rhs.source_path);
  };

  std::unordered_map<std::string, size_t> by_target;
  std::vector<entry> unique;
  unique.reserve(entries.size());
  for (auto& item : entries) {
    const auto [iter, inserted] =
        by_target.try_emplace(item.launch_target.u8string(), unique.size());
    if (inserted) {
      unique.push_back(std::move(item));
    } else if (better(item, unique[iter->second])) {
      unique[iter->second] = std::move(item);
    }
  }

  std::sort(unique.begin(),
            unique.end(),
            [](const entry& lhs, const entry& rhs)
            { return lhs.launch_target < rhs.launch_target; });
  return unique;
}

auto discover(const std::vector<scan_root>& roots,
              const discovery_options& options,
              const shortcut_resolver& resolver) -> discovery_report
{
  const auto start = std::chrono::steady_clock::now();
  discovery_report report;
  std::vector<entry> found;

  for (const auto& root : roots) {
    const auto before = found.size();
    auto on_file = [&](const fs::directory_entry& item)
    {
      const auto& path = item.path();
      const auto stem = path.stem().u8string();
      if (stem.empty() || path.filename().u8string().front() == '.'
          || matches_any(stem, options.skip_name_patterns))
      {
        return;
      }

      switch (classify(item)) {
        case file_kind::shortcut: {
          auto target = resolver.resolve(path);
          if (!target) {
            report.warnings.push_back({path, "shortcut target unresolved"});
            return;
          }
          auto name =
              target->display_name.empty() ? stem : target->display_name;
          found.push_back(make_entry(std::move(name),
                                     std::move(target->target),
                                     root.origin,
                                     path,
                                     std::move(target->icon_name)));
          break;
        }
        case file_kind::executable: {
          std::error_code error;
          auto target = fs::weakly_canonical(path, error);
          found.push_back(
              make_entry(stem, error ? path : target, root.origin, path));
          break;
        }
        case file_kind::other:
          break;
      }
    };
    walk_tree(root.path, options.exclude_paths, {}, on_file, report.warnings);
    spdlog::debug("discovery: {} ({}) yielded {} candidates",
                  root.path.u8string(),
                  to_string(root.origin),
                  found.size() - before);
  }

  for (const auto& warning : report.warnings) {
    spdlog::debug("discovery: skipped {}: {}",
                  warning.path.u8string(),
                  warning.message);
  }

  const auto candidates = found.size();
  report.entries = collapse_duplicates(std::move(found));
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  spdlog::info(
      "discovery: {} entries from {} candidates in {} roots, {} warnings, {} ms",
      report.entries.size(),
      candidates,
      roots.size(),
      report.warnings.size(),
      elapsed.count());
  return report;
}

}  // namespace adx
