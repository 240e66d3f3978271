#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "entry.hpp"

namespace adx
{

inline constexpr int cache_schema_version = 1;

struct fingerprint
{
  std::uint64_t digest = 0;
  std::size_t directory_count = 0;

  auto operator==(const fingerprint& other) const -> bool
  {
    return digest == other.digest && directory_count == other.directory_count;
  }

  auto operator!=(const fingerprint& other) const -> bool
  {
    return !(*this == other);
  }
};

// Summarizes the configuration and the modification times of every directory
// a discovery pass over roots would enter.
auto compute_fingerprint(const std::vector<scan_root>& roots,
                         const std::vector<std::filesystem::path>& exclude_paths,
                         const std::vector<std::string>& skip_name_patterns)
    -> fingerprint;

auto compute_fingerprint(const config& cfg) -> fingerprint;

struct index_cache_record
{
  fingerprint stamp;
  std::vector<entry> entries;
};

class index_cache
{
public:
  explicit index_cache(std::filesystem::path file);

  // Nothing when the record is absent, unreadable, corrupt, written with
  // another schema, or stamped with a different fingerprint.
  auto load(const fingerprint& current) const
      -> std::optional<index_cache_record>;

  // Atomically replaces the record. Returns false when writing failed.
  auto save(const std::vector<entry>& entries, const fingerprint& stamp) const
      -> bool;

  auto file() const -> const std::filesystem::path& { return m_file; }

private:
  std::filesystem::path m_file;
};

}  // namespace adx
