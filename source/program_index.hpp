#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "config.hpp"
#include "entry.hpp"

namespace adx
{

// Immutable catalog of entries, kept in display order: case-insensitive by
// name, or a permutation fixed by the seed it was built with.
class program_index
{
public:
  program_index() = default;
  program_index(std::vector<entry> entries,
                sort_order order,
                std::uint64_t seed = 0);

  auto entries() const -> const std::vector<entry>& { return m_entries; }
  auto size() const -> std::size_t { return m_entries.size(); }
  auto empty() const -> bool { return m_entries.empty(); }
  auto order() const -> sort_order { return m_order; }
  auto seed() const -> std::uint64_t { return m_seed; }

private:
  std::vector<entry> m_entries;
  sort_order m_order = sort_order::alphabetical;
  std::uint64_t m_seed = 0;
};

using index_snapshot = std::shared_ptr<const program_index>;

// Holds the published snapshot. Rebuilds hand over a finished index in one
// swap; readers keep whatever snapshot they obtained alive on their own.
class index_publisher
{
public:
  index_publisher();

  auto current() const -> index_snapshot;
  void publish(index_snapshot next);
  auto generation() const -> std::uint64_t;

private:
  mutable std::mutex m_mutex;
  index_snapshot m_current;
  std::uint64_t m_generation = 0;
};

// Fresh seed for a random display order, different on every build.
auto random_seed() -> std::uint64_t;

}  // namespace adx
