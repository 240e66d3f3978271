#include <algorithm>
#include <random>
#include <tuple>
#include <utility>

#include "program_index.hpp"

#include "text.hpp"

namespace adx
{

program_index::program_index(std::vector<entry> entries,
                             sort_order order,
                             std::uint64_t seed)
    : m_entries(std::move(entries))
    , m_order(order)
    , m_seed(seed)
{
  if (m_order == sort_order::alphabetical) {
    std::vector<std::pair<std::string, size_t>> keys;
    keys.reserve(m_entries.size());
    for (size_t i = 0; i < m_entries.size(); ++i) {
      keys.emplace_back(to_lower(m_entries[i].name), i);
    }
    std::sort(keys.begin(),
              keys.end(),
              [&](const auto& lhs, const auto& rhs)
              {
                const auto& left = m_entries[lhs.second];
                const auto& right = m_entries[rhs.second];
                return std::tie(lhs.first, left.name, left.launch_target)
                    < std::tie(rhs.first, right.name, right.launch_target);
              });
    std::vector<entry> sorted;
    sorted.reserve(m_entries.size());
    for (const auto& key : keys) {
      sorted.push_back(std::move(m_entries[key.second]));
    }
    m_entries = std::move(sorted);
    return;
  }

  // Start from a canonical order so the seed alone decides the permutation.
  std::sort(m_entries.begin(),
            m_entries.end(),
            [](const entry& lhs, const entry& rhs)
            { return lhs.launch_target < rhs.launch_target; });
  std::mt19937_64 engine {m_seed};
  std::shuffle(m_entries.begin(), m_entries.end(), engine);
}

index_publisher::index_publisher()
    : m_current(std::make_shared<const program_index>())
{
}

auto index_publisher::current() const -> index_snapshot
{
  const std::scoped_lock lock {m_mutex};
  return m_current;
}

void index_publisher::publish(index_snapshot next)
{
  if (!next) {
    return;
  }
  const std::scoped_lock lock {m_mutex};
  m_current = std::move(next);
  ++m_generation;
}

auto index_publisher::generation() const -> std::uint64_t
{
  const std::scoped_lock lock {m_mutex};
  return m_generation;
}

auto random_seed() -> std::uint64_t
{
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32U) ^ device();
}

}  // namespace adx
