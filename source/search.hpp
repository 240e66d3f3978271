#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "entry.hpp"
#include "program_index.hpp"

namespace adx
{

struct search_hit
{
  const entry* item = nullptr;
  double score = 0.0;
};

// Hits point into snapshot, which the result keeps alive.
struct search_result
{
  index_snapshot snapshot;
  std::vector<search_hit> hits;
};

// Each bonus outweighs every combination of the ones below it.
inline constexpr double prefix_bonus = 1000.0;
inline constexpr double contiguity_weight = 40.0;
inline constexpr double start_menu_bonus = 30.0;
inline constexpr double max_length_penalty = 25.0;

// Nothing unless normalized_query is a subsequence of the entry's normalized
// name. An empty query matches everything with score 0.
auto score_entry(std::string_view normalized_query, const entry& item)
    -> std::optional<double>;

// Total order of ranked hits: score descending, then normalized name, then
// launch target.
auto ranks_before(const search_hit& lhs, const search_hit& rhs) -> bool;

class searcher
{
public:
  explicit searcher(index_snapshot index);

  // Ranks the whole index, then keeps the first max_results hits.
  auto search(std::string_view query, std::size_t max_results) const
      -> search_result;

  // Display order of the index.
  auto list_all(std::size_t max_results) const -> search_result;

private:
  index_snapshot m_index;
};

// Orders concurrent queries: once a newer sequence number is admitted, older
// ones are reported stale and their results must be dropped.
class query_gate
{
public:
  // Server-assigned sequence number.
  auto open() -> std::uint64_t;

  // Client-assigned sequence number; false if a newer one was admitted.
  auto admit(std::uint64_t sequence) -> bool;

  auto is_current(std::uint64_t sequence) const -> bool;

private:
  std::atomic<std::uint64_t> m_latest {0};
};

}  // namespace adx
