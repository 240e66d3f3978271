#include <algorithm>
#include <execution>
#include <string>
#include <utility>

#include "search.hpp"

#include <rapidfuzz/fuzz.hpp>

#include "text.hpp"

namespace adx
{

namespace
{

// Sum of squared run lengths over the tightest window holding the query as
// a subsequence of code points: scan forward for the earliest end, then
// backward for the latest start, then match greedily inside the window. A
// verbatim occurrence anywhere in the name counts as one full run.
auto contiguity(std::u32string_view query, std::u32string_view name)
    -> std::optional<std::size_t>
{
  if (name.find(query) != std::u32string_view::npos) {
    return query.size() * query.size();
  }

  std::size_t matched = 0;
  std::size_t end = 0;
  for (std::size_t i = 0; i < name.size() && matched < query.size(); ++i) {
    if (name[i] == query[matched]) {
      end = i;
      ++matched;
    }
  }
  if (matched < query.size()) {
    return std::nullopt;
  }

  std::size_t start = end;
  for (std::size_t i = end + 1; i-- > 0;) {
    if (name[i] == query[matched - 1]) {
      start = i;
      if (--matched == 0) {
        break;
      }
    }
  }

  std::size_t total = 0;
  std::size_t run = 0;
  std::size_t last = 0;
  for (std::size_t i = start; i <= end && matched < query.size(); ++i) {
    if (name[i] != query[matched]) {
      continue;
    }
    if (run > 0 && i == last + 1) {
      ++run;
    } else {
      total += run * run;
      run = 1;
    }
    last = i;
    ++matched;
  }
  return total + run * run;
}

}  // namespace

auto score_entry(std::string_view normalized_query, const entry& item)
    -> std::optional<double>
{
  if (normalized_query.empty()) {
    return 0.0;
  }
  const auto query = decode_utf8(normalized_query);
  const auto name = decode_utf8(item.normalized_name);
  const auto runs = contiguity(query, name);
  if (!runs) {
    return std::nullopt;
  }

  auto score = contiguity_weight * static_cast<double>(*runs);
  if (name.compare(0, query.size(), query) == 0) {
    score += prefix_bonus;
  }
  if (item.origin == entry_origin::start_menu) {
    score += start_menu_bonus;
  }
  // For a subsequence match the Indel ratio is 200*|q|/(|q|+|name|), so the
  // penalty grows with the name length and stays below 25.
  // NOLINTNEXTLINE(*magic-numbers*)
  score -= (100.0 - rapidfuzz::fuzz::ratio(query, name)) / 4.0;
  return score;
}

auto ranks_before(const search_hit& lhs, const search_hit& rhs) -> bool
{
  if (lhs.score != rhs.score) {
    return lhs.score > rhs.score;
  }
  if (lhs.item->normalized_name != rhs.item->normalized_name) {
    return lhs.item->normalized_name < rhs.item->normalized_name;
  }
  return lhs.item->launch_target < rhs.item->launch_target;
}

searcher::searcher(index_snapshot index)
    : m_index(std::move(index))
{
  if (!m_index) {
    m_index = std::make_shared<const program_index>();
  }
}

auto searcher::search(std::string_view query, std::size_t max_results) const
    -> search_result
{
  const auto normalized = normalize_name(query);
  if (normalized.empty()) {
    return list_all(max_results);
  }

  const auto& entries = m_index->entries();
  std::vector<std::optional<double>> scores(entries.size());
  std::transform(std::execution::par,
                 entries.begin(),
                 entries.end(),
                 scores.begin(),
                 [&](const entry& item) { return score_entry(normalized, item); });

  search_result result {m_index, {}};
  for (std::size_t i = 0; i < entries.size(); ++i) {
    if (scores[i]) {
      result.hits.push_back(search_hit {&entries[i], *scores[i]});
    }
  }
  std::sort(std::execution::par,
            result.hits.begin(),
            result.hits.end(),
            ranks_before);
  if (result.hits.size() > max_results) {
    result.hits.resize(max_results);
  }
  return result;
}

auto searcher::list_all(std::size_t max_results) const -> search_result
{
  const auto& entries = m_index->entries();
  search_result result {m_index, {}};
  const auto count = std::min(max_results, entries.size());
  result.hits.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    result.hits.push_back(search_hit {&entries[i], 0.0});
  }
  return result;
}

auto query_gate::open() -> std::uint64_t
{
  return ++m_latest;
}

auto query_gate::admit(std::uint64_t sequence) -> bool
{
  auto latest = m_latest.load();
  while (sequence > latest) {
    if (m_latest.compare_exchange_weak(latest, sequence)) {
      return true;
    }
  }
  return sequence == latest;
}

auto query_gate::is_current(std::uint64_t sequence) const -> bool
{
  return m_latest.load() == sequence;
}

}  // namespace adx
