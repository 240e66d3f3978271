#include <chrono>
#include <exception>
#include <utility>

#include "catalog.hpp"

#include <spdlog/spdlog.h>

#include "discovery.hpp"

namespace adx
{

namespace
{

auto with_defaults(config cfg) -> config
{
  if (cfg.cache_dir.empty()) {
    cfg.cache_dir = default_cache_dir();
  }
  if (cfg.max_results < 1) {
    cfg.max_results = 1;
  }
  return cfg;
}

}  // namespace

catalog::catalog(config cfg,
                 std::unique_ptr<shortcut_resolver> resolver,
                 std::unique_ptr<icon_extractor> extractor)
    : m_config(with_defaults(std::move(cfg)))
    , m_resolver(std::move(resolver))
    , m_icons(m_config.cache_dir / "icons", std::move(extractor))
    , m_cache(m_config.cache_dir / "index_cache.json")
{
}

catalog::catalog(config cfg)
    : catalog(cfg,
              make_default_shortcut_resolver(),
              make_default_icon_extractor(cfg.program_icon_size))
{
}

catalog::~catalog()
{
  wait();
}

auto catalog::load_cached() -> bool
{
  if (!m_config.enable_cache) {
    return false;
  }
  const std::scoped_lock lock {m_build_mutex};
  auto record = m_cache.load(compute_fingerprint(m_config));
  if (!record) {
    return false;
  }
  build_report report;
  report.from_cache = true;
  report.entry_count = record->entries.size();
  publish(std::move(record->entries));
  const std::scoped_lock report_lock {m_report_mutex};
  m_last_build = report;
  return true;
}

auto catalog::build(bool use_cache) -> build_report
{
  const std::scoped_lock lock {m_build_mutex};
  const auto start = std::chrono::steady_clock::now();
  build_report report;

  const auto roots = scan_roots(m_config);
  std::optional<fingerprint> stamp;
  if (m_config.enable_cache) {
    stamp = compute_fingerprint(
        roots, m_config.exclude_paths, m_config.skip_name_patterns);
    if (use_cache) {
      if (auto record = m_cache.load(*stamp)) {
        report.from_cache = true;
        report.entry_count = record->entries.size();
        publish(std::move(record->entries));
        return report;
      }
    }
  }

  auto discovered = discover(roots,
                             {m_config.exclude_paths, m_config.skip_name_patterns},
                             *m_resolver);
  for (auto& item : discovered.entries) {
    item.icon = m_icons.resolve(item);
  }
  report.entry_count = discovered.entries.size();
  report.warning_count = discovered.warnings.size();

  const auto pruned = m_icons.prune(discovered.entries);
  if (pruned > 0) {
    spdlog::debug("catalog: pruned {} stale icons", pruned);
  }
  if (stamp) {
    report.cache_written = m_cache.save(discovered.entries, *stamp);
  }
  publish(std::move(discovered.entries));

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  spdlog::info("catalog: built {} entries in {} ms", report.entry_count, elapsed.count());
  return report;
}

void catalog::publish(std::vector<entry> entries)
{
  m_publisher.publish(std::make_shared<const program_index>(
      std::move(entries), m_config.initial_sort, seed_for_build()));
}

auto catalog::seed_for_build() const -> std::uint64_t
{
  return m_config.initial_sort == sort_order::random ? random_seed() : 0;
}

auto catalog::rebuild(bool use_cache) -> build_report
{
  m_indexing = true;
  auto report = build(use_cache);
  {
    const std::scoped_lock lock {m_report_mutex};
    m_last_build = report;
  }
  m_indexing = false;
  return report;
}

auto catalog::rebuild_async(bool use_cache) -> bool
{
  if (m_indexing.exchange(true)) {
    return false;
  }
  const std::scoped_lock lock {m_worker_mutex};
  if (m_worker.joinable()) {
    m_worker.join();
  }
  m_worker = std::thread {[this, use_cache]
                          {
                            try {
                              rebuild(use_cache);
                            } catch (const std::exception& failure) {
                              spdlog::error("catalog: rebuild failed: {}",
                                            failure.what());
                              m_indexing = false;
                            }
                          }};
  return true;
}

void catalog::wait()
{
  const std::scoped_lock lock {m_worker_mutex};
  if (m_worker.joinable()) {
    m_worker.join();
  }
}

auto catalog::rows(const search_result& result) const -> std::vector<query_row>
{
  std::vector<query_row> out;
  out.reserve(result.hits.size());
  for (const auto& hit : result.hits) {
    out.push_back(query_row {hit.item->name,
                             hit.item->launch_target.u8string(),
                             hit.item->icon,
                             hit.score});
  }
  return out;
}

auto catalog::search(std::string_view query) const -> std::vector<query_row>
{
  const searcher engine {m_publisher.current()};
  return rows(engine.search(query, m_config.max_results));
}

auto catalog::list_all() const -> std::vector<query_row>
{
  const searcher engine {m_publisher.current()};
  return rows(engine.list_all(m_config.max_results));
}

auto catalog::status() const -> catalog_status
{
  catalog_status result;
  result.indexing = m_indexing;
  result.entry_count = m_publisher.current()->size();
  result.generation = m_publisher.generation();
  const std::scoped_lock lock {m_report_mutex};
  result.last_build = m_last_build;
  return result;
}

}  // namespace adx
