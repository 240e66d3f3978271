#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "config.hpp"
#include "icon.hpp"
#include "index_cache.hpp"
#include "program_index.hpp"
#include "search.hpp"
#include "shortcut.hpp"

namespace adx
{

// One row of the outward query interface.
struct query_row
{
  std::string display_name;
  std::string launch_target;
  icon_reference icon;
  double score = 0.0;
};

struct build_report
{
  bool from_cache = false;
  bool cache_written = false;
  std::size_t entry_count = 0;
  std::size_t warning_count = 0;
};

struct catalog_status
{
  bool indexing = false;
  std::size_t entry_count = 0;
  std::uint64_t generation = 0;
  std::optional<build_report> last_build;
};

// Owns the published index and everything needed to rebuild it. Queries only
// ever read the current snapshot; rebuilds publish a finished one.
class catalog
{
public:
  catalog(config cfg,
          std::unique_ptr<shortcut_resolver> resolver,
          std::unique_ptr<icon_extractor> extractor);
  explicit catalog(config cfg);
  ~catalog();

  catalog(const catalog&) = delete;
  catalog(catalog&&) = delete;
  auto operator=(const catalog&) -> catalog& = delete;
  auto operator=(catalog&&) -> catalog& = delete;

  // Publishes the cached index if it is still valid. Does no discovery.
  auto load_cached() -> bool;

  // Blocking full build: cache when valid, otherwise discovery.
  auto rebuild(bool use_cache = true) -> build_report;

  // Runs rebuild on the background worker. False if one is already running.
  auto rebuild_async(bool use_cache = true) -> bool;

  // Waits for a background rebuild to finish.
  void wait();

  auto search(std::string_view query) const -> std::vector<query_row>;
  auto list_all() const -> std::vector<query_row>;

  auto snapshot() const -> index_snapshot { return m_publisher.current(); }
  auto status() const -> catalog_status;
  auto settings() const -> const config& { return m_config; }

private:
  auto build(bool use_cache) -> build_report;
  auto rows(const search_result& result) const -> std::vector<query_row>;
  auto seed_for_build() const -> std::uint64_t;
  void publish(std::vector<entry> entries);

  config m_config;
  std::unique_ptr<shortcut_resolver> m_resolver;
  icon_resolver m_icons;
  index_cache m_cache;
  index_publisher m_publisher;

  std::atomic<bool> m_indexing {false};
  std::mutex m_build_mutex;
  std::mutex m_worker_mutex;
  std::thread m_worker;
  mutable std::mutex m_report_mutex;
  std::optional<build_report> m_last_build;
};

}  // namespace adx
