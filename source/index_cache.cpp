#include <algorithm>
#include <chrono>
#include <fstream>
#include <system_error>
#include <utility>

#include "index_cache.hpp"

#include <fmt/format.h>
#include <mio/mmap.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "discovery.hpp"
#include "icon.hpp"
#include "json_text.hpp"
#include "text.hpp"

namespace adx
{

namespace fs = std::filesystem;
using nlohmann::json;

namespace
{

class digest_builder
{
public:
  void add(std::string_view text)
  {
    m_hash = fnv1a(text, m_hash);
    m_hash = fnv1a("\x1f", m_hash);
  }

  void add(std::int64_t value) { add(std::to_string(value)); }

  auto value() const -> std::uint64_t { return m_hash; }

private:
  std::uint64_t m_hash = fnv1a("appdex");
};

auto entry_to_json(const entry& item) -> json
{
  json jsn {
      {"name", text_to_json(item.name)},
      {"launch_target", path_to_json(item.launch_target)},
      {"origin", to_string(item.origin)},
      {"source_path", path_to_json(item.source_path)},
      {"icon_name", text_to_json(item.icon_name)},
  };
  if (const auto* bitmap = std::get_if<bitmap_icon>(&item.icon)) {
    jsn["icon"] = path_to_json(bitmap->path);
  }
  return jsn;
}

// Throws json::exception on missing or mistyped fields, std::invalid_argument
// on damaged hex.
auto entry_from_json(const json& jsn) -> std::optional<entry>
{
  const auto origin = origin_from_string(jsn.at("origin").get<std::string>());
  auto launch_target = path_from_json(jsn.at("launch_target"));
  if (!origin || launch_target.empty()) {
    return std::nullopt;
  }
  auto item = make_entry(text_from_json(jsn.at("name")),
                         std::move(launch_target),
                         *origin,
                         path_from_json(jsn.at("source_path")),
                         text_from_json(jsn.at("icon_name")));

  item.icon = icon_resolver::placeholder_for(item.name);
  const auto icon = jsn.find("icon");
  if (icon != jsn.end()) {
    auto bitmap = path_from_json(*icon);
    std::error_code error;
    if (fs::is_regular_file(bitmap, error)) {
      item.icon = bitmap_icon {std::move(bitmap)};
    }
  }
  return item;
}

auto parse_record(const json& jsn, const fingerprint& current)
    -> std::optional<index_cache_record>
{
  if (jsn.at("schema").get<int>() != cache_schema_version) {
    spdlog::debug("index cache: schema mismatch");
    return std::nullopt;
  }
  const auto& stamp_json = jsn.at("fingerprint");
  index_cache_record record;
  record.stamp.directory_count =
      stamp_json.at("directories").get<std::size_t>();
  record.stamp.digest =
      std::stoull(stamp_json.at("digest").get<std::string>(), nullptr, 16);
  if (record.stamp != current) {
    spdlog::debug("index cache: fingerprint mismatch");
    return std::nullopt;
  }

  const auto& entries = jsn.at("entries");
  record.entries.reserve(entries.size());
  for (const auto& item : entries) {
    auto parsed = entry_from_json(item);
    if (!parsed) {
      spdlog::debug("index cache: malformed entry");
      return std::nullopt;
    }
    record.entries.push_back(std::move(*parsed));
  }
  return record;
}

}  // namespace

auto compute_fingerprint(const std::vector<scan_root>& roots,
                         const std::vector<fs::path>& exclude_paths,
                         const std::vector<std::string>& skip_name_patterns)
    -> fingerprint
{
  digest_builder digest;
  digest.add(cache_schema_version);
  for (const auto& path : exclude_paths) {
    digest.add(path.u8string());
  }
  for (const auto& pattern : skip_name_patterns) {
    digest.add(pattern);
  }

  std::vector<std::pair<std::string, std::int64_t>> directories;
  std::vector<discovery_warning> warnings;
  for (const auto& root : roots) {
    std::error_code error;
    digest.add(root.path.u8string());
    digest.add(to_string(root.origin));
    digest.add(fs::is_directory(root.path, error) ? 1 : 0);
    walk_tree(
        root.path,
        exclude_paths,
        [&](const fs::path& dir)
        {
          std::error_code time_error;
          const auto time = fs::last_write_time(dir, time_error);
          directories.emplace_back(
              dir.u8string(),
              time_error ? 0
                         : static_cast<std::int64_t>(
                               time.time_since_epoch().count()));
        },
        {},
        warnings);
  }

  std::sort(directories.begin(), directories.end());
  for (const auto& [path, time] : directories) {
    digest.add(path);
    digest.add(time);
  }
  return fingerprint {digest.value(), directories.size()};
}

auto compute_fingerprint(const config& cfg) -> fingerprint
{
  return compute_fingerprint(
      scan_roots(cfg), cfg.exclude_paths, cfg.skip_name_patterns);
}

index_cache::index_cache(fs::path file)
    : m_file(std::move(file))
{
}

auto index_cache::load(const fingerprint& current) const
    -> std::optional<index_cache_record>
{
  std::error_code error;
  const auto size = fs::file_size(m_file, error);
  if (error || size == 0) {
    spdlog::debug("index cache: {} absent", m_file.u8string());
    return std::nullopt;
  }

  try {
    const mio::mmap_source source {m_file.native()};
    const auto jsn = json::parse(source.begin(), source.end());
    auto record = parse_record(jsn, current);
    if (record) {
      spdlog::info("index cache: loaded {} entries from {}",
                   record->entries.size(),
                   m_file.u8string());
    }
    return record;
  } catch (const json::exception& failure) {
    spdlog::warn("index cache: {} is corrupt: {}", m_file.u8string(), failure.what());
  } catch (const std::system_error& failure) {
    spdlog::warn("index cache: cannot map {}: {}", m_file.u8string(), failure.what());
  } catch (const std::logic_error& failure) {
    // std::stoull on a damaged digest
    spdlog::warn("index cache: {} is corrupt: {}", m_file.u8string(), failure.what());
  }
  return std::nullopt;
}

auto index_cache::save(const std::vector<entry>& entries,
                       const fingerprint& stamp) const -> bool
{
  json document {
      {"schema", cache_schema_version},
      {"fingerprint",
       {{"digest", to_hex(stamp.digest)},
        {"directories", stamp.directory_count}}},
      {"entries", json::array()},
  };
  auto& list = document["entries"];
  for (const auto& item : entries) {
    list.push_back(entry_to_json(item));
  }

  std::error_code error;
  if (m_file.has_parent_path()) {
    fs::create_directories(m_file.parent_path(), error);
    if (error) {
      spdlog::warn("index cache: cannot create {}: {}",
                   m_file.parent_path().u8string(),
                   error.message());
      return false;
    }
  }

  auto temporary = m_file;
  temporary += fmt::format(
      ".{}.tmp", std::chrono::steady_clock::now().time_since_epoch().count());
  {
    std::ofstream out {temporary, std::ios::binary | std::ios::trunc};
    try {
      out << document.dump();
    } catch (const json::exception& failure) {
      spdlog::warn("index cache: cannot encode the index: {}", failure.what());
      out.close();
      fs::remove(temporary, error);
      return false;
    }
    out.close();
    if (!out) {
      spdlog::warn("index cache: writing {} failed", temporary.u8string());
      fs::remove(temporary, error);
      return false;
    }
  }

  fs::rename(temporary, m_file, error);
  if (error) {
    spdlog::warn("index cache: replacing {} failed: {}",
                 m_file.u8string(),
                 error.message());
    std::error_code cleanup;
    fs::remove(temporary, cleanup);
    return false;
  }
  spdlog::debug("index cache: wrote {} entries to {}",
                entries.size(),
                m_file.u8string());
  return true;
}

}  // namespace adx
