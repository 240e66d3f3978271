#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include "config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "text.hpp"

namespace adx
{

using nlohmann::json;

namespace
{

auto get_env(const char* var, const char* default_val = "") -> std::string
{
  const char* val = std::getenv(var);
  return val != nullptr ? val : default_val;
}

auto home_dir() -> std::filesystem::path
{
#ifdef _WIN32
  return get_env("USERPROFILE");
#else
  return get_env("HOME");
#endif
}

// Reads one key, keeping the default when the key is absent or mistyped.
template<typename T>
void read_key(const json& jsn, const char* key, T& out)
{
  const auto iter = jsn.find(key);
  if (iter == jsn.end()) {
    return;
  }
  try {
    iter->get_to(out);
  } catch (const json::exception& error) {
    spdlog::warn("config: ignoring '{}': {}", key, error.what());
  }
}

void read_paths(const json& jsn,
                const char* key,
                std::vector<std::filesystem::path>& out)
{
  std::vector<std::string> raw;
  read_key(jsn, key, raw);
  for (auto& path : raw) {
    if (!path.empty()) {
      out.push_back(std::filesystem::u8path(path));
    }
  }
}

}  // namespace

auto parse_config(std::string_view json_text) -> config
{
  config cfg;
  json jsn;
  try {
    jsn = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error& error) {
    spdlog::warn("config: malformed document, using defaults: {}", error.what());
    return cfg;
  }
  if (!jsn.is_object()) {
    spdlog::warn("config: top level is not an object, using defaults");
    return cfg;
  }

  read_key(jsn, "search_icon_size", cfg.search_icon_size);
  read_key(jsn, "program_icon_size", cfg.program_icon_size);

  std::int64_t max_results = static_cast<std::int64_t>(cfg.max_results);
  read_key(jsn, "max_results", max_results);
  if (max_results < 1) {
    spdlog::warn("config: max_results {} is below 1, clamping", max_results);
    max_results = 1;
  }
  cfg.max_results = static_cast<std::size_t>(max_results);

  read_paths(jsn, "extra_index_paths", cfg.extra_index_paths);
  read_paths(jsn, "exclude_paths", cfg.exclude_paths);

  std::string sort = "alphabetical";
  read_key(jsn, "initial_sort", sort);
  sort = to_lower(sort);
  if (sort == "random") {
    cfg.initial_sort = sort_order::random;
  } else if (sort != "alphabetical") {
    spdlog::warn("config: unknown initial_sort '{}', using alphabetical", sort);
  }

  read_key(jsn, "enable_cache", cfg.enable_cache);
  read_key(jsn, "include_default_roots", cfg.include_default_roots);
  read_key(jsn, "skip_name_patterns", cfg.skip_name_patterns);
  read_key(jsn, "log_level", cfg.log_level);

  std::string cache_dir;
  read_key(jsn, "cache_dir", cache_dir);
  if (!cache_dir.empty()) {
    cfg.cache_dir = std::filesystem::u8path(cache_dir);
  }
  return cfg;
}

auto load_config(const std::filesystem::path& path) -> config
{
  std::ifstream file {path, std::ios::binary};
  if (!file) {
    spdlog::info("config: {} not readable, using defaults", path.u8string());
    return config {};
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse_config(buffer.str());
}

auto default_cache_dir() -> std::filesystem::path
{
#ifdef _WIN32
  const auto local = get_env("LOCALAPPDATA");
  if (!local.empty()) {
    return std::filesystem::path {local} / "appdex";
  }
#else
  const auto xdg_cache_home = get_env("XDG_CACHE_HOME");
  if (!xdg_cache_home.empty()) {
    return std::filesystem::path {xdg_cache_home} / "appdex";
  }
#endif
  const auto home = home_dir();
  if (home.empty()) {
    return std::filesystem::temp_directory_path() / "appdex";
  }
  return home / ".cache" / "appdex";
}

auto default_scan_roots() -> std::vector<scan_root>
{
  std::vector<scan_root> roots;
  std::unordered_set<std::string> seen;
  auto add_root = [&](const std::filesystem::path& path, entry_origin origin)
  {
    if (!path.empty() && seen.insert(path.u8string()).second) {
      roots.push_back({path, origin});
    }
  };

#ifdef _WIN32
  const std::filesystem::path programs =
      std::filesystem::path {"Microsoft"} / "Windows" / "Start Menu" / "Programs";
  const auto program_data = get_env("ProgramData", "C:\\ProgramData");
  add_root(std::filesystem::path {program_data} / programs,
           entry_origin::start_menu);
  const auto app_data = get_env("APPDATA");
  if (!app_data.empty()) {
    add_root(std::filesystem::path {app_data} / programs,
             entry_origin::start_menu);
  }
  add_root(get_env("ProgramFiles", "C:\\Program Files"),
           entry_origin::program_files);
  add_root(get_env("ProgramFiles(x86)", "C:\\Program Files (x86)"),
           entry_origin::program_files);
#else
  const auto home = home_dir();
  const auto xdg_data_home = get_env("XDG_DATA_HOME");
  if (!xdg_data_home.empty()) {
    add_root(std::filesystem::path {xdg_data_home} / "applications",
             entry_origin::start_menu);
  } else if (!home.empty()) {
    add_root(home / ".local" / "share" / "applications",
             entry_origin::start_menu);
  }
  const auto xdg_data_dirs =
      get_env("XDG_DATA_DIRS", "/usr/local/share:/usr/share");
  for (const auto& dir : split(xdg_data_dirs, ':')) {
    if (dir.empty() || dir[0] != '/') {
      continue;
    }
    add_root(std::filesystem::path {dir} / "applications",
             entry_origin::start_menu);
  }
  if (!home.empty()) {
    add_root(home / ".local/share/flatpak/exports/share/applications",
             entry_origin::start_menu);
  }
  add_root("/var/lib/flatpak/exports/share/applications",
           entry_origin::start_menu);
  add_root("/var/lib/snapd/desktop/applications", entry_origin::start_menu);

  add_root("/opt", entry_origin::program_files);
  if (!home.empty()) {
    add_root(home / "Applications", entry_origin::program_files);
  }
#endif
  return roots;
}

auto scan_roots(const config& cfg) -> std::vector<scan_root>
{
  std::vector<scan_root> roots;
  if (cfg.include_default_roots) {
    roots = default_scan_roots();
  }
  for (const auto& path : cfg.extra_index_paths) {
    roots.push_back({path, entry_origin::extra_path});
  }
  return roots;
}

}  // namespace adx
