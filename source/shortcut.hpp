#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adx
{

struct shortcut_target
{
  std::filesystem::path target;
  std::string display_name;  // empty when the shortcut carries none
  std::string icon_name;
};

// Turns a shortcut file into the program it launches. Implementations return
// nothing for files they cannot parse and for targets that no longer exist.
class shortcut_resolver
{
public:
  shortcut_resolver() = default;
  virtual ~shortcut_resolver() = default;

  shortcut_resolver(const shortcut_resolver&) = delete;
  shortcut_resolver(shortcut_resolver&&) = delete;
  auto operator=(const shortcut_resolver&) -> shortcut_resolver& = delete;
  auto operator=(shortcut_resolver&&) -> shortcut_resolver& = delete;

  virtual auto resolve(const std::filesystem::path& shortcut) const
      -> std::optional<shortcut_target> = 0;
};

// XDG Desktop Entry files. Hidden and NoDisplay entries are rejected, as are
// entries whose TryExec or Exec program cannot be found. When Exec carries
// arguments beyond field codes the desktop file itself is the target, since
// the bare program would not start the same application.
class desktop_entry_resolver final : public shortcut_resolver
{
public:
  // Searches $PATH.
  desktop_entry_resolver();
  explicit desktop_entry_resolver(
      std::vector<std::filesystem::path> search_path);

  auto resolve(const std::filesystem::path& shortcut) const
      -> std::optional<shortcut_target> override;

private:
  auto find_executable(const std::string& command) const
      -> std::optional<std::filesystem::path>;

  std::vector<std::filesystem::path> m_search_path;
};

// Windows Shell Link (.lnk) files, read from the binary format directly so it
// works on every platform.
class shell_link_resolver final : public shortcut_resolver
{
public:
  auto resolve(const std::filesystem::path& shortcut) const
      -> std::optional<shortcut_target> override;
};

// Dispatches on the lowercase file extension.
class extension_resolver final : public shortcut_resolver
{
public:
  void add(std::string extension, std::unique_ptr<shortcut_resolver> resolver);

  auto resolve(const std::filesystem::path& shortcut) const
      -> std::optional<shortcut_target> override;

private:
  std::map<std::string, std::unique_ptr<shortcut_resolver>> m_resolvers;
};

auto make_default_shortcut_resolver() -> std::unique_ptr<shortcut_resolver>;

// Splits a GKeyFile-unescaped Exec value into arguments.
auto tokenize_exec(const std::string& exec_value) -> std::vector<std::string>;

auto is_executable_file(const std::filesystem::path& path) -> bool;

#ifdef _WIN32
inline constexpr char search_path_separator = ';';
#else
inline constexpr char search_path_separator = ':';
#endif

// Directories of a PATH-style value, empty items dropped.
auto split_search_path(std::string_view value)
    -> std::vector<std::filesystem::path>;

}  // namespace adx
