#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "entry.hpp"

namespace adx
{

// Produces an image file for an entry. Implementations write it as
// destination_stem plus an image extension and return the written path.
class icon_extractor
{
public:
  icon_extractor() = default;
  virtual ~icon_extractor() = default;

  icon_extractor(const icon_extractor&) = delete;
  icon_extractor(icon_extractor&&) = delete;
  auto operator=(const icon_extractor&) -> icon_extractor& = delete;
  auto operator=(icon_extractor&&) -> icon_extractor& = delete;

  virtual auto extract(const entry& item,
                       const std::filesystem::path& destination_stem) const
      -> std::optional<std::filesystem::path> = 0;
};

// An icon inside a file: an image, or the resource at index of an executable,
// library or icon file.
struct icon_location
{
  std::filesystem::path file;
  int index = 0;
};

// Splits a Shell Link style "file,index" location. Without a numeric suffix
// the whole hint names the file and the index is 0.
auto parse_icon_location(std::string_view hint) -> icon_location;

// Looks the entry's icon hint up the way XDG icon themes lay files out
// (hicolor sizes, then pixmaps), then tries an image beside the program.
class theme_icon_extractor final : public icon_extractor
{
public:
  explicit theme_icon_extractor(std::uint16_t preferred_size);
  theme_icon_extractor(std::uint16_t preferred_size,
                       std::vector<std::filesystem::path> icon_dirs,
                       std::vector<std::filesystem::path> pixmap_dirs);

  auto extract(const entry& item,
               const std::filesystem::path& destination_stem) const
      -> std::optional<std::filesystem::path> override;

  auto locate(const entry& item) const -> std::optional<std::filesystem::path>;

private:
  auto locate_named(const std::string& icon_name) const
      -> std::optional<std::filesystem::path>;

  std::uint16_t m_preferred_size;
  std::vector<std::filesystem::path> m_icon_dirs;
  std::vector<std::filesystem::path> m_pixmap_dirs;
};

#ifdef _WIN32
// Asks the shell for the icon embedded in the program (or in the file a
// "file,index" hint names) and writes it as PNG through GDI+. Image files
// are handled by the theme lookup.
class shell_icon_extractor final : public icon_extractor
{
public:
  explicit shell_icon_extractor(std::uint16_t preferred_size);
  ~shell_icon_extractor() override;

  auto extract(const entry& item,
               const std::filesystem::path& destination_stem) const
      -> std::optional<std::filesystem::path> override;

private:
  std::uint16_t m_preferred_size;
  std::uintptr_t m_gdiplus_token = 0;
  theme_icon_extractor m_files;
};
#endif

// shell_icon_extractor on Windows, theme_icon_extractor elsewhere.
auto make_default_icon_extractor(std::uint16_t preferred_size)
    -> std::unique_ptr<icon_extractor>;

class icon_resolver
{
public:
  icon_resolver(std::filesystem::path cache_dir,
                std::unique_ptr<icon_extractor> extractor);

  // Extracted bitmap when possible, otherwise the placeholder. Never throws.
  auto resolve(const entry& item) const -> icon_reference;

  // Removes cached images that no entry in keep references.
  auto prune(const std::vector<entry>& keep) const -> std::size_t;

  auto cache_dir() const -> const std::filesystem::path&
  {
    return m_cache_dir;
  }

  static auto placeholder_for(std::string_view name) -> placeholder_icon;

private:
  std::filesystem::path m_cache_dir;
  std::unique_ptr<icon_extractor> m_extractor;
};

// Cache file stem for an entry, derived from its identity.
auto icon_cache_stem(const entry& item) -> std::string;

}  // namespace adx
