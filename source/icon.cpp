#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>

#include "icon.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#ifdef _WIN32
#  include <windows.h>
#  include <shellapi.h>
#  include <shlobj.h>
#  include <gdiplus.h>
#endif

#include "text.hpp"

namespace adx
{

namespace fs = std::filesystem;

namespace
{

// NOLINTNEXTLINE(*magic-numbers*)
constexpr std::array<std::uint32_t, 12> placeholder_palette {
    0xE57373, 0xF06292, 0xBA68C8, 0x9575CD, 0x7986CB, 0x64B5F6,
    0x4DB6AC, 0x81C784, 0xDCE775, 0xFFB74D, 0xFF8A65, 0xA1887F,
};

constexpr std::array<const char*, 4> image_extensions {
    ".png", ".svg", ".xpm", ".ico"};

constexpr std::array<int, 9> fallback_sizes {
    48, 64, 32, 128, 256, 96, 24, 22, 16};

auto regular_file(const fs::path& path) -> bool
{
  std::error_code error;
  return fs::is_regular_file(path, error);
}

auto is_image(const fs::path& path) -> bool
{
  const auto extension = to_lower(path.extension().u8string());
  return std::find(image_extensions.begin(), image_extensions.end(), extension)
      != image_extensions.end();
}

auto env_path(const char* var) -> fs::path
{
  const char* val = std::getenv(var);
  return val != nullptr ? fs::path {val} : fs::path {};
}

// Cached copy at least as new as its source.
auto is_fresh(const fs::path& cached, const fs::path& source) -> bool
{
  std::error_code error;
  if (!regular_file(cached)) {
    return false;
  }
  const auto cached_time = fs::last_write_time(cached, error);
  if (error) {
    return false;
  }
  const auto source_time = fs::last_write_time(source, error);
  return !error && cached_time >= source_time;
}

auto default_icon_dirs() -> std::vector<fs::path>
{
  std::vector<fs::path> dirs;
  const auto home = env_path("HOME");
  const auto xdg_data_home = env_path("XDG_DATA_HOME");
  if (!xdg_data_home.empty()) {
    dirs.push_back(xdg_data_home / "icons");
  } else if (!home.empty()) {
    dirs.push_back(home / ".local" / "share" / "icons");
  }
  if (!home.empty()) {
    dirs.push_back(home / ".icons");
  }
  const char* data_dirs = std::getenv("XDG_DATA_DIRS");
  for (const auto& dir :
       split(data_dirs != nullptr ? data_dirs : "/usr/local/share:/usr/share",
             ':'))
  {
    if (!dir.empty()) {
      dirs.push_back(fs::path {dir} / "icons");
    }
  }
  return dirs;
}

}  // namespace

auto icon_cache_stem(const entry& item) -> std::string
{
  return to_hex(fnv1a(item.launch_target.u8string()));
}

auto parse_icon_location(std::string_view hint) -> icon_location
{
  const auto comma = hint.rfind(',');
  if (comma != std::string_view::npos) {
    const auto digits = hint.substr(comma + 1);
    int index = 0;
    const auto* const last = digits.data() + digits.size();
    const auto [end, error] = std::from_chars(digits.data(), last, index);
    if (!digits.empty() && error == std::errc {} && end == last) {
      return {fs::u8path(hint.substr(0, comma)), index};
    }
  }
  return {fs::u8path(hint), 0};
}

theme_icon_extractor::theme_icon_extractor(std::uint16_t preferred_size)
    : theme_icon_extractor(
        preferred_size, default_icon_dirs(), {"/usr/share/pixmaps"})
{
}

theme_icon_extractor::theme_icon_extractor(std::uint16_t preferred_size,
                                           std::vector<fs::path> icon_dirs,
                                           std::vector<fs::path> pixmap_dirs)
    : m_preferred_size(preferred_size)
    , m_icon_dirs(std::move(icon_dirs))
    , m_pixmap_dirs(std::move(pixmap_dirs))
{
}

auto theme_icon_extractor::locate_named(const std::string& icon_name) const
    -> std::optional<fs::path>
{
  std::vector<std::string> size_dirs;
  size_dirs.push_back(fmt::format("{0}x{0}", m_preferred_size));
  for (const auto size : fallback_sizes) {
    auto dir = fmt::format("{0}x{0}", size);
    if (std::find(size_dirs.begin(), size_dirs.end(), dir) == size_dirs.end()) {
      size_dirs.push_back(std::move(dir));
    }
  }
  size_dirs.emplace_back("scalable");

  for (const auto& base : m_icon_dirs) {
    for (const auto& size_dir : size_dirs) {
      const auto apps = base / "hicolor" / size_dir / "apps";
      for (const auto* extension : image_extensions) {
        auto candidate = apps / fs::u8path(icon_name + extension);
        if (regular_file(candidate)) {
          return candidate;
        }
      }
    }
  }
  for (const auto& dir : m_pixmap_dirs) {
    for (const auto* extension : image_extensions) {
      auto candidate = dir / fs::u8path(icon_name + extension);
      if (regular_file(candidate)) {
        return candidate;
      }
    }
  }
  return std::nullopt;
}

auto theme_icon_extractor::locate(const entry& item) const
    -> std::optional<fs::path>
{
  if (!item.icon_name.empty()) {
    const auto hinted = parse_icon_location(item.icon_name).file;
    if (hinted.is_absolute()) {
      if (is_image(hinted) && regular_file(hinted)) {
        return hinted;
      }
    } else if (auto found = locate_named(item.icon_name)) {
      return found;
    }
  }

  const auto program = item.launch_target.stem().u8string();
  for (const auto& dir : {item.source_path.parent_path(),
                          item.launch_target.parent_path()})
  {
    if (dir.empty()) {
      continue;
    }
    for (const auto* extension : image_extensions) {
      auto candidate = dir / fs::u8path(program + extension);
      if (regular_file(candidate)) {
        return candidate;
      }
    }
  }
  return locate_named(to_lower(program));
}

auto theme_icon_extractor::extract(const entry& item,
                                   const fs::path& destination_stem) const
    -> std::optional<fs::path>
{
  const auto source = locate(item);
  if (!source) {
    return std::nullopt;
  }
  auto destination = destination_stem;
  destination += fs::u8path(to_lower(source->extension().u8string()));
  if (is_fresh(destination, *source)) {
    return destination;
  }

  std::error_code error;
  fs::copy_file(
      *source, destination, fs::copy_options::overwrite_existing, error);
  if (error) {
    spdlog::debug(
        "icon: copying {} failed: {}", source->u8string(), error.message());
    return std::nullopt;
  }
  return destination;
}

#ifdef _WIN32

namespace
{

struct icon_deleter
{
  void operator()(HICON icon) const { DestroyIcon(icon); }
};
using icon_handle = std::unique_ptr<std::remove_pointer_t<HICON>, icon_deleter>;

struct bitmap_deleter
{
  void operator()(HBITMAP bitmap) const { DeleteObject(bitmap); }
};
using bitmap_handle =
    std::unique_ptr<std::remove_pointer_t<HBITMAP>, bitmap_deleter>;

// COM for the calling thread, as long as the scope lives.
class com_scope
{
public:
  com_scope()
      : m_result(CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED))
  {
  }
  ~com_scope()
  {
    if (SUCCEEDED(m_result)) {
      CoUninitialize();
    }
  }

  com_scope(const com_scope&) = delete;
  com_scope(com_scope&&) = delete;
  auto operator=(const com_scope&) -> com_scope& = delete;
  auto operator=(com_scope&&) -> com_scope& = delete;

private:
  HRESULT m_result;
};

// 32bpp BGRA, top-down, straight alpha.
struct bgra_image
{
  int width = 0;
  int height = 0;
  std::vector<BYTE> pixels;
};

auto load_icon(const icon_location& location, std::uint16_t size) -> icon_handle
{
  const auto file = location.file.wstring();
  HICON large = nullptr;
  if (SHDefExtractIconW(file.c_str(),
                        location.index,
                        0,
                        &large,
                        nullptr,
                        MAKELONG(size, size))
      == S_OK)
  {
    return icon_handle {large};
  }

  // Files without their own icon resources get the icon of their type.
  SHFILEINFOW info {};
  if (SHGetFileInfoW(file.c_str(),
                     FILE_ATTRIBUTE_NORMAL,
                     &info,
                     sizeof(info),
                     SHGFI_ICON | SHGFI_LARGEICON)
      == 0)
  {
    return icon_handle {};
  }
  return icon_handle {info.hIcon};
}

auto icon_pixels(HICON icon) -> std::optional<bgra_image>
{
  ICONINFO info {};
  if (GetIconInfo(icon, &info) == FALSE) {
    return std::nullopt;
  }
  const bitmap_handle color {info.hbmColor};
  const bitmap_handle mask {info.hbmMask};
  if (!color) {
    return std::nullopt;
  }

  BITMAP header {};
  if (GetObjectW(color.get(), sizeof(header), &header) == 0) {
    return std::nullopt;
  }
  bgra_image image {header.bmWidth, header.bmHeight, {}};
  image.pixels.resize(static_cast<std::size_t>(image.width) * image.height * 4);

  BITMAPINFO format {};
  format.bmiHeader.biSize = sizeof(BITMAPINFOHEADER);
  format.bmiHeader.biWidth = image.width;
  format.bmiHeader.biHeight = -image.height;  // top-down
  format.bmiHeader.biPlanes = 1;
  // NOLINTNEXTLINE(*magic-numbers*)
  format.bmiHeader.biBitCount = 32;
  format.bmiHeader.biCompression = BI_RGB;

  HDC screen = GetDC(nullptr);
  const auto lines = GetDIBits(screen,
                               color.get(),
                               0,
                               static_cast<UINT>(image.height),
                               image.pixels.data(),
                               &format,
                               DIB_RGB_COLORS);
  ReleaseDC(nullptr, screen);
  if (lines == 0) {
    return std::nullopt;
  }

  // Icons without an alpha channel leave it zero; they are opaque.
  bool has_alpha = false;
  for (std::size_t i = 3; i < image.pixels.size(); i += 4) {
    has_alpha = has_alpha || image.pixels[i] != 0;
  }
  if (!has_alpha) {
    for (std::size_t i = 3; i < image.pixels.size(); i += 4) {
      // NOLINTNEXTLINE(*magic-numbers*)
      image.pixels[i] = 0xFF;
    }
  }
  return image;
}

auto png_encoder() -> std::optional<CLSID>
{
  UINT count = 0;
  UINT size = 0;
  if (Gdiplus::GetImageEncodersSize(&count, &size) != Gdiplus::Ok || size == 0) {
    return std::nullopt;
  }
  std::vector<BYTE> buffer(size);
  auto* codecs = reinterpret_cast<Gdiplus::ImageCodecInfo*>(buffer.data());
  if (Gdiplus::GetImageEncoders(count, size, codecs) != Gdiplus::Ok) {
    return std::nullopt;
  }
  for (UINT i = 0; i < count; ++i) {
    if (std::wstring_view {codecs[i].MimeType} == L"image/png") {
      return codecs[i].Clsid;
    }
  }
  return std::nullopt;
}

auto write_png(bgra_image& image, const fs::path& destination) -> bool
{
  const auto encoder = png_encoder();
  if (!encoder) {
    return false;
  }
  Gdiplus::Bitmap bitmap {image.width,
                          image.height,
                          image.width * 4,
                          PixelFormat32bppARGB,
                          image.pixels.data()};
  return bitmap.Save(destination.c_str(), &*encoder, nullptr) == Gdiplus::Ok;
}

// Icon location for an entry: the hinted file when it exists, otherwise the
// program itself.
auto shell_icon_source(const entry& item) -> icon_location
{
  if (!item.icon_name.empty()) {
    auto hinted = parse_icon_location(item.icon_name);
    if (hinted.file.is_absolute() && regular_file(hinted.file)) {
      return hinted;
    }
  }
  return {item.launch_target, 0};
}

}  // namespace

shell_icon_extractor::shell_icon_extractor(std::uint16_t preferred_size)
    : m_preferred_size(preferred_size)
    , m_files(preferred_size, {}, {})
{
  const Gdiplus::GdiplusStartupInput input;
  ULONG_PTR token = 0;
  if (Gdiplus::GdiplusStartup(&token, &input, nullptr) == Gdiplus::Ok) {
    m_gdiplus_token = token;
  } else {
    spdlog::warn("icon: GDI+ is unavailable, embedded icons are skipped");
  }
}

shell_icon_extractor::~shell_icon_extractor()
{
  if (m_gdiplus_token != 0) {
    Gdiplus::GdiplusShutdown(static_cast<ULONG_PTR>(m_gdiplus_token));
  }
}

auto shell_icon_extractor::extract(const entry& item,
                                   const fs::path& destination_stem) const
    -> std::optional<fs::path>
{
  const auto source = shell_icon_source(item);
  const auto extension = to_lower(source.file.extension().u8string());
  if (m_gdiplus_token == 0 || (is_image(source.file) && extension != ".ico")) {
    return m_files.extract(item, destination_stem);
  }

  auto destination = destination_stem;
  destination += ".png";
  if (is_fresh(destination, source.file)) {
    return destination;
  }

  const com_scope com;
  const auto icon = load_icon(source, m_preferred_size);
  if (!icon) {
    spdlog::debug("icon: no icon in {}", source.file.u8string());
    return m_files.extract(item, destination_stem);
  }
  auto image = icon_pixels(icon.get());
  if (!image || !write_png(*image, destination)) {
    spdlog::debug("icon: converting the icon of {} failed", source.file.u8string());
    return m_files.extract(item, destination_stem);
  }
  return destination;
}

#endif

auto make_default_icon_extractor(std::uint16_t preferred_size)
    -> std::unique_ptr<icon_extractor>
{
#ifdef _WIN32
  return std::make_unique<shell_icon_extractor>(preferred_size);
#else
  return std::make_unique<theme_icon_extractor>(preferred_size);
#endif
}

icon_resolver::icon_resolver(fs::path cache_dir,
                             std::unique_ptr<icon_extractor> extractor)
    : m_cache_dir(std::move(cache_dir))
    , m_extractor(std::move(extractor))
{
}

auto icon_resolver::resolve(const entry& item) const -> icon_reference
{
  if (m_extractor) {
    std::error_code error;
    fs::create_directories(m_cache_dir, error);
    if (!error) {
      try {
        if (auto path =
                m_extractor->extract(item, m_cache_dir / icon_cache_stem(item)))
        {
          return bitmap_icon {std::move(*path)};
        }
      } catch (const fs::filesystem_error& failure) {
        spdlog::debug("icon: extraction for {} failed: {}",
                      item.launch_target.u8string(),
                      failure.what());
      }
    }
  }
  return placeholder_for(item.name);
}

auto icon_resolver::prune(const std::vector<entry>& keep) const -> std::size_t
{
  std::unordered_set<std::string> referenced;
  for (const auto& item : keep) {
    if (const auto* bitmap = std::get_if<bitmap_icon>(&item.icon)) {
      referenced.insert(bitmap->path.filename().u8string());
    }
  }

  std::size_t removed = 0;
  std::error_code error;
  fs::directory_iterator iter {m_cache_dir, error};
  if (error) {
    return removed;
  }
  std::vector<fs::path> stale;
  for (; iter != fs::directory_iterator {}; iter.increment(error)) {
    if (error) {
      break;
    }
    const auto& path = iter->path();
    if (is_image(path) && referenced.count(path.filename().u8string()) == 0) {
      stale.push_back(path);
    }
  }
  for (const auto& path : stale) {
    if (fs::remove(path, error)) {
      ++removed;
    }
  }
  return removed;
}

auto icon_resolver::placeholder_for(std::string_view name) -> placeholder_icon
{
  placeholder_icon icon;
  const auto codes = decode_utf8(name);
  const auto first = std::find_if(codes.begin(), codes.end(), is_alnum);
  if (first != codes.end()) {
    icon.letter = encode_utf8(std::u32string(1, upper_case(*first)));
  }
  icon.color = placeholder_palette[fnv1a(name) % placeholder_palette.size()];
  return icon;
}

}  // namespace adx
