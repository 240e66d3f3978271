#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <utility>

#include "shortcut.hpp"

#include <spdlog/spdlog.h>

#include "text.hpp"

namespace adx
{

namespace fs = std::filesystem;

namespace
{

auto trim(std::string_view text) -> std::string_view
{
  const auto first = text.find_first_not_of(" \t\r");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r");
  return text.substr(first, last - first + 1);
}

// First pass of Desktop Entry value decoding: \s \n \t \r \\.
auto unescape_key_file_string(std::string_view str) -> std::string
{
  std::string unescaped;
  unescaped.reserve(str.size());
  for (size_t i = 0; i < str.size(); ++i) {
    if (str[i] != '\\') {
      unescaped += str[i];
      continue;
    }
    if (i + 1 >= str.size()) {
      unescaped += '\\';
      break;
    }
    ++i;
    switch (str[i]) {
      case 's':
        unescaped += ' ';
        break;
      case 'n':
        unescaped += '\n';
        break;
      case 't':
        unescaped += '\t';
        break;
      case 'r':
        unescaped += '\r';
        break;
      default:
        unescaped += str[i];
        break;
    }
  }
  return unescaped;
}

auto is_field_code(const std::string& token) -> bool
{
  return token.size() == 2 && token[0] == '%';
}

auto canonical_or_self(const fs::path& path) -> fs::path
{
  std::error_code error;
  auto canonical = fs::weakly_canonical(path, error);
  return error ? path : canonical;
}

struct desktop_entry
{
  std::string type;
  std::string name;
  std::string exec;
  std::string try_exec;
  std::string icon;
  bool no_display = false;
  bool hidden = false;
};

auto parse_desktop_entry(std::istream& input) -> desktop_entry
{
  desktop_entry result;
  bool in_desktop_entry = false;
  std::string raw_line;
  while (std::getline(input, raw_line)) {
    const auto line = trim(raw_line);
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (line[0] == '[') {
      in_desktop_entry = line == "[Desktop Entry]";
      continue;
    }
    if (!in_desktop_entry) {
      continue;
    }
    const auto equals = line.find('=');
    if (equals == std::string_view::npos) {
      continue;
    }
    const auto key = trim(line.substr(0, equals));
    const auto value = std::string {trim(line.substr(equals + 1))};
    if (key == "Type") {
      result.type = value;
    } else if (key == "Name") {
      result.name = unescape_key_file_string(value);
    } else if (key == "Exec") {
      result.exec = unescape_key_file_string(value);
    } else if (key == "TryExec") {
      result.try_exec = unescape_key_file_string(value);
    } else if (key == "Icon") {
      result.icon = unescape_key_file_string(value);
    } else if (key == "NoDisplay") {
      result.no_display = value == "true";
    } else if (key == "Hidden") {
      result.hidden = value == "true";
    }
  }
  return result;
}

class byte_reader
{
public:
  explicit byte_reader(const std::vector<std::uint8_t>& data)
      : m_data(data)
  {
  }

  auto has(size_t offset, size_t count) const -> bool
  {
    return offset <= m_data.size() && count <= m_data.size() - offset;
  }

  auto u16(size_t offset) const -> std::optional<std::uint16_t>
  {
    if (!has(offset, 2)) {
      return std::nullopt;
    }
    return static_cast<std::uint16_t>(m_data[offset]
                                      | (m_data[offset + 1] << 8U));
  }

  auto u32(size_t offset) const -> std::optional<std::uint32_t>
  {
    if (!has(offset, 4)) {
      return std::nullopt;
    }
    std::uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
      value |= static_cast<std::uint32_t>(m_data[offset + i]) << (8U * i);
    }
    return value;
  }

  // NUL-terminated single-byte string starting at offset.
  auto c_string(size_t offset) const -> std::optional<std::string>
  {
    if (offset >= m_data.size()) {
      return std::nullopt;
    }
    std::string result;
    for (size_t i = offset; i < m_data.size(); ++i) {
      if (m_data[i] == 0) {
        return result;
      }
      result.push_back(static_cast<char>(m_data[i]));
    }
    return std::nullopt;
  }

  // UTF-16LE units, either NUL-terminated (count == npos) or counted.
  auto utf16_string(size_t offset, size_t count = std::string::npos) const
      -> std::optional<std::string>
  {
    std::u16string units;
    for (size_t pos = offset; units.size() < count; pos += 2) {
      const auto unit = u16(pos);
      if (!unit) {
        return std::nullopt;
      }
      if (count == std::string::npos && *unit == 0) {
        break;
      }
      units.push_back(static_cast<char16_t>(*unit));
    }
    return to_utf8(units);
  }

  auto bytes(size_t offset, size_t count) const -> std::optional<std::string>
  {
    if (!has(offset, count)) {
      return std::nullopt;
    }
    return std::string {m_data.begin() + static_cast<std::ptrdiff_t>(offset),
                        m_data.begin()
                            + static_cast<std::ptrdiff_t>(offset + count)};
  }

private:
  static auto to_utf8(const std::u16string& units) -> std::string
  {
    std::u32string codes;
    codes.reserve(units.size());
    for (size_t i = 0; i < units.size(); ++i) {
      char32_t code = units[i];
      // NOLINTBEGIN(*magic-numbers*)
      if (code >= 0xD800 && code <= 0xDBFF && i + 1 < units.size()
          && units[i + 1] >= 0xDC00 && units[i + 1] <= 0xDFFF)
      {
        code = 0x10000 + ((code - 0xD800) << 10U) + (units[i + 1] - 0xDC00);
        ++i;
      }
      // NOLINTEND(*magic-numbers*)
      codes.push_back(code);
    }
    return encode_utf8(codes);
  }

  const std::vector<std::uint8_t>& m_data;
};

// MS-SHLLINK layout constants.
constexpr std::uint32_t link_header_size = 0x4C;
constexpr size_t link_flags_offset = 20;
constexpr std::uint32_t has_link_target_id_list = 0x1;
constexpr std::uint32_t has_link_info = 0x2;
constexpr std::uint32_t has_name = 0x4;
constexpr std::uint32_t has_relative_path = 0x8;
constexpr std::uint32_t has_working_dir = 0x10;
constexpr std::uint32_t has_arguments = 0x20;
constexpr std::uint32_t has_icon_location = 0x40;
constexpr std::uint32_t is_unicode = 0x80;
constexpr std::uint32_t volume_id_and_local_base_path = 0x1;
constexpr std::uint32_t link_info_unicode_header_size = 0x24;
constexpr size_t max_link_file_size = 1U << 20U;

// Unicode strings arrive as UTF-8, ANSI ones in the system code page.
auto windows_to_native(std::string path) -> fs::path
{
#ifdef _WIN32
  if (!is_valid_utf8(path)) {
    return fs::path {path};
  }
#else
  std::replace(path.begin(), path.end(), '\\', '/');
#endif
  return fs::u8path(path);
}

}  // namespace

auto tokenize_exec(const std::string& exec_value) -> std::vector<std::string>
{
  std::vector<std::string> tokens;
  std::string buffer;
  bool escape_pending = false;
  bool inside_quotes = false;
  bool quoted_part = false;

  auto flush = [&]
  {
    if (!buffer.empty() || quoted_part) {
      tokens.push_back(std::move(buffer));
      buffer.clear();
      quoted_part = false;
    }
  };

  for (const auto chr : exec_value) {
    if (escape_pending) {
      if (inside_quotes && chr != '`' && chr != '"' && chr != '$' && chr != '\\')
      {
        buffer += '\\';
      }
      buffer += chr;
      escape_pending = false;
    } else if (chr == '\\') {
      escape_pending = true;
    } else if (inside_quotes) {
      if (chr == '"') {
        inside_quotes = false;
      } else {
        buffer += chr;
      }
    } else if (chr == '"') {
      inside_quotes = true;
      quoted_part = true;
    } else if (chr == ' ' || chr == '\t') {
      flush();
    } else {
      buffer += chr;
    }
  }
  flush();
  return tokens;
}

auto is_executable_file(const fs::path& path) -> bool
{
  std::error_code error;
  const auto status = fs::status(path, error);
  if (error || !fs::is_regular_file(status)) {
    return false;
  }
  constexpr auto exec_bits =
      fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
  return (status.permissions() & exec_bits) != fs::perms::none;
}

auto split_search_path(std::string_view value) -> std::vector<fs::path>
{
  std::vector<fs::path> dirs;
  for (auto& dir : split(value, search_path_separator)) {
    if (!dir.empty()) {
      dirs.emplace_back(std::move(dir));
    }
  }
  return dirs;
}

desktop_entry_resolver::desktop_entry_resolver()
{
  const char* env_path = std::getenv("PATH");
  if (env_path != nullptr) {
    m_search_path = split_search_path(env_path);
  }
}

desktop_entry_resolver::desktop_entry_resolver(
    std::vector<fs::path> search_path)
    : m_search_path(std::move(search_path))
{
}

auto desktop_entry_resolver::find_executable(const std::string& command) const
    -> std::optional<fs::path>
{
  if (command.empty()) {
    return std::nullopt;
  }
  if (command.find('/') != std::string::npos) {
    if (is_executable_file(fs::u8path(command))) {
      return fs::u8path(command);
    }
    return std::nullopt;
  }
  for (const auto& dir : m_search_path) {
    auto candidate = dir / fs::u8path(command);
    if (is_executable_file(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

auto desktop_entry_resolver::resolve(const fs::path& shortcut) const
    -> std::optional<shortcut_target>
{
  std::ifstream file {shortcut};
  if (!file) {
    return std::nullopt;
  }
  const auto desktop = parse_desktop_entry(file);
  if ((!desktop.type.empty() && desktop.type != "Application")
      || desktop.no_display || desktop.hidden)
  {
    return std::nullopt;
  }
  if (!desktop.try_exec.empty() && !find_executable(desktop.try_exec)) {
    return std::nullopt;
  }

  auto tokens = tokenize_exec(desktop.exec);
  if (tokens.empty()) {
    return std::nullopt;
  }
  const auto program = find_executable(tokens.front());
  if (!program) {
    return std::nullopt;
  }
  const auto extra_arguments =
      std::any_of(std::next(tokens.begin()),
                  tokens.end(),
                  [](const std::string& token) { return !is_field_code(token); });

  shortcut_target result;
  result.target = canonical_or_self(extra_arguments ? shortcut : *program);
  result.display_name = desktop.name;
  result.icon_name = desktop.icon;
  return result;
}

auto shell_link_resolver::resolve(const fs::path& shortcut) const
    -> std::optional<shortcut_target>
{
  std::error_code error;
  const auto size = fs::file_size(shortcut, error);
  if (error || size < link_header_size || size > max_link_file_size) {
    return std::nullopt;
  }
  std::ifstream file {shortcut, std::ios::binary};
  if (!file) {
    return std::nullopt;
  }
  const std::vector<std::uint8_t> data {std::istreambuf_iterator<char> {file},
                                        std::istreambuf_iterator<char> {}};
  const byte_reader reader {data};

  if (reader.u32(0) != link_header_size) {
    return std::nullopt;
  }
  const auto flags = reader.u32(link_flags_offset);
  if (!flags) {
    return std::nullopt;
  }

  size_t offset = link_header_size;
  if ((*flags & has_link_target_id_list) != 0) {
    const auto id_list_size = reader.u16(offset);
    if (!id_list_size) {
      return std::nullopt;
    }
    offset += 2 + *id_list_size;
  }

  std::optional<std::string> base_path;
  if ((*flags & has_link_info) != 0) {
    const auto info_size = reader.u32(offset);
    const auto header_size = reader.u32(offset + 4);
    const auto info_flags = reader.u32(offset + 8);
    if (!info_size || !header_size || !info_flags
        || !reader.has(offset, *info_size))
    {
      return std::nullopt;
    }
    if ((*info_flags & volume_id_and_local_base_path) != 0) {
      const auto local_offset = reader.u32(offset + 16);
      const auto suffix_offset = reader.u32(offset + 24);
      if (*header_size >= link_info_unicode_header_size) {
        const auto local_unicode = reader.u32(offset + 28);
        const auto suffix_unicode = reader.u32(offset + 32);
        if (local_unicode && *local_unicode != 0) {
          base_path = reader.utf16_string(offset + *local_unicode);
          if (base_path && suffix_unicode && *suffix_unicode != 0) {
            *base_path += reader.utf16_string(offset + *suffix_unicode)
                              .value_or(std::string {});
          }
        }
      }
      if (!base_path && local_offset) {
        base_path = reader.c_string(offset + *local_offset);
        if (base_path && suffix_offset && *suffix_offset != 0) {
          *base_path +=
              reader.c_string(offset + *suffix_offset).value_or(std::string {});
        }
      }
    }
    offset += *info_size;
  }

  // StringData: NAME, RELATIVE_PATH, WORKING_DIR, ARGUMENTS, ICON_LOCATION.
  const bool unicode = (*flags & is_unicode) != 0;
  auto read_string_data = [&]() -> std::optional<std::string>
  {
    const auto count = reader.u16(offset);
    if (!count) {
      return std::nullopt;
    }
    offset += 2;
    auto value = unicode ? reader.utf16_string(offset, *count)
                         : reader.bytes(offset, *count);
    offset += unicode ? 2U * *count : *count;
    return value;
  };

  std::optional<std::string> name;
  std::optional<std::string> relative_path;
  std::optional<std::string> icon_location;
  for (const auto flag : {has_name,
                          has_relative_path,
                          has_working_dir,
                          has_arguments,
                          has_icon_location})
  {
    if ((*flags & flag) == 0) {
      continue;
    }
    auto value = read_string_data();
    if (!value) {
      break;
    }
    if (flag == has_name) {
      name = std::move(value);
    } else if (flag == has_relative_path) {
      relative_path = std::move(value);
    } else if (flag == has_icon_location) {
      icon_location = std::move(value);
    }
  }

  fs::path target;
  if (base_path && !base_path->empty()) {
    target = windows_to_native(*base_path);
  } else if (relative_path && !relative_path->empty()) {
    target = shortcut.parent_path() / windows_to_native(*relative_path);
  } else {
    return std::nullopt;
  }
  if (!fs::exists(target, error) || error) {
    spdlog::debug("shortcut {}: target {} is gone",
                  shortcut.u8string(),
                  target.u8string());
    return std::nullopt;
  }

  shortcut_target result;
  result.target = canonical_or_self(target);
  result.display_name = name.value_or(std::string {});
  result.icon_name = icon_location.value_or(std::string {});
  return result;
}

void extension_resolver::add(std::string extension,
                             std::unique_ptr<shortcut_resolver> resolver)
{
  m_resolvers[to_lower(extension)] = std::move(resolver);
}

auto extension_resolver::resolve(const fs::path& shortcut) const
    -> std::optional<shortcut_target>
{
  const auto iter = m_resolvers.find(to_lower(shortcut.extension().u8string()));
  if (iter == m_resolvers.end()) {
    return std::nullopt;
  }
  return iter->second->resolve(shortcut);
}

auto make_default_shortcut_resolver() -> std::unique_ptr<shortcut_resolver>
{
  auto resolver = std::make_unique<extension_resolver>();
  resolver->add(".desktop", std::make_unique<desktop_entry_resolver>());
  resolver->add(".lnk", std::make_unique<shell_link_resolver>());
  return resolver;
}

}  // namespace adx
