#include <utility>

#include "entry.hpp"

#include "text.hpp"

namespace adx
{

auto to_string(entry_origin origin) -> std::string_view
{
  switch (origin) {
    case entry_origin::start_menu:
      return "start_menu";
    case entry_origin::program_files:
      return "program_files";
    case entry_origin::extra_path:
      return "extra_path";
  }
  return "extra_path";
}

auto origin_from_string(std::string_view text) -> std::optional<entry_origin>
{
  for (const auto origin : {entry_origin::start_menu,
                            entry_origin::program_files,
                            entry_origin::extra_path})
  {
    if (to_string(origin) == text) {
      return origin;
    }
  }
  return std::nullopt;
}

auto make_entry(std::string name,
                std::filesystem::path launch_target,
                entry_origin origin,
                std::filesystem::path source_path,
                std::string icon_name) -> entry
{
  entry result;
  result.normalized_name = normalize_name(name);
  result.name = std::move(name);
  result.launch_target = std::move(launch_target);
  result.origin = origin;
  result.source_path = std::move(source_path);
  result.icon_name = std::move(icon_name);
  return result;
}

}  // namespace adx
