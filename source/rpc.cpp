#include <variant>

#include "rpc.hpp"

#include <fmt/format.h>

#include "json_text.hpp"

namespace adx
{

using nlohmann::json;

void to_json(json& jsn, const icon_reference& icon)
{
  if (const auto* bitmap = std::get_if<bitmap_icon>(&icon)) {
    jsn = json {{"kind", "bitmap"}, {"path", path_to_json(bitmap->path)}};
    return;
  }
  const auto& placeholder = std::get<placeholder_icon>(icon);
  jsn = json {
      {"kind", "placeholder"},
      {"letter", text_to_json(placeholder.letter)},
      {"color", fmt::format("#{:06x}", placeholder.color)},
  };
}

void to_json(json& jsn, const query_row& row)
{
  jsn = json {
      {"display_name", text_to_json(row.display_name)},
      {"launch_target", text_to_json(row.launch_target)},
      {"icon", row.icon},
      {"score", row.score},
  };
}

void to_json(json& jsn, const catalog_status& status)
{
  jsn = json {
      {"indexing", status.indexing},
      {"entries", status.entry_count},
      {"generation", status.generation},
  };
  if (status.last_build) {
    jsn["from_cache"] = status.last_build->from_cache;
    jsn["cache_written"] = status.last_build->cache_written;
    jsn["warnings"] = status.last_build->warning_count;
  }
}

auto search_reply(const catalog& source,
                  query_gate& gate,
                  std::string_view query,
                  std::optional<std::uint64_t> sequence) -> json
{
  const auto stale = json {{"superseded", true}, {"results", json::array()}};
  if (!sequence) {
    sequence = gate.open();
  } else if (!gate.admit(*sequence)) {
    return stale;
  }
  auto rows = source.search(query);
  if (!gate.is_current(*sequence)) {
    return stale;
  }
  return json {{"superseded", false}, {"results", rows}};
}

}  // namespace adx
