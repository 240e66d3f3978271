#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

#include "catalog.hpp"
#include "entry.hpp"
#include "search.hpp"

namespace adx
{

// Row text that is not valid UTF-8 is sent as {"hex": ...}, see json_text.hpp.
void to_json(nlohmann::json& jsn, const icon_reference& icon);
void to_json(nlohmann::json& jsn, const query_row& row);
void to_json(nlohmann::json& jsn, const catalog_status& status);

// Reply of the search methods. With a client sequence number the query is
// admitted through gate; without one the server numbers it. Either way a
// reply overtaken by a newer query is {"superseded": true} with no results.
auto search_reply(const catalog& source,
                  query_gate& gate,
                  std::string_view query,
                  std::optional<std::uint64_t> sequence = std::nullopt)
    -> nlohmann::json;

}  // namespace adx
