#include "json_text.hpp"

#include "text.hpp"

namespace adx
{

using nlohmann::json;

auto text_to_json(std::string_view text) -> json
{
  if (is_valid_utf8(text)) {
    return std::string {text};
  }
  return json {{"hex", bytes_to_hex(text)}};
}

auto text_from_json(const json& jsn) -> std::string
{
  if (jsn.is_object()) {
    return hex_to_bytes(jsn.at("hex").get<std::string>());
  }
  return jsn.get<std::string>();
}

auto path_to_json(const std::filesystem::path& path) -> json
{
  return text_to_json(path.u8string());
}

auto path_from_json(const json& jsn) -> std::filesystem::path
{
  return std::filesystem::u8path(text_from_json(jsn));
}

}  // namespace adx
