#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace adx
{

// File names are bytes (POSIX) and need not be valid UTF-8. Valid text is
// written as a JSON string, anything else as {"hex": "<raw bytes>"}, so every
// document dumps with the strict error handler and reads back byte for byte.
auto text_to_json(std::string_view text) -> nlohmann::json;

// Throws nlohmann::json::exception on a value of the wrong shape and
// std::invalid_argument on damaged hex.
auto text_from_json(const nlohmann::json& jsn) -> std::string;

auto path_to_json(const std::filesystem::path& path) -> nlohmann::json;
auto path_from_json(const nlohmann::json& jsn) -> std::filesystem::path;

}  // namespace adx
