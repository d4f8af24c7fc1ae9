// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <concepts>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Error.hpp"

namespace voxsrt::json
{

/// @brief Parses a JSON document, turning parser exceptions into a ParseError.
[[nodiscard]] inline auto parse(std::string_view input) -> Result<nlohmann::json>
{
    try
    {
        return nlohmann::json::parse(input);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        return makeError(ErrorCode::ParseError, std::format("JSON parse error: {}", e.what()));
    }
}

/// @brief Returns the string at @p key, or @p defaultValue if it is missing or not a string.
[[nodiscard]] inline auto getStringOr(const nlohmann::json& obj,
                                      std::string_view key,
                                      std::string_view defaultValue) -> std::string
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_string())
        return it->get<std::string>();
    return std::string(defaultValue);
}

/// @brief Returns the number at @p key converted to @p T, or @p defaultValue if it is missing or not a number.
template <typename T>
    requires std::floating_point<T>
[[nodiscard]] auto getNumberOr(const nlohmann::json& obj, std::string_view key, T defaultValue) -> T
{
    auto const it = obj.find(std::string(key));
    if (it != obj.end() && it->is_number())
        return it->get<T>();
    return defaultValue;
}

/// @brief Looks up an optional numeric field that must be a number when present.
/// @return std::nullopt if @p key is absent, the value if it is a number, ParseError otherwise.
[[nodiscard]] inline auto findNumber(const nlohmann::json& obj, std::string_view key) -> Result<std::optional<double>>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end())
        return std::nullopt;
    if (!it->is_number())
        return makeError(ErrorCode::ParseError, std::format("\"{}\" must be a number", key));
    return it->get<double>();
}

/// @brief Collects the string elements of the array at @p key, skipping anything else.
/// @return The strings, or std::nullopt if the field is missing or not an array.
[[nodiscard]] inline auto getStringArray(const nlohmann::json& obj, std::string_view key)
    -> std::optional<std::vector<std::string>>
{
    auto const it = obj.find(std::string(key));
    if (it == obj.end() || !it->is_array())
        return std::nullopt;

    auto values = std::vector<std::string> {};
    for (auto const& item: *it)
    {
        if (item.is_string())
            values.push_back(item.get<std::string>());
    }
    return values;
}

} // namespace voxsrt::json
