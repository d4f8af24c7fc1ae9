// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <subtitle/SrtFormatter.hpp>
#include <subtitle/TimelineComposer.hpp>

#include <string>
#include <string_view>

namespace voxsrt
{

/// @brief Output file configuration section.
struct OutputConfig
{
    LineEnding lineEnding = LineEnding::Lf;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    /// @brief Segmentation, estimation and podcast composition parameters.
    ComposerConfig composer;
    OutputConfig output;
};

/// @brief Loads the application configuration from the default config path.
///
/// A missing file is not an error; the defaults are returned.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Parses "lf" or "crlf" (case-insensitive).
[[nodiscard]] auto lineEndingFromString(std::string_view text) -> Result<LineEnding>;

/// @brief Returns "lf" or "crlf".
[[nodiscard]] constexpr auto lineEndingToString(LineEnding ending) -> std::string_view
{
    return ending == LineEnding::CrLf ? "crlf" : "lf";
}

} // namespace voxsrt
