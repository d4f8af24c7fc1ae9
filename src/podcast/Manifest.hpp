// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <subtitle/Types.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace voxsrt
{

/// @brief Builds speech segments from a parsed podcast manifest.
///
/// The manifest has the form
/// @code
/// { "turns": [ { "speaker": "Alice", "text": "...", "duration": 2.5,
///                "audio": "alice.wav", "srt": "alice.srt", "rate": 1.0, "volume": 1.0 } ] }
/// @endcode
/// Every turn needs "text" or "srt". The duration is taken from "duration" or, when absent,
/// by probing "audio". Relative file paths are resolved against @p baseDir.
/// @param root The manifest document.
/// @param baseDir Directory used to resolve relative paths.
/// @return The segments in manifest order, or an error naming the offending turn.
[[nodiscard]] auto segmentsFromManifest(const nlohmann::json& root, const std::filesystem::path& baseDir)
    -> Result<std::vector<SpeechSegment>>;

/// @brief Loads a podcast manifest file (see segmentsFromManifest()).
/// @param path Path to the JSON manifest.
/// @return The segments, or IoError/ParseError/InvalidSegment.
[[nodiscard]] auto loadManifest(std::string_view path) -> Result<std::vector<SpeechSegment>>;

} // namespace voxsrt
