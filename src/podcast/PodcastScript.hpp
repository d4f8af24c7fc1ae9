// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <subtitle/Types.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace voxsrt
{

/// @brief One utterance of a podcast script.
struct ScriptTurn
{
    std::string speaker;
    std::string text;
};

/// @brief Parses a podcast script made of "SpeakerName: utterance" lines.
///
/// Blank lines and lines starting with '#' are ignored. A line without a speaker
/// prefix continues the utterance of the previous turn.
/// @param script The script text.
/// @return The turns in script order, or ParseError naming the offending line.
[[nodiscard]] auto parsePodcastScript(std::string_view script) -> Result<std::vector<ScriptTurn>>;

/// @brief Pairs script turns with their measured durations.
/// @param turns The parsed script turns.
/// @param durations The spoken duration of each turn in seconds, in the same order.
/// @return One labelled segment per turn, or InvalidInput if the counts differ.
[[nodiscard]] auto toSpeechSegments(std::span<const ScriptTurn> turns, std::span<const double> durations)
    -> Result<std::vector<SpeechSegment>>;

} // namespace voxsrt
