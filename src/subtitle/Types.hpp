// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace voxsrt
{

/// @brief A single subtitle cue. Times are in seconds from the start of the timeline.
struct Cue
{
    int index = 1;
    double start = 0.0;
    double end = 0.0;
    std::string text; // May span multiple lines separated by '\n'.
};

/// @brief Start and end of one sentence within its segment, in seconds.
struct TimeSpan
{
    double start = 0.0;
    double end = 0.0;

    [[nodiscard]] auto duration() const -> double { return end - start; }
};

/// @brief One synthesized stretch of speech, as reported by the synthesis collaborator.
struct SpeechSegment
{
    std::string text;
    double totalDurationSeconds = 0.0;
    std::optional<std::string> speakerLabel;
    float rate = 1.0f;
    float volume = 1.0f;

    /// @brief Cues already timed by the synthesis engine, relative to the segment start.
    ///
    /// When present they replace sentence segmentation and duration estimation.
    std::optional<std::vector<Cue>> nativeCues;
};

/// @brief Ordered cues plus the cumulative duration they cover.
struct Timeline
{
    std::vector<Cue> cues;
    double totalDuration = 0.0;
};

} // namespace voxsrt
