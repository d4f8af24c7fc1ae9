// SPDX-License-Identifier: Apache-2.0
#include "TimelineComposer.hpp"

#include <core/Log.hpp>
#include <core/Utf8.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <vector>

namespace voxsrt
{

namespace
{

    [[nodiscard]] auto hasPositiveDuration(const SpeechSegment& segment) -> bool
    {
        return std::isfinite(segment.totalDurationSeconds) && segment.totalDurationSeconds > 0.0;
    }

    /// @brief Cues of one segment, relative to the segment start and numbered from 1.
    [[nodiscard]] auto estimatedCues(const SpeechSegment& segment, const ComposerConfig& config)
        -> Result<std::vector<Cue>>
    {
        auto const sentences = segmentSentences(segment.text, config.segmenter);
        auto spans = estimateDurations(sentences, segment.totalDurationSeconds, segment.rate, config.estimator);
        if (!spans)
            return std::unexpected(spans.error());

        auto cues = std::vector<Cue> {};
        cues.reserve(sentences.size());
        for (auto i = std::size_t { 0 }; i < sentences.size(); ++i)
        {
            cues.push_back(Cue {
                .index = static_cast<int>(i + 1),
                .start = (*spans)[i].start,
                .end = (*spans)[i].end,
                .text = sentences[i],
            });
        }
        return cues;
    }

    /// @brief Engine-provided cues, ordered and limited to the segment duration.
    [[nodiscard]] auto nativeCues(const SpeechSegment& segment) -> Result<std::vector<Cue>>
    {
        auto cues = *segment.nativeCues;
        std::ranges::stable_sort(cues, {}, &Cue::start);

        auto const limit = segment.totalDurationSeconds;
        auto kept = std::vector<Cue> {};
        kept.reserve(cues.size());

        for (auto& cue: cues)
        {
            if (cue.start < 0.0)
                return makeError(ErrorCode::InvalidInput,
                                 std::format("Native cue '{}' starts at a negative time", cue.text));
            if (cue.start >= limit)
            {
                log::warning("Dropping native cue '{}' starting after the segment end ({:.3f}s)", cue.text, limit);
                continue;
            }
            cue.end = std::min(cue.end, limit);
            if (cue.end <= cue.start)
                return makeError(ErrorCode::InvalidInput,
                                 std::format("Native cue '{}' does not end after it starts", cue.text));
            if (!kept.empty() && cue.start < kept.back().end)
                return makeError(ErrorCode::InvalidInput,
                                 std::format("Native cue '{}' overlaps the cue before it", cue.text));

            cue.index = static_cast<int>(kept.size() + 1);
            kept.push_back(std::move(cue));
        }

        if (kept.empty())
            return makeError(ErrorCode::InvalidInput, "Segment has no native cues within its duration");
        return kept;
    }

    [[nodiscard]] auto segmentCues(const SpeechSegment& segment, const ComposerConfig& config)
        -> Result<std::vector<Cue>>
    {
        if (!hasPositiveDuration(segment))
            return makeError(ErrorCode::InvalidInput,
                             std::format("Segment duration must be positive, got {}", segment.totalDurationSeconds));

        if (segment.nativeCues)
            return nativeCues(segment);

        if (utf8::trim(segment.text).empty())
            return makeError(ErrorCode::InvalidInput, "Segment text is empty");

        return estimatedCues(segment, config);
    }

} // namespace

auto applySpeakerLabel(std::string_view labelFormat, std::string_view label, std::string_view text) -> std::string
{
    auto prefix = std::string(labelFormat);
    if (auto const placeholder = prefix.find("{}"); placeholder != std::string::npos)
        prefix.replace(placeholder, 2, label);
    return prefix + std::string(text);
}

auto compose(const SpeechSegment& segment, const ComposerConfig& config) -> Result<Timeline>
{
    auto cues = segmentCues(segment, config);
    if (!cues)
        return std::unexpected(cues.error());

    log::debug("Composed {} cue(s) over {:.3f}s", cues->size(), segment.totalDurationSeconds);
    return Timeline { .cues = std::move(*cues), .totalDuration = segment.totalDurationSeconds };
}

auto composePodcast(std::span<const SpeechSegment> turns, const ComposerConfig& config) -> Result<Timeline>
{
    if (turns.empty())
        return makeError(ErrorCode::InvalidInput, "Podcast has no turns");

    // Reject bad durations before doing any work so that no partial timeline exists.
    for (auto k = std::size_t { 0 }; k < turns.size(); ++k)
    {
        if (!hasPositiveDuration(turns[k]))
            return makeError(ErrorCode::InvalidSegment,
                             std::format("Turn {} has a non-positive duration ({})", k, turns[k].totalDurationSeconds));
    }

    auto timeline = Timeline {};
    auto offset = 0.0;

    for (auto k = std::size_t { 0 }; k < turns.size(); ++k)
    {
        auto const& turn = turns[k];
        if (k > 0)
            offset += config.interTurnSilence;

        if (!turn.nativeCues && utf8::trim(turn.text).empty())
        {
            log::debug("Turn {} has no text; advancing the timeline by {:.3f}s", k, turn.totalDurationSeconds);
            offset += turn.totalDurationSeconds;
            continue;
        }

        auto cues = segmentCues(turn, config);
        if (!cues)
            return makeError(ErrorCode::InvalidSegment, std::format("Turn {}: {}", k, cues.error().message));

        for (auto& cue: *cues)
        {
            cue.index = static_cast<int>(timeline.cues.size() + 1);
            cue.start += offset;
            cue.end += offset;
            if (turn.speakerLabel)
                cue.text = applySpeakerLabel(config.speakerLabelFormat, *turn.speakerLabel, cue.text);
            timeline.cues.push_back(std::move(cue));
        }

        log::debug("Turn {} ({}) placed at {:.3f}s with {} cue(s)",
                   k,
                   turn.speakerLabel.value_or("unlabelled"),
                   offset,
                   cues->size());
        offset += turn.totalDurationSeconds;
    }

    timeline.totalDuration = offset;
    return timeline;
}

auto validateTimeline(const Timeline& timeline) -> VoidResult
{
    for (auto i = std::size_t { 0 }; i < timeline.cues.size(); ++i)
    {
        auto const& cue = timeline.cues[i];
        if (cue.index != static_cast<int>(i + 1))
            return makeError(ErrorCode::FormatError,
                             std::format("Cue at position {} has index {}, expected {}", i + 1, cue.index, i + 1));
        if (cue.start < 0.0 || cue.end <= cue.start)
            return makeError(ErrorCode::FormatError,
                             std::format("Cue {} has an invalid span [{}, {}]", cue.index, cue.start, cue.end));
        if (i > 0 && timeline.cues[i - 1].end > cue.start)
            return makeError(ErrorCode::FormatError,
                             std::format("Cue {} overlaps cue {}", cue.index, timeline.cues[i - 1].index));
    }

    if (!timeline.cues.empty() && timeline.cues.back().end > timeline.totalDuration)
        return makeError(ErrorCode::FormatError,
                         std::format("Last cue ends at {} after the timeline end {}",
                                     timeline.cues.back().end,
                                     timeline.totalDuration));
    return {};
}

} // namespace voxsrt
