// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <subtitle/DurationEstimator.hpp>
#include <subtitle/SentenceSegmenter.hpp>
#include <subtitle/Types.hpp>

#include <span>
#include <string>

namespace voxsrt
{

/// @brief Everything the composer needs to turn speech segments into a timeline.
struct ComposerConfig
{
    SegmenterConfig segmenter;
    EstimatorConfig estimator;

    /// @brief Silence in seconds between consecutive podcast turns.
    double interTurnSilence = 0.0;

    /// @brief Prefix template applied to cue text of labelled turns; "{}" is the speaker label.
    std::string speakerLabelFormat = "[{}]: ";
};

/// @brief Builds the timeline of a single speech segment.
///
/// The segment text is split into sentences, each sentence receives a share of the
/// segment duration and the cues are numbered from 1. No speaker label is applied.
/// @param segment The synthesized segment.
/// @param config Composition parameters.
/// @return The timeline, or InvalidInput for blank text or a non-positive duration.
[[nodiscard]] auto compose(const SpeechSegment& segment, const ComposerConfig& config = {}) -> Result<Timeline>;

/// @brief Builds one continuous timeline from consecutive podcast turns.
///
/// Each turn is composed on its own and shifted by the summed durations of all
/// earlier turns plus the configured inter-turn silence. Indices run contiguously
/// across turns, and labelled turns get their label prefixed to each cue.
/// @param turns The turns in speaking order.
/// @param config Composition parameters.
/// @return The merged timeline, or InvalidSegment naming the first turn that failed.
[[nodiscard]] auto composePodcast(std::span<const SpeechSegment> turns, const ComposerConfig& config = {})
    -> Result<Timeline>;

/// @brief Checks index numbering, cue ordering and non-overlap of a timeline.
[[nodiscard]] auto validateTimeline(const Timeline& timeline) -> VoidResult;

/// @brief Applies a speaker label template to a cue text.
[[nodiscard]] auto applySpeakerLabel(std::string_view labelFormat, std::string_view label, std::string_view text)
    -> std::string;

} // namespace voxsrt
