// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <subtitle/Types.hpp>

#include <span>
#include <string>
#include <vector>

namespace voxsrt
{

/// @brief Configuration for apportioning a segment's duration over its sentences.
struct EstimatorConfig
{
    /// @brief Silence in seconds inserted between consecutive sentences.
    ///
    /// The gap is taken from the two neighbouring sentences in proportion to their
    /// durations. It is skipped for any pair where it would leave a sentence with no time.
    double interSentenceGap = 0.0;
};

/// @brief Assigns each sentence a time span within a segment of @p totalDuration seconds.
///
/// Durations are proportional to the sentence length in code points. The first span
/// starts at 0 and the last span ends exactly at @p totalDuration.
///
/// @param sentences The sentences in speaking order.
/// @param totalDuration The measured duration of the spoken segment, in seconds.
/// @param rate The speech rate of the segment. It is already reflected in @p totalDuration
///             and does not scale the result.
/// @param config Estimation parameters.
/// @return One span per sentence, or InvalidInput if @p totalDuration is not positive
///         or @p sentences is empty.
[[nodiscard]] auto estimateDurations(std::span<const std::string> sentences,
                                     double totalDuration,
                                     float rate = 1.0f,
                                     const EstimatorConfig& config = {}) -> Result<std::vector<TimeSpan>>;

} // namespace voxsrt
