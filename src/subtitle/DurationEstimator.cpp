// SPDX-License-Identifier: Apache-2.0
#include "DurationEstimator.hpp"

#include <core/Log.hpp>
#include <core/Utf8.hpp>

#include <cmath>
#include <format>

namespace voxsrt
{

namespace
{

    /// @brief Shrinks neighbouring spans to open a gap of @p gap seconds between each pair.
    void insertGaps(std::vector<TimeSpan>& spans, double gap)
    {
        for (auto i = std::size_t { 0 }; i + 1 < spans.size(); ++i)
        {
            auto& left = spans[i];
            auto& right = spans[i + 1];

            auto const leftDuration = left.duration();
            auto const rightDuration = right.duration();
            auto const combined = leftDuration + rightDuration;
            if (combined <= 0.0)
                continue;

            auto const leftCut = gap * (leftDuration / combined);
            auto const rightCut = gap - leftCut;
            if (leftDuration - leftCut <= 0.0 || rightDuration - rightCut <= 0.0)
            {
                log::debug("Skipping inter-sentence gap between sentences {} and {}", i + 1, i + 2);
                continue;
            }

            left.end -= leftCut;
            right.start += rightCut;
        }
    }

} // namespace

auto estimateDurations(std::span<const std::string> sentences,
                       double totalDuration,
                       float /*rate*/,
                       const EstimatorConfig& config) -> Result<std::vector<TimeSpan>>
{
    if (!std::isfinite(totalDuration) || totalDuration <= 0.0)
        return makeError(ErrorCode::InvalidInput,
                         std::format("Total duration must be positive, got {}", totalDuration));

    if (sentences.empty())
        return makeError(ErrorCode::InvalidInput, "Cannot estimate durations for an empty sentence list");

    auto lengths = std::vector<std::size_t> {};
    lengths.reserve(sentences.size());
    auto totalLength = std::size_t { 0 };
    for (auto const& sentence: sentences)
    {
        lengths.push_back(utf8::codePointCount(utf8::trim(sentence)));
        totalLength += lengths.back();
    }

    auto spans = std::vector<TimeSpan> {};
    spans.reserve(sentences.size());

    auto cursor = 0.0;
    for (auto i = std::size_t { 0 }; i < sentences.size(); ++i)
    {
        auto const share = totalLength == 0
                               ? 1.0 / static_cast<double>(sentences.size())
                               : static_cast<double>(lengths[i]) / static_cast<double>(totalLength);
        auto const start = cursor;
        auto const end = (i + 1 == sentences.size()) ? totalDuration : start + totalDuration * share;
        spans.push_back(TimeSpan { .start = start, .end = end });
        cursor = end;
    }

    if (config.interSentenceGap > 0.0)
        insertGaps(spans, config.interSentenceGap);

    return spans;
}

} // namespace voxsrt
