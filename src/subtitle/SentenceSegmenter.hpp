// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxsrt
{

/// @brief Configuration for sentence segmentation.
struct SegmenterConfig
{
    /// @brief Language code selecting the punctuation rules (en, vi, ja, zh, ko).
    ///
    /// Only the first two characters are significant; unknown languages use the English rules.
    std::string language = "en";

    /// @brief Tokens that do not end a sentence when followed by a period.
    ///
    /// Compared case-insensitively, without the trailing period.
    /// When unset, the default list for the language is used.
    std::optional<std::vector<std::string>> abbreviations;
};

/// @brief Returns the built-in abbreviation list for a language.
/// @param language The language code (e.g. "en", "vi-VN").
/// @return The abbreviations, empty for languages without any.
[[nodiscard]] auto defaultAbbreviations(std::string_view language) -> std::vector<std::string>;

/// @brief Splits text into trimmed, non-empty sentences in their original order.
///
/// A run of terminal punctuation ('.', '!', '?') ends a sentence when the next
/// non-whitespace character is the end of the text, an uppercase letter, a quote or
/// an opening bracket. A single period after a known abbreviation or an initial does
/// not end a sentence. For CJK languages the full-width terminators always end a sentence.
///
/// @param text The text to split.
/// @param config Segmentation rules.
/// @return The sentences, or an empty vector if @p text is blank.
[[nodiscard]] auto segmentSentences(std::string_view text, const SegmenterConfig& config = {})
    -> std::vector<std::string>;

} // namespace voxsrt
