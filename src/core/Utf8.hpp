// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace voxsrt::utf8
{

/// @brief A code point decoded from a UTF-8 byte sequence.
struct DecodedCodePoint
{
    char32_t codePoint = 0;
    std::size_t length = 0; ///< Number of bytes consumed (at least 1 unless at end of input).
};

/// @brief Replacement character produced for malformed sequences.
constexpr char32_t ReplacementCharacter = 0xFFFD;

/// @brief Decodes the code point starting at byte offset @p pos.
///
/// Malformed or truncated sequences decode to U+FFFD and consume one byte,
/// so a scan always makes progress.
/// @param text The UTF-8 text.
/// @param pos Byte offset into @p text.
/// @return The code point and its encoded length, or a zero length at end of input.
[[nodiscard]] auto decodeAt(std::string_view text, std::size_t pos) -> DecodedCodePoint;

/// @brief Returns the byte offset of the code point that ends right before @p pos.
[[nodiscard]] auto previousOffset(std::string_view text, std::size_t pos) -> std::size_t;

/// @brief Counts code points in a UTF-8 string.
[[nodiscard]] auto codePointCount(std::string_view text) -> std::size_t;

/// @brief Returns true for ASCII whitespace, NBSP and the ideographic space.
[[nodiscard]] auto isWhitespace(char32_t codePoint) -> bool;

/// @brief Maps Latin (including Vietnamese), Greek and Cyrillic capitals to their lowercase letter.
///
/// Code points outside those ranges are returned unchanged.
[[nodiscard]] auto toLower(char32_t codePoint) -> char32_t;

/// @brief Returns true for the capitals toLower() knows about.
[[nodiscard]] auto isUppercase(char32_t codePoint) -> bool;

/// @brief Appends the UTF-8 encoding of @p codePoint to @p out.
void append(std::string& out, char32_t codePoint);

/// @brief Lowercases every code point of @p text with toLower(); malformed bytes become U+FFFD.
[[nodiscard]] auto foldCase(std::string_view text) -> std::string;

/// @brief Trims leading and trailing whitespace (see isWhitespace).
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

} // namespace voxsrt::utf8
