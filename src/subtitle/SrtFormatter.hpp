// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <subtitle/Types.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace voxsrt
{

/// @brief Line ending used throughout one rendered SRT document.
enum class LineEnding : std::uint8_t
{
    Lf,
    CrLf,
};

/// @brief Options for rendering SRT text.
struct SrtOptions
{
    LineEnding lineEnding = LineEnding::Lf;
};

/// @brief Converts seconds to whole milliseconds, truncating any finer fraction.
[[nodiscard]] auto toMilliseconds(double seconds) -> std::int64_t;

/// @brief Formats a time as an SRT timestamp, e.g. "01:02:03,456".
///
/// Hours are padded to two digits and are not wrapped at 24.
/// @param seconds A non-negative time in seconds.
[[nodiscard]] auto formatTimestamp(double seconds) -> std::string;

/// @brief Parses an SRT timestamp ("HH:MM:SS,mmm", '.' also accepted) into seconds.
[[nodiscard]] auto parseTimestamp(std::string_view text) -> Result<double>;

/// @brief Renders cues as an SRT document.
///
/// Each cue becomes its index line, a "start --> end" line, its text lines and a blank line.
/// @param cues The cues in output order.
/// @param options Rendering options.
/// @return The SRT text, or FormatError for a cue with a negative start, end <= start,
///         an index below 1 or text that would break the block structure.
[[nodiscard]] auto formatSrt(std::span<const Cue> cues, const SrtOptions& options = {}) -> Result<std::string>;

/// @brief Parses an SRT document into cues with millisecond precision.
///
/// Accepts LF and CRLF line endings and a leading UTF-8 byte order mark.
/// Multi-line cue text is joined with '\n'.
/// @param text The SRT document.
/// @return The cues, or ParseError naming the offending line.
[[nodiscard]] auto parseSrt(std::string_view text) -> Result<std::vector<Cue>>;

} // namespace voxsrt
