// SPDX-License-Identifier: Apache-2.0
#include "SrtFormatter.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <system_error>

namespace voxsrt
{

namespace
{

    /// @brief Absorbs binary representation error so that e.g. 5.2 s yields 5200 ms, not 5199 ms.
    constexpr auto TruncationTolerance = 1e-6;

    constexpr auto ArrowSeparator = std::string_view { " --> " };

    /// @brief Upper bound for the hours field, keeping the millisecond total far from overflow.
    constexpr auto MaxHours = std::int64_t { 999'999 };

    [[nodiscard]] auto lineEndingText(LineEnding ending) -> std::string_view
    {
        return ending == LineEnding::CrLf ? "\r\n" : "\n";
    }

    [[nodiscard]] auto parseUnsigned(std::string_view text, std::int64_t& value) -> bool
    {
        if (text.empty())
            return false;
        auto const* const end = text.data() + text.size();
        auto const [ptr, ec] = std::from_chars(text.data(), end, value);
        return ec == std::errc {} && ptr == end && value >= 0;
    }

    /// @brief Splits text into lines, dropping a trailing '\r' from each.
    [[nodiscard]] auto splitLines(std::string_view text) -> std::vector<std::string_view>
    {
        auto lines = std::vector<std::string_view> {};
        auto start = std::size_t { 0 };
        while (start <= text.size())
        {
            auto end = text.find('\n', start);
            if (end == std::string_view::npos)
                end = text.size();
            auto line = text.substr(start, end - start);
            if (line.ends_with('\r'))
                line.remove_suffix(1);
            lines.push_back(line);
            start = end + 1;
        }
        return lines;
    }

    [[nodiscard]] auto isBlank(std::string_view line) -> bool
    {
        return line.find_first_not_of(" \t") == std::string_view::npos;
    }

    [[nodiscard]] auto trimAscii(std::string_view text) -> std::string_view
    {
        auto const first = text.find_first_not_of(" \t");
        if (first == std::string_view::npos)
            return {};
        auto const last = text.find_last_not_of(" \t");
        return text.substr(first, last - first + 1);
    }

    [[nodiscard]] auto validateCue(const Cue& cue) -> VoidResult
    {
        if (cue.index < 1)
            return makeError(ErrorCode::FormatError, std::format("Cue index must be at least 1, got {}", cue.index));
        if (!std::isfinite(cue.start) || !std::isfinite(cue.end))
            return makeError(ErrorCode::FormatError, std::format("Cue {} has a non-finite time", cue.index));
        if (cue.start < 0.0)
            return makeError(ErrorCode::FormatError,
                             std::format("Cue {} starts at a negative time ({})", cue.index, cue.start));
        if (cue.end <= cue.start)
            return makeError(ErrorCode::FormatError,
                             std::format("Cue {} ends at {} which is not after its start {}",
                                         cue.index,
                                         cue.end,
                                         cue.start));
        // The rendered timestamps are truncated, so the span must survive at millisecond precision.
        if (toMilliseconds(cue.end) <= toMilliseconds(cue.start))
            return makeError(ErrorCode::FormatError,
                             std::format("Cue {} is shorter than a millisecond ({}s to {}s)",
                                         cue.index,
                                         cue.start,
                                         cue.end));
        if (cue.text.empty())
            return makeError(ErrorCode::FormatError, std::format("Cue {} has no text", cue.index));
        for (auto const line: splitLines(cue.text))
        {
            if (isBlank(line))
                return makeError(ErrorCode::FormatError, std::format("Cue {} text contains a blank line", cue.index));
        }
        return {};
    }

} // namespace

auto toMilliseconds(double seconds) -> std::int64_t
{
    return static_cast<std::int64_t>(std::floor(seconds * 1000.0 + TruncationTolerance));
}

auto formatTimestamp(double seconds) -> std::string
{
    auto const totalMs = std::max<std::int64_t>(0, toMilliseconds(seconds));
    auto const hours = totalMs / 3'600'000;
    auto const minutes = (totalMs / 60'000) % 60;
    auto const secs = (totalMs / 1000) % 60;
    auto const millis = totalMs % 1000;
    return std::format("{:02}:{:02}:{:02},{:03}", hours, minutes, secs, millis);
}

auto parseTimestamp(std::string_view text) -> Result<double>
{
    text = trimAscii(text);

    auto const invalid = [&] {
        return makeError(ErrorCode::ParseError, std::format("Invalid SRT timestamp: '{}'", text));
    };

    auto const firstColon = text.find(':');
    auto const secondColon = firstColon == std::string_view::npos ? firstColon : text.find(':', firstColon + 1);
    auto const separator = text.find_first_of(",.");
    if (secondColon == std::string_view::npos || separator == std::string_view::npos || separator < secondColon)
        return invalid();

    auto hours = std::int64_t { 0 };
    auto minutes = std::int64_t { 0 };
    auto secs = std::int64_t { 0 };
    auto millis = std::int64_t { 0 };

    auto const millisText = text.substr(separator + 1);
    if (!parseUnsigned(text.substr(0, firstColon), hours)
        || !parseUnsigned(text.substr(firstColon + 1, secondColon - firstColon - 1), minutes)
        || !parseUnsigned(text.substr(secondColon + 1, separator - secondColon - 1), secs)
        || millisText.size() != 3 || !parseUnsigned(millisText, millis))
        return invalid();

    if (hours > MaxHours || minutes > 59 || secs > 59)
        return invalid();

    auto const totalMs = ((hours * 60 + minutes) * 60 + secs) * 1000 + millis;
    return static_cast<double>(totalMs) / 1000.0;
}

auto formatSrt(std::span<const Cue> cues, const SrtOptions& options) -> Result<std::string>
{
    auto const eol = lineEndingText(options.lineEnding);
    auto output = std::string {};

    for (auto const& cue: cues)
    {
        if (auto valid = validateCue(cue); !valid)
            return std::unexpected(valid.error());

        output += std::format("{}{}", cue.index, eol);
        output += std::format("{}{}{}{}", formatTimestamp(cue.start), ArrowSeparator, formatTimestamp(cue.end), eol);

        for (auto const line: splitLines(cue.text))
        {
            output += line;
            output += eol;
        }
        output += eol;
    }

    return output;
}

auto parseSrt(std::string_view text) -> Result<std::vector<Cue>>
{
    if (text.starts_with("\xEF\xBB\xBF"))
        text.remove_prefix(3);

    auto const lines = splitLines(text);
    auto cues = std::vector<Cue> {};
    auto i = std::size_t { 0 };

    auto const parseError = [&](std::size_t lineIndex, std::string_view what) {
        return makeError(ErrorCode::ParseError, std::format("SRT line {}: {}", lineIndex + 1, what));
    };

    while (i < lines.size())
    {
        if (isBlank(lines[i]))
        {
            ++i;
            continue;
        }

        auto index = std::int64_t { 0 };
        if (!parseUnsigned(trimAscii(lines[i]), index) || index < 1)
            return parseError(i, std::format("expected a cue index, got '{}'", lines[i]));
        if (index > std::numeric_limits<int>::max())
            return parseError(i, std::format("cue index {} is out of range", index));
        ++i;

        if (i >= lines.size())
            return parseError(i, "missing timestamp line");

        auto const timing = lines[i];
        auto const arrow = timing.find("-->");
        if (arrow == std::string_view::npos)
            return parseError(i, std::format("expected 'start --> end', got '{}'", timing));

        // Anything after the end timestamp (positioning hints) is ignored.
        auto endText = trimAscii(timing.substr(arrow + 3));
        if (auto const space = endText.find_first_of(" \t"); space != std::string_view::npos)
            endText = endText.substr(0, space);

        auto start = parseTimestamp(timing.substr(0, arrow));
        if (!start)
            return parseError(i, start.error().message);
        auto end = parseTimestamp(endText);
        if (!end)
            return parseError(i, end.error().message);
        ++i;

        auto cueText = std::string {};
        while (i < lines.size() && !isBlank(lines[i]))
        {
            if (!cueText.empty())
                cueText += '\n';
            cueText += lines[i];
            ++i;
        }

        cues.push_back(Cue {
            .index = static_cast<int>(index),
            .start = *start,
            .end = *end,
            .text = std::move(cueText),
        });
    }

    return cues;
}

} // namespace voxsrt
