// SPDX-License-Identifier: Apache-2.0
#include "PodcastScript.hpp"

#include <core/Utf8.hpp>

#include <format>
#include <optional>

namespace voxsrt
{

namespace
{

    constexpr auto MaxSpeakerNameLength = std::size_t { 40 };

    struct SpeakerLine
    {
        std::string_view speaker;
        std::string_view utterance;
    };

    [[nodiscard]] auto splitSpeakerLine(std::string_view line) -> std::optional<SpeakerLine>
    {
        auto const colon = line.find(':');
        if (colon == std::string_view::npos)
            return std::nullopt;

        auto const speaker = utf8::trim(line.substr(0, colon));
        if (speaker.empty() || utf8::codePointCount(speaker) > MaxSpeakerNameLength)
            return std::nullopt;
        if (speaker.find_first_of(".!?") != std::string_view::npos)
            return std::nullopt;

        return SpeakerLine { .speaker = speaker, .utterance = utf8::trim(line.substr(colon + 1)) };
    }

} // namespace

auto parsePodcastScript(std::string_view script) -> Result<std::vector<ScriptTurn>>
{
    if (script.starts_with("\xEF\xBB\xBF"))
        script.remove_prefix(3);

    auto turns = std::vector<ScriptTurn> {};
    auto lineNumber = std::size_t { 0 };
    auto start = std::size_t { 0 };

    while (start < script.size())
    {
        auto end = script.find('\n', start);
        if (end == std::string_view::npos)
            end = script.size();
        auto const line = utf8::trim(script.substr(start, end - start));
        start = end + 1;
        ++lineNumber;

        if (line.empty() || line.starts_with('#'))
            continue;

        if (auto const speakerLine = splitSpeakerLine(line))
        {
            if (speakerLine->utterance.empty())
                return makeError(ErrorCode::ParseError,
                                 std::format("Script line {}: speaker '{}' has no text", lineNumber, speakerLine->speaker));
            turns.push_back(ScriptTurn {
                .speaker = std::string(speakerLine->speaker),
                .text = std::string(speakerLine->utterance),
            });
            continue;
        }

        if (turns.empty())
            return makeError(ErrorCode::ParseError,
                             std::format("Script line {}: expected 'Speaker: text', got '{}'", lineNumber, line));

        turns.back().text += ' ';
        turns.back().text += line;
    }

    return turns;
}

auto toSpeechSegments(std::span<const ScriptTurn> turns, std::span<const double> durations)
    -> Result<std::vector<SpeechSegment>>
{
    if (turns.size() != durations.size())
        return makeError(ErrorCode::InvalidInput,
                         std::format("Script has {} turn(s) but {} duration(s) were given", turns.size(), durations.size()));

    auto segments = std::vector<SpeechSegment> {};
    segments.reserve(turns.size());
    for (auto i = std::size_t { 0 }; i < turns.size(); ++i)
    {
        segments.push_back(SpeechSegment {
            .text = turns[i].text,
            .totalDurationSeconds = durations[i],
            .speakerLabel = turns[i].speaker,
        });
    }
    return segments;
}

} // namespace voxsrt
