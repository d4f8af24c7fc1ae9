// SPDX-License-Identifier: Apache-2.0
#include "Manifest.hpp"

#include <audio/AudioProbe.hpp>
#include <core/FileIo.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <subtitle/SrtFormatter.hpp>

#include <format>

namespace voxsrt
{

namespace
{

    [[nodiscard]] auto resolve(const std::filesystem::path& baseDir, std::string_view file) -> std::filesystem::path
    {
        auto path = std::filesystem::path(file);
        if (path.is_relative())
            path = baseDir / path;
        return path;
    }

    [[nodiscard]] auto turnError(std::size_t index, std::string_view message) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::InvalidSegment, std::format("Manifest turn {}: {}", index, message));
    }

    [[nodiscard]] auto parseTurn(const nlohmann::json& turn, std::size_t index, const std::filesystem::path& baseDir)
        -> Result<SpeechSegment>
    {
        if (!turn.is_object())
            return turnError(index, "expected an object");

        auto segment = SpeechSegment {};
        segment.text = json::getStringOr(turn, "text", "");
        segment.rate = json::getNumberOr(turn, "rate", 1.0f);
        segment.volume = json::getNumberOr(turn, "volume", 1.0f);

        if (auto const speaker = json::getStringOr(turn, "speaker", ""); !speaker.empty())
            segment.speakerLabel = speaker;

        if (segment.rate <= 0.0f)
            return turnError(index, std::format("rate must be positive, got {}", segment.rate));
        if (segment.volume < 0.0f || segment.volume > 1.0f)
            return turnError(index, std::format("volume must be within 0..1, got {}", segment.volume));

        if (auto const srtFile = json::getStringOr(turn, "srt", ""); !srtFile.empty())
        {
            auto content = readTextFile(resolve(baseDir, srtFile));
            if (!content)
                return std::unexpected(content.error());
            auto cues = parseSrt(*content);
            if (!cues)
                return turnError(index, std::format("{}: {}", srtFile, cues.error().message));
            segment.nativeCues = std::move(*cues);
        }

        auto const duration = json::findNumber(turn, "duration");
        if (!duration)
            return turnError(index, duration.error().message);

        if (*duration)
            segment.totalDurationSeconds = **duration;
        else if (auto const audioFile = json::getStringOr(turn, "audio", ""); !audioFile.empty())
        {
            auto probed = probeAudioDuration(resolve(baseDir, audioFile).string());
            if (!probed)
                return turnError(index, probed.error().message);
            segment.totalDurationSeconds = *probed;
        }
        else
            return turnError(index, "needs a \"duration\" or an \"audio\" file");

        if (segment.text.empty() && !segment.nativeCues)
            log::warning("Manifest turn {} has neither text nor subtitles", index);

        return segment;
    }

} // namespace

auto segmentsFromManifest(const nlohmann::json& root, const std::filesystem::path& baseDir)
    -> Result<std::vector<SpeechSegment>>
{
    if (!root.is_object() || !root.contains("turns") || !root["turns"].is_array())
        return makeError(ErrorCode::ParseError, "Manifest must be an object with a \"turns\" array");

    auto segments = std::vector<SpeechSegment> {};
    auto index = std::size_t { 0 };
    for (auto const& turn: root["turns"])
    {
        auto segment = parseTurn(turn, index, baseDir);
        if (!segment)
            return std::unexpected(segment.error());
        segments.push_back(std::move(*segment));
        ++index;
    }

    log::info("Loaded {} podcast turn(s) from manifest", segments.size());
    return segments;
}

auto loadManifest(std::string_view path) -> Result<std::vector<SpeechSegment>>
{
    auto content = readTextFile(std::filesystem::path(path));
    if (!content)
        return std::unexpected(content.error());

    auto root = json::parse(*content);
    if (!root)
        return std::unexpected(root.error());

    return segmentsFromManifest(*root, std::filesystem::path(path).parent_path());
}

} // namespace voxsrt
