// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioProbe.hpp>
#include <core/FileIo.hpp>
#include <core/Log.hpp>
#include <podcast/Manifest.hpp>
#include <podcast/PodcastScript.hpp>
#include <subtitle/SrtFormatter.hpp>
#include <subtitle/TimelineComposer.hpp>

#include <cstdio>
#include <filesystem>
#include <format>
#include <print>

namespace voxsrt
{

auto renderTimeline(const Timeline& timeline, const AppConfig& config) -> Result<std::string>
{
    if (auto valid = validateTimeline(timeline); !valid)
        return std::unexpected(valid.error());

    return formatSrt(timeline.cues, SrtOptions { .lineEnding = config.output.lineEnding });
}

App::App(AppConfig config): _config(std::move(config))
{
}

auto App::emit(const Timeline& timeline, std::string_view outputPath) const -> VoidResult
{
    // Everything is rendered before the first byte is written.
    auto srt = renderTimeline(timeline, _config);
    if (!srt)
        return std::unexpected(srt.error());

    if (outputPath.empty())
    {
        std::print(stdout, "{}", *srt);
        std::fflush(stdout);
        return {};
    }

    auto result = writeFileAtomically(std::filesystem::path(outputPath), *srt);
    if (!result)
        return result;

    log::info("Wrote {} cue(s) covering {:.3f}s to {}", timeline.cues.size(), timeline.totalDuration, outputPath);
    return {};
}

auto App::runCompose(const ComposeRequest& request) -> VoidResult
{
    auto segment = SpeechSegment { .text = request.text, .rate = request.rate };

    if (!request.textPath.empty())
    {
        auto content = readTextFile(std::filesystem::path(request.textPath));
        if (!content)
            return std::unexpected(content.error());
        segment.text = std::move(*content);
    }

    if (request.duration)
        segment.totalDurationSeconds = *request.duration;
    else if (!request.audioPath.empty())
    {
        auto duration = probeAudioDuration(request.audioPath);
        if (!duration)
            return std::unexpected(duration.error());
        segment.totalDurationSeconds = *duration;
    }
    else
    {
        segment.totalDurationSeconds = estimateSpokenDuration(segment.text, request.rate);
        log::warning("No duration or audio given; using a text-based estimate of {:.2f}s",
                     segment.totalDurationSeconds);
    }

    auto timeline = compose(segment, _config.composer);
    if (!timeline)
        return std::unexpected(timeline.error());

    return emit(*timeline, request.outputPath);
}

auto App::runPodcast(const PodcastRequest& request) -> VoidResult
{
    auto segments = std::vector<SpeechSegment> {};

    if (!request.scriptPath.empty())
    {
        auto content = readTextFile(std::filesystem::path(request.scriptPath));
        if (!content)
            return std::unexpected(content.error());

        auto turns = parsePodcastScript(*content);
        if (!turns)
            return std::unexpected(turns.error());

        auto converted = toSpeechSegments(*turns, request.durations);
        if (!converted)
            return std::unexpected(converted.error());
        segments = std::move(*converted);
    }
    else if (!request.manifestPath.empty())
    {
        auto loaded = loadManifest(request.manifestPath);
        if (!loaded)
            return std::unexpected(loaded.error());
        segments = std::move(*loaded);
    }
    else
        return makeError(ErrorCode::InvalidInput, "A podcast needs a script or a manifest");

    auto timeline = composePodcast(segments, _config.composer);
    if (!timeline)
        return std::unexpected(timeline.error());

    return emit(*timeline, request.outputPath);
}

auto App::runCheck(std::string_view srtPath) -> VoidResult
{
    auto content = readTextFile(std::filesystem::path(srtPath));
    if (!content)
        return std::unexpected(content.error());

    auto cues = parseSrt(*content);
    if (!cues)
        return std::unexpected(cues.error());

    auto timeline = Timeline { .cues = std::move(*cues) };
    if (!timeline.cues.empty())
        timeline.totalDuration = timeline.cues.back().end;

    if (auto valid = validateTimeline(timeline); !valid)
        return std::unexpected(valid.error());

    std::println(stdout,
                 "{}: {} cue(s), {} --> {}",
                 srtPath,
                 timeline.cues.size(),
                 formatTimestamp(timeline.cues.empty() ? 0.0 : timeline.cues.front().start),
                 formatTimestamp(timeline.totalDuration));
    return {};
}

} // namespace voxsrt
