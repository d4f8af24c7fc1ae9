// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>
#include <voxsrt/App.hpp>
#include <voxsrt/Config.hpp>

#include <CLI/CLI.hpp>

#include <string>

int main(int argc, char** argv)
{
    auto app = CLI::App { "voxsrt: subtitles for synthesized speech and multi-speaker podcasts" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto language = std::string {};
    auto crlf = false;
    auto verbose = false;
    auto logLevel = std::string {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--language", language, "Language for sentence splitting (en, vi, ja, zh, ko)");
    app.add_flag("--crlf", crlf, "Write CRLF line endings");
    auto* verboseFlag = app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_option("--log-level", logLevel, "Log level: error, warning, info or debug")->excludes(verboseFlag);

    auto composeRequest = voxsrt::ComposeRequest {};
    auto duration = 0.0;
    auto* compose = app.add_subcommand("compose", "Subtitles for one synthesized text");
    auto* textFileOption = compose->add_option("-i,--input", composeRequest.textPath, "Text file that was spoken");
    compose->add_option("-t,--text", composeRequest.text, "Text that was spoken")->excludes(textFileOption);
    auto* durationOption = compose->add_option("-d,--duration", duration, "Spoken duration in seconds");
    compose->add_option("-a,--audio", composeRequest.audioPath, "Synthesized audio file to measure")
        ->excludes(durationOption);
    compose->add_option("-r,--rate", composeRequest.rate, "Speech rate multiplier");
    compose->add_option("-o,--output", composeRequest.outputPath, "Output .srt file (default: stdout)");

    auto podcastRequest = voxsrt::PodcastRequest {};
    auto* podcast = app.add_subcommand("podcast", "Merged subtitles for a multi-speaker podcast");
    auto* scriptOption =
        podcast->add_option("-s,--script", podcastRequest.scriptPath, "Podcast script ('Speaker: text' lines)");
    podcast->add_option("-d,--durations", podcastRequest.durations, "Spoken duration of each turn in seconds")
        ->delimiter(',')
        ->needs(scriptOption);
    podcast->add_option("-m,--manifest", podcastRequest.manifestPath, "JSON manifest describing the turns")
        ->excludes(scriptOption);
    podcast->add_option("-o,--output", podcastRequest.outputPath, "Output .srt file (default: stdout)");

    auto checkPath = std::string {};
    auto* check = app.add_subcommand("check", "Validate an SRT file");
    check->add_option("file", checkPath, "SRT file to validate")->required();

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        voxsrt::log::setLevel(voxsrt::log::Level::Debug);
    else if (!logLevel.empty())
    {
        auto const level = voxsrt::log::parseLevel(logLevel);
        if (!level)
        {
            voxsrt::log::error("Unknown log level '{}'", logLevel);
            return 1;
        }
        voxsrt::log::setLevel(*level);
    }

    // Load config
    auto configResult = configPath.empty() ? voxsrt::loadConfig() : voxsrt::loadConfigFromFile(configPath);
    if (!configResult)
    {
        voxsrt::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!language.empty())
    {
        config.composer.segmenter.language = language;
        config.composer.segmenter.abbreviations.reset();
    }
    if (crlf)
        config.output.lineEnding = voxsrt::LineEnding::CrLf;

    if (durationOption->count() > 0)
        composeRequest.duration = duration;

    auto application = voxsrt::App(std::move(config));
    auto result = voxsrt::VoidResult {};

    if (compose->parsed())
        result = application.runCompose(composeRequest);
    else if (podcast->parsed())
        result = application.runPodcast(podcastRequest);
    else if (check->parsed())
        result = application.runCheck(checkPath);

    if (!result)
    {
        voxsrt::log::error("{}", result.error());
        return 1;
    }

    return 0;
}
