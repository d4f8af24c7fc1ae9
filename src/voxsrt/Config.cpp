// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/FileIo.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>

namespace voxsrt
{

namespace
{

    [[nodiscard]] auto validate(const AppConfig& config) -> VoidResult
    {
        auto const& composer = config.composer;
        if (!std::isfinite(composer.estimator.interSentenceGap) || composer.estimator.interSentenceGap < 0.0)
            return makeError(ErrorCode::ConfigError,
                             std::format("estimator.interSentenceGap must be >= 0, got {}",
                                         composer.estimator.interSentenceGap));
        if (!std::isfinite(composer.interTurnSilence) || composer.interTurnSilence < 0.0)
            return makeError(ErrorCode::ConfigError,
                             std::format("podcast.interTurnSilence must be >= 0, got {}", composer.interTurnSilence));
        if (composer.segmenter.language.empty())
            return makeError(ErrorCode::ConfigError, "segmenter.language must not be empty");
        return {};
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\voxsrt";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/voxsrt";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/voxsrt";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/voxsrt";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto lineEndingFromString(std::string_view text) -> Result<LineEnding>
{
    auto lowered = std::string {};
    for (auto const ch: text)
        lowered += static_cast<char>((ch >= 'A' && ch <= 'Z') ? ch - 'A' + 'a' : ch);

    if (lowered == "lf")
        return LineEnding::Lf;
    if (lowered == "crlf")
        return LineEnding::CrLf;
    return makeError(ErrorCode::ConfigError, std::format("Unknown line ending '{}' (expected lf or crlf)", text));
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto content = readTextFile(std::filesystem::path(path));
    if (!content)
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto parseResult = json::parse(*content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    auto config = AppConfig {};

    // Segmenter section
    if (root.contains("segmenter"))
    {
        auto const& segmenter = root["segmenter"];
        config.composer.segmenter.language = json::getStringOr(segmenter, "language", "en");
        config.composer.segmenter.abbreviations = json::getStringArray(segmenter, "abbreviations");
    }

    // Estimator section
    if (root.contains("estimator"))
    {
        auto const& estimator = root["estimator"];
        config.composer.estimator.interSentenceGap = json::getNumberOr(estimator, "interSentenceGap", 0.0);
    }

    // Podcast section
    if (root.contains("podcast"))
    {
        auto const& podcast = root["podcast"];
        config.composer.interTurnSilence = json::getNumberOr(podcast, "interTurnSilence", 0.0);
        config.composer.speakerLabelFormat = json::getStringOr(podcast, "speakerLabelFormat", "[{}]: ");
    }

    // Output section
    if (root.contains("output"))
    {
        auto lineEnding = lineEndingFromString(json::getStringOr(root["output"], "lineEnding", "lf"));
        if (!lineEnding)
            return std::unexpected(lineEnding.error());
        config.output.lineEnding = *lineEnding;
    }

    if (auto valid = validate(config); !valid)
        return std::unexpected(valid.error());

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Segmenter section
    auto segmenter = nlohmann::json::object();
    segmenter["language"] = config.composer.segmenter.language;
    if (config.composer.segmenter.abbreviations)
        segmenter["abbreviations"] = *config.composer.segmenter.abbreviations;
    root["segmenter"] = std::move(segmenter);

    // Estimator section
    auto estimator = nlohmann::json::object();
    estimator["interSentenceGap"] = config.composer.estimator.interSentenceGap;
    root["estimator"] = std::move(estimator);

    // Podcast section
    auto podcast = nlohmann::json::object();
    podcast["interTurnSilence"] = config.composer.interTurnSilence;
    podcast["speakerLabelFormat"] = config.composer.speakerLabelFormat;
    root["podcast"] = std::move(podcast);

    // Output section
    auto output = nlohmann::json::object();
    output["lineEnding"] = std::string(lineEndingToString(config.output.lineEnding));
    root["output"] = std::move(output);

    auto result = writeFileAtomically(std::filesystem::path(path), root.dump(4) + '\n');
    if (!result)
        return makeError(ErrorCode::ConfigError, result.error().message);
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace voxsrt
