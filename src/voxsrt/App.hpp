// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <subtitle/Types.hpp>
#include <voxsrt/Config.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxsrt
{

/// @brief Subtitles for a single synthesized text.
struct ComposeRequest
{
    std::string text;      ///< Literal text; used when textPath is empty.
    std::string textPath;  ///< File holding the spoken text.
    std::optional<double> duration;
    std::string audioPath; ///< Synthesized audio to measure when no duration is given.
    float rate = 1.0f;
    std::string outputPath; ///< Empty writes to stdout.
};

/// @brief Subtitles for a multi-speaker podcast.
struct PodcastRequest
{
    std::string scriptPath;       ///< "Speaker: text" script, paired with durations.
    std::vector<double> durations;
    std::string manifestPath;     ///< JSON manifest; used when scriptPath is empty.
    std::string outputPath;       ///< Empty writes to stdout.
};

/// @brief Validates a timeline and renders it as SRT text.
[[nodiscard]] auto renderTimeline(const Timeline& timeline, const AppConfig& config) -> Result<std::string>;

/// @brief Command-line front end wiring inputs, composition and output together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);

    /// @brief Writes subtitles for one text.
    [[nodiscard]] auto runCompose(const ComposeRequest& request) -> VoidResult;

    /// @brief Writes merged subtitles for a podcast.
    [[nodiscard]] auto runPodcast(const PodcastRequest& request) -> VoidResult;

    /// @brief Parses and validates an SRT file, printing a summary to stdout.
    [[nodiscard]] auto runCheck(std::string_view srtPath) -> VoidResult;

    [[nodiscard]] auto config() const noexcept -> const AppConfig& { return _config; }

  private:
    [[nodiscard]] auto emit(const Timeline& timeline, std::string_view outputPath) const -> VoidResult;

    AppConfig _config;
};

} // namespace voxsrt
