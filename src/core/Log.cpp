// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <algorithm>
#include <cctype>
#include <print>
#include <string>
#include <utility>

namespace voxsrt::log
{

namespace
{
    auto currentLevel = Level::Info;
    auto currentSink = Sink {};
} // namespace

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    auto lowered = std::string(name);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) { return std::tolower(c); });

    if (lowered == "warn")
        return Level::Warning;
    for (auto const level: { Level::Error, Level::Warning, Level::Info, Level::Debug })
    {
        if (lowered == levelName(level))
            return level;
    }
    return std::nullopt;
}

void setSink(Sink sink)
{
    currentSink = std::move(sink);
}

void setLevel(Level level)
{
    currentLevel = level;
}

auto getLevel() -> Level
{
    return currentLevel;
}

void write(Level level, std::string_view message)
{
    if (level > currentLevel)
        return;

    if (currentSink)
    {
        currentSink(level, message);
        return;
    }

    // Subtitles may go to stdout, so diagnostics always use stderr.
    std::println(stderr, "voxsrt: {}: {}", levelName(level), message);
}

ScopedSink::ScopedSink(Sink sink): _previous(std::exchange(currentSink, std::move(sink)))
{
}

ScopedSink::~ScopedSink()
{
    currentSink = std::move(_previous);
}

} // namespace voxsrt::log
