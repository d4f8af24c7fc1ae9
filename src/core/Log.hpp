// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace voxsrt::log
{

/// @brief Verbosity level for log messages, most severe first.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
};

/// @brief Receives every message that passes the level filter.
using Sink = std::function<void(Level level, std::string_view message)>;

/// @brief Returns the lowercase name of a level ("error", "warning", "info", "debug").
[[nodiscard]] constexpr auto levelName(Level level) noexcept -> std::string_view
{
    switch (level)
    {
        case Level::Error: return "error";
        case Level::Warning: return "warning";
        case Level::Info: return "info";
        case Level::Debug: return "debug";
    }
    return "unknown";
}

/// @brief Parses a level name as accepted by --log-level (case-insensitive, "warn" allowed).
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Routes messages to @p sink instead of stderr. An empty sink restores stderr.
void setSink(Sink sink);

void setLevel(Level level);

[[nodiscard]] auto getLevel() -> Level;

/// @brief Emits @p message at @p level if the current level lets it through.
void write(Level level, std::string_view message);

/// @brief Installs a sink for the lifetime of the object, restoring the previous one afterwards.
class ScopedSink
{
  public:
    explicit ScopedSink(Sink sink);
    ~ScopedSink();

    ScopedSink(const ScopedSink&) = delete;
    auto operator=(const ScopedSink&) -> ScopedSink& = delete;

  private:
    Sink _previous;
};

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Warning)
        write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Info)
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs a debug message. Arguments are not formatted unless debug output is enabled.
template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (getLevel() >= Level::Debug)
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace voxsrt::log
