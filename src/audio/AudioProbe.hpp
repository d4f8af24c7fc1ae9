// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <span>
#include <string_view>

namespace voxsrt
{

/// @brief Reads the playing time of an audio file (WAV, MP3 or FLAC) using miniaudio.
/// @param path Path to the audio file.
/// @return The duration in seconds, or AudioError if the file cannot be decoded or is empty.
[[nodiscard]] auto probeAudioDuration(std::string_view path) -> Result<double>;

/// @brief Reads the playing time of encoded audio held in memory.
/// @param data The encoded audio bytes, as returned by a synthesis engine.
/// @return The duration in seconds, or AudioError if the data cannot be decoded or is empty.
[[nodiscard]] auto probeAudioDuration(std::span<const std::byte> data) -> Result<double>;

/// @brief Rough spoken duration of @p text when no audio is available.
///
/// Assumes about 15 characters per second at normal rate, with a one second minimum.
/// @param text The text that would be spoken.
/// @param rate Speech rate multiplier; values <= 0 are treated as 1.
[[nodiscard]] auto estimateSpokenDuration(std::string_view text, float rate = 1.0f) -> double;

} // namespace voxsrt
