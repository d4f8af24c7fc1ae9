// SPDX-License-Identifier: Apache-2.0
#include "AudioProbe.hpp"

#include <core/Log.hpp>
#include <core/Utf8.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <format>
#include <string>

namespace voxsrt
{

namespace
{

    constexpr auto FallbackCharactersPerSecond = 15.0;
    constexpr auto MinimumFallbackDuration = 1.0;

    /// @brief Owns an initialized ma_decoder.
    struct DecoderGuard
    {
        ma_decoder decoder {};
        bool initialized = false;

        DecoderGuard() = default;
        DecoderGuard(const DecoderGuard&) = delete;
        DecoderGuard& operator=(const DecoderGuard&) = delete;

        ~DecoderGuard()
        {
            if (initialized)
                ma_decoder_uninit(&decoder);
        }
    };

    [[nodiscard]] auto measure(DecoderGuard& guard, std::string_view source) -> Result<double>
    {
        auto frames = ma_uint64 { 0 };
        auto const rc = ma_decoder_get_length_in_pcm_frames(&guard.decoder, &frames);
        if (rc != MA_SUCCESS)
            return makeError(ErrorCode::AudioError,
                             std::format("Cannot determine the length of {} (miniaudio error {})",
                                         source,
                                         static_cast<int>(rc)));

        auto const sampleRate = guard.decoder.outputSampleRate;
        if (frames == 0 || sampleRate == 0)
            return makeError(ErrorCode::AudioError, std::format("{} contains no audio", source));

        auto const seconds = static_cast<double>(frames) / static_cast<double>(sampleRate);
        log::debug("Probed {}: {} frames at {} Hz = {:.3f}s", source, frames, sampleRate, seconds);
        return seconds;
    }

} // namespace

auto probeAudioDuration(std::string_view path) -> Result<double>
{
    auto guard = DecoderGuard {};
    auto const config = ma_decoder_config_init(ma_format_f32, 0, 0);
    auto const pathStr = std::string(path);

    auto const rc = ma_decoder_init_file(pathStr.c_str(), &config, &guard.decoder);
    if (rc != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Cannot open audio file '{}' (miniaudio error {})", path, static_cast<int>(rc)));
    guard.initialized = true;

    return measure(guard, std::format("'{}'", path));
}

auto probeAudioDuration(std::span<const std::byte> data) -> Result<double>
{
    if (data.empty())
        return makeError(ErrorCode::AudioError, "Audio buffer is empty");

    auto guard = DecoderGuard {};
    auto const config = ma_decoder_config_init(ma_format_f32, 0, 0);

    auto const rc = ma_decoder_init_memory(data.data(), data.size(), &config, &guard.decoder);
    if (rc != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Cannot decode audio buffer of {} bytes (miniaudio error {})",
                                     data.size(),
                                     static_cast<int>(rc)));
    guard.initialized = true;

    return measure(guard, "audio buffer");
}

auto estimateSpokenDuration(std::string_view text, float rate) -> double
{
    auto const characters = static_cast<double>(utf8::codePointCount(utf8::trim(text)));
    auto const normalRate = std::max(MinimumFallbackDuration, characters / FallbackCharactersPerSecond);
    return rate > 0.0f ? normalRate / static_cast<double>(rate) : normalRate;
}

} // namespace voxsrt
