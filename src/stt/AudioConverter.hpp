// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace callscribe
{

/// @brief Sample rate expected by the transcription backends.
constexpr auto TranscriptionSampleRate = 16000u;

/// @brief Decodes an audio file held in memory (WAV, MP3 or FLAC) to 16 kHz mono float PCM.
[[nodiscard]] auto decodeToMono16k(std::string_view encoded) -> Result<std::vector<float>>;

/// @brief Encodes 16 kHz mono float PCM as a 16-bit PCM WAV file.
[[nodiscard]] auto encodeWav16k(std::span<float const> samples) -> Result<std::string>;

/// @brief Returns the play time of 16 kHz mono samples in seconds.
[[nodiscard]] inline auto durationSeconds(std::span<float const> samples) noexcept -> double
{
    return static_cast<double>(samples.size()) / static_cast<double>(TranscriptionSampleRate);
}

} // namespace callscribe
