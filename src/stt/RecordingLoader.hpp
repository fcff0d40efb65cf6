// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stt/HttpClient.hpp>
#include <stt/SttSettings.hpp>
#include <stt/TranscriptionProvider.hpp>

#include <expected>
#include <string>
#include <vector>

namespace callscribe
{

/// @brief A recording ready to hand to a transcription backend.
struct PreparedRecording
{
    std::vector<float> samples; ///< 16 kHz mono.
    std::string wav;            ///< The same audio as a 16-bit PCM WAV file.
    double durationSeconds = 0.0;
};

/// @brief Reads the raw bytes of a recording.
///
/// Accepts a plain filesystem path, a file:// URL, or an http(s):// URL fetched with @p http.
/// A non-200 download response fails with its status code, so a missing remote recording
/// (404) is a client error.
[[nodiscard]] auto fetchRecording(std::string const& recordingUrl, HttpClient& http)
    -> std::expected<std::string, TranscriptionFailure>;

/// @brief Fails with a 413 client error if the recording exceeds the configured limits.
[[nodiscard]] auto checkRecordingLimits(SttSettings const& settings, double durationSeconds, size_t wavBytes)
    -> std::expected<void, TranscriptionFailure>;

/// @brief Fetches, decodes and re-encodes the job's recording, then checks the limits.
[[nodiscard]] auto prepareRecording(JobEnvelope const& job, SttSettings const& settings, HttpClient& http)
    -> std::expected<PreparedRecording, TranscriptionFailure>;

} // namespace callscribe
