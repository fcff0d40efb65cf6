// SPDX-License-Identifier: Apache-2.0
#include "RecordingLoader.hpp"

#include <core/Log.hpp>

#include <stt/AudioConverter.hpp>

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace callscribe
{

namespace
{

    auto readLocalRecording(std::string const& recordingUrl, std::filesystem::path const& path)
        -> std::expected<std::string, TranscriptionFailure>
    {
        auto ec = std::error_code {};
        if (!std::filesystem::is_regular_file(path, ec))
            return std::unexpected(TranscriptionFailure::transient(std::format("Recording not found at {}", recordingUrl)));

        auto file = std::ifstream(path, std::ios::binary);
        if (!file.is_open())
            return std::unexpected(TranscriptionFailure::transient(std::format("Cannot read recording at {}", recordingUrl)));

        auto ss = std::ostringstream {};
        ss << file.rdbuf();
        return ss.str();
    }

} // namespace

auto fetchRecording(std::string const& recordingUrl, HttpClient& http) -> std::expected<std::string, TranscriptionFailure>
{
    auto const schemeEnd = recordingUrl.find("://");
    if (schemeEnd == std::string::npos)
        return readLocalRecording(recordingUrl, recordingUrl);

    auto const scheme = recordingUrl.substr(0, schemeEnd);
    if (scheme == "file")
    {
        auto path = recordingUrl.substr(schemeEnd + 3);
        // file://host/path names a path on "host"; only the local host form is supported.
        if (!path.starts_with('/'))
            path.erase(0, std::min(path.find('/'), path.size()));
        return readLocalRecording(recordingUrl, path);
    }

    if (scheme != "http" && scheme != "https")
        return std::unexpected(
            TranscriptionFailure::transient(std::format("Unsupported recording URL scheme: {}", scheme)));

    auto response = http.get(recordingUrl, {});
    if (!response)
        return std::unexpected(TranscriptionFailure::transient(response.error().message));

    if (response->status != 200)
    {
        auto message = extractErrorMessage(response->body);
        if (message.empty())
            message = "Unable to download recording";
        return std::unexpected(TranscriptionFailure::fromStatus(response->status, std::move(message)));
    }

    return std::move(response->body);
}

auto checkRecordingLimits(SttSettings const& settings, double durationSeconds, size_t wavBytes)
    -> std::expected<void, TranscriptionFailure>
{
    constexpr auto PayloadTooLarge = 413;

    if (settings.maxFileMinutes > 0 && durationSeconds > settings.maxFileMinutes * 60.0)
        return std::unexpected(TranscriptionFailure::fromStatus(
            PayloadTooLarge,
            std::format("Recording duration exceeds configured limit: {:.1f} min > {} min",
                        durationSeconds / 60.0,
                        settings.maxFileMinutes)));

    auto const maxBytes = static_cast<size_t>(settings.maxFileSizeMb) * 1024 * 1024;
    if (settings.maxFileSizeMb > 0 && wavBytes > maxBytes)
        return std::unexpected(TranscriptionFailure::fromStatus(
            PayloadTooLarge,
            std::format("Recording size {:.1f} MB exceeds {} MB limit",
                        static_cast<double>(wavBytes) / (1024.0 * 1024.0),
                        settings.maxFileSizeMb)));

    return {};
}

auto prepareRecording(JobEnvelope const& job, SttSettings const& settings, HttpClient& http)
    -> std::expected<PreparedRecording, TranscriptionFailure>
{
    auto encoded = fetchRecording(job.recordingUrl, http);
    if (!encoded)
        return std::unexpected(encoded.error());

    auto samples = decodeToMono16k(*encoded);
    if (!samples)
    {
        log::error("Failed to convert recording call_id={} url={}: {}", job.callId, job.recordingUrl, samples.error().message);
        return std::unexpected(TranscriptionFailure::transient("Audio conversion failed"));
    }

    auto wav = encodeWav16k(*samples);
    if (!wav)
    {
        log::error("Failed to encode recording call_id={}: {}", job.callId, wav.error().message);
        return std::unexpected(TranscriptionFailure::transient("Audio conversion failed"));
    }

    auto const duration = durationSeconds(*samples);
    if (auto withinLimits = checkRecordingLimits(settings, duration, wav->size()); !withinLimits)
        return std::unexpected(withinLimits.error());

    return PreparedRecording {
        .samples = std::move(*samples),
        .wav = std::move(*wav),
        .durationSeconds = duration,
    };
}

} // namespace callscribe
