// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stt/HttpClient.hpp>
#include <stt/SttSettings.hpp>
#include <stt/TranscriptionProvider.hpp>

#include <memory>

namespace callscribe
{

/// @brief Uploads recordings to an HTTP transcription API as multipart/form-data.
///
/// Serves both the "openai-whisper" engine (OpenAI audio transcription API) and the
/// "local" engine (a self-hosted service with the same request and response shape).
/// The request carries the recording as a 16 kHz mono WAV "file" part, plus "model"
/// and "language" fields when set. The response must be {"text": ..., "language"?: ...}.
class HttpTranscriptionProvider final: public TranscriptionProvider
{
  public:
    struct Endpoint
    {
        std::string displayName; ///< Used in error messages, e.g. "OpenAI Whisper".
        std::string url;
        std::string apiKey; ///< Sent as a bearer token when not empty.
        std::string model;  ///< Sent as the "model" field when not empty.
    };

    HttpTranscriptionProvider(Endpoint endpoint, SttSettings settings, std::shared_ptr<HttpClient> http);

    /// @brief Builds the "openai-whisper" provider. Fails if no API key is configured.
    [[nodiscard]] static auto openAi(SttSettings const& settings, std::shared_ptr<HttpClient> http)
        -> Result<std::unique_ptr<HttpTranscriptionProvider>>;

    /// @brief Builds the "local" provider. Fails if no URL is configured.
    [[nodiscard]] static auto local(SttSettings const& settings, std::shared_ptr<HttpClient> http)
        -> Result<std::unique_ptr<HttpTranscriptionProvider>>;

    [[nodiscard]] auto transcribe(JobEnvelope const& job) -> TranscriptionOutcome override;

    [[nodiscard]] auto endpoint() const noexcept -> Endpoint const& { return _endpoint; }

  private:
    [[nodiscard]] auto appendLimitHint(int statusCode, std::string message) const -> std::string;

    Endpoint _endpoint;
    SttSettings _settings;
    std::shared_ptr<HttpClient> _http;
};

} // namespace callscribe
