// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <stt/HttpClient.hpp>
#include <stt/SttSettings.hpp>
#include <stt/TranscriptionProvider.hpp>

#include <memory>
#include <optional>
#include <span>
#include <string>

namespace callscribe
{

/// @brief Text recognized by whisper.cpp and the language it was recognized in.
struct WhisperTranscript
{
    std::string text;
    std::optional<std::string> language;
};

/// @brief Speech-to-text transcription using whisper.cpp.
///
/// One loaded model serves all callers; transcribe() calls are serialized.
class WhisperTranscriber
{
  public:
    WhisperTranscriber();
    ~WhisperTranscriber();

    WhisperTranscriber(const WhisperTranscriber&) = delete;
    WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

    /// @brief Loads the whisper model.
    /// @param settings Model path and thread count.
    /// @return Success or an error.
    [[nodiscard]] auto initialize(const WhisperSettings& settings) -> VoidResult;

    /// @brief Transcribes audio samples to text.
    /// @param samples Float32 PCM audio at 16kHz mono.
    /// @param language ISO language code, or nothing to let whisper detect it.
    /// @return The transcribed text or an error.
    [[nodiscard]] auto transcribe(std::span<const float> samples, std::optional<std::string> const& language)
        -> Result<WhisperTranscript>;

    /// @brief Returns true if the model is loaded.
    [[nodiscard]] auto isLoaded() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief The "whisper" engine: transcribes recordings in-process with whisper.cpp.
class WhisperProvider final: public TranscriptionProvider
{
  public:
    WhisperProvider(std::shared_ptr<WhisperTranscriber> transcriber, SttSettings settings, std::shared_ptr<HttpClient> http);

    [[nodiscard]] auto transcribe(JobEnvelope const& job) -> TranscriptionOutcome override;

  private:
    std::shared_ptr<WhisperTranscriber> _transcriber;
    SttSettings _settings;
    std::shared_ptr<HttpClient> _http;
};

} // namespace callscribe
