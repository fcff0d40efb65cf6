// SPDX-License-Identifier: Apache-2.0
#include "WhisperTranscriber.hpp"

#include <core/Log.hpp>

#include <stt/RecordingLoader.hpp>

#include <whisper.h>

#include <array>
#include <format>
#include <mutex>
#include <optional>
#include <string>

namespace callscribe
{

namespace
{

    /// @brief Line buffer for whisper.cpp log continuation messages.
    auto whisperLineBuffer = std::string {};

    /// @brief Maps ggml_log_level to callscribe::log::Level.
    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards whisper.cpp log output to callscribe::log, one complete line at a time.
    void whisperLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        whisperLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = whisperLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = whisperLineBuffer.substr(0, nlPos);
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);

            if (!line.empty())
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), std::format("whisper: {}", line));

            whisperLineBuffer.erase(0, nlPos + 1);
        }
    }

    auto trim(std::string text) -> std::string
    {
        auto const start = text.find_first_not_of(" \t\n\r");
        if (start == std::string::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\n\r");
        return text.substr(start, end - start + 1);
    }

    /// @brief Whisper emits these markers for silence or noise; they are not speech.
    auto isNonSpeechMarker(std::string_view segment) -> bool
    {
        static constexpr auto Markers = std::array {
            std::string_view { "[BLANK_AUDIO]" }, std::string_view { "(blank audio)" },
            std::string_view { "[SOUND]" },       std::string_view { "[MUSIC]" },
            std::string_view { "[NOISE]" },
        };
        for (auto const& marker: Markers)
            if (segment == marker)
                return true;
        return false;
    }

} // namespace

struct WhisperTranscriber::Impl
{
    whisper_context* ctx = nullptr;
    WhisperSettings settings;
    std::mutex mutex;

    ~Impl()
    {
        if (ctx)
            whisper_free(ctx);
    }
};

WhisperTranscriber::WhisperTranscriber(): _impl(std::make_unique<Impl>())
{
}

WhisperTranscriber::~WhisperTranscriber() = default;

auto WhisperTranscriber::initialize(const WhisperSettings& settings) -> VoidResult
{
    _impl->settings = settings;

    whisper_log_set(whisperLogCallback, nullptr);

    auto params = whisper_context_default_params();
    _impl->ctx = whisper_init_from_file_with_params(settings.modelPath.c_str(), params);

    if (!_impl->ctx)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Failed to load whisper model: {}", settings.modelPath));

    log::info("Whisper model loaded: {}", settings.modelPath);
    return {};
}

auto WhisperTranscriber::transcribe(std::span<const float> samples, std::optional<std::string> const& language)
    -> Result<WhisperTranscript>
{
    auto const lock = std::lock_guard { _impl->mutex };

    if (!_impl->ctx)
        return makeError(ErrorCode::TranscriptionError, "Whisper model not loaded");

    auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = language ? language->c_str() : "auto";
    params.detect_language = false;
    params.translate = false;
    params.n_threads = _impl->settings.threads;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    auto const result = whisper_full(_impl->ctx, params, samples.data(), static_cast<int>(samples.size()));

    if (result != 0)
        return makeError(ErrorCode::TranscriptionError,
                         std::format("Whisper transcription failed with code: {}", result));

    auto const nSegments = whisper_full_n_segments(_impl->ctx);
    auto text = std::string {};

    for (auto i = 0; i < nSegments; ++i)
    {
        auto const* segmentText = whisper_full_get_segment_text(_impl->ctx, i);
        if (!segmentText)
            continue;
        auto segment = trim(segmentText);
        if (segment.empty() || isNonSpeechMarker(segment))
            continue;
        if (!text.empty())
            text += ' ';
        text += segment;
    }

    auto transcript = WhisperTranscript { .text = std::move(text), .language = language };
    if (!language)
    {
        auto const langId = whisper_full_lang_id(_impl->ctx);
        if (auto const* name = whisper_lang_str(langId); langId >= 0 && name)
            transcript.language = std::string(name);
    }
    return transcript;
}

auto WhisperTranscriber::isLoaded() const -> bool
{
    return _impl->ctx != nullptr;
}

WhisperProvider::WhisperProvider(std::shared_ptr<WhisperTranscriber> transcriber,
                                 SttSettings settings,
                                 std::shared_ptr<HttpClient> http):
    _transcriber(std::move(transcriber)), _settings(std::move(settings)), _http(std::move(http))
{
}

auto WhisperProvider::transcribe(JobEnvelope const& job) -> TranscriptionOutcome
{
    auto recording = prepareRecording(job, _settings, *_http);
    if (!recording)
        return std::unexpected(recording.error());

    auto language = job.language;
    if ((!language || language->empty()) && !_settings.defaultLanguage.empty())
        language = _settings.defaultLanguage;
    if (language && language->empty())
        language.reset();

    auto transcript = _transcriber->transcribe(recording->samples, language);
    if (!transcript)
        return std::unexpected(TranscriptionFailure::transient(transcript.error().message));

    auto path = writeTranscript(_settings.transcriptsDir, job.callId, transcript->text);
    if (!path)
        return std::unexpected(TranscriptionFailure::transient(path.error().message));

    return TranscriptResult { .transcriptPath = path->string(), .language = std::move(transcript->language) };
}

} // namespace callscribe
