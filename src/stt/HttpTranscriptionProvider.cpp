// SPDX-License-Identifier: Apache-2.0
#include "HttpTranscriptionProvider.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <stt/RecordingLoader.hpp>

#include <format>
#include <random>

namespace callscribe
{

namespace
{

    auto makeBoundary() -> std::string
    {
        auto device = std::random_device {};
        auto engine = std::mt19937_64 { device() };
        return std::format("callscribe-{:016x}{:016x}", engine(), engine());
    }

    auto requestedLanguage(JobEnvelope const& job, SttSettings const& settings) -> std::optional<std::string>
    {
        if (job.language && !job.language->empty())
            return job.language;
        if (!settings.defaultLanguage.empty())
            return settings.defaultLanguage;
        return std::nullopt;
    }

} // namespace

HttpTranscriptionProvider::HttpTranscriptionProvider(Endpoint endpoint,
                                                     SttSettings settings,
                                                     std::shared_ptr<HttpClient> http):
    _endpoint(std::move(endpoint)), _settings(std::move(settings)), _http(std::move(http))
{
}

auto HttpTranscriptionProvider::openAi(SttSettings const& settings, std::shared_ptr<HttpClient> http)
    -> Result<std::unique_ptr<HttpTranscriptionProvider>>
{
    if (settings.openai.apiKey.empty())
        return makeError(ErrorCode::ConfigError, "stt.openai.apiKey must be configured to use the OpenAI Whisper provider");

    auto baseUrl = settings.openai.baseUrl;
    while (baseUrl.ends_with('/'))
        baseUrl.pop_back();

    return std::make_unique<HttpTranscriptionProvider>(
        Endpoint {
            .displayName = "OpenAI Whisper",
            .url = baseUrl + "/audio/transcriptions",
            .apiKey = settings.openai.apiKey,
            .model = settings.openai.model,
        },
        settings,
        std::move(http));
}

auto HttpTranscriptionProvider::local(SttSettings const& settings, std::shared_ptr<HttpClient> http)
    -> Result<std::unique_ptr<HttpTranscriptionProvider>>
{
    if (settings.local.url.empty())
        return makeError(ErrorCode::ConfigError, "stt.local.url must be configured to use the local STT provider");

    return std::make_unique<HttpTranscriptionProvider>(
        Endpoint {
            .displayName = "Local STT",
            .url = settings.local.url,
            .apiKey = settings.local.apiKey,
            .model = {},
        },
        settings,
        std::move(http));
}

auto HttpTranscriptionProvider::appendLimitHint(int statusCode, std::string message) const -> std::string
{
    auto hint = std::string {};
    if (statusCode == 413)
    {
        hint = _settings.errorHint413;
        auto details = std::vector<std::string> {};
        if (_settings.maxFileMinutes > 0)
            details.push_back(std::format("max duration {} min", _settings.maxFileMinutes));
        if (_settings.maxFileSizeMb > 0)
            details.push_back(std::format("max size {} MB", _settings.maxFileSizeMb));
        if (!details.empty())
        {
            auto joined = details.front();
            for (auto i = size_t { 1 }; i < details.size(); ++i)
                joined += ", " + details[i];
            hint = hint.empty() ? std::format("({})", joined) : std::format("{} ({})", hint, joined);
        }
    }
    else if (statusCode == 422)
    {
        hint = _settings.errorHint422;
    }

    if (hint.empty())
        return message;
    if (message.empty())
        return hint;
    return std::format("{}. {}", message, hint);
}

auto HttpTranscriptionProvider::transcribe(JobEnvelope const& job) -> TranscriptionOutcome
{
    auto recording = prepareRecording(job, _settings, *_http);
    if (!recording)
        return std::unexpected(recording.error());

    auto const language = requestedLanguage(job, _settings);

    auto parts = std::vector<FormPart> {};
    parts.push_back(FormPart {
        .name = "file",
        .content = std::move(recording->wav),
        .filename = std::format("{}.wav", sanitizeFileStem(job.callId)),
        .contentType = "audio/wav",
    });
    if (!_endpoint.model.empty())
        parts.push_back(FormPart { .name = "model", .content = _endpoint.model, .filename = {}, .contentType = {} });
    if (language)
        parts.push_back(FormPart { .name = "language", .content = *language, .filename = {}, .contentType = {} });

    auto headers = HttpHeaders {};
    if (!_endpoint.apiKey.empty())
        headers.emplace("Authorization", std::format("Bearer {}", _endpoint.apiKey));

    auto const multipart = encodeMultipart(parts, makeBoundary());

    log::debug("Uploading recording call_id={} to {} ({:.1f} s)", job.callId, _endpoint.url, recording->durationSeconds);
    auto response = _http->post(_endpoint.url, headers, multipart.body, multipart.contentType);
    if (!response)
        return std::unexpected(TranscriptionFailure::transient(response.error().message));

    if (response->status != 200)
    {
        auto message = appendLimitHint(response->status, extractErrorMessage(response->body));
        if (message.empty())
            message = "STT provider error";
        return std::unexpected(TranscriptionFailure::fromStatus(response->status, std::move(message)));
    }

    auto payload = json::parse(response->body);
    if (!payload || !payload->is_object())
        return std::unexpected(
            TranscriptionFailure::transient(std::format("Unexpected response from {}", _endpoint.displayName)));

    auto const text = json::getOptionalString(*payload, "text");
    if (!text)
        return std::unexpected(TranscriptionFailure::transient(
            std::format("{} response is missing transcript text", _endpoint.displayName)));

    auto path = writeTranscript(_settings.transcriptsDir, job.callId, *text);
    if (!path)
        return std::unexpected(TranscriptionFailure::transient(path.error().message));

    auto detected = json::getOptionalString(*payload, "language");
    return TranscriptResult {
        .transcriptPath = path->string(),
        .language = detected ? std::move(detected) : language,
    };
}

} // namespace callscribe
