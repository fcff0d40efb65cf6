// SPDX-License-Identifier: Apache-2.0
#include "Job.hpp"

#include <core/JsonUtils.hpp>

#include <charconv>
#include <format>

namespace callscribe
{

namespace
{

    auto readRecordId(nlohmann::json const& payload) -> Result<std::int64_t>
    {
        if (!payload.contains("record_id"))
            return makeError(ErrorCode::ProtocolError, "Job payload is missing required field: record_id");

        auto const& value = payload["record_id"];
        if (value.is_number_integer())
            return value.get<std::int64_t>();

        if (value.is_string())
        {
            auto const text = value.get<std::string>();
            auto id = std::int64_t { 0 };
            auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
            if (ec == std::errc {} && ptr == text.data() + text.size())
                return id;
        }

        return makeError(ErrorCode::ProtocolError,
                         std::format("Job payload has invalid record_id: {}", value.dump()));
    }

    /// @brief Reads a required field, accepting any scalar and converting it to text.
    auto readText(nlohmann::json const& payload, char const* key) -> Result<std::string>
    {
        if (!payload.contains(key) || payload[key].is_null())
            return makeError(ErrorCode::ProtocolError,
                             std::format("Job payload is missing required field: {}", key));
        auto const& value = payload[key];
        if (value.is_string())
            return value.get<std::string>();
        if (value.is_primitive())
            return value.dump();
        return makeError(ErrorCode::ProtocolError, std::format("Job payload has invalid field: {}", key));
    }

} // namespace

auto JobEnvelope::dedupKey() const -> std::string
{
    return std::format("{}|{}|{}", callId, recordingUrl, engine);
}

auto toJson(JobEnvelope const& job) -> nlohmann::json
{
    return nlohmann::json {
        { "record_id", job.recordId },
        { "call_id", job.callId },
        { "recording_url", job.recordingUrl },
        { "engine", job.engine },
        { "language", job.language ? nlohmann::json(*job.language) : nlohmann::json(nullptr) },
    };
}

auto jobFromJson(nlohmann::json const& payload) -> Result<JobEnvelope>
{
    if (!payload.is_object())
        return makeError(ErrorCode::ProtocolError, "Job payload must be a JSON object");

    auto recordId = readRecordId(payload);
    if (!recordId)
        return std::unexpected(recordId.error());
    auto callId = readText(payload, "call_id");
    if (!callId)
        return std::unexpected(callId.error());
    auto recordingUrl = readText(payload, "recording_url");
    if (!recordingUrl)
        return std::unexpected(recordingUrl.error());
    auto engine = readText(payload, "engine");
    if (!engine)
        return std::unexpected(engine.error());

    auto job = JobEnvelope {
        .recordId = *recordId,
        .callId = std::move(*callId),
        .recordingUrl = std::move(*recordingUrl),
        .engine = std::move(*engine),
        .language = std::nullopt,
    };

    if (payload.contains("language") && !payload["language"].is_null())
    {
        auto const& language = payload["language"];
        job.language = language.is_string() ? language.get<std::string>() : language.dump();
    }

    return job;
}

auto serializeJob(JobEnvelope const& job) -> std::string
{
    return json::serialize(toJson(job));
}

auto parseJob(std::string_view payload) -> Result<JobEnvelope>
{
    return json::parse(payload).and_then([](nlohmann::json const& value) { return jobFromJson(value); });
}

auto toJson(DeadLetterEntry const& entry) -> nlohmann::json
{
    return nlohmann::json {
        { "job", toJson(entry.job) },
        { "reason", entry.reason },
        { "failed_at", formatIso8601(entry.failedAt) },
        { "status_code", entry.statusCode ? nlohmann::json(*entry.statusCode) : nlohmann::json(nullptr) },
    };
}

auto serializeDeadLetter(DeadLetterEntry const& entry) -> std::string
{
    return json::serialize(toJson(entry));
}

auto parseDeadLetter(std::string_view payload) -> Result<DeadLetterEntry>
{
    auto value = json::parseObject(payload);
    if (!value)
        return std::unexpected(value.error());

    if (!value->contains("job"))
        return makeError(ErrorCode::ProtocolError, "Dead-letter payload is missing required field: job");

    auto job = jobFromJson((*value)["job"]);
    if (!job)
        return std::unexpected(job.error());

    auto failedAtText = json::getString(*value, "failed_at");
    if (!failedAtText)
        return std::unexpected(failedAtText.error());
    auto failedAt = parseIso8601(*failedAtText);
    if (!failedAt)
        return std::unexpected(failedAt.error());

    return DeadLetterEntry {
        .job = std::move(*job),
        .reason = json::getStringOr(*value, "reason", ""),
        .statusCode = json::getOptionalInt(*value, "status_code"),
        .failedAt = *failedAt,
    };
}

auto deadLetterIdFor(std::string_view payload) -> std::string
{
    constexpr auto FnvOffsetBasis = std::uint64_t { 0xcbf29ce484222325ULL };
    constexpr auto FnvPrime = std::uint64_t { 0x100000001b3ULL };

    auto hash = FnvOffsetBasis;
    for (auto const c: payload)
    {
        hash ^= static_cast<unsigned char>(c);
        hash *= FnvPrime;
    }
    return std::format("{:016x}", hash);
}

} // namespace callscribe
