// SPDX-License-Identifier: Apache-2.0
#include "CallRecord.hpp"

#include <core/JsonUtils.hpp>

#include <array>
#include <format>
#include <utility>

namespace callscribe
{

namespace
{

    constexpr auto StatusNames = std::array<std::pair<CallRecordStatus, std::string_view>, 8> { {
        { CallRecordStatus::Pending, "pending" },
        { CallRecordStatus::Downloading, "downloading" },
        { CallRecordStatus::Downloaded, "downloaded" },
        { CallRecordStatus::Transcribing, "transcribing" },
        { CallRecordStatus::Completed, "completed" },
        { CallRecordStatus::Skipped, "skipped" },
        { CallRecordStatus::Error, "error" },
        { CallRecordStatus::MissingAudio, "missing_audio" },
    } };

    auto optionalJson(std::optional<std::string> const& value) -> nlohmann::json
    {
        return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
    }

} // namespace

auto toString(CallRecordStatus status) -> std::string_view
{
    for (auto const& [value, name]: StatusNames)
        if (value == status)
            return name;
    return "pending";
}

auto parseCallRecordStatus(std::string_view name) -> std::optional<CallRecordStatus>
{
    for (auto const& [value, text]: StatusNames)
        if (text == name)
            return value;
    return std::nullopt;
}

void markTranscribing(CallRecord& record, Timestamp now)
{
    record.status = CallRecordStatus::Transcribing;
    record.retryCount += 1;
    record.lastRetryAt = now;
}

void markCompleted(CallRecord& record,
                   std::string transcriptPath,
                   std::optional<std::string> language,
                   std::optional<std::string> summaryPath,
                   Timestamp now)
{
    record.transcriptPath = std::move(transcriptPath);
    record.summaryPath = std::move(summaryPath);
    record.language = std::move(language);
    record.status = CallRecordStatus::Completed;
    record.errorCode.reset();
    record.errorMessage.reset();
    record.lastRetryAt = now;
}

void markFailed(CallRecord& record, std::string errorCode, std::string errorMessage, Timestamp now)
{
    record.status = CallRecordStatus::Error;
    record.errorCode = std::move(errorCode);
    record.errorMessage = std::move(errorMessage);
    record.lastRetryAt = now;
}

void resetForReplay(CallRecord& record)
{
    record.status = CallRecordStatus::Downloaded;
    record.errorCode.reset();
    record.errorMessage.reset();
}

auto toJson(CallRecord const& record) -> nlohmann::json
{
    return nlohmann::json {
        { "id", record.id },
        { "call_id", record.callId },
        { "recording_url", record.recordingUrl },
        { "status", toString(record.status) },
        { "retry_count", record.retryCount },
        { "last_retry_at", record.lastRetryAt ? nlohmann::json(formatIso8601(*record.lastRetryAt)) : nlohmann::json(nullptr) },
        { "transcript_path", optionalJson(record.transcriptPath) },
        { "summary_path", optionalJson(record.summaryPath) },
        { "language", optionalJson(record.language) },
        { "error_code", optionalJson(record.errorCode) },
        { "error_message", optionalJson(record.errorMessage) },
    };
}

auto callRecordFromJson(nlohmann::json const& value) -> Result<CallRecord>
{
    if (!value.is_object())
        return makeError(ErrorCode::RecordError, "Call record must be a JSON object");

    auto id = json::getInt64(value, "id");
    if (!id)
        return makeError(ErrorCode::RecordError, id.error().message);

    auto const statusName = json::getStringOr(value, "status", "pending");
    auto const status = parseCallRecordStatus(statusName);
    if (!status)
        return makeError(ErrorCode::RecordError, std::format("Unknown call record status: '{}'", statusName));

    auto record = CallRecord {
        .id = *id,
        .callId = json::getStringOr(value, "call_id", ""),
        .recordingUrl = json::getStringOr(value, "recording_url", ""),
        .status = *status,
        .retryCount = json::getIntOr(value, "retry_count", 0),
        .lastRetryAt = std::nullopt,
        .transcriptPath = json::getOptionalString(value, "transcript_path"),
        .summaryPath = json::getOptionalString(value, "summary_path"),
        .language = json::getOptionalString(value, "language"),
        .errorCode = json::getOptionalString(value, "error_code"),
        .errorMessage = json::getOptionalString(value, "error_message"),
    };

    if (auto const lastRetryAt = json::getOptionalString(value, "last_retry_at"))
    {
        auto parsed = parseIso8601(*lastRetryAt);
        if (!parsed)
            return makeError(ErrorCode::RecordError, parsed.error().message);
        record.lastRetryAt = *parsed;
    }

    return record;
}

} // namespace callscribe
