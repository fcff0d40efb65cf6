// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Time.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace callscribe
{

/// @brief Processing status of a call record.
enum class CallRecordStatus
{
    Pending,
    Downloading,
    Downloaded,
    Transcribing,
    Completed,
    Skipped,
    Error,
    MissingAudio,
};

/// @brief Returns the lowercase wire name ("pending", "missing_audio", ...).
[[nodiscard]] auto toString(CallRecordStatus status) -> std::string_view;

[[nodiscard]] auto parseCallRecordStatus(std::string_view name) -> std::optional<CallRecordStatus>;

/// @brief The slice of a call record the transcription pipeline reads and updates.
struct CallRecord
{
    std::int64_t id = 0;
    std::string callId;
    std::string recordingUrl;
    CallRecordStatus status = CallRecordStatus::Pending;
    int retryCount = 0;
    std::optional<Timestamp> lastRetryAt;
    std::optional<std::string> transcriptPath;
    std::optional<std::string> summaryPath;
    std::optional<std::string> language;
    std::optional<std::string> errorCode;
    std::optional<std::string> errorMessage;
};

/// @brief Starts an attempt: status TRANSCRIBING, one more retry, stamped at @p now.
void markTranscribing(CallRecord& record, Timestamp now);

/// @brief Stores the transcript and summary locations and marks the record COMPLETED with no error.
void markCompleted(CallRecord& record,
                   std::string transcriptPath,
                   std::optional<std::string> language,
                   std::optional<std::string> summaryPath,
                   Timestamp now);

/// @brief Marks the record ERROR with the given error code and message.
void markFailed(CallRecord& record, std::string errorCode, std::string errorMessage, Timestamp now);

/// @brief Moves the record back to DOWNLOADED and clears the error fields. Idempotent.
void resetForReplay(CallRecord& record);

[[nodiscard]] auto toJson(CallRecord const& record) -> nlohmann::json;
[[nodiscard]] auto callRecordFromJson(nlohmann::json const& value) -> Result<CallRecord>;

} // namespace callscribe
