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

/// @brief Envelope for a single transcription job.
///
/// Immutable once enqueued. Two jobs are duplicates when their dedup keys match,
/// regardless of record id or language.
struct JobEnvelope
{
    std::int64_t recordId = 0;
    std::string callId;
    std::string recordingUrl;
    std::string engine;
    std::optional<std::string> language;

    /// @brief Returns "call_id|recording_url|engine".
    [[nodiscard]] auto dedupKey() const -> std::string;

    auto operator==(JobEnvelope const&) const -> bool = default;
};

/// @brief Returns the flat wire object {record_id, call_id, recording_url, engine, language}.
[[nodiscard]] auto toJson(JobEnvelope const& job) -> nlohmann::json;

/// @brief Builds a job from its wire object.
///
/// record_id may be given as an integer or a numeric string. A non-string language is
/// stored as its JSON text, a null or absent one as no language.
[[nodiscard]] auto jobFromJson(nlohmann::json const& payload) -> Result<JobEnvelope>;

/// @brief Serializes a job to its compact JSON payload.
[[nodiscard]] auto serializeJob(JobEnvelope const& job) -> std::string;

/// @brief Parses a job from a JSON payload string.
[[nodiscard]] auto parseJob(std::string_view payload) -> Result<JobEnvelope>;

/// @brief A permanently failed job as stored in the dead-letter list.
struct DeadLetterEntry
{
    JobEnvelope job;
    std::string reason;
    std::optional<int> statusCode;
    Timestamp failedAt = nowUtc();
};

[[nodiscard]] auto toJson(DeadLetterEntry const& entry) -> nlohmann::json;
[[nodiscard]] auto serializeDeadLetter(DeadLetterEntry const& entry) -> std::string;
[[nodiscard]] auto parseDeadLetter(std::string_view payload) -> Result<DeadLetterEntry>;

/// @brief Returns the stable identifier of a stored dead-letter payload.
///
/// The identifier is the FNV-1a 64-bit digest of the exact stored string, printed as
/// 16 lowercase hex digits.
[[nodiscard]] auto deadLetterIdFor(std::string_view payload) -> std::string;

/// @brief A dead-letter entry together with its identifier and the exact stored payload.
struct DeadLetterRecord
{
    std::string entryId;
    DeadLetterEntry entry;
    std::string payload;
};

} // namespace callscribe
