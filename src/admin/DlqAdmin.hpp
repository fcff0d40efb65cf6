// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <queue/JobQueue.hpp>
#include <records/CallRecordRepository.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace callscribe
{

/// @brief Who asked for an administrative action and why. Written to the audit log.
struct AuditContext
{
    std::string actor;
    std::string reason;
};

/// @brief JSON response of an admin command plus the process exit code it implies.
struct AdminReply
{
    static constexpr auto ExitOk = 0;
    static constexpr auto ExitNotFound = 2;

    nlohmann::json body;
    int exitCode = ExitOk;
};

/// @brief Returns {status: "requeued", entry_id, job, reason, failed_at, status_code}.
[[nodiscard]] auto requeuedResponse(DeadLetterRecord const& record) -> nlohmann::json;

/// @brief Returns {entry_id, job, reason, failed_at, status_code}.
[[nodiscard]] auto dlqEntryJson(DeadLetterRecord const& record) -> nlohmann::json;

/// @brief Operator commands on the queue and its dead-letter list.
class DlqAdmin
{
  public:
    DlqAdmin(JobQueue& queue, CallRecordRepositoryFactory records);

    /// @brief Enqueues a job; replies "enqueued" or "skipped" (already processed).
    [[nodiscard]] auto enqueue(JobEnvelope const& job) -> Result<AdminReply>;

    /// @brief Lists all dead-letter entries, oldest first.
    [[nodiscard]] auto list() -> Result<AdminReply>;

    /// @brief Replays the entry with @p entryId; replies "not_found" with exit code 2 if absent.
    [[nodiscard]] auto requeue(std::string_view entryId, AuditContext const& audit) -> Result<AdminReply>;

    /// @brief Replays the oldest entry for @p recordId; replies "not_found" with exit code 2 if absent.
    [[nodiscard]] auto replayRecord(std::int64_t recordId, AuditContext const& audit) -> Result<AdminReply>;

    /// @brief Replies {pending, dead_letters, processed}.
    [[nodiscard]] auto stats() -> Result<AdminReply>;

  private:
    auto replied(std::optional<DeadLetterRecord> const& replayed, nlohmann::json notFound, AuditContext const& audit)
        -> AdminReply;

    JobQueue& _queue;
    CallRecordRepositoryFactory _records;
};

} // namespace callscribe
