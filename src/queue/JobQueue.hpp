// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <queue/Job.hpp>
#include <queue/QueueStore.hpp>
#include <records/CallRecordRepository.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace callscribe
{

/// @brief Store keys used by one queue.
struct QueueKeys
{
    std::string pending;
    std::string deadLetter;
    std::string processed;

    /// @brief Returns "<prefix>:jobs", "<prefix>:jobs:dlq" and "<prefix>:jobs:processed".
    [[nodiscard]] static auto withPrefix(std::string_view prefix) -> QueueKeys;
};

/// @brief Sizes of the queue's lists and processed set.
struct QueueStats
{
    std::int64_t pending = 0;
    std::int64_t deadLetters = 0;
    std::int64_t processed = 0;
};

/// @brief Idempotent transcription job queue with a dead-letter list.
///
/// Holds no state of its own; any number of JobQueue instances in any number of
/// processes may share one QueueStore. Store failures are returned, never retried.
class JobQueue
{
  public:
    explicit JobQueue(QueueStore& store, QueueKeys keys = QueueKeys::withPrefix("stt"));

    /// @brief Appends @p job to the pending list unless its dedup key was already processed.
    ///
    /// The membership check and the push are one atomic store operation. Duplicates that are
    /// merely pending are tolerated and filtered out by fetchJob().
    /// @return true if the job was pushed, false if it was skipped as already processed.
    [[nodiscard]] auto enqueue(JobEnvelope const& job) -> Result<bool>;

    /// @brief Pops the next job whose dedup key is not yet processed.
    ///
    /// With a positive @p timeout the first pop waits up to that long; every following pop
    /// (after discarding a processed duplicate) does not wait. With a non-positive timeout
    /// no pop waits. Unparseable payloads are logged and discarded.
    /// @return The job, or nothing if the list is empty (or stayed empty for @p timeout).
    [[nodiscard]] auto fetchJob(std::chrono::milliseconds timeout) -> Result<std::optional<JobEnvelope>>;

    [[nodiscard]] auto isProcessed(JobEnvelope const& job) -> Result<bool>;
    [[nodiscard]] auto markProcessed(JobEnvelope const& job) -> VoidResult;

    /// @brief Appends a dead-letter entry.
    [[nodiscard]] auto pushToDlq(DeadLetterEntry const& entry) -> VoidResult;

    /// @brief Returns all dead-letter entries, oldest first, with their identifiers.
    [[nodiscard]] auto listDlqEntries() -> Result<std::vector<DeadLetterRecord>>;

    /// @brief Puts a dead-lettered job back into circulation.
    ///
    /// Atomically removes the entry, clears the job's processed marker and pushes the job to
    /// the pending list, then resets the call record to DOWNLOADED with no error. The record
    /// is left untouched when the store fails or another replay removed the entry first.
    /// @return The removed entry, or nothing if no entry has this id (or a concurrent
    ///         replay removed it first).
    [[nodiscard]] auto requeueDlqEntry(CallRecordRepository& records, std::string_view entryId)
        -> Result<std::optional<DeadLetterRecord>>;

    /// @brief Like requeueDlqEntry(), selecting the oldest entry whose job has @p recordId.
    [[nodiscard]] auto replayByRecordId(CallRecordRepository& records, std::int64_t recordId)
        -> Result<std::optional<DeadLetterRecord>>;

    /// @brief Starts an attempt on the job's record.
    /// @return The updated record, or nothing if the record does not exist.
    [[nodiscard]] auto markTranscribing(CallRecordRepository& records, JobEnvelope const& job)
        -> Result<std::optional<CallRecord>>;

    /// @brief Stores a successful transcription on the record and marks the job processed.
    [[nodiscard]] auto recordSuccess(CallRecordRepository& records,
                                     JobEnvelope const& job,
                                     std::string transcriptPath,
                                     std::optional<std::string> language,
                                     std::optional<std::string> summaryPath = std::nullopt) -> VoidResult;

    /// @brief Stores a terminal failure on the record and marks the job processed.
    [[nodiscard]] auto recordFailure(CallRecordRepository& records,
                                     JobEnvelope const& job,
                                     std::string errorCode,
                                     std::string errorMessage) -> VoidResult;

    /// @brief Hands an unfinished job back to the pending list and moves its record back to DOWNLOADED.
    ///
    /// The record keeps its retry_count, so every interrupted run stays visible.
    [[nodiscard]] auto returnToPending(CallRecordRepository& records, JobEnvelope const& job) -> VoidResult;

    [[nodiscard]] auto stats() -> Result<QueueStats>;

    [[nodiscard]] auto keys() const noexcept -> QueueKeys const& { return _keys; }

  private:
    auto replay(CallRecordRepository& records, DeadLetterRecord found) -> Result<std::optional<DeadLetterRecord>>;

    QueueStore& _store;
    QueueKeys _keys;
};

} // namespace callscribe
