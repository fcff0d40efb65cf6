// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <queue/JobQueue.hpp>
#include <records/CallRecordRepository.hpp>
#include <stt/CallSummarizer.hpp>
#include <stt/TranscriptionProvider.hpp>
#include <worker/RetryPolicy.hpp>
#include <worker/WorkerMetrics.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string_view>

namespace callscribe
{

/// @brief What one processNext() call did.
enum class JobOutcome
{
    Idle,          ///< No job was available.
    Success,       ///< The transcript was stored.
    DeadLettered,  ///< The job failed for good and went to the dead-letter list.
    MissingRecord, ///< The job's call record does not exist; the job was dropped.
    Interrupted,   ///< A stop request arrived between attempts; the job was put back with a fresh retry budget.
};

[[nodiscard]] constexpr auto jobOutcomeName(JobOutcome outcome) -> std::string_view
{
    switch (outcome)
    {
        case JobOutcome::Idle: return "idle";
        case JobOutcome::Success: return "success";
        case JobOutcome::DeadLettered: return "dead_lettered";
        case JobOutcome::MissingRecord: return "missing_record";
        case JobOutcome::Interrupted: return "interrupted";
    }
    return "idle";
}

/// @brief Sleeps between retries and while idle. Replaceable in tests.
using Sleeper = std::function<void(Seconds)>;

/// @brief Executes transcription jobs one at a time.
///
/// For each job: FETCHED -> TRANSCRIBING -> SUCCESS | RETRY -> TRANSCRIBING | DEAD_LETTERED.
/// Store failures are returned from processNext(); runForever() logs them and idles.
class Worker
{
  public:
    /// @param sleeper Called for every retry and idle sleep. When empty, the worker sleeps
    ///                on its own clock and wakes up early on requestStop().
    /// @param summarizer Writes a call summary after each successful transcription. Optional.
    Worker(JobQueue& queue,
           TranscriptionProvider& provider,
           CallRecordRepositoryFactory records,
           WorkerMetrics metrics,
           WorkerSettings const& settings,
           Sleeper sleeper = {},
           CallSummarizer const* summarizer = nullptr);

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /// @brief Fetches and fully processes at most one job.
    /// @param timeout How long to wait for a job; non-positive does not wait.
    [[nodiscard]] auto processNext(std::chrono::milliseconds timeout) -> Result<JobOutcome>;

    /// @brief Processes jobs until requestStop() is called.
    void runForever(std::chrono::milliseconds timeout);

    /// @brief Makes runForever() return after the current job. Thread-safe.
    void requestStop();

    [[nodiscard]] auto stopRequested() const noexcept -> bool { return _stopRequested.load(); }

    [[nodiscard]] auto retryPolicy() const noexcept -> RetryPolicy const& { return _retryPolicy; }
    [[nodiscard]] auto idleSleep() const noexcept -> Seconds { return _idleSleep; }

  private:
    auto processJob(CallRecordRepository& records, JobEnvelope const& job) -> Result<JobOutcome>;
    auto summarize(JobEnvelope const& job, TranscriptResult const& result) const -> std::optional<std::string>;
    void sleep(Seconds duration);

    JobQueue& _queue;
    TranscriptionProvider& _provider;
    CallRecordRepositoryFactory _records;
    WorkerMetrics _metrics;
    RetryPolicy _retryPolicy;
    Seconds _idleSleep;
    Sleeper _sleeper;
    CallSummarizer const* _summarizer;

    std::atomic<bool> _stopRequested { false };
    std::mutex _stopMutex;
    std::condition_variable _stopSignal;
};

} // namespace callscribe
