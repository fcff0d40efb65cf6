// SPDX-License-Identifier: Apache-2.0
#include "Worker.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace callscribe
{

Worker::Worker(JobQueue& queue,
               TranscriptionProvider& provider,
               CallRecordRepositoryFactory records,
               WorkerMetrics metrics,
               WorkerSettings const& settings,
               Sleeper sleeper,
               CallSummarizer const* summarizer):
    _queue(queue),
    _provider(provider),
    _records(std::move(records)),
    _metrics(metrics),
    _retryPolicy(settings),
    _idleSleep(std::max(Seconds { settings.idleSleepSeconds }, Seconds { RetryPolicy::MinBackoff })),
    _sleeper(std::move(sleeper)),
    _summarizer(summarizer)
{
}

auto Worker::processNext(std::chrono::milliseconds timeout) -> Result<JobOutcome>
{
    auto job = _queue.fetchJob(timeout);
    if (!job)
        return std::unexpected(job.error());
    if (!job->has_value())
        return JobOutcome::Idle;

    auto const startTime = std::chrono::steady_clock::now();

    auto outcome = [&]() -> Result<JobOutcome> {
        auto records = _records ? _records() : nullptr;
        if (!records)
            return makeError(ErrorCode::RecordError, "Cannot open call record repository");
        return processJob(*records, **job);
    }();

    _metrics.duration.observe(Seconds { std::chrono::steady_clock::now() - startTime }.count());
    return outcome;
}

auto Worker::processJob(CallRecordRepository& records, JobEnvelope const& job) -> Result<JobOutcome>
{
    auto record = _queue.markTranscribing(records, job);
    if (!record)
        return std::unexpected(record.error());

    if (!record->has_value())
    {
        if (auto marked = _queue.markProcessed(job); !marked)
            return std::unexpected(marked.error());
        _metrics.jobs.increment(JobStatusLabel::MissingRecord);
        log::warning("Dropping job without call record record_id={} call_id={}", job.recordId, job.callId);
        return JobOutcome::MissingRecord;
    }

    for (auto attempt = 1;; ++attempt)
    {
        log::info("Transcribing call_id={} engine={} attempt={}", job.callId, job.engine, attempt);

        auto result = _provider.transcribe(job);
        if (result)
        {
            auto summaryPath = summarize(job, *result);
            if (auto stored =
                    _queue.recordSuccess(records, job, result->transcriptPath, result->language, std::move(summaryPath));
                !stored)
                return std::unexpected(stored.error());
            _metrics.jobs.increment(JobStatusLabel::Success);
            log::info("Transcription completed call_id={} engine={} transcript={}",
                      job.callId,
                      job.engine,
                      result->transcriptPath);
            return JobOutcome::Success;
        }

        auto const& failure = result.error();
        auto decision = _retryPolicy.decide(failure, attempt);

        if (decision.action == RetryDecision::Action::Retry)
        {
            _metrics.jobs.increment(JobStatusLabel::Retry);
            log::warning("Transcription failed call_id={} engine={} attempt={} status_code={} kind={} delay={:.1f}s: {}",
                         job.callId,
                         job.engine,
                         attempt,
                         failure.statusCode ? std::format("{}", *failure.statusCode) : "none",
                         failureKindName(failure.kind),
                         decision.delay.count(),
                         failure.message);
            sleep(decision.delay);

            if (stopRequested())
            {
                // Shutting down: hand the job to another worker instead of using up its attempts.
                if (auto requeued = _queue.returnToPending(records, job); !requeued)
                    return std::unexpected(requeued.error());
                _metrics.jobs.increment(JobStatusLabel::Interrupted);
                log::info("Returned job to queue on shutdown call_id={} engine={} attempt={}", job.callId, job.engine, attempt);
                return JobOutcome::Interrupted;
            }
            continue;
        }

        // The entry goes in first: once recordFailure() marks the key processed, the
        // dead-letter list is the only way back for this job.
        if (auto pushed = _queue.pushToDlq(DeadLetterEntry {
                .job = job,
                .reason = decision.reason,
                .statusCode = decision.statusCode,
                .failedAt = nowUtc(),
            });
            !pushed)
            return std::unexpected(pushed.error());

        if (auto stored = _queue.recordFailure(records, job, decision.errorCode, decision.errorMessage); !stored)
            return std::unexpected(stored.error());

        _metrics.jobs.increment(JobStatusLabel::Dlq);
        log::error("Job dead-lettered call_id={} engine={} attempt={} status_code={} reason={}",
                   job.callId,
                   job.engine,
                   attempt,
                   decision.statusCode ? std::format("{}", *decision.statusCode) : "none",
                   decision.reason);
        return JobOutcome::DeadLettered;
    }
}

auto Worker::summarize(JobEnvelope const& job, TranscriptResult const& result) const -> std::optional<std::string>
{
    if (!_summarizer)
        return std::nullopt;

    auto summary = _summarizer->summarizeFile(job.callId, result.transcriptPath);
    if (!summary)
    {
        log::warning("Skipping call summary call_id={}: {}", job.callId, summary.error());
        return std::nullopt;
    }
    log::debug("Wrote call summary call_id={} path={} bullets={}", job.callId, summary->path, summary->bullets.size());
    return std::move(summary->path);
}

void Worker::runForever(std::chrono::milliseconds timeout)
{
    log::info("Worker started (max_retries={}, base_backoff={:.1f}s)",
              _retryPolicy.maxRetries(),
              _retryPolicy.baseBackoff().count());

    while (!stopRequested())
    {
        auto outcome = processNext(timeout);
        if (!outcome)
        {
            log::error("Worker loop error: {}", outcome.error());
            sleep(_idleSleep);
            continue;
        }
        if (*outcome == JobOutcome::Idle)
            sleep(_idleSleep);
    }

    log::info("Worker stopped");
}

void Worker::requestStop()
{
    {
        auto const lock = std::lock_guard { _stopMutex };
        _stopRequested = true;
    }
    _stopSignal.notify_all();
}

void Worker::sleep(Seconds duration)
{
    if (_sleeper)
    {
        _sleeper(duration);
        return;
    }

    auto lock = std::unique_lock { _stopMutex };
    _stopSignal.wait_for(lock, duration, [this] { return _stopRequested.load(); });
}

} // namespace callscribe
