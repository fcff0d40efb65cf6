// SPDX-License-Identifier: Apache-2.0
#include "JobQueue.hpp"

#include <core/Log.hpp>

#include <format>

namespace callscribe
{

auto QueueKeys::withPrefix(std::string_view prefix) -> QueueKeys
{
    return QueueKeys {
        .pending = std::format("{}:jobs", prefix),
        .deadLetter = std::format("{}:jobs:dlq", prefix),
        .processed = std::format("{}:jobs:processed", prefix),
    };
}

JobQueue::JobQueue(QueueStore& store, QueueKeys keys): _store(store), _keys(std::move(keys))
{
}

auto JobQueue::enqueue(JobEnvelope const& job) -> Result<bool>
{
    auto pushed = _store.pushUnlessMember(_keys.pending, _keys.processed, job.dedupKey(), serializeJob(job));
    if (!pushed)
        return pushed;

    if (!*pushed)
        log::info("Skipping enqueue for already processed job call_id={} engine={}", job.callId, job.engine);
    else
        log::debug("Enqueued job record_id={} call_id={} engine={}", job.recordId, job.callId, job.engine);
    return pushed;
}

auto JobQueue::fetchJob(std::chrono::milliseconds timeout) -> Result<std::optional<JobEnvelope>>
{
    auto block = timeout.count() > 0;

    while (true)
    {
        auto item = block ? _store.blockingPopFront(_keys.pending, timeout) : _store.popFront(_keys.pending);
        block = false;
        if (!item)
            return std::unexpected(item.error());
        if (!item->has_value())
            return std::optional<JobEnvelope> {};

        auto job = parseJob(**item);
        if (!job)
        {
            log::error("Discarding malformed job payload: {} ({})", **item, job.error().message);
            continue;
        }

        auto processed = isProcessed(*job);
        if (!processed)
            return std::unexpected(processed.error());
        if (*processed)
        {
            log::warning("Skipping duplicate job call_id={} engine={}", job->callId, job->engine);
            continue;
        }

        return std::optional<JobEnvelope> { std::move(*job) };
    }
}

auto JobQueue::isProcessed(JobEnvelope const& job) -> Result<bool>
{
    return _store.isMember(_keys.processed, job.dedupKey());
}

auto JobQueue::markProcessed(JobEnvelope const& job) -> VoidResult
{
    return _store.addMember(_keys.processed, job.dedupKey()).transform([](bool) {});
}

auto JobQueue::pushToDlq(DeadLetterEntry const& entry) -> VoidResult
{
    return _store.pushBack(_keys.deadLetter, serializeDeadLetter(entry)).transform([](std::int64_t) {});
}

auto JobQueue::listDlqEntries() -> Result<std::vector<DeadLetterRecord>>
{
    auto payloads = _store.range(_keys.deadLetter, 0, -1);
    if (!payloads)
        return std::unexpected(payloads.error());

    auto entries = std::vector<DeadLetterRecord> {};
    entries.reserve(payloads->size());
    for (auto& payload: *payloads)
    {
        auto entry = parseDeadLetter(payload);
        if (!entry)
        {
            log::warning("Ignoring malformed dead-letter payload: {} ({})", payload, entry.error().message);
            continue;
        }
        auto entryId = deadLetterIdFor(payload);
        entries.push_back(DeadLetterRecord {
            .entryId = std::move(entryId),
            .entry = std::move(*entry),
            .payload = std::move(payload),
        });
    }
    return entries;
}

auto JobQueue::requeueDlqEntry(CallRecordRepository& records, std::string_view entryId)
    -> Result<std::optional<DeadLetterRecord>>
{
    auto entries = listDlqEntries();
    if (!entries)
        return std::unexpected(entries.error());

    for (auto& entry: *entries)
        if (entry.entryId == entryId)
            return replay(records, std::move(entry));

    return std::optional<DeadLetterRecord> {};
}

auto JobQueue::replayByRecordId(CallRecordRepository& records, std::int64_t recordId)
    -> Result<std::optional<DeadLetterRecord>>
{
    auto entries = listDlqEntries();
    if (!entries)
        return std::unexpected(entries.error());

    for (auto& entry: *entries)
        if (entry.entry.job.recordId == recordId)
            return replay(records, std::move(entry));

    return std::optional<DeadLetterRecord> {};
}

auto JobQueue::replay(CallRecordRepository& records, DeadLetterRecord found)
    -> Result<std::optional<DeadLetterRecord>>
{
    auto const& job = found.entry.job;

    auto replayed = _store.replayListValue(
        _keys.deadLetter, found.payload, _keys.processed, job.dedupKey(), _keys.pending, serializeJob(job));
    if (!replayed)
        return std::unexpected(replayed.error());
    if (!*replayed)
    {
        log::info("Dead-letter entry {} was removed concurrently", found.entryId);
        return std::optional<DeadLetterRecord> {};
    }

    // Only the caller that removed the entry resets the record.
    auto record = records.find(job.recordId);
    if (!record)
        return std::unexpected(record.error());
    if (record->has_value())
    {
        resetForReplay(**record);
        if (auto saved = records.save(**record); !saved)
            return std::unexpected(saved.error());
    }
    else
    {
        log::warning("Replaying dead-letter entry {} without call record record_id={}", found.entryId, job.recordId);
    }

    log::info("Requeued dead-letter entry {} record_id={} call_id={} engine={}",
              found.entryId,
              job.recordId,
              job.callId,
              job.engine);
    return std::optional<DeadLetterRecord> { std::move(found) };
}

auto JobQueue::markTranscribing(CallRecordRepository& records, JobEnvelope const& job)
    -> Result<std::optional<CallRecord>>
{
    auto record = records.find(job.recordId);
    if (!record)
        return std::unexpected(record.error());
    if (!record->has_value())
    {
        log::warning("Call record for job not found call_id={} record_id={}", job.callId, job.recordId);
        return std::optional<CallRecord> {};
    }

    callscribe::markTranscribing(**record, nowUtc());
    if (auto saved = records.save(**record); !saved)
        return std::unexpected(saved.error());
    return record;
}

auto JobQueue::recordSuccess(CallRecordRepository& records,
                             JobEnvelope const& job,
                             std::string transcriptPath,
                             std::optional<std::string> language,
                             std::optional<std::string> summaryPath) -> VoidResult
{
    auto record = records.find(job.recordId);
    if (!record)
        return std::unexpected(record.error());
    if (!record->has_value())
    {
        log::error("Call record missing when storing transcript call_id={} record_id={}", job.callId, job.recordId);
        return {};
    }

    markCompleted(**record, std::move(transcriptPath), std::move(language), std::move(summaryPath), nowUtc());
    if (auto saved = records.save(**record); !saved)
        return saved;
    return markProcessed(job);
}

auto JobQueue::recordFailure(CallRecordRepository& records,
                             JobEnvelope const& job,
                             std::string errorCode,
                             std::string errorMessage) -> VoidResult
{
    auto record = records.find(job.recordId);
    if (!record)
        return std::unexpected(record.error());
    if (!record->has_value())
    {
        log::error("Call record missing when recording failure call_id={} record_id={}", job.callId, job.recordId);
        return {};
    }

    markFailed(**record, std::move(errorCode), std::move(errorMessage), nowUtc());
    if (auto saved = records.save(**record); !saved)
        return saved;
    return markProcessed(job);
}

auto JobQueue::returnToPending(CallRecordRepository& records, JobEnvelope const& job) -> VoidResult
{
    if (auto pushed = enqueue(job); !pushed)
        return std::unexpected(pushed.error());

    auto record = records.find(job.recordId);
    if (!record)
        return std::unexpected(record.error());
    if (!record->has_value())
        return {};

    resetForReplay(**record);
    return records.save(**record);
}

auto JobQueue::stats() -> Result<QueueStats>
{
    auto pending = _store.length(_keys.pending);
    if (!pending)
        return std::unexpected(pending.error());
    auto deadLetters = _store.length(_keys.deadLetter);
    if (!deadLetters)
        return std::unexpected(deadLetters.error());
    auto processed = _store.memberCount(_keys.processed);
    if (!processed)
        return std::unexpected(processed.error());

    return QueueStats { .pending = *pending, .deadLetters = *deadLetters, .processed = *processed };
}

} // namespace callscribe
