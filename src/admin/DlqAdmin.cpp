// SPDX-License-Identifier: Apache-2.0
#include "DlqAdmin.hpp"

#include <core/Log.hpp>
#include <core/Time.hpp>

namespace callscribe
{

namespace
{

    auto statusCodeJson(std::optional<int> statusCode) -> nlohmann::json
    {
        return statusCode ? nlohmann::json(*statusCode) : nlohmann::json(nullptr);
    }

    auto orDash(std::string const& text) -> std::string const&
    {
        static auto const dash = std::string { "-" };
        return text.empty() ? dash : text;
    }

} // namespace

auto dlqEntryJson(DeadLetterRecord const& record) -> nlohmann::json
{
    return nlohmann::json {
        { "entry_id", record.entryId },
        { "job", toJson(record.entry.job) },
        { "reason", record.entry.reason },
        { "failed_at", formatIso8601(record.entry.failedAt) },
        { "status_code", statusCodeJson(record.entry.statusCode) },
    };
}

auto requeuedResponse(DeadLetterRecord const& record) -> nlohmann::json
{
    auto body = dlqEntryJson(record);
    body["status"] = "requeued";
    return body;
}

DlqAdmin::DlqAdmin(JobQueue& queue, CallRecordRepositoryFactory records):
    _queue(queue), _records(std::move(records))
{
}

auto DlqAdmin::enqueue(JobEnvelope const& job) -> Result<AdminReply>
{
    auto pushed = _queue.enqueue(job);
    if (!pushed)
        return std::unexpected(pushed.error());

    return AdminReply {
        .body = { { "status", *pushed ? "enqueued" : "skipped" }, { "dedup_key", job.dedupKey() }, { "job", toJson(job) } },
    };
}

auto DlqAdmin::list() -> Result<AdminReply>
{
    auto entries = _queue.listDlqEntries();
    if (!entries)
        return std::unexpected(entries.error());

    auto body = nlohmann::json::array();
    for (auto const& entry: *entries)
        body.push_back(dlqEntryJson(entry));
    return AdminReply { .body = std::move(body) };
}

auto DlqAdmin::requeue(std::string_view entryId, AuditContext const& audit) -> Result<AdminReply>
{
    auto records = _records ? _records() : nullptr;
    if (!records)
        return makeError(ErrorCode::RecordError, "Cannot open call record repository");

    auto replayed = _queue.requeueDlqEntry(*records, entryId);
    if (!replayed)
        return std::unexpected(replayed.error());

    return replied(*replayed, { { "status", "not_found" }, { "entry_id", std::string(entryId) } }, audit);
}

auto DlqAdmin::replayRecord(std::int64_t recordId, AuditContext const& audit) -> Result<AdminReply>
{
    auto records = _records ? _records() : nullptr;
    if (!records)
        return makeError(ErrorCode::RecordError, "Cannot open call record repository");

    auto replayed = _queue.replayByRecordId(*records, recordId);
    if (!replayed)
        return std::unexpected(replayed.error());

    return replied(*replayed, { { "status", "not_found" }, { "record_id", recordId } }, audit);
}

auto DlqAdmin::replied(std::optional<DeadLetterRecord> const& replayed,
                       nlohmann::json notFound,
                       AuditContext const& audit) -> AdminReply
{
    if (!replayed)
        return AdminReply { .body = std::move(notFound), .exitCode = AdminReply::ExitNotFound };

    auto const& job = replayed->entry.job;
    log::info("audit action=dlq_replay actor={} reason=\"{}\" entry_id={} record_id={} call_id={} engine={} "
              "dlq_reason=\"{}\"",
              orDash(audit.actor),
              audit.reason,
              replayed->entryId,
              job.recordId,
              job.callId,
              job.engine,
              replayed->entry.reason);

    return AdminReply { .body = requeuedResponse(*replayed) };
}

auto DlqAdmin::stats() -> Result<AdminReply>
{
    auto stats = _queue.stats();
    if (!stats)
        return std::unexpected(stats.error());

    return AdminReply {
        .body = {
            { "pending", stats->pending },
            { "dead_letters", stats->deadLetters },
            { "processed", stats->processed },
        },
    };
}

} // namespace callscribe
