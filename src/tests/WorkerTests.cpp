// SPDX-License-Identifier: Apache-2.0
#include <queue/JobQueue.hpp>
#include <queue/MemoryQueueStore.hpp>
#include <stt/CallSummarizer.hpp>
#include <stt/PlaceholderProvider.hpp>
#include <stt/ProviderRouter.hpp>
#include <tests/TestSupport.hpp>
#include <worker/Worker.hpp>
#include <worker/WorkerPool.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <fstream>
#include <sstream>
#include <thread>

using namespace callscribe;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace
{

    auto makeJob(std::int64_t recordId, std::string callId, std::string engine = "stub") -> JobEnvelope
    {
        auto url = std::format("http://x/{}.wav", recordId);
        return JobEnvelope {
            .recordId = recordId,
            .callId = std::move(callId),
            .recordingUrl = std::move(url),
            .engine = std::move(engine),
            .language = std::nullopt,
        };
    }

    auto success(std::string path, std::optional<std::string> language = std::nullopt) -> TranscriptionOutcome
    {
        return TranscriptResult { .transcriptPath = std::move(path), .language = std::move(language) };
    }

    auto failure(TranscriptionFailure f) -> TranscriptionOutcome
    {
        return std::unexpected(std::move(f));
    }

    /// Queue, records and metrics wired up the way WorkerApp does, with a recording sleeper.
    struct WorkerFixture
    {
        MemoryQueueStore store;
        JobQueue queue { store };
        std::shared_ptr<CallRecordTable> table = std::make_shared<CallRecordTable>();
        metrics::Registry registry;
        WorkerMetrics metrics = WorkerMetrics::registerWith(registry);
        WorkerSettings settings { .maxRetries = 3, .baseBackoffSeconds = 2.0, .idleSleepSeconds = 1.0 };
        std::vector<Seconds> sleeps;

        auto recordsFactory() -> CallRecordRepositoryFactory
        {
            return [table = table] {
                return std::make_unique<MemoryCallRecordRepository>(table);
            };
        }

        auto makeWorker(TranscriptionProvider& provider) -> std::unique_ptr<Worker>
        {
            return std::make_unique<Worker>(
                queue, provider, recordsFactory(), metrics, settings, [this](Seconds s) { sleeps.push_back(s); });
        }

        void seed(JobEnvelope const& job)
        {
            table->put(test::downloadedRecord(job.recordId, job.callId, job.recordingUrl));
            REQUIRE(queue.enqueue(job) == true);
        }

        auto deadLetters() -> std::vector<DeadLetterRecord>
        {
            auto entries = queue.listDlqEntries();
            REQUIRE(entries.has_value());
            return *entries;
        }
    };

} // namespace

// {{{ RetryPolicy
TEST_CASE("RetryPolicy doubles the backoff per attempt", "[worker][retry]")
{
    auto const policy = RetryPolicy(5, Seconds { 2.0 });
    CHECK(policy.backoffDelay(1).count() == Catch::Approx(2.0));
    CHECK(policy.backoffDelay(2).count() == Catch::Approx(4.0));
    CHECK(policy.backoffDelay(3).count() == Catch::Approx(8.0));
    CHECK(policy.backoffDelay(4).count() == Catch::Approx(16.0));
}

TEST_CASE("RetryPolicy clamps its settings", "[worker][retry]")
{
    auto const policy = RetryPolicy(0, Seconds { 0.0 });
    CHECK(policy.maxRetries() == 1);
    CHECK(policy.baseBackoff().count() == Catch::Approx(RetryPolicy::MinBackoff));

    auto const decision = policy.decide(TranscriptionFailure::transient("boom"), 1);
    CHECK(decision.action == RetryDecision::Action::DeadLetter);
}

TEST_CASE("RetryPolicy dead-letters client errors at once", "[worker][retry]")
{
    auto const policy = RetryPolicy(5, Seconds { 1.0 });
    auto const decision = policy.decide(TranscriptionFailure::fromStatus(413, "File too large"), 1);

    CHECK(decision.action == RetryDecision::Action::DeadLetter);
    CHECK(decision.errorCode == "http_413");
    CHECK(decision.errorMessage == "File too large");
    CHECK(decision.reason == "413: File too large");
    CHECK(decision.statusCode == 413);
}

TEST_CASE("RetryPolicy retries transient failures until the last attempt", "[worker][retry]")
{
    auto const policy = RetryPolicy(3, Seconds { 1.0 });
    auto const failure = TranscriptionFailure::fromStatus(503, "Service Unavailable");

    auto const first = policy.decide(failure, 1);
    CHECK(first.action == RetryDecision::Action::Retry);
    CHECK(first.delay.count() == Catch::Approx(1.0));

    auto const second = policy.decide(failure, 2);
    CHECK(second.action == RetryDecision::Action::Retry);
    CHECK(second.delay.count() == Catch::Approx(2.0));

    auto const last = policy.decide(failure, 3);
    CHECK(last.action == RetryDecision::Action::DeadLetter);
    CHECK(last.errorCode == "max_retries");
    CHECK(last.errorMessage == "503: Service Unavailable");
    CHECK(last.reason == "max_retries");
    CHECK(last.statusCode == 503);
}

TEST_CASE("RetryPolicy labels exhausted exceptions as unexpected", "[worker][retry]")
{
    auto const policy = RetryPolicy(1, Seconds { 1.0 });
    auto const decision = policy.decide(TranscriptionFailure::unexpected("provider exploded"), 1);
    CHECK(decision.errorCode == "unexpected_error");
    CHECK(decision.errorMessage == "provider exploded");
    CHECK(decision.reason == "max_retries");
    CHECK(!decision.statusCode.has_value());
}
// }}}

// {{{ Worker
TEST_CASE("Worker is idle on an empty queue", "[worker]")
{
    auto f = WorkerFixture {};
    auto provider = test::ScriptedProvider({ success("/t/x.txt") });
    auto worker = f.makeWorker(provider);

    CHECK(worker->processNext(0ms) == JobOutcome::Idle);
    CHECK(provider.calls == 0);
    CHECK(f.metrics.duration.count() == 0);
}

TEST_CASE("Worker stores a successful transcript", "[worker]")
{
    auto f = WorkerFixture {};
    auto const job = makeJob(1, "C1");
    f.seed(job);
    auto provider = test::ScriptedProvider({ success("/t/C1.txt", "de") });
    auto worker = f.makeWorker(provider);

    CHECK(worker->processNext(0ms) == JobOutcome::Success);

    auto const record = f.table->get(1);
    REQUIRE(record.has_value());
    CHECK(record->status == CallRecordStatus::Completed);
    CHECK(record->transcriptPath == "/t/C1.txt");
    CHECK(record->language == "de");
    CHECK(record->retryCount == 1);
    CHECK(f.queue.isProcessed(job) == true);
    CHECK(f.sleeps.empty());
    CHECK(f.metrics.jobs.value(JobStatusLabel::Success) == 1);
    CHECK(f.metrics.duration.count() == 1);
}

TEST_CASE("Worker backs off exponentially between transient failures", "[worker]")
{
    auto f = WorkerFixture {};
    f.seed(makeJob(1, "C1"));
    auto provider = test::ScriptedProvider({
        failure(TranscriptionFailure::fromStatus(502, "Bad Gateway")),
        failure(TranscriptionFailure::transient("connection reset")),
        success("/t/C1.txt"),
    });
    auto worker = f.makeWorker(provider);

    CHECK(worker->processNext(0ms) == JobOutcome::Success);
    CHECK(provider.calls == 3);
    REQUIRE(f.sleeps.size() == 2);
    CHECK(f.sleeps[0].count() == Catch::Approx(2.0));
    CHECK(f.sleeps[1].count() == Catch::Approx(4.0));

    auto const record = f.table->get(1);
    REQUIRE(record.has_value());
    CHECK(record->retryCount == 1);
    CHECK(f.metrics.jobs.value(JobStatusLabel::Retry) == 2);
    CHECK(f.metrics.jobs.value(JobStatusLabel::Success) == 1);
    CHECK(f.deadLetters().empty());
}

TEST_CASE("Worker dead-letters a client error without retrying", "[worker]")
{
    auto f = WorkerFixture {};
    auto const job = makeJob(1, "C1");
    f.seed(job);
    auto provider = test::ScriptedProvider({ failure(TranscriptionFailure::fromStatus(400, "Invalid file format")) });
    auto worker = f.makeWorker(provider);

    CHECK(worker->processNext(0ms) == JobOutcome::DeadLettered);
    CHECK(provider.calls == 1);
    CHECK(f.sleeps.empty());

    auto const entries = f.deadLetters();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].entry.job == job);
    CHECK(entries[0].entry.reason == "400: Invalid file format");
    CHECK(entries[0].entry.statusCode == 400);

    auto const record = f.table->get(1);
    REQUIRE(record.has_value());
    CHECK(record->status == CallRecordStatus::Error);
    CHECK(record->errorCode == "http_400");
    CHECK(record->errorMessage == "Invalid file format");
    CHECK(f.queue.isProcessed(job) == true);
    CHECK(f.metrics.jobs.value(JobStatusLabel::Dlq) == 1);
    CHECK(f.metrics.jobs.value(JobStatusLabel::Retry) == 0);
}

TEST_CASE("Worker dead-letters after exhausting its retries", "[worker]")
{
    auto f = WorkerFixture {};
    f.seed(makeJob(1, "C1"));
    auto provider = test::ScriptedProvider({ failure(TranscriptionFailure::fromStatus(503, "Service Unavailable")) });
    auto worker = f.makeWorker(provider);

    CHECK(worker->processNext(0ms) == JobOutcome::DeadLettered);
    CHECK(provider.calls == 3);
    CHECK(f.sleeps.size() == 2);

    auto const entries = f.deadLetters();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].entry.reason == "max_retries");
    CHECK(entries[0].entry.statusCode == 503);

    auto const record = f.table->get(1);
    REQUIRE(record.has_value());
    CHECK(record->errorCode == "max_retries");
    CHECK(record->errorMessage == "503: Service Unavailable");
    CHECK(f.metrics.jobs.value(JobStatusLabel::Retry) == 2);
    CHECK(f.metrics.jobs.value(JobStatusLabel::Dlq) == 1);
}

TEST_CASE("Worker treats provider exceptions as retryable", "[worker]")
{
    auto f = WorkerFixture {};
    f.settings.maxRetries = 2;
    f.seed(makeJob(1, "C1"));

    auto router = ProviderRouter("stub");
    router.add("stub", std::make_unique<test::ThrowingProvider>());
    auto worker = f.makeWorker(router);

    CHECK(worker->processNext(0ms) == JobOutcome::DeadLettered);
    CHECK(f.sleeps.size() == 1);

    auto const record = f.table->get(1);
    REQUIRE(record.has_value());
    CHECK(record->errorCode == "unexpected_error");
    CHECK(record->errorMessage == "provider exploded");
}

TEST_CASE("Worker drops jobs whose call record is missing", "[worker]")
{
    auto f = WorkerFixture {};
    auto const job = makeJob(42, "ghost");
    REQUIRE(f.queue.enqueue(job) == true);
    auto provider = test::ScriptedProvider({ success("/t/ghost.txt") });
    auto worker = f.makeWorker(provider);

    CHECK(worker->processNext(0ms) == JobOutcome::MissingRecord);
    CHECK(provider.calls == 0);
    CHECK(f.queue.isProcessed(job) == true);
    CHECK(f.deadLetters().empty());
    CHECK(f.metrics.jobs.value(JobStatusLabel::MissingRecord) == 1);
}

TEST_CASE("Worker counts every attempt on the record", "[worker]")
{
    auto f = WorkerFixture {};
    auto const job = makeJob(1, "C1");
    f.seed(job);
    auto provider = test::ScriptedProvider({ failure(TranscriptionFailure::fromStatus(404, "Not Found")) });
    auto worker = f.makeWorker(provider);
    REQUIRE(worker->processNext(0ms) == JobOutcome::DeadLettered);

    auto const entryId = f.deadLetters().front().entryId;
    auto records = MemoryCallRecordRepository(f.table);
    REQUIRE(f.queue.requeueDlqEntry(records, entryId).has_value());

    auto second = test::ScriptedProvider({ success("/t/C1.txt") });
    auto replayWorker = f.makeWorker(second);
    CHECK(replayWorker->processNext(0ms) == JobOutcome::Success);

    auto const record = f.table->get(1);
    REQUIRE(record.has_value());
    CHECK(record->retryCount == 2);
    CHECK(record->status == CallRecordStatus::Completed);
}

TEST_CASE("Worker reports a failing repository factory", "[worker]")
{
    auto f = WorkerFixture {};
    f.seed(makeJob(1, "C1"));
    auto provider = test::ScriptedProvider({ success("/t/C1.txt") });
    auto worker = Worker(f.queue, provider, [] { return std::unique_ptr<CallRecordRepository> {}; }, f.metrics, f.settings);

    auto const outcome = worker.processNext(0ms);
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::RecordError);
}

TEST_CASE("Worker puts the job back when stopped between retries", "[worker]")
{
    auto f = WorkerFixture {};
    auto const job = makeJob(1, "C1");
    f.seed(job);
    auto provider = test::ScriptedProvider({ failure(TranscriptionFailure::transient("timeout")) });

    auto worker = std::unique_ptr<Worker> {};
    worker = std::make_unique<Worker>(f.queue, provider, f.recordsFactory(), f.metrics, f.settings, [&](Seconds) {
        worker->requestStop();
    });

    CHECK(worker->processNext(0ms) == JobOutcome::Interrupted);
    CHECK(provider.calls == 1);
    CHECK(f.queue.isProcessed(job) == false);
    CHECK(f.store.length("stt:jobs") == 1);
    CHECK(f.deadLetters().empty());
    CHECK(f.metrics.jobs.value(JobStatusLabel::Interrupted) == 1);
    CHECK(f.metrics.jobs.value(JobStatusLabel::Retry) == 1);

    auto const record = f.table->get(1);
    REQUIRE(record.has_value());
    CHECK(record->status == CallRecordStatus::Downloaded);
    CHECK(record->retryCount == 1);
}

TEST_CASE("Worker runs a stub job end to end", "[worker][e2e]")
{
    auto const dir = test::TempDirectory {};
    auto f = WorkerFixture {};
    auto const job = makeJob(1, "C1");
    f.seed(job);

    auto router = ProviderRouter("stub");
    router.add("stub", std::make_unique<PlaceholderProvider>(dir.path() / "transcripts"));
    auto worker = f.makeWorker(router);

    CHECK(worker->processNext(0ms) == JobOutcome::Success);

    auto const record = f.table->get(1);
    REQUIRE(record.has_value());
    CHECK(record->status == CallRecordStatus::Completed);
    REQUIRE(record->transcriptPath.has_value());
    CHECK(std::filesystem::path(*record->transcriptPath) == dir.path() / "transcripts" / "C1.txt");

    auto contents = std::stringstream {};
    contents << std::ifstream(*record->transcriptPath).rdbuf();
    CHECK(contents.str() == PlaceholderProvider::PlaceholderText);

    CHECK(f.store.isMember("stt:jobs:processed", "C1|http://x/1.wav|stub") == true);

    // Enqueueing the finished job again is a no-op.
    CHECK(f.queue.enqueue(job) == false);
    CHECK(f.store.length("stt:jobs") == 0);

    // A duplicate that was already pending is discarded on fetch.
    REQUIRE(f.store.pushBack("stt:jobs", serializeJob(job)).has_value());
    CHECK(worker->processNext(0ms) == JobOutcome::Idle);
    CHECK(f.metrics.jobs.value(JobStatusLabel::Success) == 1);
}

TEST_CASE("Worker dead-letters failures whose message is not valid UTF-8", "[worker]")
{
    auto const dir = test::TempDirectory {};
    auto f = WorkerFixture {};
    auto const job = makeJob(1, "C1");

    auto seeded = FileCallRecordRepository(dir.path());
    REQUIRE(seeded.save(test::downloadedRecord(1, "C1", job.recordingUrl)).has_value());
    REQUIRE(f.queue.enqueue(job) == true);

    auto provider = test::ScriptedProvider({ failure(TranscriptionFailure::fromStatus(415, "<html>Fehler \xfc</html>")) });
    auto worker = Worker(
        f.queue,
        provider,
        [path = dir.path()] { return std::make_unique<FileCallRecordRepository>(path); },
        f.metrics,
        f.settings,
        [](Seconds) {});

    CHECK(worker.processNext(0ms) == JobOutcome::DeadLettered);

    auto const entries = f.deadLetters();
    REQUIRE(entries.size() == 1);
    CHECK(entries[0].entry.statusCode == 415);
    CHECK_THAT(entries[0].entry.reason, ContainsSubstring("415: <html>Fehler "));
    CHECK_THAT(entries[0].entry.reason, ContainsSubstring("\xef\xbf\xbd"));

    auto const record = seeded.find(1);
    REQUIRE(record.has_value());
    REQUIRE(record->has_value());
    CHECK((*record)->status == CallRecordStatus::Error);
    CHECK((*record)->errorCode == "http_415");
    CHECK(f.queue.isProcessed(job) == true);
}

TEST_CASE("Worker leaves the job unprocessed when the dead-letter push fails", "[worker]")
{
    auto store = test::FaultyQueueStore {};
    store.failPushTo = "stt:jobs:dlq";
    auto queue = JobQueue { store };
    auto f = WorkerFixture {};
    auto const job = makeJob(1, "C1");
    f.table->put(test::downloadedRecord(1, "C1", job.recordingUrl));
    REQUIRE(queue.enqueue(job) == true);

    auto provider = test::ScriptedProvider({ failure(TranscriptionFailure::fromStatus(400, "Invalid file format")) });
    auto worker = Worker(queue, provider, f.recordsFactory(), f.metrics, f.settings, [](Seconds) {});

    auto const outcome = worker.processNext(0ms);
    REQUIRE(!outcome.has_value());
    CHECK(outcome.error().code == ErrorCode::StoreError);
    CHECK(queue.isProcessed(job) == false);
    CHECK(f.metrics.jobs.value(JobStatusLabel::Dlq) == 0);

    auto const record = f.table->get(1);
    REQUIRE(record.has_value());
    CHECK(record->status == CallRecordStatus::Transcribing);
    CHECK(!record->errorCode.has_value());

    // The job can still be submitted again.
    CHECK(queue.enqueue(job) == true);
}

TEST_CASE("Worker writes a call summary after a successful transcription", "[worker][summary]")
{
    auto const dir = test::TempDirectory {};
    auto f = WorkerFixture {};
    auto const transcript = dir.path() / "C1.txt";
    std::ofstream(transcript) << "Customer asked about the invoice. Agent confirmed the refund.\nCall ended politely.\n";

    auto const summarizer = CallSummarizer(dir.path() / "summaries", [] {
        return Timestamp { std::chrono::sys_days { std::chrono::year { 2024 } / 5 / 1 } + std::chrono::hours { 10 } };
    });

    SECTION("summary stored on the record")
    {
        f.seed(makeJob(1, "C1"));
        auto provider = test::ScriptedProvider({ success(transcript.string()) });
        auto worker = Worker(f.queue, provider, f.recordsFactory(), f.metrics, f.settings, [](Seconds) {}, &summarizer);

        CHECK(worker.processNext(0ms) == JobOutcome::Success);

        auto const record = f.table->get(1);
        REQUIRE(record.has_value());
        REQUIRE(record->summaryPath.has_value());
        CHECK(std::filesystem::path(*record->summaryPath)
              == dir.path() / "summaries" / "2024" / "05" / "01" / "call_C1_20240501T100000Z.md");

        auto contents = std::stringstream {};
        contents << std::ifstream(*record->summaryPath).rdbuf();
        CHECK(contents.str()
              == "- Customer asked about the invoice.\n- Agent confirmed the refund.\n- Call ended politely.\n");
    }

    SECTION("a transcript that cannot be summarized still completes the job")
    {
        f.seed(makeJob(2, "C2"));
        auto provider = test::ScriptedProvider({ success((dir.path() / "missing.txt").string()) });
        auto worker = Worker(f.queue, provider, f.recordsFactory(), f.metrics, f.settings, [](Seconds) {}, &summarizer);

        CHECK(worker.processNext(0ms) == JobOutcome::Success);

        auto const record = f.table->get(2);
        REQUIRE(record.has_value());
        CHECK(record->status == CallRecordStatus::Completed);
        CHECK(!record->summaryPath.has_value());
    }
}

TEST_CASE("Worker runForever stops on request", "[worker]")
{
    auto f = WorkerFixture {};
    f.seed(makeJob(1, "C1"));
    auto provider = test::ScriptedProvider({ success("/t/C1.txt") });

    auto worker = std::unique_ptr<Worker> {};
    worker = std::make_unique<Worker>(f.queue, provider, f.recordsFactory(), f.metrics, f.settings, [&](Seconds) {
        worker->requestStop();
    });

    worker->runForever(0ms);
    CHECK(worker->stopRequested());
    CHECK(provider.calls == 1);
}
// }}}

// {{{ WorkerPool
TEST_CASE("WorkerPool drains the queue with several threads", "[worker][pool]")
{
    auto const dir = test::TempDirectory {};
    auto f = WorkerFixture {};
    f.settings.idleSleepSeconds = 0.1;
    for (auto id = 1; id <= 6; ++id)
        f.seed(makeJob(id, std::format("C{}", id)));

    auto router = ProviderRouter("stub");
    router.add("stub", std::make_unique<PlaceholderProvider>(dir.path()));

    auto const factory = [&] {
        return std::make_unique<Worker>(f.queue, router, f.recordsFactory(), f.metrics, f.settings);
    };
    CHECK(WorkerPool(0, factory, 20ms).workerCount() == 1);

    auto pool = WorkerPool(3, factory, 20ms);
    REQUIRE(pool.start());
    CHECK(pool.isRunning());
    CHECK(!pool.start());

    auto const deadline = std::chrono::steady_clock::now() + 10s;
    while (f.metrics.jobs.value(JobStatusLabel::Success) < 6 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(10ms);

    pool.stop();
    CHECK(!pool.isRunning());

    CHECK(f.metrics.jobs.value(JobStatusLabel::Success) == 6);
    for (auto id = 1; id <= 6; ++id)
        CHECK(f.table->get(id)->status == CallRecordStatus::Completed);
    CHECK(f.store.length("stt:jobs") == 0);
}

TEST_CASE("WorkerPool refuses to start without workers", "[worker][pool]")
{
    auto pool = WorkerPool(2, [] { return std::unique_ptr<Worker> {}; }, 20ms);
    CHECK(!pool.start());
    CHECK(!pool.isRunning());
}
// }}}
