// SPDX-License-Identifier: Apache-2.0
#include <queue/Job.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace callscribe;

namespace
{

    auto sampleJob() -> JobEnvelope
    {
        return JobEnvelope {
            .recordId = 42,
            .callId = "CA123",
            .recordingUrl = "https://recordings.example.com/CA123.wav",
            .engine = "openai-whisper",
            .language = "de",
        };
    }

} // namespace

TEST_CASE("dedupKey joins call id, recording url and engine", "[job]")
{
    CHECK(sampleJob().dedupKey() == "CA123|https://recordings.example.com/CA123.wav|openai-whisper");
}

TEST_CASE("dedupKey ignores record id and language", "[job]")
{
    auto a = sampleJob();
    auto b = sampleJob();
    b.recordId = 7;
    b.language.reset();
    CHECK(a.dedupKey() == b.dedupKey());

    b.engine = "stub";
    CHECK(a.dedupKey() != b.dedupKey());
}

TEST_CASE("toJson emits the flat wire object", "[job]")
{
    auto job = sampleJob();
    job.language.reset();
    auto const value = toJson(job);

    CHECK(value["record_id"] == 42);
    CHECK(value["call_id"] == "CA123");
    CHECK(value["recording_url"] == "https://recordings.example.com/CA123.wav");
    CHECK(value["engine"] == "openai-whisper");
    REQUIRE(value.contains("language"));
    CHECK(value["language"].is_null());
}

TEST_CASE("parseJob reads a serialized job back", "[job]")
{
    auto const job = sampleJob();
    auto parsed = parseJob(serializeJob(job));
    REQUIRE(parsed.has_value());
    CHECK(*parsed == job);
}

TEST_CASE("parseJob accepts a numeric string record id", "[job]")
{
    auto parsed = parseJob(R"({"record_id":"17","call_id":"C","recording_url":"u","engine":"stub"})");
    REQUIRE(parsed.has_value());
    CHECK(parsed->recordId == 17);
    CHECK(!parsed->language.has_value());
}

TEST_CASE("parseJob rejects malformed payloads", "[job]")
{
    SECTION("not JSON")
    {
        CHECK(!parseJob("not json").has_value());
    }

    SECTION("not an object")
    {
        auto parsed = parseJob("[1,2,3]");
        REQUIRE(!parsed.has_value());
        CHECK(parsed.error().code == ErrorCode::ProtocolError);
    }

    SECTION("missing field")
    {
        auto parsed = parseJob(R"({"record_id":1,"call_id":"C","engine":"stub"})");
        REQUIRE(!parsed.has_value());
        CHECK(parsed.error().message.find("recording_url") != std::string::npos);
    }

    SECTION("non-numeric record id")
    {
        CHECK(!parseJob(R"({"record_id":"abc","call_id":"C","recording_url":"u","engine":"stub"})").has_value());
    }
}

TEST_CASE("dead-letter payload carries status_code even when absent", "[job][dlq]")
{
    auto const entry = DeadLetterEntry { .job = sampleJob(), .reason = "max_retries", .statusCode = std::nullopt };
    auto const value = toJson(entry);

    REQUIRE(value.contains("status_code"));
    CHECK(value["status_code"].is_null());
    CHECK(value["reason"] == "max_retries");
    CHECK(value["job"]["call_id"] == "CA123");
    CHECK(value["failed_at"].get<std::string>().ends_with("+00:00"));
}

TEST_CASE("parseDeadLetter restores job, reason, status and timestamp", "[job][dlq]")
{
    auto const entry = DeadLetterEntry {
        .job = sampleJob(),
        .reason = "400: Invalid file format",
        .statusCode = 400,
        .failedAt = nowUtc(),
    };

    auto parsed = parseDeadLetter(serializeDeadLetter(entry));
    REQUIRE(parsed.has_value());
    CHECK(parsed->job == entry.job);
    CHECK(parsed->reason == entry.reason);
    CHECK(parsed->statusCode == 400);
    CHECK(parsed->failedAt == entry.failedAt);
}

TEST_CASE("parseDeadLetter rejects a payload without a job", "[job][dlq]")
{
    CHECK(!parseDeadLetter(R"({"reason":"x","failed_at":"2024-01-01T00:00:00+00:00"})").has_value());
}

TEST_CASE("deadLetterIdFor is a stable 16 digit hex digest", "[job][dlq]")
{
    auto const id = deadLetterIdFor("payload");
    CHECK(id.size() == 16);
    CHECK(id.find_first_not_of("0123456789abcdef") == std::string::npos);
    CHECK(id == deadLetterIdFor("payload"));
    CHECK(id != deadLetterIdFor("payload2"));

    // FNV-1a 64 of the empty string is the offset basis.
    CHECK(deadLetterIdFor("") == "cbf29ce484222325");
}

TEST_CASE("serializeDeadLetter replaces invalid UTF-8 in the reason", "[job][dlq]")
{
    auto const entry = DeadLetterEntry {
        .job = sampleJob(),
        .reason = "502: <html>Fehler \xfc</html>",
        .statusCode = 502,
    };

    auto const payload = serializeDeadLetter(entry);
    auto parsed = parseDeadLetter(payload);
    REQUIRE(parsed.has_value());
    CHECK(parsed->reason == "502: <html>Fehler \xef\xbf\xbd</html>");
    CHECK(parsed->statusCode == 502);
}
