// SPDX-License-Identifier: Apache-2.0
#include <records/CallRecord.hpp>
#include <records/CallRecordRepository.hpp>
#include <tests/TestSupport.hpp>

#include <catch2/catch_test_macros.hpp>

#include <fstream>

using namespace callscribe;

TEST_CASE("status names round-trip through their wire form", "[records]")
{
    CHECK(toString(CallRecordStatus::MissingAudio) == "missing_audio");
    CHECK(parseCallRecordStatus("transcribing") == CallRecordStatus::Transcribing);
    CHECK(!parseCallRecordStatus("TRANSCRIBING").has_value());
}

TEST_CASE("record lifecycle transitions", "[records]")
{
    auto record = test::downloadedRecord(1, "C1", "http://x/1.wav");
    auto const now = nowUtc();

    markTranscribing(record, now);
    CHECK(record.status == CallRecordStatus::Transcribing);
    CHECK(record.retryCount == 1);
    CHECK(record.lastRetryAt == now);

    SECTION("failure then replay")
    {
        markFailed(record, "http_400", "Invalid file format", now);
        CHECK(record.status == CallRecordStatus::Error);
        CHECK(record.errorCode == "http_400");

        resetForReplay(record);
        CHECK(record.status == CallRecordStatus::Downloaded);
        CHECK(!record.errorCode.has_value());
        CHECK(!record.errorMessage.has_value());
        CHECK(record.retryCount == 1);

        resetForReplay(record);
        CHECK(record.status == CallRecordStatus::Downloaded);
    }

    SECTION("completion clears earlier errors")
    {
        markFailed(record, "max_retries", "boom", now);
        markCompleted(record, "/t/C1.txt", "en", "/s/C1.md", now);
        CHECK(record.status == CallRecordStatus::Completed);
        CHECK(record.transcriptPath == "/t/C1.txt");
        CHECK(record.language == "en");
        CHECK(record.summaryPath == "/s/C1.md");
        CHECK(!record.errorCode.has_value());
    }
}

TEST_CASE("callRecordFromJson reads back toJson", "[records]")
{
    auto record = test::downloadedRecord(9, "C9", "file:///rec/9.wav");
    markTranscribing(record, nowUtc());
    markFailed(record, "http_413", "too large", nowUtc());

    auto parsed = callRecordFromJson(toJson(record));
    REQUIRE(parsed.has_value());
    CHECK(parsed->id == 9);
    CHECK(parsed->status == CallRecordStatus::Error);
    CHECK(parsed->retryCount == 1);
    CHECK(parsed->lastRetryAt == record.lastRetryAt);
    CHECK(parsed->errorMessage == "too large");
    CHECK(!parsed->transcriptPath.has_value());
    CHECK(!parsed->summaryPath.has_value());

    markCompleted(record, "/t/C9.txt", std::nullopt, "/s/C9.md", nowUtc());
    auto const json = toJson(record);
    CHECK(json["summary_path"] == "/s/C9.md");
    auto completed = callRecordFromJson(json);
    REQUIRE(completed.has_value());
    CHECK(completed->summaryPath == "/s/C9.md");
}

TEST_CASE("callRecordFromJson rejects unknown status", "[records]")
{
    auto parsed = callRecordFromJson(nlohmann::json { { "id", 1 }, { "status", "exploded" } });
    REQUIRE(!parsed.has_value());
    CHECK(parsed.error().code == ErrorCode::RecordError);
}

TEST_CASE("MemoryCallRecordRepository sessions share one table", "[records]")
{
    auto table = std::make_shared<CallRecordTable>();
    auto writer = MemoryCallRecordRepository(table);
    auto reader = MemoryCallRecordRepository(table);

    auto before = reader.find(1);
    REQUIRE(before.has_value());
    CHECK(!before->has_value());
    REQUIRE(writer.save(test::downloadedRecord(1, "C1", "u")).has_value());

    auto found = reader.find(1);
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    CHECK((*found)->callId == "C1");
    CHECK(table->size() == 1);
}

TEST_CASE("FileCallRecordRepository stores one JSON file per record", "[records]")
{
    auto const dir = test::TempDirectory {};
    auto repository = FileCallRecordRepository(dir.path() / "records");

    auto missing = repository.find(5);
    REQUIRE(missing.has_value());
    CHECK(!missing->has_value());

    auto record = test::downloadedRecord(5, "C5", "http://x/5.wav");
    markTranscribing(record, nowUtc());
    REQUIRE(repository.save(record).has_value());
    CHECK(std::filesystem::exists(repository.pathFor(5)));

    auto found = repository.find(5);
    REQUIRE(found.has_value());
    REQUIRE(found->has_value());
    CHECK((*found)->status == CallRecordStatus::Transcribing);
    CHECK((*found)->retryCount == 1);

    SECTION("no temporary files are left behind")
    {
        auto files = 0;
        for ([[maybe_unused]] auto const& entry: std::filesystem::directory_iterator(dir.path() / "records"))
            ++files;
        CHECK(files == 1);
    }

    SECTION("a corrupt file is an error, not a missing record")
    {
        std::ofstream(repository.pathFor(5), std::ios::trunc) << "{ not json";
        auto corrupt = repository.find(5);
        REQUIRE(!corrupt.has_value());
        CHECK(corrupt.error().code == ErrorCode::RecordError);
    }
}
