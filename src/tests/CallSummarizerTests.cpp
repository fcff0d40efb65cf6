// SPDX-License-Identifier: Apache-2.0
#include <stt/CallSummarizer.hpp>
#include <tests/TestSupport.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <fstream>
#include <sstream>

using namespace callscribe;
using Catch::Matchers::ContainsSubstring;

namespace
{

    auto fixedTime() -> Timestamp
    {
        using namespace std::chrono;
        return Timestamp { sys_days { year { 2024 } / 12 / 31 } + hours { 23 } + minutes { 59 } + seconds { 58 }
                           + microseconds { 123456 } };
    }

    auto readFile(std::filesystem::path const& path) -> std::string
    {
        auto contents = std::stringstream {};
        contents << std::ifstream(path).rdbuf();
        return contents.str();
    }

} // namespace

TEST_CASE("buildSummaryBullets takes the first sentences", "[summary]")
{
    SECTION("sentences split across punctuation and lines")
    {
        auto bullets = buildSummaryBullets("Hello there!  How are   you?\nI need a refund. It broke.\n\nThanks.");
        REQUIRE(bullets.has_value());
        CHECK(*bullets
              == std::vector<std::string> { "Hello there!", "How are you?", "I need a refund.", "It broke.", "Thanks." });
    }

    SECTION("at most five bullets")
    {
        auto bullets = buildSummaryBullets("One. Two. Three. Four. Five. Six. Seven.");
        REQUIRE(bullets.has_value());
        CHECK(bullets->size() == 5);
        CHECK(bullets->back() == "Five.");
    }

    SECTION("punctuation inside a word does not split")
    {
        auto bullets = buildSummaryBullets("Version 2.5 shipped. Call me at 3.30 pm. Bye.");
        REQUIRE(bullets.has_value());
        CHECK(bullets->front() == "Version 2.5 shipped.");
    }
}

TEST_CASE("buildSummaryBullets falls back to word chunks", "[summary]")
{
    auto bullets = buildSummaryBullets("the customer called about a late delivery and wants it tomorrow");
    REQUIRE(bullets.has_value());
    CHECK(*bullets
          == std::vector<std::string> {
              "the customer called about a late delivery and wants it tomorrow",
              "the customer called about",
              "a late delivery and",
              "wants it tomorrow",
          });
}

TEST_CASE("buildSummaryBullets rejects unusable transcripts", "[summary]")
{
    auto const empty = buildSummaryBullets(" \n\t ");
    REQUIRE(!empty.has_value());
    CHECK(empty.error().code == ErrorCode::InvalidArgument);
    CHECK_THAT(empty.error().message, ContainsSubstring("empty"));

    auto const tooShort = buildSummaryBullets("hello");
    REQUIRE(!tooShort.has_value());
    CHECK(tooShort.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("buildSummaryBullets shortens long sentences", "[summary]")
{
    auto const longSentence = std::string(300, 'a');
    auto bullets = buildSummaryBullets(std::format("{}. Second. Third.", longSentence));
    REQUIRE(bullets.has_value());
    auto const& first = bullets->front();
    CHECK(first == std::string(255, 'a') + "\xe2\x80\xa6");

    SECTION("multi-byte characters are counted once")
    {
        auto umlauts = std::string {};
        for (auto i = 0; i < 256; ++i)
            umlauts += "\xc3\xbc";
        auto kept = buildSummaryBullets(std::format("{} One. Two.", umlauts));
        REQUIRE(kept.has_value());
        CHECK(kept->front() == umlauts.substr(0, 255 * 2) + "\xe2\x80\xa6");
    }
}

TEST_CASE("formatSummaryMarkdown writes one bullet per line", "[summary]")
{
    CHECK(formatSummaryMarkdown({ "a", "b c" }) == "- a\n- b c\n");
}

TEST_CASE("summaryPathFor groups summaries by day", "[summary]")
{
    auto const path = summaryPathFor("/srv/summaries", "call/../7", fixedTime());
    CHECK(path == std::filesystem::path("/srv/summaries/2024/12/31/call_call____7_20241231T235958Z.md"));
}

TEST_CASE("CallSummarizer stores the summary as Markdown", "[summary]")
{
    auto const dir = test::TempDirectory {};
    auto const summarizer = CallSummarizer(dir.path() / "summaries", fixedTime);

    auto summary = summarizer.summarize("C1", "First point. Second point. Third point.");
    REQUIRE(summary.has_value());
    CHECK(summary->bullets.size() == 3);
    CHECK(std::filesystem::path(summary->path)
          == dir.path() / "summaries" / "2024" / "12" / "31" / "call_C1_20241231T235958Z.md");
    CHECK(readFile(summary->path) == "- First point.\n- Second point.\n- Third point.\n");
}

TEST_CASE("CallSummarizer reads transcripts from local files", "[summary]")
{
    auto const dir = test::TempDirectory {};
    auto const summarizer = CallSummarizer(dir.path(), fixedTime);
    auto const transcript = dir.path() / "C2.txt";
    std::ofstream(transcript) << "Alpha. Beta. Gamma.\n";

    SECTION("plain path")
    {
        auto summary = summarizer.summarizeFile("C2", transcript.string());
        REQUIRE(summary.has_value());
        CHECK(summary->bullets == std::vector<std::string> { "Alpha.", "Beta.", "Gamma." });
    }

    SECTION("file URL")
    {
        auto summary = summarizer.summarizeFile("C2", "file://" + transcript.string());
        REQUIRE(summary.has_value());
        CHECK(summary->bullets.size() == 3);
    }

    SECTION("remote locations are not read")
    {
        auto summary = summarizer.summarizeFile("C2", "s3://bucket/C2.txt");
        REQUIRE(!summary.has_value());
        CHECK(summary.error().code == ErrorCode::InvalidArgument);
    }

    SECTION("missing file")
    {
        auto summary = summarizer.summarizeFile("C2", (dir.path() / "nope.txt").string());
        REQUIRE(!summary.has_value());
        CHECK(summary.error().code == ErrorCode::IoError);
    }
}
