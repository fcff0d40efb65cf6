// SPDX-License-Identifier: Apache-2.0
#include <core/Time.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace callscribe;
using namespace std::chrono;

TEST_CASE("formatIso8601 prints microseconds and a UTC offset", "[time]")
{
    auto const instant = sys_days { 2024y / January / 2 } + 3h + 4min + 5s + 6us;
    CHECK(formatIso8601(instant) == "2024-01-02T03:04:05.000006+00:00");
}

TEST_CASE("parseIso8601 accepts the formats found in stored payloads", "[time]")
{
    auto const expected = Timestamp { sys_days { 2024y / January / 1 } + 10h };

    CHECK(parseIso8601("2024-01-01T10:00:00+00:00") == expected);
    CHECK(parseIso8601("2024-01-01T10:00:00Z") == expected);
    CHECK(parseIso8601("2024-01-01T10:00:00") == expected);
    CHECK(parseIso8601("2024-01-01T10:00:00.000000+00:00") == expected);
    CHECK(parseIso8601("2024-01-01T12:00:00+02:00") == expected);
    CHECK(parseIso8601("2024-01-01T05:30:00-04:30") == expected);
}

TEST_CASE("parseIso8601 keeps fractional seconds", "[time]")
{
    auto parsed = parseIso8601("2024-01-01T10:00:00.25Z");
    REQUIRE(parsed.has_value());
    CHECK(parsed->time_since_epoch() % seconds { 1 } == microseconds { 250000 });
}

TEST_CASE("parseIso8601 reads back what formatIso8601 wrote", "[time]")
{
    auto const now = nowUtc();
    CHECK(parseIso8601(formatIso8601(now)) == now);
}

TEST_CASE("parseIso8601 rejects malformed timestamps", "[time]")
{
    CHECK(!parseIso8601("").has_value());
    CHECK(!parseIso8601("yesterday").has_value());
    CHECK(!parseIso8601("2024-13-01T00:00:00Z").has_value());
    CHECK(!parseIso8601("2024-01-01T10:00:00+0000").has_value());
    CHECK(!parseIso8601("2024-01-01T10:00:00.Z").has_value());

    auto const parsed = parseIso8601("2024-01-01");
    REQUIRE(!parsed.has_value());
    CHECK(parsed.error().code == ErrorCode::ProtocolError);
}
