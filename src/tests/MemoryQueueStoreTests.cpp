// SPDX-License-Identifier: Apache-2.0
#include <queue/MemoryQueueStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include <thread>

using namespace callscribe;
using namespace std::chrono_literals;

TEST_CASE("MemoryQueueStore lists are FIFO", "[store]")
{
    auto store = MemoryQueueStore {};

    CHECK(store.pushBack("l", "a") == 1);
    CHECK(store.pushBack("l", "b") == 2);
    CHECK(store.length("l") == 2);

    CHECK(store.popFront("l") == std::optional<std::string> { "a" });
    CHECK(store.popFront("l") == std::optional<std::string> { "b" });
    CHECK(store.popFront("l") == std::optional<std::string> {});
    CHECK(store.length("missing") == 0);
}

TEST_CASE("MemoryQueueStore range follows Redis index rules", "[store]")
{
    auto store = MemoryQueueStore {};
    for (auto const* value: { "a", "b", "c", "d" })
        REQUIRE(store.pushBack("l", value).has_value());

    CHECK(store.range("l", 0, -1) == std::vector<std::string> { "a", "b", "c", "d" });
    CHECK(store.range("l", 1, 2) == std::vector<std::string> { "b", "c" });
    CHECK(store.range("l", -2, -1) == std::vector<std::string> { "c", "d" });
    CHECK(store.range("l", 2, 100) == std::vector<std::string> { "c", "d" });
    CHECK(store.range("l", 5, 10)->empty());
    CHECK(store.range("empty", 0, -1)->empty());
}

TEST_CASE("MemoryQueueStore removeValue follows LREM count semantics", "[store]")
{
    auto store = MemoryQueueStore {};
    auto const fill = [&store] {
        for (auto const* value: { "x", "a", "x", "b", "x" })
            REQUIRE(store.pushBack("l", value).has_value());
    };

    SECTION("positive count removes from the head")
    {
        fill();
        CHECK(store.removeValue("l", 2, "x") == 2);
        CHECK(store.range("l", 0, -1) == std::vector<std::string> { "a", "b", "x" });
    }

    SECTION("negative count removes from the tail")
    {
        fill();
        CHECK(store.removeValue("l", -1, "x") == 1);
        CHECK(store.range("l", 0, -1) == std::vector<std::string> { "x", "a", "x", "b" });
    }

    SECTION("zero removes all")
    {
        fill();
        CHECK(store.removeValue("l", 0, "x") == 3);
        CHECK(store.range("l", 0, -1) == std::vector<std::string> { "a", "b" });
    }
}

TEST_CASE("MemoryQueueStore sets track membership", "[store]")
{
    auto store = MemoryQueueStore {};

    CHECK(store.addMember("s", "k") == true);
    CHECK(store.addMember("s", "k") == false);
    CHECK(store.isMember("s", "k") == true);
    CHECK(store.memberCount("s") == 1);
    CHECK(store.removeMember("s", "k") == true);
    CHECK(store.removeMember("s", "k") == false);
    CHECK(store.isMember("s", "k") == false);
}

TEST_CASE("pushUnlessMember skips members", "[store]")
{
    auto store = MemoryQueueStore {};

    CHECK(store.pushUnlessMember("l", "s", "k", "v1") == true);
    REQUIRE(store.addMember("s", "k").has_value());
    CHECK(store.pushUnlessMember("l", "s", "k", "v2") == false);
    CHECK(store.range("l", 0, -1) == std::vector<std::string> { "v1" });
}

TEST_CASE("replayListValue moves one value and clears the member", "[store]")
{
    auto store = MemoryQueueStore {};
    REQUIRE(store.pushBack("dlq", "entry").has_value());
    REQUIRE(store.pushBack("dlq", "entry").has_value());
    REQUIRE(store.addMember("s", "k").has_value());

    CHECK(store.replayListValue("dlq", "entry", "s", "k", "jobs", "job") == true);
    CHECK(store.length("dlq") == 1);
    CHECK(store.isMember("s", "k") == false);
    CHECK(store.range("jobs", 0, -1) == std::vector<std::string> { "job" });

    SECTION("nothing happens when the value is gone")
    {
        REQUIRE(store.removeValue("dlq", 0, "entry").has_value());
        REQUIRE(store.addMember("s", "k").has_value());

        CHECK(store.replayListValue("dlq", "entry", "s", "k", "jobs", "job") == false);
        CHECK(store.isMember("s", "k") == true);
        CHECK(store.length("jobs") == 1);
    }
}

TEST_CASE("blockingPopFront times out on an empty list", "[store]")
{
    auto store = MemoryQueueStore {};
    auto const start = std::chrono::steady_clock::now();
    CHECK(store.blockingPopFront("l", 50ms) == std::optional<std::string> {});
    CHECK(std::chrono::steady_clock::now() - start >= 40ms);
}

TEST_CASE("blockingPopFront wakes up on a push from another thread", "[store]")
{
    auto store = MemoryQueueStore {};
    auto producer = std::thread([&store] {
        std::this_thread::sleep_for(20ms);
        (void) store.pushBack("l", "late");
    });

    auto const value = store.blockingPopFront("l", 5s);
    producer.join();

    REQUIRE(value.has_value());
    CHECK(*value == std::optional<std::string> { "late" });
}
