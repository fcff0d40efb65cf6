// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <queue/QueueStore.hpp>

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>

namespace callscribe
{

/// @brief In-process QueueStore shared by all threads holding a reference to it.
///
/// A single mutex serializes every operation. Blocking pops wait on a condition variable
/// signalled by pushes.
class MemoryQueueStore final: public QueueStore
{
  public:
    [[nodiscard]] auto pushBack(std::string_view list, std::string_view value) -> Result<std::int64_t> override;
    [[nodiscard]] auto popFront(std::string_view list) -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto blockingPopFront(std::string_view list, std::chrono::milliseconds timeout)
        -> Result<std::optional<std::string>> override;
    [[nodiscard]] auto range(std::string_view list, std::int64_t start, std::int64_t stop)
        -> Result<std::vector<std::string>> override;
    [[nodiscard]] auto removeValue(std::string_view list, std::int64_t count, std::string_view value)
        -> Result<std::int64_t> override;
    [[nodiscard]] auto length(std::string_view list) -> Result<std::int64_t> override;
    [[nodiscard]] auto addMember(std::string_view set, std::string_view member) -> Result<bool> override;
    [[nodiscard]] auto removeMember(std::string_view set, std::string_view member) -> Result<bool> override;
    [[nodiscard]] auto isMember(std::string_view set, std::string_view member) -> Result<bool> override;
    [[nodiscard]] auto memberCount(std::string_view set) -> Result<std::int64_t> override;
    [[nodiscard]] auto pushUnlessMember(std::string_view list,
                                        std::string_view set,
                                        std::string_view member,
                                        std::string_view value) -> Result<bool> override;
    [[nodiscard]] auto replayListValue(std::string_view sourceList,
                                       std::string_view value,
                                       std::string_view set,
                                       std::string_view member,
                                       std::string_view targetList,
                                       std::string_view replayValue) -> Result<bool> override;

  private:
    using List = std::deque<std::string>;
    using Set = std::set<std::string, std::less<>>;

    auto listOf(std::string_view name) -> List&;
    auto setOf(std::string_view name) -> Set&;
    auto removeLocked(std::string_view list, std::int64_t count, std::string_view value) -> std::int64_t;

    std::mutex _mutex;
    std::condition_variable _pushed;
    std::map<std::string, List, std::less<>> _lists;
    std::map<std::string, Set, std::less<>> _sets;
};

} // namespace callscribe
