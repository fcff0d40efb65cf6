// SPDX-License-Identifier: Apache-2.0
#include "MemoryQueueStore.hpp"

#include <algorithm>

namespace callscribe
{

auto MemoryQueueStore::listOf(std::string_view name) -> List&
{
    auto it = _lists.find(name);
    if (it == _lists.end())
        it = _lists.emplace(std::string(name), List {}).first;
    return it->second;
}

auto MemoryQueueStore::setOf(std::string_view name) -> Set&
{
    auto it = _sets.find(name);
    if (it == _sets.end())
        it = _sets.emplace(std::string(name), Set {}).first;
    return it->second;
}

auto MemoryQueueStore::removeLocked(std::string_view list, std::int64_t count, std::string_view value)
    -> std::int64_t
{
    auto& items = listOf(list);
    auto removed = std::int64_t { 0 };
    auto const limit = count == 0 ? static_cast<std::int64_t>(items.size()) : (count < 0 ? -count : count);

    if (count >= 0)
    {
        for (auto it = items.begin(); it != items.end() && removed < limit;)
        {
            if (*it == value)
            {
                it = items.erase(it);
                ++removed;
            }
            else
                ++it;
        }
    }
    else
    {
        for (auto i = static_cast<std::int64_t>(items.size()) - 1; i >= 0 && removed < limit; --i)
        {
            if (items[static_cast<size_t>(i)] == value)
            {
                items.erase(items.begin() + i);
                ++removed;
            }
        }
    }
    return removed;
}

auto MemoryQueueStore::pushBack(std::string_view list, std::string_view value) -> Result<std::int64_t>
{
    auto length = std::int64_t { 0 };
    {
        auto const lock = std::lock_guard { _mutex };
        auto& items = listOf(list);
        items.emplace_back(value);
        length = static_cast<std::int64_t>(items.size());
    }
    _pushed.notify_all();
    return length;
}

auto MemoryQueueStore::popFront(std::string_view list) -> Result<std::optional<std::string>>
{
    auto const lock = std::lock_guard { _mutex };
    auto& items = listOf(list);
    if (items.empty())
        return std::optional<std::string> {};
    auto value = std::move(items.front());
    items.pop_front();
    return std::optional<std::string> { std::move(value) };
}

auto MemoryQueueStore::blockingPopFront(std::string_view list, std::chrono::milliseconds timeout)
    -> Result<std::optional<std::string>>
{
    auto lock = std::unique_lock { _mutex };
    auto& items = listOf(list);
    if (!_pushed.wait_for(lock, timeout, [&items] { return !items.empty(); }))
        return std::optional<std::string> {};
    auto value = std::move(items.front());
    items.pop_front();
    return std::optional<std::string> { std::move(value) };
}

auto MemoryQueueStore::range(std::string_view list, std::int64_t start, std::int64_t stop)
    -> Result<std::vector<std::string>>
{
    auto const lock = std::lock_guard { _mutex };
    auto const& items = listOf(list);
    auto const size = static_cast<std::int64_t>(items.size());

    if (start < 0)
        start = std::max<std::int64_t>(size + start, 0);
    if (stop < 0)
        stop = size + stop;
    stop = std::min(stop, size - 1);

    auto result = std::vector<std::string> {};
    for (auto i = start; i <= stop; ++i)
        result.push_back(items[static_cast<size_t>(i)]);
    return result;
}

auto MemoryQueueStore::removeValue(std::string_view list, std::int64_t count, std::string_view value)
    -> Result<std::int64_t>
{
    auto const lock = std::lock_guard { _mutex };
    return removeLocked(list, count, value);
}

auto MemoryQueueStore::length(std::string_view list) -> Result<std::int64_t>
{
    auto const lock = std::lock_guard { _mutex };
    return static_cast<std::int64_t>(listOf(list).size());
}

auto MemoryQueueStore::addMember(std::string_view set, std::string_view member) -> Result<bool>
{
    auto const lock = std::lock_guard { _mutex };
    return setOf(set).emplace(member).second;
}

auto MemoryQueueStore::removeMember(std::string_view set, std::string_view member) -> Result<bool>
{
    auto const lock = std::lock_guard { _mutex };
    auto& members = setOf(set);
    auto const it = members.find(member);
    if (it == members.end())
        return false;
    members.erase(it);
    return true;
}

auto MemoryQueueStore::isMember(std::string_view set, std::string_view member) -> Result<bool>
{
    auto const lock = std::lock_guard { _mutex };
    return setOf(set).contains(member);
}

auto MemoryQueueStore::memberCount(std::string_view set) -> Result<std::int64_t>
{
    auto const lock = std::lock_guard { _mutex };
    return static_cast<std::int64_t>(setOf(set).size());
}

auto MemoryQueueStore::pushUnlessMember(std::string_view list,
                                        std::string_view set,
                                        std::string_view member,
                                        std::string_view value) -> Result<bool>
{
    {
        auto const lock = std::lock_guard { _mutex };
        if (setOf(set).contains(member))
            return false;
        listOf(list).emplace_back(value);
    }
    _pushed.notify_all();
    return true;
}

auto MemoryQueueStore::replayListValue(std::string_view sourceList,
                                       std::string_view value,
                                       std::string_view set,
                                       std::string_view member,
                                       std::string_view targetList,
                                       std::string_view replayValue) -> Result<bool>
{
    {
        auto const lock = std::lock_guard { _mutex };
        if (removeLocked(sourceList, 1, value) == 0)
            return false;
        auto& members = setOf(set);
        if (auto const it = members.find(member); it != members.end())
            members.erase(it);
        listOf(targetList).emplace_back(replayValue);
    }
    _pushed.notify_all();
    return true;
}

} // namespace callscribe
