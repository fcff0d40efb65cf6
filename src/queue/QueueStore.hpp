// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace callscribe
{

/// @brief Shared key/value backend holding lists and sets of strings.
///
/// Every operation is atomic with respect to every other operation on the same store,
/// including concurrent callers in other threads or processes. Implementations report
/// I/O and protocol failures as ErrorCode::StoreError.
class QueueStore
{
  public:
    virtual ~QueueStore() = default;

    /// @brief Appends @p value to the tail of @p list.
    /// @return The list length after the push.
    [[nodiscard]] virtual auto pushBack(std::string_view list, std::string_view value) -> Result<std::int64_t> = 0;

    /// @brief Removes and returns the head of @p list, or nothing if it is empty.
    [[nodiscard]] virtual auto popFront(std::string_view list) -> Result<std::optional<std::string>> = 0;

    /// @brief Like popFront(), but waits up to @p timeout for an element to arrive.
    [[nodiscard]] virtual auto blockingPopFront(std::string_view list, std::chrono::milliseconds timeout)
        -> Result<std::optional<std::string>> = 0;

    /// @brief Returns elements [start, stop] of @p list, both inclusive, negative indices count from the tail.
    [[nodiscard]] virtual auto range(std::string_view list, std::int64_t start, std::int64_t stop)
        -> Result<std::vector<std::string>> = 0;

    /// @brief Removes up to @p count occurrences of @p value from the head side (0 removes all).
    /// @return The number of removed elements.
    [[nodiscard]] virtual auto removeValue(std::string_view list, std::int64_t count, std::string_view value)
        -> Result<std::int64_t> = 0;

    [[nodiscard]] virtual auto length(std::string_view list) -> Result<std::int64_t> = 0;

    /// @return true if @p member was newly added.
    [[nodiscard]] virtual auto addMember(std::string_view set, std::string_view member) -> Result<bool> = 0;

    /// @return true if @p member was present.
    [[nodiscard]] virtual auto removeMember(std::string_view set, std::string_view member) -> Result<bool> = 0;

    [[nodiscard]] virtual auto isMember(std::string_view set, std::string_view member) -> Result<bool> = 0;

    [[nodiscard]] virtual auto memberCount(std::string_view set) -> Result<std::int64_t> = 0;

    /// @brief Appends @p value to @p list unless @p member is in @p set, as one atomic step.
    /// @return true if the value was pushed.
    [[nodiscard]] virtual auto pushUnlessMember(std::string_view list,
                                                std::string_view set,
                                                std::string_view member,
                                                std::string_view value) -> Result<bool> = 0;

    /// @brief Moves one occurrence of @p value out of @p sourceList, removes @p member from @p set
    /// and appends @p replayValue to @p targetList, as one atomic step.
    ///
    /// Nothing changes when @p value is not in @p sourceList.
    /// @return true if the value was found and the replay happened.
    [[nodiscard]] virtual auto replayListValue(std::string_view sourceList,
                                               std::string_view value,
                                               std::string_view set,
                                               std::string_view member,
                                               std::string_view targetList,
                                               std::string_view replayValue) -> Result<bool> = 0;
};

} // namespace callscribe
