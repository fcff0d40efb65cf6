// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <queue/QueueStore.hpp>
#include <queue/RedisConnection.hpp>

#include <memory>
#include <mutex>
#include <vector>

namespace callscribe
{

/// @brief QueueStore backed by a Redis server.
///
/// Lists and sets map onto Redis lists and sets. The composite operations run as Lua
/// scripts via EVAL, which Redis executes atomically.
///
/// Thread-safe: each call borrows a connection from an internal pool, so a blocking pop
/// in one thread does not stall commands issued by another.
class RedisQueueStore final: public QueueStore
{
  public:
    explicit RedisQueueStore(RedisEndpoint endpoint);
    ~RedisQueueStore() override;

    /// @brief Opens one connection and checks the server answers PING.
    [[nodiscard]] auto ping() -> VoidResult;

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
    /// @brief Runs one command on a pooled connection and rejects RESP error replies.
    auto execute(std::vector<std::string> const& args,
                 std::chrono::milliseconds extraWait = std::chrono::milliseconds { 0 }) -> Result<resp::Reply>;
    auto executeInteger(std::vector<std::string> const& args) -> Result<std::int64_t>;

    auto acquire() -> std::unique_ptr<RedisConnection>;
    void release(std::unique_ptr<RedisConnection> connection);

    RedisEndpoint _endpoint;
    std::mutex _poolMutex;
    std::vector<std::unique_ptr<RedisConnection>> _idle;
};

} // namespace callscribe
