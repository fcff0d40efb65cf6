// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <queue/Resp.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace callscribe
{

/// @brief Address and timeouts of a Redis server.
struct RedisEndpoint
{
    std::string host = "localhost";
    int port = 6379;
    std::chrono::milliseconds connectTimeout { 2000 };
    std::chrono::milliseconds ioTimeout { 10000 };
};

/// @brief One blocking TCP connection to a Redis server speaking RESP2.
///
/// Not thread-safe. A connection that failed is closed and reopened by the next command.
class RedisConnection
{
  public:
    explicit RedisConnection(RedisEndpoint endpoint);
    ~RedisConnection();

    RedisConnection(RedisConnection const&) = delete;
    RedisConnection& operator=(RedisConnection const&) = delete;

    /// @brief Opens the TCP connection if it is not open yet.
    [[nodiscard]] auto connect() -> VoidResult;

    /// @brief Sends one command and waits for its reply.
    ///
    /// @param args Command name followed by its arguments.
    /// @param extraWait Additional time the server may take to answer (for blocking commands).
    /// @return The reply (which may be a RESP error reply) or a StoreError on I/O failure.
    [[nodiscard]] auto command(std::vector<std::string> const& args,
                               std::chrono::milliseconds extraWait = std::chrono::milliseconds { 0 })
        -> Result<resp::Reply>;

    void close();

    [[nodiscard]] auto isConnected() const -> bool;

    [[nodiscard]] auto endpoint() const noexcept -> RedisEndpoint const& { return _endpoint; }

  private:
    auto sendAll(std::string_view data) -> VoidResult;
    auto readReply(std::chrono::milliseconds timeout) -> Result<resp::Reply>;

    struct Impl;
    RedisEndpoint _endpoint;
    std::unique_ptr<Impl> _impl;
};

} // namespace callscribe
