// SPDX-License-Identifier: Apache-2.0
#include "RedisConnection.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace callscribe
{

namespace
{

    auto storeError(std::string message) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::StoreError, std::move(message));
    }

    auto setNonBlocking(int fd, bool enabled) -> bool
    {
        auto const flags = fcntl(fd, F_GETFL, 0);
        if (flags < 0)
            return false;
        auto const newFlags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
        return fcntl(fd, F_SETFL, newFlags) == 0;
    }

    /// @brief Connects @p fd to @p address, giving up after @p timeout.
    auto connectWithTimeout(int fd, addrinfo const& address, std::chrono::milliseconds timeout) -> bool
    {
        if (!setNonBlocking(fd, true))
            return false;

        if (::connect(fd, address.ai_addr, address.ai_addrlen) != 0)
        {
            if (errno != EINPROGRESS)
                return false;

            auto pfd = pollfd { .fd = fd, .events = POLLOUT, .revents = 0 };
            if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0)
                return false;

            auto socketError = 0;
            auto length = socklen_t { sizeof(socketError) };
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &socketError, &length) != 0 || socketError != 0)
                return false;
        }

        return setNonBlocking(fd, false);
    }

} // namespace

struct RedisConnection::Impl
{
    int fd = -1;
    std::string readBuffer;
};

RedisConnection::RedisConnection(RedisEndpoint endpoint):
    _endpoint(std::move(endpoint)), _impl(std::make_unique<Impl>())
{
}

RedisConnection::~RedisConnection()
{
    close();
}

auto RedisConnection::connect() -> VoidResult
{
    if (_impl->fd >= 0)
        return {};

    auto hints = addrinfo {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* addresses = nullptr;
    auto const port = std::to_string(_endpoint.port);
    if (auto const rc = getaddrinfo(_endpoint.host.c_str(), port.c_str(), &hints, &addresses); rc != 0)
        return storeError(std::format("Cannot resolve Redis host {}: {}", _endpoint.host, gai_strerror(rc)));

    for (auto const* address = addresses; address != nullptr; address = address->ai_next)
    {
        auto const fd = ::socket(address->ai_family, address->ai_socktype, address->ai_protocol);
        if (fd < 0)
            continue;

        if (connectWithTimeout(fd, *address, _endpoint.connectTimeout))
        {
            auto noDelay = 1;
            setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay));
            _impl->fd = fd;
            break;
        }
        ::close(fd);
    }
    freeaddrinfo(addresses);

    if (_impl->fd < 0)
        return storeError(std::format("Cannot connect to Redis at {}:{}", _endpoint.host, _endpoint.port));

    _impl->readBuffer.clear();
    log::debug("Connected to Redis at {}:{}", _endpoint.host, _endpoint.port);
    return {};
}

auto RedisConnection::sendAll(std::string_view data) -> VoidResult
{
    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::send(_impl->fd, data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            return storeError(std::format("Failed to write to Redis: {}", std::strerror(errno)));
        }
        offset += static_cast<size_t>(written);
    }
    return {};
}

auto RedisConnection::readReply(std::chrono::milliseconds timeout) -> Result<resp::Reply>
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        auto consumed = size_t { 0 };
        auto decoded = resp::decodeReply(_impl->readBuffer, consumed);
        if (!decoded)
            return storeError(decoded.error().message);
        if (decoded->has_value())
        {
            _impl->readBuffer.erase(0, consumed);
            return std::move(**decoded);
        }

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return makeError(ErrorCode::TimeoutError, "Timed out waiting for Redis reply");

        auto pfd = pollfd { .fd = _impl->fd, .events = POLLIN, .revents = 0 };
        auto const ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
                continue;
            return storeError(std::format("Failed to poll Redis socket: {}", std::strerror(errno)));
        }
        if (ready == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::recv(_impl->fd, buf.data(), buf.size(), 0);
        if (bytesRead == 0)
            return storeError("Redis closed the connection");
        if (bytesRead < 0)
        {
            if (errno == EINTR)
                continue;
            return storeError(std::format("Failed to read from Redis: {}", std::strerror(errno)));
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

auto RedisConnection::command(std::vector<std::string> const& args, std::chrono::milliseconds extraWait)
    -> Result<resp::Reply>
{
    auto const wasConnected = isConnected();
    if (auto connected = connect(); !connected)
        return std::unexpected(connected.error());

    auto const request = resp::encodeCommand(args);
    auto sent = sendAll(request);
    if (!sent && wasConnected)
    {
        // The server may have dropped an idle connection; nothing was executed yet.
        log::debug("Redis write failed on a reused connection, reconnecting");
        close();
        if (auto reconnected = connect(); !reconnected)
            return std::unexpected(reconnected.error());
        sent = sendAll(request);
    }
    if (!sent)
    {
        close();
        return std::unexpected(sent.error());
    }

    auto reply = readReply(_endpoint.ioTimeout + extraWait);
    if (!reply)
        close();
    return reply;
}

void RedisConnection::close()
{
    if (_impl->fd < 0)
        return;
    ::close(_impl->fd);
    _impl->fd = -1;
    _impl->readBuffer.clear();
}

auto RedisConnection::isConnected() const -> bool
{
    return _impl->fd >= 0;
}

} // namespace callscribe
