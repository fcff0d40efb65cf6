// SPDX-License-Identifier: Apache-2.0
#include "RedisQueueStore.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace callscribe
{

namespace
{

    // KEYS[1] = list, KEYS[2] = set, ARGV[1] = member, ARGV[2] = value
    constexpr auto PushUnlessMemberScript = std::string_view {
        "if redis.call('SISMEMBER', KEYS[2], ARGV[1]) == 1 then return 0 end\n"
        "redis.call('RPUSH', KEYS[1], ARGV[2])\n"
        "return 1\n"
    };

    // KEYS[1] = source list, KEYS[2] = set, KEYS[3] = target list
    // ARGV[1] = value, ARGV[2] = member, ARGV[3] = replay value
    constexpr auto ReplayListValueScript = std::string_view {
        "if redis.call('LREM', KEYS[1], 1, ARGV[1]) == 0 then return 0 end\n"
        "redis.call('SREM', KEYS[2], ARGV[2])\n"
        "redis.call('RPUSH', KEYS[3], ARGV[3])\n"
        "return 1\n"
    };

    auto unexpectedReply(std::string_view command, resp::Reply const& reply) -> std::unexpected<Error>
    {
        return makeError(ErrorCode::StoreError,
                         std::format("Unexpected reply to {}: {}", command, resp::describe(reply)));
    }

    auto optionalText(std::string_view command, resp::Reply const& reply) -> Result<std::optional<std::string>>
    {
        if (reply.isNil())
            return std::optional<std::string> {};
        if (reply.type != resp::ReplyType::BulkString)
            return unexpectedReply(command, reply);
        return std::optional<std::string> { reply.text };
    }

} // namespace

RedisQueueStore::RedisQueueStore(RedisEndpoint endpoint): _endpoint(std::move(endpoint))
{
}

RedisQueueStore::~RedisQueueStore() = default;

auto RedisQueueStore::acquire() -> std::unique_ptr<RedisConnection>
{
    {
        auto const lock = std::lock_guard { _poolMutex };
        if (!_idle.empty())
        {
            auto connection = std::move(_idle.back());
            _idle.pop_back();
            return connection;
        }
    }
    return std::make_unique<RedisConnection>(_endpoint);
}

void RedisQueueStore::release(std::unique_ptr<RedisConnection> connection)
{
    if (!connection->isConnected())
        return;
    auto const lock = std::lock_guard { _poolMutex };
    _idle.push_back(std::move(connection));
}

auto RedisQueueStore::execute(std::vector<std::string> const& args, std::chrono::milliseconds extraWait)
    -> Result<resp::Reply>
{
    auto connection = acquire();
    auto reply = connection->command(args, extraWait);
    release(std::move(connection));

    if (!reply)
    {
        log::warning("Redis command {} failed: {}", args.front(), reply.error().message);
        return reply;
    }
    if (reply->isError())
        return makeError(ErrorCode::StoreError, std::format("Redis {} failed: {}", args.front(), reply->text));
    return reply;
}

auto RedisQueueStore::executeInteger(std::vector<std::string> const& args) -> Result<std::int64_t>
{
    auto reply = execute(args);
    if (!reply)
        return std::unexpected(reply.error());
    if (reply->type != resp::ReplyType::Integer)
        return unexpectedReply(args.front(), *reply);
    return reply->integer;
}

auto RedisQueueStore::ping() -> VoidResult
{
    auto reply = execute({ "PING" });
    if (!reply)
        return std::unexpected(reply.error());
    if (reply->type != resp::ReplyType::SimpleString || reply->text != "PONG")
        return unexpectedReply("PING", *reply);
    return {};
}

auto RedisQueueStore::pushBack(std::string_view list, std::string_view value) -> Result<std::int64_t>
{
    return executeInteger({ "RPUSH", std::string(list), std::string(value) });
}

auto RedisQueueStore::popFront(std::string_view list) -> Result<std::optional<std::string>>
{
    return execute({ "LPOP", std::string(list) }).and_then([](resp::Reply const& reply) {
        return optionalText("LPOP", reply);
    });
}

auto RedisQueueStore::blockingPopFront(std::string_view list, std::chrono::milliseconds timeout)
    -> Result<std::optional<std::string>>
{
    // BLPOP takes whole seconds on older servers, and 0 would block forever.
    auto const seconds = std::max<std::int64_t>(1, (timeout.count() + 999) / 1000);
    auto reply = execute({ "BLPOP", std::string(list), std::to_string(seconds) }, std::chrono::seconds { seconds });
    if (!reply)
        return std::unexpected(reply.error());
    if (reply->isNil())
        return std::optional<std::string> {};
    if (reply->type != resp::ReplyType::Array || reply->elements.size() != 2)
        return unexpectedReply("BLPOP", *reply);
    return optionalText("BLPOP", reply->elements[1]);
}

auto RedisQueueStore::range(std::string_view list, std::int64_t start, std::int64_t stop)
    -> Result<std::vector<std::string>>
{
    auto reply = execute({ "LRANGE", std::string(list), std::to_string(start), std::to_string(stop) });
    if (!reply)
        return std::unexpected(reply.error());
    if (reply->type != resp::ReplyType::Array)
        return unexpectedReply("LRANGE", *reply);

    auto values = std::vector<std::string> {};
    values.reserve(reply->elements.size());
    for (auto& element: reply->elements)
    {
        if (element.type != resp::ReplyType::BulkString)
            return unexpectedReply("LRANGE", element);
        values.push_back(std::move(element.text));
    }
    return values;
}

auto RedisQueueStore::removeValue(std::string_view list, std::int64_t count, std::string_view value)
    -> Result<std::int64_t>
{
    return executeInteger({ "LREM", std::string(list), std::to_string(count), std::string(value) });
}

auto RedisQueueStore::length(std::string_view list) -> Result<std::int64_t>
{
    return executeInteger({ "LLEN", std::string(list) });
}

auto RedisQueueStore::addMember(std::string_view set, std::string_view member) -> Result<bool>
{
    return executeInteger({ "SADD", std::string(set), std::string(member) }).transform([](std::int64_t n) {
        return n > 0;
    });
}

auto RedisQueueStore::removeMember(std::string_view set, std::string_view member) -> Result<bool>
{
    return executeInteger({ "SREM", std::string(set), std::string(member) }).transform([](std::int64_t n) {
        return n > 0;
    });
}

auto RedisQueueStore::isMember(std::string_view set, std::string_view member) -> Result<bool>
{
    return executeInteger({ "SISMEMBER", std::string(set), std::string(member) }).transform([](std::int64_t n) {
        return n == 1;
    });
}

auto RedisQueueStore::memberCount(std::string_view set) -> Result<std::int64_t>
{
    return executeInteger({ "SCARD", std::string(set) });
}

auto RedisQueueStore::pushUnlessMember(std::string_view list,
                                       std::string_view set,
                                       std::string_view member,
                                       std::string_view value) -> Result<bool>
{
    return executeInteger({ "EVAL",
                            std::string(PushUnlessMemberScript),
                            "2",
                            std::string(list),
                            std::string(set),
                            std::string(member),
                            std::string(value) })
        .transform([](std::int64_t n) { return n == 1; });
}

auto RedisQueueStore::replayListValue(std::string_view sourceList,
                                      std::string_view value,
                                      std::string_view set,
                                      std::string_view member,
                                      std::string_view targetList,
                                      std::string_view replayValue) -> Result<bool>
{
    return executeInteger({ "EVAL",
                            std::string(ReplayListValueScript),
                            "3",
                            std::string(sourceList),
                            std::string(set),
                            std::string(targetList),
                            std::string(value),
                            std::string(member),
                            std::string(replayValue) })
        .transform([](std::int64_t n) { return n == 1; });
}

} // namespace callscribe
