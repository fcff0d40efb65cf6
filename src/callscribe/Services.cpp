// SPDX-License-Identifier: Apache-2.0
#include "Services.hpp"

#include <core/Log.hpp>

#include <queue/MemoryQueueStore.hpp>
#include <queue/RedisQueueStore.hpp>

namespace callscribe
{

auto makeQueueStore(StoreConfig const& config) -> Result<std::unique_ptr<QueueStore>>
{
    if (config.backend == "memory")
    {
        log::warning("Using the in-process memory queue store; jobs are lost when the process exits");
        return std::make_unique<MemoryQueueStore>();
    }

    auto store = std::make_unique<RedisQueueStore>(RedisEndpoint {
        .host = config.host,
        .port = config.port,
        .connectTimeout = std::chrono::milliseconds { config.connectTimeoutMs },
    });

    if (auto pong = store->ping(); !pong)
        return std::unexpected(pong.error());

    log::info("Connected to Redis at {}:{} (key prefix {})", config.host, config.port, config.keyPrefix);
    return store;
}

auto makeRecordRepositoryFactory(RecordsConfig const& config) -> CallRecordRepositoryFactory
{
    return [directory = std::filesystem::path(config.directory)]() -> std::unique_ptr<CallRecordRepository> {
        return std::make_unique<FileCallRecordRepository>(directory);
    };
}

void applyLogLevel(AppConfig const& config, bool verbose)
{
    if (verbose)
    {
        log::setLevel(log::Level::Debug);
        return;
    }

    if (auto level = log::parseLevel(config.logLevel))
        log::setLevel(*level);
    else
        log::warning("Unknown log level '{}' in config", config.logLevel);
}

} // namespace callscribe
