// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <callscribe/Config.hpp>
#include <core/Error.hpp>

#include <queue/JobQueue.hpp>
#include <queue/QueueStore.hpp>
#include <records/CallRecordRepository.hpp>

#include <memory>

namespace callscribe
{

/// @brief Opens the configured queue store. A Redis store must answer PING.
[[nodiscard]] auto makeQueueStore(StoreConfig const& config) -> Result<std::unique_ptr<QueueStore>>;

/// @brief Returns a factory opening FileCallRecordRepository sessions on the records directory.
[[nodiscard]] auto makeRecordRepositoryFactory(RecordsConfig const& config) -> CallRecordRepositoryFactory;

/// @brief Sets the log level from the config, raised to debug by @p verbose.
void applyLogLevel(AppConfig const& config, bool verbose);

} // namespace callscribe
