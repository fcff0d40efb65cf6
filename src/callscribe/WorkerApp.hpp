// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <callscribe/Config.hpp>
#include <core/Error.hpp>

#include <atomic>
#include <memory>

namespace callscribe
{

/// @brief Wires store, queue, providers, metrics and the worker pool together.
class WorkerApp
{
  public:
    explicit WorkerApp(AppConfig config);
    ~WorkerApp();

    WorkerApp(const WorkerApp&) = delete;
    WorkerApp& operator=(const WorkerApp&) = delete;

    /// @brief Connects to the store, sets up the STT engines and the metrics endpoint.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the worker pool until @p stopFlag becomes non-zero.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(std::atomic<int> const& stopFlag) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace callscribe
