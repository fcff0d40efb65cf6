// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <worker/Worker.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace callscribe
{

/// @brief Builds the worker for one pool thread.
using WorkerFactory = std::function<std::unique_ptr<Worker>()>;

/// @brief Runs N workers, each on its own thread named "worker-<n>", against a shared queue.
class WorkerPool
{
  public:
    WorkerPool(int threads, WorkerFactory factory, std::chrono::milliseconds dequeueTimeout);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// @brief Creates the workers and starts their threads.
    /// @return false if the pool is already running or a worker could not be created.
    [[nodiscard]] auto start() -> bool;

    /// @brief Asks every worker to stop and joins the threads. Jobs in flight are finished first.
    void stop();

    [[nodiscard]] auto isRunning() const noexcept -> bool { return !_threads.empty(); }
    [[nodiscard]] auto workerCount() const noexcept -> int { return _threadCount; }

  private:
    int _threadCount;
    WorkerFactory _factory;
    std::chrono::milliseconds _dequeueTimeout;
    std::vector<std::unique_ptr<Worker>> _workers;
    std::vector<std::thread> _threads;
};

} // namespace callscribe
