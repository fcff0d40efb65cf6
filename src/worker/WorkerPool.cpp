// SPDX-License-Identifier: Apache-2.0
#include "WorkerPool.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace callscribe
{

WorkerPool::WorkerPool(int threads, WorkerFactory factory, std::chrono::milliseconds dequeueTimeout):
    _threadCount(std::max(1, threads)), _factory(std::move(factory)), _dequeueTimeout(dequeueTimeout)
{
}

WorkerPool::~WorkerPool()
{
    stop();
}

auto WorkerPool::start() -> bool
{
    if (isRunning())
    {
        log::warning("Worker pool already running");
        return false;
    }

    _workers.clear();
    for (auto i = 0; i < _threadCount; ++i)
    {
        auto worker = _factory ? _factory() : nullptr;
        if (!worker)
        {
            log::error("Failed to create worker {}", i + 1);
            _workers.clear();
            return false;
        }
        _workers.push_back(std::move(worker));
    }

    _threads.reserve(_workers.size());
    for (auto i = size_t { 0 }; i < _workers.size(); ++i)
    {
        _threads.emplace_back([this, i] {
            log::setThreadName(std::format("worker-{}", i + 1));
            _workers[i]->runForever(_dequeueTimeout);
        });
    }

    log::info("Worker pool started with {} thread(s)", _threadCount);
    return true;
}

void WorkerPool::stop()
{
    if (!isRunning())
        return;

    log::debug("Stopping worker pool...");

    for (auto& worker: _workers)
        worker->requestStop();

    for (auto& thread: _threads)
        if (thread.joinable())
            thread.join();

    _threads.clear();
    _workers.clear();

    log::info("Worker pool stopped");
}

} // namespace callscribe
