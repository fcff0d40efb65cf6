// SPDX-License-Identifier: Apache-2.0
#include "WorkerApp.hpp"

#include <callscribe/Services.hpp>
#include <core/Log.hpp>
#include <core/Metrics.hpp>

#include <queue/JobQueue.hpp>
#include <stt/CallSummarizer.hpp>
#include <stt/HttpClient.hpp>
#include <stt/ProviderRouter.hpp>
#include <worker/MetricsExporter.hpp>
#include <worker/Worker.hpp>
#include <worker/WorkerMetrics.hpp>
#include <worker/WorkerPool.hpp>

#include <chrono>
#include <thread>

namespace callscribe
{

struct WorkerApp::Impl
{
    AppConfig config;

    std::unique_ptr<QueueStore> store;
    std::unique_ptr<JobQueue> queue;
    CallRecordRepositoryFactory records;
    std::unique_ptr<ProviderRouter> router;
    std::unique_ptr<CallSummarizer> summarizer;

    metrics::Registry registry;
    std::unique_ptr<MetricsExporter> exporter;
    std::unique_ptr<WorkerPool> pool;
};

WorkerApp::WorkerApp(AppConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

WorkerApp::~WorkerApp()
{
    if (_impl->pool)
        _impl->pool->stop();
    if (_impl->exporter)
        _impl->exporter->stop();
}

auto WorkerApp::initialize() -> VoidResult
{
    auto const& config = _impl->config;

    auto store = makeQueueStore(config.store);
    if (!store)
        return std::unexpected(store.error());
    _impl->store = std::move(*store);
    _impl->queue = std::make_unique<JobQueue>(*_impl->store, QueueKeys::withPrefix(config.store.keyPrefix));
    _impl->records = makeRecordRepositoryFactory(config.records);

    auto http = std::make_shared<HttplibClient>(std::chrono::seconds { config.stt.requestTimeoutSeconds });
    _impl->router = makeProviderRouter(config.stt, std::move(http));

    if (config.stt.summary.enabled)
    {
        _impl->summarizer = std::make_unique<CallSummarizer>(config.stt.summary.directory);
        log::info("Call summaries enabled, writing to {}", config.stt.summary.directory);
    }

    auto const workerMetrics = WorkerMetrics::registerWith(_impl->registry);

    if (config.metrics.enabled)
    {
        _impl->exporter = std::make_unique<MetricsExporter>(_impl->registry);
        if (auto started = _impl->exporter->start(config.metrics.host, config.metrics.port); !started)
            return std::unexpected(started.error());
    }

    auto const timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double> { config.worker.dequeueTimeoutSeconds });

    _impl->pool = std::make_unique<WorkerPool>(
        config.worker.threads,
        [this, workerMetrics]() {
            return std::make_unique<Worker>(*_impl->queue,
                                            *_impl->router,
                                            _impl->records,
                                            workerMetrics,
                                            _impl->config.worker,
                                            Sleeper {},
                                            _impl->summarizer.get());
        },
        timeout);

    return {};
}

auto WorkerApp::run(std::atomic<int> const& stopFlag) -> int
{
    if (!_impl->pool || !_impl->pool->start())
    {
        log::error("Failed to start worker pool");
        return 1;
    }

    while (stopFlag.load() == 0)
        std::this_thread::sleep_for(std::chrono::milliseconds { 200 });

    log::info("Shutdown requested, waiting for running jobs to finish");
    _impl->pool->stop();
    if (_impl->exporter)
        _impl->exporter->stop();
    return 0;
}

} // namespace callscribe
