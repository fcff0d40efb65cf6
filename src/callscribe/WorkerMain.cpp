// SPDX-License-Identifier: Apache-2.0
#include <callscribe/Config.hpp>
#include <callscribe/Services.hpp>
#include <callscribe/WorkerApp.hpp>
#include <core/Log.hpp>

#include <CLI/CLI.hpp>

#include <atomic>
#include <csignal>

namespace
{

    std::atomic<int> shutdownRequested { 0 };

    void onSignal(int /*signal*/)
    {
        shutdownRequested.store(1);
    }

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "callscribe-worker: transcribes queued call recordings" };

    auto configPath = std::string {};
    auto storeBackend = std::string {};
    auto redisHost = std::string {};
    auto redisPort = 0;
    auto keyPrefix = std::string {};
    auto threads = 0;
    auto engine = std::string {};
    auto metricsPort = -1;
    auto noMetrics = false;
    auto verbose = false;

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--store", storeBackend, "Queue store backend (redis|memory)");
    app.add_option("--redis-host", redisHost, "Redis host");
    app.add_option("--redis-port", redisPort, "Redis port");
    app.add_option("--key-prefix", keyPrefix, "Queue key prefix");
    app.add_option("-t,--threads", threads, "Number of worker threads");
    app.add_option("--default-engine", engine, "STT engine for jobs that name none");
    app.add_option("--metrics-port", metricsPort, "Port of the /metrics endpoint");
    app.add_flag("--no-metrics", noMetrics, "Do not serve /metrics");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        callscribe::log::setLevel(callscribe::log::Level::Debug);

    auto configResult = configPath.empty() ? callscribe::loadConfig() : callscribe::loadConfigFromFile(configPath);
    if (!configResult)
    {
        callscribe::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!storeBackend.empty())
        config.store.backend = storeBackend;
    if (!redisHost.empty())
        config.store.host = redisHost;
    if (redisPort > 0)
        config.store.port = redisPort;
    if (!keyPrefix.empty())
        config.store.keyPrefix = keyPrefix;
    if (threads > 0)
        config.worker.threads = threads;
    if (!engine.empty())
        config.stt.defaultEngine = engine;
    if (metricsPort >= 0)
        config.metrics.port = metricsPort;
    if (noMetrics)
        config.metrics.enabled = false;

    callscribe::applyLogLevel(config, verbose);
    callscribe::log::setThreadName("main");

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    auto application = callscribe::WorkerApp(std::move(config));
    auto initResult = application.initialize();
    if (!initResult)
    {
        callscribe::log::error("Initialization failed: {}", initResult.error());
        return 1;
    }

    return application.run(shutdownRequested);
}
