// SPDX-License-Identifier: Apache-2.0
#include "MetricsExporter.hpp"

#include <core/Log.hpp>

#include <httplib.h>

#include <format>
#include <thread>

namespace callscribe
{

struct MetricsExporter::Impl
{
    metrics::Registry const& registry;
    httplib::Server server;
    std::thread thread;
    int port = 0;

    explicit Impl(metrics::Registry const& r): registry(r) {}
};

MetricsExporter::MetricsExporter(metrics::Registry const& registry): _impl(std::make_unique<Impl>(registry))
{
    _impl->server.Get("/metrics", [this](httplib::Request const& /*req*/, httplib::Response& res) {
        res.set_content(_impl->registry.renderText(), "text/plain; version=0.0.4; charset=utf-8");
    });
}

MetricsExporter::~MetricsExporter()
{
    stop();
}

auto MetricsExporter::start(std::string const& host, int port) -> VoidResult
{
    if (_impl->thread.joinable())
        return makeError(ErrorCode::InvalidArgument, "Metrics endpoint already running");

    auto bound = port == 0 ? _impl->server.bind_to_any_port(host) : (_impl->server.bind_to_port(host, port) ? port : -1);
    if (bound < 0)
        return makeError(ErrorCode::IoError, std::format("Cannot bind metrics endpoint to {}:{}", host, port));

    _impl->port = bound;
    _impl->thread = std::thread([this] {
        log::setThreadName("metrics");
        if (!_impl->server.listen_after_bind())
            log::error("Metrics endpoint stopped unexpectedly");
    });

    log::info("Serving metrics on http://{}:{}/metrics", host, bound);
    return {};
}

void MetricsExporter::stop()
{
    if (!_impl->thread.joinable())
        return;

    _impl->server.stop();
    _impl->thread.join();
    _impl->port = 0;
}

auto MetricsExporter::port() const noexcept -> int
{
    return _impl->port;
}

} // namespace callscribe
