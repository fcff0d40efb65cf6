// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Metrics.hpp>

#include <memory>
#include <string>

namespace callscribe
{

/// @brief Serves GET /metrics in the Prometheus text format on a background thread.
class MetricsExporter
{
  public:
    explicit MetricsExporter(metrics::Registry const& registry);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// @brief Binds @p host:@p port and starts serving. Port 0 picks a free port.
    [[nodiscard]] auto start(std::string const& host, int port) -> VoidResult;

    void stop();

    /// @brief Returns the bound port, or 0 when not running.
    [[nodiscard]] auto port() const noexcept -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace callscribe
