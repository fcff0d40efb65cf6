// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Metrics.hpp>

#include <string_view>

namespace callscribe
{

/// @brief Outcome labels of stt_jobs_total.
namespace JobStatusLabel
{
    constexpr auto Success = std::string_view { "success" };
    constexpr auto Retry = std::string_view { "retry" };
    constexpr auto Dlq = std::string_view { "dlq" };
    constexpr auto MissingRecord = std::string_view { "missing_record" };
    constexpr auto Interrupted = std::string_view { "interrupted" };
} // namespace JobStatusLabel

/// @brief The metrics a worker reports. All workers of a process share one set.
struct WorkerMetrics
{
    metrics::Counter& jobs;
    metrics::Histogram& duration;

    /// @brief Registers stt_jobs_total and stt_job_duration_seconds with @p registry.
    [[nodiscard]] static auto registerWith(metrics::Registry& registry) -> WorkerMetrics;
};

} // namespace callscribe
