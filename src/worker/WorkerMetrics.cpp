// SPDX-License-Identifier: Apache-2.0
#include "WorkerMetrics.hpp"

namespace callscribe
{

auto WorkerMetrics::registerWith(metrics::Registry& registry) -> WorkerMetrics
{
    auto& jobs = registry.addCounter("stt_jobs_total", "Transcription job outcomes.", "status");
    auto& duration = registry.addHistogram("stt_job_duration_seconds",
                                           "Time spent processing one transcription job.",
                                           { 0.5, 1.0, 2.5, 5.0, 10.0, 30.0, 60.0, 120.0, 300.0, 600.0 });
    return WorkerMetrics { .jobs = jobs, .duration = duration };
}

} // namespace callscribe
