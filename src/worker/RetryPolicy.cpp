// SPDX-License-Identifier: Apache-2.0
#include "RetryPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace callscribe
{

RetryPolicy::RetryPolicy(int maxRetries, Seconds baseBackoff):
    _maxRetries(std::max(1, maxRetries)), _baseBackoff(std::max(baseBackoff, Seconds { MinBackoff }))
{
}

RetryPolicy::RetryPolicy(WorkerSettings const& settings):
    RetryPolicy(settings.maxRetries, Seconds { settings.baseBackoffSeconds })
{
}

auto RetryPolicy::backoffDelay(int attempt) const -> Seconds
{
    return _baseBackoff * std::pow(2.0, std::max(0, attempt - 1));
}

auto RetryPolicy::decide(TranscriptionFailure const& failure, int attempt) const -> RetryDecision
{
    if (failure.kind == FailureKind::ClientError)
    {
        auto const status = failure.statusCode ? std::format("{}", *failure.statusCode) : std::string { "4xx" };
        return RetryDecision {
            .action = RetryDecision::Action::DeadLetter,
            .delay = {},
            .errorCode = failure.statusCode ? std::format("http_{}", *failure.statusCode) : "client_error",
            .errorMessage = failure.message,
            .reason = std::format("{}: {}", status, failure.message),
            .statusCode = failure.statusCode,
        };
    }

    if (attempt < _maxRetries)
        return RetryDecision { .action = RetryDecision::Action::Retry, .delay = backoffDelay(attempt) };

    return RetryDecision {
        .action = RetryDecision::Action::DeadLetter,
        .delay = {},
        .errorCode = failure.kind == FailureKind::Unexpected ? "unexpected_error" : "max_retries",
        .errorMessage =
            failure.statusCode ? std::format("{}: {}", *failure.statusCode, failure.message) : failure.message,
        .reason = "max_retries",
        .statusCode = failure.statusCode,
    };
}

} // namespace callscribe
