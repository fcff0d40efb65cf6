// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stt/TranscriptionProvider.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace callscribe
{

/// @brief Worker loop tuning, see the "worker" config section.
struct WorkerSettings
{
    int maxRetries = 5;
    double baseBackoffSeconds = 2.0;
    double idleSleepSeconds = 1.0;
    double dequeueTimeoutSeconds = 5.0;
    int threads = 1;
};

using Seconds = std::chrono::duration<double>;

/// @brief What to do after a failed attempt.
struct RetryDecision
{
    enum class Action
    {
        Retry,
        DeadLetter,
    };

    Action action = Action::DeadLetter;
    Seconds delay {}; ///< Only meaningful for Action::Retry.

    // Filled in for Action::DeadLetter.
    std::string errorCode;
    std::string errorMessage;
    std::string reason;
    std::optional<int> statusCode;
};

/// @brief Bounded exponential backoff.
///
/// Client errors are dead-lettered at once. Any other failure is retried until maxRetries
/// attempts were made, sleeping base, 2*base, 4*base, ... in between.
class RetryPolicy
{
  public:
    static constexpr auto MinBackoff = 0.1;

    /// @brief Clamps maxRetries to at least 1 and the base backoff to at least 100 ms.
    RetryPolicy(int maxRetries, Seconds baseBackoff);

    explicit RetryPolicy(WorkerSettings const& settings);

    /// @brief Returns the delay after failed attempt @p attempt (1-based): base * 2^(attempt-1).
    [[nodiscard]] auto backoffDelay(int attempt) const -> Seconds;

    /// @brief Decides how to continue after attempt @p attempt (1-based) failed with @p failure.
    [[nodiscard]] auto decide(TranscriptionFailure const& failure, int attempt) const -> RetryDecision;

    [[nodiscard]] auto maxRetries() const noexcept -> int { return _maxRetries; }
    [[nodiscard]] auto baseBackoff() const noexcept -> Seconds { return _baseBackoff; }

  private:
    int _maxRetries;
    Seconds _baseBackoff;
};

} // namespace callscribe
