// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stt/HttpClient.hpp>
#include <stt/SttSettings.hpp>
#include <stt/TranscriptionProvider.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace callscribe
{

/// @brief Dispatches each job to the provider registered for its engine name.
///
/// A job with an empty engine goes to the default engine. Exceptions thrown by a provider
/// are caught and reported as FailureKind::Unexpected.
class ProviderRouter final: public TranscriptionProvider
{
  public:
    explicit ProviderRouter(std::string defaultEngine = "stub");

    /// @brief Registers @p provider under @p engine, replacing any previous registration.
    void add(std::string engine, std::unique_ptr<TranscriptionProvider> provider);

    [[nodiscard]] auto has(std::string const& engine) const -> bool;

    [[nodiscard]] auto engines() const -> std::vector<std::string>;

    [[nodiscard]] auto defaultEngine() const noexcept -> std::string const& { return _defaultEngine; }

    [[nodiscard]] auto transcribe(JobEnvelope const& job) -> TranscriptionOutcome override;

  private:
    std::string _defaultEngine;
    std::map<std::string, std::unique_ptr<TranscriptionProvider>, std::less<>> _providers;
};

/// @brief Builds the router for the configured engines.
///
/// "stub" is always available. "openai-whisper", "local" and "whisper" are registered when
/// enabled; an enabled engine that cannot be set up is logged and left out.
[[nodiscard]] auto makeProviderRouter(SttSettings const& settings, std::shared_ptr<HttpClient> http)
    -> std::unique_ptr<ProviderRouter>;

} // namespace callscribe
