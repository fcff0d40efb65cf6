// SPDX-License-Identifier: Apache-2.0
#include "ProviderRouter.hpp"

#include <core/Log.hpp>

#include <stt/HttpTranscriptionProvider.hpp>
#include <stt/PlaceholderProvider.hpp>
#include <stt/WhisperTranscriber.hpp>

#include <exception>
#include <format>

namespace callscribe
{

ProviderRouter::ProviderRouter(std::string defaultEngine): _defaultEngine(std::move(defaultEngine))
{
}

void ProviderRouter::add(std::string engine, std::unique_ptr<TranscriptionProvider> provider)
{
    _providers.insert_or_assign(std::move(engine), std::move(provider));
}

auto ProviderRouter::has(std::string const& engine) const -> bool
{
    return _providers.contains(engine);
}

auto ProviderRouter::engines() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    names.reserve(_providers.size());
    for (auto const& [name, _]: _providers)
        names.push_back(name);
    return names;
}

auto ProviderRouter::transcribe(JobEnvelope const& job) -> TranscriptionOutcome
{
    auto const& engine = job.engine.empty() ? _defaultEngine : job.engine;

    auto const it = _providers.find(engine);
    if (it == _providers.end())
        return std::unexpected(TranscriptionFailure::transient(std::format("STT engine '{}' is not enabled", engine)));

    try
    {
        return it->second->transcribe(job);
    }
    catch (std::exception const& e)
    {
        log::error("STT engine {} threw for call_id={}: {}", engine, job.callId, e.what());
        return std::unexpected(TranscriptionFailure::unexpected(e.what()));
    }
}

auto makeProviderRouter(SttSettings const& settings, std::shared_ptr<HttpClient> http) -> std::unique_ptr<ProviderRouter>
{
    auto router = std::make_unique<ProviderRouter>(settings.defaultEngine);

    router->add("stub", std::make_unique<PlaceholderProvider>(settings.transcriptsDir));

    if (settings.openai.enabled)
    {
        if (auto provider = HttpTranscriptionProvider::openAi(settings, http))
            router->add("openai-whisper", std::move(*provider));
        else
            log::warning("STT engine openai-whisper disabled: {}", provider.error().message);
    }

    if (settings.local.enabled)
    {
        if (auto provider = HttpTranscriptionProvider::local(settings, http))
            router->add("local", std::move(*provider));
        else
            log::warning("STT engine local disabled: {}", provider.error().message);
    }

    if (settings.whisper.enabled)
    {
        auto transcriber = std::make_shared<WhisperTranscriber>();
        if (settings.whisper.modelPath.empty())
            log::warning("STT engine whisper disabled: stt.whisper.modelPath is not configured");
        else if (auto loaded = transcriber->initialize(settings.whisper); !loaded)
            log::warning("STT engine whisper disabled: {}", loaded.error().message);
        else
            router->add("whisper", std::make_unique<WhisperProvider>(std::move(transcriber), settings, http));
    }

    if (!router->has(router->defaultEngine()))
        log::warning("Default STT engine '{}' is not enabled", router->defaultEngine());

    log::info("STT engines enabled: {}", [&] {
        auto joined = std::string {};
        for (auto const& name: router->engines())
            joined += joined.empty() ? name : ", " + name;
        return joined;
    }());

    return router;
}

} // namespace callscribe
