// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace callscribe
{

auto defaultConfigDir() -> std::string
{
#ifdef __APPLE__
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/callscribe";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/callscribe";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/callscribe";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto parseConfig(std::string_view content) -> Result<AppConfig>
{
    auto parseResult = json::parse(content);
    if (!parseResult)
        return makeError(ErrorCode::ConfigError, parseResult.error().message);

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};
    auto const defaults = AppConfig {};

    config.logLevel = json::getStringOr(root, "logLevel", defaults.logLevel);

    // Store section
    {
        auto const store = json::sectionOf(root, "store");
        config.store.backend = json::getStringOr(store, "backend", defaults.store.backend);
        config.store.host = json::getStringOr(store, "host", defaults.store.host);
        config.store.port = json::getIntOr(store, "port", defaults.store.port);
        config.store.keyPrefix = json::getStringOr(store, "keyPrefix", defaults.store.keyPrefix);
        config.store.connectTimeoutMs = json::getIntOr(store, "connectTimeoutMs", defaults.store.connectTimeoutMs);

        if (config.store.backend != "redis" && config.store.backend != "memory")
            return makeError(ErrorCode::ConfigError,
                             std::format("Unknown store backend '{}' (expected \"redis\" or \"memory\")",
                                         config.store.backend));
    }

    // Worker section
    {
        auto const worker = json::sectionOf(root, "worker");
        config.worker.maxRetries = json::getIntOr(worker, "maxRetries", defaults.worker.maxRetries);
        config.worker.baseBackoffSeconds =
            json::getDoubleOr(worker, "baseBackoffSeconds", defaults.worker.baseBackoffSeconds);
        config.worker.idleSleepSeconds =
            json::getDoubleOr(worker, "idleSleepSeconds", defaults.worker.idleSleepSeconds);
        config.worker.dequeueTimeoutSeconds =
            json::getDoubleOr(worker, "dequeueTimeoutSeconds", defaults.worker.dequeueTimeoutSeconds);
        config.worker.threads = json::getIntOr(worker, "threads", defaults.worker.threads);
    }

    // STT section
    {
        auto const stt = json::sectionOf(root, "stt");
        config.stt.defaultEngine = json::getStringOr(stt, "defaultEngine", defaults.stt.defaultEngine);
        config.stt.defaultLanguage = json::getStringOr(stt, "defaultLanguage", defaults.stt.defaultLanguage);
        config.stt.transcriptsDir = json::getStringOr(stt, "transcriptsDir", defaults.stt.transcriptsDir);
        config.stt.requestTimeoutSeconds =
            json::getIntOr(stt, "requestTimeoutSeconds", defaults.stt.requestTimeoutSeconds);
        config.stt.maxFileMinutes = json::getIntOr(stt, "maxFileMinutes", defaults.stt.maxFileMinutes);
        config.stt.maxFileSizeMb = json::getIntOr(stt, "maxFileSizeMb", defaults.stt.maxFileSizeMb);
        config.stt.errorHint413 = json::getStringOr(stt, "errorHint413", defaults.stt.errorHint413);
        config.stt.errorHint422 = json::getStringOr(stt, "errorHint422", defaults.stt.errorHint422);

        auto const openai = json::sectionOf(stt, "openai");
        config.stt.openai.enabled = json::getBoolOr(openai, "enabled", defaults.stt.openai.enabled);
        config.stt.openai.apiKey = json::getStringOr(openai, "apiKey", defaults.stt.openai.apiKey);
        config.stt.openai.baseUrl = json::getStringOr(openai, "baseUrl", defaults.stt.openai.baseUrl);
        config.stt.openai.model = json::getStringOr(openai, "model", defaults.stt.openai.model);

        auto const local = json::sectionOf(stt, "local");
        config.stt.local.enabled = json::getBoolOr(local, "enabled", defaults.stt.local.enabled);
        config.stt.local.url = json::getStringOr(local, "url", defaults.stt.local.url);
        config.stt.local.apiKey = json::getStringOr(local, "apiKey", defaults.stt.local.apiKey);

        auto const whisper = json::sectionOf(stt, "whisper");
        config.stt.whisper.enabled = json::getBoolOr(whisper, "enabled", defaults.stt.whisper.enabled);
        config.stt.whisper.modelPath = json::getStringOr(whisper, "modelPath", defaults.stt.whisper.modelPath);
        config.stt.whisper.threads = json::getIntOr(whisper, "threads", defaults.stt.whisper.threads);

        auto const summary = json::sectionOf(stt, "summary");
        config.stt.summary.enabled = json::getBoolOr(summary, "enabled", defaults.stt.summary.enabled);
        config.stt.summary.directory = json::getStringOr(summary, "directory", defaults.stt.summary.directory);
    }

    // Records section
    config.records.directory =
        json::getStringOr(json::sectionOf(root, "records"), "directory", defaults.records.directory);

    // Metrics section
    {
        auto const metrics = json::sectionOf(root, "metrics");
        config.metrics.enabled = json::getBoolOr(metrics, "enabled", defaults.metrics.enabled);
        config.metrics.host = json::getStringOr(metrics, "host", defaults.metrics.host);
        config.metrics.port = json::getIntOr(metrics, "port", defaults.metrics.port);
    }

    return config;
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto config = parseConfig(ss.str());
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace callscribe
