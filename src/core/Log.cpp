// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <core/Time.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <mutex>
#include <print>
#include <sstream>
#include <thread>

namespace callscribe::log
{

namespace
{
    std::atomic<Level> globalLevel { Level::Info };
    std::mutex globalMutex;
    auto globalCallback = LogCallback {};
    thread_local auto threadName = std::string {};

    auto currentThreadLabel() -> std::string
    {
        if (!threadName.empty())
            return threadName;
        auto ss = std::ostringstream {};
        ss << "T" << std::this_thread::get_id();
        return ss.str();
    }
} // namespace

void setCallback(LogCallback callback)
{
    auto const lock = std::lock_guard { globalMutex };
    globalCallback = std::move(callback);
}

void setLevel(Level level)
{
    globalLevel.store(level);
}

auto getLevel() -> Level
{
    return globalLevel.load();
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    auto lower = std::string(name);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "error")
        return Level::Error;
    if (lower == "warn" || lower == "warning")
        return Level::Warning;
    if (lower == "info")
        return Level::Info;
    if (lower == "debug")
        return Level::Debug;
    if (lower == "trace")
        return Level::Trace;
    return std::nullopt;
}

void setThreadName(std::string name)
{
    threadName = std::move(name);
}

void write(Level level, std::string_view message)
{
    if (level > globalLevel.load())
        return;

    auto const lock = std::lock_guard { globalMutex };

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    constexpr auto levelPrefix = [](Level l) -> std::string_view {
        switch (l)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    };

    std::println(stderr,
                 "{} [{}] [{}] {}",
                 formatIso8601(SystemClock::now()),
                 levelPrefix(level),
                 currentThreadLabel(),
                 message);
}

} // namespace callscribe::log
