// SPDX-License-Identifier: Apache-2.0
#include "Log.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <mutex>
#include <print>
#include <utility>

namespace toolbridge::log
{

namespace
{
    constexpr auto LevelNames = std::array<std::string_view, 5> { "error", "warning", "info", "debug", "trace" };

    auto globalLevel = std::atomic<Level> { Level::Info };
    auto globalCallback = LogCallback {};
    auto globalMutex = std::mutex {};

    auto exchangeCallback(LogCallback callback) -> LogCallback
    {
        auto const lock = std::lock_guard(globalMutex);
        return std::exchange(globalCallback, std::move(callback));
    }

    auto stderrTag(Level level) -> std::string_view
    {
        switch (level)
        {
            case Level::Error: return "ERROR";
            case Level::Warning: return "WARN ";
            case Level::Info: return "INFO ";
            case Level::Debug: return "DEBUG";
            case Level::Trace: return "TRACE";
        }
        return "?????";
    }
} // namespace

void setCallback(LogCallback callback)
{
    exchangeCallback(std::move(callback));
}

void setLevel(Level level)
{
    globalLevel = level;
}

auto getLevel() -> Level
{
    return globalLevel;
}

auto parseLevel(std::string_view name) -> std::optional<Level>
{
    if (name == "warn")
        return Level::Warning;
    for (auto i = size_t { 0 }; i < LevelNames.size(); ++i)
    {
        if (LevelNames[i] == name)
            return static_cast<Level>(i);
    }
    return std::nullopt;
}

auto levelName(Level level) -> std::string_view
{
    auto const index = static_cast<size_t>(level);
    return index < LevelNames.size() ? LevelNames[index] : "unknown";
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
        return;

    auto const lock = std::lock_guard(globalMutex);

    if (globalCallback)
    {
        globalCallback(level, message);
        return;
    }

    auto const now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    std::println(stderr, "{:%T} {} {}", now, stderrTag(level), message);
}

ScopedCallback::ScopedCallback(LogCallback callback, Level level):
    _previousCallback(exchangeCallback(std::move(callback))), _previousLevel(getLevel())
{
    setLevel(level);
}

ScopedCallback::~ScopedCallback()
{
    setLevel(_previousLevel);
    exchangeCallback(std::move(_previousCallback));
}

} // namespace toolbridge::log
