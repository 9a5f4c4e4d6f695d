// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <format>
#include <functional>
#include <optional>
#include <string_view>

namespace toolbridge::log
{

/// @brief Verbosity level for log messages.
enum class Level
{
    Error,
    Warning,
    Info,
    Debug,
    Trace,
};

/// @brief Receives every message that passes the level filter.
/// May be invoked from the connection reader and server stderr threads.
using LogCallback = std::function<void(Level level, std::string_view message)>;

/// @brief Routes messages to @p callback instead of stderr. An empty callback restores stderr.
void setCallback(LogCallback callback);

void setLevel(Level level);
[[nodiscard]] auto getLevel() -> Level;

/// @brief Returns true if messages at @p level are currently written.
[[nodiscard]] inline auto enabled(Level level) -> bool
{
    return level <= getLevel();
}

/// @brief Parses a level name (error, warning, info, debug, trace).
/// @return The level, or std::nullopt for an unknown name.
[[nodiscard]] auto parseLevel(std::string_view name) -> std::optional<Level>;

/// @brief Lower-case name of @p level, the inverse of parseLevel().
[[nodiscard]] auto levelName(Level level) -> std::string_view;

/// @brief Writes a message at the given level.
///
/// Without a callback, the message goes to stderr as "HH:MM:SS.mmm LEVEL message".
void write(Level level, std::string_view message);

/// @brief Installs a callback and level for its lifetime, restoring the previous ones afterwards.
class ScopedCallback
{
  public:
    ScopedCallback(LogCallback callback, Level level);
    ~ScopedCallback();

    ScopedCallback(const ScopedCallback&) = delete;
    auto operator=(const ScopedCallback&) -> ScopedCallback& = delete;

  private:
    LogCallback _previousCallback;
    Level _previousLevel;
};

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warning(std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Info))
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Debug))
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

/// @brief Logs wire-level detail such as raw JSON-RPC frames.
template <typename... Args>
void trace(std::format_string<Args...> fmt, Args&&... args)
{
    if (enabled(Level::Trace))
        write(Level::Trace, std::format(fmt, std::forward<Args>(args)...));
}

} // namespace toolbridge::log
