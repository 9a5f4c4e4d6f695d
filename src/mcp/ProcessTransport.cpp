// SPDX-License-Identifier: Apache-2.0
#include "ProcessTransport.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <format>
#include <mutex>
#include <ranges>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace toolbridge
{

namespace
{
    constexpr auto ReadChunkSize = size_t { 4096 };
    constexpr auto ReapPollInterval = std::chrono::milliseconds(10);

    void closeFd(int& fd) noexcept
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto splitPath(std::string_view path) -> std::vector<std::string>
    {
        auto entries = std::vector<std::string> {};
        for (auto const part: std::views::split(path, ':'))
        {
            auto entry = std::string(part.begin(), part.end());
            if (!entry.empty())
                entries.push_back(std::move(entry));
        }
        return entries;
    }

    /// Writes to a pipe whose reader is gone must fail with EPIPE, not kill the host.
    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
    }

    auto buildEnvironment(const std::map<std::string, std::string>& overlay) -> std::map<std::string, std::string>
    {
        auto env = std::map<std::string, std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view(*e);
                auto const eq = entry.find('=');
                if (eq == std::string_view::npos)
                    continue;
                env[std::string(entry.substr(0, eq))] = std::string(entry.substr(eq + 1));
            }
        }

        for (const auto& [key, value]: overlay)
            env[key] = value;

        auto const home = env.contains("HOME") ? env["HOME"] : std::string {};
        env["PATH"] = extendedSearchPath(env.contains("PATH") ? env["PATH"] : std::string {}, home);
        return env;
    }
} // namespace

auto extendedSearchPath(std::string_view currentPath, std::string_view home) -> std::string
{
    auto entries = splitPath(currentPath);
    if (entries.empty())
        entries = { "/usr/bin", "/bin" };

    auto extras = std::vector<std::string> { "/usr/local/bin", "/opt/homebrew/bin", "/opt/local/bin" };
    if (!home.empty())
    {
        for (auto const* suffix: { "/.local/bin", "/.cargo/bin", "/.npm-global/bin", "/.bun/bin", "/.deno/bin", "/go/bin" })
            extras.push_back(std::format("{}{}", home, suffix));
    }

    for (auto& extra: extras)
    {
        if (std::ranges::find(entries, extra) == entries.end())
            entries.push_back(std::move(extra));
    }

    auto result = std::string {};
    for (const auto& entry: entries)
    {
        if (!result.empty())
            result += ':';
        result += entry;
    }
    return result;
}

auto resolveExecutable(std::string_view command, std::string_view searchPath) -> std::optional<std::string>
{
    auto const isExecutableFile = [](const std::string& candidate) {
        auto ec = std::error_code {};
        return std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0;
    };

    if (command.empty())
        return std::nullopt;

    if (command.find('/') != std::string_view::npos)
    {
        auto path = std::string(command);
        if (isExecutableFile(path))
            return path;
        return std::nullopt;
    }

    for (const auto& dir: splitPath(searchPath))
    {
        auto candidate = std::format("{}/{}", dir, command);
        if (isExecutableFile(candidate))
            return candidate;
    }
    return std::nullopt;
}

struct ProcessTransport::Impl
{
    std::string name;
    std::chrono::milliseconds stopTimeout { 2000 };

    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;

    // Never drained once written: every poller sees it and gives up.
    std::array<int, 2> wakePipe { -1, -1 };

    bool started = false;
    std::atomic<bool> connected = false;
    std::atomic<bool> stopping = false;

    std::mutex writeMutex;
    std::mutex readMutex;
    std::mutex processMutex;

    std::jthread stderrDrain;

    ~Impl()
    {
        closeFd(stdinWrite);
        closeFd(stdoutRead);
        closeFd(stderrRead);
        closeFd(wakePipe[0]);
        closeFd(wakePipe[1]);
    }

    /// Reaps the child if it has exited. Caller holds processMutex.
    auto reapIfExited() -> bool
    {
        if (childPid <= 0)
            return true;

        auto status = 0;
        auto const rc = ::waitpid(childPid, &status, WNOHANG);
        if (rc == 0)
            return false;

        if (rc == childPid)
            logExit(status);
        childPid = -1;
        return true;
    }

    void logExit(int status) const
    {
        if (WIFEXITED(status))
            log::debug("Server '{}' exited with status {}", name, WEXITSTATUS(status));
        else if (WIFSIGNALED(status))
            log::debug("Server '{}' terminated by signal {}", name, WTERMSIG(status));
    }

    void terminate() noexcept
    {
        auto const lock = std::lock_guard(processMutex);
        if (childPid <= 0)
            return;

        ::kill(childPid, SIGTERM);

        auto const deadline = std::chrono::steady_clock::now() + stopTimeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (reapIfExited())
                return;
            std::this_thread::sleep_for(ReapPollInterval);
        }

        log::warning("Server '{}' did not exit after SIGTERM, killing it", name);
        ::kill(childPid, SIGKILL);
        auto status = 0;
        if (::waitpid(childPid, &status, 0) == childPid)
            logExit(status);
        childPid = -1;
    }

    void drainStderr(const std::stop_token& stopToken)
    {
        auto pending = std::string {};
        auto buf = std::array<char, ReadChunkSize> {};

        auto const flushLines = [&](bool flushAll) {
            auto pos = pending.find('\n');
            while (pos != std::string::npos)
            {
                auto line = std::string_view(pending).substr(0, pos);
                if (!line.empty() && line.back() == '\r')
                    line.remove_suffix(1);
                if (!line.empty())
                    log::info("[{}] {}", name, line);
                pending.erase(0, pos + 1);
                pos = pending.find('\n');
            }
            if (flushAll && !pending.empty())
            {
                log::info("[{}] {}", name, pending);
                pending.clear();
            }
        };

        while (!stopToken.stop_requested())
        {
            auto fds = std::array<pollfd, 2> { {
                { .fd = stderrRead, .events = POLLIN, .revents = 0 },
                { .fd = wakePipe[0], .events = POLLIN, .revents = 0 },
            } };

            auto const rc = ::poll(fds.data(), fds.size(), -1);
            if (rc < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }

            if (fds[0].revents != 0)
            {
                auto const n = ::read(stderrRead, buf.data(), buf.size());
                if (n < 0 && errno == EINTR)
                    continue;
                if (n <= 0)
                    break;
                pending.append(buf.data(), static_cast<size_t>(n));
                flushLines(false);
                continue;
            }

            if (fds[1].revents != 0)
                break;
        }

        flushLines(true);
    }
};

ProcessTransport::ProcessTransport(): _impl(std::make_unique<Impl>())
{
}

ProcessTransport::~ProcessTransport()
{
    stop();
}

auto ProcessTransport::start(const ProcessConfig& config) -> VoidResult
{
    if (_impl->started || _impl->stopping)
        return makeError(ErrorCode::InvalidState, "Transport already started");

    ignoreSigpipe();

    auto const env = buildEnvironment(config.env);
    auto const executable = resolveExecutable(config.command, env.at("PATH"));
    if (!executable)
        return makeError(ErrorCode::SpawnFailed,
                         std::format("Executable '{}' not found or not executable", config.command));

    int stdinPipe[2];
    int stdoutPipe[2];
    int stderrPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::SpawnFailed, std::format("Failed to create stdin pipe: {}", std::strerror(errno)));
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::SpawnFailed, std::format("Failed to create stdout pipe: {}", std::strerror(errno)));
    }
    if (::pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        for (auto const fd: { stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1] })
            ::close(fd);
        return makeError(ErrorCode::SpawnFailed, std::format("Failed to create stderr pipe: {}", std::strerror(errno)));
    }

    // dup2 clears O_CLOEXEC on the target descriptor, every other pipe end closes on exec.
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);

    auto argStrings = std::vector<std::string> { config.command };
    argStrings.insert(argStrings.end(), config.args.begin(), config.args.end());
    auto argv = std::vector<char*> {};
    for (auto& arg: argStrings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = std::vector<std::string> {};
    for (const auto& [key, value]: env)
        envStrings.push_back(std::format("{}={}", key, value));
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = ::posix_spawn(&pid, executable->c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        return makeError(ErrorCode::SpawnFailed,
                         std::format("Failed to spawn '{}': {}", config.command, std::strerror(status)));
    }

    _impl->name = config.name.empty() ? config.command : config.name;
    _impl->stopTimeout = config.stopTimeout;
    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->stderrRead = stderrPipe[0];
    _impl->started = true;

    {
        auto const lock = std::lock_guard(_impl->processMutex);
        if (_impl->reapIfExited())
        {
            closeFd(_impl->stdinWrite);
            closeFd(_impl->stdoutRead);
            closeFd(_impl->stderrRead);
            return makeError(ErrorCode::SpawnFailed,
                             std::format("Server process '{}' exited immediately", config.command));
        }
    }

    if (::pipe2(_impl->wakePipe.data(), O_CLOEXEC) != 0)
    {
        stop();
        return makeError(ErrorCode::SpawnFailed, std::format("Failed to create wake pipe: {}", std::strerror(errno)));
    }

    _impl->stderrDrain = std::jthread([impl = _impl.get()](const std::stop_token& token) { impl->drainStderr(token); });
    _impl->connected = true;

    log::info("MCP server '{}' started: {} (pid {})", _impl->name, *executable, pid);
    return {};
}

auto ProcessTransport::write(std::string_view bytes) -> VoidResult
{
    auto const lock = std::lock_guard(_impl->writeMutex);

    if (!_impl->connected || _impl->stdinWrite < 0)
        return makeError(ErrorCode::WriteFailed, "Transport not connected");

    if (!isRunning())
    {
        _impl->connected = false;
        return makeError(ErrorCode::WriteFailed, std::format("Server '{}' has exited", _impl->name));
    }

    while (!bytes.empty())
    {
        auto const n = ::write(_impl->stdinWrite, bytes.data(), bytes.size());
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            auto const reason = std::strerror(errno);
            _impl->connected = false;
            return makeError(ErrorCode::WriteFailed,
                             std::format("Failed to write to '{}' stdin: {}", _impl->name, reason));
        }
        bytes.remove_prefix(static_cast<size_t>(n));
    }

    return {};
}

auto ProcessTransport::read() -> Result<std::string>
{
    auto const lock = std::lock_guard(_impl->readMutex);

    if (_impl->stdoutRead < 0)
        return makeError(ErrorCode::Disconnected, "Transport not connected");

    auto buf = std::array<char, ReadChunkSize> {};
    while (true)
    {
        if (_impl->stopping)
            break;

        auto fds = std::array<pollfd, 2> { {
            { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 },
            { .fd = _impl->wakePipe[0], .events = POLLIN, .revents = 0 },
        } };

        auto const rc = ::poll(fds.data(), fds.size(), -1);
        if (rc < 0)
        {
            if (errno == EINTR)
                continue;
            break;
        }

        if (fds[1].revents != 0)
            break;

        if (fds[0].revents != 0)
        {
            auto const n = ::read(_impl->stdoutRead, buf.data(), buf.size());
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
            {
                _impl->connected = false;
                closeFd(_impl->stdoutRead);
                return makeError(ErrorCode::Disconnected, std::format("Server '{}' closed its output", _impl->name));
            }
            return std::string(buf.data(), static_cast<size_t>(n));
        }
    }

    closeFd(_impl->stdoutRead);
    return makeError(ErrorCode::Disconnected, "Transport closed");
}

void ProcessTransport::close() noexcept
{
    stop();
}

void ProcessTransport::stop() noexcept
{
    if (_impl->stopping.exchange(true))
        return;

    _impl->connected = false;
    if (!_impl->started)
        return;

    if (_impl->wakePipe[1] >= 0)
    {
        auto const byte = char { 1 };
        [[maybe_unused]] auto const n = ::write(_impl->wakePipe[1], &byte, 1);
    }

    // A writer blocked on a full pipe holds the lock until the process dies.
    {
        auto lock = std::unique_lock(_impl->writeMutex, std::try_to_lock);
        if (lock.owns_lock())
            closeFd(_impl->stdinWrite);
    }

    _impl->terminate();

    {
        auto const lock = std::lock_guard(_impl->writeMutex);
        closeFd(_impl->stdinWrite);
    }

    if (_impl->stderrDrain.joinable())
    {
        _impl->stderrDrain.request_stop();
        _impl->stderrDrain.join();
    }
    closeFd(_impl->stderrRead);

    // A blocked reader wakes up and releases stdout itself.
    {
        auto lock = std::unique_lock(_impl->readMutex, std::try_to_lock);
        if (lock.owns_lock())
            closeFd(_impl->stdoutRead);
    }

    log::debug("MCP transport for '{}' stopped", _impl->name);
}

auto ProcessTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto ProcessTransport::isRunning() const -> bool
{
    auto const lock = std::lock_guard(_impl->processMutex);
    return !_impl->reapIfExited();
}

auto ProcessTransport::processId() const -> int
{
    auto const lock = std::lock_guard(_impl->processMutex);
    return _impl->childPid;
}

} // namespace toolbridge
