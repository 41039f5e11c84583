// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/JsonRpc.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <format>
#include <mutex>
#include <thread>
#include <utility>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcpgate
{

namespace
{

    using namespace std::chrono_literals;

    constexpr auto StderrPollInterval = 200ms;
    constexpr auto WriteTimeout = 10s;
    constexpr auto StdinCloseGrace = 200ms;
    constexpr auto TerminateGrace = 2s;

    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto decodeWaitStatus(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }

    auto remainingMs(std::chrono::steady_clock::time_point deadline) -> int
    {
        auto const left =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    }

    /// Inherited environment with the overrides applied on top. Later entries win.
    auto buildEnvironment(const std::map<std::string, std::string>& overrides) -> std::vector<std::string>
    {
        auto merged = std::map<std::string, std::string> {};
        if (environ)
        {
            for (auto** e = environ; *e; ++e)
            {
                auto const entry = std::string_view(*e);
                auto const eq = entry.find('=');
                if (eq == std::string_view::npos)
                    continue;
                merged.emplace(std::string(entry.substr(0, eq)), std::string(entry.substr(eq + 1)));
            }
        }
        for (const auto& [key, value]: overrides)
            merged[key] = value;

        auto result = std::vector<std::string> {};
        result.reserve(merged.size());
        for (const auto& [key, value]: merged)
            result.push_back(std::format("{}={}", key, value));
        return result;
    }

} // namespace

struct StdioTransport::Impl
{
    std::string label;
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int stderrRead = -1;
    std::atomic<bool> connected = false;
    std::string readBuffer;

    // send() holds writeMutex and receive() holds readMutex for their whole
    // duration. close() takes both before touching the descriptors, after
    // waking any poll in progress through the wake pipe.
    std::mutex readMutex;
    std::mutex writeMutex;
    int wakeRead = -1;
    int wakeWrite = -1;

    std::mutex processMutex;
    std::optional<int> exitStatus;
    std::jthread stderrDrain;

    /// @brief Collects the child's exit status if it has terminated.
    /// @param block Wait for the child instead of polling.
    auto reap(bool block) -> std::optional<int>
    {
        auto const lock = std::scoped_lock(processMutex);
        if (exitStatus || childPid <= 0)
            return exitStatus;

        auto status = 0;
        auto const rc = ::waitpid(childPid, &status, block ? 0 : WNOHANG);
        if (rc == childPid)
            exitStatus = decodeWaitStatus(status);
        return exitStatus;
    }

    auto waitForExit(std::chrono::milliseconds limit) -> std::optional<int>
    {
        auto const deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (auto code = reap(false))
                return code;
            std::this_thread::sleep_for(25ms);
        }
        return reap(false);
    }

    void signalGroup(int sig)
    {
        auto const lock = std::scoped_lock(processMutex);
        if (childPid > 0 && !exitStatus)
            ::kill(-childPid, sig);
    }

    void terminate()
    {
        if (childPid <= 0)
            return;

        if (waitForExit(StdinCloseGrace))
            return;

        signalGroup(SIGTERM);
        if (waitForExit(TerminateGrace))
            return;

        log::warning("[{}] Backend ignored SIGTERM, killing process group {}", label, childPid);
        signalGroup(SIGKILL);
        (void) reap(true);
    }

    void wake()
    {
        if (wakeWrite >= 0)
        {
            auto const byte = char { 1 };
            (void) ::write(wakeWrite, &byte, 1);
        }
    }

    /// @brief Creates the wake pipe, or empties it if a previous close() left it readable.
    auto prepareWakePipe() -> bool
    {
        if (wakeRead < 0)
        {
            int fds[2] = { -1, -1 };
            if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0)
                return false;
            wakeRead = fds[0];
            wakeWrite = fds[1];
            return true;
        }

        auto buf = std::array<char, 64> {};
        while (::read(wakeRead, buf.data(), buf.size()) > 0)
            ;
        return true;
    }

    static void drainStderr(const std::stop_token& token, int fd, std::string label)
    {
        auto pending = std::string {};
        auto buf = std::array<char, 4096> {};

        while (!token.stop_requested())
        {
            auto pfd = pollfd { .fd = fd, .events = POLLIN, .revents = 0 };
            auto const rc = ::poll(&pfd, 1, static_cast<int>(StderrPollInterval.count()));
            if (rc < 0 && errno == EINTR)
                continue;
            if (rc < 0)
                break;
            if (rc == 0)
                continue;

            auto const n = ::read(fd, buf.data(), buf.size());
            if (n < 0 && errno == EINTR)
                continue;
            if (n <= 0)
                break;

            pending.append(buf.data(), static_cast<size_t>(n));
            for (auto pos = pending.find('\n'); pos != std::string::npos; pos = pending.find('\n'))
            {
                auto line = pending.substr(0, pos);
                pending.erase(0, pos + 1);
                if (!line.empty())
                    log::debug("[{}] stderr: {}", label, line);
            }
        }

        if (!pending.empty())
            log::debug("[{}] stderr: {}", label, pending);
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
    closeFd(_impl->wakeRead);
    closeFd(_impl->wakeWrite);
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected || _impl->childPid > 0)
        return makeError(ErrorCode::InvalidArgument, "Transport already started");

    if (config.command.empty())
        return makeError(ErrorCode::BackendUnreachable, "No command configured");

    if (!config.workingDirectory.empty())
    {
        auto ec = std::error_code {};
        if (!std::filesystem::is_directory(config.workingDirectory, ec))
            return makeError(ErrorCode::BackendUnreachable,
                             std::format("Working directory does not exist: {}", config.workingDirectory));
    }

    ignoreSigpipe();
    if (!_impl->prepareWakePipe())
        return makeError(ErrorCode::BackendUnreachable, std::format("Failed to create wake pipe: {}", strerror(errno)));
    _impl->label = config.label.empty() ? config.command : config.label;

    int stdinPipe[2] = { -1, -1 };
    int stdoutPipe[2] = { -1, -1 };
    int stderrPipe[2] = { -1, -1 };

    auto const closePipes = [&] {
        for (auto* p: { stdinPipe, stdoutPipe, stderrPipe })
        {
            closeFd(p[0]);
            closeFd(p[1]);
        }
    };

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0 || ::pipe2(stdoutPipe, O_CLOEXEC) != 0
        || ::pipe2(stderrPipe, O_CLOEXEC) != 0)
    {
        auto const err = errno;
        closePipes();
        return makeError(ErrorCode::BackendUnreachable, std::format("Failed to create pipes: {}", strerror(err)));
    }

    // The duplicated descriptors lose O_CLOEXEC, the originals close on exec.
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);
    if (!config.workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(&actions, config.workingDirectory.c_str());

    // Own process group so wrappers like npx take their children down with them,
    // and SIGPIPE back at its default disposition in the child.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    auto defaultSignals = sigset_t {};
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaultSignals);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF);

    auto argStrings = std::vector<std::string> {};
    argStrings.reserve(config.args.size() + 1);
    argStrings.push_back(config.command);
    argStrings.insert(argStrings.end(), config.args.begin(), config.args.end());

    auto argv = std::vector<char*> {};
    for (auto& arg: argStrings)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    auto envStrings = buildEnvironment(config.env);
    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = posix_spawnp(&pid, config.command.c_str(), &actions, &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    closeFd(stdinPipe[0]);
    closeFd(stdoutPipe[1]);
    closeFd(stderrPipe[1]);

    if (status != 0)
    {
        closePipes();
        return makeError(ErrorCode::BackendUnreachable,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    _impl->childPid = pid;
    _impl->exitStatus.reset();
    _impl->stdinWrite = std::exchange(stdinPipe[1], -1);
    _impl->stdoutRead = std::exchange(stdoutPipe[0], -1);
    _impl->stderrRead = std::exchange(stderrPipe[0], -1);
    _impl->readBuffer.clear();
    _impl->connected = true;

    _impl->stderrDrain = std::jthread(
        [fd = _impl->stderrRead, label = _impl->label](const std::stop_token& token) {
            Impl::drainStderr(token, fd, label);
        });

    log::info("[{}] Backend process started: {} (pid {})", _impl->label, config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    auto const lock = std::scoped_lock(_impl->writeMutex);
    if (!_impl->connected)
        return makeError(ErrorCode::ConnectionClosed, "Transport not connected");

    auto const data = message.dump() + "\n";
    auto const deadline = std::chrono::steady_clock::now() + WriteTimeout;
    auto written = size_t { 0 };

    while (written < data.size())
    {
        auto pfds = std::array {
            pollfd { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 },
            pollfd { .fd = _impl->wakeRead, .events = POLLIN, .revents = 0 },
        };
        auto const rc = ::poll(pfds.data(), pfds.size(), remainingMs(deadline));
        if (rc < 0 && errno == EINTR)
            continue;
        if (rc == 0)
            return makeError(ErrorCode::Timeout, "Timed out writing to backend stdin");
        if (pfds[1].revents != 0 || !_impl->connected)
            return makeError(ErrorCode::ConnectionClosed, "Transport closed while writing");

        auto const n = ::write(_impl->stdinWrite, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 || rc < 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::ConnectionClosed,
                             std::format("Failed to write to backend stdin: {}", strerror(errno)));
        }
        written += static_cast<size_t>(n);
    }

    log::trace("[{}] >> {}", _impl->label, data.substr(0, data.size() - 1));
    return {};
}

auto StdioTransport::receive(std::chrono::milliseconds timeout) -> Result<nlohmann::json>
{
    auto const lock = std::scoped_lock(_impl->readMutex);
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    auto skipped = 0;

    while (true)
    {
        for (auto pos = _impl->readBuffer.find('\n'); pos != std::string::npos; pos = _impl->readBuffer.find('\n'))
        {
            auto line = _impl->readBuffer.substr(0, pos);
            _impl->readBuffer.erase(0, pos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos)
                continue;

            auto parsed = json::parse(line);
            if (parsed && jsonrpc::isReply(*parsed))
            {
                log::trace("[{}] << {}", _impl->label, line);
                return parsed;
            }

            if (!parsed)
                log::debug("[{}] Skipping non-JSON output: {}", _impl->label, line);
            else if (jsonrpc::isNotification(*parsed))
                log::trace("[{}] Skipping notification {}", _impl->label, parsed->value("method", ""));
            else
                log::debug("[{}] Skipping unexpected message: {}", _impl->label, line);

            if (++skipped > MaxSkippedMessages)
                return makeError(ErrorCode::ProtocolDesync,
                                 std::format("Backend '{}' produced {} lines without a JSON-RPC reply",
                                             _impl->label,
                                             skipped));
        }

        if (!_impl->connected)
            return makeError(ErrorCode::ConnectionClosed, "Transport not connected");

        auto const waitMs = remainingMs(deadline);
        if (waitMs <= 0)
            return makeError(ErrorCode::Timeout,
                             std::format("Timed out after {}ms waiting for '{}'", timeout.count(), _impl->label));

        auto pfds = std::array {
            pollfd { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 },
            pollfd { .fd = _impl->wakeRead, .events = POLLIN, .revents = 0 },
        };
        auto const rc = ::poll(pfds.data(), pfds.size(), waitMs);
        if (rc < 0 && errno == EINTR)
            continue;
        if (rc == 0)
            continue;
        if (pfds[1].revents != 0 || !_impl->connected)
            return makeError(ErrorCode::ConnectionClosed, std::format("Transport to '{}' was closed", _impl->label));

        auto buf = std::array<char, 4096> {};
        auto const n = rc > 0 ? ::read(_impl->stdoutRead, buf.data(), buf.size()) : -1;
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
        {
            _impl->connected = false;
            auto const code = _impl->waitForExit(StdinCloseGrace);
            return makeError(ErrorCode::ConnectionClosed,
                             code ? std::format("Backend '{}' exited with code {}", _impl->label, *code)
                                  : std::format("Backend '{}' closed its output", _impl->label));
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(n));
    }
}

void StdioTransport::close()
{
    _impl->connected = false;
    _impl->wake();

    auto const lock = std::scoped_lock(_impl->readMutex, _impl->writeMutex);
    if (_impl->childPid <= 0 && _impl->stdinWrite < 0)
        return;

    // EOF on stdin gives well-behaved backends the chance to exit on their own.
    closeFd(_impl->stdinWrite);
    _impl->terminate();
    closeFd(_impl->stdoutRead);

    if (_impl->stderrDrain.joinable())
    {
        _impl->stderrDrain.request_stop();
        _impl->stderrDrain.join();
    }
    closeFd(_impl->stderrRead);

    auto const code = _impl->reap(false);
    log::debug("[{}] Backend transport closed (exit code {})",
               _impl->label,
               code ? std::to_string(*code) : std::string("unknown"));

    auto const processLock = std::scoped_lock(_impl->processMutex);
    _impl->childPid = -1;
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::exitCode() -> std::optional<int>
{
    return _impl->reap(false);
}

auto StdioTransport::pid() const -> int
{
    auto const lock = std::scoped_lock(_impl->processMutex);
    return _impl->childPid;
}

} // namespace mcpgate
