// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <optional>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace mcpagent
{

namespace
{

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    /// @brief A dead child must surface as a write error, not terminate us.
    void ignoreSigpipeOnce()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] {
            ::signal(SIGPIPE, SIG_IGN);
            log::debug("SIGPIPE ignored for stdio transports");
        });
    }

    /// @brief Polls waitpid() until the child exited or the deadline passed.
    /// @return True if the child has been reaped.
    auto waitForExit(pid_t pid, std::chrono::milliseconds timeout) -> bool
    {
        auto const deadline = std::chrono::steady_clock::now() + timeout;
        while (true)
        {
            int status = 0;
            auto const rc = ::waitpid(pid, &status, WNOHANG);
            if (rc == pid || (rc < 0 && errno == ECHILD))
                return true;
            if (std::chrono::steady_clock::now() >= deadline)
                return false;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

} // namespace

struct StdioTransport::Impl
{
    StdioTransportConfig config;
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    std::array<int, 2> wakePipe { -1, -1 };
    std::atomic<bool> connected = false;
    std::string readBuffer;

    ~Impl()
    {
        closeFd(wakePipe[0]);
        closeFd(wakePipe[1]);
    }

    /// @brief Takes the next complete line out of the read buffer, if there is one.
    auto takeLine() -> std::optional<std::string>
    {
        auto const newlinePos = readBuffer.find('\n');
        if (newlinePos == std::string::npos)
            return std::nullopt;

        auto line = readBuffer.substr(0, newlinePos);
        readBuffer.erase(0, newlinePos + 1);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        return line;
    }
};

StdioTransport::StdioTransport(StdioTransportConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

StdioTransport::~StdioTransport()
{
    close();
}

auto StdioTransport::start() -> VoidResult
{
    if (_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    auto const& config = _impl->config;

    if (config.command.empty())
        return makeError(ErrorCode::TransportError, "No command configured");

    if (!config.workingDirectory.empty())
    {
        auto ec = std::error_code {};
        if (!std::filesystem::is_directory(config.workingDirectory, ec))
            return makeError(ErrorCode::TransportError,
                             std::format("Server path not found: {}", config.workingDirectory.string()));
    }

    ignoreSigpipeOnce();

    if (_impl->wakePipe[0] < 0)
    {
        if (::pipe2(_impl->wakePipe.data(), O_CLOEXEC | O_NONBLOCK) != 0)
            return makeError(ErrorCode::TransportError, "Failed to create wake-up pipe");
    }

    int stdinPipe[2];
    int stdoutPipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }

    // dup2 clears O_CLOEXEC on the child's ends; all other pipe ends vanish on exec.
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    if (!config.workingDirectory.empty())
        posix_spawn_file_actions_addchdir_np(&actions, config.workingDirectory.c_str());

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!config.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    // send() waits for POLLOUT with a deadline instead of blocking in write().
    if (::fcntl(stdinPipe[1], F_SETFL, ::fcntl(stdinPipe[1], F_GETFL) | O_NONBLOCK) != 0)
        log::warning("Failed to make stdin pipe of {} non-blocking: {}", config.command, strerror(errno));

    _impl->childPid = pid;
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->readBuffer.clear();
    _impl->connected = true;

    log::info("Tool server started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto const data = message.dump() + "\n";
    auto const deadline = std::chrono::steady_clock::now() + _impl->config.writeTimeout;

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const written = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (written >= 0)
        {
            offset += static_cast<size_t>(written);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK)
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", strerror(errno)));

        auto const remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds::zero())
        {
            // A partially written line leaves the stream unusable.
            _impl->connected = false;
            return makeError(ErrorCode::TransportError,
                             std::format("Timed out writing to process stdin after {} ms",
                                         _impl->config.writeTimeout.count()));
        }

        auto fd = pollfd { .fd = _impl->stdinWrite, .events = POLLOUT, .revents = 0 };
        if (::poll(&fd, 1, static_cast<int>(remaining.count())) < 0 && errno != EINTR)
            return makeError(ErrorCode::TransportError, std::format("poll() failed: {}", strerror(errno)));
    }

    return {};
}

auto StdioTransport::receiveLine() -> Result<std::string>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    while (true)
    {
        if (auto line = _impl->takeLine())
            return std::move(*line);

        auto fds = std::array<pollfd, 2> { {
            { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 },
            { .fd = _impl->wakePipe[0], .events = POLLIN, .revents = 0 },
        } };

        if (::poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno == EINTR)
                continue;
            return makeError(ErrorCode::TransportError, std::format("poll() failed: {}", strerror(errno)));
        }

        if (fds[1].revents & POLLIN)
        {
            auto drain = std::array<char, 64> {};
            while (::read(_impl->wakePipe[0], drain.data(), drain.size()) > 0)
                ;
            return makeError(ErrorCode::TransportError, "Receive interrupted");
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR))
        {
            auto buf = std::array<char, 4096> {};
            auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
            if (bytesRead < 0 && errno == EINTR)
                continue;
            if (bytesRead <= 0)
            {
                _impl->connected = false;
                return makeError(ErrorCode::TransportError, "Process stdout closed");
            }
            _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
        }
    }
}

void StdioTransport::interrupt()
{
    if (_impl->wakePipe[1] < 0)
        return;

    auto const byte = char { 1 };
    if (::write(_impl->wakePipe[1], &byte, 1) < 0 && errno != EAGAIN)
        log::debug("Failed to signal stdio transport: {}", strerror(errno));
}

void StdioTransport::close()
{
    if (_impl->childPid < 0 && _impl->stdinWrite < 0 && _impl->stdoutRead < 0)
        return;

    _impl->connected = false;

    closeFd(_impl->stdinWrite);
    closeFd(_impl->stdoutRead);

    if (_impl->childPid > 0)
    {
        ::kill(_impl->childPid, SIGTERM);
        if (!waitForExit(_impl->childPid, _impl->config.shutdownGrace))
        {
            log::debug("Tool server {} ignored SIGTERM, killing it", _impl->childPid);
            ::kill(_impl->childPid, SIGKILL);
            int status;
            ::waitpid(_impl->childPid, &status, 0);
        }
        _impl->childPid = -1;
    }

    log::debug("Stdio transport closed: {}", _impl->config.command);
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::config() const -> const StdioTransportConfig&
{
    return _impl->config;
}

} // namespace mcpagent
