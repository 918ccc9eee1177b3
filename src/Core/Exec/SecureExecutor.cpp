/**
 * @file SecureExecutor.cpp
 * @brief Subprocess spawning, draining and reaping
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/SecureExecutor.hpp>
#include <Warden/Core/ErrorHandler.hpp>
#include <Warden/Core/Logger.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace Warden::Exec {

namespace {

constexpr size_t kReadChunk = 64 * 1024;
constexpr Milliseconds kReapInterval{10};

// ============================================================================
// RAII Guards
// ============================================================================

/// Owns a file descriptor
class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : m_fd(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : m_fd(other.m_fd) { other.m_fd = -1; }
    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset();
            m_fd = other.m_fd;
            other.m_fd = -1;
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return m_fd; }
    [[nodiscard]] bool valid() const noexcept { return m_fd >= 0; }

    void reset() noexcept {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

private:
    int m_fd = -1;
};

struct Pipe {
    FileDescriptor readEnd;
    FileDescriptor writeEnd;
};

Result<Pipe> makePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return makeError(ErrorCode::PipeFailed, std::strerror(errno));
    }
    Pipe pipe;
    pipe.readEnd = FileDescriptor(fds[0]);
    pipe.writeEnd = FileDescriptor(fds[1]);
    return pipe;
}

/// Kills and reaps the process group unless released
class ChildGuard {
public:
    explicit ChildGuard(pid_t pid) : m_pid(pid) {}

    ~ChildGuard() {
        if (m_pid > 0) {
            ::killpg(m_pid, SIGKILL);
            int status = 0;
            while (::waitpid(m_pid, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }

    ChildGuard(const ChildGuard&) = delete;
    ChildGuard& operator=(const ChildGuard&) = delete;

    void release() noexcept { m_pid = -1; }

private:
    pid_t m_pid;
};

// ============================================================================
// Helpers
// ============================================================================

std::string trimmed(const std::string& value) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), isSpace);
    auto end = std::find_if_not(value.rbegin(), value.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

/// Parent environment minus the stripped names, NODE_ENV defaulted
std::vector<std::string> buildEnvironment(const std::vector<std::string>& stripped) {
    std::vector<std::string> env;
    bool hasNodeEnv = false;

    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view line(*entry);
        std::string_view name = line.substr(0, line.find('='));

        if (std::find(stripped.begin(), stripped.end(), name) != stripped.end()) {
            continue;
        }
        if (name == "NODE_ENV") {
            if (line.size() <= name.size() + 1) {
                continue;
            }
            hasNodeEnv = true;
        }
        env.emplace_back(line);
    }

    if (!hasNodeEnv) {
        env.emplace_back("NODE_ENV=production");
    }
    return env;
}

std::vector<char*> toArgv(std::vector<std::string>& strings) {
    std::vector<char*> argv;
    argv.reserve(strings.size() + 1);
    for (auto& s : strings) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);
    return argv;
}

/// Runs in the forked child; only async-signal-safe calls
[[noreturn]] void execChild(int stdoutFd, int stderrFd, int statusFd,
                            const char* cwd, char* const* argv, char* const* envp) {
    ::setpgid(0, 0);

    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull < 0 || ::dup2(devNull, STDIN_FILENO) < 0 ||
        ::dup2(stdoutFd, STDOUT_FILENO) < 0 || ::dup2(stderrFd, STDERR_FILENO) < 0) {
        int err = errno;
        (void)!::write(statusFd, &err, sizeof(err));
        ::_exit(127);
    }

    if (cwd != nullptr && ::chdir(cwd) != 0) {
        int err = errno;
        (void)!::write(statusFd, &err, sizeof(err));
        ::_exit(127);
    }

    ::execvpe(argv[0], argv, envp);

    int err = errno;
    (void)!::write(statusFd, &err, sizeof(err));
    ::_exit(127);
}

} // anonymous namespace

// ============================================================================
// SecureExecutor
// ============================================================================

SecureExecutor::SecureExecutor(ExecutorConfig config,
                               const Security::InputValidator& validator,
                               Security::SecurityEventLog& events)
    : m_config(std::move(config))
    , m_validator(validator)
    , m_events(events) {}

bool SecureExecutor::isCommandAllowed(std::string_view command) const {
    return std::find(m_config.allowedCommands.begin(), m_config.allowedCommands.end(),
                     command) != m_config.allowedCommands.end();
}

Result<ExecResult> SecureExecutor::execute(std::string_view command,
                                           const std::vector<std::string>& args,
                                           const ExecOptions& options) const {
    const std::string name = trimmed(std::string(command));

    if (name.empty()) {
        return makeError(ErrorCode::EmptyInput, "Command must be a non-empty string", "command");
    }

    if (!isCommandAllowed(name)) {
        m_events.logEvent(Security::EventType::PolicyViolation,
                          {{"reason", "command not allowed"}, {"command", name}});
        return makeError(ErrorCode::CommandNotAllowed, "Command not allowed", "command", name);
    }

    auto sanitized = m_validator.sanitizeCommandArgs(args);
    if (sanitized.isFailure()) {
        if (sanitized.error() == ErrorCode::DangerousPattern) {
            m_events.logEvent(Security::EventType::CommandInjection,
                              {{"command", name}, {"field", "commandArgs"}});
        }
        return sanitized.errorInfo();
    }

    return run(name, sanitized.value(), options);
}

Result<ExecResult> SecureExecutor::run(const std::string& command,
                                       const std::vector<Security::CommandArg>& args,
                                       const ExecOptions& options) const {
    const Milliseconds timeout = options.timeout.value_or(m_config.defaultTimeout);

    // Everything the child touches is prepared before fork
    std::vector<std::string> argStrings;
    argStrings.reserve(args.size() + 1);
    argStrings.push_back(command);
    for (const auto& arg : args) {
        argStrings.push_back(arg.str());
    }
    std::vector<std::string> envStrings = buildEnvironment(m_config.strippedEnv);
    std::vector<char*> argv = toArgv(argStrings);
    std::vector<char*> envp = toArgv(envStrings);
    const std::string cwd = options.cwd.string();

    Pipe outPipe;
    Pipe errPipe;
    Pipe statusPipe;
    WARDEN_TRY_ASSIGN(outPipe, makePipe());
    WARDEN_TRY_ASSIGN(errPipe, makePipe());
    WARDEN_TRY_ASSIGN(statusPipe, makePipe());

    WARDEN_LOG_DEBUG_F("Spawning %s with %zu argument(s), timeout %lld ms",
                       command.c_str(), args.size(),
                       static_cast<long long>(timeout.count()));

    pid_t pid = ::fork();
    if (pid < 0) {
        return makeError(ErrorCode::SpawnFailed, std::strerror(errno));
    }
    if (pid == 0) {
        execChild(outPipe.writeEnd.get(), errPipe.writeEnd.get(), statusPipe.writeEnd.get(),
                  cwd.empty() ? nullptr : cwd.c_str(), argv.data(), envp.data());
    }

    ChildGuard guard(pid);
    outPipe.writeEnd.reset();
    errPipe.writeEnd.reset();
    statusPipe.writeEnd.reset();

    // EOF means exec succeeded and closed the close-on-exec status pipe
    int childErrno = 0;
    ssize_t statusBytes;
    do {
        statusBytes = ::read(statusPipe.readEnd.get(), &childErrno, sizeof(childErrno));
    } while (statusBytes < 0 && errno == EINTR);

    if (statusBytes == static_cast<ssize_t>(sizeof(childErrno))) {
        WARDEN_LOG_WARNING_F("Failed to start %s: %s", command.c_str(), std::strerror(childErrno));
        return makeError(ErrorCode::SpawnFailed,
                         std::string("Command execution failed: ") + std::strerror(childErrno));
    }

    const TimePoint deadline = Clock::now() + timeout;
    TimePoint killAt{};
    bool timedOut = false;
    bool killSent = false;
    bool tooLarge = false;

    auto checkDeadlines = [&](TimePoint now) {
        if (!timedOut && now >= deadline) {
            timedOut = true;
            killAt = now + m_config.killGrace;
            ::killpg(pid, SIGTERM);
        }
        if (timedOut && !killSent && now >= killAt) {
            killSent = true;
            ::killpg(pid, SIGKILL);
        }
    };

    auto nextWakeup = [&](TimePoint now) -> int {
        TimePoint next = timedOut ? killAt : deadline;
        if (killSent) {
            return 100;
        }
        auto remaining = std::chrono::duration_cast<Milliseconds>(next - now).count();
        return static_cast<int>(std::clamp<long long>(remaining + 1, 0, 100));
    };

    std::string out;
    std::string err;
    size_t total = 0;
    char buffer[kReadChunk];

    FileDescriptor* streams[2] = {&outPipe.readEnd, &errPipe.readEnd};
    std::string* sinks[2] = {&out, &err};

    while (!tooLarge && (streams[0]->valid() || streams[1]->valid())) {
        checkDeadlines(Clock::now());
        if (killSent) {
            // The group is gone; a writer still holding a pipe left the group
            streams[0]->reset();
            streams[1]->reset();
            break;
        }

        pollfd fds[2];
        nfds_t count = 0;
        int slot[2];
        for (int i = 0; i < 2; ++i) {
            if (streams[i]->valid()) {
                fds[count].fd = streams[i]->get();
                fds[count].events = POLLIN;
                fds[count].revents = 0;
                slot[count] = i;
                ++count;
            }
        }

        int ready = ::poll(fds, count, nextWakeup(Clock::now()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return makeError(ErrorCode::ProcessError, std::strerror(errno));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            const int index = slot[i];
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            if (n <= 0) {
                streams[index]->reset();
                continue;
            }

            total += static_cast<size_t>(n);
            if (total > m_config.maxOutputBytes) {
                tooLarge = true;
                ::killpg(pid, SIGKILL);
                killSent = true;
                break;
            }
            sinks[index]->append(buffer, static_cast<size_t>(n));
        }
    }

    // Pipes are closed (or abandoned); wait for the child under the same deadlines
    int status = 0;
    for (;;) {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            guard.release();
            return makeError(ErrorCode::ProcessError, std::strerror(errno));
        }
        checkDeadlines(Clock::now());
        std::this_thread::sleep_for(kReapInterval);
    }
    guard.release();

    if (tooLarge) {
        WARDEN_LOG_WARNING_F("%s exceeded the output cap of %zu bytes",
                             command.c_str(), m_config.maxOutputBytes);
        return makeError(ErrorCode::OutputTooLarge,
                         "Command output too large (max " +
                             std::to_string(m_config.maxOutputBytes) + " bytes)");
    }

    if (timedOut) {
        WARDEN_LOG_WARNING_F("%s timed out after %lld ms",
                             command.c_str(), static_cast<long long>(timeout.count()));
        return makeError(ErrorCode::Timeout,
                         "Command timed out after " + std::to_string(timeout.count()) + "ms");
    }

    if (WIFSIGNALED(status)) {
        return makeError(ErrorCode::KilledBySignal,
                         "Command killed with signal: " + std::to_string(WTERMSIG(status)));
    }

    ExecResult result;
    result.stdOut = trimmed(out);
    result.stdErr = trimmed(err);
    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : 0;
    return result;
}

} // namespace Warden::Exec
