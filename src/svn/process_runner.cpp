#include <svn_bridge/svn/process_runner.hpp>

#include <svn_bridge/core/log.hpp>
#include <svn_bridge/svn/stderr_classifier.hpp>

#include <array>
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

namespace svn_bridge {

namespace {

constexpr const char* kOperation = "ProcessRunner";
constexpr int kExecFailedExitCode = 127;
constexpr int kPollSliceMs = 50;

using Clock = std::chrono::steady_clock;

Error SystemError(const std::string& what) {
    return Error::Make(kOperation, what + ": " + std::strerror(errno),
                       ErrorCategory::Internal);
}

void ClosePipe(std::array<int, 2>& pipefd) {
    for (int& fd : pipefd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

// Only async-signal-safe calls between fork and exec.
void WriteAll(int fd, const char* data, size_t size) {
    while (size > 0) {
        auto n = ::write(fd, data, size);
        if (n <= 0) return;
        data += n;
        size -= static_cast<size_t>(n);
    }
}

[[noreturn]] void ChildFail(const char* prefix, const char* subject) {
    const char* reason = std::strerror(errno);
    WriteAll(STDERR_FILENO, prefix, std::strlen(prefix));
    WriteAll(STDERR_FILENO, subject, std::strlen(subject));
    WriteAll(STDERR_FILENO, ": ", 2);
    WriteAll(STDERR_FILENO, reason, std::strlen(reason));
    WriteAll(STDERR_FILENO, "\n", 1);
    ::_exit(kExecFailedExitCode);
}

std::vector<std::string> CurrentEnvironment() {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        env.emplace_back(*entry);
    }
    return env;
}

std::vector<char*> ToCharPointers(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

// Read whatever is available; returns false once the pipe reached EOF.
bool DrainOnce(int fd, std::string& sink) {
    std::array<char, 8192> buffer{};
    while (true) {
        auto n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        // EAGAIN: nothing more for now. Anything else: treat as closed.
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

enum class StopReason { None, Timeout, Cancelled };

StopReason CheckStop(const ProcessRunnerOptions& options,
                     const std::optional<Clock::time_point>& deadline) {
    if (options.cancellation.has_value() && options.cancellation->IsCancelled()) {
        return StopReason::Cancelled;
    }
    if (deadline.has_value() && Clock::now() >= *deadline) {
        return StopReason::Timeout;
    }
    return StopReason::None;
}

Error StopError(StopReason reason, const ProcessRunnerOptions& options,
                const std::string& command) {
    if (reason == StopReason::Timeout) {
        return Error::Make(kOperation,
                           "Timed out after " + std::to_string(options.timeout.count()) +
                               " ms: " + command,
                           ErrorCategory::Timeout);
    }
    return Error::Make(kOperation, "Cancelled: " + command,
                       ErrorCategory::Cancelled);
}

void KillAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // anonymous namespace

std::vector<std::string> BuildChildEnvironment(
    const std::vector<std::string>& base,
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    std::map<std::string, size_t> index;

    auto set = [&](const std::string& name, const std::string& value) {
        auto line = name + "=" + value;
        auto it = index.find(name);
        if (it != index.end()) {
            env[it->second] = std::move(line);
        } else {
            index[name] = env.size();
            env.push_back(std::move(line));
        }
    };

    for (const auto& entry : base) {
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        set(entry.substr(0, eq), entry.substr(eq + 1));
    }
    set("LANG", kUtf8Locale);
    set("LC_ALL", kUtf8Locale);
    for (const auto& [name, value] : overrides) {
        set(name, value);
    }
    return env;
}

std::string DescribeCommand(const std::string& executable,
                            const std::vector<std::string>& args) {
    std::string out = executable;
    bool mask_next = false;
    for (const auto& arg : args) {
        out += ' ';
        if (mask_next) {
            out += "****";
            mask_next = false;
            continue;
        }
        if (arg.find(' ') != std::string::npos) {
            out += '"' + arg + '"';
        } else {
            out += arg;
        }
        mask_next = arg == "--password";
    }
    return out;
}

ProcessRunner::ProcessRunner(std::string executable, ProcessRunnerOptions options)
    : executable_(std::move(executable)), options_(std::move(options)) {}

Result<std::string, Error> ProcessRunner::Run(
    const std::vector<std::string>& args,
    const std::optional<std::string>& working_dir) {
    const auto command = DescribeCommand(executable_, args);
    LogDebug("runner", "Running: " + command +
                           (working_dir ? " in " + *working_dir : std::string()));

    // Everything the child needs is prepared before fork().
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(executable_);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    auto argv = ToCharPointers(argv_storage);

    auto env_storage = BuildChildEnvironment(CurrentEnvironment(), options_.environment);
    auto envp = ToCharPointers(env_storage);

    std::array<int, 2> out_pipe{-1, -1};
    std::array<int, 2> err_pipe{-1, -1};
    // O_CLOEXEC keeps these ends out of children forked by concurrent Run calls.
    if (::pipe2(out_pipe.data(), O_CLOEXEC) < 0) {
        return Result<std::string, Error>::Err(SystemError("pipe"));
    }
    if (::pipe2(err_pipe.data(), O_CLOEXEC) < 0) {
        auto error = SystemError("pipe");
        ClosePipe(out_pipe);
        return Result<std::string, Error>::Err(std::move(error));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        auto error = SystemError("fork");
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        return Result<std::string, Error>::Err(std::move(error));
    }

    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ClosePipe(out_pipe);
        ClosePipe(err_pipe);
        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }
        if (working_dir && ::chdir(working_dir->c_str()) != 0) {
            ChildFail("svn-bridge: cannot change directory to ",
                      working_dir->c_str());
        }
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        ChildFail("svn-bridge: cannot execute ", argv[0]);
    }

    ::close(out_pipe[1]);
    out_pipe[1] = -1;
    ::close(err_pipe[1]);
    err_pipe[1] = -1;
    ::fcntl(out_pipe[0], F_SETFL, ::fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, ::fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    std::optional<Clock::time_point> deadline;
    if (options_.timeout.count() > 0) {
        deadline = Clock::now() + options_.timeout;
    }

    std::string stdout_text;
    std::string stderr_text;
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        if (auto reason = CheckStop(options_, deadline); reason != StopReason::None) {
            ClosePipe(out_pipe);
            ClosePipe(err_pipe);
            KillAndReap(pid);
            LogWarn("runner", "Killed: " + command);
            return Result<std::string, Error>::Err(StopError(reason, options_, command));
        }

        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out_open) fds[count++] = pollfd{out_pipe[0], POLLIN, 0};
        if (err_open) fds[count++] = pollfd{err_pipe[0], POLLIN, 0};

        const int ready = ::poll(fds.data(), count, kPollSliceMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            auto error = SystemError("poll");
            ClosePipe(out_pipe);
            ClosePipe(err_pipe);
            KillAndReap(pid);
            return Result<std::string, Error>::Err(std::move(error));
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_pipe[0]) {
                out_open = DrainOnce(out_pipe[0], stdout_text);
            } else {
                err_open = DrainOnce(err_pipe[0], stderr_text);
            }
        }
    }
    ClosePipe(out_pipe);
    ClosePipe(err_pipe);

    // Output is drained; the child may still be exiting.
    int status = 0;
    while (true) {
        const pid_t done = ::waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) {
            return Result<std::string, Error>::Err(SystemError("waitpid"));
        }
        if (auto reason = CheckStop(options_, deadline); reason != StopReason::None) {
            KillAndReap(pid);
            LogWarn("runner", "Killed: " + command);
            return Result<std::string, Error>::Err(StopError(reason, options_, command));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    int exit_code = 0;
    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code = 128 + WTERMSIG(status);
    }
    LogDebug("runner", "Exit code " + std::to_string(exit_code) + ": " + command);

    if (exit_code != 0) {
        auto error = Error::CommandFailed(kOperation, exit_code, std::move(stderr_text));
        ApplyStderrClassification(error);
        return Result<std::string, Error>::Err(std::move(error));
    }
    return Result<std::string, Error>::Ok(std::move(stdout_text));
}

} // namespace svn_bridge
