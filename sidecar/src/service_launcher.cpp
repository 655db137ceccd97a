#include "service_launcher.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <regex>
#include <vector>

namespace sidecar {

namespace {

constexpr size_t kMaxOutputBytes = 64 * 1024;
constexpr auto kReapGrace = std::chrono::milliseconds(2000);

void append_bounded(std::string& output, const char* data, size_t size) {
    output.append(data, size);
    if (output.size() > kMaxOutputBytes) {
        output.erase(0, output.size() - kMaxOutputBytes);
    }
}

bool is_blank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string with_output(std::string message, const std::string& output) {
    if (!is_blank(output)) {
        message += "\nServer output: " + output;
    }
    return message;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Waits up to `grace` for the child, then SIGKILLs it. Returns the raw status.
int reap_child(pid_t pid, std::chrono::milliseconds grace) {
    int status = 0;
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid || (r < 0 && errno != EINTR)) {
            return status;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    LOG4CPLUS_WARN(launcher_logger(), "service pid " << pid << " ignored SIGTERM, killing");
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return status;
}

int exit_code_from_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::string exit_description(int status) {
    if (WIFSIGNALED(status)) {
        return "signal " + std::to_string(WTERMSIG(status));
    }
    return "code " + std::to_string(exit_code_from_status(status));
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

int resolve_port(std::optional<int> explicit_port) {
    if (explicit_port) {
        return *explicit_port;
    }

    const char* raw = std::getenv(kPortEnv);
    if (!raw || !*raw) {
        return 0;
    }

    char* end = nullptr;
    errno = 0;
    const long candidate = std::strtol(raw, &end, 10);
    if (end == raw || errno == ERANGE || candidate < 0 || candidate > 65535) {
        return 0;
    }
    return static_cast<int>(candidate);
}

std::optional<std::string> extract_listening_url(const std::string& line) {
    static const std::regex pattern(R"(on\s+(https?://[^\s]+))");
    std::smatch match;
    if (!std::regex_search(line, match, pattern)) {
        return std::nullopt;
    }
    return match[1].str();
}

std::vector<std::string> LineBuffer::append(const char* data, size_t size) {
    std::vector<std::string> lines;
    pending_.append(data, size);

    size_t start = 0;
    size_t newline;
    while ((newline = pending_.find('\n', start)) != std::string::npos) {
        if (discarding_) {
            discarding_ = false;
        } else {
            std::string line = pending_.substr(start, newline - start);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines.push_back(std::move(line));
        }
        start = newline + 1;
    }
    pending_.erase(0, start);

    if (pending_.size() > limit_) {
        pending_.clear();
        discarding_ = true;
    }
    return lines;
}

std::unique_ptr<ServiceProcess> launch_service(const LaunchOptions& options) {
    const int port = resolve_port(options.port);

    std::vector<std::string> args = {
        options.binary,
        "serve",
        "--hostname=" + options.hostname,
        "--port=" + std::to_string(port),
    };
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    LOG4CPLUS_INFO(launcher_logger(), "Starting OpenCode server: " << options.binary << " serve --hostname="
                                                                   << options.hostname << " --port=" << port);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0 || ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        const std::string reason = std::strerror(errno);
        for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        throw LaunchError(LaunchError::Kind::SpawnFailed, "pipe failed: " + reason);
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        throw LaunchError(LaunchError::Kind::SpawnFailed, "fork failed: " + reason);
    }

    if (pid == 0) {
        // child: async-signal-safe calls only until exec
#ifdef __linux__
        if (options.parent_death_signal) {
            ::prctl(PR_SET_PDEATHSIG, SIGTERM);
        }
#endif
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t empty;
        sigemptyset(&empty);
        ::sigprocmask(SIG_SETMASK, &empty, nullptr);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        ::execvp(argv[0], argv.data());

        int exec_errno = errno;
        ssize_t ignored = ::write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t exec_read;
    do {
        exec_read = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (exec_read < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (exec_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        throw LaunchError(LaunchError::Kind::SpawnFailed,
                          "Failed to start " + options.binary + ": " + std::strerror(exec_errno));
    }

    LOG4CPLUS_DEBUG(launcher_logger(), "service pid " << pid);

    int stdout_fd = out_pipe[0];
    int stderr_fd = err_pipe[0];
    std::string output;
    LineBuffer stdout_lines(kMaxOutputBytes);
    bool stdout_open = true;
    bool stderr_open = true;

    auto fail = [&](LaunchError::Kind kind, const std::string& message, std::optional<int> exit_code) {
        close_fd(stdout_fd);
        close_fd(stderr_fd);
        throw LaunchError(kind, message, output, exit_code);
    };

    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    char buffer[4096];

    // once reaped, waitpid() on the pid fails with ECHILD, so remember the status
    bool exited = false;
    int status = 0;

    while (true) {
        if (!exited) {
            pid_t waited = ::waitpid(pid, &status, WNOHANG);
            exited = waited == pid;
        }

        auto now = std::chrono::steady_clock::now();
        if (!exited && now >= deadline) {
            ::kill(pid, SIGTERM);
            reap_child(pid, kReapGrace);
            fail(LaunchError::Kind::Timeout,
                 with_output("Timeout waiting for server to start after " + std::to_string(options.timeout.count()) +
                                 "ms",
                             output),
                 std::nullopt);
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (stdout_open) {
            fds[count++] = {stdout_fd, POLLIN, 0};
        }
        if (stderr_open) {
            fds[count++] = {stderr_fd, POLLIN, 0};
        }

        if (count == 0) {
            if (exited) {
                fail(LaunchError::Kind::Exited, with_output("Server exited with " + exit_description(status), output),
                     exit_code_from_status(status));
            }
            // pipes closed but the child lives on; keep waiting for exit or timeout
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }

        // after exit only drain what is already buffered
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        int wait_ms = exited ? 0 : static_cast<int>(std::min<long long>(remaining, 100));

        int ready = ::poll(fds, count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string reason = std::strerror(errno);
            ::kill(pid, SIGTERM);
            reap_child(pid, kReapGrace);
            fail(LaunchError::Kind::SpawnFailed, "poll failed: " + reason, std::nullopt);
        }

        if (ready == 0 && exited) {
            fail(LaunchError::Kind::Exited, with_output("Server exited with " + exit_description(status), output),
                 exit_code_from_status(status));
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }

            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                if (fds[i].fd == stdout_fd) {
                    stdout_open = false;
                } else {
                    stderr_open = false;
                }
                continue;
            }

            append_bounded(output, buffer, static_cast<size_t>(n));
            if (fds[i].fd != stdout_fd) {
                continue;
            }

            for (const auto& line : stdout_lines.append(buffer, static_cast<size_t>(n))) {
                if (!starts_with(line, options.ready_prefix)) {
                    continue;
                }

                auto url = extract_listening_url(line);
                if (!url) {
                    if (!exited) {
                        ::kill(pid, SIGTERM);
                        reap_child(pid, kReapGrace);
                    }
                    fail(LaunchError::Kind::BadOutput, "Failed to parse server url from output: " + line,
                         std::nullopt);
                }
                if (exited) {
                    // ready line arrived from a process that is already gone
                    fail(LaunchError::Kind::Exited,
                         with_output("Server exited with " + exit_description(status), output),
                         exit_code_from_status(status));
                }

                LOG4CPLUS_INFO(launcher_logger(), "OpenCode server listening at " << *url);
                return std::make_unique<ServiceProcess>(pid, *url, stdout_fd, stderr_fd, std::move(output));
            }
        }
    }
}

ServiceProcess::ServiceProcess(pid_t pid, std::string url, int stdout_fd, int stderr_fd, std::string output)
    : pid_(pid),
      url_(std::move(url)),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd),
      output_(std::move(output)) {
    drain_thread_ = std::thread(&ServiceProcess::drain_loop, this);
}

ServiceProcess::~ServiceProcess() {
    terminate();
    stop_drain_ = true;
    if (drain_thread_.joinable()) {
        drain_thread_.join();
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    reap_child(pid_, kReapGrace);
}

void ServiceProcess::terminate() {
    if (terminated_.exchange(true)) {
        return;
    }
    LOG4CPLUS_INFO(launcher_logger(), "Terminating OpenCode server pid " << pid_);
    ::kill(pid_, SIGTERM);
}

std::string ServiceProcess::output() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    return output_;
}

void ServiceProcess::drain_loop() {
    bool stdout_open = stdout_fd_ >= 0;
    bool stderr_open = stderr_fd_ >= 0;
    LineBuffer partial[2] = {LineBuffer(kMaxOutputBytes), LineBuffer(kMaxOutputBytes)};
    char buffer[4096];

    while (!stop_drain_ && (stdout_open || stderr_open)) {
        pollfd fds[2];
        int index[2];
        nfds_t count = 0;
        if (stdout_open) {
            index[count] = 0;
            fds[count++] = {stdout_fd_, POLLIN, 0};
        }
        if (stderr_open) {
            index[count] = 1;
            fds[count++] = {stderr_fd_, POLLIN, 0};
        }

        int ready = ::poll(fds, count, 250);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_ERROR(launcher_logger(), "service output poll failed: " << std::strerror(errno));
            return;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                (index[i] == 0 ? stdout_open : stderr_open) = false;
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(output_mutex_);
                append_bounded(output_, buffer, static_cast<size_t>(n));
            }

            for (const auto& line : partial[index[i]].append(buffer, static_cast<size_t>(n))) {
                LOG4CPLUS_DEBUG(launcher_logger(), (index[i] == 0 ? "[opencode] " : "[opencode:err] ") << line);
            }
        }
    }
}

} // namespace sidecar
