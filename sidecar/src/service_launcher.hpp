#pragma once

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace sidecar {

inline constexpr const char* kPortEnv = "OPENCODE_PORT";
inline constexpr const char* kReadyPrefix = "opencode server listening";

struct LaunchOptions {
    std::string binary = "opencode";
    std::string hostname = "127.0.0.1";
    std::optional<int> port;                     // falls back to $OPENCODE_PORT, then 0
    std::chrono::milliseconds timeout{10000};
    std::string ready_prefix = kReadyPrefix;
    bool parent_death_signal = false;            // child gets SIGTERM when we die
};

/**
 * Splits a child's output stream into lines, '\r' stripped.
 * A partial line that grows past `limit` bytes is discarded up to its
 * newline, so a stream without newlines stays bounded.
 */
class LineBuffer {
public:
    explicit LineBuffer(size_t limit = 64 * 1024) : limit_(limit) {}

    /// Completed lines found after appending `data`.
    std::vector<std::string> append(const char* data, size_t size);

    size_t pending_size() const { return pending_.size(); }

private:
    size_t limit_;
    std::string pending_;
    bool discarding_ = false;
};

class LaunchError : public std::runtime_error {
public:
    enum class Kind { Timeout, Exited, SpawnFailed, BadOutput };

    LaunchError(Kind kind, const std::string& message, std::string output = "", std::optional<int> exit_code = {})
        : std::runtime_error(message), kind_(kind), output_(std::move(output)), exit_code_(exit_code) {}

    Kind kind() const { return kind_; }
    const std::string& output() const { return output_; }
    std::optional<int> exit_code() const { return exit_code_; }

private:
    Kind kind_;
    std::string output_;
    std::optional<int> exit_code_;
};

/**
 * A running service child discovered by launch_service().
 *
 * Keeps draining the child's stdout/stderr so it never blocks on a full
 * pipe. Destruction terminates the child and reaps it.
 */
class ServiceProcess {
public:
    ServiceProcess(pid_t pid, std::string url, int stdout_fd, int stderr_fd, std::string output);
    ~ServiceProcess();

    ServiceProcess(const ServiceProcess&) = delete;
    ServiceProcess& operator=(const ServiceProcess&) = delete;

    const std::string& url() const { return url_; }
    pid_t pid() const { return pid_; }

    /// Sends SIGTERM once; later calls do nothing.
    void terminate();
    bool terminated() const { return terminated_.load(); }

    /// Output seen so far (tail only once it grows large).
    std::string output() const;

private:
    pid_t pid_;
    std::string url_;
    int stdout_fd_;
    int stderr_fd_;

    std::atomic<bool> terminated_{false};
    std::atomic<bool> stop_drain_{false};

    mutable std::mutex output_mutex_;
    std::string output_;
    std::thread drain_thread_;

    void drain_loop();
};

/// Explicit port, else the integer prefix of $OPENCODE_PORT, else 0.
int resolve_port(std::optional<int> explicit_port);

/// URL from "... on http://host:port"; nullopt when the line has none.
std::optional<std::string> extract_listening_url(const std::string& line);

/// Spawns `<binary> serve --hostname=<h> --port=<p>` and waits for the
/// ready line. Throws LaunchError.
std::unique_ptr<ServiceProcess> launch_service(const LaunchOptions& options);

} // namespace sidecar
