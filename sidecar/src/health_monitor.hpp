#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace sidecar {

/**
 * Periodic liveness probe of the downstream service.
 *
 * The probe throws on failure; failures are logged and counted but never
 * stop the monitor. The first probe runs one interval after start().
 */
class HealthMonitor {
public:
    using Probe = std::function<void()>;

    explicit HealthMonitor(Probe probe, std::chrono::milliseconds interval = std::chrono::milliseconds(30000));
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    bool start();
    void stop();    // wakes the timer immediately
    bool stop(std::chrono::milliseconds grace); // false if a probe outlasts `grace`

    bool is_running() const { return running_.load(); }
    size_t failure_count() const { return failures_.load(); }
    size_t probe_count() const { return probes_.load(); }

private:
    Probe probe_;
    std::chrono::milliseconds interval_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> failures_{0};
    std::atomic<size_t> probes_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool thread_active_ = false;
    std::thread thread_;

    void run();
};

} // namespace sidecar
