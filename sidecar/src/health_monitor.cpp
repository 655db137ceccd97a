#include "health_monitor.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <exception>

namespace sidecar {

HealthMonitor::HealthMonitor(Probe probe, std::chrono::milliseconds interval)
    : probe_(std::move(probe)), interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(30000)) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

bool HealthMonitor::start() {
    if (running_) {
        return true;
    }
    if (!probe_) {
        LOG4CPLUS_ERROR(core_logger(), "health monitor: no probe");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        thread_active_ = true;
    }
    running_ = true;
    thread_ = std::thread(&HealthMonitor::run, this);

    LOG4CPLUS_INFO(core_logger(), "Health monitor started, interval " << interval_.count() << "ms");
    return true;
}

void HealthMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
}

bool HealthMonitor::stop(std::chrono::milliseconds grace) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        stop_requested_ = true;
        cv_.notify_all();
        if (!cv_.wait_for(lock, grace, [this] { return !thread_active_; })) {
            LOG4CPLUS_WARN(core_logger(), "Health probe still running after " << grace.count() << "ms");
            return false;
        }
    }
    stop();
    return true;
}

void HealthMonitor::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
                break;
            }
        }

        ++probes_;
        try {
            probe_();
            LOG4CPLUS_DEBUG(core_logger(), "Health check passed");
        } catch (const std::exception& e) {
            size_t failures = ++failures_;
            LOG4CPLUS_WARN(core_logger(), "Health check failed (" << failures << " so far): " << e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        thread_active_ = false;
    }
    cv_.notify_all();
}

} // namespace sidecar
