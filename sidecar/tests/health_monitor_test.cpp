#include <gtest/gtest.h>

#include "health_monitor.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using sidecar::HealthMonitor;

namespace {

bool wait_for_probes(const HealthMonitor& monitor, size_t count, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (monitor.probe_count() < count && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return monitor.probe_count() >= count;
}

} // namespace

TEST(HealthMonitor, FailuresAreCountedAndNotFatal) {
    std::atomic<int> calls{0};
    HealthMonitor monitor(
        [&calls] {
            if (++calls % 2 == 1) {
                throw std::runtime_error("connection refused");
            }
        },
        std::chrono::milliseconds(10));

    ASSERT_TRUE(monitor.start());
    ASSERT_TRUE(wait_for_probes(monitor, 4, std::chrono::milliseconds(5000)));
    EXPECT_TRUE(monitor.is_running());

    monitor.stop();
    EXPECT_FALSE(monitor.is_running());
    EXPECT_GE(monitor.failure_count(), 2u);
    EXPECT_LT(monitor.failure_count(), monitor.probe_count());
}

TEST(HealthMonitor, StopWakesTimerImmediately) {
    std::atomic<int> calls{0};
    HealthMonitor monitor([&calls] { ++calls; }, std::chrono::milliseconds(60000));
    ASSERT_TRUE(monitor.start());

    auto begin = std::chrono::steady_clock::now();
    monitor.stop();
    auto elapsed = std::chrono::steady_clock::now() - begin;

    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(monitor.probe_count(), 0u);
}

TEST(HealthMonitor, ProbesDownstreamHealthRoute) {
    auto transport = std::make_shared<FakeTransport>();
    transport->on("GET", "/global/health", json_response(200, {{"healthy", true}}));
    SidecarContext context = make_test_context(transport);
    auto client = context.client;

    HealthMonitor monitor([client] { client->health(sidecar::RetryPolicy::single_attempt()); },
                          std::chrono::milliseconds(10));
    ASSERT_TRUE(monitor.start());
    ASSERT_TRUE(wait_for_probes(monitor, 2, std::chrono::milliseconds(5000)));
    monitor.stop();

    EXPECT_EQ(monitor.failure_count(), 0u);
    EXPECT_GE(transport->count("GET", "/global/health"), 2u);
}

TEST(HealthMonitor, SingleAttemptPerTick) {
    auto transport = std::make_shared<FakeTransport>();
    SidecarContext context = make_test_context(transport);
    auto client = context.client;

    HealthMonitor monitor([client] { client->health(sidecar::RetryPolicy::single_attempt()); },
                          std::chrono::milliseconds(10));
    ASSERT_TRUE(monitor.start());
    ASSERT_TRUE(wait_for_probes(monitor, 3, std::chrono::milliseconds(5000)));
    monitor.stop();

    EXPECT_EQ(monitor.failure_count(), monitor.probe_count());
    EXPECT_EQ(transport->count("GET", "/global/health"), monitor.probe_count());
}

TEST(HealthMonitor, BoundedStopDoesNotWaitOnHungProbe) {
    std::atomic<bool> release{false};
    HealthMonitor monitor(
        [&release] {
            while (!release) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        },
        std::chrono::milliseconds(10));
    ASSERT_TRUE(monitor.start());
    ASSERT_TRUE(wait_for_probes(monitor, 1, std::chrono::milliseconds(5000)));

    EXPECT_FALSE(monitor.stop(std::chrono::milliseconds(50)));

    release = true;
    EXPECT_TRUE(monitor.stop(std::chrono::milliseconds(5000)));
    EXPECT_FALSE(monitor.is_running());
}
