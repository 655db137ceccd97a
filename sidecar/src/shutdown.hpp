#pragma once

#include "health_monitor.hpp"
#include "stdio_server.hpp"

#include <chrono>
#include <functional>

namespace sidecar {

/**
 * Teardown order for the sidecar process.
 *
 * The managed service is terminated before anything waits on sidecar
 * threads, so a handler blocked on a slow HTTP call cannot keep the
 * service alive. The monitor and the stdio loop then get `grace` each.
 * Returns false when a probe or a handler is still in flight; the caller
 * is expected to exit without joining.
 */
bool orderly_shutdown(const std::function<void()>& terminate_service,
                      HealthMonitor& monitor,
                      StdioServer& server,
                      std::chrono::milliseconds grace);

} // namespace sidecar
