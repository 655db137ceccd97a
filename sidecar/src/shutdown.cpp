#include "shutdown.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace sidecar {

bool orderly_shutdown(const std::function<void()>& terminate_service,
                      HealthMonitor& monitor,
                      StdioServer& server,
                      std::chrono::milliseconds grace) {
    if (terminate_service) {
        terminate_service();
    }

    bool monitor_stopped = monitor.stop(grace);
    bool server_stopped = server.stop(grace);
    if (!monitor_stopped || !server_stopped) {
        LOG4CPLUS_WARN(core_logger(), "Shutdown left work in flight (monitor "
                                          << (monitor_stopped ? "stopped" : "busy") << ", stdio "
                                          << (server_stopped ? "stopped" : "busy") << ")");
        return false;
    }
    return true;
}

} // namespace sidecar
