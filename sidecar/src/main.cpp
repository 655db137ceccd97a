#include "command/command.hpp"
#include "health_monitor.hpp"
#include "logger.hpp"
#include "net/http_transport.hpp"
#include "opencode_client.hpp"
#include "payload_normalizer.hpp"
#include "service_launcher.hpp"
#include "shutdown.hpp"
#include "sidecar_config.hpp"
#include "sidecar_context.hpp"
#include "stdio_server.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

// per component, covers the reader's 1s poll
constexpr std::chrono::milliseconds kShutdownGrace(2000);

void on_stop_signal(int signo) {
    g_stop_signal = signo;
}

void install_signal_handlers() {
    struct sigaction action {};
    action.sa_handler = on_stop_signal;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGTERM, &action, nullptr);
    ::sigaction(SIGINT, &action, nullptr);

    // a closed stdout must surface as EPIPE, not kill the process
    ::signal(SIGPIPE, SIG_IGN);
}

} // namespace

int main(int argc, char** argv) {
    log4cplus::Initializer log_initializer;

    sidecar::SidecarConfig config = sidecar::load_config(argc, argv);

    if (config.show_version) {
        std::cout << "Version: " << SIDECAR_VERSION_STRING << std::endl;
        std::cout << "Commit: " << SIDECAR_GIT_VERSION_STRING << std::endl;
        std::cout << "Build Time: " << SIDECAR_BUILD_TIMESTAMP << std::endl;
        return 0;
    }

#ifdef __linux__
    if (config.parent_death_signal) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    init_logging(config.log_config);
    install_signal_handlers();

    LOG4CPLUS_INFO(core_logger(), "opencode_sidecar starting");
    LOG4CPLUS_INFO(core_logger(), "Version: " << SIDECAR_VERSION_STRING << ", Commit: " << SIDECAR_GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << SIDECAR_BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Directory: " << config.directory);
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (config.parent_death_signal ? "enabled" : "disabled"));
    for (const auto& warning : config.warnings) {
        LOG4CPLUS_WARN(core_logger(), warning);
    }

    SidecarContext context;
    context.directory = config.directory;
    context.health_probe_policy = config.probe;

    std::unique_ptr<sidecar::ServiceProcess> service;
    if (config.launch_service) {
        try {
            service = sidecar::launch_service(config.launch);
            context.base_url = service->url();
            context.started_at_ms = sidecar::payload::now_epoch_ms();
        } catch (const sidecar::LaunchError& exc) {
            LOG4CPLUS_ERROR(core_logger(), "Failed to start OpenCode server: " << exc.what());
            LOG4CPLUS_WARN(core_logger(), "Falling back to " << config.fallback_url);
            context.base_url = config.fallback_url;
        }
    } else {
        LOG4CPLUS_INFO(core_logger(), "Launch disabled, using " << config.fallback_url);
        context.base_url = config.fallback_url;
    }

    sidecar::net::CurlGlobal curl_global;
    auto transport = std::make_shared<sidecar::net::CurlTransport>(config.http_timeout_ms);
    context.client = std::make_shared<sidecar::OpencodeClient>(transport, context.base_url, context.directory,
                                                               sidecar::RetryingClient(config.retry));

    try {
        sidecar::Json health = context.client->health(context.health_probe_policy);
        LOG4CPLUS_INFO(core_logger(), "OpenCode server healthy at " << context.base_url << ": " << health.dump());
    } catch (const std::exception& exc) {
        LOG4CPLUS_WARN(core_logger(), "OpenCode server not healthy at " << context.base_url << ": " << exc.what());
    }

    sidecar::commands::CommandDispatcher dispatcher(context);
    sidecar::StdioServer server(
        STDIN_FILENO, STDOUT_FILENO, [&dispatcher](const std::string& line) { return dispatcher.handle_line(line); },
        config.workers);

    if (!server.start()) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to start stdio server");
        return 1;
    }

    LOG4CPLUS_INFO(core_logger(), "Sidecar ready, serving " << context.base_url);

    auto client = context.client;
    sidecar::HealthMonitor monitor(
        [client] { client->health(sidecar::RetryPolicy::single_attempt()); }, config.health_interval);
    monitor.start();

    while (!g_stop_signal && server.is_running()) {
        ::sleep(1);
    }

    if (g_stop_signal) {
        LOG4CPLUS_INFO(core_logger(), "Received signal " << g_stop_signal << ", shutting down");
    } else {
        LOG4CPLUS_INFO(core_logger(), "Input closed, shutting down");
    }

    bool clean = sidecar::orderly_shutdown(
        [&service] {
            if (service) {
                service->terminate();
            }
        },
        monitor, server, kShutdownGrace);
    if (!clean) {
        // handlers blocked in HTTP calls would keep the process alive
        LOG4CPLUS_WARN(core_logger(), "Exiting with requests in flight");
        ::_exit(0);
    }

    LOG4CPLUS_INFO(core_logger(), "Health checks: " << monitor.probe_count() << ", failures: " << monitor.failure_count());
    return 0;
}
