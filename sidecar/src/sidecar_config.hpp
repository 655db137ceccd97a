#pragma once

#include "retrying_client.hpp"
#include "service_launcher.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace sidecar {

inline constexpr const char* kCliPathEnv = "OPENCODE_CLI_PATH";
inline constexpr const char* kDirectoryEnv = "OPENCODE_DIRECTORY";
inline constexpr const char* kFallbackUrl = "http://127.0.0.1:4096";

/**
 * 启动配置
 * Everything main needs, resolved once from argv and the environment.
 */
struct SidecarConfig {
    std::string log_config = "log4cplus.ini";

    LaunchOptions launch;               // binary, hostname, port, timeout
    bool launch_service = true;         // --no-launch talks to fallback_url directly
    bool parent_death_signal = false;

    std::string directory;
    std::string fallback_url = kFallbackUrl;

    std::chrono::milliseconds health_interval{30000};
    long http_timeout_ms = 0;           // 0: no overall limit
    size_t workers = 4;

    RetryPolicy retry = RetryPolicy::standard();
    RetryPolicy probe = RetryPolicy::health_probe();

    bool show_version = false;

    // Logging is not up while flags are parsed; main logs these afterwards.
    std::vector<std::string> warnings;
};

using EnvLookup = std::function<const char*(const char*)>;

/// cwd, or its parent when cwd ends in "/src-tauri".
std::string default_directory(const std::string& cwd);

/// getcwd(), or "." when it fails.
std::string current_directory();

SidecarConfig load_config(int argc, const char* const* argv, const EnvLookup& env, const std::string& cwd);

/// Reads the real process environment and working directory.
SidecarConfig load_config(int argc, const char* const* argv);

} // namespace sidecar
