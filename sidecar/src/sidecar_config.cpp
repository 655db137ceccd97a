#include "sidecar_config.hpp"

#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

namespace sidecar {

namespace {

constexpr const char* kTauriSuffix = "/src-tauri";

bool parse_long(const char* text, long& out) {
    if (!text || !*text) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text, &end, 10);
    if (errno == ERANGE || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

bool parse_double(const char* text, double& out) {
    if (!text || !*text) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text, &end);
    if (errno == ERANGE || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

// Matches "--name=value"; returns the value or nullptr.
const char* flag_value(const char* arg, const char* name) {
    const size_t len = std::strlen(name);
    if (std::strncmp(arg, name, len) == 0 && arg[len] == '=') {
        return arg + len + 1;
    }
    return nullptr;
}

void warn_invalid(SidecarConfig& config, const char* name, const char* value) {
    config.warnings.push_back(std::string("Ignoring invalid value for ") + name + ": '" + value + "'");
}

// Non-negative integer flag; anything else keeps the default.
template <typename Apply>
void numeric_flag(SidecarConfig& config, const char* name, const char* value, long min, Apply apply) {
    long parsed = 0;
    if (!parse_long(value, parsed) || parsed < min) {
        warn_invalid(config, name, value);
        return;
    }
    apply(parsed);
}

} // namespace

std::string default_directory(const std::string& cwd) {
    const size_t suffix_len = std::strlen(kTauriSuffix);
    if (cwd.size() >= suffix_len && cwd.compare(cwd.size() - suffix_len, suffix_len, kTauriSuffix) == 0) {
        std::string parent = cwd.substr(0, cwd.size() - suffix_len);
        return parent.empty() ? "/" : parent;
    }
    return cwd;
}

std::string current_directory() {
    char buffer[PATH_MAX];
    if (::getcwd(buffer, sizeof(buffer)) == nullptr) {
        return ".";
    }
    return buffer;
}

SidecarConfig load_config(int argc, const char* const* argv, const EnvLookup& env, const std::string& cwd) {
    SidecarConfig config;

    auto lookup = [&env](const char* name) -> const char* {
        const char* value = env ? env(name) : nullptr;
        return (value && *value) ? value : nullptr;
    };

    if (const char* binary = lookup(kCliPathEnv)) {
        config.launch.binary = binary;
    }
    if (const char* directory = lookup(kDirectoryEnv)) {
        config.directory = directory;
    } else {
        config.directory = default_directory(cwd);
    }

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* value = nullptr;

        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--version") == 0) {
            config.show_version = true;
            continue;
        }

        if (std::strcmp(arg, "--pdeathsig") == 0) {
            config.parent_death_signal = true;
            config.launch.parent_death_signal = true;
            continue;
        }

        if (std::strcmp(arg, "--no-launch") == 0) {
            config.launch_service = false;
            continue;
        }

        if (std::strcmp(arg, "--config") == 0 && i + 1 < argc) {
            config.log_config = argv[++i];
            continue;
        }

        if ((value = flag_value(arg, "--config"))) {
            config.log_config = value;
            continue;
        }

        if ((value = flag_value(arg, "--binary"))) {
            if (*value) {
                config.launch.binary = value;
            }
            continue;
        }

        if ((value = flag_value(arg, "--hostname"))) {
            if (*value) {
                config.launch.hostname = value;
            }
            continue;
        }

        if ((value = flag_value(arg, "--directory"))) {
            if (*value) {
                config.directory = value;
            }
            continue;
        }

        if ((value = flag_value(arg, "--fallback-url"))) {
            if (*value) {
                config.fallback_url = value;
            }
            continue;
        }

        if ((value = flag_value(arg, "--port"))) {
            numeric_flag(config, "--port", value, 0, [&](long v) {
                if (v > 65535) {
                    warn_invalid(config, "--port", value);
                    return;
                }
                config.launch.port = static_cast<int>(v);
            });
            continue;
        }

        if ((value = flag_value(arg, "--timeout-ms"))) {
            numeric_flag(config, "--timeout-ms", value, 1,
                         [&](long v) { config.launch.timeout = std::chrono::milliseconds(v); });
            continue;
        }

        if ((value = flag_value(arg, "--health-interval-ms"))) {
            numeric_flag(config, "--health-interval-ms", value, 1,
                         [&](long v) { config.health_interval = std::chrono::milliseconds(v); });
            continue;
        }

        if ((value = flag_value(arg, "--http-timeout-ms"))) {
            numeric_flag(config, "--http-timeout-ms", value, 0, [&](long v) { config.http_timeout_ms = v; });
            continue;
        }

        if ((value = flag_value(arg, "--workers"))) {
            numeric_flag(config, "--workers", value, 1, [&](long v) { config.workers = static_cast<size_t>(v); });
            continue;
        }

        if ((value = flag_value(arg, "--retries"))) {
            numeric_flag(config, "--retries", value, 0,
                         [&](long v) { config.retry.max_retries = static_cast<int>(v); });
            continue;
        }

        if ((value = flag_value(arg, "--retry-delay-ms"))) {
            numeric_flag(config, "--retry-delay-ms", value, 0,
                         [&](long v) { config.retry.delay = std::chrono::milliseconds(v); });
            continue;
        }

        if ((value = flag_value(arg, "--retry-backoff"))) {
            double backoff = 0;
            if (!parse_double(value, backoff) || backoff < 1.0) {
                warn_invalid(config, "--retry-backoff", value);
            } else {
                config.retry.backoff_multiplier = backoff;
            }
            continue;
        }

        if ((value = flag_value(arg, "--probe-retries"))) {
            numeric_flag(config, "--probe-retries", value, 0,
                         [&](long v) { config.probe.max_retries = static_cast<int>(v); });
            continue;
        }

        if ((value = flag_value(arg, "--probe-delay-ms"))) {
            numeric_flag(config, "--probe-delay-ms", value, 0,
                         [&](long v) { config.probe.delay = std::chrono::milliseconds(v); });
            continue;
        }

        config.warnings.push_back(std::string("Ignoring unknown argument: ") + arg);
    }

    return config;
}

SidecarConfig load_config(int argc, const char* const* argv) {
    return load_config(argc, argv, [](const char* name) { return static_cast<const char*>(std::getenv(name)); },
                       current_directory());
}

} // namespace sidecar
