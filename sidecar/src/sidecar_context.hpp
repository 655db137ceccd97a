#pragma once

#include "opencode_client.hpp"
#include "retrying_client.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

/**
 * Sidecar 上下文
 * Built once in main before the stdio server starts reading; handlers only
 * read from it afterwards, so it needs no lock.
 */
struct SidecarContext {
    std::string base_url;
    std::optional<int64_t> started_at_ms;   // set only when the service was launched here
    std::string directory;                  // default OpenCode project directory

    std::shared_ptr<sidecar::OpencodeClient> client;

    // `health` command and startup probe; the service may still be booting
    sidecar::RetryPolicy health_probe_policy = sidecar::RetryPolicy::health_probe();
};
