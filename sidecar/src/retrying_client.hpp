#pragma once

#include "protocol.hpp"

#include <chrono>
#include <functional>
#include <string>

namespace sidecar {

struct RetryPolicy {
    int max_retries = 3;                        // attempts beyond the first
    std::chrono::milliseconds delay{1000};      // before the first retry
    double backoff_multiplier = 2.0;            // applied per retry

    static RetryPolicy standard() { return {}; }
    static RetryPolicy health_probe() { return {9, std::chrono::milliseconds(250), 1.0}; }
    static RetryPolicy single_attempt() { return {0, std::chrono::milliseconds(0), 1.0}; }

    /// Delay slept after failed attempt `attempt` (0-based).
    std::chrono::milliseconds delay_for(int attempt) const;
};

/**
 * Unwraps a `{data}` / `{error}` envelope.
 *
 * A truthy `error` becomes a DownstreamError whose message is
 * error.data.message, else error.name, else the serialized error.
 * A present `data` is returned bare; anything else is returned unchanged.
 */
Json unwrap_envelope(const Json& envelope);

class RetryingClient {
public:
    using Attempt = std::function<Json()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit RetryingClient(RetryPolicy policy = RetryPolicy::standard(), Sleeper sleeper = {});

    /// Runs `attempt` and unwraps its envelope, retrying any exception.
    /// Rethrows the last failure once the policy is exhausted.
    Json call(const std::string& operation, const Attempt& attempt) const;
    Json call(const std::string& operation, const Attempt& attempt, const RetryPolicy& policy) const;

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
};

} // namespace sidecar
