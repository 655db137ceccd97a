#include "retrying_client.hpp"

#include "errors.hpp"
#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cmath>
#include <exception>
#include <thread>

namespace sidecar {

namespace {

// one hour; also keeps the double -> integer conversion defined
constexpr double kMaxDelayMs = 3600.0 * 1000.0;

} // namespace

std::chrono::milliseconds RetryPolicy::delay_for(int attempt) const {
    double scaled = static_cast<double>(delay.count()) * std::pow(backoff_multiplier, attempt);
    if (!(scaled < kMaxDelayMs)) { // also catches inf and NaN
        scaled = kMaxDelayMs;
    } else if (scaled < 0) {
        scaled = 0;
    }
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(scaled));
}

Json unwrap_envelope(const Json& envelope) {
    if (!envelope.is_object()) {
        return envelope;
    }

    if (auto error = codec::find_key(envelope, "error")) {
        if (codec::is_truthy(*error)) {
            std::string details;
            if (auto data = codec::find_key(*error, "data")) {
                if (auto message = codec::find_key(*data, "message")) {
                    if (codec::is_truthy(*message)) {
                        details = codec::as_string(*message, message->dump());
                    }
                }
            }
            if (details.empty()) {
                if (auto name = codec::find_key(*error, "name")) {
                    if (codec::is_truthy(*name)) {
                        details = codec::as_string(*name, name->dump());
                    }
                }
            }
            if (details.empty()) {
                details = error->dump(-1, ' ', false, Json::error_handler_t::replace);
            }
            if (details.empty()) {
                details = "OpenCode request failed";
            }
            throw DownstreamError(details);
        }
    }

    if (auto data = codec::find_key(envelope, "data")) {
        return *data;
    }
    return envelope;
}

RetryingClient::RetryingClient(RetryPolicy policy, Sleeper sleeper)
    : policy_(policy), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

Json RetryingClient::call(const std::string& operation, const Attempt& attempt) const {
    return call(operation, attempt, policy_);
}

Json RetryingClient::call(const std::string& operation, const Attempt& attempt, const RetryPolicy& policy) const {
    const int max_retries = policy.max_retries > 0 ? policy.max_retries : 0;
    std::exception_ptr last_error;

    for (int i = 0; i <= max_retries; ++i) {
        try {
            return unwrap_envelope(attempt());
        } catch (const std::exception& exc) {
            last_error = std::current_exception();
            if (i < max_retries) {
                auto delay = policy.delay_for(i);
                LOG4CPLUS_DEBUG(client_logger(), operation << " attempt " << (i + 1) << "/" << (max_retries + 1)
                                                           << " failed: " << exc.what() << ", retrying in "
                                                           << delay.count() << "ms");
                sleeper_(delay);
            } else {
                LOG4CPLUS_WARN(client_logger(), operation << " failed after " << (max_retries + 1)
                                                          << " attempt(s): " << exc.what());
            }
        }
    }

    std::rethrow_exception(last_error);
}

} // namespace sidecar
