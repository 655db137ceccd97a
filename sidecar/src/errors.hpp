#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sidecar {

/// Base for every error that may be reported back over the protocol.
/// `code()` is empty when the error has no protocol code of its own.
class SidecarError : public std::runtime_error {
public:
    explicit SidecarError(const std::string& message, std::string code = "")
        : std::runtime_error(message), code_(std::move(code)) {}

    const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

/// Raised by command handlers when a required field is missing or malformed.
class CommandError : public SidecarError {
public:
    CommandError(const std::string& code, const std::string& message)
        : SidecarError(message, code) {}
};

/// Error carried inside a downstream `{error: ...}` envelope.
class DownstreamError : public SidecarError {
public:
    using SidecarError::SidecarError;
};

/// The HTTP exchange itself failed (refused connection, timeout, ...).
class TransportError : public SidecarError {
public:
    using SidecarError::SidecarError;
};

} // namespace sidecar
