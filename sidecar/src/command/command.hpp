#pragma once

#include "../protocol.hpp"
#include "../sidecar_context.hpp"

#include <string>

namespace sidecar::commands {

/**
 * Routes one protocol line to its handler.
 *
 * Every failure below this point (parse, unknown command, validation,
 * downstream) becomes exactly one error Response; nothing is rethrown.
 * Safe to call from several threads at once: the context is read-only.
 */
class CommandDispatcher {
public:
    explicit CommandDispatcher(SidecarContext& context);

    std::string handle_line(const std::string& line) const;
    Response dispatch(const Request& request) const;

private:
    SidecarContext& context_;
};

} // namespace sidecar::commands
