#pragma once

#include "command_base.hpp"

#include <array>
#include <memory>
#include <vector>

namespace sidecar::commands {

class CommandRegistry {
public:
    void add(std::unique_ptr<CommandHandler> handler);
    CommandHandler* find(CommandKind kind) const;

    /// Kinds with no registered handler.
    std::vector<CommandKind> missing() const;

private:
    std::array<std::unique_ptr<CommandHandler>, kCommandCount> handlers_;
};

void register_global_commands(CommandRegistry& registry);
void register_session_commands(CommandRegistry& registry);
void register_provider_commands(CommandRegistry& registry);

/// Fully populated registry; throws std::logic_error if a kind is unhandled.
const CommandRegistry& command_registry();

} // namespace sidecar::commands
