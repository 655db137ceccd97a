#include "command_registry.hpp"

#include <stdexcept>
#include <string>

namespace sidecar::commands {

void CommandRegistry::add(std::unique_ptr<CommandHandler> handler) {
    if (!handler) {
        return;
    }
    const auto index = static_cast<std::size_t>(handler->kind());
    if (index >= kCommandCount) {
        return;
    }
    handlers_[index] = std::move(handler);
}

CommandHandler* CommandRegistry::find(CommandKind kind) const {
    const auto index = static_cast<std::size_t>(kind);
    if (index >= kCommandCount) {
        return nullptr;
    }
    return handlers_[index].get();
}

std::vector<CommandKind> CommandRegistry::missing() const {
    std::vector<CommandKind> result;
    for (std::size_t i = 0; i < kCommandCount; ++i) {
        if (!handlers_[i]) {
            result.push_back(static_cast<CommandKind>(i));
        }
    }
    return result;
}

const CommandRegistry& command_registry() {
    static const CommandRegistry registry = [] {
        CommandRegistry reg;
        register_global_commands(reg);
        register_session_commands(reg);
        register_provider_commands(reg);

        auto missing = reg.missing();
        if (!missing.empty()) {
            std::string names;
            for (auto kind : missing) {
                if (!names.empty()) {
                    names += ", ";
                }
                names += std::string(command_name(kind));
            }
            throw std::logic_error("no handler registered for: " + names);
        }
        return reg;
    }();

    return registry;
}

} // namespace sidecar::commands
