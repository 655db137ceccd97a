#pragma once

#include "../protocol.hpp"
#include "../sidecar_context.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sidecar::commands {

enum class CommandKind : std::size_t {
    Health,
    ServerInfo,
    Config,
    CreateSession,
    GetSession,
    ListSessions,
    Prompt,
    PromptAsync,
    FindFiles,
    ListMessages,
    DeleteSession,
    SetAuth,
    GetProviders,
    ProviderList,
    ProviderAuth,
    ProviderOauthAuthorize,
    ProviderOauthCallback,
    RemoveAuth,
    UpdateConfig,
    Dispose,
    Count
};

inline constexpr std::size_t kCommandCount = static_cast<std::size_t>(CommandKind::Count);

// Wire names, indexed by CommandKind.
inline constexpr std::array<std::string_view, kCommandCount> kCommandNames = {
    "health",
    "serverInfo",
    "config",
    "createSession",
    "getSession",
    "listSessions",
    "prompt",
    "promptAsync",
    "findFiles",
    "listMessages",
    "deleteSession",
    "setAuth",
    "getProviders",
    "providerList",
    "providerAuth",
    "providerOauthAuthorize",
    "providerOauthCallback",
    "removeAuth",
    "updateConfig",
    "dispose",
};

constexpr bool all_commands_named() {
    for (std::size_t i = 0; i < kCommandNames.size(); ++i) {
        if (kCommandNames[i].empty()) {
            return false;
        }
    }
    return true;
}

static_assert(all_commands_named(), "every CommandKind needs a wire name");

constexpr std::string_view command_name(CommandKind kind) {
    return kCommandNames[static_cast<std::size_t>(kind)];
}

std::optional<CommandKind> command_from_name(std::string_view name);

struct CommandContext {
    const std::string& cmd;
    SidecarContext& context;
    const Json& args;
    const std::optional<std::string>& session_path;
    const std::optional<std::string>& directory;
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandKind kind() const = 0;

    /// Returns the `data` of the success response; throws on failure.
    virtual Json handle(CommandContext& ctx) = 0;

protected:
    const std::string& require_session_path(const CommandContext& ctx) const;
    std::optional<std::string> optional_string(const CommandContext& ctx, const std::string& key) const;
    OpencodeClient& client(const CommandContext& ctx) const;
};

} // namespace sidecar::commands
