#include "command_base.hpp"
#include "command_registry.hpp"

#include "../errors.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"
#include "../payload_normalizer.hpp"

#include <log4cplus/loggingmacros.h>

#include <string>

namespace sidecar::commands {

namespace {

struct OauthTarget {
    std::string provider_id;
    int64_t method = 0;
};

OauthTarget require_oauth_target(const CommandContext& ctx) {
    auto provider = codec::find_key(ctx.args, "providerID");
    auto method = codec::find_key(ctx.args, "method");
    const std::string provider_id = provider ? codec::as_string(*provider) : "";
    if (provider_id.empty() || !method || !method->is_number()) {
        LOG4CPLUS_ERROR(dispatch_logger(), ctx.cmd << ": providerID and method are required");
        throw CommandError(codes::kInvalidArgument, "providerID and method are required");
    }
    return {provider_id, codec::as_int64(*method)};
}

} // namespace

class SetAuthCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::SetAuth; }

    Json handle(CommandContext& ctx) override {
        const std::string provider = optional_string(ctx, "provider").value_or("");
        const std::string api_key = optional_string(ctx, "apiKey").value_or("");
        if (provider.empty() || api_key.empty()) {
            LOG4CPLUS_ERROR(dispatch_logger(), "setAuth: provider and apiKey are required");
            throw CommandError(codes::kInvalidArgument, "provider and apiKey are required");
        }

        LOG4CPLUS_INFO(dispatch_logger(), "setAuth provider=" << provider);
        Json auth = {{"type", "api"}, {"key", api_key}};
        Json success = client(ctx).auth_set(provider, auth);
        return {{"success", success}, {"provider", provider}};
    }
};

class GetProvidersCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::GetProviders; }

    Json handle(CommandContext& ctx) override {
        Json providers = client(ctx).config_providers(ctx.directory);
        return payload::to_json(payload::to_ui_providers(providers));
    }
};

class ProviderListCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::ProviderList; }

    Json handle(CommandContext& ctx) override {
        return payload::summarize_provider_list(client(ctx).provider_list(ctx.directory));
    }
};

class ProviderAuthCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::ProviderAuth; }

    Json handle(CommandContext& ctx) override {
        Json methods = client(ctx).provider_auth(ctx.directory);
        if (methods.is_null()) {
            return Json::object();
        }
        return methods;
    }
};

class ProviderOauthAuthorizeCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::ProviderOauthAuthorize; }

    Json handle(CommandContext& ctx) override {
        OauthTarget target = require_oauth_target(ctx);
        LOG4CPLUS_INFO(dispatch_logger(), "oauth authorize provider=" << target.provider_id << " method=" << target.method);
        return client(ctx).provider_oauth_authorize(target.provider_id, target.method, ctx.directory);
    }
};

class ProviderOauthCallbackCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::ProviderOauthCallback; }

    Json handle(CommandContext& ctx) override {
        OauthTarget target = require_oauth_target(ctx);
        Json success = client(ctx).provider_oauth_callback(target.provider_id, target.method,
                                                           optional_string(ctx, "code"), ctx.directory);
        return {{"success", success}};
    }
};

class RemoveAuthCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::RemoveAuth; }

    Json handle(CommandContext& ctx) override {
        const std::string provider_id = optional_string(ctx, "providerID").value_or("");
        if (provider_id.empty()) {
            LOG4CPLUS_ERROR(dispatch_logger(), "removeAuth: providerID is required");
            throw CommandError(codes::kInvalidArgument, "providerID is required");
        }
        Json success = client(ctx).auth_remove(provider_id);
        return {{"success", success}};
    }
};

void register_provider_commands(CommandRegistry& registry) {
    registry.add(std::make_unique<SetAuthCommand>());
    registry.add(std::make_unique<GetProvidersCommand>());
    registry.add(std::make_unique<ProviderListCommand>());
    registry.add(std::make_unique<ProviderAuthCommand>());
    registry.add(std::make_unique<ProviderOauthAuthorizeCommand>());
    registry.add(std::make_unique<ProviderOauthCallbackCommand>());
    registry.add(std::make_unique<RemoveAuthCommand>());
}

} // namespace sidecar::commands
