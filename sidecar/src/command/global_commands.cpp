#include "command_base.hpp"
#include "command_registry.hpp"

#include "../errors.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"
#include "../payload_normalizer.hpp"

#include <log4cplus/loggingmacros.h>

#include <future>
#include <string>

namespace sidecar::commands {

namespace {

void copy_if_present(Json& out, const Json& source, const char* key) {
    if (auto value = codec::find_key(source, key)) {
        out[key] = *value;
    }
}

} // namespace

class HealthCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::Health; }

    Json handle(CommandContext& ctx) override {
        Json health = client(ctx).health(ctx.context.health_probe_policy);
        Json data = Json::object();
        copy_if_present(data, health, "healthy");
        copy_if_present(data, health, "version");
        return data;
    }
};

class ServerInfoCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::ServerInfo; }

    Json handle(CommandContext& ctx) override {
        Json data = Json::object();
        data["baseUrl"] = ctx.context.base_url;
        if (ctx.context.started_at_ms) {
            data["startedAt"] = *ctx.context.started_at_ms;
        } else {
            data["startedAt"] = nullptr;
        }
        return data;
    }
};

class ConfigCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::Config; }

    Json handle(CommandContext& ctx) override {
        OpencodeClient& api = client(ctx);
        const OptionalDir directory = ctx.directory;

        auto config_future = std::async(std::launch::async, [&api, directory] { return api.config_get(directory); });
        auto providers_future =
            std::async(std::launch::async, [&api, directory] { return api.config_providers(directory); });

        // wait for both before surfacing the first failure
        config_future.wait();
        providers_future.wait();
        Json config = config_future.get();
        Json providers = providers_future.get();

        auto ui = payload::to_json(payload::to_ui_providers(providers));
        return {
            {"config", std::move(config)},
            {"providers", std::move(ui["providers"])},
            {"defaults", std::move(ui["defaults"])},
        };
    }
};

class UpdateConfigCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::UpdateConfig; }

    Json handle(CommandContext& ctx) override {
        auto config = codec::find_key(ctx.args, "config");
        if (!config || !config->is_object()) {
            LOG4CPLUS_ERROR(dispatch_logger(), "updateConfig: config is required");
            throw CommandError(codes::kInvalidArgument, "config is required");
        }
        return client(ctx).global_config_update(*config);
    }
};

class DisposeCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::Dispose; }

    Json handle(CommandContext& ctx) override {
        LOG4CPLUS_INFO(dispatch_logger(), "dispose requested");
        return client(ctx).global_dispose();
    }
};

void register_global_commands(CommandRegistry& registry) {
    registry.add(std::make_unique<HealthCommand>());
    registry.add(std::make_unique<ServerInfoCommand>());
    registry.add(std::make_unique<ConfigCommand>());
    registry.add(std::make_unique<UpdateConfigCommand>());
    registry.add(std::make_unique<DisposeCommand>());
}

} // namespace sidecar::commands
