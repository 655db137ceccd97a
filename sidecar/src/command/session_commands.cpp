#include "command_base.hpp"
#include "command_registry.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"
#include "../payload_normalizer.hpp"

#include <log4cplus/loggingmacros.h>

#include <initializer_list>
#include <string>

namespace sidecar::commands {

namespace {

Json first_non_null(const Json& object, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (auto value = codec::find_key(object, key)) {
            if (!value->is_null()) {
                return *value;
            }
        }
    }
    return nullptr;
}

// Body shared by the synchronous and queued prompt calls.
Json build_prompt_body(const CommandContext& ctx, const std::string& message) {
    Json body = Json::object();

    if (auto message_id = codec::find_key(ctx.args, "messageID")) {
        if (message_id->is_string()) {
            body["messageID"] = *message_id;
        }
    }
    if (auto model = codec::find_key(ctx.args, "model")) {
        if (model->is_string()) {
            if (auto ref = payload::split_model(model->get<std::string>())) {
                body["model"] = {{"providerID", ref->provider_id}, {"modelID", ref->model_id}};
            }
        }
    }
    if (auto system = codec::find_key(ctx.args, "system")) {
        if (system->is_string()) {
            body["system"] = *system;
        }
    }

    Json parts = nullptr;
    if (auto raw = codec::find_key(ctx.args, "parts")) {
        parts = *raw;
    }
    body["parts"] = payload::normalize_prompt_parts(parts, message);
    return body;
}

} // namespace

class CreateSessionCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::CreateSession; }

    Json handle(CommandContext& ctx) override {
        std::string title = optional_string(ctx, "name").value_or("");
        if (title.empty()) {
            title = optional_string(ctx, "description").value_or("");
        }
        if (title.empty()) {
            title = "Untitled Session";
        }

        Json session = client(ctx).session_create(title, ctx.directory);

        Json data = Json::object();
        Json session_path = first_non_null(session, {"id", "path", "slug"});
        if (!session_path.is_null()) {
            data["sessionPath"] = session_path;
        }
        data["session"] = payload::summarize_session(session);
        return data;
    }
};

class GetSessionCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::GetSession; }

    Json handle(CommandContext& ctx) override {
        const std::string& session_path = require_session_path(ctx);
        Json session = client(ctx).session_get(session_path, ctx.directory);
        return {{"session", payload::summarize_session(session)}};
    }
};

class ListSessionsCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::ListSessions; }

    Json handle(CommandContext& ctx) override {
        Json sessions = client(ctx).session_list(ctx.directory);
        return {{"sessions", payload::summarize_sessions(sessions)}};
    }
};

class PromptCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::Prompt; }

    Json handle(CommandContext& ctx) override {
        const std::string& session_path = require_session_path(ctx);
        auto message = optional_string(ctx, "message");

        Json body = build_prompt_body(ctx, message.value_or(""));
        LOG4CPLUS_INFO(dispatch_logger(), "prompt session=" << session_path << " parts=" << body["parts"].size());

        Json result = client(ctx).session_prompt(session_path, body, ctx.directory);

        const Json info = first_non_null(result, {"info"});
        Json data = Json::object();
        Json message_id = first_non_null(info, {"id"});
        Json session_id = first_non_null(info, {"sessionID"});
        if (!message_id.is_null()) {
            data["messageId"] = message_id;
        }
        if (!session_id.is_null()) {
            data["sessionId"] = session_id;
        }
        if (message) {
            data["message"] = *message;
        }
        data["response"] = payload::extract_message_text(first_non_null(result, {"parts"}), "assistant");
        if (auto model = codec::find_key(ctx.args, "model")) {
            data["model"] = *model;
        }
        data["timestamp"] = payload::now_iso();
        return data;
    }
};

class PromptAsyncCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::PromptAsync; }

    Json handle(CommandContext& ctx) override {
        const std::string& session_path = require_session_path(ctx);
        Json body = build_prompt_body(ctx, optional_string(ctx, "message").value_or(""));

        client(ctx).session_prompt_async(session_path, body, ctx.directory);

        return {{"queued", true}, {"sessionId", session_path}};
    }
};

class FindFilesCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::FindFiles; }

    Json handle(CommandContext& ctx) override {
        FindFilesQuery query;
        query.query = trim(optional_string(ctx, "query").value_or(""));
        query.dirs = optional_string(ctx, "dirs");
        query.type = optional_string(ctx, "type");
        if (auto limit = codec::find_key(ctx.args, "limit")) {
            if (limit->is_number()) {
                query.limit = codec::as_int64(*limit);
            }
        }
        return client(ctx).find_files(query, ctx.directory);
    }

private:
    static std::string trim(const std::string& value) {
        const char* whitespace = " \t\r\n\f\v";
        auto begin = value.find_first_not_of(whitespace);
        if (begin == std::string::npos) {
            return "";
        }
        auto end = value.find_last_not_of(whitespace);
        return value.substr(begin, end - begin + 1);
    }
};

class ListMessagesCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::ListMessages; }

    Json handle(CommandContext& ctx) override {
        const std::string& session_path = require_session_path(ctx);
        Json messages = client(ctx).session_messages(session_path, ctx.directory);
        return {{"messages", payload::summarize_messages(messages)}};
    }
};

class DeleteSessionCommand final : public CommandHandler {
public:
    CommandKind kind() const override { return CommandKind::DeleteSession; }

    Json handle(CommandContext& ctx) override {
        const std::string& session_path = require_session_path(ctx);
        Json success = client(ctx).session_delete(session_path, ctx.directory);
        return {{"success", success}, {"sessionPath", session_path}};
    }
};

void register_session_commands(CommandRegistry& registry) {
    registry.add(std::make_unique<CreateSessionCommand>());
    registry.add(std::make_unique<GetSessionCommand>());
    registry.add(std::make_unique<ListSessionsCommand>());
    registry.add(std::make_unique<PromptCommand>());
    registry.add(std::make_unique<PromptAsyncCommand>());
    registry.add(std::make_unique<FindFilesCommand>());
    registry.add(std::make_unique<ListMessagesCommand>());
    registry.add(std::make_unique<DeleteSessionCommand>());
}

} // namespace sidecar::commands
