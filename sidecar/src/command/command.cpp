#include "command.hpp"

#include "command_base.hpp"
#include "command_registry.hpp"

#include "../errors.hpp"
#include "../json_codec.hpp"
#include "../logger.hpp"

#include <log4cplus/loggingmacros.h>

namespace sidecar::commands {

std::optional<CommandKind> command_from_name(std::string_view name) {
    for (std::size_t i = 0; i < kCommandCount; ++i) {
        if (kCommandNames[i] == name) {
            return static_cast<CommandKind>(i);
        }
    }
    return std::nullopt;
}

const std::string& CommandHandler::require_session_path(const CommandContext& ctx) const {
    if (!ctx.session_path || ctx.session_path->empty()) {
        LOG4CPLUS_ERROR(dispatch_logger(), ctx.cmd << ": sessionPath is required");
        throw CommandError(codes::kInvalidArgument, "sessionPath is required");
    }
    return *ctx.session_path;
}

std::optional<std::string> CommandHandler::optional_string(const CommandContext& ctx, const std::string& key) const {
    if (auto value = codec::find_key(ctx.args, key)) {
        if (value->is_string()) {
            return value->get<std::string>();
        }
    }
    return std::nullopt;
}

OpencodeClient& CommandHandler::client(const CommandContext& ctx) const {
    if (!ctx.context.client) {
        throw SidecarError("OpenCode client is not initialized");
    }
    return *ctx.context.client;
}

CommandDispatcher::CommandDispatcher(SidecarContext& context) : context_(context) {
    // fail at startup rather than on the first request
    command_registry();
}

std::string CommandDispatcher::handle_line(const std::string& line) const {
    Request request;
    try {
        request = codec::decode_request(line);
    } catch (const SidecarError& exc) {
        LOG4CPLUS_ERROR(dispatch_logger(), "Decode error: " << exc.what());
        return codec::encode_response(codec::make_error(exc.what(), exc.code()));
    }

    return codec::encode_response(dispatch(request));
}

Response CommandDispatcher::dispatch(const Request& request) const {
    LOG4CPLUS_INFO(dispatch_logger(), "request " << request.cmd
                                                 << (request.session_path ? " session=" + *request.session_path : "")
                                                 << (request.directory ? " directory=" + *request.directory : ""));

    auto kind = command_from_name(request.cmd);
    CommandHandler* handler = kind ? command_registry().find(*kind) : nullptr;
    if (!handler) {
        LOG4CPLUS_WARN(dispatch_logger(), "Unknown command: " << request.cmd);
        return codec::make_error("Unknown command: " + request.cmd, codes::kUnknownCommand);
    }

    CommandContext ctx{request.cmd, context_, request.args, request.session_path, request.directory};
    try {
        Json data = handler->handle(ctx);
        LOG4CPLUS_DEBUG(dispatch_logger(), "response success " << request.cmd);
        return codec::make_success(request.cmd, std::move(data));
    } catch (const SidecarError& exc) {
        LOG4CPLUS_ERROR(dispatch_logger(), request.cmd << " failed: " << exc.what());
        return codec::make_error(exc.what(), exc.code().empty() ? codes::kUnknownError : exc.code());
    } catch (const std::exception& exc) {
        LOG4CPLUS_ERROR(dispatch_logger(), request.cmd << " failed: " << exc.what());
        return codec::make_error(exc.what(), codes::kUnknownError);
    }
}

} // namespace sidecar::commands
