#include "json_codec.hpp"

#include "errors.hpp"

namespace sidecar::codec {

Request decode_request(const std::string& line) {
    Json root;
    try {
        root = Json::parse(line);
    } catch (const Json::parse_error& exc) {
        throw SidecarError(std::string("Invalid JSON: ") + exc.what(), codes::kParseError);
    }

    if (!root.is_object()) {
        throw SidecarError("Invalid JSON: request must be an object", codes::kParseError);
    }

    Request req;
    auto cmd_obj = find_key(root, "cmd");
    if (!cmd_obj) {
        throw SidecarError("Unknown command: undefined", codes::kUnknownCommand);
    }
    if (!cmd_obj->is_string()) {
        throw SidecarError("Unknown command: " + cmd_obj->dump(), codes::kUnknownCommand);
    }
    req.cmd = cmd_obj->get<std::string>();

    if (auto path_obj = find_key(root, "sessionPath")) {
        if (path_obj->is_string()) {
            req.session_path = path_obj->get<std::string>();
        }
    }
    if (auto dir_obj = find_key(root, "directory")) {
        if (dir_obj->is_string()) {
            req.directory = dir_obj->get<std::string>();
        }
    }

    root.erase("cmd");
    root.erase("sessionPath");
    root.erase("directory");
    req.args = std::move(root);

    return req;
}

const Json* find_key(const Json& object, const std::string& key) {
    if (!object.is_object()) {
        return nullptr;
    }

    auto it = object.find(key);
    if (it == object.end()) {
        return nullptr;
    }
    return &(*it);
}

std::string as_string(const Json& value, const std::string& fallback) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return fallback;
}

int64_t as_int64(const Json& value, int64_t fallback) {
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        return static_cast<int64_t>(value.get<double>());
    }
    return fallback;
}

bool as_bool(const Json& value, bool fallback) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    return fallback;
}

double as_double(const Json& value, double fallback) {
    if (value.is_number()) {
        return value.get<double>();
    }
    return fallback;
}

bool is_truthy(const Json& value) {
    switch (value.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return false;
        case Json::value_t::boolean:
            return value.get<bool>();
        case Json::value_t::string:
            return !value.get_ref<const std::string&>().empty();
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
        case Json::value_t::number_float:
            return value.get<double>() != 0.0;
        default:
            return true;
    }
}

Response make_success(const std::string& cmd, Json data) {
    Response response;
    response.type = Response::Type::Success;
    response.cmd = cmd;
    response.data = std::move(data);
    return response;
}

Response make_error(const std::string& message, const std::string& code) {
    Response response;
    response.type = Response::Type::Error;
    response.message = message;
    if (!code.empty()) {
        response.code = code;
    }
    return response;
}

std::string encode_response(const Response& response) {
    Json out = Json::object();
    if (response.type == Response::Type::Success) {
        out["type"] = "success";
        out["cmd"] = response.cmd;
        if (response.data) {
            out["data"] = *response.data;
        }
    } else {
        out["type"] = "error";
        out["message"] = response.message;
        if (response.code) {
            out["code"] = *response.code;
        }
    }
    // replace invalid UTF-8 instead of throwing from the writer path
    return out.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace sidecar::codec
