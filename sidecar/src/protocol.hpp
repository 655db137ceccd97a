#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace sidecar {

// insertion-ordered: downstream catalogs are reported in their own key order
using Json = nlohmann::ordered_json;

namespace codes {

inline constexpr const char* kParseError = "PARSE_ERROR";
inline constexpr const char* kUnknownCommand = "UNKNOWN_CMD";
inline constexpr const char* kInvalidArgument = "INVALID_ARGUMENT";
inline constexpr const char* kUnknownError = "UNKNOWN_ERROR";

} // namespace codes

struct Request {
    std::string cmd;
    std::optional<std::string> session_path;
    std::optional<std::string> directory;
    Json args = Json::object(); // everything except cmd/sessionPath/directory
};

struct Response {
    enum class Type { Success, Error };

    Type type = Type::Success;
    std::string cmd;                 // success only
    std::optional<Json> data;        // success only
    std::string message;             // error only
    std::optional<std::string> code; // error only
};

} // namespace sidecar
