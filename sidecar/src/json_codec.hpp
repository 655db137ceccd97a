#pragma once

#include "protocol.hpp"

#include <cstdint>
#include <string>

namespace sidecar::codec {

/// Parses one protocol line. Throws SidecarError with PARSE_ERROR when the
/// line is not a JSON object, CommandError with INVALID_ARGUMENT when `cmd`
/// is missing.
Request decode_request(const std::string& line);

const Json* find_key(const Json& object, const std::string& key);
std::string as_string(const Json& value, const std::string& fallback = "");
int64_t as_int64(const Json& value, int64_t fallback = 0);
bool as_bool(const Json& value, bool fallback = false);
double as_double(const Json& value, double fallback = 0.0);

/// JavaScript-style truthiness, used where the protocol mirrors `a || b`.
bool is_truthy(const Json& value);

Response make_success(const std::string& cmd, Json data);
Response make_error(const std::string& message, const std::string& code);

std::string encode_response(const Response& response);

} // namespace sidecar::codec
