#include "opencode_client.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <algorithm>

namespace {

bool is_ascii(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](char c) { return static_cast<unsigned char>(c) < 0x80; });
}

std::string segment(const std::string& value) {
    return sidecar::net::percent_encode(value);
}

void add_directory(sidecar::net::QueryList& query, const sidecar::OptionalDir& directory) {
    if (directory) {
        query.emplace_back("directory", *directory);
    }
}

} // namespace

namespace sidecar {

Json to_envelope(const net::HttpResponse& response) {
    Json parsed = Json::parse(response.body, nullptr, false);
    const bool has_json = !response.body.empty() && !parsed.is_discarded();

    if (response.status >= 200 && response.status < 300) {
        if (response.body.empty()) {
            return {{"data", nullptr}};
        }
        return {{"data", has_json ? parsed : Json(response.body)}};
    }

    // a falsy body would unwrap as success, so only truthy JSON is passed through
    if (has_json && codec::is_truthy(parsed)) {
        return {{"error", parsed}};
    }

    std::string message = "HTTP " + std::to_string(response.status);
    if (!response.body.empty()) {
        message += ": " + response.body;
    }
    return {{"error", {{"name", "HttpError"}, {"data", {{"message", message}}}}}};
}

OpencodeClient::OpencodeClient(std::shared_ptr<net::HttpTransport> transport,
                               std::string base_url,
                               std::string default_directory,
                               RetryingClient retry)
    : transport_(std::move(transport)),
      base_url_(std::move(base_url)),
      default_directory_(std::move(default_directory)),
      retry_(std::move(retry)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

Json OpencodeClient::request(const std::string& operation,
                             const std::string& method,
                             const std::string& path,
                             net::QueryList query,
                             const Json* body,
                             const RetryPolicy* policy) const {
    net::HttpRequest req;
    req.method = method;
    req.url = base_url_ + path;
    req.query = std::move(query);
    if (body) {
        req.body = body->dump(-1, ' ', false, Json::error_handler_t::replace);
    }
    if (!default_directory_.empty()) {
        req.headers.emplace_back("x-opencode-directory",
                                 is_ascii(default_directory_) ? default_directory_ : net::percent_encode(default_directory_));
    }

    auto attempt = [this, &req, &operation]() {
        LOG4CPLUS_DEBUG(client_logger(), operation << ": " << req.method << " " << req.url);
        return to_envelope(transport_->send(req));
    };

    if (policy) {
        return retry_.call(operation, attempt, *policy);
    }
    return retry_.call(operation, attempt);
}

Json OpencodeClient::health(const RetryPolicy& policy) const {
    return request("global.health", "GET", "/global/health", {}, nullptr, &policy);
}

Json OpencodeClient::global_config_update(const Json& config) const {
    return request("global.config.update", "PATCH", "/global/config", {}, &config);
}

Json OpencodeClient::global_dispose() const {
    return request("global.dispose", "POST", "/global/dispose", {}, nullptr);
}

Json OpencodeClient::config_get(const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    return request("config.get", "GET", "/config", std::move(query), nullptr);
}

Json OpencodeClient::config_providers(const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    return request("config.providers", "GET", "/config/providers", std::move(query), nullptr);
}

Json OpencodeClient::provider_list(const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    return request("provider.list", "GET", "/provider", std::move(query), nullptr);
}

Json OpencodeClient::provider_auth(const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    return request("provider.auth", "GET", "/provider/auth", std::move(query), nullptr);
}

Json OpencodeClient::provider_oauth_authorize(const std::string& provider_id,
                                              int64_t method,
                                              const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    Json body = {{"method", method}};
    return request("provider.oauth.authorize", "POST", "/provider/" + segment(provider_id) + "/oauth/authorize",
                   std::move(query), &body);
}

Json OpencodeClient::provider_oauth_callback(const std::string& provider_id,
                                             int64_t method,
                                             const std::optional<std::string>& code,
                                             const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    Json body = {{"method", method}};
    if (code) {
        body["code"] = *code;
    }
    return request("provider.oauth.callback", "POST", "/provider/" + segment(provider_id) + "/oauth/callback",
                   std::move(query), &body);
}

Json OpencodeClient::auth_set(const std::string& provider_id, const Json& auth) const {
    return request("auth.set", "PUT", "/auth/" + segment(provider_id), {}, &auth);
}

Json OpencodeClient::auth_remove(const std::string& provider_id) const {
    return request("auth.remove", "DELETE", "/auth/" + segment(provider_id), {}, nullptr);
}

Json OpencodeClient::session_create(const std::string& title, const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    Json body = {{"title", title}};
    return request("session.create", "POST", "/session", std::move(query), &body);
}

Json OpencodeClient::session_get(const std::string& session_id, const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    return request("session.get", "GET", "/session/" + segment(session_id), std::move(query), nullptr);
}

Json OpencodeClient::session_list(const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    return request("session.list", "GET", "/session", std::move(query), nullptr);
}

Json OpencodeClient::session_delete(const std::string& session_id, const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    return request("session.delete", "DELETE", "/session/" + segment(session_id), std::move(query), nullptr);
}

Json OpencodeClient::session_prompt(const std::string& session_id, const Json& body, const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    return request("session.prompt", "POST", "/session/" + segment(session_id) + "/message", std::move(query), &body);
}

Json OpencodeClient::session_prompt_async(const std::string& session_id,
                                          const Json& body,
                                          const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    return request("session.promptAsync", "POST", "/session/" + segment(session_id) + "/prompt_async",
                   std::move(query), &body);
}

Json OpencodeClient::session_messages(const std::string& session_id, const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    return request("session.messages", "GET", "/session/" + segment(session_id) + "/message", std::move(query),
                   nullptr);
}

Json OpencodeClient::find_files(const FindFilesQuery& find, const OptionalDir& directory) const {
    net::QueryList query;
    add_directory(query, directory);
    query.emplace_back("query", find.query);
    if (find.dirs) {
        query.emplace_back("dirs", *find.dirs);
    }
    if (find.type) {
        query.emplace_back("type", *find.type);
    }
    if (find.limit) {
        query.emplace_back("limit", std::to_string(*find.limit));
    }
    return request("find.files", "GET", "/find/file", std::move(query), nullptr);
}

} // namespace sidecar
