#pragma once

#include "net/http_transport.hpp"
#include "protocol.hpp"
#include "retrying_client.hpp"

#include <memory>
#include <optional>
#include <string>

namespace sidecar {

using OptionalDir = std::optional<std::string>;

/// Query options for `GET /find/file`.
struct FindFilesQuery {
    std::string query;
    std::optional<std::string> dirs;  // "true" / "false"
    std::optional<std::string> type;  // "file" / "directory"
    std::optional<int64_t> limit;
};

/// Builds the envelope the rest of the client unwraps from a raw HTTP reply.
Json to_envelope(const net::HttpResponse& response);

/**
 * Typed wrapper over the OpenCode server HTTP API.
 *
 * Every call goes through the RetryingClient; the returned value is already
 * unwrapped. `directory` selects the project per call; the default directory
 * given at construction travels on every request as a header.
 */
class OpencodeClient {
public:
    OpencodeClient(std::shared_ptr<net::HttpTransport> transport,
                   std::string base_url,
                   std::string default_directory,
                   RetryingClient retry = RetryingClient());

    const std::string& base_url() const { return base_url_; }
    const std::string& default_directory() const { return default_directory_; }
    const RetryingClient& retry() const { return retry_; }

    Json health(const RetryPolicy& policy) const;
    Json global_config_update(const Json& config) const;
    Json global_dispose() const;

    Json config_get(const OptionalDir& directory) const;
    Json config_providers(const OptionalDir& directory) const;

    Json provider_list(const OptionalDir& directory) const;
    Json provider_auth(const OptionalDir& directory) const;
    Json provider_oauth_authorize(const std::string& provider_id, int64_t method, const OptionalDir& directory) const;
    Json provider_oauth_callback(const std::string& provider_id,
                                 int64_t method,
                                 const std::optional<std::string>& code,
                                 const OptionalDir& directory) const;

    Json auth_set(const std::string& provider_id, const Json& auth) const;
    Json auth_remove(const std::string& provider_id) const;

    Json session_create(const std::string& title, const OptionalDir& directory) const;
    Json session_get(const std::string& session_id, const OptionalDir& directory) const;
    Json session_list(const OptionalDir& directory) const;
    Json session_delete(const std::string& session_id, const OptionalDir& directory) const;
    Json session_prompt(const std::string& session_id, const Json& body, const OptionalDir& directory) const;
    Json session_prompt_async(const std::string& session_id, const Json& body, const OptionalDir& directory) const;
    Json session_messages(const std::string& session_id, const OptionalDir& directory) const;

    Json find_files(const FindFilesQuery& query, const OptionalDir& directory) const;

private:
    Json request(const std::string& operation,
                 const std::string& method,
                 const std::string& path,
                 net::QueryList query,
                 const Json* body,
                 const RetryPolicy* policy = nullptr) const;

    std::shared_ptr<net::HttpTransport> transport_;
    std::string base_url_;
    std::string default_directory_;
    RetryingClient retry_;
};

} // namespace sidecar
