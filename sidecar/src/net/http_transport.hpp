#pragma once

#include <string>
#include <utility>
#include <vector>

namespace sidecar::net {

using HeaderList = std::vector<std::pair<std::string, std::string>>;
using QueryList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "GET";
    std::string url;      // base URL + path, without query string
    QueryList query;      // encoded by the transport
    HeaderList headers;
    std::string body;     // sent as application/json when non-empty
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

/// Performs one HTTP exchange. Throws TransportError when no HTTP response
/// was received; any status code is returned as-is.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/// libcurl-backed transport. Construct one CurlGlobal before the first
/// CurlTransport and keep it alive while any transport is in use.
class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(long timeout_ms = -1);

    HttpResponse send(const HttpRequest& request) override;

private:
    long timeout_ms_;
};

class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

std::string percent_encode(const std::string& value);
std::string build_url(const std::string& url, const QueryList& query);

} // namespace sidecar::net
