#include "http_transport.hpp"

#include "../errors.hpp"

#include <curl/curl.h>

#include <cctype>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, total);
    return total;
}

constexpr long kConnectTimeoutMs = 10000;

} // namespace

namespace sidecar::net {

CurlGlobal::CurlGlobal() {
    const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

CurlTransport::CurlTransport(long timeout_ms) : timeout_ms_(timeout_ms > 0 ? timeout_ms : 0) {}

HttpResponse CurlTransport::send(const HttpRequest& request) {
    CURL* handle = curl_easy_init();
    if (!handle) {
        throw TransportError("curl_easy_init failed");
    }

    const std::string url = build_url(request.url, request.query);

    HttpResponse response;
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, kConnectTimeoutMs);
    if (timeout_ms_ > 0) {
        curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, timeout_ms_);
    }

    if (request.method == "GET") {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    } else {
        if (request.method != "POST") {
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        if (!request.body.empty() || request.method == "POST") {
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        }
    }

    struct curl_slist* header_list = nullptr;
    header_list = curl_slist_append(header_list, "Accept: application/json");
    if (!request.body.empty()) {
        header_list = curl_slist_append(header_list, "Content-Type: application/json");
    }
    for (const auto& header : request.headers) {
        const std::string line = header.first + ": " + header.second;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);

    const CURLcode code = curl_easy_perform(handle);
    if (code == CURLE_OK) {
        curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(handle);

    if (code != CURLE_OK) {
        std::ostringstream oss;
        oss << request.method << " " << url << " failed: " << curl_easy_strerror(code);
        throw TransportError(oss.str());
    }

    return response;
}

std::string percent_encode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

std::string build_url(const std::string& url, const QueryList& query) {
    if (query.empty()) {
        return url;
    }

    std::string out = url;
    char separator = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& param : query) {
        out.push_back(separator);
        out += percent_encode(param.first);
        out.push_back('=');
        out += percent_encode(param.second);
        separator = '&';
    }
    return out;
}

} // namespace sidecar::net
