#pragma once

#include "net/http_transport.hpp"
#include "protocol.hpp"
#include "sidecar_context.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

inline constexpr const char* kFakeBaseUrl = "http://opencode.test";

/**
 * Scripted HTTP transport.
 *
 * Routes are keyed by "METHOD /path" (the URL without the base and the
 * query string). Unrouted requests get a 404. Every request is recorded.
 */
class FakeTransport final : public sidecar::net::HttpTransport {
public:
    using Responder = std::function<sidecar::net::HttpResponse(const sidecar::net::HttpRequest&)>;

    void on(const std::string& method, const std::string& path, sidecar::net::HttpResponse response);
    void on(const std::string& method, const std::string& path, Responder responder);

    /// 200 with `data` as the JSON body.
    void on_data(const std::string& method, const std::string& path, const sidecar::Json& data);

    sidecar::net::HttpResponse send(const sidecar::net::HttpRequest& request) override;

    std::vector<sidecar::net::HttpRequest> requests() const;
    size_t request_count() const;
    size_t count(const std::string& method, const std::string& path) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Responder> routes_;
    std::vector<sidecar::net::HttpRequest> requests_;
};

std::string route_of(const sidecar::net::HttpRequest& request);

sidecar::net::HttpResponse json_response(long status, const sidecar::Json& body);

/// Context backed by `transport`; retries never sleep.
SidecarContext make_test_context(std::shared_ptr<FakeTransport> transport,
                                 sidecar::RetryPolicy policy = sidecar::RetryPolicy::standard());

/// Value of `key` in a request's query list, "" when absent.
std::string query_value(const sidecar::net::HttpRequest& request, const std::string& key);

/// Removes the directory tree on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    /// Writes an executable `#!/bin/sh` script and returns its path.
    std::string write_script(const std::string& name, const std::string& body) const;

private:
    std::string path_;
};

struct TestPipe {
    int read_fd = -1;
    int write_fd = -1;

    TestPipe();
    ~TestPipe();

    TestPipe(const TestPipe&) = delete;
    TestPipe& operator=(const TestPipe&) = delete;

    void write(const std::string& data) const;
    void close_write();
};

/// Reads newline-terminated lines until `count` arrived, EOF, or timeout.
std::vector<std::string> read_lines(int fd, size_t count, std::chrono::milliseconds timeout);
