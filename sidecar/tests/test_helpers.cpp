#include "test_helpers.hpp"

#include "logger.hpp"
#include "opencode_client.hpp"
#include "retrying_client.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <poll.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

class LoggingEnvironment final : public ::testing::Environment {
public:
	void SetUp() override {
		static std::once_flag once;
		std::call_once(once, []() { init_logging(SIDECAR_TEST_LOG_CONFIG); });
	}
};

::testing::Environment* const kLoggingEnvironment = ::testing::AddGlobalTestEnvironment(new LoggingEnvironment());

std::string route_key(const std::string& method, const std::string& path) {
	return method + " " + path;
}

} // namespace

std::string route_of(const sidecar::net::HttpRequest& request) {
	std::string path = request.url;
	const std::string base = kFakeBaseUrl;
	if (path.compare(0, base.size(), base) == 0) {
		path.erase(0, base.size());
	}
	return route_key(request.method, path);
}

void FakeTransport::on(const std::string& method, const std::string& path, sidecar::net::HttpResponse response) {
	on(method, path, [response](const sidecar::net::HttpRequest&) { return response; });
}

void FakeTransport::on(const std::string& method, const std::string& path, Responder responder) {
	std::lock_guard<std::mutex> lock(mutex_);
	routes_[route_key(method, path)] = std::move(responder);
}

void FakeTransport::on_data(const std::string& method, const std::string& path, const sidecar::Json& data) {
	on(method, path, json_response(200, data));
}

sidecar::net::HttpResponse FakeTransport::send(const sidecar::net::HttpRequest& request) {
	Responder responder;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		requests_.push_back(request);
		auto it = routes_.find(route_of(request));
		if (it != routes_.end()) {
			responder = it->second;
		}
	}
	if (!responder) {
		return {404, ""};
	}
	return responder(request);
}

std::vector<sidecar::net::HttpRequest> FakeTransport::requests() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return requests_;
}

size_t FakeTransport::request_count() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return requests_.size();
}

size_t FakeTransport::count(const std::string& method, const std::string& path) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const std::string key = route_key(method, path);
	size_t n = 0;
	for (const auto& request : requests_) {
		if (route_of(request) == key) {
			++n;
		}
	}
	return n;
}

sidecar::net::HttpResponse json_response(long status, const sidecar::Json& body) {
	return {status, body.dump()};
}

SidecarContext make_test_context(std::shared_ptr<FakeTransport> transport, sidecar::RetryPolicy policy) {
	SidecarContext context;
	context.base_url = kFakeBaseUrl;
	context.directory = "/work/project";
	context.client = std::make_shared<sidecar::OpencodeClient>(
		std::move(transport), kFakeBaseUrl, context.directory,
		sidecar::RetryingClient(policy, [](std::chrono::milliseconds) {}));
	return context;
}

std::string query_value(const sidecar::net::HttpRequest& request, const std::string& key) {
	for (const auto& item : request.query) {
		if (item.first == key) {
			return item.second;
		}
	}
	return "";
}

TempDir::TempDir() {
	std::string pattern = (std::filesystem::temp_directory_path() / "sidecar_test_XXXXXX").string();
	if (::mkdtemp(pattern.data()) == nullptr) {
		throw std::runtime_error("mkdtemp failed");
	}
	path_ = pattern;
}

TempDir::~TempDir() {
	std::error_code ec;
	std::filesystem::remove_all(path_, ec);
}

std::string TempDir::write_script(const std::string& name, const std::string& body) const {
	const std::string script = path_ + "/" + name;
	{
		std::ofstream out(script, std::ios::trunc);
		if (!out) {
			throw std::runtime_error("Failed to write script: " + script);
		}
		out << "#!/bin/sh\n" << body << "\n";
	}
	::chmod(script.c_str(), 0755);
	return script;
}

TestPipe::TestPipe() {
	int fds[2];
	if (::pipe(fds) != 0) {
		throw std::runtime_error("pipe failed");
	}
	read_fd = fds[0];
	write_fd = fds[1];
}

TestPipe::~TestPipe() {
	close_write();
	if (read_fd >= 0) {
		::close(read_fd);
	}
}

void TestPipe::write(const std::string& data) const {
	size_t offset = 0;
	while (offset < data.size()) {
		ssize_t n = ::write(write_fd, data.data() + offset, data.size() - offset);
		if (n <= 0) {
			throw std::runtime_error("pipe write failed");
		}
		offset += static_cast<size_t>(n);
	}
}

void TestPipe::close_write() {
	if (write_fd >= 0) {
		::close(write_fd);
		write_fd = -1;
	}
}

std::vector<std::string> read_lines(int fd, size_t count, std::chrono::milliseconds timeout) {
	std::vector<std::string> lines;
	std::string pending;
	char buffer[4096];
	const auto deadline = std::chrono::steady_clock::now() + timeout;

	while (lines.size() < count) {
		auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
		if (remaining.count() <= 0) {
			break;
		}

		pollfd pfd{fd, POLLIN, 0};
		int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
		if (ready <= 0) {
			continue;
		}
		ssize_t n = ::read(fd, buffer, sizeof(buffer));
		if (n <= 0) {
			break;
		}
		pending.append(buffer, static_cast<size_t>(n));

		size_t newline;
		while ((newline = pending.find('\n')) != std::string::npos) {
			lines.push_back(pending.substr(0, newline));
			pending.erase(0, newline + 1);
		}
	}
	return lines;
}
