#include "stdio_server.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace sidecar {

StdioServer::StdioServer(int input_fd, int output_fd, LineHandler handler, size_t thread_pool_size)
    : input_fd_(input_fd),
      output_fd_(output_fd),
      handler_(std::move(handler)),
      thread_pool_size_(thread_pool_size > 0 ? thread_pool_size : 4) {}

StdioServer::~StdioServer() {
    stop();
}

bool StdioServer::start() {
    if (running_) {
        return true;
    }
    if (input_fd_ < 0 || output_fd_ < 0 || !handler_) {
        LOG4CPLUS_ERROR(core_logger(), "stdio server: invalid descriptors or handler");
        return false;
    }

    stopping_ = false;
    input_closed_ = false;
    workers_done_ = false;
    live_workers_ = thread_pool_size_;
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        active_threads_ = thread_pool_size_ + 2;
    }
    running_ = true;

    writer_thread_ = std::thread([this] {
        writer_loop();
        thread_finished();
    });
    for (size_t i = 0; i < thread_pool_size_; ++i) {
        worker_threads_.emplace_back([this] {
            worker_thread_func();
            thread_finished();
        });
    }
    reader_thread_ = std::thread([this] {
        reader_loop();
        thread_finished();
    });

    return true;
}

void StdioServer::request_stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
    }
    output_cv_.notify_all();
}

void StdioServer::thread_finished() {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        --active_threads_;
    }
    done_cv_.notify_all();
}

bool StdioServer::stop(std::chrono::milliseconds grace) {
    request_stop();
    {
        std::unique_lock<std::mutex> lock(done_mutex_);
        if (!done_cv_.wait_for(lock, grace, [this] { return active_threads_ == 0; })) {
            LOG4CPLUS_WARN(core_logger(), "stdio server: " << active_threads_ << " thread(s) still busy after "
                                                           << grace.count() << "ms");
            return false;
        }
    }
    stop();
    return true;
}

void StdioServer::stop() {
    request_stop();

    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    for (auto& t : worker_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    worker_threads_.clear();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

    running_ = false;
}

void StdioServer::reader_loop() {
    std::string pending;
    char buffer[4096];

    auto push_line = [this](std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            task_queue_.push(std::move(line));
        }
        queue_cv_.notify_one();
    };

    while (!stopping_) {
        pollfd pfd{};
        pfd.fd = input_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, 1000); // 1s timeout so stop() is noticed
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG4CPLUS_ERROR(core_logger(), "stdin poll failed: " << std::strerror(errno));
            break;
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(input_fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            LOG4CPLUS_ERROR(core_logger(), "stdin read failed: " << std::strerror(errno));
            break;
        }
        if (n == 0) {
            // a final line without a newline still counts
            if (!pending.empty()) {
                push_line(std::move(pending));
                pending.clear();
            }
            LOG4CPLUS_INFO(core_logger(), "stdin closed");
            break;
        }

        pending.append(buffer, static_cast<size_t>(n));
        size_t start = 0;
        size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            push_line(pending.substr(start, newline - start));
            start = newline + 1;
        }
        pending.erase(0, start);
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        input_closed_ = true;
    }
    queue_cv_.notify_all();
}

void StdioServer::worker_thread_func() {
    while (!stopping_) {
        std::string line;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !task_queue_.empty() || input_closed_ || stopping_; });

            if (stopping_ || task_queue_.empty()) {
                break;
            }

            line = std::move(task_queue_.front());
            task_queue_.pop();
        }

        try {
            std::string response = handler_(line);
            if (!response.empty()) {
                enqueue_output(std::move(response));
            }
        } catch (const std::exception& e) {
            LOG4CPLUS_ERROR(core_logger(), "Line handler error: " << e.what());
        }
    }

    if (--live_workers_ == 0) {
        {
            std::lock_guard<std::mutex> lock(output_mutex_);
            workers_done_ = true;
        }
        output_cv_.notify_all();
    }
}

void StdioServer::enqueue_output(std::string line) {
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        output_queue_.push(std::move(line));
    }
    output_cv_.notify_one();
}

void StdioServer::writer_loop() {
    while (true) {
        std::queue<std::string> batch;
        {
            std::unique_lock<std::mutex> lock(output_mutex_);
            output_cv_.wait(lock, [this] { return !output_queue_.empty() || workers_done_ || stopping_; });

            if (output_queue_.empty() && (workers_done_ || stopping_)) {
                break;
            }
            std::swap(batch, output_queue_);
        }

        while (!batch.empty()) {
            std::string data = std::move(batch.front());
            batch.pop();
            data.push_back('\n');
            if (!write_all(data)) {
                LOG4CPLUS_ERROR(core_logger(), "stdout write failed: " << std::strerror(errno));
            }
        }
    }

    running_ = false;
}

bool StdioServer::write_all(const std::string& data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t written = ::write(output_fd_, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        offset += static_cast<size_t>(written);
    }
    return true;
}

} // namespace sidecar
