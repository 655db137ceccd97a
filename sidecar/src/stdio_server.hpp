#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace sidecar {

/**
 * Newline-delimited request/response loop over a pair of file descriptors
 * (stdin/stdout in production).
 *
 * A reader thread frames input lines, a worker pool runs the handler
 * concurrently, and a single writer thread owns the output descriptor so
 * response lines never interleave. Responses are written in completion
 * order, which may differ from request order.
 */
class StdioServer {
public:
    /// Returns one encoded response line (without the trailing newline).
    using LineHandler = std::function<std::string(const std::string& line)>;

    StdioServer(int input_fd, int output_fd, LineHandler handler, size_t thread_pool_size = 4);
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    bool start();

    /// Stops all threads; queued but unhandled lines are dropped.
    void stop();

    /// stop() that gives up after `grace` when a handler is still running.
    /// On false the threads are left joinable for a later stop().
    bool stop(std::chrono::milliseconds grace);

    /// False once input reached EOF and every response has been written,
    /// or after stop().
    bool is_running() const { return running_.load(); }

private:
    int input_fd_;
    int output_fd_;
    LineHandler handler_;
    size_t thread_pool_size_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::thread reader_thread_;

    // Worker pool
    std::vector<std::thread> worker_threads_;
    std::queue<std::string> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool input_closed_ = false;
    std::atomic<size_t> live_workers_{0};

    // Single writer
    std::thread writer_thread_;
    std::queue<std::string> output_queue_;
    std::mutex output_mutex_;
    std::condition_variable output_cv_;
    bool workers_done_ = false;

    // Threads not yet returned, for the bounded stop
    std::mutex done_mutex_;
    std::condition_variable done_cv_;
    size_t active_threads_ = 0;

    void request_stop();
    void thread_finished();
    void reader_loop();
    void worker_thread_func();
    void writer_loop();
    void enqueue_output(std::string line);
    bool write_all(const std::string& data);
};

} // namespace sidecar
