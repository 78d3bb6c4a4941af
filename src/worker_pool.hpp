#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <vector>

namespace statik {

// Fixed set of worker threads serving accepted sockets from a bounded
// queue. The pool owns every fd handed to dispatch() and closes it once
// the handler returns.
class WorkerPool {
public:
    using ConnectionHandler = std::function<void(int fd)>;

    WorkerPool(std::size_t workers, std::size_t queue_capacity, ConnectionHandler handler);
    ~WorkerPool();

    // Non-copyable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    // Wakes blocked callers, shuts down active connections, closes queued
    // ones and joins the workers
    void stop();

    // Blocks while the queue is full. Returns false (and closes fd) once
    // the pool is stopping.
    bool dispatch(int fd);

    std::size_t queued() const;
    std::size_t active() const;
    std::size_t worker_count() const { return workers_count_; }

private:
    void worker_loop();

    const std::size_t workers_count_;
    const std::size_t capacity_;
    ConnectionHandler handler_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<int> queue_;
    std::unordered_set<int> active_;

    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
};

} // namespace statik
