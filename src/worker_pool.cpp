#include "worker_pool.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <unistd.h>

namespace statik {

WorkerPool::WorkerPool(std::size_t workers, std::size_t queue_capacity, ConnectionHandler handler)
    : workers_count_(workers > 0 ? workers : 1)
    , capacity_(queue_capacity > 0 ? queue_capacity : 1)
    , handler_(std::move(handler))
{
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load()) {
        return;
    }
    running_.store(true);
    threads_.reserve(workers_count_);
    for (std::size_t i = 0; i < workers_count_; i++) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
    spdlog::debug("Worker pool started ({} workers, queue {})", workers_count_, capacity_);
}

void WorkerPool::stop() {
    std::deque<int> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
        abandoned.swap(queue_);
        // Unblocks workers waiting in recv/send on keep-alive connections
        for (int fd : active_) {
            shutdown(fd, SHUT_RDWR);
        }
    }
    not_empty_.notify_all();
    not_full_.notify_all();

    for (int fd : abandoned) {
        close(fd);
    }

    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();
}

bool WorkerPool::dispatch(int fd) {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock, [this] { return !running_.load() || queue_.size() < capacity_; });
    if (!running_.load()) {
        lock.unlock();
        close(fd);
        return false;
    }
    queue_.push_back(fd);
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

std::size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::size_t WorkerPool::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void WorkerPool::worker_loop() {
    for (;;) {
        int fd;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_empty_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });
            if (!running_.load()) {
                return;
            }
            fd = queue_.front();
            queue_.pop_front();
            active_.insert(fd);
        }
        not_full_.notify_one();

        try {
            handler_(fd);
        } catch (const std::exception& e) {
            spdlog::error("Worker: connection fd {} failed: {}", fd, e.what());
        }

        {
            // Closed under the lock so stop() never shuts down a reused fd
            std::lock_guard<std::mutex> lock(mutex_);
            active_.erase(fd);
            close(fd);
        }
    }
}

} // namespace statik
