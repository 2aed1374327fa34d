#include "../include/worker_pool.hpp"
#include "../include/log.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

WorkerPool::WorkerPool(std::size_t slots) : slots_(slots) {
    if (slots_ == 0) throw std::invalid_argument("worker pool needs at least one slot");
    threads_.reserve(slots_);
    for (std::size_t i = 0; i < slots_; ++i) {
        threads_.emplace_back([this]{ worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) return false;
        queue_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

PoolSnapshot WorkerPool::snapshot() {
    std::lock_guard<std::mutex> lock(mtx_);
    return PoolSnapshot{slots_, busy_, queue_.size()};
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this]{ return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop_front();
            ++busy_;
        }
        try {
            job();
        } catch (const std::exception& e) {
            log_error("worker", std::string("job threw: ") + e.what());
        }
        {
            std::lock_guard<std::mutex> lock(mtx_);
            --busy_;
        }
    }
}
