#include "mcptk/worker_pool.hpp"
#include "mcptk/error.hpp"
#include <algorithm>

namespace mcptk {

WorkerPool::WorkerPool(int size) : size_(size < 1 ? 1 : static_cast<size_t>(size)) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < size_; ++i) spawn_locked();
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::spawn_locked() {
    ++live_;
    threads_.emplace_back([this] {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !tasks_.empty() || !running_; });
                if (!running_ && tasks_.empty()) {
                    --live_;
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
            std::lock_guard<std::mutex> lock(mutex_);
            if (surplus_ > 0) {
                --surplus_;
                --live_;
                retired_.push_back(std::this_thread::get_id());
                return;
            }
        }
    });
}

void WorkerPool::post(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) throw McpError("Worker pool is stopped");
        tasks_.push(std::move(fn));
    }
    cv_.notify_one();
}

void WorkerPool::add_replacement() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        for (const auto& id : retired_) {
            auto it = std::find_if(threads_.begin(), threads_.end(),
                                   [&](const std::thread& t) { return t.get_id() == id; });
            if (it == threads_.end()) continue;
            finished.push_back(std::move(*it));
            threads_.erase(it);
        }
        retired_.clear();
        ++surplus_;
        spawn_locked();
    }
    for (auto& t : finished) t.join();
}

size_t WorkerPool::live_workers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_;
}

void WorkerPool::stop() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        threads.swap(threads_);
    }
    cv_.notify_all();
    for (auto& t : threads) {
        if (!t.joinable()) continue;
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();
        } else {
            t.join();
        }
    }
}

} // namespace mcptk
