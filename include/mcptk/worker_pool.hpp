#pragma once
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace mcptk {

/// Fixed-size FIFO thread pool. Queued tasks are drained before stop() returns.
class WorkerPool {
public:
    explicit WorkerPool(int size = 4);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Queue fn. Throws McpError once the pool is stopped.
    void post(std::function<void()> fn);

    /// Queue fn and return a future for its result; exceptions land in the future.
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        post([task] { (*task)(); });
        return fut;
    }

    /// Start one extra worker to stand in for a worker stuck on an abandoned
    /// task. The pool shrinks back once that task returns.
    void add_replacement();

    void stop();

    /// Configured worker count.
    [[nodiscard]] size_t size() const { return size_; }

    /// Workers currently alive, replacements included.
    [[nodiscard]] size_t live_workers() const;

private:
    void spawn_locked();

    size_t size_;
    size_t live_ = 0;
    size_t surplus_ = 0;
    std::vector<std::thread> threads_;
    std::vector<std::thread::id> retired_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = true;
};

} // namespace mcptk
