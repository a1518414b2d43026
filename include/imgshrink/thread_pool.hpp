// thread_pool.hpp - fester pool, die anzahl threads ist gleichzeitig das limit
// wie viele files parallel dekodiert im speicher liegen
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace imgshrink {

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Enqueue a task and get a future for its result
    template<typename F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F>>;

    size_t size() const noexcept { return workers_.size(); }

    // queued + running
    size_t pending() const noexcept { return pending_tasks_.load(); }

    // tasks die gerade auf einem worker laufen, nie mehr als size()
    size_t active() const noexcept { return active_tasks_.load(); }

    // blocks until the queue is drained and every worker is idle
    void wait_all();

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable done_condition_;
    bool stop_ = false;
    std::atomic<size_t> pending_tasks_{0};
    std::atomic<size_t> active_tasks_{0};
};

template<typename F>
auto ThreadPool::enqueue(F&& f) -> std::future<std::invoke_result_t<F>> {
    using return_type = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
    std::future<return_type> result = task->get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("enqueue on stopped ThreadPool");
        }
        pending_tasks_++;
        tasks_.emplace([task]() { (*task)(); });
    }

    condition_.notify_one();
    return result;
}

} // namespace imgshrink
