#include "imgshrink/thread_pool.hpp"

namespace imgshrink {

ThreadPool::ThreadPool(size_t num_threads) {
    if (num_threads == 0) {
        throw std::invalid_argument("ThreadPool needs at least one thread");
    }

    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPool::worker_loop() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] {
                return stop_ || !tasks_.empty();
            });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        active_tasks_++;
        // packaged_task fängt exceptions selbst und legt sie ins future
        task();
        active_tasks_--;

        // Decrement inside the lock so wait_all() cannot miss the wakeup
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            pending_tasks_--;
        }
        done_condition_.notify_all();
    }
}

void ThreadPool::wait_all() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    // kein timeout: ein batch läuft immer bis zum ende
    done_condition_.wait(lock, [this] {
        return pending_tasks_ == 0;
    });
}

} // namespace imgshrink
