#include "imgshrink/progress_queue.hpp"

namespace imgshrink {

void ProgressQueue::push(CompressionResult result) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        items_.push_back(std::move(result));
    }
    available_.notify_one();
}

std::optional<CompressionResult> ProgressQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    available_.wait(lock, [this] { return closed_ || !items_.empty(); });

    if (items_.empty()) return std::nullopt;

    CompressionResult result = std::move(items_.front());
    items_.pop_front();
    return result;
}

std::optional<CompressionResult> ProgressQueue::try_pop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) return std::nullopt;

    CompressionResult result = std::move(items_.front());
    items_.pop_front();
    return result;
}

void ProgressQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    available_.notify_all();
}

bool ProgressQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t ProgressQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

} // namespace imgshrink
