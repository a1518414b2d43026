#pragma once
// unbounded channel für fertige results, workers blockieren nie beim push

#include "imgshrink/types.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace imgshrink {

class ProgressQueue {
public:
    ProgressQueue() = default;

    ProgressQueue(const ProgressQueue&) = delete;
    ProgressQueue& operator=(const ProgressQueue&) = delete;

    // ignored after close()
    void push(CompressionResult result);

    // Blocks until a result is available. nullopt once closed and drained.
    std::optional<CompressionResult> pop();

    std::optional<CompressionResult> try_pop();

    // wakes every waiting pop(); already queued results stay poppable
    void close();

    bool closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<CompressionResult> items_;
    bool closed_ = false;
};

} // namespace imgshrink
