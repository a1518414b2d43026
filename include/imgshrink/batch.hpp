#pragma once
// viele files parallel, aber nie mehr als kMaxInFlight gleichzeitig

#include "imgshrink/progress_queue.hpp"
#include "imgshrink/types.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <vector>

namespace imgshrink {

// 4 dekodierte bilder gleichzeitig im speicher reichen, mehr bringt nur swapping
constexpr size_t kMaxInFlight = 4;

using CompressFn = std::function<CompressionResult(const std::filesystem::path&,
                                                   const CompressionOptions&)>;

// Owned by one batch run. Workers hand their results in through record(),
// the only place that touches the shared totals.
class BatchAccumulator {
public:
    explicit BatchAccumulator(size_t expected = 0);

    BatchAccumulator(const BatchAccumulator&) = delete;
    BatchAccumulator& operator=(const BatchAccumulator&) = delete;

    void record(const CompressionResult& result);

    size_t recorded() const;

    // computes the overall reduction from successful files and hands the batch out
    BatchResult finish();

private:
    mutable std::mutex mutex_;
    BatchResult batch_;
};

class BatchOrchestrator {
public:
    explicit BatchOrchestrator(CompressFn compress, size_t max_in_flight = kMaxInFlight);

    size_t max_in_flight() const noexcept { return max_in_flight_; }

    // One result per path, in completion order. Results are pushed onto
    // progress (if given) right after they were recorded.
    BatchResult run(const std::vector<std::filesystem::path>& paths,
                    const CompressionOptions& options,
                    ProgressQueue* progress = nullptr) const;

private:
    CompressFn compress_;
    size_t max_in_flight_;
};

} // namespace imgshrink
