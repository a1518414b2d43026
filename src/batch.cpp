#include "imgshrink/batch.hpp"
#include "imgshrink/thread_pool.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>
#include <utility>

namespace imgshrink {

BatchAccumulator::BatchAccumulator(size_t expected) {
    batch_.results.reserve(expected);
}

void BatchAccumulator::record(const CompressionResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    batch_.results.push_back(result);
    if (result.success) {
        batch_.success_count++;
        batch_.total_input += result.input_size;
        batch_.total_output += result.output_size;
    } else {
        // kaputte files zählen bei den bytes gar nicht mit
        batch_.fail_count++;
    }
}

size_t BatchAccumulator::recorded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return batch_.results.size();
}

BatchResult BatchAccumulator::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    batch_.total_reduction = calculate_reduction(batch_.total_input, batch_.total_output);
    return std::move(batch_);
}

BatchOrchestrator::BatchOrchestrator(CompressFn compress, size_t max_in_flight)
    : compress_(std::move(compress)), max_in_flight_(max_in_flight) {
    if (!compress_) {
        throw std::invalid_argument("BatchOrchestrator needs a compress function");
    }
    if (max_in_flight_ == 0) {
        throw std::invalid_argument("BatchOrchestrator needs at least one slot");
    }
}

BatchResult BatchOrchestrator::run(const std::vector<std::filesystem::path>& paths,
                                   const CompressionOptions& options,
                                   ProgressQueue* progress) const {
    BatchAccumulator accumulator(paths.size());
    if (paths.empty()) {
        return accumulator.finish();
    }

    ThreadPool pool(std::min(max_in_flight_, paths.size()));

    std::vector<std::future<void>> futures;
    futures.reserve(paths.size());

    for (const auto& path : paths) {
        futures.push_back(pool.enqueue([this, &path, &options, &accumulator, progress]() {
            CompressionResult result;
            try {
                result = compress_(path, options);
            } catch (const std::exception& e) {
                // ein file darf nie den ganzen batch mitreissen
                result = CompressionResult{};
                result.success = false;
                result.error = Error{ErrorKind::EncodeFailed,
                                     std::string("unexpected error: ") + e.what()};
            }

            if (result.input_path.empty()) {
                result.input_path = path;
            }
            if (!result.success && !result.error) {
                result.error = Error{ErrorKind::EncodeFailed, "compression failed"};
            }

            accumulator.record(result);
            if (progress) {
                progress->push(std::move(result));
            }
        }));
    }

    // warten bis alles fertig
    for (auto& f : futures) {
        f.get();
    }

    return accumulator.finish();
}

} // namespace imgshrink
