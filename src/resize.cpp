#include "imgshrink/resize.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace imgshrink {

namespace {

// 0 darf nie rauskommen, sonst kracht der resampler. nach oben auf int begrenzt,
// dünne quellen mit riesiger zielbreite laufen sonst über
int at_least_one(std::int64_t value) {
    return static_cast<int>(std::clamp<std::int64_t>(value, 1, std::numeric_limits<int>::max()));
}

int scale_by_percent(int extent, double percent) {
    return at_least_one(static_cast<std::int64_t>(std::floor(extent * percent / 100.0)));
}

// integer math, damit 800x600 -> 400 auch wirklich 300 gibt
int scale_proportional(int other_source, int given, int given_source) {
    return at_least_one(static_cast<std::int64_t>(other_source) * given / given_source);
}

} // namespace

Dimensions compute_target_dimensions(Dimensions source, const CompressionOptions& options) {
    if (source.width <= 0 || source.height <= 0) {
        throw std::invalid_argument("source dimensions must be positive, got " +
                                    std::to_string(source.width) + "x" +
                                    std::to_string(source.height));
    }

    if (options.percent_resize_active()) {
        return {scale_by_percent(source.width, options.resize_percent),
                scale_by_percent(source.height, options.resize_percent)};
    }

    int width = options.resize_width;
    int height = options.resize_height;

    if (width > 0 && height > 0) {
        return {width, height};
    }
    if (width > 0) {
        return {width, scale_proportional(source.height, width, source.width)};
    }
    if (height > 0) {
        return {scale_proportional(source.width, height, source.height), height};
    }

    return source;
}

} // namespace imgshrink
