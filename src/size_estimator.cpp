#include "imgshrink/size_estimator.hpp"
#include <cmath>

namespace imgshrink {

double resize_area_factor(const CompressionOptions& options) {
    if (!options.percent_resize_active()) return 1.0;
    double scale = options.resize_percent / 100.0;
    return scale * scale;
}

std::uintmax_t estimate_size(ImageFormat format, std::uintmax_t input_size,
                             const CompressionOptions& options) {
    double ratio = 1.0;

    switch (format) {
        case ImageFormat::Jpeg:
            // jpeg bitrate geht ungefähr linear mit quality
            ratio = 0.1 + 0.4 * (options.quality / 100.0);
            break;
        case ImageFormat::Png:
            // lossless, nur weniger gewinn pro stufe
            ratio = 1.0 - 0.05 * options.compression_level;
            break;
    }

    double estimated = static_cast<double>(input_size) * ratio * resize_area_factor(options);
    if (estimated <= 0) return 0;
    // runden statt abschneiden, sonst wird aus 55000 schnell 54999
    return static_cast<std::uintmax_t>(std::llround(estimated));
}

} // namespace imgshrink
