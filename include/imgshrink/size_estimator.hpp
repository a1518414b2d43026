#pragma once
// schätzung für previews, kein echter encode

#include "imgshrink/types.hpp"
#include <cstdint>

namespace imgshrink {

// (percent/100)^2 when a percent resize is active, otherwise 1
double resize_area_factor(const CompressionOptions& options);

// Rounded to whole bytes.
// JPEG: input * (0.1 + 0.4 * quality/100) * area
// PNG:  input * (1 - 0.05 * level) * area
// Rough guess only; the real size is whatever compress() measures afterwards.
std::uintmax_t estimate_size(ImageFormat format, std::uintmax_t input_size,
                             const CompressionOptions& options);

} // namespace imgshrink
