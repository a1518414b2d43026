#pragma once
// zielgröße ausrechnen, macht selbst kein resize

#include "imgshrink/types.hpp"

namespace imgshrink {

// Target dimensions for a source of the given size.
//
// Precedence, first match wins:
//   1. resize_percent in (0, 100): both axes scaled by percent/100
//   2. resize_width and/or resize_height > 0: both given are used as is,
//      a single one scales the other axis proportionally
//   3. source dimensions unchanged
//
// Results are floored, an axis that would floor to 0 becomes 1 and an axis
// that would overflow int is capped at INT_MAX. Limits on what can actually
// be resampled are enforced by resample().
// Throws std::invalid_argument for a non-positive source.
Dimensions compute_target_dimensions(Dimensions source, const CompressionOptions& options);

} // namespace imgshrink
