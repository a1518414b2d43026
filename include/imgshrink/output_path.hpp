#pragma once

#include "imgshrink/types.hpp"
#include <filesystem>

namespace imgshrink {

// (output_dir or the input's directory) / stem + suffix + original extension.
// Pure, never touches the filesystem.
std::filesystem::path generate_output_path(const std::filesystem::path& input,
                                           const CompressionOptions& options);

} // namespace imgshrink
