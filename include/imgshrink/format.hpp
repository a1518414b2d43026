#pragma once
// welches format hat ein file, nur nach extension

#include "imgshrink/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace imgshrink {

// lower-cased extension including the dot, "" when there is none
std::string lowercase_extension(const std::filesystem::path& path);

// nullopt for anything that is not .jpg/.jpeg/.png (any case)
std::optional<ImageFormat> detect_format(const std::filesystem::path& path);

// same as detect_format but throws ImageError(UnsupportedFormat)
ImageFormat resolve_format(const std::filesystem::path& path);

bool is_supported(const std::filesystem::path& path);

const std::vector<std::string>& supported_extensions();

} // namespace imgshrink
