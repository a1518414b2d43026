#include "imgshrink/format.hpp"
#include <algorithm>
#include <cctype>

namespace imgshrink {

std::string lowercase_extension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

const std::vector<std::string>& supported_extensions() {
    static const std::vector<std::string> exts = {".jpg", ".jpeg", ".png"};
    return exts;
}

std::optional<ImageFormat> detect_format(const std::filesystem::path& path) {
    auto ext = lowercase_extension(path);
    if (ext == ".jpg" || ext == ".jpeg") return ImageFormat::Jpeg;
    if (ext == ".png") return ImageFormat::Png;
    return std::nullopt;
}

ImageFormat resolve_format(const std::filesystem::path& path) {
    auto format = detect_format(path);
    if (!format) {
        auto ext = path.extension().string();
        throw ImageError(ErrorKind::UnsupportedFormat,
                         "unsupported image format: " + (ext.empty() ? std::string("(none)") : ext));
    }
    return *format;
}

bool is_supported(const std::filesystem::path& path) {
    return detect_format(path).has_value();
}

} // namespace imgshrink
