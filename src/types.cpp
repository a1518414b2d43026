#include "imgshrink/types.hpp"
#include <cmath>
#include <cstdio>

namespace imgshrink {

const char* to_string(ImageFormat format) {
    switch (format) {
        case ImageFormat::Jpeg: return "jpeg";
        case ImageFormat::Png:  return "png";
    }
    return "unknown";
}

const char* to_string(ChromaSubsample chroma) {
    switch (chroma) {
        case ChromaSubsample::Yuv444: return "4:4:4";
        case ChromaSubsample::Yuv422: return "4:2:2";
        case ChromaSubsample::Yuv420: return "4:2:0";
    }
    return "unknown";
}

const char* to_string(PngEffort effort) {
    switch (effort) {
        case PngEffort::None:    return "none";
        case PngEffort::Fastest: return "fastest";
        case PngEffort::Default: return "default";
        case PngEffort::Maximum: return "maximum";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnsupportedFormat:     return "unsupported format";
        case ErrorKind::InvalidOptions:        return "invalid options";
        case ErrorKind::InputUnreadable:       return "input unreadable";
        case ErrorKind::DecodeFailed:          return "invalid or corrupt image";
        case ErrorKind::DirectoryCreateFailed: return "cannot create output directory";
        case ErrorKind::EncodeFailed:          return "encode failed";
        case ErrorKind::WriteFailed:           return "write failed";
        case ErrorKind::OutputStatFailed:      return "output unreadable";
    }
    return "unknown error";
}

std::optional<ChromaSubsample> parse_chroma_subsample(const std::string& text) {
    if (text == "4:4:4" || text == "444") return ChromaSubsample::Yuv444;
    if (text == "4:2:2" || text == "422") return ChromaSubsample::Yuv422;
    if (text == "4:2:0" || text == "420") return ChromaSubsample::Yuv420;
    return std::nullopt;
}

// grob quantisiert, der encoder hat nur vier stufen
PngEffort effort_for_level(int compression_level) {
    if (compression_level <= 0) return PngEffort::None;
    if (compression_level <= 3) return PngEffort::Fastest;
    if (compression_level <= 6) return PngEffort::Default;
    return PngEffort::Maximum;
}

JpegParams CompressionOptions::jpeg() const {
    JpegParams params;
    params.quality = quality;
    params.progressive = progressive;
    params.chroma = chroma_subsample;
    params.strip_metadata = strip_metadata;
    return params;
}

PngParams CompressionOptions::png() const {
    PngParams params;
    params.effort = effort_for_level(compression_level);
    params.interlaced = interlaced;
    return params;
}

CompressionOptions default_options() {
    return CompressionOptions{};
}

std::vector<std::string> validate_options(const CompressionOptions& options) {
    std::vector<std::string> problems;

    if (options.quality < 1 || options.quality > 100) {
        problems.push_back("quality must be within 1-100, got " + std::to_string(options.quality));
    }
    if (options.compression_level < 0 || options.compression_level > 9) {
        problems.push_back("compression level must be within 0-9, got " +
                           std::to_string(options.compression_level));
    }
    if (!std::isfinite(options.resize_percent) ||
        options.resize_percent < 0 || options.resize_percent > 100) {
        problems.push_back("resize percent must be within 0-100");
    }
    if (options.resize_width < 0) {
        problems.push_back("resize width must not be negative");
    }
    if (options.resize_height < 0) {
        problems.push_back("resize height must not be negative");
    }

    return problems;
}

double calculate_reduction(std::uintmax_t input_size, std::uintmax_t output_size) {
    if (input_size == 0) return 0;
    return (1.0 - static_cast<double>(output_size) / static_cast<double>(input_size)) * 100.0;
}

std::string format_bytes(std::uintmax_t bytes) {
    constexpr std::uintmax_t unit = 1024;
    if (bytes < unit) {
        return std::to_string(bytes) + " B";
    }

    std::uintmax_t div = unit;
    int exp = 0;
    for (std::uintmax_t n = bytes / unit; n >= unit; n /= unit) {
        div *= unit;
        exp++;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %cB",
                  static_cast<double>(bytes) / static_cast<double>(div), "KMGTPE"[exp]);
    return buf;
}

} // namespace imgshrink
