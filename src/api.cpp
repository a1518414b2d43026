#include "imgshrink/api.hpp"
#include "imgshrink/format.hpp"
#include "imgshrink/resize.hpp"
#include "imgshrink/size_estimator.hpp"
#include <algorithm>
#include <system_error>

namespace imgshrink {

const Compressor& ImageApi::compressor_for(ImageFormat format) const {
    if (format == ImageFormat::Png) return png_;
    return jpeg_;
}

CompressionResult ImageApi::compress(const std::filesystem::path& input,
                                     const CompressionOptions& options) const {
    auto format = detect_format(input);
    if (!format) {
        CompressionResult result;
        result.input_path = input;
        result.success = false;
        result.error = Error{ErrorKind::UnsupportedFormat,
                             "unsupported image format: " + input.extension().string()};
        return result;
    }
    return compressor_for(*format).compress(input, options);
}

ImageInfo ImageApi::get_info(const std::filesystem::path& path) const {
    return read_image_info(path);
}

std::uintmax_t ImageApi::estimate_size(const std::filesystem::path& path,
                                       const CompressionOptions& options) const {
    return compressor_for(resolve_format(path)).estimate_size(path, options);
}

CompressionPreview ImageApi::preview(const std::filesystem::path& path,
                                     const CompressionOptions& options) const {
    ImageInfo info = get_info(path);

    CompressionPreview preview;
    preview.input_path = path;
    preview.input_size = info.size;
    preview.estimated_size = imgshrink::estimate_size(info.format, info.size, options);
    preview.estimated_reduction = calculate_reduction(info.size, preview.estimated_size);
    preview.format = info.format;
    preview.width = info.width;
    preview.height = info.height;

    Dimensions target = compute_target_dimensions({info.width, info.height}, options);
    preview.new_width = target.width;
    preview.new_height = target.height;
    return preview;
}

BatchResult ImageApi::batch_compress(const std::vector<std::filesystem::path>& paths,
                                     const CompressionOptions& options,
                                     ProgressQueue* progress) const {
    BatchOrchestrator orchestrator(
        [this](const std::filesystem::path& path, const CompressionOptions& opts) {
            return compress(path, opts);
        });
    return orchestrator.run(paths, options, progress);
}

std::vector<std::filesystem::path> ImageApi::scan_directory(const std::filesystem::path& dir,
                                                            bool recursive) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        throw ImageError(ErrorKind::InputUnreadable, "not a directory: " + dir.string());
    }

    std::vector<std::filesystem::path> images;
    auto consider = [&images](const std::filesystem::directory_entry& entry) {
        std::error_code entry_ec;
        // SYMLINK FIX: keine symlinks, sonst endlosschleifen
        if (entry.is_symlink(entry_ec)) return;
        if (entry.is_regular_file(entry_ec) && is_supported(entry.path())) {
            images.push_back(entry.path());
        }
    };

    try {
        const auto opts = std::filesystem::directory_options::skip_permission_denied;
        if (recursive) {
            for (const auto& entry : std::filesystem::recursive_directory_iterator(dir, opts)) {
                consider(entry);
            }
        } else {
            for (const auto& entry : std::filesystem::directory_iterator(dir, opts)) {
                consider(entry);
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw ImageError(ErrorKind::InputUnreadable,
                         "failed to scan directory " + dir.string() + ": " + e.what());
    }

    std::sort(images.begin(), images.end());
    return images;
}

void ImageApi::validate_image(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw ImageError(ErrorKind::InputUnreadable, "file does not exist: " + path.string());
    }

    ImageFormat format = resolve_format(path);

    try {
        probe_file(path, format);
    } catch (const ImageError& e) {
        throw ImageError(e.kind(), std::string("invalid ") + to_string(format) + " image: " + e.what());
    }
}

} // namespace imgshrink
