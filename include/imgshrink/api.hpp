#pragma once
// die fassade die cli und alles andere benutzen

#include "imgshrink/batch.hpp"
#include "imgshrink/compressor.hpp"
#include "imgshrink/progress_queue.hpp"
#include "imgshrink/types.hpp"
#include <cstdint>
#include <filesystem>
#include <vector>

namespace imgshrink {

// Routes every call through the format resolver to the JPEG or PNG
// compressor. compress() and batch_compress() report failures in their
// results; the inspection calls throw ImageError.
class ImageApi {
public:
    ImageApi() = default;

    CompressionResult compress(const std::filesystem::path& input,
                               const CompressionOptions& options) const;

    ImageInfo get_info(const std::filesystem::path& path) const;

    std::uintmax_t estimate_size(const std::filesystem::path& path,
                                 const CompressionOptions& options) const;

    CompressionPreview preview(const std::filesystem::path& path,
                               const CompressionOptions& options) const;

    BatchResult batch_compress(const std::vector<std::filesystem::path>& paths,
                               const CompressionOptions& options,
                               ProgressQueue* progress = nullptr) const;

    // supported images below dir, sorted. Throws ImageError(InputUnreadable)
    // when dir is not a readable directory.
    std::vector<std::filesystem::path> scan_directory(const std::filesystem::path& dir,
                                                      bool recursive) const;

    // exists + supported extension + parsable header, throws ImageError otherwise
    void validate_image(const std::filesystem::path& path) const;

    CompressionOptions default_options() const { return imgshrink::default_options(); }

private:
    const Compressor& compressor_for(ImageFormat format) const;

    JpegCompressor jpeg_;
    PngCompressor png_;
};

} // namespace imgshrink
