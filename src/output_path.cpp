#include "imgshrink/output_path.hpp"

namespace imgshrink {

std::filesystem::path generate_output_path(const std::filesystem::path& input,
                                           const CompressionOptions& options) {
    std::filesystem::path dir = options.output_dir.empty() ? input.parent_path() : options.output_dir;

    // nur der dateiname, extension bleibt wie sie war (auch gross geschrieben)
    std::filesystem::path filename = input.stem();
    filename += options.output_suffix;
    filename += input.extension();

    return dir / filename;
}

} // namespace imgshrink
