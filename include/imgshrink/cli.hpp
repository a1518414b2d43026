#pragma once
// cli parsing und so

#include "imgshrink/types.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace imgshrink {

class ImageApi;

enum class CliMode {
    Compress,
    Estimate,   // nur previews, nix wird geschrieben
    Info
};

struct CLIConfig {
    std::vector<std::filesystem::path> input_paths;
    CompressionOptions options;
    CliMode mode = CliMode::Compress;
    bool recursive = false;
    bool verbose = false;
};

class CLI {
public:
    // nullopt after printing the problem (or help/version, see exit_code)
    static std::optional<CLIConfig> parse(int argc, char* argv[], int& exit_code);
    static void print_help();
    static void print_version();
    static int run(const CLIConfig& config);

private:
    static std::vector<std::filesystem::path> collect_files(
        const ImageApi& api,
        const std::vector<std::filesystem::path>& paths,
        bool recursive
    );
    static int run_info(const ImageApi& api, const std::vector<std::filesystem::path>& files);
    static int run_estimate(const ImageApi& api, const std::vector<std::filesystem::path>& files,
                            const CompressionOptions& options);
    static void print_summary(const BatchResult& batch, double total_time_ms);
};

} // namespace imgshrink
