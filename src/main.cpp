#include "imgshrink/cli.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        int exit_code = 1;
        auto config = imgshrink::CLI::parse(argc, argv, exit_code);
        if (!config) {
            return exit_code;
        }

        return imgshrink::CLI::run(*config);
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
