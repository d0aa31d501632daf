#include "omr/BatchRunner.hpp"
#include "omr/OmrConfig.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

void printUsage(const char* prog) {
    std::cout << "Usage: " << prog << " <marker_image> <bubbles.csv> <parsed_folder> [options]\n"
              << "\n"
              << "Reads every scanned page under <parsed_folder>/<page>/ and writes\n"
              << "per-page CSVs, review PDFs and consolidated_answers.csv to\n"
              << "<parsed_folder>_OMR.\n"
              << "\n"
              << "Options:\n"
              << "  --min-jump <v>          minimum intensity gap between marked and blank (25)\n"
              << "  --global-threshold <v>  intensity at or above which nothing is marked (210)\n"
              << "  --default-dpi <v>       resolution for images without DPI metadata (200)\n"
              << "  --verbose               debug logging\n"
              << "  --help                  this text\n";
}

bool parseValue(const std::string& flag, const char* text, double& out) {
    try {
        size_t used = 0;
        out = std::stod(text, &used);
        if (used == std::string(text).size() && out > 0) return true;
    } catch (const std::exception&) {
    }
    std::cerr << "Invalid value for " << flag << ": " << text << "\n";
    return false;
}

}

int main(int argc, char** argv) {
    omr::OmrConfig config;
    std::vector<std::string> positional;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
            continue;
        }
        if (arg == "--min-jump" || arg == "--global-threshold" || arg == "--default-dpi") {
            if (i + 1 >= argc) {
                std::cerr << arg << " needs a value\n";
                return 2;
            }
            double* target = arg == "--min-jump" ? &config.minJump
                           : arg == "--global-threshold" ? &config.globalThreshold
                           : &config.defaultDpi;
            if (!parseValue(arg, argv[++i], *target)) return 2;
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
        positional.push_back(arg);
    }

    if (positional.size() != 3) {
        printUsage(argv[0]);
        return 2;
    }

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);

    try {
        omr::BatchRunner runner(config);
        omr::BatchSummary s = runner.run(positional[0], positional[1], positional[2]);

        std::cout << "\n=== OMR SUMMARY ===\n";
        std::cout << "Page folders:   " << s.pageGroups << "\n";
        std::cout << "Images:         " << s.images << "\n";
        std::cout << "Scans read:     " << s.scansRead << "\n";
        std::cout << "Scans failed:   " << s.scansFailed << "\n";
        std::cout << "Students:       " << s.students << "\n";
        std::cout << "Output folder:  " << s.outputDir.string() << "\n";
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
