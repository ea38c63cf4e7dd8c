// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Scott Friedman and Project Contributors

#include "deformation_cloud/config.hpp"
#include "deformation_cloud/conversion.hpp"
#include "deformation_cloud/errors.hpp"
#include "deformation_cloud/log.hpp"
#include <iostream>
#include <string>
#include <cstdlib>
#include <map>
#include <stdexcept>

using namespace deformation_cloud;

namespace {

const int kExitSuccess = 0;
const int kExitFatal = 1;
const int kExitPartialFailure = 2;

} // namespace

// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n";
    std::cout << "Convert deformation/coherence raster pairs into point clouds.\n";
    std::cout << "Options:\n";
    std::cout << "  --config FILE             Processing parameters YAML file\n";
    std::cout << "  --input-dir DIR           Directory holding *_unwrap rasters\n";
    std::cout << "  --output-dir DIR          Directory receiving the point clouds\n";
    std::cout << "  --stride N                Keep every N-th row and column (default: 5)\n";
    std::cout << "  --coherence-threshold T   Minimum coherence kept, in [0, 1] (default: 0.3)\n";
    std::cout << "  --formats LIST            Comma-separated output formats: las,xyz (default: las,xyz)\n";
    std::cout << "  --workers N               Pairs converted concurrently (default: 1)\n";
    std::cout << "  --quiet                   Only print warnings and errors\n";
    std::cout << "  --help                    Display this help message\n";
    std::cout << "Exit status: 0 all pairs converted, 2 some pairs failed, 1 fatal error\n";
}

// Parse command-line arguments
std::map<std::string, std::string> parse_args(int argc, char* argv[]) {
    std::map<std::string, std::string> args;
    args["quiet"] = "false";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            std::exit(kExitSuccess);
        } else if (arg == "--quiet") {
            args["quiet"] = "true";
        } else if (i + 1 < argc) {
            if (arg == "--config") {
                args["config"] = argv[++i];
            } else if (arg == "--input-dir") {
                args["input-dir"] = argv[++i];
            } else if (arg == "--output-dir") {
                args["output-dir"] = argv[++i];
            } else if (arg == "--stride") {
                args["stride"] = argv[++i];
            } else if (arg == "--coherence-threshold") {
                args["coherence-threshold"] = argv[++i];
            } else if (arg == "--formats") {
                args["formats"] = argv[++i];
            } else if (arg == "--workers") {
                args["workers"] = argv[++i];
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                std::exit(kExitFatal);
            }
        } else {
            std::cerr << "Missing argument for option: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(kExitFatal);
        }
    }

    return args;
}

// Config file first, then command-line overrides
ConversionConfig build_config(std::map<std::string, std::string>& args) {
    ConversionConfig config;
    if (args.count("config")) {
        config = loadConfig(args["config"]);
    }

    if (args.count("input-dir")) {
        config.input_dir = args["input-dir"];
    }
    if (args.count("output-dir")) {
        config.output_dir = args["output-dir"];
    }
    if (args.count("stride")) {
        config.sampling.stride = parseInteger(args["stride"], "--stride");
    }
    if (args.count("coherence-threshold")) {
        config.sampling.coherence_threshold =
            parseReal(args["coherence-threshold"], "--coherence-threshold");
    }
    if (args.count("formats")) {
        config.formats = splitList(args["formats"]);
    }
    if (args.count("workers")) {
        config.workers = parseInteger(args["workers"], "--workers");
    }

    if (config.input_dir.empty() || config.output_dir.empty()) {
        throw ConfigError("Input and output directories are required "
                          "(--input-dir/--output-dir or paths.results in --config)");
    }

    validateConfig(config);
    return config;
}

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    setLogQuiet(args["quiet"] == "true");

    ConversionConfig config;
    try {
        config = build_config(args);
    } catch (const ConfigError& e) {
        logError(e.what());
        return kExitFatal;
    }

    logInfo("Input directory:  " + config.input_dir);
    logInfo("Output directory: " + config.output_dir);
    logInfo("Stride: " + std::to_string(config.sampling.stride) +
            ", coherence threshold: " + std::to_string(config.sampling.coherence_threshold) +
            ", workers: " + std::to_string(config.workers));

    ConversionSummary summary;
    try {
        ConversionOrchestrator orchestrator(config);
        summary = orchestrator.run();
    } catch (const InputDirectoryError& e) {
        logError(e.what());
        return kExitFatal;
    } catch (const std::exception& e) {
        logError(e.what());
        return kExitFatal;
    }

    if (!isLogQuiet()) {
        std::cout << "\nConversion summary:\n";
        std::cout << "  Pairs found:     " << summary.pairs_found << "\n";
        std::cout << "  Pairs converted: " << summary.pairs_converted << "\n";
        std::cout << "  Pairs failed:    " << summary.pairs_failed << "\n";
        std::cout << "  Points written:  " << summary.points_written << "\n";
    }

    if (summary.pairs_failed > 0) {
        for (const auto& result : summary.results) {
            if (!result.success) {
                std::cerr << "  failed: " << result.pair.deformation_file
                          << " (" << result.error << ")\n";
            }
        }
        return kExitPartialFailure;
    }
    return kExitSuccess;
}
