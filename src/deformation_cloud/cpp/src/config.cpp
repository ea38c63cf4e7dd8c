/**
 * @file config.cpp
 * @brief YAML configuration loading
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "deformation_cloud/config.hpp"
#include "deformation_cloud/errors.hpp"
#include "deformation_cloud/log.hpp"
#include "deformation_cloud/writers.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace deformation_cloud {

namespace {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
    if (node[key]) {
        value = node[key].as<T>();
    }
}

char parseDelimiter(const std::string& text) {
    if (text == "space" || text == " ") return ' ';
    if (text == "comma" || text == ",") return ',';
    if (text == "tab" || text == "\t") return '\t';
    throw ConfigError("Unsupported text delimiter '" + text + "' (use space, comma or tab)");
}

ConversionConfig parse(const YAML::Node& root) {
    ConversionConfig cfg;

    if (auto paths = root["paths"]) {
        std::string results;
        load(paths, "results", results);
        if (!results.empty()) {
            std::filesystem::path base(results);
            cfg.input_dir = (base / "deformation").string();
            cfg.output_dir = (base / "point_cloud").string();
        }
    }

    auto point_cloud = root["point_cloud"];
    if (!point_cloud) {
        return cfg;
    }

    if (auto n = point_cloud["conversion"]) {
        load(n, "input_dir", cfg.input_dir);
        load(n, "output_dir", cfg.output_dir);
        load(n, "resolution", cfg.sampling.stride);
        load(n, "coherence_threshold", cfg.sampling.coherence_threshold);
        load(n, "deformation_suffix", cfg.deformation_suffix);
        load(n, "coherence_suffix", cfg.coherence_suffix);
        load(n, "raster_extensions", cfg.raster_extensions);
        load(n, "formats", cfg.formats);
        load(n, "workers", cfg.workers);

        std::string delimiter;
        load(n, "delimiter", delimiter);
        if (!delimiter.empty()) {
            cfg.text_delimiter = parseDelimiter(delimiter);
        }

        if (n["interpolation"]) {
            logWarning("[Config] point_cloud.conversion.interpolation is ignored; "
                       "points are taken at cell indices without interpolation");
        }
    }

    return cfg;
}

} // namespace

ConversionConfig loadConfig(const std::string& config_file) {
    ConversionConfig cfg;
    try {
        YAML::Node root = YAML::LoadFile(config_file);
        cfg = parse(root);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Cannot open config file: " + config_file);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid config file " + config_file + ": " + e.what());
    }

    validateConfig(cfg);
    return cfg;
}

void validateConfig(const ConversionConfig& config) {
    if (config.sampling.stride < 1) {
        throw ConfigError("Decimation stride (resolution) must be >= 1");
    }
    if (!(config.sampling.coherence_threshold >= 0.0 &&
          config.sampling.coherence_threshold <= 1.0)) {
        throw ConfigError("Coherence threshold must lie in [0, 1]");
    }
    if (config.workers < 1) {
        throw ConfigError("Worker count must be >= 1");
    }
    if (config.deformation_suffix.empty()) {
        throw ConfigError("Deformation suffix must not be empty");
    }
    if (config.coherence_suffix == config.deformation_suffix) {
        throw ConfigError("Coherence and deformation suffixes must differ");
    }
    if (config.raster_extensions.empty()) {
        throw ConfigError("At least one raster extension is required");
    }
    if (config.formats.empty()) {
        throw ConfigError("At least one output format is required");
    }

    const std::vector<std::string> known = availableFormats();
    for (const auto& format : config.formats) {
        if (std::find(known.begin(), known.end(), format) == known.end()) {
            throw ConfigError("Unknown output format: " + format);
        }
    }
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

int parseInteger(const std::string& text, const std::string& what) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::invalid_argument&) {
        consumed = 0;
    } catch (const std::out_of_range&) {
        throw ConfigError(what + " is out of range: '" + text + "'");
    }
    if (consumed == 0 || consumed != text.size()) {
        throw ConfigError(what + " must be an integer, got '" + text + "'");
    }
    return value;
}

double parseReal(const std::string& text, const std::string& what) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::invalid_argument&) {
        consumed = 0;
    } catch (const std::out_of_range&) {
        throw ConfigError(what + " is out of range: '" + text + "'");
    }
    if (consumed == 0 || consumed != text.size()) {
        throw ConfigError(what + " must be a number, got '" + text + "'");
    }
    return value;
}

} // namespace deformation_cloud
