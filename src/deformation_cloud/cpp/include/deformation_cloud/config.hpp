/**
 * @file config.hpp
 * @brief Conversion parameters and their YAML loading
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef DEFORMATION_CLOUD_CONFIG_HPP
#define DEFORMATION_CLOUD_CONFIG_HPP

#include <string>
#include <vector>

#include "sampling.hpp"

namespace deformation_cloud {

/**
 * @struct ConversionConfig
 * @brief Configuration of a directory conversion run
 */
struct ConversionConfig {
    std::string input_dir;                   // Directory holding the raster pairs
    std::string output_dir;                  // Directory receiving the point clouds
    SamplingOptions sampling;                // Stride and coherence threshold
    std::string deformation_suffix = "_unwrap";
    std::string coherence_suffix = "_corr";
    std::vector<std::string> raster_extensions = {
        ".geo", ".grd", ".nc", ".tif", ".tiff"
    };
    std::vector<std::string> formats = {"las", "xyz"};
    char text_delimiter = ' ';
    int workers = 1;                         // Pairs converted concurrently
};

/**
 * @brief Load a processing parameters YAML file
 *
 * Reads paths.results (input = <results>/deformation, output =
 * <results>/point_cloud) and the point_cloud.conversion section. Keys that
 * are absent keep their defaults; unknown keys are ignored.
 *
 * @param config_file YAML file path
 * @return Validated configuration
 * @throws ConfigError if the file cannot be parsed or holds invalid values
 */
ConversionConfig loadConfig(const std::string& config_file);

/**
 * @brief Check value ranges and format names
 * @throws ConfigError describing the first invalid value
 */
void validateConfig(const ConversionConfig& config);

/**
 * @brief Split a comma-separated list, dropping empty entries
 */
std::vector<std::string> splitList(const std::string& text);

/**
 * @brief Parse a whole string as an integer
 * @param what Name of the setting, used in the error message
 * @throws ConfigError if text is empty, has trailing characters or is out of range
 */
int parseInteger(const std::string& text, const std::string& what);

/**
 * @brief Parse a whole string as a real number
 * @param what Name of the setting, used in the error message
 * @throws ConfigError if text is empty, has trailing characters or is out of range
 */
double parseReal(const std::string& text, const std::string& what);

} // namespace deformation_cloud

#endif // DEFORMATION_CLOUD_CONFIG_HPP
