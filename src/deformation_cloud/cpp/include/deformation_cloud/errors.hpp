/**
 * @file errors.hpp
 * @brief Exception types raised by the deformation point cloud engine
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef DEFORMATION_CLOUD_ERRORS_HPP
#define DEFORMATION_CLOUD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace deformation_cloud {

/**
 * @class RasterReadError
 * @brief Raster file is missing, unreadable or malformed
 */
class RasterReadError : public std::runtime_error {
public:
    RasterReadError(const std::string& path, const std::string& reason)
        : std::runtime_error("Failed to read raster " + path + ": " + reason),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @class DimensionMismatchError
 * @brief Coherence grid shape differs from the deformation grid shape
 */
class DimensionMismatchError : public std::runtime_error {
public:
    explicit DimensionMismatchError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class WriteError
 * @brief Point cloud output could not be written
 */
class WriteError : public std::runtime_error {
public:
    WriteError(const std::string& path, const std::string& reason)
        : std::runtime_error("Failed to write " + path + ": " + reason),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @class InputDirectoryError
 * @brief Input directory cannot be scanned (fatal for a conversion run)
 */
class InputDirectoryError : public std::runtime_error {
public:
    explicit InputDirectoryError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class ConfigError
 * @brief Configuration file is unreadable or holds out-of-range values
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace deformation_cloud

#endif // DEFORMATION_CLOUD_ERRORS_HPP
