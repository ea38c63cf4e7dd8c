/**
 * @file log.hpp
 * @brief Line-oriented console logging shared by concurrent conversions
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef DEFORMATION_CLOUD_LOG_HPP
#define DEFORMATION_CLOUD_LOG_HPP

#include <string>

namespace deformation_cloud {

/**
 * @brief Write an informational line to stdout (suppressed in quiet mode)
 */
void logInfo(const std::string& message);

/**
 * @brief Write a "Warning: " line to stderr
 */
void logWarning(const std::string& message);

/**
 * @brief Write an "Error: " line to stderr
 */
void logError(const std::string& message);

/**
 * @brief Enable or disable quiet mode; warnings and errors are always shown
 */
void setLogQuiet(bool quiet);

bool isLogQuiet();

} // namespace deformation_cloud

#endif // DEFORMATION_CLOUD_LOG_HPP
