/**
 * @file writers.cpp
 * @brief Writer factory and the write-then-rename helpers shared by all formats
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "deformation_cloud/writers.hpp"
#include "deformation_cloud/errors.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace deformation_cloud {

std::vector<std::string> availableFormats() {
    return {"las", "xyz"};
}

std::unique_ptr<PointCloudWriter> makeWriter(const std::string& format,
                                             const TextWriterOptions& text_options)
{
    if (format == "las") {
        return std::make_unique<LasPointCloudWriter>();
    }
    if (format == "xyz") {
        return std::make_unique<TextPointCloudWriter>(text_options);
    }
    throw std::invalid_argument("Unknown point cloud format: " + format);
}

namespace detail {

std::string temporaryPathFor(const std::string& output_file) {
    fs::path target(output_file);
    fs::path temporary = target.parent_path() /
        (target.stem().string() + ".partial" + target.extension().string());
    return temporary.string();
}

void commitTemporary(const std::string& temporary_file, const std::string& output_file) {
    std::error_code ec;
    fs::rename(temporary_file, output_file, ec);
    if (ec) {
        discardTemporary(temporary_file);
        throw WriteError(output_file, "cannot move finished output into place: " + ec.message());
    }
}

void discardTemporary(const std::string& temporary_file) {
    std::error_code ec;
    fs::remove(temporary_file, ec);
}

} // namespace detail

} // namespace deformation_cloud
