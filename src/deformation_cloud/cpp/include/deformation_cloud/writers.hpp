/**
 * @file writers.hpp
 * @brief Point cloud serializers (LAS binary and delimited text)
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef DEFORMATION_CLOUD_WRITERS_HPP
#define DEFORMATION_CLOUD_WRITERS_HPP

#include <limits>
#include <memory>
#include <string>
#include <tuple>
#include <vector>

#include "point_cloud.hpp"

namespace deformation_cloud {

/**
 * @class PointCloudWriter
 * @brief Base class for point cloud output formats
 *
 * Implementations write the whole cloud or nothing: output goes to a
 * temporary sibling file that is renamed over the target only after the
 * encoder has finished.
 */
class PointCloudWriter {
public:
    virtual ~PointCloudWriter() = default;

    /**
     * @brief Serialize a point cloud
     * @param cloud Cloud to write (may be empty)
     * @param output_file Destination path
     * @throws WriteError on any filesystem or encoder failure
     */
    virtual void write(const PointCloud& cloud, const std::string& output_file) const = 0;

    /**
     * @brief File extension of the format, including the leading dot
     */
    virtual std::string extension() const = 0;

    /**
     * @brief Short format name used in configuration ("las", "xyz")
     */
    virtual std::string formatName() const = 0;
};

/**
 * @class LasPointCloudWriter
 * @brief LAS 1.4 writer backed by PDAL
 *
 * X, Y and Z are standard LAS dimensions. Every attribute is declared as a
 * float extra-bytes dimension in insertion order. The cloud CRS, when set,
 * is written as the file's spatial reference.
 */
class LasPointCloudWriter : public PointCloudWriter {
public:
    static constexpr int kMinorVersion = 4;
    static constexpr int kPointFormat = 7;

    void write(const PointCloud& cloud, const std::string& output_file) const override;
    std::string extension() const override { return ".las"; }
    std::string formatName() const override { return "las"; }
};

/**
 * @struct TextWriterOptions
 * @brief Formatting of the delimited text output
 */
struct TextWriterOptions {
    char delimiter = ' ';
    int precision = std::numeric_limits<double>::max_digits10;
};

/**
 * @class TextPointCloudWriter
 * @brief Delimited text writer: header "X Y Z <attributes...>" then one row per point
 */
class TextPointCloudWriter : public PointCloudWriter {
public:
    explicit TextPointCloudWriter(const TextWriterOptions& options = TextWriterOptions());

    void write(const PointCloud& cloud, const std::string& output_file) const override;
    std::string extension() const override { return ".xyz"; }
    std::string formatName() const override { return "xyz"; }

    const TextWriterOptions& getOptions() const { return options_; }

private:
    TextWriterOptions options_;
};

/**
 * @brief Read a LAS file written by LasPointCloudWriter
 *
 * Every extra-bytes dimension becomes an attribute, in header order.
 *
 * @param input_file LAS file path
 * @return Point cloud with coordinates, attributes and CRS
 * @throws std::runtime_error if the file cannot be read
 */
PointCloud readLasPointCloud(const std::string& input_file);

/**
 * @struct LasHeaderInfo
 * @brief Header summary of a LAS file, read without loading its points
 */
struct LasHeaderInfo {
    size_t point_count = 0;
    std::tuple<double, double, double, double, double, double> bounds;  ///< (min_x, min_y, min_z, max_x, max_y, max_z)
    std::string crs;                                                     ///< WKT, empty if the file has none
    std::vector<std::string> dimension_names;
};

/**
 * @brief Read the header of a LAS file
 * @throws std::runtime_error if the file cannot be read
 */
LasHeaderInfo readLasHeader(const std::string& input_file);

/**
 * @brief Parse a text file written by TextPointCloudWriter
 * @param input_file Text file path
 * @param delimiter Column delimiter (' ' accepts any run of whitespace)
 * @return Point cloud with the columns after X Y Z as attributes
 * @throws std::runtime_error on a missing file, bad header or malformed row
 */
PointCloud readTextPointCloud(const std::string& input_file, char delimiter = ' ');

/**
 * @brief Names accepted by makeWriter()
 */
std::vector<std::string> availableFormats();

/**
 * @brief Create a writer by format name
 * @param format "las" or "xyz"
 * @param text_options Options used by the text writer
 * @throws std::invalid_argument for an unknown format
 */
std::unique_ptr<PointCloudWriter> makeWriter(
    const std::string& format,
    const TextWriterOptions& text_options = TextWriterOptions());

namespace detail {

/**
 * @brief Sibling path used while a writer is producing output_file
 *
 * Keeps the final extension so format detection by suffix still works.
 */
std::string temporaryPathFor(const std::string& output_file);

/**
 * @brief Move a finished temporary file over its target
 * @throws WriteError if the rename fails (the temporary file is removed)
 */
void commitTemporary(const std::string& temporary_file, const std::string& output_file);

/**
 * @brief Remove a temporary file, ignoring a file that does not exist
 */
void discardTemporary(const std::string& temporary_file);

} // namespace detail

} // namespace deformation_cloud

#endif // DEFORMATION_CLOUD_WRITERS_HPP
