/**
 * @file text_writer.cpp
 * @brief Delimited text (XYZ) point cloud output and parsing
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "deformation_cloud/writers.hpp"
#include "deformation_cloud/errors.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace deformation_cloud {

namespace {

std::vector<std::string> splitFields(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    if (delimiter == ' ') {
        std::istringstream stream(line);
        std::string field;
        while (stream >> field) {
            fields.push_back(field);
        }
        return fields;
    }

    std::string field;
    std::istringstream stream(line);
    while (std::getline(stream, field, delimiter)) {
        fields.push_back(field);
    }
    return fields;
}

double parseNumber(const std::string& text, const std::string& input_file, size_t line_number) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != text.size()) {
        throw std::runtime_error(input_file + ":" + std::to_string(line_number) +
                                 ": not a number: '" + text + "'");
    }
    return value;
}

} // namespace

TextPointCloudWriter::TextPointCloudWriter(const TextWriterOptions& options)
    : options_(options)
{
    if (options_.precision < 1) {
        throw std::invalid_argument("Text writer precision must be positive");
    }
}

void TextPointCloudWriter::write(const PointCloud& cloud, const std::string& output_file) const {
    const std::string temporary = detail::temporaryPathFor(output_file);
    const char delimiter = options_.delimiter;

    {
        std::ofstream file(temporary);
        if (!file.is_open()) {
            throw WriteError(output_file, "cannot open " + temporary + ": " + std::strerror(errno));
        }

        const PointAttributeSet& attributes = cloud.getAttributes();
        file << "X" << delimiter << "Y" << delimiter << "Z";
        for (const auto& entry : attributes) {
            file << delimiter << entry.first;
        }
        file << '\n';

        std::vector<const std::vector<double>*> columns;
        for (const auto& entry : attributes) {
            columns.push_back(&entry.second);
        }

        file << std::setprecision(options_.precision);
        const auto& points = cloud.getPoints();
        for (size_t i = 0; i < points.size() && file; i++) {
            file << points[i].x << delimiter << points[i].y << delimiter << points[i].z;
            for (const auto* column : columns) {
                file << delimiter << (*column)[i];
            }
            file << '\n';
        }

        file.flush();
        if (!file) {
            file.close();
            detail::discardTemporary(temporary);
            throw WriteError(output_file, "stream error while writing " + temporary);
        }
        file.close();
        if (file.fail()) {
            detail::discardTemporary(temporary);
            throw WriteError(output_file, "failed to close " + temporary);
        }
    }

    detail::commitTemporary(temporary, output_file);
}

PointCloud readTextPointCloud(const std::string& input_file, char delimiter) {
    std::ifstream file(input_file);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + input_file);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error(input_file + ": missing header line");
    }

    std::vector<std::string> header = splitFields(line, delimiter);
    if (header.size() < 3 || header[0] != "X" || header[1] != "Y" || header[2] != "Z") {
        throw std::runtime_error(input_file + ": header must start with X Y Z");
    }

    const size_t attribute_count = header.size() - 3;
    std::vector<GeoPoint> points;
    std::vector<std::vector<double>> columns(attribute_count);

    size_t line_number = 1;
    while (std::getline(file, line)) {
        line_number++;
        if (line.empty()) {
            continue;
        }

        std::vector<std::string> fields = splitFields(line, delimiter);
        if (fields.size() != header.size()) {
            throw std::runtime_error(input_file + ":" + std::to_string(line_number) +
                                     ": expected " + std::to_string(header.size()) +
                                     " columns, found " + std::to_string(fields.size()));
        }

        points.push_back(GeoPoint{parseNumber(fields[0], input_file, line_number),
                                  parseNumber(fields[1], input_file, line_number),
                                  parseNumber(fields[2], input_file, line_number)});
        for (size_t a = 0; a < attribute_count; a++) {
            columns[a].push_back(parseNumber(fields[a + 3], input_file, line_number));
        }
    }

    PointAttributeSet attributes(points.size());
    for (size_t a = 0; a < attribute_count; a++) {
        attributes.addAttribute(header[a + 3], std::move(columns[a]));
    }

    return PointCloud(std::move(points), std::move(attributes));
}

} // namespace deformation_cloud
