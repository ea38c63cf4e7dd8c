/**
 * @file las_writer.cpp
 * @brief LAS point cloud output and read-back through PDAL
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "deformation_cloud/writers.hpp"
#include "deformation_cloud/errors.hpp"

#include <filesystem>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

// PDAL includes
#include <pdal/Options.hpp>
#include <pdal/PointTable.hpp>
#include <pdal/PointView.hpp>
#include <pdal/QuickInfo.hpp>
#include <pdal/SpatialReference.hpp>
#include <pdal/io/BufferReader.hpp>
#include <pdal/io/LasReader.hpp>
#include <pdal/io/LasWriter.hpp>

namespace deformation_cloud {

namespace {

// Scale used for an axis without extent to derive one from
constexpr double kFallbackScale = 0.001;

std::string extraDimsOption(const PointAttributeSet& attributes) {
    std::string option;
    for (const auto& entry : attributes) {
        if (!option.empty()) {
            option += ",";
        }
        option += entry.first + "=float";
    }
    return option;
}

// Options are stored as text; keep every digit of an offset
std::string formatExact(double value) {
    std::ostringstream stream;
    stream << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return stream.str();
}

// Let PDAL fit scale and offset to the data span; a flat axis gets a fixed
// scale anchored on its single value
void addAxisScaling(pdal::Options& options, const std::string& axis,
                    double min_value, double max_value, bool has_points) {
    if (has_points && max_value > min_value) {
        const std::string automatic = "auto";
        options.add("scale_" + axis, automatic);
        options.add("offset_" + axis, automatic);
    } else {
        options.add("scale_" + axis, formatExact(kFallbackScale));
        options.add("offset_" + axis, formatExact(has_points ? min_value : 0.0));
    }
}

pdal::Options makeWriteOptions(const PointCloud& cloud, const std::string& filename) {
    pdal::Options options;
    options.add("filename", filename);
    options.add("minor_version", LasPointCloudWriter::kMinorVersion);
    options.add("dataformat_id", LasPointCloudWriter::kPointFormat);

    auto [min_x, min_y, min_z, max_x, max_y, max_z] = cloud.getBounds();
    const bool has_points = !cloud.empty();
    addAxisScaling(options, "x", min_x, max_x, has_points);
    addAxisScaling(options, "y", min_y, max_y, has_points);
    addAxisScaling(options, "z", min_z, max_z, has_points);

    if (!cloud.getAttributes().empty()) {
        options.add("extra_dims", extraDimsOption(cloud.getAttributes()));
    }
    if (!cloud.getCrs().empty()) {
        options.add("a_srs", cloud.getCrs());
    }
    return options;
}

void writeLas(const PointCloud& cloud, const std::string& filename) {
    pdal::PointTable table;
    pdal::PointLayoutPtr layout = table.layout();
    layout->registerDim(pdal::Dimension::Id::X);
    layout->registerDim(pdal::Dimension::Id::Y);
    layout->registerDim(pdal::Dimension::Id::Z);

    // Attributes become extra-bytes dimensions, so they must not shadow a LAS field
    std::vector<std::pair<pdal::Dimension::Id, const std::vector<double>*>> attribute_dims;
    for (const auto& entry : cloud.getAttributes()) {
        if (pdal::Dimension::id(entry.first) != pdal::Dimension::Id::Unknown) {
            throw WriteError(filename, "attribute '" + entry.first +
                             "' collides with a standard LAS dimension");
        }
        pdal::Dimension::Id id = layout->registerOrAssignDim(entry.first,
                                                             pdal::Dimension::Type::Float);
        attribute_dims.emplace_back(id, &entry.second);
    }

    pdal::PointViewPtr view(new pdal::PointView(table));
    const auto& points = cloud.getPoints();
    for (size_t i = 0; i < points.size(); i++) {
        pdal::PointId id = view->size();
        view->setField(pdal::Dimension::Id::X, id, points[i].x);
        view->setField(pdal::Dimension::Id::Y, id, points[i].y);
        view->setField(pdal::Dimension::Id::Z, id, points[i].z);

        for (const auto& dim : attribute_dims) {
            view->setField(dim.first, id, static_cast<float>((*dim.second)[i]));
        }
    }

    pdal::BufferReader reader;
    reader.addView(view);

    pdal::LasWriter writer;
    writer.setOptions(makeWriteOptions(cloud, filename));
    writer.setInput(reader);
    writer.prepare(table);
    writer.execute(table);
}

} // namespace

void LasPointCloudWriter::write(const PointCloud& cloud, const std::string& output_file) const {
    const std::string temporary = detail::temporaryPathFor(output_file);
    try {
        writeLas(cloud, temporary);
    } catch (const WriteError&) {
        detail::discardTemporary(temporary);
        throw;
    } catch (const std::exception& e) {
        detail::discardTemporary(temporary);
        throw WriteError(output_file, e.what());
    }
    detail::commitTemporary(temporary, output_file);
}

PointCloud readLasPointCloud(const std::string& input_file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(input_file, ec)) {
        throw std::runtime_error("LAS file does not exist: " + input_file);
    }

    pdal::Options options;
    options.add("filename", input_file);

    pdal::LasReader reader;
    reader.setOptions(options);

    pdal::PointTable table;
    reader.prepare(table);
    pdal::PointViewSet view_set = reader.execute(table);

    // Extra-bytes dimensions are the ones PDAL does not know by name
    pdal::PointLayoutPtr layout = table.layout();
    std::vector<std::pair<std::string, pdal::Dimension::Id>> extra_dims;
    for (pdal::Dimension::Id id : layout->dims()) {
        std::string name = layout->dimName(id);
        if (pdal::Dimension::id(name) == pdal::Dimension::Id::Unknown) {
            extra_dims.emplace_back(name, id);
        }
    }

    std::vector<GeoPoint> points;
    std::vector<std::vector<double>> columns(extra_dims.size());
    for (const pdal::PointViewPtr& view : view_set) {
        for (pdal::PointId i = 0; i < view->size(); i++) {
            points.push_back(GeoPoint{
                view->getFieldAs<double>(pdal::Dimension::Id::X, i),
                view->getFieldAs<double>(pdal::Dimension::Id::Y, i),
                view->getFieldAs<double>(pdal::Dimension::Id::Z, i)});
            for (size_t d = 0; d < extra_dims.size(); d++) {
                columns[d].push_back(view->getFieldAs<double>(extra_dims[d].second, i));
            }
        }
    }

    PointAttributeSet attributes(points.size());
    for (size_t d = 0; d < extra_dims.size(); d++) {
        attributes.addAttribute(extra_dims[d].first, std::move(columns[d]));
    }

    return PointCloud(std::move(points), std::move(attributes),
                      table.anySpatialReference().getWKT());
}

LasHeaderInfo readLasHeader(const std::string& input_file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(input_file, ec)) {
        throw std::runtime_error("LAS file does not exist: " + input_file);
    }

    pdal::Options options;
    options.add("filename", input_file);

    pdal::LasReader reader;
    reader.setOptions(options);

    pdal::QuickInfo info = reader.preview();
    if (!info.valid()) {
        throw std::runtime_error("Cannot read LAS header: " + input_file);
    }

    LasHeaderInfo header;
    header.point_count = static_cast<size_t>(info.m_pointCount);
    if (header.point_count > 0) {
        header.bounds = std::make_tuple(info.m_bounds.minx, info.m_bounds.miny, info.m_bounds.minz,
                                        info.m_bounds.maxx, info.m_bounds.maxy, info.m_bounds.maxz);
    } else {
        header.bounds = std::make_tuple(0.0, 0.0, 0.0, 0.0, 0.0, 0.0);
    }
    header.crs = info.m_srs.getWKT();
    header.dimension_names = info.m_dimNames;
    return header;
}

} // namespace deformation_cloud
