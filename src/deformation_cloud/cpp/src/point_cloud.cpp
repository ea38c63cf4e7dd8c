/**
 * @file point_cloud.cpp
 * @brief Implementation of the point cloud and its builder
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "deformation_cloud/point_cloud.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace deformation_cloud {

PointCloud::PointCloud(std::vector<GeoPoint> points, PointAttributeSet attributes,
                       std::string crs)
    : points_(std::move(points)),
      attributes_(std::move(attributes)),
      crs_(std::move(crs))
{
    if (attributes_.getPointCount() != points_.size()) {
        throw std::invalid_argument(
            "Attribute set covers " + std::to_string(attributes_.getPointCount()) +
            " points but the cloud has " + std::to_string(points_.size()));
    }
}

std::tuple<double, double, double, double, double, double> PointCloud::getBounds() const {
    if (points_.empty()) {
        return std::make_tuple(0.0, 0.0, 0.0, 0.0, 0.0, 0.0);
    }

    double min_x = points_[0].x, max_x = points_[0].x;
    double min_y = points_[0].y, max_y = points_[0].y;
    double min_z = points_[0].z, max_z = points_[0].z;

    for (const auto& point : points_) {
        min_x = std::min(min_x, point.x);
        min_y = std::min(min_y, point.y);
        min_z = std::min(min_z, point.z);

        max_x = std::max(max_x, point.x);
        max_y = std::max(max_y, point.y);
        max_z = std::max(max_z, point.z);
    }

    return std::make_tuple(min_x, min_y, min_z, max_x, max_y, max_z);
}

const GeoPoint& PointCloud::getPoint(size_t index) const {
    if (index >= points_.size()) {
        throw std::out_of_range("Point index out of range");
    }
    return points_[index];
}

PointCloud buildPointCloud(const RasterGrid& deformation,
                           const RasterGrid* coherence,
                           const GeoTransform& transform,
                           const std::vector<CellIndex>& cells)
{
    if (coherence) {
        requireSameShape(deformation, *coherence);
    }

    std::vector<GeoPoint> points;
    std::vector<double> deformation_values;
    std::vector<double> coherence_values;
    points.reserve(cells.size());
    deformation_values.reserve(cells.size());
    coherence_values.reserve(cells.size());

    for (const auto& cell : cells) {
        const double z = deformation.getValue(cell.row, cell.col);
        auto [x, y] = cellToGround(cell.row, cell.col, transform);

        points.push_back(GeoPoint{x, y, z});
        deformation_values.push_back(z);
        coherence_values.push_back(coherence ? coherence->getValue(cell.row, cell.col)
                                             : kFullCoherence);
    }

    PointAttributeSet attributes(points.size());
    attributes.addAttribute(kDeformationAttribute, std::move(deformation_values));
    attributes.addAttribute(kCoherenceAttribute, std::move(coherence_values));

    return PointCloud(std::move(points), std::move(attributes), deformation.getCrs());
}

} // namespace deformation_cloud
