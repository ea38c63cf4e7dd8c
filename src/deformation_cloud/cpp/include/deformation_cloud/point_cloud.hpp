/**
 * @file point_cloud.hpp
 * @brief Attributed point cloud built from a deformation/coherence raster pair
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef DEFORMATION_CLOUD_POINT_CLOUD_HPP
#define DEFORMATION_CLOUD_POINT_CLOUD_HPP

#include <cstddef>
#include <string>
#include <tuple>
#include <vector>

#include "attribute_set.hpp"
#include "raster.hpp"
#include "sampling.hpp"

namespace deformation_cloud {

/// Attribute holding the deformation value of each point
inline const std::string kDeformationAttribute = "deformation";

/// Attribute holding the coherence of each point
inline const std::string kCoherenceAttribute = "coherence";

/// Coherence given to every point when the pair has no coherence raster
constexpr double kFullCoherence = 1.0;

/**
 * @struct GeoPoint
 * @brief Ground coordinates plus the deformation value as z
 */
struct GeoPoint {
    double x;
    double y;
    double z;
};

/**
 * @class PointCloud
 * @brief Ordered points with index-aligned named attributes
 *
 * Immutable once constructed; writers only read it.
 */
class PointCloud {
public:
    PointCloud() = default;

    /**
     * @brief Constructor
     * @param points Points in storage order
     * @param attributes Per-point attributes (point count must match)
     * @param crs Coordinate reference identifier (WKT, may be empty)
     * @throws std::invalid_argument if the attribute point count differs
     */
    PointCloud(std::vector<GeoPoint> points, PointAttributeSet attributes,
               std::string crs = std::string());

    /**
     * @brief Get number of points in the point cloud
     * @return Number of points
     */
    size_t getNumPoints() const { return points_.size(); }

    bool empty() const { return points_.empty(); }

    /**
     * @brief Get point cloud bounds
     * @return Tuple of (min_x, min_y, min_z, max_x, max_y, max_z), all zero when empty
     */
    std::tuple<double, double, double, double, double, double> getBounds() const;

    /**
     * @brief Get point at specified index
     * @throws std::out_of_range if the index is past the end
     */
    const GeoPoint& getPoint(size_t index) const;

    const std::vector<GeoPoint>& getPoints() const { return points_; }
    const PointAttributeSet& getAttributes() const { return attributes_; }
    const std::string& getCrs() const { return crs_; }

private:
    std::vector<GeoPoint> points_;
    PointAttributeSet attributes_;
    std::string crs_;
};

/**
 * @brief Assemble the point cloud of the surviving cells
 *
 * For each cell, (x, y) comes from the geocoding transform and z is the
 * deformation value. Attributes are "deformation" (= z) and "coherence"
 * (the coherence value, or kFullCoherence without a coherence grid).
 *
 * @param deformation Deformation grid
 * @param coherence Coherence grid of identical dimensions, or nullptr
 * @param transform Geocoding transform applied to every cell
 * @param cells Surviving cells, typically SamplingResult::cells
 * @return Point cloud in the order of cells, carrying the deformation CRS
 * @throws DimensionMismatchError if the grids differ in shape
 * @throws std::out_of_range if a cell lies outside the grid
 */
PointCloud buildPointCloud(const RasterGrid& deformation,
                           const RasterGrid* coherence,
                           const GeoTransform& transform,
                           const std::vector<CellIndex>& cells);

} // namespace deformation_cloud

#endif // DEFORMATION_CLOUD_POINT_CLOUD_HPP
