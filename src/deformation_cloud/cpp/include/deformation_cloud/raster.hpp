/**
 * @file raster.hpp
 * @brief Geo-referenced single-band rasters and the geocoding transform
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef DEFORMATION_CLOUD_RASTER_HPP
#define DEFORMATION_CLOUD_RASTER_HPP

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace deformation_cloud {

/**
 * @struct GeoTransform
 * @brief Geospatial transformation parameters (affine transformation)
 *
 * Follows the GDAL GeoTransform convention:
 * - parameters[0]: origin x (top-left corner)
 * - parameters[1]: pixel width (w-e resolution)
 * - parameters[2]: row rotation (typically 0)
 * - parameters[3]: origin y (top-left corner)
 * - parameters[4]: column rotation (typically 0)
 * - parameters[5]: pixel height (n-s resolution, negative for north-up)
 */
struct GeoTransform {
    double parameters[6] = {0.0, 1.0, 0.0, 0.0, 0.0, 1.0};

    /**
     * @brief Build a north-up transform without rotation terms
     * @param origin_x Ground x of cell (0, 0)
     * @param origin_y Ground y of cell (0, 0)
     * @param pixel_width Ground step per column
     * @param pixel_height Ground step per row (negative for north-up rasters)
     */
    static GeoTransform northUp(double origin_x, double origin_y,
                                double pixel_width, double pixel_height);

    double originX() const { return parameters[0]; }
    double pixelWidth() const { return parameters[1]; }
    double rotationX() const { return parameters[2]; }
    double originY() const { return parameters[3]; }
    double rotationY() const { return parameters[4]; }
    double pixelHeight() const { return parameters[5]; }

    /**
     * @brief Convert a cell index to ground coordinates
     *
     * Evaluated at the cell index itself (the cell's top-left corner), not
     * at the cell center.
     *
     * @param row Row index
     * @param col Column index
     * @return Tuple of (x, y) in ground coordinates
     */
    std::tuple<double, double> cellToGround(int row, int col) const;

    /**
     * @brief Ground bounding box spanned by every cell index of a grid
     * @param width Number of columns
     * @param height Number of rows
     * @return Tuple of (min_x, min_y, max_x, max_y)
     */
    std::tuple<double, double, double, double> groundBounds(int width, int height) const;
};

/**
 * @brief Convert a cell index to ground coordinates
 * @param row Row index
 * @param col Column index
 * @param transform Geocoding transform of the raster
 * @return Tuple of (x, y) in ground coordinates
 */
std::tuple<double, double> cellToGround(int row, int col, const GeoTransform& transform);

/**
 * @class RasterGrid
 * @brief Immutable in-memory copy of one raster band plus its georeferencing
 *
 * Cell values are stored row-major as double so that float32 and float64
 * inputs keep their exact values.
 */
class RasterGrid {
public:
    /**
     * @brief Constructor
     * @param width Number of columns (> 0)
     * @param height Number of rows (> 0)
     * @param values Row-major cell values, exactly width * height entries
     * @param transform Geocoding transform
     * @param crs Coordinate reference identifier (WKT, may be empty)
     * @param nodata_value Band no-data value, if the band declares one
     * @param data_type Name of the source pixel type (e.g. "Float32")
     * @param source_path File the grid was read from (empty for in-memory grids)
     */
    RasterGrid(int width, int height, std::vector<double> values,
               const GeoTransform& transform,
               std::string crs = std::string(),
               std::optional<double> nodata_value = std::nullopt,
               std::string data_type = "Float64",
               std::string source_path = std::string());

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }

    /**
     * @brief Get raster dimensions
     * @return Tuple of (width, height)
     */
    std::tuple<int, int> getDimensions() const;

    /**
     * @brief Check whether another grid has the same width and height
     */
    bool sameShape(const RasterGrid& other) const;

    /**
     * @brief Get the value of one cell
     * @throws std::out_of_range if the index is outside the grid
     */
    double getValue(int row, int col) const;

    /**
     * @brief Check whether a cell holds no measurement (NaN or the no-data value)
     */
    bool isMissing(int row, int col) const;

    const std::vector<double>& getValues() const { return values_; }
    const GeoTransform& getGeoTransform() const { return transform_; }
    const std::string& getCrs() const { return crs_; }
    const std::optional<double>& getNoDataValue() const { return nodata_value_; }
    const std::string& getDataType() const { return data_type_; }
    const std::string& getSourcePath() const { return source_path_; }

private:
    int width_;
    int height_;
    std::vector<double> values_;
    GeoTransform transform_;
    std::string crs_;
    std::optional<double> nodata_value_;
    std::string data_type_;
    std::string source_path_;
};

/**
 * @brief Read band 1 of a geo-referenced raster through GDAL
 * @param path Raster file path (any GDAL-readable format)
 * @return Grid with values, transform, CRS and no-data value
 * @throws RasterReadError if the file is missing, unreadable, has no band,
 *         holds complex samples or is zero-sized
 */
RasterGrid readRaster(const std::string& path);

} // namespace deformation_cloud

#endif // DEFORMATION_CLOUD_RASTER_HPP
