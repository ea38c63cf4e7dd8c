/**
 * @file raster.cpp
 * @brief GDAL raster reading and geocoding arithmetic
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "deformation_cloud/raster.hpp"
#include "deformation_cloud/errors.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// GDAL includes
#include <cpl_error.h>
#include <gdal_priv.h>

namespace deformation_cloud {

namespace {

struct DatasetCloser {
    void operator()(GDALDataset* dataset) const {
        if (dataset) {
            GDALClose(GDALDataset::ToHandle(dataset));
        }
    }
};

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

void registerDrivers() {
    static std::once_flag once;
    std::call_once(once, []() { GDALAllRegister(); });
}

std::string lastGdalError(const std::string& fallback) {
    const char* message = CPLGetLastErrorMsg();
    if (message && *message) {
        return message;
    }
    return fallback;
}

} // namespace

// Implementation of GeoTransform methods
GeoTransform GeoTransform::northUp(double origin_x, double origin_y,
                                   double pixel_width, double pixel_height) {
    GeoTransform transform;
    transform.parameters[0] = origin_x;
    transform.parameters[1] = pixel_width;
    transform.parameters[2] = 0.0;
    transform.parameters[3] = origin_y;
    transform.parameters[4] = 0.0;
    transform.parameters[5] = pixel_height;
    return transform;
}

std::tuple<double, double> GeoTransform::cellToGround(int row, int col) const {
    double x = parameters[0] + col * parameters[1] + row * parameters[2];
    double y = parameters[3] + col * parameters[4] + row * parameters[5];
    return std::make_tuple(x, y);
}

std::tuple<double, double, double, double> GeoTransform::groundBounds(int width, int height) const {
    if (width <= 0 || height <= 0) {
        return std::make_tuple(parameters[0], parameters[3], parameters[0], parameters[3]);
    }

    // An affine map reaches its extremes at the corners of the index range
    const int rows[2] = {0, height - 1};
    const int cols[2] = {0, width - 1};

    double min_x = 0.0, min_y = 0.0, max_x = 0.0, max_y = 0.0;
    bool first = true;
    for (int row : rows) {
        for (int col : cols) {
            auto [x, y] = cellToGround(row, col);
            if (first) {
                min_x = max_x = x;
                min_y = max_y = y;
                first = false;
            } else {
                min_x = std::min(min_x, x);
                min_y = std::min(min_y, y);
                max_x = std::max(max_x, x);
                max_y = std::max(max_y, y);
            }
        }
    }
    return std::make_tuple(min_x, min_y, max_x, max_y);
}

std::tuple<double, double> cellToGround(int row, int col, const GeoTransform& transform) {
    return transform.cellToGround(row, col);
}

// Implementation of RasterGrid methods
RasterGrid::RasterGrid(int width, int height, std::vector<double> values,
                       const GeoTransform& transform,
                       std::string crs,
                       std::optional<double> nodata_value,
                       std::string data_type,
                       std::string source_path)
    : width_(width),
      height_(height),
      values_(std::move(values)),
      transform_(transform),
      crs_(std::move(crs)),
      nodata_value_(nodata_value),
      data_type_(std::move(data_type)),
      source_path_(std::move(source_path))
{
    if (width_ <= 0 || height_ <= 0) {
        throw std::invalid_argument("Raster dimensions must be positive");
    }
    if (values_.size() != static_cast<size_t>(width_) * static_cast<size_t>(height_)) {
        throw std::invalid_argument("Raster value count does not match width * height");
    }
}

std::tuple<int, int> RasterGrid::getDimensions() const {
    return std::make_tuple(width_, height_);
}

bool RasterGrid::sameShape(const RasterGrid& other) const {
    return width_ == other.width_ && height_ == other.height_;
}

double RasterGrid::getValue(int row, int col) const {
    if (row < 0 || row >= height_ || col < 0 || col >= width_) {
        throw std::out_of_range("Raster cell index out of range");
    }
    return values_[static_cast<size_t>(row) * width_ + col];
}

bool RasterGrid::isMissing(int row, int col) const {
    double value = getValue(row, col);
    if (std::isnan(value)) {
        return true;
    }
    return nodata_value_.has_value() && value == *nodata_value_;
}

RasterGrid readRaster(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw RasterReadError(path, "file does not exist");
    }

    registerDrivers();

    // Keep GDAL from printing its own messages; they are folded into the exception
    CPLPushErrorHandler(CPLQuietErrorHandler);
    CPLErrorReset();
    DatasetPtr dataset(GDALDataset::FromHandle(GDALOpen(path.c_str(), GA_ReadOnly)));
    CPLPopErrorHandler();

    if (!dataset) {
        throw RasterReadError(path, lastGdalError("unsupported or corrupt raster format"));
    }
    if (dataset->GetRasterCount() < 1) {
        throw RasterReadError(path, "raster has no bands");
    }

    const int width = dataset->GetRasterXSize();
    const int height = dataset->GetRasterYSize();
    if (width <= 0 || height <= 0) {
        throw RasterReadError(path, "raster is zero-sized");
    }

    GDALRasterBand* band = dataset->GetRasterBand(1);
    const GDALDataType data_type = band->GetRasterDataType();
    if (GDALDataTypeIsComplex(data_type)) {
        throw RasterReadError(path, "complex-valued bands are not supported");
    }

    // Rasters without georeferencing fall back to the identity transform
    GeoTransform transform;
    if (dataset->GetGeoTransform(transform.parameters) != CE_None) {
        transform = GeoTransform();
    }

    const char* projection = dataset->GetProjectionRef();
    std::string crs = projection ? projection : "";

    int has_nodata = 0;
    double nodata = band->GetNoDataValue(&has_nodata);
    std::optional<double> nodata_value;
    if (has_nodata) {
        nodata_value = nodata;
    }

    std::vector<double> values(static_cast<size_t>(width) * static_cast<size_t>(height));
    CPLPushErrorHandler(CPLQuietErrorHandler);
    CPLErrorReset();
    CPLErr err = band->RasterIO(GF_Read, 0, 0, width, height,
                                values.data(), width, height, GDT_Float64, 0, 0);
    CPLPopErrorHandler();
    if (err != CE_None) {
        throw RasterReadError(path, lastGdalError("failed to read raster data"));
    }

    return RasterGrid(width, height, std::move(values), transform, std::move(crs),
                      nodata_value, GDALGetDataTypeName(data_type), path);
}

} // namespace deformation_cloud
