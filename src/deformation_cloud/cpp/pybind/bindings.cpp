/**
 * @file bindings.cpp
 * @brief Python bindings for the deformation cloud library
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include <algorithm>
#include <string>
#include <vector>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "deformation_cloud/config.hpp"
#include "deformation_cloud/conversion.hpp"
#include "deformation_cloud/errors.hpp"
#include "deformation_cloud/log.hpp"
#include "deformation_cloud/point_cloud.hpp"
#include "deformation_cloud/raster.hpp"
#include "deformation_cloud/sampling.hpp"
#include "deformation_cloud/writers.hpp"

namespace py = pybind11;
namespace dc = deformation_cloud;

PYBIND11_MODULE(_deformation_cloud, m) {
    m.doc() = "InSAR deformation raster to point cloud conversion";

    // Version info
    m.attr("__version__") = "1.0.0";

    // ==== Exceptions ====

    py::register_exception<dc::RasterReadError>(m, "RasterReadError");
    py::register_exception<dc::DimensionMismatchError>(m, "DimensionMismatchError");
    py::register_exception<dc::WriteError>(m, "WriteError");
    py::register_exception<dc::InputDirectoryError>(m, "InputDirectoryError");
    py::register_exception<dc::ConfigError>(m, "ConfigError");

    // ==== Structs ====

    // GeoTransform
    py::class_<dc::GeoTransform>(m, "GeoTransform")
        .def(py::init<>())
        .def_static("north_up", &dc::GeoTransform::northUp,
                    py::arg("origin_x"), py::arg("origin_y"),
                    py::arg("pixel_width"), py::arg("pixel_height"))
        .def_property("parameters",
            [](const dc::GeoTransform& self) {
                return std::vector<double>(self.parameters, self.parameters + 6);
            },
            [](dc::GeoTransform& self, const std::vector<double>& values) {
                if (values.size() != 6) {
                    throw py::value_error("GeoTransform needs exactly 6 parameters");
                }
                std::copy(values.begin(), values.end(), self.parameters);
            })
        .def("cell_to_ground", &dc::GeoTransform::cellToGround,
             py::arg("row"), py::arg("col"))
        .def("ground_bounds", &dc::GeoTransform::groundBounds,
             py::arg("width"), py::arg("height"));

    m.def("cell_to_ground",
          py::overload_cast<int, int, const dc::GeoTransform&>(&dc::cellToGround),
          py::arg("row"), py::arg("col"), py::arg("transform"));

    // CellIndex
    py::class_<dc::CellIndex>(m, "CellIndex")
        .def(py::init<int, int>(), py::arg("row"), py::arg("col"))
        .def_readwrite("row", &dc::CellIndex::row)
        .def_readwrite("col", &dc::CellIndex::col)
        .def("__eq__", &dc::CellIndex::operator==)
        .def("__repr__", [](const dc::CellIndex& self) {
            return "CellIndex(" + std::to_string(self.row) + ", " + std::to_string(self.col) + ")";
        });

    // SamplingOptions
    py::class_<dc::SamplingOptions>(m, "SamplingOptions")
        .def(py::init<>())
        .def_readwrite("stride", &dc::SamplingOptions::stride)
        .def_readwrite("coherence_threshold", &dc::SamplingOptions::coherence_threshold);

    // SamplingResult
    py::class_<dc::SamplingResult>(m, "SamplingResult")
        .def_readonly("cells", &dc::SamplingResult::cells)
        .def_readonly("candidates", &dc::SamplingResult::candidates)
        .def_readonly("rejected_missing", &dc::SamplingResult::rejected_missing)
        .def_readonly("rejected_coherence", &dc::SamplingResult::rejected_coherence);

    // GeoPoint
    py::class_<dc::GeoPoint>(m, "GeoPoint")
        .def_readwrite("x", &dc::GeoPoint::x)
        .def_readwrite("y", &dc::GeoPoint::y)
        .def_readwrite("z", &dc::GeoPoint::z);

    // ==== Classes ====

    // RasterGrid
    py::class_<dc::RasterGrid>(m, "RasterGrid")
        .def(py::init<int, int, std::vector<double>, const dc::GeoTransform&,
                      std::string, std::optional<double>, std::string, std::string>(),
             py::arg("width"), py::arg("height"), py::arg("values"), py::arg("transform"),
             py::arg("crs") = std::string(), py::arg("nodata_value") = py::none(),
             py::arg("data_type") = "Float64", py::arg("source_path") = std::string())
        .def("get_width", &dc::RasterGrid::getWidth)
        .def("get_height", &dc::RasterGrid::getHeight)
        .def("get_dimensions", &dc::RasterGrid::getDimensions)
        .def("get_value", &dc::RasterGrid::getValue, py::arg("row"), py::arg("col"))
        .def("is_missing", &dc::RasterGrid::isMissing, py::arg("row"), py::arg("col"))
        .def("get_values", &dc::RasterGrid::getValues)
        .def("get_geotransform", &dc::RasterGrid::getGeoTransform)
        .def("get_crs", &dc::RasterGrid::getCrs)
        .def("get_nodata_value", &dc::RasterGrid::getNoDataValue)
        .def("get_data_type", &dc::RasterGrid::getDataType)
        .def("get_source_path", &dc::RasterGrid::getSourcePath);

    m.def("read_raster", &dc::readRaster, py::arg("path"));

    m.def("sample_cells",
          [](const dc::RasterGrid& deformation, const dc::RasterGrid* coherence,
             const dc::SamplingOptions& options) {
              return dc::sampleCells(deformation, coherence, options);
          },
          py::arg("deformation"), py::arg("coherence") = nullptr,
          py::arg("options") = dc::SamplingOptions());

    // PointCloud
    py::class_<dc::PointCloud>(m, "PointCloud")
        .def("get_num_points", &dc::PointCloud::getNumPoints)
        .def("get_bounds", &dc::PointCloud::getBounds)
        .def("get_point", &dc::PointCloud::getPoint, py::arg("index"))
        .def("get_points", &dc::PointCloud::getPoints)
        .def("get_crs", &dc::PointCloud::getCrs)
        .def("get_attribute_names", [](const dc::PointCloud& self) {
            return self.getAttributes().getNames();
        })
        .def("get_attribute", [](const dc::PointCloud& self, const std::string& name) {
            return self.getAttributes().getValues(name);
        }, py::arg("name"))
        .def("__len__", &dc::PointCloud::getNumPoints);

    m.def("build_point_cloud",
          [](const dc::RasterGrid& deformation, const dc::RasterGrid* coherence,
             const dc::GeoTransform& transform, const std::vector<dc::CellIndex>& cells) {
              return dc::buildPointCloud(deformation, coherence, transform, cells);
          },
          py::arg("deformation"), py::arg("coherence"), py::arg("transform"), py::arg("cells"));

    // Writers
    py::class_<dc::PointCloudWriter>(m, "PointCloudWriter")
        .def("write", &dc::PointCloudWriter::write, py::arg("cloud"), py::arg("output_file"))
        .def("extension", &dc::PointCloudWriter::extension)
        .def("format_name", &dc::PointCloudWriter::formatName);

    py::class_<dc::LasPointCloudWriter, dc::PointCloudWriter>(m, "LasPointCloudWriter")
        .def(py::init<>());

    py::class_<dc::TextWriterOptions>(m, "TextWriterOptions")
        .def(py::init<>())
        .def_readwrite("delimiter", &dc::TextWriterOptions::delimiter)
        .def_readwrite("precision", &dc::TextWriterOptions::precision);

    py::class_<dc::TextPointCloudWriter, dc::PointCloudWriter>(m, "TextPointCloudWriter")
        .def(py::init<const dc::TextWriterOptions&>(),
             py::arg("options") = dc::TextWriterOptions());

    m.def("read_las_point_cloud", &dc::readLasPointCloud, py::arg("input_file"));
    py::class_<dc::LasHeaderInfo>(m, "LasHeaderInfo")
        .def_readonly("point_count", &dc::LasHeaderInfo::point_count)
        .def_readonly("bounds", &dc::LasHeaderInfo::bounds)
        .def_readonly("crs", &dc::LasHeaderInfo::crs)
        .def_readonly("dimension_names", &dc::LasHeaderInfo::dimension_names);

    m.def("read_las_header", &dc::readLasHeader, py::arg("input_file"));
    m.def("read_text_point_cloud", &dc::readTextPointCloud,
          py::arg("input_file"), py::arg("delimiter") = ' ');

    // Configuration
    py::class_<dc::ConversionConfig>(m, "ConversionConfig")
        .def(py::init<>())
        .def_readwrite("input_dir", &dc::ConversionConfig::input_dir)
        .def_readwrite("output_dir", &dc::ConversionConfig::output_dir)
        .def_readwrite("sampling", &dc::ConversionConfig::sampling)
        .def_readwrite("deformation_suffix", &dc::ConversionConfig::deformation_suffix)
        .def_readwrite("coherence_suffix", &dc::ConversionConfig::coherence_suffix)
        .def_readwrite("raster_extensions", &dc::ConversionConfig::raster_extensions)
        .def_readwrite("formats", &dc::ConversionConfig::formats)
        .def_readwrite("text_delimiter", &dc::ConversionConfig::text_delimiter)
        .def_readwrite("workers", &dc::ConversionConfig::workers);

    m.def("load_config", &dc::loadConfig, py::arg("config_file"));

    // Conversion
    py::class_<dc::RasterPair>(m, "RasterPair")
        .def_readonly("stamp", &dc::RasterPair::stamp)
        .def_readonly("deformation_file", &dc::RasterPair::deformation_file)
        .def_readonly("coherence_file", &dc::RasterPair::coherence_file);

    py::class_<dc::PairResult>(m, "PairResult")
        .def_readonly("pair", &dc::PairResult::pair)
        .def_readonly("success", &dc::PairResult::success)
        .def_readonly("num_points", &dc::PairResult::num_points)
        .def_readonly("output_files", &dc::PairResult::output_files)
        .def_readonly("error", &dc::PairResult::error);

    py::class_<dc::ConversionSummary>(m, "ConversionSummary")
        .def_readonly("pairs_found", &dc::ConversionSummary::pairs_found)
        .def_readonly("pairs_converted", &dc::ConversionSummary::pairs_converted)
        .def_readonly("pairs_failed", &dc::ConversionSummary::pairs_failed)
        .def_readonly("points_written", &dc::ConversionSummary::points_written)
        .def_readonly("results", &dc::ConversionSummary::results);

    py::class_<dc::ConversionOrchestrator>(m, "ConversionOrchestrator")
        .def(py::init<const dc::ConversionConfig&>(), py::arg("config"))
        .def("find_pairs", &dc::ConversionOrchestrator::findPairs)
        .def("convert_pair", &dc::ConversionOrchestrator::convertPair, py::arg("pair"))
        .def("run", &dc::ConversionOrchestrator::run,
             py::call_guard<py::gil_scoped_release>());

    m.def("set_log_quiet", &dc::setLogQuiet, py::arg("quiet"));
}
