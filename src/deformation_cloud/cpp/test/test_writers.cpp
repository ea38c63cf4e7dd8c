/**
 * @file test_writers.cpp
 * @brief Tests for the LAS and XYZ point cloud writers
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include <catch2/catch.hpp>
#include "deformation_cloud/errors.hpp"
#include "deformation_cloud/point_cloud.hpp"
#include "deformation_cloud/writers.hpp"
#include "test_fixtures.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

using namespace deformation_cloud;
using deformation_cloud::test::TempDir;
using deformation_cloud::test::epsgWkt;
using deformation_cloud::test::writeTextFile;

namespace {

PointCloud makeCloud() {
    std::vector<GeoPoint> points = {
        {512340.125, 4182001.5, -0.0123},
        {512370.125, 4181971.5, 0.0456},
        {512400.125, 4181941.5, 1.0 / 3.0},
    };
    PointAttributeSet attributes(points.size());
    attributes.addAttribute(kDeformationAttribute, std::vector<double>{-0.0123, 0.0456, 1.0 / 3.0});
    attributes.addAttribute(kCoherenceAttribute, std::vector<double>{0.31, 0.75, 1.0});
    return PointCloud(points, attributes);
}

PointCloud makeEmptyCloud() {
    PointAttributeSet attributes(0);
    attributes.addAttribute(kDeformationAttribute, std::vector<double>{});
    attributes.addAttribute(kCoherenceAttribute, std::vector<double>{});
    return PointCloud({}, attributes);
}

std::vector<std::string> readLines(const std::string& filename) {
    std::ifstream file(filename);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

std::string readAll(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

size_t countFiles(const std::filesystem::path& dir) {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        (void)entry;
        count++;
    }
    return count;
}

} // namespace

TEST_CASE("Writer factory builds writers by format name", "[Writers]") {
    REQUIRE(availableFormats() == std::vector<std::string>{"las", "xyz"});

    auto las = makeWriter("las");
    REQUIRE(las->extension() == ".las");
    REQUIRE(las->formatName() == "las");

    TextWriterOptions options;
    options.delimiter = ',';
    auto xyz = makeWriter("xyz", options);
    REQUIRE(xyz->extension() == ".xyz");
    REQUIRE(dynamic_cast<TextPointCloudWriter&>(*xyz).getOptions().delimiter == ',');

    REQUIRE_THROWS_AS(makeWriter("ply"), std::invalid_argument);
}

TEST_CASE("Temporary output sits beside the final file", "[Writers]") {
    std::filesystem::path expected = std::filesystem::path("out") / "20200101_unwrap.partial.las";
    REQUIRE(detail::temporaryPathFor((std::filesystem::path("out") / "20200101_unwrap.las").string()) ==
            expected.string());
}

TEST_CASE("LAS round trip preserves points and extra dimensions", "[Writers][LAS]") {
    TempDir dir("las_round_trip");
    const std::string path = dir.file("20200101_unwrap.las");
    PointCloud cloud = makeCloud();

    LasPointCloudWriter writer;
    writer.write(cloud, path);

    PointCloud read = readLasPointCloud(path);
    REQUIRE(read.getNumPoints() == cloud.getNumPoints());
    REQUIRE(read.getAttributes().getNames() ==
            std::vector<std::string>{kDeformationAttribute, kCoherenceAttribute});

    for (size_t i = 0; i < cloud.getNumPoints(); i++) {
        REQUIRE(read.getPoint(i).x == Approx(cloud.getPoint(i).x).margin(1e-3));
        REQUIRE(read.getPoint(i).y == Approx(cloud.getPoint(i).y).margin(1e-3));
        REQUIRE(read.getPoint(i).z == Approx(cloud.getPoint(i).z).margin(1e-6));
    }

    // Extra dimensions are float32
    for (const auto& name : {kDeformationAttribute, kCoherenceAttribute}) {
        const auto& written = cloud.getAttributes().getValues(name);
        const auto& restored = read.getAttributes().getValues(name);
        for (size_t i = 0; i < written.size(); i++) {
            REQUIRE(restored[i] == Approx(static_cast<float>(written[i])));
        }
    }

    // Only the final file remains
    REQUIRE(countFiles(dir.path()) == 1);
}

TEST_CASE("LAS output of an empty cloud is a valid zero-point file", "[Writers][LAS]") {
    TempDir dir("las_empty");
    const std::string path = dir.file("empty_unwrap.las");

    LasPointCloudWriter writer;
    writer.write(makeEmptyCloud(), path);

    REQUIRE(std::filesystem::exists(path));
    PointCloud read = readLasPointCloud(path);
    REQUIRE(read.getNumPoints() == 0);
    REQUIRE(read.getAttributes().getNames() ==
            std::vector<std::string>{kDeformationAttribute, kCoherenceAttribute});
    REQUIRE(readLasHeader(path).point_count == 0);
}

TEST_CASE("LAS output carries the raster CRS", "[Writers][LAS]") {
    TempDir dir("las_crs");
    const std::string path = dir.file("20200101_unwrap.las");

    PointCloud source = makeCloud();
    PointCloud cloud(source.getPoints(), source.getAttributes(), epsgWkt(32633));

    LasPointCloudWriter writer;
    writer.write(cloud, path);

    PointCloud read = readLasPointCloud(path);
    REQUIRE_FALSE(read.getCrs().empty());
    REQUIRE(read.getCrs().find("32633") != std::string::npos);

    LasHeaderInfo header = readLasHeader(path);
    REQUIRE(header.crs.find("32633") != std::string::npos);
}

TEST_CASE("LAS header records the cloud bounds", "[Writers][LAS]") {
    TempDir dir("las_header");
    const std::string path = dir.file("20200101_unwrap.las");
    PointCloud cloud = makeCloud();

    LasPointCloudWriter writer;
    writer.write(cloud, path);

    LasHeaderInfo header = readLasHeader(path);
    REQUIRE(header.point_count == cloud.getNumPoints());

    auto [min_x, min_y, min_z, max_x, max_y, max_z] = cloud.getBounds();
    REQUIRE(std::get<0>(header.bounds) == Approx(min_x).margin(1e-3));
    REQUIRE(std::get<1>(header.bounds) == Approx(min_y).margin(1e-3));
    REQUIRE(std::get<2>(header.bounds) == Approx(min_z).margin(1e-3));
    REQUIRE(std::get<3>(header.bounds) == Approx(max_x).margin(1e-3));
    REQUIRE(std::get<4>(header.bounds) == Approx(max_y).margin(1e-3));
    REQUIRE(std::get<5>(header.bounds) == Approx(max_z).margin(1e-3));

    for (const auto& name : {kDeformationAttribute, kCoherenceAttribute}) {
        REQUIRE(std::find(header.dimension_names.begin(), header.dimension_names.end(), name) !=
                header.dimension_names.end());
    }

    REQUIRE_THROWS_AS(readLasHeader(dir.file("missing.las")), std::runtime_error);
}

TEST_CASE("LAS writer keeps a flat axis exact", "[Writers][LAS]") {
    TempDir dir("las_flat");
    const std::string path = dir.file("flat_unwrap.las");

    std::vector<GeoPoint> points = {{10.0, 20.0, 0.25}, {11.0, 20.0, 0.25}};
    PointAttributeSet attributes(2);
    attributes.addAttribute(kDeformationAttribute, 0.25);
    PointCloud cloud(points, attributes);

    LasPointCloudWriter writer;
    writer.write(cloud, path);

    PointCloud read = readLasPointCloud(path);
    REQUIRE(read.getNumPoints() == 2);
    REQUIRE(read.getPoint(0).y == Approx(20.0).margin(1e-3));
    REQUIRE(read.getPoint(1).z == Approx(0.25).margin(1e-3));
}

TEST_CASE("LAS writer rejects attributes that shadow LAS fields", "[Writers][LAS]") {
    TempDir dir("las_collision");
    const std::string path = dir.file("bad_unwrap.las");

    std::vector<GeoPoint> points = {{0.0, 0.0, 0.0}};
    PointAttributeSet attributes(1);
    attributes.addAttribute("Intensity", 1.0);
    PointCloud cloud(points, attributes);

    LasPointCloudWriter writer;
    REQUIRE_THROWS_AS(writer.write(cloud, path), WriteError);
    REQUIRE(countFiles(dir.path()) == 0);
}

TEST_CASE("Writers report unwritable destinations", "[Writers]") {
    TempDir dir("unwritable");
    const std::string missing_dir = (dir.path() / "no" / "such" / "dir").string();

    LasPointCloudWriter las;
    REQUIRE_THROWS_AS(las.write(makeCloud(), missing_dir + "/a_unwrap.las"), WriteError);

    TextPointCloudWriter xyz;
    try {
        xyz.write(makeCloud(), missing_dir + "/a_unwrap.xyz");
        FAIL("expected WriteError");
    } catch (const WriteError& e) {
        REQUIRE(e.path() == missing_dir + "/a_unwrap.xyz");
    }
}

TEST_CASE("XYZ output has a header and one row per point", "[Writers][XYZ]") {
    TempDir dir("xyz_layout");
    const std::string path = dir.file("20200101_unwrap.xyz");

    TextPointCloudWriter writer;
    writer.write(makeCloud(), path);

    std::vector<std::string> lines = readLines(path);
    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0] == "X Y Z deformation coherence");

    std::istringstream row(lines[1]);
    std::vector<std::string> fields;
    std::string field;
    while (row >> field) {
        fields.push_back(field);
    }
    REQUIRE(fields.size() == 5);
    REQUIRE(countFiles(dir.path()) == 1);
}

TEST_CASE("XYZ round trip is exact", "[Writers][XYZ]") {
    TempDir dir("xyz_round_trip");
    const std::string path = dir.file("exact_unwrap.xyz");
    PointCloud cloud = makeCloud();

    TextPointCloudWriter writer;
    writer.write(cloud, path);
    PointCloud read = readTextPointCloud(path);

    REQUIRE(read.getNumPoints() == cloud.getNumPoints());
    for (size_t i = 0; i < cloud.getNumPoints(); i++) {
        REQUIRE(read.getPoint(i).x == cloud.getPoint(i).x);
        REQUIRE(read.getPoint(i).y == cloud.getPoint(i).y);
        REQUIRE(read.getPoint(i).z == cloud.getPoint(i).z);
    }
    REQUIRE(read.getAttributes().getValues(kDeformationAttribute) ==
            cloud.getAttributes().getValues(kDeformationAttribute));
    REQUIRE(read.getAttributes().getValues(kCoherenceAttribute) ==
            cloud.getAttributes().getValues(kCoherenceAttribute));
}

TEST_CASE("XYZ writer honours a comma delimiter", "[Writers][XYZ]") {
    TempDir dir("xyz_comma");
    const std::string path = dir.file("comma_unwrap.xyz");

    TextWriterOptions options;
    options.delimiter = ',';
    TextPointCloudWriter writer(options);
    writer.write(makeCloud(), path);

    std::vector<std::string> lines = readLines(path);
    REQUIRE(lines[0] == "X,Y,Z,deformation,coherence");

    PointCloud read = readTextPointCloud(path, ',');
    REQUIRE(read.getNumPoints() == 3);
    REQUIRE(read.getAttributes().getValues(kCoherenceAttribute)[1] == 0.75);
}

TEST_CASE("XYZ output of an empty cloud is only the header", "[Writers][XYZ]") {
    TempDir dir("xyz_empty");
    const std::string path = dir.file("empty_unwrap.xyz");

    TextPointCloudWriter writer;
    writer.write(makeEmptyCloud(), path);

    std::vector<std::string> lines = readLines(path);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0] == "X Y Z deformation coherence");
    REQUIRE(readTextPointCloud(path).empty());
}

TEST_CASE("Rewriting the same cloud gives the same files", "[Writers]") {
    TempDir dir("idempotent");
    const std::string xyz_path = dir.file("same_unwrap.xyz");
    const std::string las_path = dir.file("same_unwrap.las");
    PointCloud cloud = makeCloud();

    TextPointCloudWriter xyz;
    xyz.write(cloud, xyz_path);
    const std::string first = readAll(xyz_path);
    xyz.write(cloud, xyz_path);
    REQUIRE(readAll(xyz_path) == first);

    LasPointCloudWriter las;
    las.write(cloud, las_path);
    PointCloud first_las = readLasPointCloud(las_path);
    las.write(cloud, las_path);
    PointCloud second_las = readLasPointCloud(las_path);
    REQUIRE(second_las.getNumPoints() == first_las.getNumPoints());
    for (size_t i = 0; i < first_las.getNumPoints(); i++) {
        REQUIRE(second_las.getPoint(i).x == first_las.getPoint(i).x);
        REQUIRE(second_las.getPoint(i).z == first_las.getPoint(i).z);
    }
    REQUIRE(countFiles(dir.path()) == 2);
}

TEST_CASE("Malformed text point clouds are rejected", "[Writers][XYZ]") {
    TempDir dir("xyz_malformed");

    const std::string no_header = dir.file("no_header.xyz");
    writeTextFile(no_header, "1 2 3\n");
    REQUIRE_THROWS_AS(readTextPointCloud(no_header), std::runtime_error);

    const std::string short_row = dir.file("short_row.xyz");
    writeTextFile(short_row, "X Y Z deformation\n1 2 3\n");
    REQUIRE_THROWS_AS(readTextPointCloud(short_row), std::runtime_error);

    const std::string bad_number = dir.file("bad_number.xyz");
    writeTextFile(bad_number, "X Y Z\n1 2 abc\n");
    REQUIRE_THROWS_AS(readTextPointCloud(bad_number), std::runtime_error);

    REQUIRE_THROWS_AS(readTextPointCloud(dir.file("absent.xyz")), std::runtime_error);
}
