/**
 * @file test_sampling.cpp
 * @brief Tests for cell decimation and coherence filtering
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include <catch2/catch.hpp>
#include "deformation_cloud/errors.hpp"
#include "deformation_cloud/sampling.hpp"
#include "test_fixtures.hpp"
#include <cmath>
#include <limits>
#include <vector>

using namespace deformation_cloud;
using deformation_cloud::test::rampValues;

namespace {

RasterGrid makeGrid(int width, int height, std::vector<double> values) {
    return RasterGrid(width, height, std::move(values), GeoTransform());
}

RasterGrid constantGrid(int width, int height, double value) {
    return makeGrid(width, height, std::vector<double>(static_cast<size_t>(width) * height, value));
}

} // namespace

TEST_CASE("Lattice size is ceil(h/S) * ceil(w/S)", "[Sampler]") {
    REQUIRE(latticeCellCount(4, 4, 2) == 4);
    REQUIRE(latticeCellCount(5, 5, 2) == 9);
    REQUIRE(latticeCellCount(7, 3, 5) == 2);
    REQUIRE(latticeCellCount(10, 10, 1) == 100);
    REQUIRE(latticeCellCount(3, 3, 10) == 1);
    REQUIRE(latticeCellCount(3, 3, 0) == 0);

    for (int width = 1; width <= 9; width++) {
        for (int height = 1; height <= 9; height++) {
            for (int stride = 1; stride <= 4; stride++) {
                RasterGrid grid = constantGrid(width, height, 1.0);
                SamplingOptions options;
                options.stride = stride;
                SamplingResult result = sampleCells(grid, nullptr, options);
                REQUIRE(result.candidates == latticeCellCount(width, height, stride));
                REQUIRE(result.cells.size() == result.candidates);
            }
        }
    }
}

TEST_CASE("Strides near the int limit keep only the origin cell", "[Sampler]") {
    const int huge = std::numeric_limits<int>::max();
    REQUIRE(latticeCellCount(4, 4, huge) == 1);
    REQUIRE(latticeCellCount(huge, 1, huge) == 1);
    REQUIRE(latticeCellCount(huge, 1, huge - 1) == 2);

    RasterGrid grid = makeGrid(4, 3, rampValues(4, 3));
    SamplingOptions options;
    options.stride = huge;

    SamplingResult result = sampleCells(grid, nullptr, options);
    REQUIRE(result.candidates == 1);
    REQUIRE(result.cells == std::vector<CellIndex>{{0, 0}});
}

TEST_CASE("Only cells on the stride lattice are returned, in row-major order", "[Sampler]") {
    RasterGrid grid = makeGrid(5, 4, rampValues(5, 4));
    SamplingOptions options;
    options.stride = 2;

    SamplingResult result = sampleCells(grid, nullptr, options);

    std::vector<CellIndex> expected = {
        {0, 0}, {0, 2}, {0, 4}, {2, 0}, {2, 2}, {2, 4}
    };
    REQUIRE(result.cells == expected);
    for (const auto& cell : result.cells) {
        REQUIRE(cell.row % 2 == 0);
        REQUIRE(cell.col % 2 == 0);
    }
}

TEST_CASE("Stride one keeps every valid cell", "[Sampler]") {
    RasterGrid grid = makeGrid(3, 2, rampValues(3, 2));
    SamplingOptions options;
    options.stride = 1;

    SamplingResult result = sampleCells(grid, nullptr, options);
    REQUIRE(result.cells.size() == 6);
    REQUIRE(result.cells.back() == CellIndex{1, 2});
}

TEST_CASE("Coherence threshold keeps cells at or above the threshold", "[Sampler]") {
    RasterGrid deformation = makeGrid(4, 1, {1.0, 2.0, 3.0, 4.0});
    RasterGrid coherence = makeGrid(4, 1, {0.1, 0.3, 0.29999, 0.9});
    SamplingOptions options;
    options.stride = 1;
    options.coherence_threshold = 0.3;

    SamplingResult result = sampleCells(deformation, &coherence, options);

    std::vector<CellIndex> expected = {{0, 1}, {0, 3}};
    REQUIRE(result.cells == expected);
    REQUIRE(result.rejected_coherence == 2);
    REQUIRE(result.rejected_missing == 0);
}

TEST_CASE("Threshold zero keeps all finite coherence, threshold one only full coherence", "[Sampler]") {
    RasterGrid deformation = constantGrid(3, 1, 5.0);
    RasterGrid coherence = makeGrid(3, 1, {0.0, 0.5, 1.0});
    SamplingOptions options;
    options.stride = 1;

    options.coherence_threshold = 0.0;
    REQUIRE(sampleCells(deformation, &coherence, options).cells.size() == 3);

    options.coherence_threshold = 1.0;
    SamplingResult strict = sampleCells(deformation, &coherence, options);
    REQUIRE(strict.cells.size() == 1);
    REQUIRE(strict.cells[0] == CellIndex{0, 2});
}

TEST_CASE("Missing deformation and missing coherence are rejected", "[Sampler]") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    RasterGrid deformation(4, 1, {nan, -32768.0, 1.0, 2.0}, GeoTransform(), "", -32768.0);
    RasterGrid coherence(4, 1, {0.9, 0.9, nan, -1.0}, GeoTransform(), "", -1.0);
    SamplingOptions options;
    options.stride = 1;
    options.coherence_threshold = 0.0;

    SamplingResult result = sampleCells(deformation, &coherence, options);

    REQUIRE(result.cells.empty());
    REQUIRE(result.candidates == 4);
    REQUIRE(result.rejected_missing == 2);
    REQUIRE(result.rejected_coherence == 2);
}

TEST_CASE("Without coherence every valid candidate survives", "[Sampler]") {
    RasterGrid deformation = makeGrid(2, 2, {0.0, -1.0, 1e6, -1e6});
    SamplingOptions options;
    options.stride = 1;
    options.coherence_threshold = 1.0;

    SamplingResult result = sampleCells(deformation, nullptr, options);
    REQUIRE(result.cells.size() == 4);
    REQUIRE(result.rejected_coherence == 0);
}

TEST_CASE("Zero survivors is not an error", "[Sampler]") {
    RasterGrid deformation = constantGrid(3, 3, 1.0);
    RasterGrid coherence = constantGrid(3, 3, 0.1);
    SamplingOptions options;
    options.stride = 1;
    options.coherence_threshold = 0.5;

    SamplingResult result = sampleCells(deformation, &coherence, options);
    REQUIRE(result.cells.empty());
    REQUIRE(result.rejected_coherence == 9);
}

TEST_CASE("Grids of different shape are rejected", "[Sampler]") {
    RasterGrid deformation = constantGrid(4, 3, 1.0);
    RasterGrid coherence = constantGrid(4, 4, 1.0);

    REQUIRE_THROWS_AS(sampleCells(deformation, &coherence, SamplingOptions()),
                      DimensionMismatchError);
    REQUIRE_THROWS_AS(requireSameShape(deformation, coherence), DimensionMismatchError);
}

TEST_CASE("Invalid sampling options are rejected", "[Sampler]") {
    RasterGrid grid = constantGrid(2, 2, 1.0);
    SamplingOptions options;

    options.stride = 0;
    REQUIRE_THROWS_AS(sampleCells(grid, nullptr, options), std::invalid_argument);

    options.stride = 1;
    options.coherence_threshold = 1.5;
    REQUIRE_THROWS_AS(sampleCells(grid, nullptr, options), std::invalid_argument);

    options.coherence_threshold = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(sampleCells(grid, nullptr, options), std::invalid_argument);
}
