/**
 * @file sampling.hpp
 * @brief Spatial decimation and validity filtering of raster cells
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef DEFORMATION_CLOUD_SAMPLING_HPP
#define DEFORMATION_CLOUD_SAMPLING_HPP

#include <cstddef>
#include <vector>

#include "raster.hpp"

namespace deformation_cloud {

/**
 * @struct CellIndex
 * @brief Row and column of one raster cell
 */
struct CellIndex {
    int row;
    int col;

    bool operator==(const CellIndex& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const CellIndex& other) const { return !(*this == other); }
};

/**
 * @struct SamplingOptions
 * @brief Parameters of the decimation lattice and the coherence filter
 */
struct SamplingOptions {
    int stride = 5;                    ///< Keep every stride-th row and column (>= 1)
    double coherence_threshold = 0.3;  ///< Minimum accepted coherence, in [0, 1]
};

/**
 * @struct SamplingResult
 * @brief Surviving cells in row-major order plus rejection counters
 */
struct SamplingResult {
    std::vector<CellIndex> cells;       ///< Cells that passed every criterion
    size_t candidates = 0;              ///< Cells on the decimation lattice
    size_t rejected_missing = 0;        ///< Lattice cells without a deformation value
    size_t rejected_coherence = 0;      ///< Lattice cells below the coherence threshold
};

/**
 * @brief Number of lattice cells for a grid, ceil(height/S) * ceil(width/S)
 */
size_t latticeCellCount(int width, int height, int stride);

/**
 * @brief Select the decimated, valid cells of a deformation grid
 *
 * A cell survives iff row % stride == 0, col % stride == 0, its deformation
 * value is not missing and, when a coherence grid is given, its coherence is
 * a number >= coherence_threshold. Without a coherence grid every cell is at
 * full confidence.
 *
 * @param deformation Deformation grid
 * @param coherence Coherence grid of identical dimensions, or nullptr
 * @param options Stride and coherence threshold
 * @return Surviving cells in ascending row, then column, order
 * @throws DimensionMismatchError if the grids differ in width or height
 * @throws std::invalid_argument if stride < 1 or the threshold is outside [0, 1]
 */
SamplingResult sampleCells(const RasterGrid& deformation,
                           const RasterGrid* coherence,
                           const SamplingOptions& options = SamplingOptions());

/**
 * @brief Throw DimensionMismatchError unless both grids have the same shape
 */
void requireSameShape(const RasterGrid& deformation, const RasterGrid& coherence);

} // namespace deformation_cloud

#endif // DEFORMATION_CLOUD_SAMPLING_HPP
