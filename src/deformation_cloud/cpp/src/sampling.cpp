/**
 * @file sampling.cpp
 * @brief Implementation of cell decimation and validity filtering
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "deformation_cloud/sampling.hpp"
#include "deformation_cloud/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace deformation_cloud {

namespace {

// value and divisor are positive; value + divisor - 1 could overflow int
size_t ceilDiv(int value, int divisor) {
    return static_cast<size_t>(value / divisor) + (value % divisor != 0 ? 1 : 0);
}

void validateOptions(const SamplingOptions& options) {
    if (options.stride < 1) {
        throw std::invalid_argument("Decimation stride must be >= 1, got " +
                                    std::to_string(options.stride));
    }
    if (!(options.coherence_threshold >= 0.0 && options.coherence_threshold <= 1.0)) {
        throw std::invalid_argument("Coherence threshold must lie in [0, 1], got " +
                                    std::to_string(options.coherence_threshold));
    }
}

} // namespace

size_t latticeCellCount(int width, int height, int stride) {
    if (stride < 1 || width <= 0 || height <= 0) {
        return 0;
    }
    return ceilDiv(height, stride) * ceilDiv(width, stride);
}

void requireSameShape(const RasterGrid& deformation, const RasterGrid& coherence) {
    if (!deformation.sameShape(coherence)) {
        throw DimensionMismatchError(
            "Coherence grid is " + std::to_string(coherence.getHeight()) + "x" +
            std::to_string(coherence.getWidth()) + " but deformation grid is " +
            std::to_string(deformation.getHeight()) + "x" +
            std::to_string(deformation.getWidth()));
    }
}

SamplingResult sampleCells(const RasterGrid& deformation,
                           const RasterGrid* coherence,
                           const SamplingOptions& options)
{
    validateOptions(options);
    if (coherence) {
        requireSameShape(deformation, *coherence);
    }

    const int width = deformation.getWidth();
    const int height = deformation.getHeight();
    const int stride = options.stride;

    SamplingResult result;
    result.cells.reserve(latticeCellCount(width, height, stride));

    // Row-major scan restricted to the lattice; the order is the output order.
    // Lattice steps are counted so row + stride never has to be formed.
    const size_t lattice_rows = ceilDiv(height, stride);
    const size_t lattice_cols = ceilDiv(width, stride);
    for (size_t r = 0; r < lattice_rows; r++) {
        const int row = static_cast<int>(r * static_cast<size_t>(stride));
        for (size_t c = 0; c < lattice_cols; c++) {
            const int col = static_cast<int>(c * static_cast<size_t>(stride));
            ++result.candidates;

            if (deformation.isMissing(row, col)) {
                ++result.rejected_missing;
                continue;
            }

            if (coherence) {
                // NaN and no-data coherence never pass the threshold
                double value = coherence->getValue(row, col);
                if (coherence->isMissing(row, col) || value < options.coherence_threshold) {
                    ++result.rejected_coherence;
                    continue;
                }
            }

            result.cells.push_back(CellIndex{row, col});
        }
    }

    return result;
}

} // namespace deformation_cloud
