/**
 * @file conversion.hpp
 * @brief Directory-level conversion of raster pairs into point clouds
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef DEFORMATION_CLOUD_CONVERSION_HPP
#define DEFORMATION_CLOUD_CONVERSION_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "config.hpp"
#include "writers.hpp"

namespace deformation_cloud {

/**
 * @struct RasterPair
 * @brief A deformation raster and its optional coherence partner
 */
struct RasterPair {
    std::string stamp;             ///< Date-stamp prefix shared by the pair
    std::string deformation_file;  ///< Path of the deformation raster
    std::string coherence_file;    ///< Path of the coherence raster, empty if absent
};

/**
 * @struct PairResult
 * @brief Outcome of converting one pair
 */
struct PairResult {
    RasterPair pair;
    bool success = false;
    size_t num_points = 0;
    std::vector<std::string> output_files;
    std::string error;             ///< Failure message, empty on success
};

/**
 * @struct ConversionSummary
 * @brief Totals of a directory conversion run
 */
struct ConversionSummary {
    size_t pairs_found = 0;
    size_t pairs_converted = 0;
    size_t pairs_failed = 0;
    size_t points_written = 0;
    std::vector<PairResult> results;   ///< One entry per pair, in pair order
};

namespace detail {

/**
 * @class WorkerGroup
 * @brief Owns a set of threads and joins every one of them on destruction
 *
 * Threads already started are joined even when a later spawn throws.
 */
class WorkerGroup {
public:
    WorkerGroup() = default;
    ~WorkerGroup() { join(); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    /**
     * @brief Start a thread running task
     * @throws std::system_error if the thread cannot be started
     */
    void spawn(std::function<void()> task) { threads_.emplace_back(std::move(task)); }

    /**
     * @brief Wait for every started thread
     */
    void join() {
        for (auto& thread : threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        threads_.clear();
    }

    size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

} // namespace detail

/**
 * @class ConversionOrchestrator
 * @brief Pairs rasters by naming convention and converts each pair independently
 *
 * A pair's failure is logged and counted and never stops the other pairs.
 */
class ConversionOrchestrator {
public:
    /**
     * @brief Constructor
     * @param config Conversion configuration
     * @throws ConfigError if the configuration is invalid
     */
    explicit ConversionOrchestrator(const ConversionConfig& config);

    /**
     * @brief Find every deformation raster and its coherence partner
     * @return Pairs sorted by deformation file name
     * @throws InputDirectoryError if the input directory does not exist
     */
    std::vector<RasterPair> findPairs() const;

    /**
     * @brief Convert a single pair, writing one file per configured format
     * @return Result with point count and output files
     * @throws RasterReadError, DimensionMismatchError, WriteError
     */
    PairResult convertPair(const RasterPair& pair) const;

    /**
     * @brief Convert every pair in the input directory
     * @return Summary of found, converted and failed pairs
     * @throws InputDirectoryError if the input directory does not exist,
     *         WriteError if the output directory cannot be created
     */
    ConversionSummary run() const;

    /**
     * @brief Output path of a pair for one writer
     */
    std::string outputPathFor(const RasterPair& pair, const PointCloudWriter& writer) const;

    const ConversionConfig& getConfig() const { return config_; }

private:
    PairResult convertPairSafely(const RasterPair& pair) const;

    ConversionConfig config_;
    std::vector<std::unique_ptr<PointCloudWriter>> writers_;
};

} // namespace deformation_cloud

#endif // DEFORMATION_CLOUD_CONVERSION_HPP
