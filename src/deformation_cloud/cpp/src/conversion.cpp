/**
 * @file conversion.cpp
 * @brief Implementation of the directory conversion driver
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "deformation_cloud/conversion.hpp"
#include "deformation_cloud/errors.hpp"
#include "deformation_cloud/log.hpp"
#include "deformation_cloud/point_cloud.hpp"
#include "deformation_cloud/raster.hpp"
#include "deformation_cloud/sampling.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace deformation_cloud {

namespace {

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ConversionOrchestrator::ConversionOrchestrator(const ConversionConfig& config)
    : config_(config)
{
    validateConfig(config_);

    TextWriterOptions text_options;
    text_options.delimiter = config_.text_delimiter;
    for (const auto& format : config_.formats) {
        writers_.push_back(makeWriter(format, text_options));
    }
}

std::vector<RasterPair> ConversionOrchestrator::findPairs() const {
    std::error_code ec;
    const fs::path input_dir(config_.input_dir);
    if (config_.input_dir.empty() || !fs::is_directory(input_dir, ec)) {
        throw InputDirectoryError("Input directory does not exist: " + config_.input_dir);
    }

    // Candidate pairs with the rank of their extension in raster_extensions
    std::vector<std::pair<RasterPair, size_t>> candidates;
    fs::directory_iterator it(input_dir, ec);
    if (ec) {
        throw InputDirectoryError("Cannot scan input directory " + config_.input_dir +
                                  ": " + ec.message());
    }

    for (const fs::directory_entry& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }

        const fs::path& path = entry.path();
        const std::string extension = path.extension().string();
        auto ext_it = std::find(config_.raster_extensions.begin(),
                                config_.raster_extensions.end(), extension);
        if (ext_it == config_.raster_extensions.end()) {
            continue;
        }

        const std::string stem = path.stem().string();
        if (!endsWith(stem, config_.deformation_suffix) ||
            stem.size() == config_.deformation_suffix.size()) {
            continue;
        }

        RasterPair pair;
        pair.stamp = stem.substr(0, stem.size() - config_.deformation_suffix.size());
        pair.deformation_file = path.string();

        fs::path coherence = input_dir / (pair.stamp + config_.coherence_suffix + extension);
        if (fs::is_regular_file(coherence, entry_ec)) {
            pair.coherence_file = coherence.string();
        }
        const auto rank = static_cast<size_t>(ext_it - config_.raster_extensions.begin());
        candidates.emplace_back(pair, rank);
    }

    // Outputs are named by stamp, so one stamp may produce only one pair:
    // the extension listed first in raster_extensions wins
    std::sort(candidates.begin(), candidates.end(),
              [](const std::pair<RasterPair, size_t>& a, const std::pair<RasterPair, size_t>& b) {
                  if (a.first.stamp != b.first.stamp) {
                      return a.first.stamp < b.first.stamp;
                  }
                  return a.second < b.second;
              });

    std::vector<RasterPair> pairs;
    for (const auto& candidate : candidates) {
        if (!pairs.empty() && pairs.back().stamp == candidate.first.stamp) {
            logWarning("Skipping " + candidate.first.deformation_file + ": stamp " +
                       candidate.first.stamp + " is already converted from " +
                       pairs.back().deformation_file);
            continue;
        }
        pairs.push_back(candidate.first);
    }

    std::sort(pairs.begin(), pairs.end(), [](const RasterPair& a, const RasterPair& b) {
        return a.deformation_file < b.deformation_file;
    });
    return pairs;
}

std::string ConversionOrchestrator::outputPathFor(const RasterPair& pair,
                                                  const PointCloudWriter& writer) const {
    fs::path output = fs::path(config_.output_dir) /
        (pair.stamp + config_.deformation_suffix + writer.extension());
    return output.string();
}

PairResult ConversionOrchestrator::convertPair(const RasterPair& pair) const {
    PairResult result;
    result.pair = pair;

    logInfo("Reading deformation raster: " + pair.deformation_file);
    RasterGrid deformation = readRaster(pair.deformation_file);

    std::optional<RasterGrid> coherence;
    if (!pair.coherence_file.empty()) {
        logInfo("Reading coherence raster: " + pair.coherence_file);
        coherence.emplace(readRaster(pair.coherence_file));
    } else {
        logWarning("No coherence raster for " + pair.deformation_file +
                   ", every cell is kept at coherence 1.0");
    }
    const RasterGrid* coherence_grid = coherence ? &*coherence : nullptr;

    SamplingResult sampled = sampleCells(deformation, coherence_grid, config_.sampling);
    PointCloud cloud = buildPointCloud(deformation, coherence_grid,
                                       deformation.getGeoTransform(), sampled.cells);

    logInfo("Grid " + std::to_string(deformation.getHeight()) + "x" +
            std::to_string(deformation.getWidth()) + ": " +
            std::to_string(sampled.candidates) + " sampled cells, " +
            std::to_string(sampled.rejected_missing) + " missing, " +
            std::to_string(sampled.rejected_coherence) + " below coherence " +
            std::to_string(config_.sampling.coherence_threshold) + ", " +
            std::to_string(cloud.getNumPoints()) + " points");

    for (const auto& writer : writers_) {
        const std::string output_file = outputPathFor(pair, *writer);
        writer->write(cloud, output_file);
        logInfo("Saved " + writer->formatName() + " point cloud: " + output_file);
        result.output_files.push_back(output_file);
    }

    result.num_points = cloud.getNumPoints();
    result.success = true;
    return result;
}

PairResult ConversionOrchestrator::convertPairSafely(const RasterPair& pair) const {
    try {
        return convertPair(pair);
    } catch (const RasterReadError& e) {
        logError(e.what());
        return PairResult{pair, false, 0, {}, e.what()};
    } catch (const DimensionMismatchError& e) {
        logError(pair.deformation_file + ": " + e.what());
        return PairResult{pair, false, 0, {}, e.what()};
    } catch (const WriteError& e) {
        logError(pair.deformation_file + ": " + e.what());
        return PairResult{pair, false, 0, {}, e.what()};
    } catch (const std::exception& e) {
        logError("Unexpected failure converting " + pair.deformation_file + ": " + e.what());
        return PairResult{pair, false, 0, {}, e.what()};
    }
}

ConversionSummary ConversionOrchestrator::run() const {
    std::vector<RasterPair> pairs = findPairs();

    std::error_code ec;
    fs::create_directories(config_.output_dir, ec);
    if (ec) {
        throw WriteError(config_.output_dir, "cannot create output directory: " + ec.message());
    }

    logInfo("Found " + std::to_string(pairs.size()) + " deformation rasters in " +
            config_.input_dir);

    ConversionSummary summary;
    summary.pairs_found = pairs.size();
    summary.results.resize(pairs.size());

    const size_t num_workers = std::min(static_cast<size_t>(config_.workers), pairs.size());
    if (num_workers <= 1) {
        for (size_t i = 0; i < pairs.size(); i++) {
            summary.results[i] = convertPairSafely(pairs[i]);
        }
    } else {
        // Pairs share nothing but the output directory; each worker claims the next index
        std::atomic<size_t> next(0);
        auto work = [&]() {
            for (size_t i = next++; i < pairs.size(); i = next++) {
                summary.results[i] = convertPairSafely(pairs[i]);
            }
        };

        detail::WorkerGroup workers;
        try {
            for (size_t w = 0; w < num_workers; w++) {
                workers.spawn(work);
            }
        } catch (const std::system_error& e) {
            logWarning("Started " + std::to_string(workers.size()) + " of " +
                       std::to_string(num_workers) + " worker threads: " + e.what());
        }
        if (workers.size() == 0) {
            work();
        }
        workers.join();
    }

    for (const auto& result : summary.results) {
        if (result.success) {
            summary.pairs_converted++;
            summary.points_written += result.num_points;
        } else {
            summary.pairs_failed++;
        }
    }

    logInfo("Conversion finished: " + std::to_string(summary.pairs_found) + " pairs found, " +
            std::to_string(summary.pairs_converted) + " converted, " +
            std::to_string(summary.pairs_failed) + " failed");

    return summary;
}

} // namespace deformation_cloud
