/**
 * @file log.cpp
 * @brief Console logging implementation
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "deformation_cloud/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace deformation_cloud {

namespace {

std::mutex& logMutex() {
    static std::mutex mutex;
    return mutex;
}

std::atomic<bool>& quietFlag() {
    static std::atomic<bool> quiet(false);
    return quiet;
}

// One lock per line so worker threads never interleave output
void writeLine(std::ostream& stream, const char* prefix, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex());
    stream << prefix << message << std::endl;
}

} // namespace

void logInfo(const std::string& message) {
    if (quietFlag().load()) {
        return;
    }
    writeLine(std::cout, "", message);
}

void logWarning(const std::string& message) {
    writeLine(std::cerr, "Warning: ", message);
}

void logError(const std::string& message) {
    writeLine(std::cerr, "Error: ", message);
}

void setLogQuiet(bool quiet) {
    quietFlag().store(quiet);
}

bool isLogQuiet() {
    return quietFlag().load();
}

} // namespace deformation_cloud
