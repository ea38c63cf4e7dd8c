/**
 * @file attribute_set.cpp
 * @brief Implementation of the per-point attribute set
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#include "deformation_cloud/attribute_set.hpp"

#include <algorithm>
#include <stdexcept>

namespace deformation_cloud {

PointAttributeSet::PointAttributeSet(size_t point_count)
    : point_count_(point_count)
{
}

PointAttributeSet::PointAttributeSet(
    size_t point_count,
    std::vector<std::pair<std::string, std::vector<double>>> attributes)
    : point_count_(point_count)
{
    attributes_.reserve(attributes.size());
    for (auto& attribute : attributes) {
        addAttribute(attribute.first, std::move(attribute.second));
    }
}

void PointAttributeSet::addAttribute(const std::string& name, std::vector<double> values) {
    if (name.empty()) {
        throw std::invalid_argument("Attribute name must not be empty");
    }
    if (hasAttribute(name)) {
        throw std::invalid_argument("Duplicate attribute: " + name);
    }
    if (values.size() != point_count_) {
        throw std::invalid_argument(
            "Attribute '" + name + "' has " + std::to_string(values.size()) +
            " values, expected " + std::to_string(point_count_));
    }
    attributes_.emplace_back(name, std::move(values));
}

void PointAttributeSet::addAttribute(const std::string& name, double fill_value) {
    addAttribute(name, std::vector<double>(point_count_, fill_value));
}

bool PointAttributeSet::hasAttribute(const std::string& name) const {
    return std::any_of(attributes_.begin(), attributes_.end(),
                       [&name](const Entry& entry) { return entry.first == name; });
}

const std::vector<double>& PointAttributeSet::getValues(const std::string& name) const {
    for (const auto& entry : attributes_) {
        if (entry.first == name) {
            return entry.second;
        }
    }
    throw std::out_of_range("Unknown attribute: " + name);
}

std::vector<std::string> PointAttributeSet::getNames() const {
    std::vector<std::string> names;
    names.reserve(attributes_.size());
    for (const auto& entry : attributes_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace deformation_cloud
