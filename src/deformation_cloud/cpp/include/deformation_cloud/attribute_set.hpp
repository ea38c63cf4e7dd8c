/**
 * @file attribute_set.hpp
 * @brief Named, index-aligned per-point attribute values
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright 2025 Scott Friedman and Project Contributors
 */

#ifndef DEFORMATION_CLOUD_ATTRIBUTE_SET_HPP
#define DEFORMATION_CLOUD_ATTRIBUTE_SET_HPP

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace deformation_cloud {

/**
 * @class PointAttributeSet
 * @brief Ordered map from attribute name to one value per point
 *
 * Every attribute holds exactly getPointCount() values. The check lives in
 * addAttribute(), so a set can never be partially populated.
 */
class PointAttributeSet {
public:
    /**
     * @brief Constructor
     * @param point_count Number of points every attribute must cover
     */
    explicit PointAttributeSet(size_t point_count = 0);

    /**
     * @brief Constructor from a list of named value sequences
     * @param point_count Number of points every attribute must cover
     * @param attributes Attributes in declaration order
     * @throws std::invalid_argument on a length mismatch or duplicate name
     */
    PointAttributeSet(size_t point_count,
                      std::vector<std::pair<std::string, std::vector<double>>> attributes);

    /**
     * @brief Append a new attribute
     * @param name Attribute name (non-empty, unique within the set)
     * @param values One value per point
     * @throws std::invalid_argument on a length mismatch, empty or duplicate name
     */
    void addAttribute(const std::string& name, std::vector<double> values);

    /**
     * @brief Append a new attribute with every point set to a fill value
     * @param name Attribute name (non-empty, unique within the set)
     * @param fill_value Value given to every point
     */
    void addAttribute(const std::string& name, double fill_value);

    bool hasAttribute(const std::string& name) const;

    /**
     * @brief Get the values of one attribute
     * @throws std::out_of_range if the attribute does not exist
     */
    const std::vector<double>& getValues(const std::string& name) const;

    /**
     * @brief Attribute names in insertion order
     */
    std::vector<std::string> getNames() const;

    size_t getPointCount() const { return point_count_; }
    size_t getAttributeCount() const { return attributes_.size(); }
    bool empty() const { return attributes_.empty(); }

    // Iteration in insertion order
    using Entry = std::pair<std::string, std::vector<double>>;
    std::vector<Entry>::const_iterator begin() const { return attributes_.begin(); }
    std::vector<Entry>::const_iterator end() const { return attributes_.end(); }

private:
    size_t point_count_;
    std::vector<Entry> attributes_;
};

} // namespace deformation_cloud

#endif // DEFORMATION_CLOUD_ATTRIBUTE_SET_HPP
