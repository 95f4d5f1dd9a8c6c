// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "tag_types.hpp"

#include <cstdint>

#include <nlohmann/json.hpp>

namespace coldspray {

constexpr std::int64_t kScaleCounts = 4095; // 12-bit converter full scale

// Converts a value to the declared tag type. Throws std::invalid_argument when the value cannot be represented.
Value coerce(TagType type, const Value& value);

// Raw hardware value -> engineering value (12-bit scaling, speed labels, type coercion).
Value to_engineering(const TagDefinition& def, const Value& raw);

// Engineering value -> raw hardware value. Inverse of to_engineering.
Value to_hardware(const TagDefinition& def, const Value& engineering);

// 12-bit helpers; full_scale is the engineering value at 4095 counts.
std::int64_t scale_to_counts(double engineering, double full_scale);
double counts_to_scale(double counts, double full_scale);

Value value_from_json(const nlohmann::json& json);
nlohmann::json value_to_json(const Value& value);

bool values_equal(const Value& a, const Value& b);

} // namespace coldspray
