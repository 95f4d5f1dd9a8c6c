// SPDX-License-Identifier: Apache-2.0
#include "value_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace coldspray {

namespace {
std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

double parse_double(const std::string& text) {
    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("number out of range '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("trailing characters in number '" + text + "'");
    }
    return v;
}

std::int64_t parse_integer(const std::string& text) {
    std::size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &used);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("integer out of range '" + text + "'");
    }
    if (used != text.size()) {
        throw std::invalid_argument("not an integer '" + text + "'");
    }
    return static_cast<std::int64_t>(v);
}

double full_scale_of(const TagDefinition& def) {
    if (!def.range || def.range->second <= 0.0) {
        throw std::invalid_argument("scaled tag " + def.path + " has no positive range maximum");
    }
    return def.range->second;
}
} // namespace

std::int64_t scale_to_counts(double engineering, double full_scale) {
    const auto counts = static_cast<std::int64_t>(std::llround(engineering * kScaleCounts / full_scale));
    return std::clamp<std::int64_t>(counts, 0, kScaleCounts);
}

double counts_to_scale(double counts, double full_scale) {
    return counts * full_scale / kScaleCounts;
}

Value coerce(TagType type, const Value& value) {
    switch (type) {
    case TagType::Float: {
        if (const auto* s = std::get_if<std::string>(&value)) {
            return parse_double(*s);
        }
        return *as_number(value);
    }
    case TagType::Integer: {
        if (const auto* i = std::get_if<std::int64_t>(&value)) {
            return *i;
        }
        if (const auto* d = std::get_if<double>(&value)) {
            if (!std::isfinite(*d)) {
                throw std::invalid_argument("non-finite value for integer tag");
            }
            return static_cast<std::int64_t>(std::llround(*d));
        }
        if (const auto* b = std::get_if<bool>(&value)) {
            return static_cast<std::int64_t>(*b ? 1 : 0);
        }
        return parse_integer(std::get<std::string>(value));
    }
    case TagType::Bool: {
        if (const auto* s = std::get_if<std::string>(&value)) {
            const auto text = lowercase(*s);
            if (text == "true" || text == "1" || text == "on") {
                return true;
            }
            if (text == "false" || text == "0" || text == "off") {
                return false;
            }
            throw std::invalid_argument("not a boolean '" + *s + "'");
        }
        return *as_number(value) != 0.0;
    }
    case TagType::String:
        return to_string(value);
    }
    throw std::invalid_argument("unsupported tag type");
}

Value to_engineering(const TagDefinition& def, const Value& raw) {
    if (def.scaling != Scaling::None) {
        const auto counts = as_number(raw);
        if (!counts) {
            throw std::invalid_argument("scaled tag " + def.path + " received non-numeric raw value");
        }
        return coerce(def.type, counts_to_scale(*counts, full_scale_of(def)));
    }
    if (!def.speeds.empty()) {
        if (const auto number = as_number(raw); number && !std::holds_alternative<bool>(raw)) {
            const auto code = static_cast<std::int64_t>(std::llround(*number));
            for (const auto& [label, speed] : def.speeds) {
                if (speed == code) {
                    return label;
                }
            }
        }
        // Hardware values without a named speed are reported as-is.
        return raw;
    }
    return coerce(def.type, raw);
}

Value to_hardware(const TagDefinition& def, const Value& engineering) {
    if (def.scaling != Scaling::None) {
        const auto number = as_number(engineering);
        if (!number || !std::isfinite(*number)) {
            throw std::invalid_argument("scaled tag " + def.path + " needs a finite number");
        }
        return scale_to_counts(*number, full_scale_of(def));
    }
    if (!def.speeds.empty()) {
        if (const auto* label = std::get_if<std::string>(&engineering)) {
            const auto it = def.speeds.find(*label);
            if (it == def.speeds.end()) {
                throw std::invalid_argument("unknown speed '" + *label + "' for " + def.path);
            }
            return it->second;
        }
    }
    return coerce(def.type, engineering);
}

Value value_from_json(const nlohmann::json& json) {
    if (json.is_boolean()) {
        return json.get<bool>();
    }
    if (json.is_number_integer()) {
        return json.get<std::int64_t>();
    }
    if (json.is_number()) {
        return json.get<double>();
    }
    if (json.is_string()) {
        return json.get<std::string>();
    }
    throw std::invalid_argument("unsupported JSON value: " + json.dump());
}

nlohmann::json value_to_json(const Value& value) {
    return std::visit([](const auto& v) { return nlohmann::json(v); }, value);
}

bool values_equal(const Value& a, const Value& b) {
    if (a.index() == b.index()) {
        return a == b;
    }
    const auto na = as_number(a);
    const auto nb = as_number(b);
    return na && nb && *na == *nb;
}

} // namespace coldspray
