// SPDX-License-Identifier: Apache-2.0
#include "tag_validation.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace coldspray {

namespace {
const char* value_kind(const Value& value) {
    switch (value.index()) {
    case 0:
        return "bool";
    case 1:
        return "integer";
    case 2:
        return "float";
    default:
        return "string";
    }
}

std::string join_speeds(const std::map<std::string, std::int64_t>& speeds) {
    std::ostringstream out;
    bool first = true;
    for (const auto& entry : speeds) {
        out << (first ? "" : ", ") << entry.first;
        first = false;
    }
    return out.str();
}

void check_type(const TagDefinition& def, const Value& value) {
    bool ok = false;
    switch (def.type) {
    case TagType::Float:
        ok = std::holds_alternative<double>(value) || std::holds_alternative<std::int64_t>(value);
        break;
    case TagType::Integer:
        ok = std::holds_alternative<std::int64_t>(value);
        break;
    case TagType::Bool:
        ok = std::holds_alternative<bool>(value);
        break;
    case TagType::String:
        ok = std::holds_alternative<std::string>(value);
        break;
    }
    if (!ok) {
        throw ValidationError(def.path, std::string("expected ") + to_string(def.type) + ", got " + value_kind(value));
    }
    if (const auto* d = std::get_if<double>(&value); d && !std::isfinite(*d)) {
        throw ValidationError(def.path, "value is not finite");
    }
}
} // namespace

void validate_write(const TagDefinition& def, const Value& value) {
    if (def.internal) {
        return;
    }
    if (!def.writable()) {
        throw ValidationError(def.path, "tag is read-only");
    }

    if (const auto* label = std::get_if<std::string>(&value); label && !def.speeds.empty()) {
        if (def.speeds.count(*label) == 0) {
            throw ValidationError(def.path, "unknown speed '" + *label + "' (expected " + join_speeds(def.speeds) + ")");
        }
        return;
    }

    check_type(def, value);

    if (def.range && !std::holds_alternative<bool>(value)) {
        if (const auto number = as_number(value)) {
            const auto [lo, hi] = *def.range;
            if (*number < lo || *number > hi) {
                std::ostringstream msg;
                msg << to_string(value) << " outside range [" << lo << ", " << hi << "]";
                throw ValidationError(def.path, msg.str());
            }
        }
    }

    if (!def.options.empty()) {
        const auto text = to_string(value);
        if (std::find(def.options.begin(), def.options.end(), text) == def.options.end()) {
            throw ValidationError(def.path, "'" + text + "' is not an allowed option");
        }
    }
}

} // namespace coldspray
