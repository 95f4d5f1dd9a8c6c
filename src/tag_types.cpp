// SPDX-License-Identifier: Apache-2.0
#include "tag_types.hpp"

#include <sstream>

namespace coldspray {

const char* to_string(TagType type) {
    switch (type) {
    case TagType::Float:
        return "float";
    case TagType::Integer:
        return "integer";
    case TagType::Bool:
        return "bool";
    case TagType::String:
        return "string";
    }
    return "unknown";
}

const char* to_string(Transport transport) {
    switch (transport) {
    case Transport::Plc:
        return "plc";
    case Transport::Feeder:
        return "feeder";
    case Transport::None:
        break;
    }
    return "none";
}

std::string to_string(const Value& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "true" : "false";
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        std::ostringstream out;
        out << *d;
        return out.str();
    }
    return std::get<std::string>(value);
}

std::optional<double> as_number(const Value& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? 1.0 : 0.0;
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    return std::nullopt;
}

} // namespace coldspray
