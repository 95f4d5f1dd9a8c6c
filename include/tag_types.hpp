// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace coldspray {

// Engineering or raw hardware value. The active alternative follows TagDefinition::type.
using Value = std::variant<bool, std::int64_t, double, std::string>;

enum class TagType {
    Float,
    Integer,
    Bool,
    String,
};

enum class TagAccess {
    Read,
    ReadWrite,
};

enum class Scaling {
    None,
    Linear12Bit, // "12bit_linear": analog input counts
    Dac12Bit,    // "12bit_dac": analog output counts
};

enum class Transport {
    None, // internal or unmapped
    Plc,
    Feeder,
};

// P-variable block of one feeder on the motion controller shell.
struct FeederRegisters {
    std::string freq_var;
    std::string time_var;
    std::string start_var;
    std::int64_t freq_step{200};
    std::int64_t default_time{999};
    std::int64_t start_val{1};
    std::int64_t stop_val{4};
};

struct TagDefinition {
    std::string path;  // e.g. gas_control.main_flow.setpoint
    std::string group; // first path segment
    std::string description;
    std::optional<std::string> hw_address;
    Transport transport{Transport::None};
    TagType type{TagType::Float};
    TagAccess access{TagAccess::Read};
    std::string unit;
    std::optional<std::pair<double, double>> range;
    std::vector<std::string> options;
    std::map<std::string, std::int64_t> speeds;
    Scaling scaling{Scaling::None};
    bool internal{false};
    bool mapped{false};
    std::optional<FeederRegisters> feeder;
    std::optional<Value> default_value;

    bool writable() const { return access == TagAccess::ReadWrite; }
};

using TagDefinitionPtr = std::shared_ptr<const TagDefinition>;

struct TagValue {
    Value value;
    std::chrono::system_clock::time_point timestamp{};
    TagDefinitionPtr definition;
};

const char* to_string(TagType type);
const char* to_string(Transport transport);
std::string to_string(const Value& value);

// Numeric view of bool/integer/float values; std::nullopt for strings.
std::optional<double> as_number(const Value& value);

} // namespace coldspray
