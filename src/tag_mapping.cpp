// SPDX-License-Identifier: Apache-2.0
#include "tag_mapping.hpp"

#include "errors.hpp"
#include "value_codec.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

#include <everest/logging.hpp>

namespace coldspray {

namespace {
using nlohmann::json;

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_tag_node(const json& node) {
    return node.is_object() &&
           (node.contains("type") || node.contains("plc_tag") || node.contains("ssh") || node.contains("internal"));
}

std::optional<TagType> parse_type(const std::string& text) {
    const auto t = lowercase(text);
    if (t == "float" || t == "double" || t == "number") {
        return TagType::Float;
    }
    if (t == "integer" || t == "int") {
        return TagType::Integer;
    }
    if (t == "bool" || t == "boolean") {
        return TagType::Bool;
    }
    if (t == "string" || t == "datetime") {
        return TagType::String;
    }
    return std::nullopt;
}

TagAccess parse_access(const std::string& text) {
    const auto a = lowercase(text);
    if (a == "read/write" || a == "read-write" || a == "rw" || a == "write") {
        return TagAccess::ReadWrite;
    }
    return TagAccess::Read;
}

std::optional<std::pair<double, double>> parse_range(const json& node) {
    if (node.contains("range") && node["range"].is_array() && node["range"].size() == 2) {
        return std::make_pair(node["range"][0].get<double>(), node["range"][1].get<double>());
    }
    if (node.contains("min_value") || node.contains("max_value")) {
        return std::make_pair(node.value("min_value", std::numeric_limits<double>::lowest()),
                              node.value("max_value", std::numeric_limits<double>::max()));
    }
    return std::nullopt;
}

FeederRegisters parse_feeder(const json& ssh) {
    FeederRegisters regs;
    regs.freq_var = ssh.value("freq_var", "");
    regs.time_var = ssh.value("time_var", "");
    regs.start_var = ssh.value("start_var", "");
    regs.freq_step = ssh.value("freq_step", regs.freq_step);
    regs.default_time = ssh.value("default_time", regs.default_time);
    regs.start_val = ssh.value("start_val", regs.start_val);
    regs.stop_val = ssh.value("stop_val", regs.stop_val);
    return regs;
}

std::optional<TagDefinition> parse_tag(const std::string& path, const json& node) {
    const auto type_name = node.value("type", "");
    const auto type = parse_type(type_name);
    if (!type) {
        EVLOG_warning << "Skipping tag " << path << ": unsupported type '" << type_name << "'";
        return std::nullopt;
    }

    TagDefinition def;
    def.path = path;
    def.group = path.substr(0, path.find('.'));
    def.description = node.value("description", "");
    def.type = *type;
    def.access = parse_access(node.value("access", "read"));
    def.unit = node.value("unit", "");
    def.range = parse_range(node);
    def.internal = node.value("internal", false);

    if (node.contains("options") && node["options"].is_array()) {
        for (const auto& opt : node["options"]) {
            def.options.push_back(to_string(value_from_json(opt)));
        }
    }
    if (node.contains("speeds") && node["speeds"].is_object()) {
        for (const auto& [label, speed] : node["speeds"].items()) {
            def.speeds[label] = speed.get<std::int64_t>();
        }
    }

    const auto scaling = lowercase(node.value("scaling", ""));
    if (scaling == "12bit_linear") {
        def.scaling = Scaling::Linear12Bit;
    } else if (scaling == "12bit_dac") {
        def.scaling = Scaling::Dac12Bit;
    } else if (!scaling.empty()) {
        EVLOG_warning << "Tag " << path << ": unknown scaling '" << scaling << "', using raw values";
    }
    if (def.scaling != Scaling::None && (!def.range || def.range->second <= 0.0)) {
        EVLOG_warning << "Tag " << path << ": 12-bit scaling needs a positive range maximum, using raw values";
        def.scaling = Scaling::None;
    }

    if (node.contains("default")) {
        try {
            def.default_value = coerce(def.type, value_from_json(node["default"]));
        } catch (const std::invalid_argument& e) {
            EVLOG_warning << "Tag " << path << ": ignoring default value (" << e.what() << ")";
        }
    }

    if (def.internal) {
        return def;
    }

    def.mapped = node.value("mapped", false);
    if (node.contains("plc_tag") && node["plc_tag"].is_string()) {
        def.hw_address = node["plc_tag"].get<std::string>();
        def.transport = Transport::Plc;
    } else if (node.contains("ssh") && node["ssh"].is_object() && node["ssh"].contains("freq_var")) {
        def.feeder = parse_feeder(node["ssh"]);
        def.hw_address = def.feeder->freq_var;
        def.transport = Transport::Feeder;
    }
    if (!def.mapped) {
        EVLOG_debug << "Skipping tag " << path << ": not marked mapped";
        return std::nullopt;
    }
    if (!def.hw_address || def.hw_address->empty()) {
        EVLOG_warning << "Skipping tag " << path << ": no plc_tag or ssh.freq_var";
        return std::nullopt;
    }
    return def;
}

struct BuildCounters {
    std::size_t plc{0};
    std::size_t feeder{0};
    std::size_t internal{0};
    std::size_t skipped{0};
};

void register_tag(TagMapping::Tables& tables, TagDefinition def, BuildCounters& counters) {
    if (def.hw_address) {
        auto& reverse = def.transport == Transport::Plc ? tables.plc_to_path : tables.feeder_to_path;
        const auto existing = reverse.find(*def.hw_address);
        if (existing != reverse.end()) {
            EVLOG_warning << "Skipping tag " << def.path << ": hardware address " << *def.hw_address
                          << " already mapped to " << existing->second;
            ++counters.skipped;
            return;
        }
        reverse.emplace(*def.hw_address, def.path);
        tables.path_to_hw.emplace(def.path, *def.hw_address);
        ++(def.transport == Transport::Plc ? counters.plc : counters.feeder);
    } else {
        ++counters.internal;
    }
    auto path = def.path;
    tables.tags.emplace(std::move(path), std::make_shared<const TagDefinition>(std::move(def)));
}

void walk(const json& node, const std::string& prefix, TagMapping::Tables& tables, BuildCounters& counters) {
    for (const auto& [key, child] : node.items()) {
        if (!child.is_object()) {
            continue;
        }
        if (key == "tags") {
            walk(child, prefix, tables, counters);
            continue;
        }
        const auto path = prefix.empty() ? key : prefix + "." + key;
        if (!is_tag_node(child)) {
            walk(child, path, tables, counters);
            continue;
        }
        std::optional<TagDefinition> def;
        try {
            def = parse_tag(path, child);
        } catch (const json::exception& e) {
            EVLOG_warning << "Skipping tag " << path << ": malformed field (" << e.what() << ")";
        } catch (const std::invalid_argument& e) {
            EVLOG_warning << "Skipping tag " << path << ": " << e.what();
        }
        if (def) {
            register_tag(tables, std::move(*def), counters);
        } else {
            ++counters.skipped;
        }
    }
}
} // namespace

TagDefinitionPtr TagMapping::Tables::find(const std::string& path) const {
    const auto it = tags.find(path);
    return it == tags.end() ? nullptr : it->second;
}

std::optional<std::string> TagMapping::Tables::find_path(const std::string& hw_address, Transport transport) const {
    const auto& reverse = transport == Transport::Feeder ? feeder_to_path : plc_to_path;
    const auto it = reverse.find(hw_address);
    if (it == reverse.end()) {
        return std::nullopt;
    }
    return it->second;
}

TagMapping::TagMapping() : tables_(std::make_shared<const Tables>()) {}

void TagMapping::build_mappings(const nlohmann::json& tag_config) {
    if (!tag_config.is_object()) {
        throw std::runtime_error("Tag configuration must be an object");
    }
    const auto& root = tag_config.contains("tag_groups") ? tag_config["tag_groups"] : tag_config;

    auto tables = std::make_shared<Tables>();
    BuildCounters counters;
    walk(root, "", *tables, counters);

    {
        std::lock_guard<std::mutex> lock(mtx_);
        tables_ = std::move(tables);
    }
    EVLOG_info << "Tag mapping built: " << counters.plc << " PLC, " << counters.feeder << " feeder, "
               << counters.internal << " internal, " << counters.skipped << " skipped";
}

std::shared_ptr<const TagMapping::Tables> TagMapping::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return tables_;
}

std::size_t TagMapping::size() const {
    return snapshot()->tags.size();
}

std::string TagMapping::to_hardware_tag(const std::string& mapped_name) const {
    const auto tables = snapshot();
    const auto it = tables->path_to_hw.find(mapped_name);
    if (it == tables->path_to_hw.end()) {
        throw UnknownTagError(mapped_name);
    }
    return it->second;
}

std::string TagMapping::to_mapped_name(const std::string& hw_address, Transport transport) const {
    auto path = find_mapped_name(hw_address, transport);
    if (!path) {
        throw UnknownTagError(hw_address);
    }
    return *path;
}

std::optional<std::string> TagMapping::find_mapped_name(const std::string& hw_address, Transport transport) const {
    return snapshot()->find_path(hw_address, transport);
}

TagDefinitionPtr TagMapping::get_tag_metadata(const std::string& mapped_name) const {
    auto def = snapshot()->find(mapped_name);
    if (!def) {
        throw UnknownTagError(mapped_name);
    }
    return def;
}

bool TagMapping::is_plc_tag(const std::string& mapped_name) const {
    const auto def = snapshot()->find(mapped_name);
    return def && def->transport == Transport::Plc;
}

bool TagMapping::is_feeder_tag(const std::string& mapped_name) const {
    const auto def = snapshot()->find(mapped_name);
    return def && def->transport == Transport::Feeder;
}

} // namespace coldspray
