// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "tag_types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace coldspray {

// Translation between logical tag paths and hardware addresses.
// Tables are immutable once published; build_mappings() swaps in a complete new set.
class TagMapping {
public:
    struct Tables {
        std::map<std::string, TagDefinitionPtr> tags; // every accepted tag, keyed by path
        std::unordered_map<std::string, std::string> path_to_hw;
        std::unordered_map<std::string, std::string> plc_to_path;
        std::unordered_map<std::string, std::string> feeder_to_path;

        TagDefinitionPtr find(const std::string& path) const;
        std::optional<std::string> find_path(const std::string& hw_address, Transport transport) const;
    };

    TagMapping();

    // Walks a nested group -> tag document and publishes the resulting tables.
    void build_mappings(const nlohmann::json& tag_config);

    std::string to_hardware_tag(const std::string& mapped_name) const;
    std::string to_mapped_name(const std::string& hw_address, Transport transport = Transport::Plc) const;
    std::optional<std::string> find_mapped_name(const std::string& hw_address,
                                                Transport transport = Transport::Plc) const;
    TagDefinitionPtr get_tag_metadata(const std::string& mapped_name) const;
    bool is_plc_tag(const std::string& mapped_name) const;
    bool is_feeder_tag(const std::string& mapped_name) const;

    std::shared_ptr<const Tables> snapshot() const;
    std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::shared_ptr<const Tables> tables_;
};

} // namespace coldspray
