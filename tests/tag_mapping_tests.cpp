// SPDX-License-Identifier: Apache-2.0
#include "errors.hpp"
#include "tag_mapping.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>

using namespace coldspray;

namespace {
nlohmann::json make_config() {
    return nlohmann::json::parse(R"({
        "version": "1.0.0",
        "gas_control": {
            "tags": {
                "main_flow": {
                    "setpoint": {"type": "float", "access": "read/write", "scaling": "12bit_dac",
                                 "range": [0, 100], "unit": "SLPM", "mapped": true, "plc_tag": "AOS32-0.1.2.1"},
                    "measured": {"type": "float", "access": "read", "scaling": "12bit_linear",
                                 "range": [0, 100], "mapped": true, "plc_tag": "MainFlowRate"}
                },
                "hardware_sets": {
                    "set1": {
                        "feeder": {
                            "frequency": {"type": "integer", "access": "read/write", "min_value": 200,
                                          "max_value": 1200, "mapped": true,
                                          "ssh": {"freq_var": "P6", "time_var": "P12", "start_var": "P10"}}
                        }
                    }
                }
            }
        },
        "valve_control": {
            "vent": {"type": "bool", "access": "rw", "mapped": true, "plc_tag": "VentSwitch"},
            "vent_copy": {"type": "bool", "access": "read", "mapped": true, "plc_tag": "VentSwitch"},
            "orphan": {"type": "bool", "access": "read/write", "mapped": true}
        },
        "system_state": {
            "state": {"type": "string", "access": "read/write", "internal": true, "mapped": false,
                      "options": ["READY", "RUNNING"], "default": "READY"},
            "errors": {"type": "dict", "internal": true}
        }
    })");
}

void test_build_and_lookup() {
    TagMapping mapping;
    mapping.build_mappings(make_config());

    assert(mapping.to_hardware_tag("gas_control.main_flow.setpoint") == "AOS32-0.1.2.1");
    assert(mapping.to_mapped_name("MainFlowRate") == "gas_control.main_flow.measured");
    assert(mapping.to_hardware_tag("gas_control.hardware_sets.set1.feeder.frequency") == "P6");
    assert(mapping.to_mapped_name("P6", Transport::Feeder) == "gas_control.hardware_sets.set1.feeder.frequency");
    assert(!mapping.find_mapped_name("P6", Transport::Plc).has_value());

    const auto def = mapping.get_tag_metadata("gas_control.main_flow.setpoint");
    assert(def->group == "gas_control");
    assert(def->type == TagType::Float);
    assert(def->access == TagAccess::ReadWrite);
    assert(def->scaling == Scaling::Dac12Bit);
    assert(def->range && def->range->second == 100.0);
    assert(def->unit == "SLPM");

    const auto feeder = mapping.get_tag_metadata("gas_control.hardware_sets.set1.feeder.frequency");
    assert(feeder->feeder.has_value());
    assert(feeder->feeder->start_var == "P10");
    assert(feeder->feeder->default_time == 999);
    assert(feeder->range && feeder->range->first == 200.0 && feeder->range->second == 1200.0);

    assert(mapping.is_plc_tag("valve_control.vent"));
    assert(!mapping.is_feeder_tag("valve_control.vent"));
    assert(mapping.is_feeder_tag("gas_control.hardware_sets.set1.feeder.frequency"));
    assert(!mapping.is_plc_tag("does.not.exist"));

    const auto state = mapping.get_tag_metadata("system_state.state");
    assert(state->internal);
    assert(!state->hw_address.has_value());
    assert(state->default_value && std::get<std::string>(*state->default_value) == "READY");
}

void test_skips_and_duplicates() {
    TagMapping mapping;
    mapping.build_mappings(make_config());

    // First registration of a hardware address wins.
    assert(mapping.to_mapped_name("VentSwitch") == "valve_control.vent");
    bool threw = false;
    try {
        mapping.get_tag_metadata("valve_control.vent_copy");
    } catch (const UnknownTagError& e) {
        threw = true;
        assert(e.tag() == "valve_control.vent_copy");
    }
    assert(threw);

    threw = false;
    try {
        mapping.to_hardware_tag("valve_control.orphan");
    } catch (const UnknownTagError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        mapping.get_tag_metadata("system_state.errors");
    } catch (const UnknownTagError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        mapping.to_mapped_name("NotARegister");
    } catch (const UnknownTagError&) {
        threw = true;
    }
    assert(threw);
}

void test_bijection() {
    TagMapping mapping;
    mapping.build_mappings(make_config());
    const auto tables = mapping.snapshot();
    for (const auto& [path, hw] : tables->path_to_hw) {
        const auto def = tables->find(path);
        assert(mapping.to_mapped_name(hw, def->transport) == path);
        assert(mapping.to_hardware_tag(mapping.to_mapped_name(hw, def->transport)) == hw);
    }
    assert(tables->plc_to_path.size() + tables->feeder_to_path.size() == tables->path_to_hw.size());
}

void test_tag_groups_wrapper_and_rebuild() {
    TagMapping mapping;
    mapping.build_mappings(make_config());
    const auto before = mapping.snapshot();

    nlohmann::json wrapped;
    wrapped["tag_groups"]["relay_control"]["shutter"] = {
        {"type", "bool"}, {"access", "read/write"}, {"mapped", true}, {"plc_tag", "Shutter"}};
    mapping.build_mappings(wrapped);

    // Old snapshot stays intact for readers that still hold it.
    assert(before->find("valve_control.vent") != nullptr);
    assert(mapping.size() == 1);
    assert(mapping.to_hardware_tag("relay_control.shutter") == "Shutter");
    assert(!mapping.find_mapped_name("VentSwitch").has_value());
}

void test_malformed_and_unmarked_entries_are_skipped() {
    TagMapping mapping;
    mapping.build_mappings(nlohmann::json::parse(R"({
        "relay_control": {
            "shutter": {"type": "bool", "access": "read/write", "mapped": true, "plc_tag": "Shutter"},
            "bad_range": {"type": "float", "range": ["lo", "hi"], "mapped": true, "plc_tag": "BadRange"},
            "bad_speeds": {"type": "integer", "speeds": {"low": "slow"}, "mapped": true, "plc_tag": "BadSpeeds"},
            "bad_type": {"type": 7, "mapped": true, "plc_tag": "BadType"},
            "bad_options": {"type": "string", "options": [{"a": 1}], "mapped": true, "plc_tag": "BadOptions"},
            "bad_flag": {"type": "bool", "mapped": "yes", "plc_tag": "BadFlag"},
            "unmarked": {"type": "bool", "access": "read/write", "plc_tag": "Unmarked"},
            "disabled": {"type": "bool", "mapped": false, "plc_tag": "Disabled"}
        }
    })"));

    assert(mapping.size() == 1);
    assert(mapping.to_hardware_tag("relay_control.shutter") == "Shutter");
    for (const auto* hw : {"BadRange", "BadSpeeds", "BadType", "BadOptions", "BadFlag", "Unmarked", "Disabled"}) {
        assert(!mapping.find_mapped_name(hw).has_value());
    }
}

void test_concurrent_readers_see_complete_tables() {
    TagMapping mapping;
    mapping.build_mappings(make_config());
    const auto full_size = mapping.size();
    std::atomic<bool> done{false};
    std::atomic<bool> partial_seen{false};

    std::thread reader([&]() {
        while (!done) {
            const auto tables = mapping.snapshot();
            if (tables->tags.size() != full_size) {
                partial_seen = true;
            }
        }
    });
    for (int i = 0; i < 200; ++i) {
        mapping.build_mappings(make_config());
    }
    done = true;
    reader.join();
    assert(!partial_seen);
}
} // namespace

int main() {
    test_build_and_lookup();
    test_skips_and_duplicates();
    test_bijection();
    test_tag_groups_wrapper_and_rebuild();
    test_malformed_and_unmarked_entries_are_skipped();
    test_concurrent_readers_see_complete_tables();
    std::cout << "tag_mapping_tests passed" << std::endl;
    return 0;
}
