// SPDX-License-Identifier: Apache-2.0
#include "errors.hpp"
#include "tag_validation.hpp"

#include <cassert>
#include <iostream>
#include <limits>
#include <string>

using namespace coldspray;

namespace {
bool rejects(const TagDefinition& def, const Value& value) {
    try {
        validate_write(def, value);
    } catch (const ValidationError& e) {
        assert(e.tag() == def.path);
        return true;
    }
    return false;
}

TagDefinition flow_setpoint() {
    TagDefinition def;
    def.path = "gas_control.main_flow.setpoint";
    def.type = TagType::Float;
    def.access = TagAccess::ReadWrite;
    def.range = std::make_pair(0.0, 100.0);
    return def;
}
} // namespace

int main() {
    // Range bounds are inclusive
    const auto flow = flow_setpoint();
    assert(!rejects(flow, 100.0));
    assert(!rejects(flow, 0.0));
    assert(!rejects(flow, std::int64_t{42}));
    assert(rejects(flow, 100.0001));
    assert(rejects(flow, -0.5));
    assert(rejects(flow, std::string("50")));
    assert(rejects(flow, true));
    assert(rejects(flow, std::numeric_limits<double>::quiet_NaN()));

    // Read-only tags refuse every write
    auto measured = flow;
    measured.path = "gas_control.main_flow.measured";
    measured.access = TagAccess::Read;
    assert(rejects(measured, 10.0));

    // Integer and bool types are strict
    TagDefinition counts;
    counts.path = "gas_control.hardware_sets.set1.deagglomerator.frequency";
    counts.type = TagType::Integer;
    counts.access = TagAccess::ReadWrite;
    assert(!rejects(counts, std::int64_t{500}));
    assert(rejects(counts, 500.0));

    TagDefinition vent;
    vent.path = "valve_control.vent";
    vent.type = TagType::Bool;
    vent.access = TagAccess::ReadWrite;
    assert(!rejects(vent, false));
    assert(rejects(vent, std::int64_t{1}));

    // Options
    TagDefinition mode;
    mode.path = "system_state.mode";
    mode.type = TagType::String;
    mode.access = TagAccess::ReadWrite;
    mode.options = {"manual", "auto"};
    assert(!rejects(mode, std::string("auto")));
    assert(rejects(mode, std::string("turbo")));

    // Named speeds accept labels; numeric writes still go through type and range checks
    TagDefinition duty;
    duty.path = "gas_control.hardware_sets.set1.deagglomerator.duty_cycle";
    duty.type = TagType::Integer;
    duty.access = TagAccess::ReadWrite;
    duty.range = std::make_pair(20.0, 35.0);
    duty.speeds = {{"high", 20}, {"low", 30}};
    assert(!rejects(duty, std::string("high")));
    assert(rejects(duty, std::string("medium")));
    assert(!rejects(duty, std::int64_t{25}));
    assert(rejects(duty, std::int64_t{40}));

    // Internal tags are not validated
    TagDefinition state;
    state.path = "system_state.state";
    state.type = TagType::String;
    state.access = TagAccess::Read;
    state.internal = true;
    assert(!rejects(state, std::string("READY")));

    std::cout << "tag_validation_tests passed" << std::endl;
    return 0;
}
