// SPDX-License-Identifier: Apache-2.0
#include "value_codec.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace coldspray;

namespace {
TagDefinition scaled_tag(Scaling scaling, double max) {
    TagDefinition def;
    def.path = "gas_control.main_flow.setpoint";
    def.type = TagType::Float;
    def.access = TagAccess::ReadWrite;
    def.scaling = scaling;
    def.range = std::make_pair(0.0, max);
    return def;
}

TagDefinition speed_tag() {
    TagDefinition def;
    def.path = "gas_control.hardware_sets.set1.deagglomerator.duty_cycle";
    def.type = TagType::Integer;
    def.access = TagAccess::ReadWrite;
    def.speeds = {{"high", 20}, {"med", 25}, {"low", 30}, {"off", 35}};
    return def;
}

void test_twelve_bit_scaling() {
    for (const auto scaling : {Scaling::Linear12Bit, Scaling::Dac12Bit}) {
        const auto def = scaled_tag(scaling, 100.0);
        const auto counts = std::get<std::int64_t>(to_hardware(def, 50.0));
        assert(counts == 2048);
        const auto back = std::get<double>(to_engineering(def, counts));
        assert(std::fabs(back - 50.0) < 0.1);

        assert(std::get<std::int64_t>(to_hardware(def, 0.0)) == 0);
        assert(std::get<std::int64_t>(to_hardware(def, 100.0)) == 4095);
        assert(std::get<double>(to_engineering(def, std::int64_t{4095})) == 100.0);
        assert(std::get<double>(to_engineering(def, std::int64_t{0})) == 0.0);
    }
    // Out-of-range engineering values clamp to the converter span.
    const auto def = scaled_tag(Scaling::Dac12Bit, 10.0);
    assert(std::get<std::int64_t>(to_hardware(def, 12.0)) == 4095);
    assert(std::get<std::int64_t>(to_hardware(def, -1.0)) == 0);
    assert(std::get<std::int64_t>(to_hardware(def, std::int64_t{5})) == 2048);
}

void test_speed_table() {
    const auto def = speed_tag();
    assert(std::get<std::int64_t>(to_hardware(def, std::string("med"))) == 25);
    assert(std::get<std::string>(to_engineering(def, std::int64_t{30})) == "low");
    // Values without a label pass through.
    assert(std::get<std::int64_t>(to_engineering(def, std::int64_t{27})) == 27);
    // Numeric writes bypass the table.
    assert(std::get<std::int64_t>(to_hardware(def, std::int64_t{22})) == 22);

    bool threw = false;
    try {
        to_hardware(def, std::string("turbo"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void test_coercion() {
    assert(std::get<double>(coerce(TagType::Float, std::int64_t{3})) == 3.0);
    assert(std::get<std::int64_t>(coerce(TagType::Integer, 2.6)) == 3);
    assert(std::get<bool>(coerce(TagType::Bool, std::int64_t{1})));
    assert(!std::get<bool>(coerce(TagType::Bool, std::string("false"))));
    assert(std::get<std::string>(coerce(TagType::String, true)) == "true");
    assert(std::get<double>(coerce(TagType::Float, std::string("1.25"))) == 1.25);

    bool threw = false;
    try {
        coerce(TagType::Integer, std::string("12abc"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        coerce(TagType::Float, std::string("1e999"));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void test_plain_tags_follow_declared_type() {
    TagDefinition def;
    def.path = "valve_control.vent";
    def.type = TagType::Bool;
    assert(std::get<bool>(to_engineering(def, std::int64_t{1})));
    assert(!std::get<bool>(to_hardware(def, false)));

    def.type = TagType::Float;
    assert(std::get<double>(to_engineering(def, std::int64_t{7})) == 7.0);
}

void test_json_and_equality() {
    assert(std::get<bool>(value_from_json(nlohmann::json(true))));
    assert(std::get<std::int64_t>(value_from_json(nlohmann::json(42))) == 42);
    assert(std::get<double>(value_from_json(nlohmann::json(4.5))) == 4.5);
    assert(std::get<std::string>(value_from_json(nlohmann::json("x"))) == "x");
    assert(value_to_json(Value{std::int64_t{5}}) == nlohmann::json(5));

    assert(values_equal(Value{std::int64_t{1}}, Value{1.0}));
    assert(!values_equal(Value{std::string("1")}, Value{std::int64_t{1}}));
    assert(values_equal(Value{std::string("a")}, Value{std::string("a")}));
}
} // namespace

int main() {
    test_twelve_bit_scaling();
    test_speed_table();
    test_coercion();
    test_plain_tags_follow_declared_type();
    test_json_and_equality();
    std::cout << "value_codec_tests passed" << std::endl;
    return 0;
}
