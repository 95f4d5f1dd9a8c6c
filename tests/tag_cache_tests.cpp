// SPDX-License-Identifier: Apache-2.0
#include "errors.hpp"
#include "hardware_sim.hpp"
#include "tag_cache.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace coldspray;
using namespace std::chrono_literals;

namespace {
const std::string kSetpoint = "gas_control.main_flow.setpoint";
const std::string kMeasured = "gas_control.main_flow.measured";
const std::string kVent = "valve_control.vent";
const std::string kFeeder = "gas_control.hardware_sets.set1.feeder.frequency";
const std::string kState = "system_state.state";

nlohmann::json tag_config() {
    return nlohmann::json::parse(R"({
        "gas_control": {
            "main_flow": {
                "setpoint": {"type": "float", "access": "read/write", "scaling": "12bit_dac",
                             "range": [0, 100], "mapped": true, "plc_tag": "AOS32-0.1.2.1"},
                "measured": {"type": "float", "access": "read", "scaling": "12bit_linear",
                             "range": [0, 100], "mapped": true, "plc_tag": "MainFlowRate"}
            },
            "chamber_pressure": {"type": "float", "access": "read", "mapped": true, "plc_tag": "ChamberPressure"},
            "hardware_sets": {
                "set1": {
                    "feeder": {
                        "frequency": {"type": "integer", "access": "read/write", "range": [200, 1200],
                                      "speeds": {"low": 200, "high": 1200}, "mapped": true,
                                      "ssh": {"freq_var": "P6", "time_var": "P12", "start_var": "P10"}}
                    }
                }
            }
        },
        "valve_control": {
            "vent": {"type": "bool", "access": "read/write", "mapped": true, "plc_tag": "VentSwitch"}
        },
        "interlocks": {
            "motion_ready": {"type": "bool", "access": "read", "mapped": true, "plc_tag": "MotionReady"}
        },
        "system_state": {
            "state": {"type": "string", "access": "read/write", "internal": true,
                      "options": ["READY", "RUNNING"], "default": "READY"}
        }
    })");
}

MockConfig instant() {
    MockConfig cfg;
    cfg.delay_ms = 0;
    cfg.seed = 11;
    return cfg;
}

struct Rig {
    std::shared_ptr<SimulatedPlcClient> plc = std::make_shared<SimulatedPlcClient>(instant());
    std::shared_ptr<SimulatedFeederClient> feeder = std::make_shared<SimulatedFeederClient>(instant());
    std::shared_ptr<TagMapping> mapping = std::make_shared<TagMapping>();
    std::unique_ptr<TagCache> cache;

    explicit Rig(int poll_interval_ms = 20) {
        TagCacheConfig cfg;
        cfg.poll_interval_ms = poll_interval_ms;
        cache = std::make_unique<TagCache>(cfg, mapping, plc, feeder);
        cache->initialize(tag_config());
    }
};

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

template <typename E, typename F> bool throws(F&& fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

void test_unscaled_setpoint() {
    auto plc = std::make_shared<SimulatedPlcClient>(instant(), RegisterTable{{"AOS32-0.1.2.1", 0.0}});
    TagCache cache(TagCacheConfig{}, std::make_shared<TagMapping>(), plc, nullptr);
    cache.initialize(nlohmann::json::parse(R"({
        "gas_control": {"tags": {"main_flow": {
            "setpoint": {"type": "float", "range": [0, 100], "access": "read-write",
                         "mapped": true, "plc_tag": "AOS32-0.1.2.1"}}}}
    })"));
    cache.poll_once();
    assert(std::get<double>(cache.get_tag(kSetpoint)) == 0.0);

    std::this_thread::sleep_for(2ms);
    cache.set_tag(kSetpoint, 42.5);
    assert(std::get<double>(cache.get_tag(kSetpoint)) == 42.5);
    assert(std::get<double>(*plc->raw_value("AOS32-0.1.2.1")) == 42.5);
    assert(cache.get_tag_with_metadata(kSetpoint).timestamp > cache.initialized_at());
}

void test_write_setpoint_end_to_end() {
    Rig rig;
    std::this_thread::sleep_for(2ms);
    rig.cache->set_tag(kSetpoint, 42.5);
    assert(std::get<std::int64_t>(*rig.plc->raw_value("AOS32-0.1.2.1")) == 1740);

    const auto tv = rig.cache->get_tag_with_metadata(kSetpoint);
    assert(std::get<double>(tv.value) == 42.5);
    assert(tv.timestamp > rig.cache->initialized_at());
    assert(tv.definition->unit.empty());

    // Integers written to float tags are cached as doubles
    rig.cache->set_tag(kSetpoint, std::int64_t{10});
    assert(std::get<double>(rig.cache->get_tag(kSetpoint)) == 10.0);

    // The next poll converts the register back within one count
    rig.cache->poll_once();
    assert(std::fabs(std::get<double>(rig.cache->get_tag(kSetpoint)) - 10.0) < 100.0 / 4095.0);
}

void test_feeder_speed_end_to_end() {
    Rig rig;
    rig.cache->set_tag(kFeeder, std::string("high"));
    assert(std::get<std::int64_t>(*rig.feeder->raw_value("P6")) == 1200);
    assert(std::get<std::string>(rig.cache->get_tag(kFeeder)) == "high");

    // Hardware reads come back as the label; unlabelled values pass through
    assert(std::get<std::string>(rig.cache->refresh_tag(kFeeder)) == "high");
    rig.feeder->set_raw_value("P6", std::int64_t{600});
    assert(std::get<std::int64_t>(rig.cache->refresh_tag(kFeeder)) == 600);

    rig.cache->set_tag(kFeeder, std::int64_t{400});
    assert(std::get<std::int64_t>(*rig.feeder->raw_value("P6")) == 400);
    assert(throws<ValidationError>([&] { rig.cache->set_tag(kFeeder, std::string("turbo")); }));
    assert(throws<ValidationError>([&] { rig.cache->set_tag(kFeeder, std::int64_t{1500}); }));
}

void test_run_feeder() {
    Rig rig;
    rig.cache->run_feeder(kFeeder, true);
    assert(std::get<std::int64_t>(*rig.feeder->raw_value("P12")) == 999);
    assert(std::get<std::int64_t>(*rig.feeder->raw_value("P10")) == 1);
    rig.cache->run_feeder(kFeeder, false);
    assert(std::get<std::int64_t>(*rig.feeder->raw_value("P10")) == 4);
    assert(throws<ValidationError>([&] { rig.cache->run_feeder(kVent, true); }));
}

void test_failed_write_leaves_cache() {
    Rig rig;
    rig.cache->poll_once();
    assert(!std::get<bool>(rig.cache->get_tag(kVent)));
    const auto before = rig.cache->get_tag_with_metadata(kVent).timestamp;

    rig.plc->inject_write_failures(1);
    assert(throws<HardwareError>([&] { rig.cache->set_tag(kVent, true); }));
    assert(!std::get<bool>(rig.cache->get_tag(kVent)));
    assert(rig.cache->get_tag_with_metadata(kVent).timestamp == before);
    assert(!std::get<bool>(*rig.plc->raw_value("VentSwitch")));

    // Validation failures never reach the client
    const auto writes = rig.plc->write_count();
    assert(throws<ValidationError>([&] { rig.cache->set_tag(kSetpoint, 150.0); }));
    assert(throws<ValidationError>([&] { rig.cache->set_tag(kMeasured, 10.0); }));
    assert(throws<ValidationError>([&] { rig.cache->set_tag(kVent, std::string("yes")); }));
    assert(rig.plc->write_count() == writes);

    rig.cache->set_tag(kVent, true);
    assert(std::get<bool>(rig.cache->get_tag(kVent)));
}

void test_lookup_errors() {
    Rig rig;
    assert(throws<UnknownTagError>([&] { rig.cache->get_tag("no.such.tag"); }));
    assert(throws<UnknownTagError>([&] { rig.cache->set_tag("no.such.tag", true); }));
    rig.cache->poll_once();
    // Mapped, but the PLC never reports MotionReady
    assert(throws<TagNotCachedError>([&] { rig.cache->get_tag("interlocks.motion_ready"); }));
}

void test_poll_skips_unmapped_and_bad_values() {
    Rig rig;
    rig.plc->set_raw_value("ChamberPressure", std::string("--"));
    rig.cache->poll_once();

    const auto all = rig.cache->get_all_tags();
    // Registers without a logical tag (e.g. "Open") are not surfaced
    for (const auto& entry : all) {
        assert(entry.first.find("Open") == std::string::npos);
    }
    assert(all.count(kMeasured) == 1);
    assert(all.count("gas_control.chamber_pressure") == 0);
    assert(std::fabs(std::get<double>(all.at(kMeasured).value) - 2039.0 * 100.0 / 4095.0) < 1e-9);

    const auto stats = rig.cache->stats();
    assert(stats.successful_polls == 1);
    assert(stats.conversion_failures == 1);
    assert(stats.last_poll.has_value());
}

void test_poll_loop_survives_failures() {
    Rig rig(10);
    rig.plc->inject_read_failures(3);
    rig.cache->start();
    rig.cache->start(); // second start is a no-op
    assert(rig.cache->is_running());

    assert(wait_until([&] { return rig.cache->stats().successful_polls >= 1; }));
    assert(rig.cache->stats().failed_polls == 3);

    rig.plc->set_raw_value("MainFlowRate", std::int64_t{4095});
    assert(wait_until([&] {
        const auto v = rig.cache->get_tag_with_metadata(kMeasured).value;
        return std::get<double>(v) == 100.0;
    }));

    rig.cache->stop();
    assert(!rig.cache->is_running());
    const auto polls = rig.cache->stats().successful_polls;
    std::this_thread::sleep_for(50ms);
    assert(rig.cache->stats().successful_polls == polls);
}

void test_callbacks() {
    Rig rig;
    std::atomic<int> seen{0};
    std::string last_path;
    const auto bad = rig.cache->add_state_callback(
        [](const std::string&, const TagValue&) { throw std::runtime_error("subscriber bug"); });
    const auto good = rig.cache->add_state_callback([&](const std::string& path, const TagValue&) {
        ++seen;
        last_path = path;
    });

    rig.cache->set_tag(kVent, true);
    assert(seen == 1);
    assert(last_path == kVent);

    // Polls notify only on change
    rig.cache->poll_once();
    const int after_first_poll = seen;
    rig.cache->poll_once();
    assert(seen == after_first_poll);
    rig.plc->set_raw_value("MainFlowRate", std::int64_t{100});
    rig.cache->poll_once();
    assert(seen == after_first_poll + 1);
    assert(last_path == kMeasured);

    assert(rig.cache->remove_state_callback(good));
    assert(!rig.cache->remove_state_callback(good));
    rig.cache->set_tag(kVent, false);
    assert(seen == after_first_poll + 1);
    assert(rig.cache->remove_state_callback(bad));
}

void test_callback_may_write_tags() {
    Rig rig;
    std::atomic<int> resets{0};
    rig.cache->add_state_callback([&](const std::string& path, const TagValue& value) {
        if (path == kVent && std::get<bool>(value.value)) {
            ++resets;
            rig.cache->set_tag(kVent, false);
        }
    });

    std::atomic<bool> done{false};
    std::thread writer([&]() {
        rig.cache->set_tag(kVent, true);
        done = true;
    });
    assert(wait_until([&] { return done.load(); }));
    writer.join();

    assert(resets == 1);
    assert(!std::get<bool>(rig.cache->get_tag(kVent)));
    assert(!std::get<bool>(*rig.plc->raw_value("VentSwitch")));
}

void test_non_standard_callback_exception() {
    Rig rig;
    std::atomic<int> delivered{0};
    rig.cache->add_state_callback([](const std::string&, const TagValue&) { throw 42; });
    rig.cache->add_state_callback([&](const std::string&, const TagValue&) { ++delivered; });

    rig.cache->set_tag(kVent, true);
    assert(delivered == 1);
    assert(std::get<bool>(rig.cache->get_tag(kVent)));

    rig.plc->set_raw_value("MainFlowRate", std::int64_t{100});
    rig.cache->poll_once();
    assert(delivered >= 2);
}

void test_remove_waits_for_running_callback() {
    Rig rig;
    std::atomic<bool> entered{false};
    std::atomic<bool> finished{false};
    const auto id = rig.cache->add_state_callback([&](const std::string&, const TagValue&) {
        entered = true;
        std::this_thread::sleep_for(100ms);
        finished = true;
    });

    std::thread writer([&]() { rig.cache->set_tag(kVent, true); });
    assert(wait_until([&] { return entered.load(); }));
    assert(rig.cache->remove_state_callback(id));
    assert(finished);
    writer.join();

    // A callback can unsubscribe itself from inside a delivery
    std::atomic<TagCache::CallbackId> self_id{0};
    std::atomic<int> calls{0};
    self_id = rig.cache->add_state_callback([&](const std::string&, const TagValue&) {
        ++calls;
        assert(rig.cache->remove_state_callback(self_id));
    });
    rig.cache->set_tag(kVent, false);
    rig.cache->set_tag(kVent, true);
    assert(calls == 1);
}

// Lets a test act between the PLC read and the cache update of one poll.
class InterleavingPlc : public SimulatedPlcClient {
public:
    explicit InterleavingPlc(const MockConfig& cfg) : SimulatedPlcClient(cfg) {}

    std::map<std::string, Value> read_all() override {
        auto values = SimulatedPlcClient::read_all();
        if (after_read) {
            auto hook = std::move(after_read);
            after_read = nullptr;
            hook();
        }
        return values;
    }

    std::function<void()> after_read;
};

void test_write_during_poll_is_kept() {
    auto plc = std::make_shared<InterleavingPlc>(instant());
    TagCache cache(TagCacheConfig{}, std::make_shared<TagMapping>(), plc, nullptr);
    cache.initialize(tag_config());
    cache.poll_once();
    assert(!std::get<bool>(cache.get_tag(kVent)));

    plc->after_read = [&]() {
        std::this_thread::sleep_for(2ms);
        cache.set_tag(kVent, true);
    };
    cache.poll_once();
    assert(std::get<bool>(cache.get_tag(kVent)));

    // The next poll reads the written register
    cache.poll_once();
    assert(std::get<bool>(cache.get_tag(kVent)));
    assert(std::get<bool>(*plc->raw_value("VentSwitch")));
}

void test_internal_tags() {
    Rig rig;
    assert(std::get<std::string>(rig.cache->get_tag(kState)) == "READY");
    const auto writes = rig.plc->write_count();
    rig.cache->set_tag(kState, std::string("RUNNING"));
    assert(std::get<std::string>(rig.cache->get_tag(kState)) == "RUNNING");
    assert(rig.plc->write_count() == writes);
    assert(std::get<std::string>(rig.cache->refresh_tag(kState)) == "RUNNING");
}

void test_reload() {
    Rig rig;
    rig.cache->poll_once();
    rig.cache->set_tag(kState, std::string("RUNNING"));

    auto cfg = tag_config();
    cfg["valve_control"].erase("vent");
    cfg["gas_control"]["main_flow"]["measured"]["unit"] = "SLPM";
    rig.cache->reload_tag_config(cfg);

    assert(throws<UnknownTagError>([&] { rig.cache->get_tag(kVent); }));
    assert(rig.cache->get_tag_with_metadata(kMeasured).definition->unit == "SLPM");
    // Internal values survive a reload
    assert(std::get<std::string>(rig.cache->get_tag(kState)) == "RUNNING");
    assert(!rig.cache->mapping().find_mapped_name("VentSwitch").has_value());
}

void test_lifecycle() {
    TagCacheConfig cfg;
    cfg.poll_interval_ms = 10;
    auto mapping = std::make_shared<TagMapping>();
    auto plc = std::make_shared<SimulatedPlcClient>(instant());
    {
        TagCache cache(cfg, mapping, plc, nullptr);
        assert(throws<std::runtime_error>([&] { cache.start(); }));
        cache.initialize(tag_config());
        assert(!cache.hardware_status().feeder_connected);
        // No feeder client: feeder tags fail as hardware errors
        assert(throws<HardwareError>([&] { cache.set_tag(kFeeder, std::int64_t{400}); }));

        cache.start();
        assert(wait_until([&] { return cache.stats().successful_polls > 0; }));
        cache.shutdown();
        assert(!cache.is_running());
        assert(!plc->is_connected());
        assert(throws<TagNotCachedError>([&] { cache.get_tag(kState); }));
        assert(throws<std::runtime_error>([&] { cache.start(); }));
    }

    // Feeder connection failures are not fatal; PLC failures are
    auto down = instant();
    down.connect_failure_rate = 1.0;
    {
        auto feeder = std::make_shared<SimulatedFeederClient>(down);
        TagCache cache(cfg, std::make_shared<TagMapping>(), std::make_shared<SimulatedPlcClient>(instant()), feeder);
        cache.initialize(tag_config());
        const auto status = cache.hardware_status();
        assert(status.plc_connected);
        assert(!status.feeder_connected);
    }
    {
        TagCache cache(cfg, std::make_shared<TagMapping>(), std::make_shared<SimulatedPlcClient>(down), nullptr);
        assert(throws<ConnectionError>([&] { cache.initialize(tag_config()); }));
    }

    assert(throws<std::invalid_argument>([&] { TagCache broken(cfg, nullptr, plc, nullptr); }));
}
} // namespace

int main() {
    test_unscaled_setpoint();
    test_write_setpoint_end_to_end();
    test_feeder_speed_end_to_end();
    test_run_feeder();
    test_failed_write_leaves_cache();
    test_lookup_errors();
    test_poll_skips_unmapped_and_bad_values();
    test_poll_loop_survives_failures();
    test_callbacks();
    test_callback_may_write_tags();
    test_non_standard_callback_exception();
    test_remove_waits_for_running_callback();
    test_write_during_poll_is_kept();
    test_internal_tags();
    test_reload();
    test_lifecycle();
    std::cout << "tag_cache_tests passed" << std::endl;
    return 0;
}
