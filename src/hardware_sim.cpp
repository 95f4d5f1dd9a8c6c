// SPDX-License-Identifier: Apache-2.0
#include "hardware_sim.hpp"

#include "errors.hpp"
#include "value_codec.hpp"

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <thread>

#include <everest/logging.hpp>

namespace coldspray {

namespace {
bool take_one(std::atomic<int>& counter) {
    int current = counter.load();
    while (current > 0) {
        if (counter.compare_exchange_weak(current, current - 1)) {
            return true;
        }
    }
    return false;
}
} // namespace

RegisterTable default_plc_values() {
    using I = std::int64_t;
    return {
        // Gas control, 12-bit counts
        {"AOS32-0.1.2.1", I{2048}}, // main flow setpoint, 50 SLPM
        {"MainFlowRate", I{2039}},
        {"AOS32-0.1.2.2", I{2048}}, // feeder flow setpoint, 5 SLPM
        {"FeederFlowRate", I{2007}},
        {"MainSwitch", false},
        {"FeederSwitch", false},
        {"NozzleSelect", false},
        // Vacuum
        {"MechPumpStart", false},
        {"MechPumpStop", false},
        {"BoosterPumpStart", false},
        {"BoosterPumpStop", false},
        {"Open", true},
        {"Partial", false},
        {"VentSwitch", false},
        // Pressure, 12-bit counts
        {"ChamberPressure", I{21}},
        {"MainGasPressure", I{269}},
        {"FeederPressure", I{1347}},
        {"NozzlePressure", I{1350}},
        {"RegulatorPressure", I{216}},
        {"Shutter", false},
        // Motion
        {"AMC.ModuleStatus", true},
        {"AMC.Ax1Position", 50.0},
        {"AMC.Ax2Position", 50.0},
        {"AMC.Ax3Position", 10.0},
        {"AMC.Ax1AxisStatus", I{4}},
        {"AMC.Ax2AxisStatus", I{4}},
        {"AMC.Ax3AxisStatus", I{4}},
        {"XAxis.Target", 0.0},
        {"YAxis.Target", 0.0},
        {"ZAxis.Target", 0.0},
        {"XAxis.Velocity", 10.0},
        {"YAxis.Velocity", 10.0},
        {"ZAxis.Velocity", 5.0},
        {"XAxis.Accel", 100.0},
        {"YAxis.Accel", 100.0},
        {"ZAxis.Accel", 50.0},
        {"XAxis.Decel", 100.0},
        {"YAxis.Decel", 100.0},
        {"ZAxis.Decel", 50.0},
        {"XAxis.InProgress", false},
        {"YAxis.InProgress", false},
        {"ZAxis.InProgress", false},
        {"XAxis.Complete", true},
        {"YAxis.Complete", true},
        {"ZAxis.Complete", true},
        {"XYMove.XPosition", 0.0},
        {"XYMove.YPosition", 0.0},
        {"XYMove.LINVelocity", 10.0},
        {"XYMove.LINRamps", 0.5},
        {"XYMove.InProgress", false},
        {"XYMove.Complete", true},
        // Hardware sets
        {"AOS32-0.1.6.1", I{35}},
        {"AOS32-0.1.6.2", I{500}},
        {"AOS32-0.1.6.3", I{35}},
        {"AOS32-0.1.6.4", I{500}},
        // Triggers
        {"MoveX", false},
        {"MoveY", false},
        {"MoveZ", false},
        {"MoveXY", false},
        {"SetHome", false},
    };
}

RegisterTable default_feeder_values() {
    using I = std::int64_t;
    return {
        {"P6", I{600}}, {"P10", I{4}}, {"P12", I{999}}, {"P106", I{600}}, {"P110", I{4}}, {"P112", I{999}},
    };
}

void load_mock_data(const fs::path& path, RegisterTable& plc, RegisterTable& feeder) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open mock data file: " + path.string());
    }
    const auto json = nlohmann::json::parse(file);
    auto overlay = [](const nlohmann::json& section, RegisterTable& table) {
        if (!section.is_object()) {
            return;
        }
        for (const auto& [address, value] : section.items()) {
            table[address] = value_from_json(value);
        }
    };
    overlay(json.value("plc_tags", nlohmann::json::object()), plc);
    overlay(json.value("feeder_tags", nlohmann::json::object()), feeder);
    EVLOG_info << "Loaded mock data from " << path.string();
}

template <typename Interface>
SimulatedClient<Interface>::SimulatedClient(std::string device, const MockConfig& cfg, RegisterTable values,
                                            bool accept_unknown)
    : device_(std::move(device)),
      cfg_(cfg),
      values_(std::move(values)),
      accept_unknown_(accept_unknown),
      rng_(cfg.seed != 0 ? cfg.seed : std::random_device{}()) {}

template <typename Interface>
bool SimulatedClient<Interface>::roll(double rate) {
    if (rate <= 0.0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(rng_mtx_);
    return std::uniform_real_distribution<double>(0.0, 1.0)(rng_) < rate;
}

template <typename Interface>
void SimulatedClient<Interface>::simulate_latency() {
    int delay_ms = cfg_.delay_ms;
    if (cfg_.jitter_ms > 0) {
        std::lock_guard<std::mutex> lock(rng_mtx_);
        delay_ms += std::uniform_int_distribution<int>(0, cfg_.jitter_ms)(rng_);
    }
    if (delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
    }
}

template <typename Interface>
void SimulatedClient<Interface>::check_read(const std::string& address) {
    if (!connected_) {
        throw HardwareError(device_, "read", address, "not connected");
    }
    if (take_one(forced_read_failures_)) {
        throw HardwareError(device_, "read", address, "injected failure");
    }
    if (roll(cfg_.read_failure_rate)) {
        throw HardwareError(device_, "read", address, "simulated failure");
    }
}

template <typename Interface>
void SimulatedClient<Interface>::check_write(const std::string& address) {
    if (!connected_) {
        throw HardwareError(device_, "write", address, "not connected");
    }
    if (take_one(forced_write_failures_)) {
        throw HardwareError(device_, "write", address, "injected failure");
    }
    if (roll(cfg_.write_failure_rate)) {
        throw HardwareError(device_, "write", address, "simulated failure");
    }
}

template <typename Interface>
void SimulatedClient<Interface>::connect() {
    simulate_latency();
    if (roll(cfg_.connect_failure_rate)) {
        throw ConnectionError(device_, "simulated connection failure");
    }
    connected_ = true;
    EVLOG_info << "Simulated " << device_ << " connected";
}

template <typename Interface>
void SimulatedClient<Interface>::disconnect() {
    connected_ = false;
}

template <typename Interface>
bool SimulatedClient<Interface>::is_connected() const {
    return connected_;
}

template <typename Interface>
Value SimulatedClient<Interface>::read_tag(const std::string& address) {
    simulate_latency();
    check_read(address);
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = values_.find(address);
    if (it == values_.end()) {
        if (accept_unknown_) {
            return std::int64_t{0};
        }
        throw HardwareError(device_, "read", address, "unknown address");
    }
    return it->second;
}

template <typename Interface>
void SimulatedClient<Interface>::write_tag(const std::string& address, const Value& value) {
    simulate_latency();
    check_write(address);
    std::lock_guard<std::mutex> lock(mtx_);
    if (!accept_unknown_ && values_.count(address) == 0) {
        throw HardwareError(device_, "write", address, "unknown address");
    }
    values_[address] = value;
    ++write_count_;
    on_write(address, value);
}

template <typename Interface>
std::optional<Value> SimulatedClient<Interface>::raw_value(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = values_.find(address);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

template <typename Interface>
void SimulatedClient<Interface>::set_raw_value(const std::string& address, const Value& value) {
    std::lock_guard<std::mutex> lock(mtx_);
    values_[address] = value;
}

template class SimulatedClient<PlcClient>;
template class SimulatedClient<HardwareClient>;

SimulatedPlcClient::SimulatedPlcClient(const MockConfig& cfg) : SimulatedPlcClient(cfg, default_plc_values()) {}

SimulatedPlcClient::SimulatedPlcClient(const MockConfig& cfg, RegisterTable values)
    : SimulatedClient<PlcClient>("plc", cfg, std::move(values), false) {}

std::map<std::string, Value> SimulatedPlcClient::read_all() {
    simulate_latency();
    check_read("");
    std::lock_guard<std::mutex> lock(mtx_);
    return values_;
}

void SimulatedPlcClient::on_write(const std::string& address, const Value& value) {
    const auto number = as_number(value);
    if (!number || *number == 0.0) {
        return;
    }
    auto number_at = [this](const std::string& key) { return as_number(values_[key]).value_or(0.0); };

    static const std::map<std::string, std::pair<std::string, std::string>> axis_moves{
        {"MoveX", {"XAxis", "AMC.Ax1Position"}},
        {"MoveY", {"YAxis", "AMC.Ax2Position"}},
        {"MoveZ", {"ZAxis", "AMC.Ax3Position"}},
    };
    if (const auto it = axis_moves.find(address); it != axis_moves.end()) {
        const auto& [axis, position] = it->second;
        values_[position] = number_at(position) + number_at(axis + ".Target");
        values_[axis + ".InProgress"] = false;
        values_[axis + ".Complete"] = true;
        values_[address] = false;
    } else if (address == "MoveXY") {
        values_["AMC.Ax1Position"] = number_at("XYMove.XPosition");
        values_["AMC.Ax2Position"] = number_at("XYMove.YPosition");
        values_["XYMove.InProgress"] = false;
        values_["XYMove.Complete"] = true;
        values_[address] = false;
    } else if (address == "SetHome") {
        values_["AMC.Ax1Position"] = 0.0;
        values_["AMC.Ax2Position"] = 0.0;
        values_["AMC.Ax3Position"] = 0.0;
        values_[address] = false;
    }
}

SimulatedFeederClient::SimulatedFeederClient(const MockConfig& cfg)
    : SimulatedFeederClient(cfg, default_feeder_values()) {}

SimulatedFeederClient::SimulatedFeederClient(const MockConfig& cfg, RegisterTable values)
    : SimulatedClient<HardwareClient>("feeder", cfg, std::move(values), true) {}

} // namespace coldspray
