// SPDX-License-Identifier: Apache-2.0
#include "equipment_service.hpp"

#include "errors.hpp"

#include <chrono>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <everest/logging.hpp>

namespace coldspray {

namespace {
constexpr const char* kMainFlowSetpoint = "gas_control.main_flow.setpoint";
constexpr const char* kMainFlowMeasured = "gas_control.main_flow.measured";
constexpr const char* kFeederFlowSetpoint = "gas_control.feeder_flow.setpoint";
constexpr const char* kFeederFlowMeasured = "gas_control.feeder_flow.measured";
constexpr const char* kMainGasValve = "valve_control.main_gas";
constexpr const char* kFeederGasValve = "valve_control.feeder_gas";
constexpr const char* kVentValve = "valve_control.vent";
constexpr const char* kGateOpen = "valve_control.gate_valve.open";
constexpr const char* kGatePartial = "valve_control.gate_valve.partial";
constexpr const char* kShutter = "relay_control.shutter";
constexpr const char* kNozzleSelect = "gas_control.hardware_sets.nozzle_select";
constexpr const char* kChamberPressure = "pressure.chamber_pressure";

void check_id(int id, const std::string& what) {
    if (id != 1 && id != 2) {
        throw ValidationError(what, "id " + std::to_string(id) + " must be 1 or 2");
    }
}

void check_finite(double value, const std::string& tag) {
    if (!std::isfinite(value)) {
        throw ValidationError(tag, "value is not finite");
    }
}

std::string hardware_set_tag(int id, const std::string& leaf) {
    return "gas_control.hardware_sets.set" + std::to_string(id) + "." + leaf;
}

std::string pump_tag(const std::string& pump, const char* action) {
    if (pump != "mechanical" && pump != "booster") {
        throw ValidationError("valve_control.pump", "unknown pump '" + pump + "'");
    }
    return "valve_control." + pump + "_pump." + action;
}
} // namespace

EquipmentService::EquipmentService(std::shared_ptr<TagCache> cache, const EquipmentConfig& cfg)
    : cache_(std::move(cache)), cfg_(cfg) {
    if (!cache_) {
        throw std::invalid_argument("EquipmentService requires a tag cache");
    }
    subscription_ = cache_->add_state_callback(
        [this](const std::string& path, const TagValue& value) { on_tag_update(path, value); });
    for (const auto& [path, value] : cache_->get_all_tags()) {
        on_tag_update(path, value);
    }
}

EquipmentService::~EquipmentService() {
    cache_->remove_state_callback(subscription_);
}

std::string EquipmentService::feeder_frequency_tag(int feeder_id) {
    return hardware_set_tag(feeder_id, "feeder.frequency");
}

void EquipmentService::on_tag_update(const std::string& path, const TagValue& value) {
    const auto number = as_number(value.value);
    const bool flag = number && *number != 0.0;
    std::lock_guard<std::mutex> lock(state_mtx_);
    auto& s = state_;
    if (path == kMainFlowSetpoint && number) {
        s.gas.main_setpoint = *number;
    } else if (path == kMainFlowMeasured && number) {
        s.gas.main_measured = *number;
    } else if (path == kFeederFlowSetpoint && number) {
        s.gas.feeder_setpoint = *number;
    } else if (path == kFeederFlowMeasured && number) {
        s.gas.feeder_measured = *number;
    } else if (path == kMainGasValve) {
        s.gas.main_valve = flag;
    } else if (path == kFeederGasValve) {
        s.gas.feeder_valve = flag;
    } else if (path == kVentValve) {
        s.vacuum.vent_open = flag;
    } else if (path == kGateOpen) {
        s.vacuum.gate_open = flag;
    } else if (path == kGatePartial) {
        s.vacuum.gate_partial = flag;
    } else if (path == kChamberPressure && number) {
        s.vacuum.chamber_pressure = *number;
    } else if (path == kShutter) {
        s.shutter = flag;
    } else if (path == kNozzleSelect) {
        s.active_nozzle = flag ? 2 : 1;
    } else if (path == feeder_frequency_tag(1) && number) {
        s.feeders[0].frequency = static_cast<std::int64_t>(*number);
    } else if (path == feeder_frequency_tag(2) && number) {
        s.feeders[1].frequency = static_cast<std::int64_t>(*number);
    }
}

void EquipmentService::set_main_flow(double slpm) {
    check_finite(slpm, kMainFlowSetpoint);
    cache_->set_tag(kMainFlowSetpoint, slpm);
}

void EquipmentService::set_feeder_flow(double slpm) {
    check_finite(slpm, kFeederFlowSetpoint);
    cache_->set_tag(kFeederFlowSetpoint, slpm);
}

void EquipmentService::set_gas_valve(const std::string& valve, bool open) {
    if (valve == "main") {
        cache_->set_tag(kMainGasValve, open);
    } else if (valve == "feeder") {
        cache_->set_tag(kFeederGasValve, open);
    } else {
        throw ValidationError("valve_control", "unknown gas valve '" + valve + "'");
    }
}

void EquipmentService::set_vent_valve(bool open) {
    cache_->set_tag(kVentValve, open);
}

void EquipmentService::set_gate_valve(const std::string& position) {
    if (position == "open") {
        cache_->set_tag(kGatePartial, false);
        cache_->set_tag(kGateOpen, true);
    } else if (position == "partial") {
        cache_->set_tag(kGateOpen, false);
        cache_->set_tag(kGatePartial, true);
    } else if (position == "closed") {
        cache_->set_tag(kGateOpen, false);
        cache_->set_tag(kGatePartial, false);
    } else {
        throw ValidationError("valve_control.gate_valve", "unknown position '" + position + "'");
    }
}

void EquipmentService::set_shutter(bool engaged) {
    cache_->set_tag(kShutter, engaged);
}

void EquipmentService::pulse(const std::string& path) {
    cache_->set_tag(path, true);
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.pulse_ms));
    cache_->set_tag(path, false);
}

void EquipmentService::start_vacuum_pump(const std::string& pump) {
    pulse(pump_tag(pump, "start"));
    EVLOG_info << "Vacuum pump " << pump << " start pulsed";
}

void EquipmentService::stop_vacuum_pump(const std::string& pump) {
    pulse(pump_tag(pump, "stop"));
    EVLOG_info << "Vacuum pump " << pump << " stop pulsed";
}

void EquipmentService::set_feeder_frequency(int feeder_id, std::int64_t hz) {
    check_id(feeder_id, "feeder");
    cache_->set_tag(feeder_frequency_tag(feeder_id), hz);
}

void EquipmentService::start_feeder(int feeder_id, std::int64_t hz) {
    check_id(feeder_id, "feeder");
    const auto tag = feeder_frequency_tag(feeder_id);
    cache_->set_tag(tag, hz);
    cache_->run_feeder(tag, true);
    std::lock_guard<std::mutex> lock(state_mtx_);
    state_.feeders[feeder_id - 1].running = true;
}

void EquipmentService::stop_feeder(int feeder_id) {
    check_id(feeder_id, "feeder");
    cache_->run_feeder(feeder_frequency_tag(feeder_id), false);
    std::lock_guard<std::mutex> lock(state_mtx_);
    state_.feeders[feeder_id - 1].running = false;
}

void EquipmentService::set_deagglomerator(int id, std::int64_t duty_cycle) {
    check_id(id, "deagglomerator");
    cache_->set_tag(hardware_set_tag(id, "deagglomerator.duty_cycle"), duty_cycle);
}

void EquipmentService::set_deagglomerator_speed(int id, const std::string& speed) {
    check_id(id, "deagglomerator");
    cache_->set_tag(hardware_set_tag(id, "deagglomerator.duty_cycle"), speed);
}

void EquipmentService::set_deagglomerator_frequency(int id, std::int64_t hz) {
    check_id(id, "deagglomerator");
    cache_->set_tag(hardware_set_tag(id, "deagglomerator.frequency"), hz);
}

void EquipmentService::select_nozzle(int nozzle_id) {
    check_id(nozzle_id, "nozzle");
    cache_->set_tag(kNozzleSelect, nozzle_id == 2);
}

EquipmentState EquipmentService::state() const {
    std::lock_guard<std::mutex> lock(state_mtx_);
    return state_;
}

void EquipmentService::check_flow(HealthReport& report, const char* name, const std::string& setpoint_tag,
                                  const std::string& measured_tag) const {
    try {
        const auto setpoint = cache_->get_tag_with_metadata(setpoint_tag);
        const auto measured = cache_->get_tag_with_metadata(measured_tag);
        const auto age = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now() -
                                                                              measured.timestamp);
        if (age.count() > cfg_.stale_after_ms) {
            report.issues.push_back(std::string(name) + " flow reading is " + std::to_string(age.count()) +
                                    " ms old");
        }
        const double deviation = std::fabs(as_number(measured.value).value_or(0.0) -
                                           as_number(setpoint.value).value_or(0.0));
        if (deviation > cfg_.flow_tolerance_slpm) {
            std::ostringstream msg;
            msg << name << " flow off setpoint by " << deviation << " SLPM";
            report.issues.push_back(msg.str());
        }
    } catch (const TagNotCachedError& e) {
        report.issues.push_back(std::string(name) + " flow has no data: " + e.what());
    } catch (const UnknownTagError& e) {
        report.issues.push_back(std::string(name) + " flow is not configured: " + e.what());
    }
}

HealthReport EquipmentService::health() const {
    HealthReport report;
    const auto hw = cache_->hardware_status();
    if (!hw.plc_connected) {
        report.issues.emplace_back("PLC disconnected");
    }
    if (!hw.feeder_connected) {
        report.issues.emplace_back("feeder controller disconnected");
    }
    check_flow(report, "main", kMainFlowSetpoint, kMainFlowMeasured);
    check_flow(report, "feeder", kFeederFlowSetpoint, kFeederFlowMeasured);
    report.healthy = report.issues.empty();
    return report;
}

} // namespace coldspray
