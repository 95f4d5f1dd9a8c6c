// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "app_config.hpp"
#include "tag_cache.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace coldspray {

struct GasState {
    double main_setpoint{0.0}; // SLPM
    double main_measured{0.0};
    double feeder_setpoint{0.0};
    double feeder_measured{0.0};
    bool main_valve{false};
    bool feeder_valve{false};
};

struct VacuumState {
    double chamber_pressure{0.0}; // torr
    bool gate_open{false};
    bool gate_partial{false};
    bool vent_open{false};
};

struct FeederState {
    std::optional<std::int64_t> frequency; // Hz
    bool running{false};
};

struct EquipmentState {
    GasState gas;
    VacuumState vacuum;
    bool shutter{false};
    int active_nozzle{1};
    std::array<FeederState, 2> feeders{};
};

struct HealthReport {
    bool healthy{true};
    std::vector<std::string> issues;
};

// Gas, vacuum, feeder and nozzle operations expressed as tag writes.
class EquipmentService {
public:
    EquipmentService(std::shared_ptr<TagCache> cache, const EquipmentConfig& cfg);
    ~EquipmentService();

    EquipmentService(const EquipmentService&) = delete;
    EquipmentService& operator=(const EquipmentService&) = delete;

    void set_main_flow(double slpm);
    void set_feeder_flow(double slpm);
    void set_gas_valve(const std::string& valve, bool open); // "main" or "feeder"
    void set_vent_valve(bool open);
    void set_gate_valve(const std::string& position); // "open", "partial" or "closed"
    void set_shutter(bool engaged);
    void start_vacuum_pump(const std::string& pump); // "mechanical" or "booster"
    void stop_vacuum_pump(const std::string& pump);

    void set_feeder_frequency(int feeder_id, std::int64_t hz);
    void start_feeder(int feeder_id, std::int64_t hz);
    void stop_feeder(int feeder_id);
    void set_deagglomerator(int id, std::int64_t duty_cycle);
    void set_deagglomerator_speed(int id, const std::string& speed); // "high", "med", "low", "off"
    void set_deagglomerator_frequency(int id, std::int64_t hz);
    void select_nozzle(int nozzle_id);

    EquipmentState state() const;
    // Flow tracking, connectivity and data freshness. Reads cached values only.
    HealthReport health() const;

    static std::string feeder_frequency_tag(int feeder_id);

private:
    void on_tag_update(const std::string& path, const TagValue& value);
    void pulse(const std::string& path);
    void check_flow(HealthReport& report, const char* name, const std::string& setpoint_tag,
                    const std::string& measured_tag) const;

    std::shared_ptr<TagCache> cache_;
    EquipmentConfig cfg_;
    TagCache::CallbackId subscription_{0};

    mutable std::mutex state_mtx_;
    EquipmentState state_;
};

} // namespace coldspray
