// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "app_config.hpp"
#include "equipment_service.hpp"
#include "tag_cache.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace coldspray {

struct Position {
    double x{0.0};
    double y{0.0};
    double z{0.0};
};

// Relative and coordinated moves on the AMC axes through the PLC move blocks.
class MotionService {
public:
    MotionService(std::shared_ptr<TagCache> cache, const MotionConfig& cfg);

    // axis is "x", "y" or "z"; distance is relative to the current position.
    void move_axis(const std::string& axis, double distance, double velocity, double acceleration,
                   double deceleration);
    void move_xy(double x, double y, double velocity, double ramps);
    void set_home();

    Position position() const;
    std::int64_t axis_status(const std::string& axis) const;
    bool is_moving() const;
    // Waits until a poll newer than this call reports the move ("x", "y", "z" or "xy") complete.
    bool wait_for_completion(const std::string& axis, std::chrono::milliseconds timeout) const;
    HealthReport health() const;

private:
    const AxisLimits& limits_for(const std::string& axis) const;
    void check_target(const std::string& axis, double target) const;
    void check_velocity(const std::string& tag, double velocity) const;

    std::shared_ptr<TagCache> cache_;
    MotionConfig cfg_;
};

} // namespace coldspray
