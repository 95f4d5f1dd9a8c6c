// SPDX-License-Identifier: Apache-2.0
#include "motion_service.hpp"

#include "errors.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <everest/logging.hpp>

namespace coldspray {

namespace {
constexpr const char* kRelativeMove = "motion.motion_control.relative_move.";
constexpr const char* kXyMove = "motion.motion_control.coordinated_move.xy_move.";
constexpr const char* kSetHome = "motion.motion_control.set_home";
constexpr const char* kMotionReady = "interlocks.motion_ready";

std::string move_block(const std::string& axis) {
    if (axis == "xy") {
        return kXyMove;
    }
    return std::string(kRelativeMove) + axis + "_move.";
}

bool read_flag(const TagCache& cache, const std::string& path) {
    const auto number = as_number(cache.get_tag(path));
    return number && *number != 0.0;
}

double read_number(const TagCache& cache, const std::string& path) {
    const auto number = as_number(cache.get_tag(path));
    if (!number) {
        throw std::runtime_error("Tag " + path + " is not numeric");
    }
    return *number;
}
} // namespace

MotionService::MotionService(std::shared_ptr<TagCache> cache, const MotionConfig& cfg)
    : cache_(std::move(cache)), cfg_(cfg) {
    if (!cache_) {
        throw std::invalid_argument("MotionService requires a tag cache");
    }
}

const AxisLimits& MotionService::limits_for(const std::string& axis) const {
    if (axis == "x") {
        return cfg_.x;
    }
    if (axis == "y") {
        return cfg_.y;
    }
    if (axis == "z") {
        return cfg_.z;
    }
    throw ValidationError("motion", "unknown axis '" + axis + "'");
}

void MotionService::check_target(const std::string& axis, double target) const {
    const auto& limits = limits_for(axis);
    if (!std::isfinite(target) || target < limits.min || target > limits.max) {
        std::ostringstream msg;
        msg << "target " << target << " outside [" << limits.min << ", " << limits.max << "]";
        throw ValidationError("motion.position." + axis + "_position", msg.str());
    }
}

void MotionService::check_velocity(const std::string& tag, double velocity) const {
    if (!std::isfinite(velocity) || velocity <= 0.0 || velocity > cfg_.max_velocity) {
        std::ostringstream msg;
        msg << "velocity " << velocity << " must be in (0, " << cfg_.max_velocity << "]";
        throw ValidationError(tag, msg.str());
    }
}

void MotionService::move_axis(const std::string& axis, double distance, double velocity, double acceleration,
                              double deceleration) {
    limits_for(axis);
    const auto block = move_block(axis);
    check_velocity(block + "parameters.velocity", velocity);
    const double current = read_number(*cache_, "motion.position." + axis + "_position");
    check_target(axis, current + distance);

    cache_->set_tag(block + "parameters.target", distance);
    cache_->set_tag(block + "parameters.velocity", velocity);
    cache_->set_tag(block + "parameters.acceleration", acceleration);
    cache_->set_tag(block + "parameters.deceleration", deceleration);
    cache_->set_tag(block + "trigger", true);
    EVLOG_info << "Relative move " << axis << " by " << distance << " mm at " << velocity << " mm/s";
}

void MotionService::move_xy(double x, double y, double velocity, double ramps) {
    check_target("x", x);
    check_target("y", y);
    check_velocity(std::string(kXyMove) + "parameters.velocity", velocity);
    if (!std::isfinite(ramps) || ramps < 0.0) {
        throw ValidationError(std::string(kXyMove) + "parameters.ramps", "ramp time must be >= 0");
    }

    cache_->set_tag(std::string(kXyMove) + "parameters.velocity", velocity);
    cache_->set_tag(std::string(kXyMove) + "parameters.ramps", ramps);
    cache_->set_tag(std::string(kXyMove) + "parameters.x_position", x);
    cache_->set_tag(std::string(kXyMove) + "parameters.y_position", y);
    cache_->set_tag(std::string(kXyMove) + "trigger", true);
    EVLOG_info << "Coordinated move to (" << x << ", " << y << ") at " << velocity << " mm/s";
}

void MotionService::set_home() {
    cache_->set_tag(kSetHome, true);
    EVLOG_info << "Home set at current position";
}

Position MotionService::position() const {
    Position pos;
    pos.x = read_number(*cache_, "motion.position.x_position");
    pos.y = read_number(*cache_, "motion.position.y_position");
    pos.z = read_number(*cache_, "motion.position.z_position");
    return pos;
}

std::int64_t MotionService::axis_status(const std::string& axis) const {
    limits_for(axis);
    return static_cast<std::int64_t>(read_number(*cache_, "motion.status." + axis + "_axis"));
}

bool MotionService::is_moving() const {
    for (const char* axis : {"x", "y", "z", "xy"}) {
        try {
            if (read_flag(*cache_, move_block(axis) + "parameters.in_progress")) {
                return true;
            }
        } catch (const TagNotCachedError&) {
            continue;
        }
    }
    return false;
}

bool MotionService::wait_for_completion(const std::string& axis, std::chrono::milliseconds timeout) const {
    if (axis != "xy") {
        limits_for(axis);
    }
    const auto block = move_block(axis);
    const auto since = std::chrono::system_clock::now();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        try {
            const auto complete = cache_->get_tag_with_metadata(block + "parameters.status");
            const auto in_progress = cache_->get_tag_with_metadata(block + "parameters.in_progress");
            const bool fresh = complete.timestamp > since && in_progress.timestamp > since;
            if (fresh && as_number(complete.value).value_or(0.0) != 0.0 &&
                as_number(in_progress.value).value_or(1.0) == 0.0) {
                return true;
            }
        } catch (const TagNotCachedError&) {
            // first poll not done yet
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg_.completion_poll_ms));
    }
    EVLOG_warning << "Move " << axis << " not complete after " << timeout.count() << " ms";
    return false;
}

HealthReport MotionService::health() const {
    HealthReport report;
    if (!cache_->hardware_status().plc_connected) {
        report.issues.emplace_back("PLC disconnected");
    }
    try {
        if (!read_flag(*cache_, kMotionReady)) {
            report.issues.emplace_back("motion controller not ready");
        }
        const auto pos = position();
        const std::pair<const char*, double> axes[] = {{"x", pos.x}, {"y", pos.y}, {"z", pos.z}};
        for (const auto& [axis, value] : axes) {
            const auto& limits = limits_for(axis);
            if (value < limits.min || value > limits.max) {
                std::ostringstream msg;
                msg << axis << " position " << value << " outside limits";
                report.issues.push_back(msg.str());
            }
        }
    } catch (const TagNotCachedError& e) {
        report.issues.push_back(std::string("no motion data: ") + e.what());
    } catch (const UnknownTagError& e) {
        report.issues.push_back(std::string("motion tag not configured: ") + e.what());
    }
    report.healthy = report.issues.empty();
    return report;
}

} // namespace coldspray
