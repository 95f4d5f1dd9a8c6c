// SPDX-License-Identifier: Apache-2.0
#include "app_config.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace coldspray {

namespace {
fs::path make_absolute(const fs::path& base, const fs::path& relative_or_absolute) {
    if (relative_or_absolute.empty() || relative_or_absolute.is_absolute()) {
        return relative_or_absolute;
    }
    return fs::weakly_canonical(base / relative_or_absolute);
}

nlohmann::json read_json(const fs::path& path, const char* what) {
    if (!fs::exists(path)) {
        throw std::runtime_error(std::string(what) + " not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(std::string("Failed to open ") + what + ": " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(std::string("Malformed ") + what + " " + path.string() + ": " + e.what());
    }
}

AxisLimits parse_limits(const nlohmann::json& limits, const char* axis, AxisLimits fallback) {
    const auto axis_json = limits.value(axis, nlohmann::json::object());
    AxisLimits out;
    out.min = axis_json.value("min", fallback.min);
    out.max = axis_json.value("max", fallback.max);
    if (out.max < out.min) {
        throw std::runtime_error(std::string("Motion limits for axis ") + axis + " have max < min");
    }
    return out;
}
} // namespace

AppConfig load_app_config(const fs::path& config_path) {
    const auto json = read_json(config_path, "Config file");
    const auto base_dir = config_path.parent_path().empty() ? fs::current_path() : config_path.parent_path();

    AppConfig cfg{};
    cfg.force_mock = json.value("forceMock", json.value("useMock", cfg.force_mock));

    const auto plc = json.value("plc", nlohmann::json::object());
    cfg.plc.ip = plc.value("ip", cfg.plc.ip);
    cfg.plc.port = plc.value("port", cfg.plc.port);
    cfg.plc.unit_id = plc.value("unitId", cfg.plc.unit_id);
    cfg.plc.tag_file = make_absolute(base_dir, plc.value("tagFile", ""));
    cfg.plc.timeout_s = plc.value("timeoutSeconds", cfg.plc.timeout_s);
    cfg.plc.polling_interval_s = plc.value("pollingIntervalSeconds", cfg.plc.polling_interval_s);
    if (cfg.plc.timeout_s <= 0.0) {
        cfg.plc.timeout_s = PlcConfig{}.timeout_s;
    }
    if (cfg.plc.polling_interval_s <= 0.0) {
        cfg.plc.polling_interval_s = PlcConfig{}.polling_interval_s;
    }

    const auto ssh = json.value("ssh", nlohmann::json::object());
    cfg.ssh.host = ssh.value("host", cfg.ssh.host);
    cfg.ssh.port = ssh.value("port", cfg.ssh.port);
    cfg.ssh.username = ssh.value("username", cfg.ssh.username);
    cfg.ssh.password = ssh.value("password", cfg.ssh.password);
    cfg.ssh.timeout_s = ssh.value("timeoutSeconds", cfg.ssh.timeout_s);
    cfg.ssh.command_timeout_s = ssh.value("commandTimeoutSeconds", cfg.ssh.command_timeout_s);
    const auto retry = ssh.value("retry", nlohmann::json::object());
    cfg.ssh.retry.max_attempts = std::max(1, retry.value("maxAttempts", cfg.ssh.retry.max_attempts));
    cfg.ssh.retry.delay_s = std::max(0.0, retry.value("delaySeconds", cfg.ssh.retry.delay_s));
    cfg.ssh.handshake_delay_s = std::max(0.0, ssh.value("handshakeDelaySeconds", cfg.ssh.handshake_delay_s));
    cfg.ssh.boot_retry_delay_s = std::max(0.0, ssh.value("bootRetryDelaySeconds", cfg.ssh.boot_retry_delay_s));
    cfg.ssh.queue_capacity = std::max<std::size_t>(1, ssh.value("queueCapacity", cfg.ssh.queue_capacity));
    cfg.ssh.read_buffer_bytes = std::max<std::size_t>(64, ssh.value("readBufferBytes", cfg.ssh.read_buffer_bytes));
    if (cfg.ssh.command_timeout_s <= 0.0) {
        cfg.ssh.command_timeout_s = SshConfig{}.command_timeout_s;
    }

    const auto mock = json.value("mock", nlohmann::json::object());
    cfg.mock.delay_ms = std::max(0, mock.value("delayMs", cfg.mock.delay_ms));
    cfg.mock.jitter_ms = std::max(0, mock.value("jitterMs", cfg.mock.jitter_ms));
    cfg.mock.connect_failure_rate = std::clamp(mock.value("connectFailureRate", 0.0), 0.0, 1.0);
    cfg.mock.read_failure_rate = std::clamp(mock.value("readFailureRate", 0.0), 0.0, 1.0);
    cfg.mock.write_failure_rate = std::clamp(mock.value("writeFailureRate", 0.0), 0.0, 1.0);
    cfg.mock.seed = mock.value("seed", cfg.mock.seed);
    cfg.mock.data_file = make_absolute(base_dir, mock.value("dataFile", ""));

    const auto cache = json.value("tagCache", nlohmann::json::object());
    const auto derived_interval_ms = static_cast<int>(cfg.plc.polling_interval_s * 1000.0);
    cfg.tag_cache.poll_interval_ms = cache.value("pollIntervalMs", derived_interval_ms);
    if (cfg.tag_cache.poll_interval_ms <= 0) {
        cfg.tag_cache.poll_interval_ms = derived_interval_ms;
    }
    cfg.tag_cache.tag_config = make_absolute(base_dir, cache.value("tagConfig", "tags.json"));

    const auto equipment = json.value("equipment", nlohmann::json::object());
    cfg.equipment.flow_tolerance_slpm = equipment.value("flowToleranceSlpm", cfg.equipment.flow_tolerance_slpm);
    cfg.equipment.pulse_ms = std::max(0, equipment.value("pulseMs", cfg.equipment.pulse_ms));
    cfg.equipment.stale_after_ms = equipment.value("staleAfterMs", cfg.equipment.stale_after_ms);

    const auto motion = json.value("motion", nlohmann::json::object());
    const auto limits = motion.value("limits", nlohmann::json::object());
    cfg.motion.x = parse_limits(limits, "x", cfg.motion.x);
    cfg.motion.y = parse_limits(limits, "y", cfg.motion.y);
    cfg.motion.z = parse_limits(limits, "z", cfg.motion.z);
    cfg.motion.max_velocity = motion.value("maxVelocity", cfg.motion.max_velocity);
    cfg.motion.completion_poll_ms = std::max(1, motion.value("completionPollMs", cfg.motion.completion_poll_ms));

    const auto logging = json.value("logging", nlohmann::json::object());
    cfg.logging_config = make_absolute(base_dir, logging.value("config", "logging.ini"));
    return cfg;
}

nlohmann::json load_tag_config(const fs::path& tag_config_path) {
    return read_json(tag_config_path, "Tag configuration");
}

} // namespace coldspray
