// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace coldspray {

namespace fs = std::filesystem;

struct PlcConfig {
    std::string ip{"192.168.0.130"};
    int port{502};
    int unit_id{1};
    fs::path tag_file;              // Tag export CSV from the Productivity Suite project
    double timeout_s{5.0};          // Modbus response timeout
    double polling_interval_s{1.0};
};

struct RetryConfig {
    int max_attempts{3};
    double delay_s{5.0};
};

struct SshConfig {
    std::string host{"192.168.0.200"};
    int port{22};
    std::string username{"root"};
    std::string password;
    double timeout_s{5.0};
    double command_timeout_s{2.0};
    RetryConfig retry;
    double handshake_delay_s{1.0};   // settle time after enabling line mode
    double boot_retry_delay_s{18.0}; // wait before retrying line mode while the controller boots
    std::size_t queue_capacity{32};
    std::size_t read_buffer_bytes{1024};
};

struct MockConfig {
    int delay_ms{100};
    int jitter_ms{0};
    double connect_failure_rate{0.0};
    double read_failure_rate{0.0};
    double write_failure_rate{0.0};
    std::uint32_t seed{0}; // 0 picks a random seed
    fs::path data_file;    // Optional JSON seed table ({"plc_tags": {...}, "feeder_tags": {...}})
};

struct TagCacheConfig {
    int poll_interval_ms{1000};
    fs::path tag_config;
};

struct EquipmentConfig {
    double flow_tolerance_slpm{2.0};
    int pulse_ms{500}; // vacuum pump start/stop pulse width
    int stale_after_ms{5000};
};

struct AxisLimits {
    double min{0.0};
    double max{500.0};
};

struct MotionConfig {
    AxisLimits x;
    AxisLimits y;
    AxisLimits z{0.0, 100.0};
    double max_velocity{100.0};
    int completion_poll_ms{50};
};

struct AppConfig {
    bool force_mock{true};
    PlcConfig plc;
    SshConfig ssh;
    MockConfig mock;
    TagCacheConfig tag_cache;
    EquipmentConfig equipment;
    MotionConfig motion;
    fs::path logging_config;
};

AppConfig load_app_config(const fs::path& config_path);
nlohmann::json load_tag_config(const fs::path& tag_config_path);

} // namespace coldspray
