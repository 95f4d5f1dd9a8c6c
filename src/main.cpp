// SPDX-License-Identifier: Apache-2.0
#include "app_config.hpp"
#include "client_factory.hpp"
#include "equipment_service.hpp"
#include "motion_service.hpp"
#include "tag_cache.hpp"
#include "tag_mapping.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <everest/logging.hpp>

namespace {
std::atomic<bool> keep_running{true};
std::atomic<bool> reload_requested{false};

void handle_signal(int sig) {
    if (sig == SIGHUP) {
        reload_requested = true;
        return;
    }
    keep_running = false;
}

std::string parse_config_path(int argc, char* argv[]) {
    std::string path = "configs/coldspray.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            path = argv[i + 1];
        }
    }
    return path;
}
} // namespace

int main(int argc, char* argv[]) {
    const auto config_path = parse_config_path(argc, argv);

    coldspray::AppConfig cfg;
    nlohmann::json tag_config;
    try {
        cfg = coldspray::load_app_config(config_path);
        tag_config = coldspray::load_tag_config(cfg.tag_cache.tag_config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    Everest::Logging::init(cfg.logging_config.string(), "coldspray-hw");
    EVLOG_info << "Starting cold spray hardware core (" << (cfg.force_mock ? "simulated" : "hardware") << " mode)";

    std::shared_ptr<coldspray::TagCache> cache;
    try {
        auto mapping = std::make_shared<coldspray::TagMapping>();
        cache = std::make_shared<coldspray::TagCache>(cfg.tag_cache, mapping, coldspray::make_plc_client(cfg),
                                                      coldspray::make_feeder_client(cfg));
        cache->initialize(tag_config);
        cache->start();
    } catch (const std::exception& e) {
        EVLOG_error << "Hardware core failed to start: " << e.what();
        return 1;
    }

    coldspray::EquipmentService equipment(cache, cfg.equipment);
    coldspray::MotionService motion(cache, cfg.motion);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGHUP, handle_signal);

    auto last_health = std::chrono::steady_clock::now();
    while (keep_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (reload_requested.exchange(false)) {
            try {
                cache->reload_tag_config(coldspray::load_tag_config(cfg.tag_cache.tag_config));
            } catch (const std::exception& e) {
                EVLOG_error << "Tag configuration reload failed, keeping previous mapping: " << e.what();
            }
        }
        const auto now = std::chrono::steady_clock::now();
        if (now - last_health >= std::chrono::seconds(30)) {
            last_health = now;
            for (const auto& report : {equipment.health(), motion.health()}) {
                for (const auto& issue : report.issues) {
                    EVLOG_warning << "Health: " << issue;
                }
            }
        }
    }

    EVLOG_info << "Shutting down";
    cache->shutdown();
    return 0;
}
