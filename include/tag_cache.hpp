// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "app_config.hpp"
#include "hardware_client.hpp"
#include "tag_mapping.hpp"
#include "tag_types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace coldspray {

/// \brief Current engineering-unit value of every tag.
///
/// A background thread polls the PLC with one batched read per interval and publishes converted
/// values. Reads never touch hardware. Writes are validated, converted to raw values, written through
/// the owning client and only then stored, so a failed write leaves the cached value unchanged.
class TagCache {
public:
    using StateCallback = std::function<void(const std::string& path, const TagValue& value)>;
    using CallbackId = std::uint64_t;

    struct Stats {
        std::uint64_t successful_polls{0};
        std::uint64_t failed_polls{0};
        std::uint64_t conversion_failures{0};
        std::optional<std::chrono::system_clock::time_point> last_poll;
    };

    struct HardwareStatus {
        bool plc_connected{false};
        bool feeder_connected{false};
    };

    TagCache(const TagCacheConfig& cfg, std::shared_ptr<TagMapping> mapping, std::shared_ptr<PlcClient> plc,
             std::shared_ptr<HardwareClient> feeder);
    ~TagCache();

    TagCache(const TagCache&) = delete;
    TagCache& operator=(const TagCache&) = delete;

    // Builds the mapping and connects the clients. A PLC connection failure is fatal; the feeder is optional.
    void initialize(const nlohmann::json& tag_config);
    void start();
    void stop();
    // stop() plus disconnect and discard cached values.
    void shutdown();
    bool is_running() const { return running_; }
    std::chrono::system_clock::time_point initialized_at() const;

    Value get_tag(const std::string& path) const;
    TagValue get_tag_with_metadata(const std::string& path) const;
    std::map<std::string, TagValue> get_all_tags() const;
    void set_tag(const std::string& path, const Value& value);
    void validate_value(const std::string& path, const Value& value) const;

    // Reads one tag from hardware into the cache.
    Value refresh_tag(const std::string& path);
    // Starts or stops a feeder through its time/start P-variables.
    void run_feeder(const std::string& path, bool run);

    void reload_tag_config(const nlohmann::json& tag_config);
    void clear_cache();

    // One poll iteration; throws on hardware failure.
    void poll_once();

    CallbackId add_state_callback(StateCallback callback);
    // Returns once no other thread is still running the callback. A callback may remove itself.
    bool remove_state_callback(CallbackId id);

    Stats stats() const;
    HardwareStatus hardware_status() const;
    const TagMapping& mapping() const { return *mapping_; }

private:
    struct CallbackSlot {
        StateCallback callback;
        bool removed{false};
        std::vector<std::thread::id> delivering;
    };

    void poll_loop();
    void seed_internal_defaults();
    void store(const std::string& path, const TagValue& value);
    void notify(const std::string& path, const TagValue& value);
    HardwareClient& client_for(const TagDefinition& def, const char* operation);
    std::mutex& write_lock_for(const std::string& path);

    TagCacheConfig cfg_;
    std::shared_ptr<TagMapping> mapping_;
    std::shared_ptr<PlcClient> plc_;
    std::shared_ptr<HardwareClient> feeder_;

    mutable std::mutex cache_mtx_;
    std::map<std::string, TagValue> values_;

    mutable std::mutex callbacks_mtx_;
    std::condition_variable callbacks_cv_;
    std::map<CallbackId, std::shared_ptr<CallbackSlot>> callbacks_;
    CallbackId next_callback_id_{1};

    std::array<std::mutex, 16> write_locks_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> running_{false};
    std::thread poll_thread_;
    std::mutex poll_mtx_;
    std::condition_variable poll_cv_;

    mutable std::mutex stats_mtx_;
    Stats stats_;
    std::chrono::system_clock::time_point initialized_at_{};
};

} // namespace coldspray
