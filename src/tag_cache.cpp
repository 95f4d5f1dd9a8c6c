// SPDX-License-Identifier: Apache-2.0
#include "tag_cache.hpp"

#include "errors.hpp"
#include "tag_validation.hpp"
#include "value_codec.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

#include <everest/logging.hpp>

namespace coldspray {

namespace {
// Float tags keep a double even when the caller passes an integer.
Value normalize(const TagDefinition& def, const Value& value) {
    if (def.type == TagType::Float) {
        if (const auto* i = std::get_if<std::int64_t>(&value)) {
            return static_cast<double>(*i);
        }
    }
    return value;
}
} // namespace

TagCache::TagCache(const TagCacheConfig& cfg, std::shared_ptr<TagMapping> mapping, std::shared_ptr<PlcClient> plc,
                   std::shared_ptr<HardwareClient> feeder)
    : cfg_(cfg), mapping_(std::move(mapping)), plc_(std::move(plc)), feeder_(std::move(feeder)) {
    if (!mapping_ || !plc_) {
        throw std::invalid_argument("TagCache requires a tag mapping and a PLC client");
    }
    if (cfg_.poll_interval_ms <= 0) {
        cfg_.poll_interval_ms = TagCacheConfig{}.poll_interval_ms;
    }
}

TagCache::~TagCache() {
    stop();
}

void TagCache::initialize(const nlohmann::json& tag_config) {
    mapping_->build_mappings(tag_config);
    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        initialized_at_ = std::chrono::system_clock::now();
    }
    seed_internal_defaults();

    plc_->connect();
    if (feeder_) {
        try {
            feeder_->connect();
        } catch (const HardwareError& e) {
            EVLOG_warning << "Feeder controller unavailable, feeder tags will fail until reconnect: " << e.what();
        }
    }
    initialized_ = true;
    EVLOG_info << "Tag cache initialized with " << mapping_->size() << " tags";
}

std::chrono::system_clock::time_point TagCache::initialized_at() const {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    return initialized_at_;
}

void TagCache::start() {
    if (!initialized_) {
        throw std::runtime_error("Tag cache started before initialize()");
    }
    {
        std::lock_guard<std::mutex> lock(poll_mtx_);
        if (running_) {
            EVLOG_warning << "Tag cache poll loop already running";
            return;
        }
        running_ = true;
    }
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
    poll_thread_ = std::thread([this]() { poll_loop(); });
    EVLOG_info << "Tag cache polling every " << cfg_.poll_interval_ms << " ms";
}

void TagCache::stop() {
    {
        std::lock_guard<std::mutex> lock(poll_mtx_);
        running_ = false;
    }
    poll_cv_.notify_all();
    if (poll_thread_.joinable()) {
        poll_thread_.join();
        EVLOG_info << "Tag cache poll loop stopped";
    }
}

void TagCache::shutdown() {
    stop();
    plc_->disconnect();
    if (feeder_) {
        feeder_->disconnect();
    }
    clear_cache();
    initialized_ = false;
}

void TagCache::poll_loop() {
    const auto interval = std::chrono::milliseconds(cfg_.poll_interval_ms);
    while (running_) {
        try {
            poll_once();
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(stats_mtx_);
                ++stats_.failed_polls;
            }
            EVLOG_warning << "Tag poll failed, retrying next interval: " << e.what();
        }
        std::unique_lock<std::mutex> lock(poll_mtx_);
        poll_cv_.wait_for(lock, interval, [this]() { return !running_; });
    }
}

void TagCache::poll_once() {
    // Values are stamped with the time the read was issued.
    const auto now = std::chrono::system_clock::now();
    const auto raw_values = plc_->read_all();
    const auto tables = mapping_->snapshot();

    std::vector<std::pair<std::string, TagValue>> changed;
    std::uint64_t conversion_failures = 0;
    {
        std::lock_guard<std::mutex> lock(cache_mtx_);
        for (const auto& [hw_address, raw] : raw_values) {
            const auto path = tables->find_path(hw_address, Transport::Plc);
            if (!path) {
                continue; // register not surfaced as a logical tag
            }
            const auto def = tables->find(*path);
            Value engineering;
            try {
                engineering = to_engineering(*def, raw);
            } catch (const std::invalid_argument& e) {
                ++conversion_failures;
                EVLOG_warning << "Cannot convert " << hw_address << " for " << *path << ": " << e.what();
                continue;
            }

            const auto existing = values_.find(*path);
            if (existing != values_.end() && existing->second.timestamp > now) {
                continue; // written while the read was in flight
            }
            TagValue value{std::move(engineering), now, def};
            const bool differs = existing == values_.end() || !values_equal(existing->second.value, value.value);
            values_[*path] = value;
            if (differs) {
                changed.emplace_back(*path, std::move(value));
            }
        }
    }
    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        ++stats_.successful_polls;
        stats_.conversion_failures += conversion_failures;
        stats_.last_poll = now;
    }
    for (const auto& [path, value] : changed) {
        notify(path, value);
    }
}

Value TagCache::get_tag(const std::string& path) const {
    return get_tag_with_metadata(path).value;
}

TagValue TagCache::get_tag_with_metadata(const std::string& path) const {
    {
        std::lock_guard<std::mutex> lock(cache_mtx_);
        const auto it = values_.find(path);
        if (it != values_.end()) {
            return it->second;
        }
    }
    if (!mapping_->snapshot()->find(path)) {
        throw UnknownTagError(path);
    }
    throw TagNotCachedError(path);
}

std::map<std::string, TagValue> TagCache::get_all_tags() const {
    std::lock_guard<std::mutex> lock(cache_mtx_);
    return values_;
}

void TagCache::validate_value(const std::string& path, const Value& value) const {
    validate_write(*mapping_->get_tag_metadata(path), value);
}

void TagCache::set_tag(const std::string& path, const Value& value) {
    const auto def = mapping_->get_tag_metadata(path);
    validate_write(*def, value);

    TagValue stored;
    {
        std::lock_guard<std::mutex> write_lock(write_lock_for(path));
        if (!def->internal) {
            Value raw;
            try {
                raw = to_hardware(*def, value);
            } catch (const std::invalid_argument& e) {
                throw ValidationError(path, e.what());
            }
            auto& client = client_for(*def, "write");
            try {
                client.write_tag(*def->hw_address, raw);
            } catch (const HardwareError& e) {
                EVLOG_error << "Write " << path << "=" << to_string(value) << " failed: " << e.what();
                throw;
            }
            EVLOG_debug << "Wrote " << path << "=" << to_string(value) << " (" << *def->hw_address << "="
                        << to_string(raw) << ")";
        }
        stored = TagValue{normalize(*def, value), std::chrono::system_clock::now(), def};
        store(path, stored);
    }
    // Callbacks run without the write lock so they may write tags themselves.
    notify(path, stored);
}

Value TagCache::refresh_tag(const std::string& path) {
    const auto def = mapping_->get_tag_metadata(path);
    if (def->internal) {
        return get_tag(path);
    }
    const auto raw = client_for(*def, "read").read_tag(*def->hw_address);
    Value engineering;
    try {
        engineering = to_engineering(*def, raw);
    } catch (const std::invalid_argument& e) {
        throw HardwareError(to_string(def->transport), "read", path, e.what());
    }

    TagValue value{engineering, std::chrono::system_clock::now(), def};
    bool differs = true;
    {
        std::lock_guard<std::mutex> lock(cache_mtx_);
        const auto existing = values_.find(path);
        differs = existing == values_.end() || !values_equal(existing->second.value, engineering);
        values_[path] = value;
    }
    if (differs) {
        notify(path, value);
    }
    return engineering;
}

void TagCache::run_feeder(const std::string& path, bool run) {
    const auto def = mapping_->get_tag_metadata(path);
    if (!def->feeder) {
        throw ValidationError(path, "not a feeder frequency tag");
    }
    const auto& regs = *def->feeder;
    auto& client = client_for(*def, "write");

    std::lock_guard<std::mutex> write_lock(write_lock_for(path));
    if (run) {
        client.write_tag(regs.time_var, regs.default_time);
        client.write_tag(regs.start_var, regs.start_val);
    } else {
        client.write_tag(regs.start_var, regs.stop_val);
    }
    EVLOG_info << "Feeder " << path << (run ? " started" : " stopped");
}

void TagCache::reload_tag_config(const nlohmann::json& tag_config) {
    mapping_->build_mappings(tag_config);
    const auto tables = mapping_->snapshot();
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(cache_mtx_);
        for (auto it = values_.begin(); it != values_.end();) {
            auto def = tables->find(it->first);
            if (!def) {
                it = values_.erase(it);
                ++dropped;
                continue;
            }
            it->second.definition = std::move(def);
            ++it;
        }
    }
    seed_internal_defaults();
    EVLOG_info << "Tag configuration reloaded (" << tables->tags.size() << " tags, " << dropped
               << " cached values dropped)";
}

void TagCache::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mtx_);
    values_.clear();
}

TagCache::CallbackId TagCache::add_state_callback(StateCallback callback) {
    auto slot = std::make_shared<CallbackSlot>();
    slot->callback = std::move(callback);
    std::lock_guard<std::mutex> lock(callbacks_mtx_);
    const auto id = next_callback_id_++;
    callbacks_.emplace(id, std::move(slot));
    return id;
}

bool TagCache::remove_state_callback(CallbackId id) {
    std::unique_lock<std::mutex> lock(callbacks_mtx_);
    const auto it = callbacks_.find(id);
    if (it == callbacks_.end()) {
        return false;
    }
    const auto slot = it->second;
    callbacks_.erase(it);
    slot->removed = true;

    const auto self = std::this_thread::get_id();
    callbacks_cv_.wait(lock, [&slot, self]() {
        return std::all_of(slot->delivering.begin(), slot->delivering.end(),
                           [self](const std::thread::id& tid) { return tid == self; });
    });
    return true;
}

TagCache::Stats TagCache::stats() const {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    return stats_;
}

TagCache::HardwareStatus TagCache::hardware_status() const {
    HardwareStatus status;
    status.plc_connected = plc_->is_connected();
    status.feeder_connected = feeder_ && feeder_->is_connected();
    return status;
}

void TagCache::seed_internal_defaults() {
    const auto tables = mapping_->snapshot();
    const auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(cache_mtx_);
    for (const auto& [path, def] : tables->tags) {
        if (def->internal && def->default_value && values_.count(path) == 0) {
            values_[path] = TagValue{*def->default_value, now, def};
        }
    }
}

void TagCache::store(const std::string& path, const TagValue& value) {
    std::lock_guard<std::mutex> lock(cache_mtx_);
    values_[path] = value;
}

void TagCache::notify(const std::string& path, const TagValue& value) {
    std::vector<std::shared_ptr<CallbackSlot>> slots;
    {
        std::lock_guard<std::mutex> lock(callbacks_mtx_);
        slots.reserve(callbacks_.size());
        for (const auto& entry : callbacks_) {
            slots.push_back(entry.second);
        }
    }

    const auto self = std::this_thread::get_id();
    for (const auto& slot : slots) {
        {
            std::lock_guard<std::mutex> lock(callbacks_mtx_);
            if (slot->removed) {
                continue;
            }
            slot->delivering.push_back(self);
        }
        try {
            slot->callback(path, value);
        } catch (const std::exception& e) {
            EVLOG_warning << "State callback for " << path << " threw: " << e.what();
        } catch (...) {
            EVLOG_warning << "State callback for " << path << " threw a non-standard exception";
        }
        {
            std::lock_guard<std::mutex> lock(callbacks_mtx_);
            slot->delivering.erase(std::find(slot->delivering.begin(), slot->delivering.end(), self));
        }
        callbacks_cv_.notify_all();
    }
}

HardwareClient& TagCache::client_for(const TagDefinition& def, const char* operation) {
    if (def.transport == Transport::Plc) {
        return *plc_;
    }
    if (def.transport == Transport::Feeder && feeder_) {
        return *feeder_;
    }
    throw HardwareError(to_string(def.transport), operation, def.path, "no client for this tag");
}

std::mutex& TagCache::write_lock_for(const std::string& path) {
    return write_locks_[std::hash<std::string>{}(path) % write_locks_.size()];
}

} // namespace coldspray
