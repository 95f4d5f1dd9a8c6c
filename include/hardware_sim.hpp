// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "app_config.hpp"
#include "hardware_client.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace coldspray {

using RegisterTable = std::map<std::string, Value>;

// Raw register defaults of an idle cell: gas at 50 %, gate valve open, axes homed.
RegisterTable default_plc_values();
RegisterTable default_feeder_values();

// Overlays {"plc_tags": {...}, "feeder_tags": {...}} from a JSON file onto the given tables.
void load_mock_data(const fs::path& path, RegisterTable& plc, RegisterTable& feeder);

/// \brief In-memory register table behind a hardware client interface, so the stack runs without a PLC
/// or feeder controller. Latency and failure rates come from MockConfig.
template <typename Interface>
class SimulatedClient : public Interface {
public:
    SimulatedClient(std::string device, const MockConfig& cfg, RegisterTable values, bool accept_unknown);

    void connect() override;
    void disconnect() override;
    Value read_tag(const std::string& address) override;
    void write_tag(const std::string& address, const Value& value) override;
    bool is_connected() const override;

    // Simulation controls for tests/harnesses
    void inject_read_failures(int count) { forced_read_failures_ = count; }
    void inject_write_failures(int count) { forced_write_failures_ = count; }
    void set_connected(bool connected) { connected_ = connected; }
    std::optional<Value> raw_value(const std::string& address) const;
    void set_raw_value(const std::string& address, const Value& value);
    std::size_t write_count() const { return write_count_; }

protected:
    void simulate_latency();
    // Throw HardwareError when disconnected or when an injected/random failure is due.
    void check_read(const std::string& address);
    void check_write(const std::string& address);
    // Called with mtx_ held after a write is stored.
    virtual void on_write(const std::string& /*address*/, const Value& /*value*/) {}

    std::string device_;
    MockConfig cfg_;
    mutable std::mutex mtx_;
    RegisterTable values_;

private:
    bool roll(double rate);

    bool accept_unknown_;
    std::atomic<bool> connected_{false};
    std::atomic<int> forced_read_failures_{0};
    std::atomic<int> forced_write_failures_{0};
    std::atomic<std::size_t> write_count_{0};
    std::mt19937 rng_;
    std::mutex rng_mtx_;
};

class SimulatedPlcClient : public SimulatedClient<PlcClient> {
public:
    explicit SimulatedPlcClient(const MockConfig& cfg);
    SimulatedPlcClient(const MockConfig& cfg, RegisterTable values);

    std::map<std::string, Value> read_all() override;

protected:
    // Move and home triggers complete immediately.
    void on_write(const std::string& address, const Value& value) override;
};

// Feeder controller shell: any P-variable may be written.
class SimulatedFeederClient : public SimulatedClient<HardwareClient> {
public:
    explicit SimulatedFeederClient(const MockConfig& cfg);
    SimulatedFeederClient(const MockConfig& cfg, RegisterTable values);
};

extern template class SimulatedClient<PlcClient>;
extern template class SimulatedClient<HardwareClient>;

} // namespace coldspray
