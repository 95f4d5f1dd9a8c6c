// SPDX-License-Identifier: Apache-2.0
#include "client_factory.hpp"

#include "hardware_sim.hpp"
#include "plc_client.hpp"
#include "ssh_feeder_client.hpp"

#include <everest/logging.hpp>

namespace coldspray {

namespace {
void seed_tables(const AppConfig& cfg, RegisterTable& plc, RegisterTable& feeder) {
    plc = default_plc_values();
    feeder = default_feeder_values();
    if (!cfg.mock.data_file.empty()) {
        load_mock_data(cfg.mock.data_file, plc, feeder);
    }
}
} // namespace

std::shared_ptr<PlcClient> make_plc_client(const AppConfig& cfg) {
    if (cfg.force_mock) {
        RegisterTable plc;
        RegisterTable feeder;
        seed_tables(cfg, plc, feeder);
        EVLOG_info << "Using simulated PLC (" << plc.size() << " registers)";
        return std::make_shared<SimulatedPlcClient>(cfg.mock, std::move(plc));
    }
    EVLOG_info << "Using Productivity PLC at " << cfg.plc.ip << ":" << cfg.plc.port;
    return std::make_shared<ProductivityPlcClient>(cfg.plc);
}

std::shared_ptr<HardwareClient> make_feeder_client(const AppConfig& cfg) {
    if (cfg.force_mock) {
        RegisterTable plc;
        RegisterTable feeder;
        seed_tables(cfg, plc, feeder);
        EVLOG_info << "Using simulated feeder controller";
        return std::make_shared<SimulatedFeederClient>(cfg.mock, std::move(feeder));
    }
    EVLOG_info << "Using feeder controller at " << cfg.ssh.host << ":" << cfg.ssh.port;
    return std::make_shared<SshFeederClient>(cfg.ssh);
}

} // namespace coldspray
