// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "app_config.hpp"
#include "hardware_client.hpp"

#include <memory>

namespace coldspray {

// Real Modbus/SSH clients, or simulated ones when forceMock is set.
std::shared_ptr<PlcClient> make_plc_client(const AppConfig& cfg);
std::shared_ptr<HardwareClient> make_feeder_client(const AppConfig& cfg);

} // namespace coldspray
