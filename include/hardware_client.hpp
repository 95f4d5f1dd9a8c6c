// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "tag_types.hpp"

#include <map>
#include <string>

namespace coldspray {

// Transport to one piece of hardware. Values crossing this interface are raw hardware values.
class HardwareClient {
public:
    virtual ~HardwareClient() = default;

    virtual void connect() = 0;
    virtual void disconnect() = 0;
    virtual Value read_tag(const std::string& address) = 0;
    virtual void write_tag(const std::string& address, const Value& value) = 0;
    virtual bool is_connected() const = 0;
};

class PlcClient : public HardwareClient {
public:
    // One batched round trip over every known PLC tag.
    virtual std::map<std::string, Value> read_all() = 0;
};

} // namespace coldspray
