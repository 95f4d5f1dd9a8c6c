// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "app_config.hpp"
#include "hardware_client.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <modbus/modbus.h>

namespace coldspray {

enum class RegisterClass {
    Coil,            // 0xxxxx
    DiscreteInput,   // 1xxxxx
    InputRegister,   // 3xxxxx
    HoldingRegister, // 4xxxxx
};

enum class PlcDataType {
    Bool,
    Int32,
    Float32,
};

struct PlcTag {
    std::string name;
    PlcDataType type{PlcDataType::Bool};
    RegisterClass register_class{RegisterClass::Coil};
    int offset{0}; // zero-based protocol address

    int width() const;
};

// Contiguous block fetched with one Modbus request.
struct ReadSpan {
    RegisterClass register_class{RegisterClass::Coil};
    int start{0};
    int count{0};
    std::vector<std::size_t> tags; // indexes into the tag list
};

// Parses the Productivity Suite tag export (CSV with "Tag Name", "Data Type" and
// "Modbus Start Address" columns). Rows without a Modbus address or with string types are skipped.
std::vector<PlcTag> load_plc_tag_file(const fs::path& path);
PlcTag parse_plc_tag(const std::string& name, const std::string& data_type, const std::string& modbus_address);

// Groups tags into spans of at most 125 registers or 2000 bits.
std::vector<ReadSpan> plan_reads(const std::vector<PlcTag>& tags);

// Productivity-series PLC over Modbus TCP (libmodbus). 32-bit values use CDAB word order.
class ProductivityPlcClient : public PlcClient {
public:
    explicit ProductivityPlcClient(const PlcConfig& cfg);
    ProductivityPlcClient(const PlcConfig& cfg, std::vector<PlcTag> tags);
    ~ProductivityPlcClient() override;

    ProductivityPlcClient(const ProductivityPlcClient&) = delete;
    ProductivityPlcClient& operator=(const ProductivityPlcClient&) = delete;

    void connect() override;
    void disconnect() override;
    Value read_tag(const std::string& address) override;
    void write_tag(const std::string& address, const Value& value) override;
    bool is_connected() const override;
    std::map<std::string, Value> read_all() override;

    const std::set<std::string>& known_tags() const { return known_tags_; }

private:
    struct ContextDeleter {
        void operator()(modbus_t* ctx) const;
    };

    void open_session();
    void close_session();
    std::map<std::string, Value> read_all_locked();
    [[noreturn]] void fail(const std::string& operation, const std::string& tag);

    PlcConfig cfg_;
    std::vector<PlcTag> tags_;
    std::map<std::string, std::size_t> index_;
    std::vector<ReadSpan> spans_;
    std::set<std::string> known_tags_;
    std::unique_ptr<modbus_t, ContextDeleter> ctx_;
    bool enabled_{false};
    mutable std::mutex mtx_;
};

} // namespace coldspray
