// SPDX-License-Identifier: Apache-2.0
#include "plc_client.hpp"

#include "errors.hpp"
#include "value_codec.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>

#include <everest/logging.hpp>

namespace coldspray {

namespace {
constexpr int kMaxRegistersPerRead = 125;
constexpr int kMaxBitsPerRead = 2000;
const char* kDevice = "plc";

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string uppercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field.push_back('"');
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field.push_back(c);
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(trim(field));
            field.clear();
        } else {
            field.push_back(c);
        }
    }
    fields.push_back(trim(field));
    return fields;
}

// Productivity type codes as they appear in the tag export.
std::optional<PlcDataType> parse_data_type(const std::string& data_type) {
    const auto code = uppercase(trim(data_type));
    if (code == "C" || code == "DI" || code == "DO" || code == "MST" || code == "SBR" ||
        code.find("BOOL") != std::string::npos) {
        return PlcDataType::Bool;
    }
    if (code == "F32" || code == "AIF32" || code == "AOF32" || code.find("FLOAT") != std::string::npos) {
        return PlcDataType::Float32;
    }
    if (code == "S32" || code == "AIS32" || code == "AOS32" || code.find("INTEGER") != std::string::npos) {
        return PlcDataType::Int32;
    }
    return std::nullopt;
}

bool is_bit_class(RegisterClass cls) {
    return cls == RegisterClass::Coil || cls == RegisterClass::DiscreteInput;
}

std::uint32_t combine_cdab(const std::uint16_t* regs) {
    return (static_cast<std::uint32_t>(regs[1]) << 16) | regs[0];
}
} // namespace

int PlcTag::width() const {
    return type == PlcDataType::Bool ? 1 : 2;
}

PlcTag parse_plc_tag(const std::string& name, const std::string& data_type, const std::string& modbus_address) {
    const auto type = parse_data_type(data_type);
    if (!type) {
        throw std::invalid_argument("Unsupported PLC data type '" + data_type + "' for tag " + name);
    }
    const auto address = trim(modbus_address);
    if (address.size() < 2 || address.size() > 7 || !std::all_of(address.begin(), address.end(),
                                           [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument("Invalid Modbus address '" + modbus_address + "' for tag " + name);
    }

    PlcTag tag;
    tag.name = name;
    tag.type = *type;
    switch (address.front()) {
    case '0':
        tag.register_class = RegisterClass::Coil;
        break;
    case '1':
        tag.register_class = RegisterClass::DiscreteInput;
        break;
    case '3':
        tag.register_class = RegisterClass::InputRegister;
        break;
    case '4':
        tag.register_class = RegisterClass::HoldingRegister;
        break;
    default:
        throw std::invalid_argument("Unknown Modbus address class '" + address + "' for tag " + name);
    }
    const int number = std::stoi(address.substr(1));
    if (number < 1) {
        throw std::invalid_argument("Modbus address out of range '" + address + "' for tag " + name);
    }
    tag.offset = number - 1;
    if (is_bit_class(tag.register_class) && tag.type != PlcDataType::Bool) {
        throw std::invalid_argument("Tag " + name + " maps a 32-bit type onto a bit address");
    }
    return tag;
}

std::vector<PlcTag> load_plc_tag_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open PLC tag file: " + path.string());
    }

    std::string line;
    int name_col = -1;
    int type_col = -1;
    int address_col = -1;
    while (std::getline(file, line)) {
        const auto header = split_csv_line(line);
        for (std::size_t i = 0; i < header.size(); ++i) {
            if (header[i] == "Tag Name") {
                name_col = static_cast<int>(i);
            } else if (header[i] == "Data Type") {
                type_col = static_cast<int>(i);
            } else if (header[i] == "Modbus Start Address") {
                address_col = static_cast<int>(i);
            }
        }
        if (name_col >= 0) {
            break;
        }
    }
    if (name_col < 0 || type_col < 0 || address_col < 0) {
        throw std::runtime_error("PLC tag file " + path.string() +
                                 " lacks Tag Name / Data Type / Modbus Start Address columns");
    }

    std::vector<PlcTag> tags;
    const auto needed = static_cast<std::size_t>(std::max({name_col, type_col, address_col}));
    while (std::getline(file, line)) {
        if (trim(line).empty()) {
            continue;
        }
        const auto fields = split_csv_line(line);
        if (fields.size() <= needed) {
            continue;
        }
        const auto& name = fields[name_col];
        const auto& address = fields[address_col];
        if (name.empty() || address.empty() || !parse_data_type(fields[type_col])) {
            EVLOG_debug << "PLC tag file: skipping " << name << " (" << fields[type_col] << ")";
            continue;
        }
        tags.push_back(parse_plc_tag(name, fields[type_col], address));
    }
    EVLOG_info << "Loaded " << tags.size() << " PLC tags from " << path.string();
    return tags;
}

std::vector<ReadSpan> plan_reads(const std::vector<PlcTag>& tags) {
    std::vector<std::size_t> order(tags.size());
    for (std::size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        if (tags[a].register_class != tags[b].register_class) {
            return tags[a].register_class < tags[b].register_class;
        }
        return tags[a].offset < tags[b].offset;
    });

    std::vector<ReadSpan> spans;
    for (const auto idx : order) {
        const auto& tag = tags[idx];
        const int limit = is_bit_class(tag.register_class) ? kMaxBitsPerRead : kMaxRegistersPerRead;
        const int end = tag.offset + tag.width();
        if (!spans.empty()) {
            auto& span = spans.back();
            const bool same_class = span.register_class == tag.register_class;
            const bool contiguous = tag.offset <= span.start + span.count;
            if (same_class && contiguous && end - span.start <= limit) {
                span.count = std::max(span.count, end - span.start);
                span.tags.push_back(idx);
                continue;
            }
        }
        ReadSpan span;
        span.register_class = tag.register_class;
        span.start = tag.offset;
        span.count = tag.width();
        span.tags.push_back(idx);
        spans.push_back(std::move(span));
    }
    return spans;
}

void ProductivityPlcClient::ContextDeleter::operator()(modbus_t* ctx) const {
    modbus_close(ctx);
    modbus_free(ctx);
}

ProductivityPlcClient::ProductivityPlcClient(const PlcConfig& cfg)
    : ProductivityPlcClient(cfg, load_plc_tag_file(cfg.tag_file)) {}

ProductivityPlcClient::ProductivityPlcClient(const PlcConfig& cfg, std::vector<PlcTag> tags)
    : cfg_(cfg), tags_(std::move(tags)) {
    for (std::size_t i = 0; i < tags_.size(); ++i) {
        if (!index_.emplace(tags_[i].name, i).second) {
            throw std::runtime_error("Duplicate PLC tag name: " + tags_[i].name);
        }
    }
    spans_ = plan_reads(tags_);
}

ProductivityPlcClient::~ProductivityPlcClient() {
    std::lock_guard<std::mutex> lock(mtx_);
    close_session();
}

void ProductivityPlcClient::open_session() {
    std::unique_ptr<modbus_t, ContextDeleter> ctx(modbus_new_tcp(cfg_.ip.c_str(), cfg_.port));
    if (!ctx) {
        throw ConnectionError(kDevice, std::string("cannot create Modbus context: ") + modbus_strerror(errno));
    }
    modbus_set_slave(ctx.get(), cfg_.unit_id);
    const auto timeout_us = static_cast<std::uint64_t>(cfg_.timeout_s * 1e6);
    modbus_set_response_timeout(ctx.get(), static_cast<std::uint32_t>(timeout_us / 1000000),
                                static_cast<std::uint32_t>(timeout_us % 1000000));
    if (modbus_connect(ctx.get()) == -1) {
        const std::string reason = modbus_strerror(errno);
        throw ConnectionError(kDevice, cfg_.ip + ":" + std::to_string(cfg_.port) + ": " + reason);
    }
    ctx_ = std::move(ctx);
    EVLOG_info << "Modbus session open to " << cfg_.ip << ":" << cfg_.port;
}

void ProductivityPlcClient::close_session() {
    ctx_.reset();
}

void ProductivityPlcClient::fail(const std::string& operation, const std::string& tag) {
    const int err = errno;
    const std::string reason = modbus_strerror(err);
    if (err <= MODBUS_ENOBASE) {
        // Transport failure; reopen on next use.
        EVLOG_warning << "Modbus transport error during " << operation << ": " << reason;
        close_session();
    }
    throw HardwareError(kDevice, operation, tag, reason);
}

void ProductivityPlcClient::connect() {
    std::lock_guard<std::mutex> lock(mtx_);
    enabled_ = true;
    try {
        if (!ctx_) {
            open_session();
        }
        const auto values = read_all_locked();
        known_tags_.clear();
        for (const auto& entry : values) {
            known_tags_.insert(entry.first);
        }
    } catch (const HardwareError&) {
        enabled_ = false;
        close_session();
        throw;
    }
}

void ProductivityPlcClient::disconnect() {
    std::lock_guard<std::mutex> lock(mtx_);
    enabled_ = false;
    close_session();
}

bool ProductivityPlcClient::is_connected() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return enabled_ && ctx_ != nullptr;
}

std::map<std::string, Value> ProductivityPlcClient::read_all() {
    std::lock_guard<std::mutex> lock(mtx_);
    return read_all_locked();
}

std::map<std::string, Value> ProductivityPlcClient::read_all_locked() {
    if (!enabled_) {
        throw HardwareError(kDevice, "read", "", "not connected");
    }
    if (!ctx_) {
        open_session();
    }

    std::map<std::string, Value> values;
    for (const auto& span : spans_) {
        if (is_bit_class(span.register_class)) {
            std::vector<std::uint8_t> bits(static_cast<std::size_t>(span.count));
            const int rc = span.register_class == RegisterClass::Coil
                               ? modbus_read_bits(ctx_.get(), span.start, span.count, bits.data())
                               : modbus_read_input_bits(ctx_.get(), span.start, span.count, bits.data());
            if (rc == -1) {
                fail("read", tags_[span.tags.front()].name);
            }
            for (const auto idx : span.tags) {
                values[tags_[idx].name] = bits[tags_[idx].offset - span.start] != 0;
            }
            continue;
        }

        std::vector<std::uint16_t> regs(static_cast<std::size_t>(span.count));
        const int rc = span.register_class == RegisterClass::HoldingRegister
                           ? modbus_read_registers(ctx_.get(), span.start, span.count, regs.data())
                           : modbus_read_input_registers(ctx_.get(), span.start, span.count, regs.data());
        if (rc == -1) {
            fail("read", tags_[span.tags.front()].name);
        }
        for (const auto idx : span.tags) {
            const auto& tag = tags_[idx];
            const auto* base = regs.data() + (tag.offset - span.start);
            switch (tag.type) {
            case PlcDataType::Bool:
                values[tag.name] = base[0] != 0;
                break;
            case PlcDataType::Int32:
                values[tag.name] = static_cast<std::int64_t>(static_cast<std::int32_t>(combine_cdab(base)));
                break;
            case PlcDataType::Float32:
                values[tag.name] = static_cast<double>(modbus_get_float_cdab(base));
                break;
            }
        }
    }
    return values;
}

Value ProductivityPlcClient::read_tag(const std::string& address) {
    if (index_.count(address) == 0) {
        throw HardwareError(kDevice, "read", address, "tag not in PLC tag file");
    }
    // The PLC session only supports whole-table reads.
    auto values = read_all();
    return values.at(address);
}

void ProductivityPlcClient::write_tag(const std::string& address, const Value& value) {
    const auto it = index_.find(address);
    if (it == index_.end()) {
        throw HardwareError(kDevice, "write", address, "tag not in PLC tag file");
    }
    const auto& tag = tags_[it->second];
    if (tag.register_class == RegisterClass::DiscreteInput || tag.register_class == RegisterClass::InputRegister) {
        throw HardwareError(kDevice, "write", address, "read-only Modbus address");
    }

    std::uint16_t regs[2]{0, 0};
    bool bit = false;
    try {
        switch (tag.type) {
        case PlcDataType::Bool:
            bit = std::get<bool>(coerce(TagType::Bool, value));
            regs[0] = bit ? 1 : 0;
            break;
        case PlcDataType::Int32: {
            const auto v = std::get<std::int64_t>(coerce(TagType::Integer, value));
            if (v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max()) {
                throw std::invalid_argument("value " + std::to_string(v) + " exceeds 32-bit range");
            }
            const auto raw = static_cast<std::uint32_t>(static_cast<std::int32_t>(v));
            regs[0] = static_cast<std::uint16_t>(raw & 0xFFFF);
            regs[1] = static_cast<std::uint16_t>(raw >> 16);
            break;
        }
        case PlcDataType::Float32:
            modbus_set_float_cdab(static_cast<float>(std::get<double>(coerce(TagType::Float, value))), regs);
            break;
        }
    } catch (const std::invalid_argument& e) {
        throw HardwareError(kDevice, "write", address, e.what());
    }

    std::lock_guard<std::mutex> lock(mtx_);
    if (!enabled_) {
        throw HardwareError(kDevice, "write", address, "not connected");
    }
    if (!ctx_) {
        open_session();
    }
    int rc = 0;
    if (tag.register_class == RegisterClass::Coil) {
        rc = modbus_write_bit(ctx_.get(), tag.offset, bit ? 1 : 0);
    } else if (tag.type == PlcDataType::Bool) {
        rc = modbus_write_register(ctx_.get(), tag.offset, regs[0]);
    } else {
        rc = modbus_write_registers(ctx_.get(), tag.offset, 2, regs);
    }
    if (rc == -1) {
        fail("write", address);
    }
    EVLOG_debug << "PLC write " << address << "=" << to_string(value);
}

} // namespace coldspray
