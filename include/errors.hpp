// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace coldspray {

class UnknownTagError : public std::runtime_error {
public:
    explicit UnknownTagError(const std::string& tag) : std::runtime_error("Unknown tag: " + tag), tag_(tag) {}

    const std::string& tag() const { return tag_; }

private:
    std::string tag_;
};

class ValidationError : public std::runtime_error {
public:
    ValidationError(const std::string& tag, const std::string& message)
        : std::runtime_error("Invalid value for " + tag + ": " + message), tag_(tag) {}

    const std::string& tag() const { return tag_; }

private:
    std::string tag_;
};

class TagNotCachedError : public std::runtime_error {
public:
    explicit TagNotCachedError(const std::string& tag)
        : std::runtime_error("Tag not in cache: " + tag), tag_(tag) {}

    const std::string& tag() const { return tag_; }

private:
    std::string tag_;
};

// Transport-level failure talking to the PLC ("plc") or the feeder controller ("feeder").
class HardwareError : public std::runtime_error {
public:
    HardwareError(std::string device, std::string operation, std::string tag, const std::string& detail)
        : std::runtime_error(format(device, operation, tag, detail)),
          device_(std::move(device)),
          operation_(std::move(operation)),
          tag_(std::move(tag)) {}

    const std::string& device() const { return device_; }
    const std::string& operation() const { return operation_; }
    const std::string& tag() const { return tag_; }

private:
    static std::string format(const std::string& device, const std::string& operation, const std::string& tag,
                              const std::string& detail) {
        std::string msg = device + " " + operation + " failed";
        if (!tag.empty()) {
            msg += " (" + tag + ")";
        }
        if (!detail.empty()) {
            msg += ": " + detail;
        }
        return msg;
    }

    std::string device_;
    std::string operation_;
    std::string tag_;
};

class ConnectionError : public HardwareError {
public:
    ConnectionError(std::string device, const std::string& detail)
        : HardwareError(std::move(device), "connect", "", detail) {}
};

class QueueFullError : public HardwareError {
public:
    QueueFullError(std::string device, std::string tag, std::size_t capacity)
        : HardwareError(std::move(device), "enqueue", std::move(tag),
                        "command queue full (capacity " + std::to_string(capacity) + ")") {}
};

} // namespace coldspray
