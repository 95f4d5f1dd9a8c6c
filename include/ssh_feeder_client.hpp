// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "app_config.hpp"
#include "hardware_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include <libssh/libssh.h>

namespace coldspray {

// Interactive byte stream to the feeder controller's command shell.
class ShellChannel {
public:
    virtual ~ShellChannel() = default;

    virtual void open() = 0;
    virtual void close() = 0;
    virtual void write(const std::string& data) = 0;
    // Returns whatever arrives within timeout (possibly empty), at most max_bytes.
    virtual std::string read_available(std::chrono::milliseconds timeout, std::size_t max_bytes) = 0;
    virtual bool is_open() const = 0;
};

// Password-authenticated shell over libssh with a pty.
class LibsshChannel : public ShellChannel {
public:
    explicit LibsshChannel(const SshConfig& cfg);
    ~LibsshChannel() override;

    LibsshChannel(const LibsshChannel&) = delete;
    LibsshChannel& operator=(const LibsshChannel&) = delete;

    void open() override;
    void close() override;
    void write(const std::string& data) override;
    std::string read_available(std::chrono::milliseconds timeout, std::size_t max_bytes) override;
    bool is_open() const override;

private:
    [[noreturn]] void raise(const std::string& what);

    SshConfig cfg_;
    ssh_session session_{nullptr};
    ssh_channel channel_{nullptr};
};

// Feeder controller reached through gpascii on an SSH shell. P-variables are written as
// "P6=1200\n" and read back as "P6\n" -> "P6=1200". One command is in flight at a time;
// waiting commands queue in FIFO order up to ssh.queueCapacity.
class SshFeederClient : public HardwareClient {
public:
    explicit SshFeederClient(const SshConfig& cfg);
    SshFeederClient(const SshConfig& cfg, std::unique_ptr<ShellChannel> channel);
    ~SshFeederClient() override;

    void connect() override;
    void disconnect() override;
    Value read_tag(const std::string& address) override;
    void write_tag(const std::string& address, const Value& value) override;
    bool is_connected() const override;

    std::size_t pending_commands() const;

private:
    class CommandSlot;

    void handshake();
    bool enable_line_mode();
    std::string exchange(const std::string& command, std::chrono::milliseconds timeout);

    std::uint64_t take_ticket(const std::string& tag);
    void wait_turn(std::uint64_t ticket);
    void release_ticket(std::uint64_t ticket);

    SshConfig cfg_;
    std::unique_ptr<ShellChannel> channel_;
    std::atomic<bool> connected_{false};

    std::mutex io_mtx_;
    mutable std::mutex queue_mtx_;
    std::condition_variable queue_cv_;
    std::deque<std::uint64_t> queue_;
    std::uint64_t next_ticket_{0};
};

// Parses a feeder payload: integer, or double when it contains '.'.
Value parse_feeder_value(const std::string& payload);

} // namespace coldspray
