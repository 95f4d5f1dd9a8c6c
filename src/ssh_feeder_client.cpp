// SPDX-License-Identifier: Apache-2.0
#include "ssh_feeder_client.hpp"

#include "errors.hpp"
#include "value_codec.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

#include <everest/logging.hpp>

namespace coldspray {

namespace {
const char* kDevice = "feeder";
constexpr auto kWriteDrain = std::chrono::milliseconds(200);

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n>");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool contains_error(const std::string& response) {
    std::string lower(response.size(), '\0');
    std::transform(response.begin(), response.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find("error") != std::string::npos;
}

void sleep_seconds(double seconds) {
    if (seconds > 0.0) {
        std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
    }
}

std::chrono::milliseconds to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

// Looks for a complete "address=value" line in the accumulated response.
std::optional<std::string> find_assignment(const std::string& buffer, const std::string& address) {
    const std::string prefix = address + "=";
    std::size_t line_start = 0;
    while (line_start < buffer.size()) {
        const auto line_end = buffer.find_first_of("\r\n", line_start);
        if (line_end == std::string::npos) {
            break;
        }
        const auto line = trim(buffer.substr(line_start, line_end - line_start));
        if (line.compare(0, prefix.size(), prefix) == 0) {
            return line.substr(prefix.size());
        }
        line_start = line_end + 1;
    }
    return std::nullopt;
}

std::string format_command_value(const Value& value) {
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? "1" : "0";
    }
    return to_string(value);
}
} // namespace

Value parse_feeder_value(const std::string& payload) {
    const auto text = trim(payload);
    if (text.empty()) {
        throw std::invalid_argument("empty feeder response");
    }
    return text.find('.') != std::string::npos ? coerce(TagType::Float, text) : coerce(TagType::Integer, text);
}

// ---- LibsshChannel ----

LibsshChannel::LibsshChannel(const SshConfig& cfg) : cfg_(cfg) {}

LibsshChannel::~LibsshChannel() {
    close();
}

void LibsshChannel::raise(const std::string& what) {
    const std::string reason = session_ ? ssh_get_error(session_) : "no session";
    throw std::runtime_error(what + ": " + reason);
}

void LibsshChannel::open() {
    close();
    session_ = ssh_new();
    if (!session_) {
        throw std::runtime_error("ssh_new failed");
    }
    unsigned int port = static_cast<unsigned int>(cfg_.port);
    long timeout_s = std::max(1L, static_cast<long>(cfg_.timeout_s));
    ssh_options_set(session_, SSH_OPTIONS_HOST, cfg_.host.c_str());
    ssh_options_set(session_, SSH_OPTIONS_PORT, &port);
    ssh_options_set(session_, SSH_OPTIONS_USER, cfg_.username.c_str());
    ssh_options_set(session_, SSH_OPTIONS_TIMEOUT, &timeout_s);

    if (ssh_connect(session_) != SSH_OK) {
        raise("connect to " + cfg_.host);
    }
    const auto known = ssh_session_is_known_server(session_);
    if (known == SSH_KNOWN_HOSTS_CHANGED || known == SSH_KNOWN_HOSTS_OTHER) {
        throw std::runtime_error("host key for " + cfg_.host + " does not match known_hosts");
    }
    if (known != SSH_KNOWN_HOSTS_OK) {
        EVLOG_warning << "Accepting unverified host key for feeder controller " << cfg_.host;
    }
    if (ssh_userauth_password(session_, nullptr, cfg_.password.c_str()) != SSH_AUTH_SUCCESS) {
        raise("password authentication as " + cfg_.username);
    }

    channel_ = ssh_channel_new(session_);
    if (!channel_) {
        raise("channel allocation");
    }
    if (ssh_channel_open_session(channel_) != SSH_OK) {
        raise("open session channel");
    }
    if (ssh_channel_request_pty(channel_) != SSH_OK) {
        raise("request pty");
    }
    if (ssh_channel_request_shell(channel_) != SSH_OK) {
        raise("request shell");
    }
}

void LibsshChannel::close() {
    if (channel_) {
        if (ssh_channel_is_open(channel_)) {
            ssh_channel_close(channel_);
        }
        ssh_channel_free(channel_);
        channel_ = nullptr;
    }
    if (session_) {
        ssh_disconnect(session_);
        ssh_free(session_);
        session_ = nullptr;
    }
}

void LibsshChannel::write(const std::string& data) {
    if (!is_open()) {
        throw std::runtime_error("shell channel is closed");
    }
    const int rc = ssh_channel_write(channel_, data.data(), static_cast<std::uint32_t>(data.size()));
    if (rc == SSH_ERROR || rc != static_cast<int>(data.size())) {
        raise("channel write");
    }
}

std::string LibsshChannel::read_available(std::chrono::milliseconds timeout, std::size_t max_bytes) {
    if (!is_open()) {
        throw std::runtime_error("shell channel is closed");
    }
    std::vector<char> buf(max_bytes);
    std::string out;
    int n = ssh_channel_read_timeout(channel_, buf.data(), static_cast<std::uint32_t>(buf.size()), 0,
                                     static_cast<int>(timeout.count()));
    if (n == SSH_ERROR) {
        raise("channel read");
    }
    out.append(buf.data(), static_cast<std::size_t>(std::max(n, 0)));
    while (out.size() < max_bytes) {
        const int avail = ssh_channel_poll(channel_, 0);
        if (avail <= 0) {
            break;
        }
        const auto want = std::min<std::size_t>(static_cast<std::size_t>(avail), max_bytes - out.size());
        n = ssh_channel_read_nonblocking(channel_, buf.data(), static_cast<std::uint32_t>(want), 0);
        if (n == SSH_ERROR) {
            raise("channel read");
        }
        if (n <= 0) {
            break;
        }
        out.append(buf.data(), static_cast<std::size_t>(n));
    }
    return out;
}

bool LibsshChannel::is_open() const {
    return channel_ != nullptr && ssh_channel_is_open(channel_) != 0 && ssh_channel_is_eof(channel_) == 0;
}

// ---- SshFeederClient ----

class SshFeederClient::CommandSlot {
public:
    CommandSlot(SshFeederClient& client, const std::string& tag) : client_(client), ticket_(client.take_ticket(tag)) {
        client_.wait_turn(ticket_);
    }
    ~CommandSlot() { client_.release_ticket(ticket_); }

    CommandSlot(const CommandSlot&) = delete;
    CommandSlot& operator=(const CommandSlot&) = delete;

private:
    SshFeederClient& client_;
    std::uint64_t ticket_;
};

SshFeederClient::SshFeederClient(const SshConfig& cfg)
    : SshFeederClient(cfg, std::make_unique<LibsshChannel>(cfg)) {}

SshFeederClient::SshFeederClient(const SshConfig& cfg, std::unique_ptr<ShellChannel> channel)
    : cfg_(cfg), channel_(std::move(channel)) {
    if (!channel_) {
        throw std::invalid_argument("SshFeederClient requires a shell channel");
    }
}

SshFeederClient::~SshFeederClient() {
    std::lock_guard<std::mutex> lock(io_mtx_);
    connected_ = false;
    channel_->close();
}

std::uint64_t SshFeederClient::take_ticket(const std::string& tag) {
    std::lock_guard<std::mutex> lock(queue_mtx_);
    if (queue_.size() >= cfg_.queue_capacity) {
        throw QueueFullError(kDevice, tag, cfg_.queue_capacity);
    }
    const auto ticket = next_ticket_++;
    queue_.push_back(ticket);
    return ticket;
}

void SshFeederClient::wait_turn(std::uint64_t ticket) {
    std::unique_lock<std::mutex> lock(queue_mtx_);
    queue_cv_.wait(lock, [&] { return !queue_.empty() && queue_.front() == ticket; });
}

void SshFeederClient::release_ticket(std::uint64_t ticket) {
    {
        std::lock_guard<std::mutex> lock(queue_mtx_);
        const auto it = std::find(queue_.begin(), queue_.end(), ticket);
        if (it != queue_.end()) {
            queue_.erase(it);
        }
    }
    queue_cv_.notify_all();
}

std::size_t SshFeederClient::pending_commands() const {
    std::lock_guard<std::mutex> lock(queue_mtx_);
    return queue_.size();
}

bool SshFeederClient::enable_line_mode() {
    channel_->write("gpascii -2\r\n");
    sleep_seconds(cfg_.handshake_delay_s);
    const auto response = channel_->read_available(to_ms(cfg_.command_timeout_s), cfg_.read_buffer_bytes);
    return !contains_error(response);
}

void SshFeederClient::handshake() {
    if (!enable_line_mode()) {
        EVLOG_warning << "Feeder controller rejected gpascii; retrying in " << cfg_.boot_retry_delay_s << " s";
        sleep_seconds(cfg_.boot_retry_delay_s);
        if (!enable_line_mode()) {
            throw std::runtime_error("gpascii line mode unavailable");
        }
    }
    channel_->write("echo1\n\r");
    const auto echo = channel_->read_available(to_ms(cfg_.command_timeout_s), cfg_.read_buffer_bytes);
    EVLOG_debug << "Feeder echo test: " << trim(echo);
}

void SshFeederClient::connect() {
    std::lock_guard<std::mutex> lock(io_mtx_);
    if (connected_) {
        return;
    }
    std::string last_error;
    for (int attempt = 1; attempt <= cfg_.retry.max_attempts; ++attempt) {
        try {
            channel_->open();
            handshake();
            connected_ = true;
            EVLOG_info << "Feeder controller connected at " << cfg_.host << ":" << cfg_.port;
            return;
        } catch (const std::exception& e) {
            last_error = e.what();
            EVLOG_warning << "Feeder connect attempt " << attempt << "/" << cfg_.retry.max_attempts
                          << " failed: " << last_error;
            channel_->close();
        }
        if (attempt < cfg_.retry.max_attempts) {
            sleep_seconds(cfg_.retry.delay_s);
        }
    }
    throw ConnectionError(kDevice, "giving up after " + std::to_string(cfg_.retry.max_attempts) +
                                       " attempts: " + last_error);
}

void SshFeederClient::disconnect() {
    std::lock_guard<std::mutex> lock(io_mtx_);
    connected_ = false;
    channel_->close();
    EVLOG_info << "Feeder controller disconnected";
}

bool SshFeederClient::is_connected() const {
    return connected_;
}

Value SshFeederClient::read_tag(const std::string& address) {
    CommandSlot slot(*this, address);
    std::lock_guard<std::mutex> lock(io_mtx_);
    if (!connected_) {
        throw HardwareError(kDevice, "read", address, "not connected");
    }

    std::string buffer;
    try {
        channel_->write(address + "\n");
        const auto deadline = std::chrono::steady_clock::now() + to_ms(cfg_.command_timeout_s);
        while (true) {
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                break;
            }
            buffer += channel_->read_available(remaining, cfg_.read_buffer_bytes);
            if (contains_error(buffer)) {
                throw HardwareError(kDevice, "read", address, trim(buffer));
            }
            if (const auto payload = find_assignment(buffer, address)) {
                return parse_feeder_value(*payload);
            }
        }
    } catch (const std::invalid_argument& e) {
        throw HardwareError(kDevice, "read", address, e.what());
    } catch (const HardwareError&) {
        throw;
    } catch (const std::runtime_error& e) {
        connected_ = false;
        channel_->close();
        throw HardwareError(kDevice, "read", address, e.what());
    }
    throw HardwareError(kDevice, "read", address, "no response within command timeout");
}

void SshFeederClient::write_tag(const std::string& address, const Value& value) {
    CommandSlot slot(*this, address);
    std::lock_guard<std::mutex> lock(io_mtx_);
    if (!connected_) {
        throw HardwareError(kDevice, "write", address, "not connected");
    }

    std::string response;
    try {
        channel_->write(address + "=" + format_command_value(value) + "\n");
        response = channel_->read_available(std::min(kWriteDrain, to_ms(cfg_.command_timeout_s)),
                                            cfg_.read_buffer_bytes);
    } catch (const std::runtime_error& e) {
        connected_ = false;
        channel_->close();
        throw HardwareError(kDevice, "write", address, e.what());
    }
    if (contains_error(response)) {
        throw HardwareError(kDevice, "write", address, trim(response));
    }
    EVLOG_debug << "Feeder write " << address << "=" << format_command_value(value);
}

} // namespace coldspray
