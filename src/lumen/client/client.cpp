#include "lumen/client/client.hpp"

#include "lumen/error.hpp"
#include "lumen/net/udp_socket.hpp"

#include <array>
#include <cstdio>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>

namespace lumen::client {

namespace {

constexpr size_t kReceiveBufferSize = 1024;

// Order in which follow-up requests go out to each device on a discovery tick.
constexpr std::array<DiscoverOption, 7> kRequestOrder = {
    DiscoverOption::Label,    DiscoverOption::Power,        DiscoverOption::Location,
    DiscoverOption::Group,    DiscoverOption::HostInfo,     DiscoverOption::HostFirmware,
    DiscoverOption::WifiFirmware,
};

} // namespace

protocol::Payload discover_request(DiscoverOption option) {
    namespace device = protocol::device;
    switch (option) {
    case DiscoverOption::Label:
        return device::GetLabel{};
    case DiscoverOption::Power:
        return device::GetPower{};
    case DiscoverOption::Location:
        return device::GetLocation{};
    case DiscoverOption::Group:
        return device::GetGroup{};
    case DiscoverOption::HostInfo:
        return device::GetHostInfo{};
    case DiscoverOption::HostFirmware:
        return device::GetHostFirmware{};
    case DiscoverOption::WifiFirmware:
        return device::GetWifiFirmware{};
    default:
        throw std::invalid_argument("discover option must be a single flag, got " +
                                    std::to_string(static_cast<uint32_t>(option)));
    }
}

namespace {

/// Holds broadcast mode on for its lifetime. The send lock must already be held.
class BroadcastScope {
  public:
    explicit BroadcastScope(net::DatagramSocket &socket) : socket_(socket) {
        socket_.set_broadcast(true);
    }

    ~BroadcastScope() {
        try {
            socket_.set_broadcast(false);
        } catch (const SocketError &e) {
            std::fprintf(stderr, "[Lumen] Failed to leave broadcast mode: %s\n", e.what());
        }
    }

    BroadcastScope(const BroadcastScope &) = delete;
    BroadcastScope &operator=(const BroadcastScope &) = delete;

  private:
    net::DatagramSocket &socket_;
};

std::shared_ptr<net::DatagramSocket> bind_socket(const ClientConfig &config) {
    return net::UdpSocket::bind(config.bind, config.read_timeout, config.write_timeout);
}

} // namespace

Client::Client(const ClientConfig &config) : Client(bind_socket(config), config) {}

Client::Client(std::shared_ptr<net::DatagramSocket> socket, const ClientConfig &config)
    : config_(config), socket_(std::move(socket)) {
    if (!socket_) {
        throw BindError("client requires a socket");
    }
}

Client::~Client() {
    close();
    // Only the calling thread can be left, when the last owner drops the client from
    // inside its own message callback.
    std::lock_guard lock(threads_mutex_);
    for (auto &t : threads_) {
        if (t.joinable()) {
            t.detach();
        }
    }
}

void Client::set_message_callback(MessageCallback callback) { on_message_ = std::move(callback); }

void Client::listen() {
    if (is_closed()) {
        std::fprintf(stderr, "[Lumen] listen() on a closed client ignored\n");
        return;
    }
    if (listening_.exchange(true)) {
        return;
    }
    spawn([this] { receive_loop(); });
}

void Client::discover(std::chrono::milliseconds interval, DiscoverOption options) {
    if (is_closed()) {
        std::fprintf(stderr, "[Lumen] discover() on a closed client ignored\n");
        return;
    }
    spawn([this, interval, options] { discover_loop(interval, options); });
}

void Client::discover() { discover(config_.discover_interval, config_.discover_options); }

uint8_t Client::send_msg(const net::Endpoint &to, protocol::Payload payload, bool ack_required,
                         uint64_t target) {
    std::lock_guard lock(send_mutex_);
    return send_locked(to, std::move(payload), ack_required, target);
}

uint8_t Client::send_to_device(uint64_t target, protocol::Payload payload, bool ack_required) {
    const auto bulb = directory_.find(target);
    if (!bulb.has_value()) {
        throw SendError("unknown device " + data::format_target(target));
    }
    return send_msg(bulb->endpoint, std::move(payload), ack_required, target);
}

uint8_t Client::get_services() {
    std::lock_guard lock(send_mutex_);
    try {
        BroadcastScope scope(*socket_);
        return send_locked(config_.broadcast, protocol::device::GetService{}, false, 0);
    } catch (const SocketError &e) {
        throw SendError(std::string("broadcast failed: ") + e.what());
    }
}

void Client::close() {
    {
        std::lock_guard lock(wait_mutex_);
        closed_.store(true, std::memory_order_seq_cst);
    }
    wait_cv_.notify_all();

    // A close() from the message callback runs on the receive thread. That thread
    // stays in threads_ so a later close() or the destructor joins it.
    std::vector<std::thread> others;
    {
        std::lock_guard lock(threads_mutex_);
        std::vector<std::thread> self;
        for (auto &t : threads_) {
            if (t.get_id() == std::this_thread::get_id()) {
                self.push_back(std::move(t));
            } else {
                others.push_back(std::move(t));
            }
        }
        threads_ = std::move(self);
    }
    for (auto &t : others) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void Client::spawn(std::function<void()> task) {
    std::lock_guard lock(threads_mutex_);
    threads_.emplace_back(std::move(task));
}

uint8_t Client::send_locked(const net::Endpoint &to, protocol::Payload payload,
                            bool ack_required, uint64_t target) {
    const uint8_t sequence = sequence_.next();
    const protocol::Message message(std::move(payload), ack_required, target, sequence,
                                    config_.source);
    const auto bytes = message.encode();

    size_t written = 0;
    try {
        written = socket_->send_to(bytes, to);
    } catch (const SocketError &e) {
        throw SendError(e.what());
    }
    if (written != bytes.size()) {
        throw SendError("wrong number of bytes written to " + to.to_string() + ": " +
                        std::to_string(written) + " of " + std::to_string(bytes.size()));
    }

    if (config_.log_traffic) {
        std::printf("[Lumen] -> %s seq=%u %s\n", to.to_string().c_str(),
                    static_cast<unsigned>(sequence), protocol::describe(message.payload()).c_str());
    }
    return sequence;
}

bool Client::wait_for_close(std::chrono::milliseconds timeout) {
    std::unique_lock lock(wait_mutex_);
    return wait_cv_.wait_for(lock, timeout, [this] { return is_closed(); });
}

void Client::receive_loop() {
    std::array<uint8_t, kReceiveBufferSize> buffer{};

    while (!is_closed()) {
        std::optional<net::Datagram> datagram;
        try {
            datagram = socket_->recv_from(buffer);
        } catch (const SocketError &e) {
            std::fprintf(stderr, "[Lumen] Receive failed: %s\n", e.what());
            wait_for_close(config_.read_timeout);
            continue;
        }
        if (!datagram.has_value()) {
            continue; // timeout: re-check the closed flag
        }

        try {
            const auto message =
                protocol::Message::decode(std::span<const uint8_t>(buffer.data(), datagram->size));
            handle_message(message, datagram->from);
        } catch (const UnrecognizedMessage &e) {
            if (config_.log_traffic) {
                std::printf("[Lumen] <- %s ignored: %s\n", datagram->from.to_string().c_str(),
                            e.what());
            }
        } catch (const DecodeError &e) {
            std::fprintf(stderr, "[Lumen] Dropped datagram from %s: %s\n",
                         datagram->from.to_string().c_str(), e.what());
        }
    }
}

void Client::handle_message(const protocol::Message &message, const net::Endpoint &from) {
    if (config_.log_traffic) {
        std::printf("[Lumen] <- %s seq=%u %s\n", from.to_string().c_str(),
                    static_cast<unsigned>(message.header().sequence),
                    protocol::describe(message.payload()).c_str());
    }

    const bool registered = message.payload().is<protocol::device::StateService>() &&
                            !directory_.find(message.target()).has_value();
    if (directory_.apply(message, from) && registered) {
        const auto bulb = directory_.find(message.target());
        if (bulb.has_value()) {
            std::printf("[Lumen] Discovered %s\n", bulb->to_string().c_str());
        }
    }

    if (on_message_) {
        try {
            on_message_(message, from);
        } catch (const std::exception &e) {
            std::fprintf(stderr, "[Lumen] Message callback failed: %s\n", e.what());
        }
    }
}

void Client::discover_loop(std::chrono::milliseconds interval, DiscoverOption options) {
    while (!is_closed()) {
        try {
            get_services();
        } catch (const Error &e) {
            std::fprintf(stderr, "[Lumen] Discovery broadcast failed: %s\n", e.what());
        }

        if (options != DiscoverOption::None) {
            for (const auto &[target, bulb] : directory_.snapshot()) {
                if (is_closed()) {
                    return;
                }
                request_state(bulb, options);
            }
        }

        if (wait_for_close(interval)) {
            return;
        }
    }
}

void Client::request_state(const data::Bulb &bulb, DiscoverOption options) {
    for (const auto option : kRequestOrder) {
        if (!has_option(options, option)) {
            continue;
        }
        try {
            send_msg(bulb.endpoint, discover_request(option), false, bulb.target);
        } catch (const Error &e) {
            std::fprintf(stderr, "[Lumen] %s request to %s failed: %s\n",
                         discover_option_name(option), bulb.to_string().c_str(), e.what());
        }
        if (wait_for_close(config_.request_delay)) {
            return;
        }
    }
}

} // namespace lumen::client
