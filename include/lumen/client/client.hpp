#pragma once

#include "lumen/client/config.hpp"
#include "lumen/data/device_directory.hpp"
#include "lumen/net/datagram_socket.hpp"
#include "lumen/protocol/message.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace lumen::client {

/// The Get* request a discovery tick sends for one option flag.
/// Throws std::invalid_argument unless exactly one flag is set.
protocol::Payload discover_request(DiscoverOption option);

/// LIFX LAN session over one bound UDP socket.
///
/// listen() runs a receive thread that decodes every inbound datagram and folds it
/// into the device directory. discover() runs a thread that periodically broadcasts
/// GetService and asks each known device for the state selected by its options.
/// Both threads are owned by the client and joined by close(), which the destructor
/// calls. Shutdown latency is bounded by the socket read timeout.
class Client {
  public:
    using MessageCallback =
        std::function<void(const protocol::Message &message, const net::Endpoint &from)>;

    /// Binds a UDP socket to config.bind. Throws BindError.
    explicit Client(const ClientConfig &config = {});

    /// Uses an already-open transport.
    explicit Client(std::shared_ptr<net::DatagramSocket> socket, const ClientConfig &config = {});

    ~Client();

    Client(const Client &) = delete;
    Client &operator=(const Client &) = delete;

    /// Start the receive thread. Calling it again while running has no effect.
    void listen();

    /// Start a discovery thread ticking every interval.
    void discover(std::chrono::milliseconds interval, DiscoverOption options);

    /// Discovery with the configured interval and options.
    void discover();

    /// Encode and send one message. Returns the sequence number it carried.
    /// Throws SendError on transport failure or short write, EncodeError if the
    /// payload has no wire representation.
    uint8_t send_msg(const net::Endpoint &to, protocol::Payload payload, bool ack_required,
                     uint64_t target);

    /// send_msg to a directory entry. Throws SendError if the target is unknown.
    uint8_t send_to_device(uint64_t target, protocol::Payload payload, bool ack_required = false);

    /// Broadcast one untargeted GetService.
    uint8_t get_services();

    [[nodiscard]] data::DeviceMap devices() const { return directory_.snapshot(); }
    [[nodiscard]] std::optional<data::Bulb> device(uint64_t target) const {
        return directory_.find(target);
    }

    /// Invoked on the receive thread for every decoded message, after the directory
    /// was updated. Set before listen().
    void set_message_callback(MessageCallback callback);

    void close();
    [[nodiscard]] bool is_closed() const { return closed_.load(std::memory_order_seq_cst); }

    [[nodiscard]] const ClientConfig &config() const { return config_; }

  private:
    void receive_loop();
    void discover_loop(std::chrono::milliseconds interval, DiscoverOption options);
    void request_state(const data::Bulb &bulb, DiscoverOption options);
    void handle_message(const protocol::Message &message, const net::Endpoint &from);

    /// Caller holds send_mutex_.
    uint8_t send_locked(const net::Endpoint &to, protocol::Payload payload, bool ack_required,
                        uint64_t target);

    /// Sleeps for timeout or until close(). Returns true if the client closed.
    bool wait_for_close(std::chrono::milliseconds timeout);

    void spawn(std::function<void()> task);

    ClientConfig config_;
    std::shared_ptr<net::DatagramSocket> socket_;
    data::DeviceDirectory directory_;
    protocol::SequenceCounter sequence_;
    MessageCallback on_message_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> listening_{false};

    // Every send takes this lock; broadcast discovery holds it across
    // enable-broadcast, send and disable-broadcast.
    std::mutex send_mutex_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    std::mutex threads_mutex_;
    std::vector<std::thread> threads_;
};

} // namespace lumen::client
