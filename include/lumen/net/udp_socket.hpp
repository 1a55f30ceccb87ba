#pragma once

#include "lumen/net/datagram_socket.hpp"

#include <atomic>
#include <chrono>
#include <memory>

namespace lumen::net {

/// POSIX IPv4 UDP socket. The descriptor is closed on destruction.
class UdpSocket : public DatagramSocket {
    // Restricts construction to bind().
    struct Passkey {
        explicit Passkey() = default;
    };

  public:
    /// Creates a socket bound to local with SO_RCVTIMEO / SO_SNDTIMEO set.
    /// Throws BindError.
    static std::unique_ptr<UdpSocket> bind(const Endpoint &local,
                                           std::chrono::milliseconds read_timeout,
                                           std::chrono::milliseconds write_timeout);

    UdpSocket(Passkey, int fd) : fd_(fd) {}
    ~UdpSocket() override;

    UdpSocket(const UdpSocket &) = delete;
    UdpSocket &operator=(const UdpSocket &) = delete;

    size_t send_to(std::span<const uint8_t> bytes, const Endpoint &to) override;
    std::optional<Datagram> recv_from(std::span<uint8_t> buffer) override;
    void set_broadcast(bool enabled) override;
    [[nodiscard]] bool broadcast() const override {
        return broadcast_.load(std::memory_order_relaxed);
    }

    /// Address actually bound (port resolved when binding to port 0).
    [[nodiscard]] Endpoint local_endpoint() const;

  private:
    int fd_ = -1;
    std::atomic<bool> broadcast_{false};
};

} // namespace lumen::net
