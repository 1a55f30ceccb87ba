#pragma once

#include "lumen/net/endpoint.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace lumen::net {

struct Datagram {
    size_t size = 0;
    Endpoint from;
};

/// Connectionless datagram transport shared by the receive and discovery threads.
/// Implementations must allow send_to and recv_from to run concurrently.
class DatagramSocket {
  public:
    virtual ~DatagramSocket() = default;

    /// Returns the number of bytes written. Throws SocketError.
    virtual size_t send_to(std::span<const uint8_t> bytes, const Endpoint &to) = 0;

    /// Blocks for at most the read timeout. Returns nullopt on timeout.
    /// Throws SocketError on any other failure.
    virtual std::optional<Datagram> recv_from(std::span<uint8_t> buffer) = 0;

    /// Throws SocketError.
    virtual void set_broadcast(bool enabled) = 0;
    [[nodiscard]] virtual bool broadcast() const = 0;
};

} // namespace lumen::net
