#pragma once

#include "lumen/protocol/header.hpp"
#include "lumen/protocol/payload.hpp"

#include <atomic>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace lumen::protocol {

/// Source identifier stamped on outgoing headers unless configured otherwise.
inline constexpr uint32_t kDefaultSource = 1014;

/// A header coupled with its payload.
class Message {
  public:
    /// Derives size, type, tagged and res_required from the payload.
    Message(Payload payload, bool ack_required, uint64_t target, uint8_t sequence,
            uint32_t source = kDefaultSource);

    Message(Header header, Payload payload);

    [[nodiscard]] const Header &header() const { return header_; }
    [[nodiscard]] const Payload &payload() const { return payload_; }
    [[nodiscard]] uint64_t target() const { return header_.target; }

    /// Consumes the message, yielding (payload, target).
    std::pair<Payload, uint64_t> unpack() &&;

    /// Header then payload, no separator.
    [[nodiscard]] std::vector<uint8_t> encode() const;

    /// Decodes one datagram. The body is [36, header.size) and is decoded with the
    /// header's type code. Throws DecodeError (or UnrecognizedMessage).
    static Message decode(std::span<const uint8_t> bytes);

  private:
    Header header_;
    Payload payload_;
};

/// Wrapping 8-bit message sequence counter shared by every send path of a client.
class SequenceCounter {
  public:
    /// Returns 0, 1, ..., 255, 0, ...
    uint8_t next() { return value_.fetch_add(1, std::memory_order_seq_cst); }

    void reset() { value_.store(0, std::memory_order_seq_cst); }

  private:
    std::atomic<uint8_t> value_{0};
};

} // namespace lumen::protocol
