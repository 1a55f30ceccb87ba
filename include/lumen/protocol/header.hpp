#pragma once

#include "lumen/codec/byte_codec.hpp"

#include <cstdint>

namespace lumen::protocol {

/// LIFX frame, frame address and protocol header: 36 bytes, little-endian.
///
/// Layout:
///   [0:2)   size
///   [2:4)   protocol(12) | addressable<<12 | tagged<<13 | origin<<14
///   [4:8)   source
///   [8:16)  target (0 = all devices)
///   [16:22) reserved
///   [22]    ack_required<<1 | res_required
///   [23]    sequence
///   [24:32) reserved
///   [32:34) type
///   [34:36) reserved
struct Header {
    static constexpr uint16_t kSize = 36;
    static constexpr uint16_t kProtocol = 1024;

    uint16_t size = 0;
    uint8_t origin = 0;
    bool tagged = true;
    bool addressable = true;
    uint16_t protocol = kProtocol;
    uint32_t source = 0;
    uint64_t target = 0;
    bool ack_required = true;
    bool res_required = true;
    uint8_t sequence = 0;
    uint16_t type = 0;

    /// Header with origin 0, addressable set and the standard protocol number.
    static Header make(uint16_t size, bool tagged, uint32_t source, uint64_t target,
                       bool ack_required, bool res_required, uint8_t sequence, uint16_t type);

    void encode(codec::Encoder &enc) const;
    static Header decode(codec::Decoder &dec);

    bool operator==(const Header &) const = default;
};

} // namespace lumen::protocol
