#include "lumen/protocol/header.hpp"

namespace lumen::protocol {

namespace {

constexpr uint16_t kOriginMask = 0b1100'0000'0000'0000;
constexpr uint16_t kTaggedBit = 0b0010'0000'0000'0000;
constexpr uint16_t kAddressableBit = 0b0001'0000'0000'0000;
constexpr uint16_t kProtocolMask = 0b0000'1111'1111'1111;

constexpr uint8_t kAckRequiredBit = 0b0000'0010;
constexpr uint8_t kResRequiredBit = 0b0000'0001;

} // namespace

Header Header::make(uint16_t size, bool tagged, uint32_t source, uint64_t target,
                    bool ack_required, bool res_required, uint8_t sequence, uint16_t type) {
    Header h;
    h.size = size;
    h.tagged = tagged;
    h.source = source;
    h.target = target;
    h.ack_required = ack_required;
    h.res_required = res_required;
    h.sequence = sequence;
    h.type = type;
    return h;
}

void Header::encode(codec::Encoder &enc) const {
    // Frame
    enc.write_u16(size);
    uint16_t bits = static_cast<uint16_t>((origin & 0b11) << 14);
    if (tagged) {
        bits |= kTaggedBit;
    }
    if (addressable) {
        bits |= kAddressableBit;
    }
    enc.write_u16(static_cast<uint16_t>((protocol & kProtocolMask) | bits));
    enc.write_u32(source);

    // Frame address
    enc.write_u64(target);
    enc.write_zeros(6);
    uint8_t flags = 0;
    if (ack_required) {
        flags |= kAckRequiredBit;
    }
    if (res_required) {
        flags |= kResRequiredBit;
    }
    enc.write_u8(flags);
    enc.write_u8(sequence);

    // Protocol header
    enc.write_zeros(8);
    enc.write_u16(type);
    enc.write_zeros(2);
}

Header Header::decode(codec::Decoder &dec) {
    Header h;

    h.size = dec.read_u16();
    const uint16_t bits = dec.read_u16();
    h.origin = static_cast<uint8_t>((bits & kOriginMask) >> 14);
    h.tagged = (bits & kTaggedBit) != 0;
    h.addressable = (bits & kAddressableBit) != 0;
    h.protocol = bits & kProtocolMask;
    h.source = dec.read_u32();

    h.target = dec.read_u64();
    dec.skip(6);
    const uint8_t flags = dec.read_u8();
    h.ack_required = (flags & kAckRequiredBit) != 0;
    h.res_required = (flags & kResRequiredBit) != 0;
    h.sequence = dec.read_u8();

    dec.skip(8);
    h.type = dec.read_u16();
    dec.skip(2);

    return h;
}

} // namespace lumen::protocol
