#include "lumen/protocol/message.hpp"

#include "lumen/error.hpp"

#include <string>

namespace lumen::protocol {

Message::Message(Payload payload, bool ack_required, uint64_t target, uint8_t sequence,
                 uint32_t source)
    : header_(Header::make(static_cast<uint16_t>(payload.wire_size() + Header::kSize),
                           payload.is_tagged(), source, target, ack_required,
                           payload.requires_response(), sequence, payload.type_code())),
      payload_(std::move(payload)) {}

Message::Message(Header header, Payload payload)
    : header_(header), payload_(std::move(payload)) {}

std::pair<Payload, uint64_t> Message::unpack() && {
    return {std::move(payload_), header_.target};
}

std::vector<uint8_t> Message::encode() const {
    codec::Encoder enc(header_.size);
    header_.encode(enc);
    payload_.encode(enc);
    return enc.take();
}

Message Message::decode(std::span<const uint8_t> bytes) {
    codec::Decoder header_dec(bytes);
    const Header header = Header::decode(header_dec);

    if (header.size < Header::kSize || header.size > bytes.size()) {
        throw DecodeError("header size " + std::to_string(header.size) +
                          " inconsistent with datagram of " + std::to_string(bytes.size()) +
                          " bytes");
    }

    codec::Decoder body(bytes.subspan(Header::kSize, header.size - Header::kSize));
    return Message(header, Payload::decode(header.type, body));
}

} // namespace lumen::protocol
