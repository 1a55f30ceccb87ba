#include "lumen/protocol/payload.hpp"

#include "lumen/error.hpp"

#include <array>
#include <sstream>

namespace lumen::protocol {

namespace {

template <typename T> constexpr bool tagged_v() {
    if constexpr (requires { T::kTagged; }) {
        return T::kTagged;
    } else {
        return false;
    }
}

template <typename T> constexpr bool response_required_v() {
    if constexpr (requires { T::kResponseRequired; }) {
        return T::kResponseRequired;
    } else {
        return false;
    }
}

template <typename T> void encode_message(const T &message, codec::Encoder &enc) {
    if constexpr (T::kSize > 0) {
        message.encode(enc);
    }
}

template <typename T> T decode_message(codec::Decoder &dec) {
    if constexpr (T::kSize == 0) {
        return T{};
    } else {
        return T::decode(dec);
    }
}

template <typename... Ts> constexpr bool type_codes_unique(const std::variant<Ts...> *) {
    constexpr std::array<uint16_t, sizeof...(Ts)> codes{Ts::kType...};
    for (size_t i = 0; i < codes.size(); ++i) {
        for (size_t j = i + 1; j < codes.size(); ++j) {
            if (codes[i] == codes[j]) {
                return false;
            }
        }
    }
    return true;
}

static_assert(type_codes_unique(static_cast<const PayloadVariant *>(nullptr)),
              "payload type codes must be unique");

template <size_t I = 0> Payload decode_alternative(uint16_t type, codec::Decoder &dec) {
    if constexpr (I == std::variant_size_v<PayloadVariant>) {
        throw UnrecognizedMessage(type);
    } else {
        using T = std::variant_alternative_t<I, PayloadVariant>;
        if (T::kType == type) {
            return Payload(decode_message<T>(dec));
        }
        return decode_alternative<I + 1>(type, dec);
    }
}

void encode_host_info(codec::Encoder &enc, float signal, uint32_t tx, uint32_t rx,
                      int16_t reserved) {
    enc.write_f32(signal);
    enc.write_u32(tx);
    enc.write_u32(rx);
    enc.write_i16(reserved);
}

void encode_firmware(codec::Encoder &enc, uint64_t build, uint64_t reserved, uint32_t version) {
    enc.write_u64(build);
    enc.write_u64(reserved);
    enc.write_u32(version);
}

std::string quoted(const std::string &s) { return "\"" + s + "\""; }

} // namespace

// --- device ---------------------------------------------------------------

namespace device {

void StateService::encode(codec::Encoder &enc) const {
    enc.write_u8(static_cast<uint8_t>(service));
    enc.write_u32(port);
}

StateService StateService::decode(codec::Decoder &dec) {
    StateService m;
    m.service = service_from_code(dec.read_u8());
    m.port = dec.read_u32();
    return m;
}

void StateHostInfo::encode(codec::Encoder &enc) const {
    encode_host_info(enc, signal, tx, rx, reserved);
}

StateHostInfo StateHostInfo::decode(codec::Decoder &dec) {
    StateHostInfo m;
    m.signal = dec.read_f32();
    m.tx = dec.read_u32();
    m.rx = dec.read_u32();
    m.reserved = dec.read_i16();
    return m;
}

void StateHostFirmware::encode(codec::Encoder &enc) const {
    encode_firmware(enc, build, reserved, version);
}

StateHostFirmware StateHostFirmware::decode(codec::Decoder &dec) {
    StateHostFirmware m;
    m.build = dec.read_u64();
    m.reserved = dec.read_u64();
    m.version = dec.read_u32();
    return m;
}

void StateWifiInfo::encode(codec::Encoder &enc) const {
    encode_host_info(enc, signal, tx, rx, reserved);
}

StateWifiInfo StateWifiInfo::decode(codec::Decoder &dec) {
    StateWifiInfo m;
    m.signal = dec.read_f32();
    m.tx = dec.read_u32();
    m.rx = dec.read_u32();
    m.reserved = dec.read_i16();
    return m;
}

void StateWifiFirmware::encode(codec::Encoder &enc) const {
    encode_firmware(enc, build, reserved, version);
}

StateWifiFirmware StateWifiFirmware::decode(codec::Decoder &dec) {
    StateWifiFirmware m;
    m.build = dec.read_u64();
    m.reserved = dec.read_u64();
    m.version = dec.read_u32();
    return m;
}

void SetPower::encode(codec::Encoder &enc) const { enc.write_u16(static_cast<uint16_t>(level)); }

SetPower SetPower::decode(codec::Decoder &dec) {
    return SetPower{.level = power_from_level(dec.read_u16())};
}

void StatePower::encode(codec::Encoder &enc) const {
    enc.write_u16(static_cast<uint16_t>(level));
}

StatePower StatePower::decode(codec::Decoder &dec) {
    return StatePower{.level = power_from_level(dec.read_u16())};
}

void SetLabel::encode(codec::Encoder &enc) const { enc.write_fixed_str(label, kLabelSize); }

SetLabel SetLabel::decode(codec::Decoder &dec) {
    return SetLabel{.label = dec.read_fixed_str(kLabelSize)};
}

void StateLabel::encode(codec::Encoder &enc) const { enc.write_fixed_str(label, kLabelSize); }

StateLabel StateLabel::decode(codec::Decoder &dec) {
    return StateLabel{.label = dec.read_fixed_str(kLabelSize)};
}

void StateVersion::encode(codec::Encoder &enc) const {
    enc.write_u32(vendor);
    enc.write_u32(product);
    enc.write_u32(version);
}

StateVersion StateVersion::decode(codec::Decoder &dec) {
    StateVersion m;
    m.vendor = dec.read_u32();
    m.product = dec.read_u32();
    m.version = dec.read_u32();
    return m;
}

void StateInfo::encode(codec::Encoder &enc) const {
    enc.write_u64(time);
    enc.write_u64(uptime);
    enc.write_u64(downtime);
}

StateInfo StateInfo::decode(codec::Decoder &dec) {
    StateInfo m;
    m.time = dec.read_u64();
    m.uptime = dec.read_u64();
    m.downtime = dec.read_u64();
    return m;
}

void StateLocation::encode(codec::Encoder &enc) const {
    enc.write_bytes(location);
    enc.write_fixed_str(label, kLabelSize);
    enc.write_u64(updated_at);
}

StateLocation StateLocation::decode(codec::Decoder &dec) {
    StateLocation m;
    m.location = dec.read_array<kIdSize>();
    m.label = dec.read_fixed_str(kLabelSize);
    m.updated_at = dec.read_u64();
    return m;
}

void StateGroup::encode(codec::Encoder &enc) const {
    enc.write_bytes(group);
    enc.write_fixed_str(label, kLabelSize);
    enc.write_u64(updated_at);
}

StateGroup StateGroup::decode(codec::Decoder &dec) {
    StateGroup m;
    m.group = dec.read_array<kIdSize>();
    m.label = dec.read_fixed_str(kLabelSize);
    m.updated_at = dec.read_u64();
    return m;
}

void EchoRequest::encode(codec::Encoder &enc) const { enc.write_bytes(payload); }

EchoRequest EchoRequest::decode(codec::Decoder &dec) {
    return EchoRequest{.payload = dec.read_array<kEchoSize>()};
}

void EchoResponse::encode(codec::Encoder &enc) const { enc.write_bytes(payload); }

EchoResponse EchoResponse::decode(codec::Decoder &dec) {
    return EchoResponse{.payload = dec.read_array<kEchoSize>()};
}

} // namespace device

// --- light ----------------------------------------------------------------

namespace light {

void SetColor::encode(codec::Encoder &enc) const {
    enc.write_u8(0);
    color.encode(enc);
    enc.write_u32(duration);
}

SetColor SetColor::decode(codec::Decoder &dec) {
    dec.skip(1);
    HSBK color = HSBK::decode(dec);
    const uint32_t duration = dec.read_u32();
    return SetColor{.color = color, .duration = duration};
}

void State::encode(codec::Encoder &enc) const {
    color.encode(enc);
    enc.write_i16(0);
    enc.write_u16(static_cast<uint16_t>(power));
    enc.write_fixed_str(label, kLabelSize);
    enc.write_u64(0);
}

State State::decode(codec::Decoder &dec) {
    HSBK color = HSBK::decode(dec);
    dec.skip(2);
    const Power power = power_from_level(dec.read_u16());
    std::string label = dec.read_fixed_str(kLabelSize);
    dec.skip(8);
    return State{.color = color, .power = power, .label = std::move(label)};
}

void SetPower::encode(codec::Encoder &enc) const {
    enc.write_u16(static_cast<uint16_t>(level));
    enc.write_u32(duration);
}

SetPower SetPower::decode(codec::Decoder &dec) {
    const Power level = power_from_level(dec.read_u16());
    const uint32_t duration = dec.read_u32();
    return SetPower{.level = level, .duration = duration};
}

void StatePower::encode(codec::Encoder &enc) const {
    enc.write_u16(static_cast<uint16_t>(level));
}

StatePower StatePower::decode(codec::Decoder &dec) {
    return StatePower{.level = power_from_level(dec.read_u16())};
}

} // namespace light

// --- Payload ----------------------------------------------------------------

uint16_t Payload::type_code() const {
    return std::visit([](const auto &m) { return std::decay_t<decltype(m)>::kType; }, message_);
}

bool Payload::is_tagged() const {
    return std::visit([](const auto &m) { return tagged_v<std::decay_t<decltype(m)>>(); },
                      message_);
}

bool Payload::requires_response() const {
    return std::visit(
        [](const auto &m) { return response_required_v<std::decay_t<decltype(m)>>(); },
        message_);
}

uint16_t Payload::wire_size() const {
    return std::visit([](const auto &m) { return std::decay_t<decltype(m)>::kSize; }, message_);
}

Family Payload::family() const { return type_code() >= 100 ? Family::Light : Family::Device; }

void Payload::encode(codec::Encoder &enc) const {
    std::visit([&enc](const auto &m) { encode_message(m, enc); }, message_);
}

Payload Payload::decode(uint16_t type, codec::Decoder &dec) {
    return decode_alternative(type, dec);
}

const char *type_name(uint16_t type) {
    switch (type) {
    case device::GetService::kType:
        return "GetService";
    case device::StateService::kType:
        return "StateService";
    case device::GetHostInfo::kType:
        return "GetHostInfo";
    case device::StateHostInfo::kType:
        return "StateHostInfo";
    case device::GetHostFirmware::kType:
        return "GetHostFirmware";
    case device::StateHostFirmware::kType:
        return "StateHostFirmware";
    case device::GetWifiInfo::kType:
        return "GetWifiInfo";
    case device::StateWifiInfo::kType:
        return "StateWifiInfo";
    case device::GetWifiFirmware::kType:
        return "GetWifiFirmware";
    case device::StateWifiFirmware::kType:
        return "StateWifiFirmware";
    case device::GetPower::kType:
        return "GetPower";
    case device::SetPower::kType:
        return "SetPower";
    case device::StatePower::kType:
        return "StatePower";
    case device::GetLabel::kType:
        return "GetLabel";
    case device::SetLabel::kType:
        return "SetLabel";
    case device::StateLabel::kType:
        return "StateLabel";
    case device::GetVersion::kType:
        return "GetVersion";
    case device::StateVersion::kType:
        return "StateVersion";
    case device::GetInfo::kType:
        return "GetInfo";
    case device::StateInfo::kType:
        return "StateInfo";
    case device::Acknowledgement::kType:
        return "Acknowledgement";
    case device::GetLocation::kType:
        return "GetLocation";
    case device::StateLocation::kType:
        return "StateLocation";
    case device::GetGroup::kType:
        return "GetGroup";
    case device::StateGroup::kType:
        return "StateGroup";
    case device::EchoRequest::kType:
        return "EchoRequest";
    case device::EchoResponse::kType:
        return "EchoResponse";
    case light::Get::kType:
        return "Light::Get";
    case light::SetColor::kType:
        return "Light::SetColor";
    case light::State::kType:
        return "Light::State";
    case light::GetPower::kType:
        return "Light::GetPower";
    case light::SetPower::kType:
        return "Light::SetPower";
    case light::StatePower::kType:
        return "Light::StatePower";
    default:
        return "Unknown";
    }
}

std::string describe(const Payload &payload) {
    std::ostringstream oss;
    oss << type_name(payload.type_code());

    std::visit(
        [&oss](const auto &m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, device::StateService>) {
                oss << " service=" << static_cast<int>(m.service) << " port=" << m.port;
            } else if constexpr (std::is_same_v<T, device::StateLabel> ||
                                 std::is_same_v<T, device::SetLabel>) {
                oss << " label=" << quoted(m.label);
            } else if constexpr (std::is_same_v<T, device::StateLocation> ||
                                 std::is_same_v<T, device::StateGroup>) {
                oss << " label=" << quoted(m.label) << " updated_at=" << m.updated_at;
            } else if constexpr (std::is_same_v<T, device::SetPower> ||
                                 std::is_same_v<T, device::StatePower> ||
                                 std::is_same_v<T, light::StatePower>) {
                oss << " level=" << power_label(m.level);
            } else if constexpr (std::is_same_v<T, light::SetPower>) {
                oss << " level=" << power_label(m.level) << " duration=" << m.duration;
            } else if constexpr (std::is_same_v<T, device::StateHostInfo> ||
                                 std::is_same_v<T, device::StateWifiInfo>) {
                oss << " signal=" << m.signal << " tx=" << m.tx << " rx=" << m.rx;
            } else if constexpr (std::is_same_v<T, device::StateHostFirmware> ||
                                 std::is_same_v<T, device::StateWifiFirmware>) {
                oss << " build=" << m.build << " version=" << (m.version >> 16) << "."
                    << (m.version & 0xffff);
            } else if constexpr (std::is_same_v<T, device::StateVersion>) {
                oss << " vendor=" << m.vendor << " product=" << m.product;
            } else if constexpr (std::is_same_v<T, device::StateInfo>) {
                oss << " uptime=" << m.uptime;
            } else if constexpr (std::is_same_v<T, light::SetColor>) {
                oss << " hsbk=" << m.color.hue() << "," << m.color.saturation() << ","
                    << m.color.brightness() << "," << m.color.kelvin()
                    << " duration=" << m.duration;
            } else if constexpr (std::is_same_v<T, light::State>) {
                oss << " label=" << quoted(m.label) << " power=" << power_label(m.power)
                    << " hsbk=" << m.color.hue() << "," << m.color.saturation() << ","
                    << m.color.brightness() << "," << m.color.kelvin();
            }
        },
        payload.variant());

    return oss.str();
}

} // namespace lumen::protocol
