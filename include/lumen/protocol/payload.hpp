#pragma once

#include "lumen/codec/byte_codec.hpp"
#include "lumen/protocol/types.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

namespace lumen::protocol {

inline constexpr size_t kLabelSize = 32;
inline constexpr size_t kIdSize = 16;
inline constexpr size_t kEchoSize = 64;

using GroupId = std::array<uint8_t, kIdSize>;
using EchoBytes = std::array<uint8_t, kEchoSize>;

// Every message declares its type code (kType) and exact wire size (kSize).
// Requests that expect a State reply declare kResponseRequired; the only message
// addressed to "any device" declares kTagged. Both default to false.

/// Device messages (type codes below 100).
namespace device {

struct GetService {
    static constexpr uint16_t kType = 2;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    static constexpr bool kTagged = true;
    bool operator==(const GetService &) const = default;
};

struct StateService {
    static constexpr uint16_t kType = 3;
    static constexpr uint16_t kSize = 5;

    Service service = Service::Udp;
    uint32_t port = 0;

    void encode(codec::Encoder &enc) const;
    static StateService decode(codec::Decoder &dec);
    bool operator==(const StateService &) const = default;
};

struct GetHostInfo {
    static constexpr uint16_t kType = 12;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const GetHostInfo &) const = default;
};

struct StateHostInfo {
    static constexpr uint16_t kType = 13;
    static constexpr uint16_t kSize = 14;

    float signal = 0.0f; // milliwatts
    uint32_t tx = 0;
    uint32_t rx = 0;
    int16_t reserved = 0;

    void encode(codec::Encoder &enc) const;
    static StateHostInfo decode(codec::Decoder &dec);
    bool operator==(const StateHostInfo &) const = default;
};

struct GetHostFirmware {
    static constexpr uint16_t kType = 14;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const GetHostFirmware &) const = default;
};

struct StateHostFirmware {
    static constexpr uint16_t kType = 15;
    static constexpr uint16_t kSize = 20;

    uint64_t build = 0; // nanoseconds since epoch
    uint64_t reserved = 0;
    uint32_t version = 0;

    void encode(codec::Encoder &enc) const;
    static StateHostFirmware decode(codec::Decoder &dec);
    bool operator==(const StateHostFirmware &) const = default;
};

struct GetWifiInfo {
    static constexpr uint16_t kType = 16;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const GetWifiInfo &) const = default;
};

struct StateWifiInfo {
    static constexpr uint16_t kType = 17;
    static constexpr uint16_t kSize = 14;

    float signal = 0.0f;
    uint32_t tx = 0;
    uint32_t rx = 0;
    int16_t reserved = 0;

    void encode(codec::Encoder &enc) const;
    static StateWifiInfo decode(codec::Decoder &dec);
    bool operator==(const StateWifiInfo &) const = default;
};

struct GetWifiFirmware {
    static constexpr uint16_t kType = 18;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const GetWifiFirmware &) const = default;
};

struct StateWifiFirmware {
    static constexpr uint16_t kType = 19;
    static constexpr uint16_t kSize = 20;

    uint64_t build = 0;
    uint64_t reserved = 0;
    uint32_t version = 0;

    void encode(codec::Encoder &enc) const;
    static StateWifiFirmware decode(codec::Decoder &dec);
    bool operator==(const StateWifiFirmware &) const = default;
};

struct GetPower {
    static constexpr uint16_t kType = 20;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const GetPower &) const = default;
};

struct SetPower {
    static constexpr uint16_t kType = 21;
    static constexpr uint16_t kSize = 2;

    Power level = Power::Standby;

    void encode(codec::Encoder &enc) const;
    static SetPower decode(codec::Decoder &dec);
    bool operator==(const SetPower &) const = default;
};

struct StatePower {
    static constexpr uint16_t kType = 22;
    static constexpr uint16_t kSize = 2;

    Power level = Power::Standby;

    void encode(codec::Encoder &enc) const;
    static StatePower decode(codec::Decoder &dec);
    bool operator==(const StatePower &) const = default;
};

struct GetLabel {
    static constexpr uint16_t kType = 23;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const GetLabel &) const = default;
};

struct SetLabel {
    static constexpr uint16_t kType = 24;
    static constexpr uint16_t kSize = kLabelSize;

    std::string label;

    void encode(codec::Encoder &enc) const;
    static SetLabel decode(codec::Decoder &dec);
    bool operator==(const SetLabel &) const = default;
};

struct StateLabel {
    static constexpr uint16_t kType = 25;
    static constexpr uint16_t kSize = kLabelSize;

    std::string label;

    void encode(codec::Encoder &enc) const;
    static StateLabel decode(codec::Decoder &dec);
    bool operator==(const StateLabel &) const = default;
};

struct GetVersion {
    static constexpr uint16_t kType = 32;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const GetVersion &) const = default;
};

struct StateVersion {
    static constexpr uint16_t kType = 33;
    static constexpr uint16_t kSize = 12;

    uint32_t vendor = 0;
    uint32_t product = 0;
    uint32_t version = 0;

    void encode(codec::Encoder &enc) const;
    static StateVersion decode(codec::Decoder &dec);
    bool operator==(const StateVersion &) const = default;
};

struct GetInfo {
    static constexpr uint16_t kType = 34;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const GetInfo &) const = default;
};

struct StateInfo {
    static constexpr uint16_t kType = 35;
    static constexpr uint16_t kSize = 24;

    uint64_t time = 0;
    uint64_t uptime = 0;
    uint64_t downtime = 0;

    void encode(codec::Encoder &enc) const;
    static StateInfo decode(codec::Decoder &dec);
    bool operator==(const StateInfo &) const = default;
};

struct Acknowledgement {
    static constexpr uint16_t kType = 45;
    static constexpr uint16_t kSize = 0;
    bool operator==(const Acknowledgement &) const = default;
};

struct GetLocation {
    static constexpr uint16_t kType = 48;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const GetLocation &) const = default;
};

struct StateLocation {
    static constexpr uint16_t kType = 50;
    static constexpr uint16_t kSize = kIdSize + kLabelSize + 8;

    GroupId location{};
    std::string label;
    uint64_t updated_at = 0;

    void encode(codec::Encoder &enc) const;
    static StateLocation decode(codec::Decoder &dec);
    bool operator==(const StateLocation &) const = default;
};

struct GetGroup {
    static constexpr uint16_t kType = 51;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const GetGroup &) const = default;
};

struct StateGroup {
    static constexpr uint16_t kType = 53;
    static constexpr uint16_t kSize = kIdSize + kLabelSize + 8;

    GroupId group{};
    std::string label;
    uint64_t updated_at = 0;

    void encode(codec::Encoder &enc) const;
    static StateGroup decode(codec::Decoder &dec);
    bool operator==(const StateGroup &) const = default;
};

struct EchoRequest {
    static constexpr uint16_t kType = 58;
    static constexpr uint16_t kSize = kEchoSize;
    static constexpr bool kResponseRequired = true;

    EchoBytes payload{};

    void encode(codec::Encoder &enc) const;
    static EchoRequest decode(codec::Decoder &dec);
    bool operator==(const EchoRequest &) const = default;
};

struct EchoResponse {
    static constexpr uint16_t kType = 59;
    static constexpr uint16_t kSize = kEchoSize;

    EchoBytes payload{};

    void encode(codec::Encoder &enc) const;
    static EchoResponse decode(codec::Decoder &dec);
    bool operator==(const EchoResponse &) const = default;
};

} // namespace device

/// Light messages (type codes 100 and above).
namespace light {

struct Get {
    static constexpr uint16_t kType = 101;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const Get &) const = default;
};

/// Wire layout: reserved u8, color, duration (ms).
struct SetColor {
    static constexpr uint16_t kType = 102;
    static constexpr uint16_t kSize = 1 + HSBK::kWireSize + 4;

    HSBK color;
    uint32_t duration = 0;

    void encode(codec::Encoder &enc) const;
    static SetColor decode(codec::Decoder &dec);
    bool operator==(const SetColor &) const = default;
};

/// Wire layout: color, reserved i16, power, label, reserved u64.
struct State {
    static constexpr uint16_t kType = 107;
    static constexpr uint16_t kSize = HSBK::kWireSize + 2 + 2 + kLabelSize + 8;

    HSBK color;
    Power power = Power::Standby;
    std::string label;

    void encode(codec::Encoder &enc) const;
    static State decode(codec::Decoder &dec);
    bool operator==(const State &) const = default;
};

struct GetPower {
    static constexpr uint16_t kType = 116;
    static constexpr uint16_t kSize = 0;
    static constexpr bool kResponseRequired = true;
    bool operator==(const GetPower &) const = default;
};

struct SetPower {
    static constexpr uint16_t kType = 117;
    static constexpr uint16_t kSize = 6;

    Power level = Power::Standby;
    uint32_t duration = 0;

    void encode(codec::Encoder &enc) const;
    static SetPower decode(codec::Decoder &dec);
    bool operator==(const SetPower &) const = default;
};

struct StatePower {
    static constexpr uint16_t kType = 118;
    static constexpr uint16_t kSize = 2;

    Power level = Power::Standby;

    void encode(codec::Encoder &enc) const;
    static StatePower decode(codec::Decoder &dec);
    bool operator==(const StatePower &) const = default;
};

} // namespace light

using PayloadVariant =
    std::variant<device::GetService, device::StateService, device::GetHostInfo,
                 device::StateHostInfo, device::GetHostFirmware, device::StateHostFirmware,
                 device::GetWifiInfo, device::StateWifiInfo, device::GetWifiFirmware,
                 device::StateWifiFirmware, device::GetPower, device::SetPower,
                 device::StatePower, device::GetLabel, device::SetLabel, device::StateLabel,
                 device::GetVersion, device::StateVersion, device::GetInfo, device::StateInfo,
                 device::Acknowledgement, device::GetLocation, device::StateLocation,
                 device::GetGroup, device::StateGroup, device::EchoRequest,
                 device::EchoResponse, light::Get, light::SetColor, light::State,
                 light::GetPower, light::SetPower, light::StatePower>;

enum class Family {
    Device,
    Light,
};

/// Tagged union over the message catalog.
///
/// The type code travels once on the wire, in the header, so decoding takes it
/// as an explicit argument instead of reading it from the body.
class Payload {
  public:
    template <typename T>
        requires(!std::is_same_v<std::decay_t<T>, Payload>)
    Payload(T &&message) : message_(std::forward<T>(message)) {}

    [[nodiscard]] uint16_t type_code() const;
    [[nodiscard]] bool is_tagged() const;
    [[nodiscard]] bool requires_response() const;
    [[nodiscard]] uint16_t wire_size() const;
    [[nodiscard]] Family family() const;

    /// Writes exactly wire_size() bytes.
    void encode(codec::Encoder &enc) const;

    /// Throws UnrecognizedMessage for a type outside the catalog, DecodeError for
    /// a truncated or invalid body.
    static Payload decode(uint16_t type, codec::Decoder &dec);

    template <typename T> [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(message_);
    }

    template <typename T> [[nodiscard]] const T *get_if() const {
        return std::get_if<T>(&message_);
    }

    [[nodiscard]] const PayloadVariant &variant() const { return message_; }

    bool operator==(const Payload &) const = default;

  private:
    PayloadVariant message_;
};

/// Catalog name for a type code ("StateLabel", "Light::SetColor", ...), or
/// "Unknown" when the code is not in the catalog.
const char *type_name(uint16_t type);

/// One-line human-readable summary of a payload, for logs.
std::string describe(const Payload &payload);

} // namespace lumen::protocol
