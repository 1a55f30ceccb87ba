#pragma once

#include "lumen/codec/byte_codec.hpp"

#include <cstdint>

namespace lumen::protocol {

/// Device power level. Only the two extremes are meaningful on the wire.
enum class Power : uint16_t {
    Standby = 0,
    Max = 65535,
};

/// 0 decodes as Standby, any other level as Max.
Power power_from_level(uint16_t level);
const char *power_label(Power power);

/// Transport advertised in StateService. Unknown codes decode as Reserved.
enum class Service : uint8_t {
    Udp = 1,
    Reserved = 5,
};

Service service_from_code(uint8_t code);

inline constexpr uint16_t kMaxBrightness = 65535;
inline constexpr uint16_t kMinKelvin = 2500;
inline constexpr uint16_t kMaxKelvin = 9000;

/// Hue, saturation, brightness and color temperature.
/// Kelvin is validated on construction: 2500 <= kelvin <= 9000.
class HSBK {
  public:
    static constexpr uint16_t kWireSize = 8;

    HSBK(uint16_t hue, uint16_t saturation, uint16_t brightness, uint16_t kelvin);

    [[nodiscard]] uint16_t hue() const { return hue_; }
    [[nodiscard]] uint16_t saturation() const { return saturation_; }
    [[nodiscard]] uint16_t brightness() const { return brightness_; }
    [[nodiscard]] uint16_t kelvin() const { return kelvin_; }

    void encode(codec::Encoder &enc) const;

    /// Throws DecodeError if the kelvin field is out of range.
    static HSBK decode(codec::Decoder &dec);

    bool operator==(const HSBK &) const = default;

  private:
    uint16_t hue_;
    uint16_t saturation_;
    uint16_t brightness_;
    uint16_t kelvin_;
};

/// Named color presets.
enum class Color {
    White,
    Red,
    Orange,
    Yellow,
    Green,
    Cyan,
    Blue,
    Purple,
    Pink,
};

HSBK to_hsbk(Color color, uint16_t brightness = kMaxBrightness);

/// Hue in degrees [0, 360) to the 16-bit wire representation.
uint16_t hue_from_degrees(double degrees);
double hue_to_degrees(uint16_t hue);

} // namespace lumen::protocol
