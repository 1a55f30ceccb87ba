#include "lumen/protocol/types.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace lumen::protocol {

Power power_from_level(uint16_t level) { return level == 0 ? Power::Standby : Power::Max; }

const char *power_label(Power power) {
    switch (power) {
    case Power::Max:
        return "On";
    case Power::Standby:
    default:
        return "Off";
    }
}

Service service_from_code(uint8_t code) { return code == 1 ? Service::Udp : Service::Reserved; }

HSBK::HSBK(uint16_t hue, uint16_t saturation, uint16_t brightness, uint16_t kelvin)
    : hue_(hue), saturation_(saturation), brightness_(brightness), kelvin_(kelvin) {
    if (kelvin < kMinKelvin || kelvin > kMaxKelvin) {
        throw std::invalid_argument("kelvin " + std::to_string(kelvin) + " outside [" +
                                    std::to_string(kMinKelvin) + ", " +
                                    std::to_string(kMaxKelvin) + "]");
    }
}

void HSBK::encode(codec::Encoder &enc) const {
    enc.write_u16(hue_);
    enc.write_u16(saturation_);
    enc.write_u16(brightness_);
    enc.write_u16(kelvin_);
}

HSBK HSBK::decode(codec::Decoder &dec) {
    const uint16_t hue = dec.read_u16();
    const uint16_t saturation = dec.read_u16();
    const uint16_t brightness = dec.read_u16();
    const uint16_t kelvin = dec.read_u16();
    try {
        return HSBK(hue, saturation, brightness, kelvin);
    } catch (const std::invalid_argument &e) {
        throw DecodeError(e.what());
    }
}

uint16_t hue_from_degrees(double degrees) {
    double wrapped = std::fmod(degrees, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    return static_cast<uint16_t>(std::lround(wrapped / 360.0 * 65535.0));
}

double hue_to_degrees(uint16_t hue) { return static_cast<double>(hue) * 360.0 / 65535.0; }

HSBK to_hsbk(Color color, uint16_t brightness) {
    constexpr uint16_t kFullSaturation = 65535;
    constexpr uint16_t kNeutralKelvin = 3500;

    switch (color) {
    case Color::Red:
        return {hue_from_degrees(0.0), kFullSaturation, brightness, kNeutralKelvin};
    case Color::Orange:
        return {hue_from_degrees(36.0), kFullSaturation, brightness, kNeutralKelvin};
    case Color::Yellow:
        return {hue_from_degrees(60.0), kFullSaturation, brightness, kNeutralKelvin};
    case Color::Green:
        return {hue_from_degrees(120.0), kFullSaturation, brightness, kNeutralKelvin};
    case Color::Cyan:
        return {hue_from_degrees(180.0), kFullSaturation, brightness, kNeutralKelvin};
    case Color::Blue:
        return {hue_from_degrees(250.0), kFullSaturation, brightness, kNeutralKelvin};
    case Color::Purple:
        return {hue_from_degrees(280.0), kFullSaturation, brightness, kNeutralKelvin};
    case Color::Pink:
        return {hue_from_degrees(325.0), 25000, brightness, kNeutralKelvin};
    case Color::White:
    default:
        return {0, 0, brightness, kNeutralKelvin};
    }
}

} // namespace lumen::protocol
