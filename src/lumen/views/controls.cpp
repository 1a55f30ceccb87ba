#include "lumen/views/controls.hpp"

#include <imgui.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <utility>

namespace lumen::views {

namespace {

uint16_t unit_to_u16(float value) {
    const float clamped = std::clamp(value, 0.0f, 1.0f);
    return static_cast<uint16_t>(std::lround(clamped * 65535.0f));
}

float u16_to_unit(uint16_t value) { return static_cast<float>(value) / 65535.0f; }

constexpr std::array<std::pair<protocol::Color, const char *>, 9> kPresets = {{
    {protocol::Color::White, "White"},
    {protocol::Color::Red, "Red"},
    {protocol::Color::Orange, "Orange"},
    {protocol::Color::Yellow, "Yellow"},
    {protocol::Color::Green, "Green"},
    {protocol::Color::Cyan, "Cyan"},
    {protocol::Color::Blue, "Blue"},
    {protocol::Color::Purple, "Purple"},
    {protocol::Color::Pink, "Pink"},
}};

} // namespace

const char *light_action_label(LightAction action) {
    switch (action) {
    case LightAction::PowerOn:
        return "Power on";
    case LightAction::PowerOff:
        return "Power off";
    case LightAction::ApplyColor:
        return "Apply color";
    case LightAction::Refresh:
    default:
        return "Refresh";
    }
}

protocol::HSBK LightControlState::to_hsbk() const {
    const int k = std::clamp(kelvin, static_cast<int>(protocol::kMinKelvin),
                             static_cast<int>(protocol::kMaxKelvin));
    return protocol::HSBK(protocol::hue_from_degrees(hue_degrees), unit_to_u16(saturation),
                          unit_to_u16(brightness), static_cast<uint16_t>(k));
}

void LightControlState::load_from(const data::Bulb &bulb) {
    target = bulb.target;
    power = bulb.power;
    if (bulb.color.has_value()) {
        hue_degrees = static_cast<float>(protocol::hue_to_degrees(bulb.color->hue()));
        saturation = u16_to_unit(bulb.color->saturation());
        brightness = u16_to_unit(bulb.color->brightness());
        kelvin = bulb.color->kelvin();
    }
}

void LightControlState::apply_preset(protocol::Color color) {
    const auto hsbk = protocol::to_hsbk(color, unit_to_u16(brightness));
    hue_degrees = static_cast<float>(protocol::hue_to_degrees(hsbk.hue()));
    saturation = u16_to_unit(hsbk.saturation());
    kelvin = hsbk.kelvin();
}

protocol::Payload LightControlState::payload_for(LightAction action) const {
    const auto duration = static_cast<uint32_t>(std::max(duration_ms, 0));
    switch (action) {
    case LightAction::PowerOn:
        return protocol::light::SetPower{protocol::Power::Max, duration};
    case LightAction::PowerOff:
        return protocol::light::SetPower{protocol::Power::Standby, duration};
    case LightAction::ApplyColor:
        return protocol::light::SetColor{to_hsbk(), duration};
    case LightAction::Refresh:
    default:
        return protocol::light::Get{};
    }
}

void LightControlState::reset() { *this = LightControlState{}; }

std::optional<LightAction> render_light_controls(LightControlState &state) {
    std::optional<LightAction> action;

    if (!state.controls_enabled()) {
        ImGui::TextDisabled("Select a device in the Devices window.");
        return action;
    }

    ImGui::Text("Power: %s", state.power.has_value() ? protocol::power_label(*state.power) : "?");
    ImGui::SameLine();
    if (ImGui::SmallButton("On")) {
        action = LightAction::PowerOn;
    }
    ImGui::SameLine();
    if (ImGui::SmallButton("Off")) {
        action = LightAction::PowerOff;
    }
    ImGui::SameLine();
    if (ImGui::SmallButton("Refresh")) {
        action = LightAction::Refresh;
    }

    ImGui::Separator();
    ImGui::SliderFloat("Hue", &state.hue_degrees, 0.0f, 360.0f, "%.0f deg");
    ImGui::SliderFloat("Saturation", &state.saturation, 0.0f, 1.0f, "%.2f");
    ImGui::SliderFloat("Brightness", &state.brightness, 0.0f, 1.0f, "%.2f");
    ImGui::SliderInt("Kelvin", &state.kelvin, protocol::kMinKelvin, protocol::kMaxKelvin);
    ImGui::SetNextItemWidth(120.0f);
    ImGui::InputInt("Duration (ms)", &state.duration_ms, 100, 1000);
    state.duration_ms = std::clamp(state.duration_ms, 0, 600000);

    for (size_t i = 0; i < kPresets.size(); ++i) {
        if (i > 0) {
            ImGui::SameLine();
        }
        if (ImGui::SmallButton(kPresets[i].second)) {
            state.apply_preset(kPresets[i].first);
        }
    }

    // Swatch of what will be sent; kelvin is not represented.
    float rgb[3] = {0.0f, 0.0f, 0.0f};
    ImGui::ColorConvertHSVtoRGB(state.hue_degrees / 360.0f, state.saturation, state.brightness,
                                rgb[0], rgb[1], rgb[2]);
    ImGui::ColorButton("##swatch", ImVec4(rgb[0], rgb[1], rgb[2], 1.0f),
                       ImGuiColorEditFlags_NoTooltip, ImVec2(48.0f, 20.0f));
    ImGui::SameLine();
    if (ImGui::Button("Apply color")) {
        action = LightAction::ApplyColor;
    }

    return action;
}

} // namespace lumen::views
