#pragma once

#include "lumen/data/device_directory.hpp"
#include "lumen/protocol/payload.hpp"
#include "lumen/protocol/types.hpp"

#include <cstdint>
#include <optional>

namespace lumen::views {

/// User action emitted by the light controls.
enum class LightAction {
    PowerOn,
    PowerOff,
    ApplyColor,
    Refresh,
};

const char *light_action_label(LightAction action);

/// Editable color and power state for the selected bulb.
struct LightControlState {
    std::optional<uint64_t> target;
    std::optional<protocol::Power> power;
    float hue_degrees = 0.0f;
    float saturation = 0.0f; // 0..1
    float brightness = 1.0f; // 0..1
    int kelvin = 3500;
    int duration_ms = 0;

    /// Clamps every field into its wire range.
    [[nodiscard]] protocol::HSBK to_hsbk() const;

    /// Select a bulb and pick up its last reported color and power.
    void load_from(const data::Bulb &bulb);

    /// Fill the editor from a named preset, keeping the current brightness.
    void apply_preset(protocol::Color color);

    [[nodiscard]] protocol::Payload payload_for(LightAction action) const;

    void reset();

    [[nodiscard]] bool controls_enabled() const { return target.has_value(); }
};

/// Render the light editor and emit a selected action.
std::optional<LightAction> render_light_controls(LightControlState &state);

} // namespace lumen::views
