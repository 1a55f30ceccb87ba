#include "lumen/views/controls.hpp"

#include <gtest/gtest.h>

using namespace lumen;
using namespace lumen::views;
using namespace lumen::protocol;

TEST(LightControlState, InitialState) {
    LightControlState state;
    EXPECT_FALSE(state.controls_enabled());
    EXPECT_FALSE(state.power.has_value());
    EXPECT_EQ(state.kelvin, 3500);
    EXPECT_FLOAT_EQ(state.brightness, 1.0f);
}

TEST(LightControlState, ToHsbkScalesUnitRanges) {
    LightControlState state;
    state.hue_degrees = 180.0f;
    state.saturation = 1.0f;
    state.brightness = 0.5f;
    state.kelvin = 4000;

    const auto hsbk = state.to_hsbk();
    EXPECT_EQ(hsbk.hue(), 32768);
    EXPECT_EQ(hsbk.saturation(), 65535);
    EXPECT_EQ(hsbk.brightness(), 32768);
    EXPECT_EQ(hsbk.kelvin(), 4000);
}

TEST(LightControlState, ToHsbkClampsOutOfRangeInput) {
    LightControlState state;
    state.saturation = 1.5f;
    state.brightness = -0.2f;
    state.kelvin = 12000;
    EXPECT_EQ(state.to_hsbk().saturation(), 65535);
    EXPECT_EQ(state.to_hsbk().brightness(), 0);
    EXPECT_EQ(state.to_hsbk().kelvin(), kMaxKelvin);

    state.kelvin = 1000;
    EXPECT_EQ(state.to_hsbk().kelvin(), kMinKelvin);
}

TEST(LightControlState, LoadFromBulb) {
    data::Bulb bulb;
    bulb.target = 77;
    bulb.power = Power::Max;
    bulb.color = HSBK(hue_from_degrees(90.0), 65535, 0, 2700);

    LightControlState state;
    state.load_from(bulb);

    EXPECT_TRUE(state.controls_enabled());
    EXPECT_EQ(state.target, 77u);
    EXPECT_EQ(state.power, Power::Max);
    EXPECT_NEAR(state.hue_degrees, 90.0f, 0.01f);
    EXPECT_FLOAT_EQ(state.saturation, 1.0f);
    EXPECT_FLOAT_EQ(state.brightness, 0.0f);
    EXPECT_EQ(state.kelvin, 2700);
}

TEST(LightControlState, LoadFromBulbWithoutColorKeepsEditor) {
    data::Bulb bulb;
    bulb.target = 5;

    LightControlState state;
    state.hue_degrees = 45.0f;
    state.load_from(bulb);
    EXPECT_FLOAT_EQ(state.hue_degrees, 45.0f);
    EXPECT_EQ(state.target, 5u);
}

TEST(LightControlState, PayloadForPowerActions) {
    LightControlState state;
    state.duration_ms = 250;

    EXPECT_EQ(state.payload_for(LightAction::PowerOn), Payload(light::SetPower{Power::Max, 250}));
    EXPECT_EQ(state.payload_for(LightAction::PowerOff),
              Payload(light::SetPower{Power::Standby, 250}));
    EXPECT_TRUE(state.payload_for(LightAction::Refresh).is<light::Get>());
}

TEST(LightControlState, PayloadForApplyColor) {
    LightControlState state;
    state.hue_degrees = 120.0f;
    state.saturation = 1.0f;
    state.duration_ms = -10;

    const auto payload = state.payload_for(LightAction::ApplyColor);
    const auto *set_color = payload.get_if<light::SetColor>();
    ASSERT_NE(set_color, nullptr);
    EXPECT_EQ(set_color->color, state.to_hsbk());
    EXPECT_EQ(set_color->duration, 0u);
}

TEST(LightControlState, PresetKeepsBrightness) {
    LightControlState state;
    state.brightness = 0.25f;
    state.apply_preset(Color::Green);

    EXPECT_NEAR(state.hue_degrees, 120.0f, 0.01f);
    EXPECT_FLOAT_EQ(state.saturation, 1.0f);
    EXPECT_FLOAT_EQ(state.brightness, 0.25f);

    state.apply_preset(Color::White);
    EXPECT_FLOAT_EQ(state.saturation, 0.0f);
}

TEST(LightControlState, ResetClearsSelection) {
    LightControlState state;
    state.target = 1;
    state.kelvin = 6000;
    state.reset();
    EXPECT_FALSE(state.controls_enabled());
    EXPECT_EQ(state.kelvin, 3500);
}

TEST(LightAction, Labels) {
    EXPECT_STREQ(light_action_label(LightAction::PowerOn), "Power on");
    EXPECT_STREQ(light_action_label(LightAction::ApplyColor), "Apply color");
}
