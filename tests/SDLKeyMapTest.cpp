#include "input/platform/sdl2/SDLKeyMap.h"

#include <gtest/gtest.h>

using namespace actuate::input;

TEST(SDLKeyMapTest, KeyCodesAreScancodes) {
    EXPECT_EQ(SDLKeyMap::toScancode(KeyCode::A), SDL_SCANCODE_A);
    EXPECT_EQ(SDLKeyMap::toScancode(KeyCode::SPACE), SDL_SCANCODE_SPACE);
    EXPECT_EQ(SDLKeyMap::toScancode(KeyCode::LEFT_SHIFT), SDL_SCANCODE_LSHIFT);
    EXPECT_FALSE(SDLKeyMap::toScancode(KeyCode::UNKNOWN).has_value());
}

TEST(SDLKeyMapTest, ControllerButtons) {
    const SDLKeyMap map;
    EXPECT_EQ(map.toControllerButton(JoystickButton::A), SDL_CONTROLLER_BUTTON_A);
    EXPECT_EQ(map.toControllerButton(JoystickButton::LEFT_BUMPER), SDL_CONTROLLER_BUTTON_LEFTSHOULDER);
    EXPECT_EQ(map.toControllerButton(JoystickButton::DPAD_RIGHT), SDL_CONTROLLER_BUTTON_DPAD_RIGHT);

    // Triggers come from the axes
    EXPECT_FALSE(map.toControllerButton(JoystickButton::LEFT_TRIGGER).has_value());
    EXPECT_FALSE(map.toControllerButton(JoystickButton::RIGHT_TRIGGER).has_value());
}

TEST(SDLKeyMapTest, MouseButtons) {
    EXPECT_EQ(SDLKeyMap::toMouseButton(MouseButton::LEFT), SDL_BUTTON_LEFT);
    EXPECT_EQ(SDLKeyMap::toMouseButton(MouseButton::RIGHT), SDL_BUTTON_RIGHT);
    EXPECT_EQ(SDLKeyMap::toMouseButton(MouseButton::X_BUTTON_2), SDL_BUTTON_X2);
}

TEST(SDLKeyMapTest, NormalizesRawAxes) {
    EXPECT_FLOAT_EQ(normalizeAxisValue(32767), 1.0f);
    EXPECT_FLOAT_EQ(normalizeAxisValue(-32768), -1.0f);
    EXPECT_FLOAT_EQ(normalizeAxisValue(0), 0.0f);
    EXPECT_NEAR(normalizeAxisValue(16384), 0.5f, 1e-4f);

    EXPECT_FLOAT_EQ(normalizeTriggerValue(32767), 1.0f);
    EXPECT_FLOAT_EQ(normalizeTriggerValue(0), 0.0f);
}
