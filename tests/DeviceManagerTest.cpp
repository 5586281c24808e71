#include "input/devices/base/DeviceService.h"
#include "input/devices/joystick/JoystickManager.h"
#include "input/devices/keyboard/KeyboardManager.h"
#include "input/devices/mouse/MouseManager.h"

#include "support/FakeInputBackend.h"

#include <gtest/gtest.h>

using namespace actuate::input;
using actuate::input::test::FakeInputBackend;

// ============================================================================
// Keyboard
// ============================================================================

TEST(KeyboardManagerTest, EdgeDetectionLastsOneFrame) {
    FakeInputBackend backend;
    KeyboardManager keyboard(backend);

    backend.setKey(KeyCode::SPACE, true);
    keyboard.update();

    EXPECT_TRUE(keyboard.isPressed(KeyCode::SPACE));
    EXPECT_TRUE(keyboard.justPressed(KeyCode::SPACE));
    EXPECT_FALSE(keyboard.justReleased(KeyCode::SPACE));

    keyboard.update();
    EXPECT_TRUE(keyboard.isPressed(KeyCode::SPACE));
    EXPECT_FALSE(keyboard.justPressed(KeyCode::SPACE));
    EXPECT_FALSE(keyboard.justReleased(KeyCode::SPACE));

    backend.setKey(KeyCode::SPACE, false);
    keyboard.update();
    EXPECT_FALSE(keyboard.isPressed(KeyCode::SPACE));
    EXPECT_TRUE(keyboard.justReleased(KeyCode::SPACE));
}

TEST(KeyboardManagerTest, PreviousSnapshotIsTheOldCurrent) {
    FakeInputBackend backend;
    KeyboardManager keyboard(backend);

    backend.setKey(KeyCode::A, true);
    keyboard.update();
    const KeyboardState before = keyboard.getCurrentState();

    backend.setKey(KeyCode::B, true);
    keyboard.update();

    EXPECT_EQ(keyboard.getPreviousState(), before);
    EXPECT_TRUE(keyboard.getCurrentState().isKeyPressed(KeyCode::B));
}

TEST(KeyboardManagerTest, StringQueries) {
    FakeInputBackend backend;
    KeyboardManager keyboard(backend);

    backend.setKey(KeyCode::LEFT_SHIFT, true);
    keyboard.update();

    EXPECT_TRUE(keyboard.isPressed("LShift"));
    EXPECT_TRUE(keyboard.isPressed("lshift"));
    EXPECT_TRUE(keyboard.isPressed(std::to_string(static_cast<int>(KeyCode::LEFT_SHIFT))));
    EXPECT_FALSE(keyboard.isPressed("NoSuchKey"));
    EXPECT_FALSE(keyboard.isPressed(""));
}

TEST(KeyboardManagerTest, ChangedThisFrame) {
    FakeInputBackend backend;
    KeyboardManager keyboard(backend);

    keyboard.update();
    EXPECT_FALSE(keyboard.changedThisFrame());

    backend.setKey(KeyCode::W, true);
    keyboard.update();
    EXPECT_TRUE(keyboard.changedThisFrame());

    keyboard.update();
    EXPECT_FALSE(keyboard.changedThisFrame());
}

// ============================================================================
// Mouse
// ============================================================================

TEST(MouseManagerTest, ButtonsAndPosition) {
    FakeInputBackend backend;
    MouseManager mouse(backend);

    backend.setMouseButton(MouseButton::RIGHT, true);
    backend.setMousePosition(100, 50);
    mouse.update();

    EXPECT_TRUE(mouse.isPressed("Right"));
    EXPECT_TRUE(mouse.justPressed(MouseButton::RIGHT));
    EXPECT_FLOAT_EQ(mouse.getAxis("XPosition"), 100.0f);
    EXPECT_FLOAT_EQ(mouse.getAxis(MouseAxis::Y_POSITION), 50.0f);

    backend.setMousePosition(110, 40);
    mouse.update();

    EXPECT_FLOAT_EQ(mouse.getLastAxis("XPosition"), 100.0f);
    EXPECT_FLOAT_EQ(mouse.axisDelta("XPosition"), 10.0f);
    EXPECT_FLOAT_EQ(mouse.axisDelta("YPosition"), -10.0f);
    EXPECT_EQ(mouse.getPositionDelta(), actuate::math::Vec2i(10, -10));
    EXPECT_TRUE(mouse.changedThisFrame());
}

TEST(MouseManagerTest, UnknownIdsReadAsZero) {
    FakeInputBackend backend;
    MouseManager mouse(backend);

    backend.setMousePosition(5, 5);
    mouse.update();

    EXPECT_FLOAT_EQ(mouse.getAxis("Wheel"), 0.0f);
    EXPECT_FLOAT_EQ(mouse.getAxis("7"), 0.0f);
    EXPECT_FALSE(mouse.isPressed("Thumb"));
}

// ============================================================================
// Joystick
// ============================================================================

TEST(JoystickManagerTest, AbsentJoystickIsZeroSnapshot) {
    FakeInputBackend backend;
    JoystickManager joystick(backend);

    joystick.update();

    EXPECT_FALSE(joystick.isConnected());
    EXPECT_EQ(joystick.getActiveJoystick(), INVALID_JOYSTICK_ID);
    EXPECT_FLOAT_EQ(joystick.getAxis("LeftStickX"), 0.0f);
    EXPECT_FALSE(joystick.isPressed("A"));
}

TEST(JoystickManagerTest, AxesAndDerivedTriggers) {
    FakeInputBackend backend;
    JoystickManager joystick(backend);

    auto& raw = backend.joystick(3);
    raw.leftStick = {0.6f, -1.5f};
    raw.leftTrigger = 0.2f;
    raw.rightTrigger = 0.9f;
    joystick.update();

    EXPECT_TRUE(joystick.isConnected());
    EXPECT_EQ(joystick.getActiveJoystick(), 3);
    EXPECT_FLOAT_EQ(joystick.getAxis("LeftStickX"), 0.6f);
    EXPECT_FLOAT_EQ(joystick.getAxis("LeftStickY"), -1.0f);
    EXPECT_FLOAT_EQ(joystick.getAxis("Triggers"), 0.7f);

    EXPECT_FALSE(joystick.isPressed("LT"));
    EXPECT_TRUE(joystick.isPressed("RT"));
    EXPECT_TRUE(joystick.justPressed(JoystickButton::RIGHT_TRIGGER));
}

TEST(JoystickManagerTest, AxisPressThreshold) {
    FakeInputBackend backend;
    JoystickManager joystick(backend);

    backend.joystick(0).leftStick = {-0.5f, 0.39f};
    joystick.update();

    EXPECT_FALSE(joystick.axisIsPressed("LeftStickX"));
    EXPECT_TRUE(joystick.axisIsPressed("LeftStickX", true));
    EXPECT_FALSE(joystick.axisIsPressed("LeftStickY", true));
    EXPECT_TRUE(joystick.axisJustPressed("LeftStickX", true));

    backend.joystick(0).leftStick = {-0.1f, 0.4f};
    joystick.update();

    EXPECT_TRUE(joystick.axisJustReleased("LeftStickX", true));
    EXPECT_TRUE(joystick.axisJustPressed(JoystickAxis::LEFT_STICK_Y));
}

TEST(JoystickManagerTest, AxisPressIsOneDirectionalByDefault) {
    FakeInputBackend backend;
    JoystickManager joystick(backend);

    backend.joystick(0).leftStick = {-0.8f, 0.0f};
    joystick.update();

    EXPECT_FALSE(joystick.axisIsPressed("LeftStickX"));
    EXPECT_FALSE(joystick.axisIsPressed(JoystickAxis::LEFT_STICK_X));
    EXPECT_FALSE(joystick.axisJustPressed("LeftStickX"));
    EXPECT_TRUE(joystick.axisIsPressed("LeftStickX", true));
    EXPECT_TRUE(joystick.axisJustPressed(JoystickAxis::LEFT_STICK_X, true));

    backend.joystick(0).leftStick = {0.8f, 0.0f};
    joystick.update();

    EXPECT_TRUE(joystick.axisIsPressed("LeftStickX"));
    EXPECT_TRUE(joystick.axisJustPressed("LeftStickX"));
    EXPECT_FALSE(joystick.axisJustReleased("LeftStickX", true));
}

TEST(JoystickManagerTest, FailsOverToNextConnectedJoystick) {
    FakeInputBackend backend;
    JoystickManager joystick(backend);

    backend.setJoystickButton(1, JoystickButton::A, true);
    backend.setJoystickButton(2, JoystickButton::B, true);
    joystick.update();

    EXPECT_EQ(joystick.getActiveJoystick(), 1);
    EXPECT_TRUE(joystick.isPressed("A"));

    backend.disconnectJoystick(1);
    joystick.update();

    EXPECT_EQ(joystick.getActiveJoystick(), 2);
    EXPECT_TRUE(joystick.isPressed("B"));
    EXPECT_TRUE(joystick.justReleased("A"));

    backend.disconnectJoystick(2);
    joystick.update();

    EXPECT_FALSE(joystick.isConnected());
    EXPECT_TRUE(joystick.justReleased("B"));
}

TEST(JoystickManagerTest, UnreadableJoystickIsDisconnected) {
    FakeInputBackend backend;
    JoystickManager joystick(backend);

    backend.setJoystickButton(4, JoystickButton::START, true);
    joystick.update();
    ASSERT_TRUE(joystick.isPressed("Start"));

    backend.setJoystickReadable(4, false);
    joystick.update();

    EXPECT_FALSE(joystick.isConnected());
    EXPECT_FALSE(joystick.isPressed("Start"));
}

// ============================================================================
// Device Service
// ============================================================================

TEST(DeviceServiceTest, UpdateRefreshesBackendOnce) {
    FakeInputBackend backend;
    DeviceService devices(backend);

    devices.update();
    devices.update();

    EXPECT_EQ(backend.getRefreshCount(), 2);
}

TEST(DeviceServiceTest, DispatchesByDevice) {
    FakeInputBackend backend;
    DeviceService devices(backend);

    backend.setKey(KeyCode::D, true);
    backend.setMouseButton(MouseButton::LEFT, true);
    backend.joystick(0).rightStick = {0.0f, 0.8f};
    devices.update();

    EXPECT_TRUE(devices.isPressed(DeviceType::KEYBOARD, "D"));
    EXPECT_TRUE(devices.justPressed(DeviceType::MOUSE, "Left"));
    EXPECT_FLOAT_EQ(devices.getAxis(DeviceType::JOYSTICK, "RightStickY"), 0.8f);
    EXPECT_TRUE(devices.isAxisPressed(DeviceType::JOYSTICK, "RightStickY"));

    // Keyboard has no axes
    EXPECT_FLOAT_EQ(devices.getAxis(DeviceType::KEYBOARD, "D"), 0.0f);
    EXPECT_FALSE(devices.isAxisPressed(DeviceType::KEYBOARD, "D"));

    EXPECT_FALSE(devices.isPressed(DeviceType::NONE, "D"));
}

TEST(DeviceServiceTest, StaticValidation) {
    EXPECT_TRUE(DeviceService::isButton(DeviceType::KEYBOARD, "Escape"));
    EXPECT_FALSE(DeviceService::isAxis(DeviceType::KEYBOARD, "Escape"));
    EXPECT_TRUE(DeviceService::isAxis(DeviceType::MOUSE, "XPosition"));
    EXPECT_TRUE(DeviceService::isButton(DeviceType::JOYSTICK, "DPadUp"));
    EXPECT_FALSE(DeviceService::isButton(DeviceType::JOYSTICK, "LeftStickX"));

    EXPECT_EQ(DeviceService::parse(DeviceType::KEYBOARD, BindingKind::AXIS, "A").error,
              NameParseError::UNKNOWN_NAME);
}
