#include "input/mapping/Action.h"
#include "input/devices/base/DeviceService.h"
#include "input/utils/XmlDocument.h"

#include "support/FakeInputBackend.h"

#include <gtest/gtest.h>

#include <string>

using namespace actuate::input;
using actuate::input::test::FakeInputBackend;

namespace {
    class ActionTest : public ::testing::Test {
    protected:
        FakeInputBackend backend;
        DeviceService devices{backend};

        // Joystick stick first, then keyboard D/A
        Action horizontal{"horizontal", {
                              InputBinding::axis(DeviceType::JOYSTICK, "LeftStickX"),
                              InputBinding::button(DeviceType::KEYBOARD, "D", "A")
                          }};

        void SetUp() override {
            backend.connectJoystick(0);
        }
    };

    bool loadAction(Action& action, const std::string& xml) {
        utils::XmlDocument document;
        if (!document.parse(xml)) {
            return false;
        }
        const auto root = document.getRoot();
        return root && action.loadFromXml(*root);
    }
}

// ============================================================================
// Value Resolution
// ============================================================================

TEST_F(ActionTest, FirstNonNeutralBindingWins) {
    backend.setKey(KeyCode::D, true);
    devices.update();
    EXPECT_FLOAT_EQ(horizontal.getValue(devices), 1.0f);

    backend.joystick(0).leftStick.x = 0.6f;
    devices.update();
    EXPECT_FLOAT_EQ(horizontal.getValue(devices), 0.6f);
}

TEST_F(ActionTest, ButtonPairResolvesToSign) {
    backend.setKey(KeyCode::A, true);
    devices.update();
    EXPECT_FLOAT_EQ(horizontal.getValue(devices), -1.0f);
    EXPECT_TRUE(horizontal.isNegative(devices));
    EXPECT_FALSE(horizontal.isPositive(devices));

    // Both sides held is neutral
    backend.setKey(KeyCode::D, true);
    devices.update();
    EXPECT_FLOAT_EQ(horizontal.getValue(devices), 0.0f);
    EXPECT_FALSE(horizontal.isPressed(devices));
}

TEST_F(ActionTest, InvertFlipsValue) {
    Action action("steer", {
                      InputBinding::axis(DeviceType::JOYSTICK, "RightStickX", true),
                      InputBinding::button(DeviceType::KEYBOARD, "Right", "Left", true)
                  });

    backend.joystick(0).rightStick.x = 0.5f;
    devices.update();
    EXPECT_FLOAT_EQ(action.getValue(devices), -0.5f);

    backend.joystick(0).rightStick.x = 0.0f;
    backend.setKey(KeyCode::RIGHT, true);
    devices.update();
    EXPECT_FLOAT_EQ(action.getValue(devices), -1.0f);
    EXPECT_TRUE(action.isPressed(devices));
}

TEST_F(ActionTest, IsPressedUsesThresholdForAxes) {
    backend.joystick(0).leftStick.x = 0.3f;
    devices.update();
    EXPECT_FALSE(horizontal.isPressed(devices));

    backend.joystick(0).leftStick.x = 0.45f;
    devices.update();
    EXPECT_TRUE(horizontal.isPressed(devices));

    // Stick pushed the other way decides before the keyboard
    backend.joystick(0).leftStick.x = -0.45f;
    backend.setKey(KeyCode::D, true);
    devices.update();
    EXPECT_FALSE(horizontal.isPressed(devices));
}

TEST_F(ActionTest, NoBindingsReadsNeutral) {
    const Action empty("idle");
    devices.update();
    EXPECT_FLOAT_EQ(empty.getValue(devices), 0.0f);
    EXPECT_FALSE(empty.isPressed(devices));
    EXPECT_FALSE(empty.justPressed(devices));
}

// ============================================================================
// Edges
// ============================================================================

TEST_F(ActionTest, EdgesOrAcrossBindings) {
    Action jump("jump", {
                    InputBinding::button(DeviceType::KEYBOARD, "Space"),
                    InputBinding::button(DeviceType::JOYSTICK, "A")
                });

    backend.setJoystickButton(0, JoystickButton::A, true);
    devices.update();
    EXPECT_TRUE(jump.justPressed(devices));
    EXPECT_FALSE(jump.justReleased(devices));

    devices.update();
    EXPECT_FALSE(jump.justPressed(devices));
    EXPECT_TRUE(jump.isPressed(devices));

    // Keyboard press while the joystick button stays held still fires
    backend.setKey(KeyCode::SPACE, true);
    devices.update();
    EXPECT_TRUE(jump.justPressed(devices));

    backend.setJoystickButton(0, JoystickButton::A, false);
    devices.update();
    EXPECT_TRUE(jump.justReleased(devices));
}

TEST_F(ActionTest, NegativeEdgeDoesNotFire) {
    backend.setKey(KeyCode::A, true);
    devices.update();
    EXPECT_FALSE(horizontal.justPressed(devices));

    backend.setKey(KeyCode::A, false);
    devices.update();
    EXPECT_FALSE(horizontal.justReleased(devices));
}

TEST_F(ActionTest, AxisEdgesAreThresholdCrossings) {
    backend.joystick(0).leftStick.x = 0.2f;
    devices.update();
    EXPECT_FALSE(horizontal.justPressed(devices));

    backend.joystick(0).leftStick.x = 0.8f;
    devices.update();
    EXPECT_TRUE(horizontal.justPressed(devices));

    backend.joystick(0).leftStick.x = 0.9f;
    devices.update();
    EXPECT_FALSE(horizontal.justPressed(devices));

    backend.joystick(0).leftStick.x = 0.0f;
    devices.update();
    EXPECT_TRUE(horizontal.justReleased(devices));
}

TEST_F(ActionTest, InvertLeavesPressAndEdgesAlone) {
    Action strafe("strafe", {InputBinding::button(DeviceType::KEYBOARD, "D", "A", true)});

    backend.setKey(KeyCode::D, true);
    devices.update();
    EXPECT_FLOAT_EQ(strafe.getValue(devices), -1.0f);
    EXPECT_TRUE(strafe.isPressed(devices));
    EXPECT_TRUE(strafe.justPressed(devices));
    EXPECT_TRUE(strafe.isNegative(devices));

    backend.setKey(KeyCode::D, false);
    devices.update();
    EXPECT_TRUE(strafe.justReleased(devices));

    // Holding only the negative side never presses the action
    backend.setKey(KeyCode::A, true);
    devices.update();
    EXPECT_FLOAT_EQ(strafe.getValue(devices), 1.0f);
    EXPECT_FALSE(strafe.isPressed(devices));
    EXPECT_FALSE(strafe.justPressed(devices));
}

// ============================================================================
// Binding Management
// ============================================================================

TEST(ActionBindingsTest, AddRejectsCollisionsAndInvalid) {
    Action action("move");

    EXPECT_TRUE(action.add(InputBinding::button(DeviceType::KEYBOARD, "D", "A")));
    EXPECT_FALSE(action.add(InputBinding::button(DeviceType::KEYBOARD, "A")));
    EXPECT_FALSE(action.add(InputBinding::button(DeviceType::KEYBOARD, "W", "d")));
    EXPECT_FALSE(action.add(InputBinding::button(DeviceType::KEYBOARD, "Bogus")));
    EXPECT_TRUE(action.add(InputBinding::button(DeviceType::JOYSTICK, "A")));

    EXPECT_EQ(action.size(), 2u);
    EXPECT_TRUE(action.isValid());
}

TEST(ActionBindingsTest, AddListCountsAccepted) {
    Action action("move");
    const std::size_t added = action.add(std::vector<InputBinding>{
        InputBinding::button(DeviceType::KEYBOARD, "Right", "Left"),
        InputBinding::button(DeviceType::KEYBOARD, "Left"),
        InputBinding::axis(DeviceType::JOYSTICK, "LeftStickX")
    });

    EXPECT_EQ(added, 2u);
    EXPECT_EQ(action.get(1)->kind, BindingKind::AXIS);
}

TEST(ActionBindingsTest, SetRechecksCollisionsAgainstOthers) {
    Action action("move", {
                      InputBinding::button(DeviceType::KEYBOARD, "D", "A"),
                      InputBinding::button(DeviceType::KEYBOARD, "W", "S")
                  });

    // Replacing a binding with its own mirror is fine
    EXPECT_TRUE(action.set(0, InputBinding::button(DeviceType::KEYBOARD, "A", "D")));
    EXPECT_FALSE(action.set(1, InputBinding::button(DeviceType::KEYBOARD, "D")));
    EXPECT_FALSE(action.set(5, InputBinding::button(DeviceType::KEYBOARD, "Q")));
    EXPECT_EQ(action.get(1)->positive, "W");
}

TEST(ActionBindingsTest, RemoveAndLookup) {
    Action action("fire", {
                      InputBinding::button(DeviceType::MOUSE, "Left"),
                      InputBinding::button(DeviceType::JOYSTICK, "RT")
                  });

    EXPECT_TRUE(action.contains(InputBinding::button(DeviceType::MOUSE, "left")));
    EXPECT_TRUE(action.remove(InputBinding::button(DeviceType::MOUSE, "LEFT")));
    EXPECT_FALSE(action.contains(InputBinding::button(DeviceType::MOUSE, "Left")));
    EXPECT_FALSE(action.remove(3));
    EXPECT_EQ(action.get(3), nullptr);

    EXPECT_TRUE(action.remove(0));
    EXPECT_TRUE(action.empty());
}

TEST(ActionBindingsTest, NamesAreNormalized) {
    Action action("  move left ");
    EXPECT_EQ(action.getName(), "move_left");
    EXPECT_TRUE(action.isValid());

    EXPECT_TRUE(action.setName("2fast"));
    EXPECT_EQ(action.getName(), "_2fast");

    EXPECT_FALSE(action.setName("   "));
    EXPECT_EQ(action.getName(), "_2fast");
}

TEST(ActionBindingsTest, LongNamesAreCut) {
    Action action(std::string(200, 'a'));
    EXPECT_EQ(action.getName().size(), MAX_ACTION_NAME_LENGTH);
    EXPECT_TRUE(action.isValid());

    EXPECT_TRUE(action.setName("9" + std::string(200, 'b')));
    EXPECT_EQ(action.getName().size(), MAX_ACTION_NAME_LENGTH);
    EXPECT_EQ(action.getName().front(), '_');
    EXPECT_TRUE(action.isValid());
}

// ============================================================================
// XML
// ============================================================================

TEST(ActionXmlTest, WritesEmptyAndPopulatedActions) {
    EXPECT_EQ(Action("idle").toXml(), R"(<action name="idle"/>)");

    const Action jump("jump", {InputBinding::button(DeviceType::KEYBOARD, "Space")});
    EXPECT_EQ(jump.toXml(),
              "<action name=\"jump\">\n"
              "  <button device=\"Keyboard\" positive=\"Space\" invert=\"false\"/>\n"
              "</action>");
}

TEST(ActionXmlTest, LoadsBindingsInOrderAndSkipsUnknownChildren) {
    Action action;
    ASSERT_TRUE(loadAction(action, R"(
        <action name="horizontal">
          <axis device="Joystick" value="LeftStickX"/>
          <note text="ignored"/>
          <button device="Keyboard" positive="D" negative="A"/>
        </action>)"));

    EXPECT_EQ(action.getName(), "horizontal");
    ASSERT_EQ(action.size(), 2u);
    EXPECT_EQ(action.get(0)->kind, BindingKind::AXIS);
    EXPECT_EQ(action.get(1)->negative, "A");
}

TEST(ActionXmlTest, FailedLoadLeavesActionUnchanged) {
    Action action("keep", {InputBinding::button(DeviceType::KEYBOARD, "K")});

    EXPECT_FALSE(loadAction(action, R"(<action name="x"><button device="Keyboard" positive="Nope"/></action>)"));
    EXPECT_FALSE(loadAction(action, R"(<action><button device="Keyboard" positive="A"/></action>)"));
    EXPECT_FALSE(loadAction(action, R"(<action name="9lives"/>)"));
    EXPECT_FALSE(loadAction(action, R"(
        <action name="x">
          <button device="Keyboard" positive="D" negative="A"/>
          <button device="Keyboard" positive="A"/>
        </action>)"));

    EXPECT_EQ(action.getName(), "keep");
    EXPECT_EQ(action.size(), 1u);
}
