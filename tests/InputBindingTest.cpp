#include "input/mapping/InputBinding.h"
#include "input/utils/XmlDocument.h"

#include <gtest/gtest.h>

using namespace actuate::input;

namespace {
    std::optional<InputBinding> parseBinding(const std::string& xml) {
        utils::XmlDocument document;
        if (!document.parse(xml)) {
            return std::nullopt;
        }
        const auto root = document.getRoot();
        return root ? InputBinding::fromXml(*root) : std::nullopt;
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST(InputBindingTest, ValidBindings) {
    EXPECT_TRUE(InputBinding::button(DeviceType::KEYBOARD, "D", "A").isValid());
    EXPECT_TRUE(InputBinding::button(DeviceType::KEYBOARD, "", "A").isValid());
    EXPECT_TRUE(InputBinding::button(DeviceType::MOUSE, "Left").isValid());
    EXPECT_TRUE(InputBinding::button(DeviceType::JOYSTICK, "DPadUp", "DPadDown").isValid());
    EXPECT_TRUE(InputBinding::axis(DeviceType::JOYSTICK, "LeftStickX").isValid());
    EXPECT_TRUE(InputBinding::axis(DeviceType::MOUSE, "YPosition").isValid());
}

TEST(InputBindingTest, InvalidBindings) {
    EXPECT_FALSE(InputBinding::button(DeviceType::KEYBOARD, "").isValid());
    EXPECT_FALSE(InputBinding::button(DeviceType::KEYBOARD, "NoSuchKey").isValid());
    EXPECT_FALSE(InputBinding::button(DeviceType::NONE, "A").isValid());
    EXPECT_FALSE(InputBinding::axis(DeviceType::KEYBOARD, "A").isValid());
    EXPECT_FALSE(InputBinding::axis(DeviceType::JOYSTICK, "A").isValid());
    EXPECT_FALSE(InputBinding(DeviceType::JOYSTICK, BindingKind::AXIS, "LeftStickX", "LeftStickY").isValid());
    EXPECT_FALSE(InputBinding::button(DeviceType::JOYSTICK, "LeftStickX").isValid());
}

TEST(InputBindingTest, ValidationErrorNamesTheProblem) {
    EXPECT_TRUE(InputBinding::button(DeviceType::KEYBOARD, "Space").getValidationError().empty());
    EXPECT_EQ(InputBinding::axis(DeviceType::KEYBOARD, "A").getValidationError(), "Keyboard has no axes");
    EXPECT_FALSE(InputBinding::button(DeviceType::KEYBOARD, "Spacebar").getValidationError().empty());
}

// ============================================================================
// Collision
// ============================================================================

TEST(InputBindingTest, CollidesWhenPositiveMatchesOtherNegative) {
    const auto da = InputBinding::button(DeviceType::KEYBOARD, "D", "A");
    const auto ad = InputBinding::button(DeviceType::KEYBOARD, "A", "D");
    const auto aOnly = InputBinding::button(DeviceType::KEYBOARD, "a");
    const auto wS = InputBinding::button(DeviceType::KEYBOARD, "W", "S");

    EXPECT_TRUE(InputBinding::collides(da, ad));
    EXPECT_TRUE(InputBinding::collides(da, aOnly));
    EXPECT_TRUE(InputBinding::collides(aOnly, da));
    EXPECT_FALSE(InputBinding::collides(da, wS));

    // Same sides do not fight
    EXPECT_FALSE(InputBinding::collides(da, da));
}

TEST(InputBindingTest, CollisionNeedsSameDeviceAndKind) {
    const auto keyboard = InputBinding::button(DeviceType::KEYBOARD, "A", "B");
    const auto joystick = InputBinding::button(DeviceType::JOYSTICK, "B", "A");
    EXPECT_FALSE(InputBinding::collides(keyboard, joystick));

    const auto invalid = InputBinding::button(DeviceType::KEYBOARD, "B", "Bogus");
    EXPECT_FALSE(InputBinding::collides(keyboard, invalid));
}

TEST(InputBindingTest, EqualityIgnoresCase) {
    EXPECT_EQ(InputBinding::button(DeviceType::KEYBOARD, "space"),
              InputBinding::button(DeviceType::KEYBOARD, "Space"));
    EXPECT_FALSE(InputBinding::button(DeviceType::KEYBOARD, "Space") ==
        InputBinding::button(DeviceType::KEYBOARD, "Space", "", true));
    EXPECT_FALSE(InputBinding::button(DeviceType::MOUSE, "Left") ==
        InputBinding::button(DeviceType::JOYSTICK, "A"));
}

// ============================================================================
// XML
// ============================================================================

TEST(InputBindingTest, WritesCanonicalXml) {
    EXPECT_EQ(InputBinding::button(DeviceType::KEYBOARD, "D", "A").toXml(),
              R"(<button device="Keyboard" positive="D" negative="A" invert="false"/>)");
    EXPECT_EQ(InputBinding::button(DeviceType::KEYBOARD, "", "A").toXml(2),
              R"(  <button device="Keyboard" negative="A" invert="false"/>)");
    EXPECT_EQ(InputBinding::axis(DeviceType::JOYSTICK, "LeftStickX", true).toXml(),
              R"(<axis device="Joystick" value="LeftStickX" invert="true"/>)");
}

TEST(InputBindingTest, ParsesCaseInsensitively) {
    const auto binding = parseBinding(R"(<BUTTON Device="keyboard" POSITIVE="d" negative="A" Invert="TRUE"/>)");
    ASSERT_TRUE(binding.has_value());
    EXPECT_EQ(binding->device, DeviceType::KEYBOARD);
    EXPECT_EQ(binding->kind, BindingKind::BUTTON);
    EXPECT_EQ(binding->positive, "d");
    EXPECT_EQ(binding->negative, "A");
    EXPECT_TRUE(binding->invert);
}

TEST(InputBindingTest, ParsesAxisAndValueAlias) {
    const auto axis = parseBinding(R"(<axis device="Joystick" value="LeftStickY"/>)");
    ASSERT_TRUE(axis.has_value());
    EXPECT_EQ(axis->kind, BindingKind::AXIS);
    EXPECT_EQ(axis->positive, "LeftStickY");
    EXPECT_FALSE(axis->invert);

    const auto button = parseBinding(R"(<button device="Mouse" value="Middle"/>)");
    ASSERT_TRUE(button.has_value());
    EXPECT_EQ(button->positive, "Middle");
}

TEST(InputBindingTest, RejectsBadElements) {
    EXPECT_FALSE(parseBinding(R"(<button positive="A"/>)").has_value());
    EXPECT_FALSE(parseBinding(R"(<button device="Gamepad" positive="A"/>)").has_value());
    EXPECT_FALSE(parseBinding(R"(<button device="Keyboard"/>)").has_value());
    EXPECT_FALSE(parseBinding(R"(<button device="Keyboard" positive="Blorp"/>)").has_value());
    EXPECT_FALSE(parseBinding(R"(<button device="Keyboard" positive="A" invert="yes"/>)").has_value());
    EXPECT_FALSE(parseBinding(R"(<axis device="Joystick"/>)").has_value());
    EXPECT_FALSE(parseBinding(R"(<axis device="Keyboard" value="A"/>)").has_value());
    EXPECT_FALSE(parseBinding(R"(<trigger device="Joystick" value="LT"/>)").has_value());
}

TEST(InputBindingTest, XmlRoundTrip) {
    const auto original = InputBinding::button(DeviceType::JOYSTICK, "RB", "LB", true);
    const auto parsed = parseBinding(original.toXml());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, original);
}
