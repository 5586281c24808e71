#include "input/core/NameTable.h"
#include "input/core/InputTypes.h"

#include <gtest/gtest.h>

using namespace actuate::input;

TEST(NameTableTest, ParsesSymbolicNamesCaseInsensitively) {
    const auto& keys = getKeyboardKeyTable();

    EXPECT_EQ(keys.parse("Space").index, static_cast<std::uint32_t>(KeyCode::SPACE));
    EXPECT_EQ(keys.parse("space").index, static_cast<std::uint32_t>(KeyCode::SPACE));
    EXPECT_EQ(keys.parse("  LSHIFT ").index, static_cast<std::uint32_t>(KeyCode::LEFT_SHIFT));
    EXPECT_EQ(keys.parse("Num1").index, static_cast<std::uint32_t>(KeyCode::NUM_1));
}

TEST(NameTableTest, ParsesNumericIndices) {
    const auto& keys = getKeyboardKeyTable();

    const auto result = keys.parse("44");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.index, static_cast<std::uint32_t>(KeyCode::SPACE));

    // Valid index without a symbolic name
    EXPECT_TRUE(keys.parse("200").ok());
}

TEST(NameTableTest, ReportsErrors) {
    const auto& keys = getKeyboardKeyTable();

    EXPECT_EQ(keys.parse("").error, NameParseError::EMPTY);
    EXPECT_EQ(keys.parse("   ").error, NameParseError::EMPTY);
    EXPECT_EQ(keys.parse("NotAKey").error, NameParseError::UNKNOWN_NAME);
    EXPECT_EQ(keys.parse("0").error, NameParseError::INDEX_OUT_OF_RANGE);
    EXPECT_EQ(keys.parse("256").error, NameParseError::INDEX_OUT_OF_RANGE);
    EXPECT_EQ(keys.parse("99999999999999999999").error, NameParseError::INDEX_OUT_OF_RANGE);
    EXPECT_FALSE(keys.parse("-1").ok());
}

TEST(NameTableTest, NameOfPrefersSymbolicName) {
    const auto& keys = getKeyboardKeyTable();

    EXPECT_EQ(keys.nameOf(static_cast<std::uint32_t>(KeyCode::A)), "A");
    EXPECT_EQ(keys.nameOf(200), "200");
    EXPECT_EQ(keys.nameOf(0), "");
}

TEST(NameTableTest, MouseTables) {
    EXPECT_EQ(getMouseButtonTable().parse("XButton2").index, 4u);
    EXPECT_EQ(getMouseButtonTable().parse("0").index, 0u);
    EXPECT_FALSE(getMouseButtonTable().parse("5").ok());

    EXPECT_EQ(getMouseAxisTable().parse("YPosition").index, 1u);
    EXPECT_FALSE(getMouseAxisTable().parse("Wheel").ok());
}

TEST(NameTableTest, JoystickTables) {
    const auto& buttons = getJoystickButtonTable();
    EXPECT_EQ(buttons.parse("A").index, 0u);
    EXPECT_EQ(buttons.parse("lt").index, static_cast<std::uint32_t>(JoystickButton::LEFT_TRIGGER));
    EXPECT_EQ(buttons.parse("DPadRight").index, 16u);
    EXPECT_FALSE(buttons.parse("17").ok());

    const auto& axes = getJoystickAxisTable();
    EXPECT_EQ(axes.parse("LeftStickX").index, 0u);
    EXPECT_EQ(axes.parse("Triggers").index, 6u);
    EXPECT_EQ(axes.getMaxIndex(), 6u);
}
