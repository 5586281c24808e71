#include "input/mapping/ActionSet.h"
#include "input/utils/FileIO.h"

#include "support/TempDirectory.h"

#include <gtest/gtest.h>

using namespace actuate::input;
using actuate::input::test::TempDirectory;

namespace {
    ActionSet makeSampleSet() {
        ActionSet set;
        set.add(Action("horizontal", {
                           InputBinding::axis(DeviceType::JOYSTICK, "LeftStickX"),
                           InputBinding::button(DeviceType::KEYBOARD, "D", "A")
                       }));
        set.add(Action("Jump", {
                           InputBinding::button(DeviceType::KEYBOARD, "Space"),
                           InputBinding::button(DeviceType::JOYSTICK, "A", "", true)
                       }));
        set.add(Action("idle"));
        return set;
    }

    const char* SAMPLE_DOCUMENT = R"(<?xml version="1.0"?>
<input>
  <action_set>
    <action name="horizontal">
      <axis device="Joystick" value="LeftStickX" invert="false"/>
      <button device="Keyboard" positive="D" negative="A" invert="false"/>
    </action>
    <action name="fire">
      <button device="Mouse" positive="Left"/>
    </action>
  </action_set>
</input>
)";
}

// ============================================================================
// Membership
// ============================================================================

TEST(ActionSetTest, LookupIsCaseInsensitive) {
    const ActionSet set = makeSampleSet();

    EXPECT_EQ(set.size(), 3u);
    EXPECT_TRUE(set.contains("jump"));
    EXPECT_TRUE(set.contains("JUMP"));
    ASSERT_NE(set.get("Horizontal"), nullptr);
    EXPECT_EQ(set.get("Horizontal")->size(), 2u);
    EXPECT_EQ(set.get("missing"), nullptr);
}

TEST(ActionSetTest, AddWithoutReplaceKeepsOriginal) {
    ActionSet set = makeSampleSet();

    const Action replacement("JUMP", {InputBinding::button(DeviceType::MOUSE, "Right")});
    EXPECT_FALSE(set.add(replacement));
    EXPECT_EQ(set.get("jump")->getName(), "Jump");
    EXPECT_EQ(set.get("jump")->size(), 2u);

    EXPECT_TRUE(set.add(replacement, true));
    EXPECT_EQ(set.get("jump")->getName(), "JUMP");
    EXPECT_EQ(set.get("jump")->size(), 1u);
    EXPECT_EQ(set.size(), 3u);
}

TEST(ActionSetTest, RejectsInvalidActions) {
    ActionSet set;
    EXPECT_FALSE(set.add(Action()));
    EXPECT_TRUE(set.empty());
}

TEST(ActionSetTest, AddListAndRemove) {
    ActionSet set;
    const std::size_t added = set.add(std::vector<Action>{Action("a"), Action("b"), Action("A")});
    EXPECT_EQ(added, 2u);

    EXPECT_TRUE(set.remove("B"));
    EXPECT_FALSE(set.remove("b"));
    EXPECT_TRUE(set.remove(Action("a")));
    EXPECT_TRUE(set.empty());
}

TEST(ActionSetTest, IteratesInLowercaseNameOrder) {
    const ActionSet set = makeSampleSet();

    std::vector<std::string> names;
    for (const auto& [key, action] : set) {
        names.push_back(action.getName());
    }

    EXPECT_EQ(names, (std::vector<std::string>{"horizontal", "idle", "Jump"}));
}

// ============================================================================
// Serialization
// ============================================================================

TEST(ActionSetTest, EmptySetSerializesAsEmptyElement) {
    EXPECT_EQ(ActionSet().toString(), "<action_set/>");
}

TEST(ActionSetTest, StringRoundTrip) {
    const ActionSet original = makeSampleSet();

    ActionSet loaded;
    ASSERT_TRUE(loaded.loadFromString(original.toDocument()));
    EXPECT_EQ(loaded, original);
    EXPECT_EQ(loaded.toDocument(), original.toDocument());
}

TEST(ActionSetTest, LoadsBareActionSetElement) {
    ActionSet set;
    ASSERT_TRUE(set.loadFromString(R"(<action_set><action name="go"/></action_set>)"));
    EXPECT_TRUE(set.contains("go"));
}

TEST(ActionSetTest, LoadsSampleDocument) {
    ActionSet set;
    ASSERT_TRUE(set.loadFromString(SAMPLE_DOCUMENT));

    ASSERT_EQ(set.size(), 2u);
    const Action* horizontal = set.get("horizontal");
    ASSERT_NE(horizontal, nullptr);
    EXPECT_EQ(horizontal->get(0)->kind, BindingKind::AXIS);
    EXPECT_EQ(horizontal->get(1)->positive, "D");
}

TEST(ActionSetTest, FailedLoadLeavesSetUntouched) {
    ActionSet set = makeSampleSet();
    const ActionSet before = set;

    // Unknown key
    EXPECT_FALSE(set.loadFromString(R"(
        <input><action_set>
          <action name="ok"/>
          <action name="bad"><button device="Keyboard" positive="NotAKey"/></action>
        </action_set></input>)"));

    // Duplicate names
    EXPECT_FALSE(set.loadFromString(R"(
        <action_set><action name="x"/><action name="X"/></action_set>)"));

    // Malformed
    EXPECT_FALSE(set.loadFromString("<input><action_set>"));

    // Wrong root
    EXPECT_FALSE(set.loadFromString("<bindings/>"));
    EXPECT_FALSE(set.loadFromString("<input/>"));

    EXPECT_EQ(set, before);
}

// ============================================================================
// Files
// ============================================================================

TEST(ActionSetTest, SaveAndLoadFile) {
    TempDirectory dir;
    const std::string path = dir.file("nested/input.xml");

    const ActionSet original = makeSampleSet();
    ASSERT_TRUE(original.saveToFile(path));

    ActionSet loaded;
    ASSERT_TRUE(loaded.loadFromFile(path));
    EXPECT_EQ(loaded, original);

    // Save, load, save is stable
    const auto first = utils::readFileContents(path);
    ASSERT_TRUE(loaded.saveToFile(path));
    EXPECT_EQ(utils::readFileContents(path), first);
}

TEST(ActionSetTest, SaveWithoutOverwriteFailsOnExistingFile) {
    TempDirectory dir;
    const std::string path = dir.file("input.xml");

    ASSERT_TRUE(makeSampleSet().saveToFile(path));
    EXPECT_FALSE(ActionSet().saveToFile(path, false));

    ActionSet loaded;
    ASSERT_TRUE(loaded.loadFromFile(path));
    EXPECT_EQ(loaded.size(), 3u);
}

TEST(ActionSetTest, MissingFileFails) {
    TempDirectory dir;
    ActionSet set = makeSampleSet();
    EXPECT_FALSE(set.loadFromFile(dir.file("absent.xml")));
    EXPECT_EQ(set.size(), 3u);
}
