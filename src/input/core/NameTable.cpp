/**
 * @file NameTable.cpp
 * @brief Device name tables implementation
 * @author Actuate Team
 * @date 2025
 */

#include "NameTable.h"

#include "InputTypes.h"

#include "../utils/InputUtils.h"

namespace actuate::input {
    const char* nameParseErrorToString(const NameParseError error) {
        switch (error) {
        case NameParseError::NONE: return "None";
        case NameParseError::EMPTY: return "Empty identifier";
        case NameParseError::UNKNOWN_NAME: return "Unknown name";
        case NameParseError::INDEX_OUT_OF_RANGE: return "Index out of range";
        default: return "Unknown error";
        }
    }

    NameTable::NameTable(const std::initializer_list<Entry> entries, const std::uint32_t minIndex,
                         const std::uint32_t maxIndex)
        : minIndex_(minIndex)
          , maxIndex_(maxIndex) {
        nameToIndex_.reserve(entries.size());
        indexToName_.reserve(entries.size());

        for (const auto& [index, name] : entries) {
            nameToIndex_.emplace(utils::toLower(name), index);
            indexToName_.emplace(index, name);
        }
    }

    NameParseResult NameTable::parse(const std::string_view text) const {
        NameParseResult result;

        const auto trimmed = utils::trim(text);
        if (trimmed.empty()) {
            result.error = NameParseError::EMPTY;
            return result;
        }

        if (const auto it = nameToIndex_.find(utils::toLower(trimmed)); it != nameToIndex_.end()) {
            result.index = it->second;
            return result;
        }

        const auto index = utils::parseIndex(trimmed);
        if (!index) {
            // A digit string too large for uint32 is still an index
            const bool allDigits = std::ranges::all_of(trimmed, utils::isDigitChar);
            result.error = allDigits ? NameParseError::INDEX_OUT_OF_RANGE : NameParseError::UNKNOWN_NAME;
            return result;
        }

        if (!isValidIndex(*index)) {
            result.error = NameParseError::INDEX_OUT_OF_RANGE;
            return result;
        }

        result.index = *index;
        return result;
    }

    std::string NameTable::nameOf(const std::uint32_t index) const {
        if (!isValidIndex(index)) {
            return {};
        }
        if (const auto it = indexToName_.find(index); it != indexToName_.end()) {
            return it->second;
        }
        return std::to_string(index);
    }

    // ============================================================================
    // Device Tables
    // ============================================================================

    namespace {
        template <typename Enum>
        constexpr std::uint32_t idx(const Enum value) noexcept {
            return static_cast<std::uint32_t>(value);
        }
    } // namespace

    const NameTable& getKeyboardKeyTable() {
        static const NameTable table({
                                         // Letters
                                         {idx(KeyCode::A), "A"}, {idx(KeyCode::B), "B"}, {idx(KeyCode::C), "C"},
                                         {idx(KeyCode::D), "D"}, {idx(KeyCode::E), "E"}, {idx(KeyCode::F), "F"},
                                         {idx(KeyCode::G), "G"}, {idx(KeyCode::H), "H"}, {idx(KeyCode::I), "I"},
                                         {idx(KeyCode::J), "J"}, {idx(KeyCode::K), "K"}, {idx(KeyCode::L), "L"},
                                         {idx(KeyCode::M), "M"}, {idx(KeyCode::N), "N"}, {idx(KeyCode::O), "O"},
                                         {idx(KeyCode::P), "P"}, {idx(KeyCode::Q), "Q"}, {idx(KeyCode::R), "R"},
                                         {idx(KeyCode::S), "S"}, {idx(KeyCode::T), "T"}, {idx(KeyCode::U), "U"},
                                         {idx(KeyCode::V), "V"}, {idx(KeyCode::W), "W"}, {idx(KeyCode::X), "X"},
                                         {idx(KeyCode::Y), "Y"}, {idx(KeyCode::Z), "Z"},

                                         // Numbers
                                         {idx(KeyCode::NUM_0), "Num0"}, {idx(KeyCode::NUM_1), "Num1"},
                                         {idx(KeyCode::NUM_2), "Num2"}, {idx(KeyCode::NUM_3), "Num3"},
                                         {idx(KeyCode::NUM_4), "Num4"}, {idx(KeyCode::NUM_5), "Num5"},
                                         {idx(KeyCode::NUM_6), "Num6"}, {idx(KeyCode::NUM_7), "Num7"},
                                         {idx(KeyCode::NUM_8), "Num8"}, {idx(KeyCode::NUM_9), "Num9"},

                                         // Control keys
                                         {idx(KeyCode::ESCAPE), "Escape"},
                                         {idx(KeyCode::ENTER), "Enter"},
                                         {idx(KeyCode::BACKSPACE), "Backspace"},
                                         {idx(KeyCode::TAB), "Tab"},
                                         {idx(KeyCode::SPACE), "Space"},
                                         {idx(KeyCode::INSERT), "Insert"},
                                         {idx(KeyCode::DELETE), "Delete"},
                                         {idx(KeyCode::HOME), "Home"},
                                         {idx(KeyCode::END), "End"},
                                         {idx(KeyCode::PAGE_UP), "PageUp"},
                                         {idx(KeyCode::PAGE_DOWN), "PageDown"},
                                         {idx(KeyCode::LEFT), "Left"},
                                         {idx(KeyCode::RIGHT), "Right"},
                                         {idx(KeyCode::UP), "Up"},
                                         {idx(KeyCode::DOWN), "Down"},

                                         // Locks and system
                                         {idx(KeyCode::PAUSE), "Pause"},
                                         {idx(KeyCode::CAPS_LOCK), "CapsLock"},
                                         {idx(KeyCode::PRINT_SCREEN), "PrintScreen"},
                                         {idx(KeyCode::SCROLL_LOCK), "ScrollLock"},
                                         {idx(KeyCode::NUM_LOCK), "NumLock"},
                                         {idx(KeyCode::APPLICATION), "Menu"},

                                         // Modifiers
                                         {idx(KeyCode::LEFT_CTRL), "LControl"},
                                         {idx(KeyCode::LEFT_SHIFT), "LShift"},
                                         {idx(KeyCode::LEFT_ALT), "LAlt"},
                                         {idx(KeyCode::LEFT_SUPER), "LSystem"},
                                         {idx(KeyCode::RIGHT_CTRL), "RControl"},
                                         {idx(KeyCode::RIGHT_SHIFT), "RShift"},
                                         {idx(KeyCode::RIGHT_ALT), "RAlt"},
                                         {idx(KeyCode::RIGHT_SUPER), "RSystem"},

                                         // Symbols
                                         {idx(KeyCode::LEFT_BRACKET), "LBracket"},
                                         {idx(KeyCode::RIGHT_BRACKET), "RBracket"},
                                         {idx(KeyCode::SEMICOLON), "Semicolon"},
                                         {idx(KeyCode::COMMA), "Comma"},
                                         {idx(KeyCode::PERIOD), "Period"},
                                         {idx(KeyCode::APOSTROPHE), "Quote"},
                                         {idx(KeyCode::SLASH), "Slash"},
                                         {idx(KeyCode::BACKSLASH), "Backslash"},
                                         {idx(KeyCode::GRAVE), "Tilde"},
                                         {idx(KeyCode::EQUAL), "Equal"},
                                         {idx(KeyCode::MINUS), "Hyphen"},

                                         // Numpad
                                         {idx(KeyCode::KP_ADD), "Add"},
                                         {idx(KeyCode::KP_SUBTRACT), "Subtract"},
                                         {idx(KeyCode::KP_MULTIPLY), "Multiply"},
                                         {idx(KeyCode::KP_DIVIDE), "Divide"},
                                         {idx(KeyCode::KP_ENTER), "NumpadEnter"},
                                         {idx(KeyCode::KP_DECIMAL), "NumpadDecimal"},
                                         {idx(KeyCode::KP_0), "Numpad0"}, {idx(KeyCode::KP_1), "Numpad1"},
                                         {idx(KeyCode::KP_2), "Numpad2"}, {idx(KeyCode::KP_3), "Numpad3"},
                                         {idx(KeyCode::KP_4), "Numpad4"}, {idx(KeyCode::KP_5), "Numpad5"},
                                         {idx(KeyCode::KP_6), "Numpad6"}, {idx(KeyCode::KP_7), "Numpad7"},
                                         {idx(KeyCode::KP_8), "Numpad8"}, {idx(KeyCode::KP_9), "Numpad9"},

                                         // Function keys
                                         {idx(KeyCode::F1), "F1"}, {idx(KeyCode::F2), "F2"},
                                         {idx(KeyCode::F3), "F3"}, {idx(KeyCode::F4), "F4"},
                                         {idx(KeyCode::F5), "F5"}, {idx(KeyCode::F6), "F6"},
                                         {idx(KeyCode::F7), "F7"}, {idx(KeyCode::F8), "F8"},
                                         {idx(KeyCode::F9), "F9"}, {idx(KeyCode::F10), "F10"},
                                         {idx(KeyCode::F11), "F11"}, {idx(KeyCode::F12), "F12"},
                                         {idx(KeyCode::F13), "F13"}, {idx(KeyCode::F14), "F14"},
                                         {idx(KeyCode::F15), "F15"},
                                     }, 1, static_cast<std::uint32_t>(KEY_COUNT - 1));
        return table;
    }

    const NameTable& getMouseButtonTable() {
        static const NameTable table({
                                         {idx(MouseButton::LEFT), "Left"},
                                         {idx(MouseButton::RIGHT), "Right"},
                                         {idx(MouseButton::MIDDLE), "Middle"},
                                         {idx(MouseButton::X_BUTTON_1), "XButton1"},
                                         {idx(MouseButton::X_BUTTON_2), "XButton2"},
                                     }, 0, static_cast<std::uint32_t>(MOUSE_BUTTON_COUNT - 1));
        return table;
    }

    const NameTable& getMouseAxisTable() {
        static const NameTable table({
                                         {idx(MouseAxis::X_POSITION), "XPosition"},
                                         {idx(MouseAxis::Y_POSITION), "YPosition"},
                                     }, 0, static_cast<std::uint32_t>(MOUSE_AXIS_COUNT - 1));
        return table;
    }

    const NameTable& getJoystickButtonTable() {
        static const NameTable table({
                                         {idx(JoystickButton::A), "A"},
                                         {idx(JoystickButton::B), "B"},
                                         {idx(JoystickButton::X), "X"},
                                         {idx(JoystickButton::Y), "Y"},
                                         {idx(JoystickButton::START), "Start"},
                                         {idx(JoystickButton::BACK), "Back"},
                                         {idx(JoystickButton::GUIDE), "Guide"},
                                         {idx(JoystickButton::LEFT_BUMPER), "LB"},
                                         {idx(JoystickButton::RIGHT_BUMPER), "RB"},
                                         {idx(JoystickButton::LEFT_TRIGGER), "LT"},
                                         {idx(JoystickButton::RIGHT_TRIGGER), "RT"},
                                         {idx(JoystickButton::LEFT_STICK), "LS"},
                                         {idx(JoystickButton::RIGHT_STICK), "RS"},
                                         {idx(JoystickButton::DPAD_UP), "DPadUp"},
                                         {idx(JoystickButton::DPAD_DOWN), "DPadDown"},
                                         {idx(JoystickButton::DPAD_LEFT), "DPadLeft"},
                                         {idx(JoystickButton::DPAD_RIGHT), "DPadRight"},
                                     }, 0, static_cast<std::uint32_t>(JOYSTICK_BUTTON_COUNT - 1));
        return table;
    }

    const NameTable& getJoystickAxisTable() {
        static const NameTable table({
                                         {idx(JoystickAxis::LEFT_STICK_X), "LeftStickX"},
                                         {idx(JoystickAxis::LEFT_STICK_Y), "LeftStickY"},
                                         {idx(JoystickAxis::RIGHT_STICK_X), "RightStickX"},
                                         {idx(JoystickAxis::RIGHT_STICK_Y), "RightStickY"},
                                         {idx(JoystickAxis::LEFT_TRIGGER), "LeftTrigger"},
                                         {idx(JoystickAxis::RIGHT_TRIGGER), "RightTrigger"},
                                         {idx(JoystickAxis::TRIGGERS), "Triggers"},
                                     }, 0, static_cast<std::uint32_t>(JOYSTICK_AXIS_COUNT - 1));
        return table;
    }
} // namespace actuate::input
