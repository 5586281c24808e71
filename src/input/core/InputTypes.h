/**
 * @file InputTypes.h
 * @brief Core type definitions for the input system
 * @author Actuate Team
 * @date 2025
 *
 * Defines the device classes, binding kinds and the platform-independent
 * key, button and axis identifiers. Platform-agnostic definitions only.
 */

#pragma once

#include "../utils/InputUtils.h"

#include <cstdint>
#include <optional>
#include <string_view>

namespace actuate::input {
    // ============================================================================
    // Forward Declarations
    // ============================================================================

    class KeyboardManager;
    class MouseManager;
    class JoystickManager;
    class DeviceService;
    class IInputBackend;

    // ============================================================================
    // Type Aliases
    // ============================================================================

    using JoystickId = std::int32_t;
    using FrameNumber = std::uint64_t;

    constexpr JoystickId INVALID_JOYSTICK_ID = -1;

    // ============================================================================
    // Device Types
    // ============================================================================

    /**
     * @brief Device classes an action can be bound to
     */
    enum class DeviceType : std::uint8_t {
        NONE = 0,
        KEYBOARD,
        MOUSE,
        JOYSTICK,

        DEVICE_COUNT
    };

    /**
     * @brief Kind of physical input a binding reads
     */
    enum class BindingKind : std::uint8_t {
        BUTTON = 0,
        AXIS,

        KIND_COUNT
    };

    [[nodiscard]] inline bool isBindableDevice(const DeviceType type) noexcept {
        return type == DeviceType::KEYBOARD || type == DeviceType::MOUSE || type == DeviceType::JOYSTICK;
    }

    // ============================================================================
    // Keyboard Input
    // ============================================================================

    /**
     * @brief Keyboard key codes (platform-independent)
     * Based on USB HID usage tables, which SDL scancodes share
     */
    enum class KeyCode : std::uint16_t {
        UNKNOWN = 0,

        // Letters
        A = 4, B, C, D, E, F, G, H, I, J, K, L, M,
        N, O, P, Q, R, S, T, U, V, W, X, Y, Z,

        // Numbers
        NUM_1 = 30, NUM_2, NUM_3, NUM_4, NUM_5,
        NUM_6, NUM_7, NUM_8, NUM_9, NUM_0,

        // Function keys
        F1 = 58, F2, F3, F4, F5, F6, F7, F8,
        F9, F10, F11, F12,
        F13 = 104, F14, F15,

        // Control keys
        ENTER = 40,
        ESCAPE = 41,
        BACKSPACE = 42,
        TAB = 43,
        INSERT = 73,
        HOME = 74,
        PAGE_UP = 75,
        DELETE = 76,
        END = 77,
        PAGE_DOWN = 78,
        RIGHT = 79,
        LEFT = 80,
        DOWN = 81,
        UP = 82,

        // Locks and system
        CAPS_LOCK = 57,
        PRINT_SCREEN = 70,
        SCROLL_LOCK = 71,
        PAUSE = 72,
        NUM_LOCK = 83,

        // Modifiers
        LEFT_CTRL = 224,
        LEFT_SHIFT = 225,
        LEFT_ALT = 226,
        LEFT_SUPER = 227, // Windows/Cmd key
        RIGHT_CTRL = 228,
        RIGHT_SHIFT = 229,
        RIGHT_ALT = 230,
        RIGHT_SUPER = 231,

        // Symbols
        SPACE = 44,
        MINUS = 45,
        EQUAL = 46,
        LEFT_BRACKET = 47,
        RIGHT_BRACKET = 48,
        BACKSLASH = 49,
        SEMICOLON = 51,
        APOSTROPHE = 52,
        GRAVE = 53,
        COMMA = 54,
        PERIOD = 55,
        SLASH = 56,

        // Numpad
        KP_DIVIDE = 84,
        KP_MULTIPLY = 85,
        KP_SUBTRACT = 86,
        KP_ADD = 87,
        KP_ENTER = 88,
        KP_1 = 89, KP_2, KP_3, KP_4, KP_5,
        KP_6, KP_7, KP_8, KP_9, KP_0,
        KP_DECIMAL = 99,

        // Special
        APPLICATION = 101, // Context menu key

        KEY_COUNT = 256
    };

    // ============================================================================
    // Mouse Input
    // ============================================================================

    /**
     * @brief Mouse button identifiers, contiguous from zero
     */
    enum class MouseButton : std::uint8_t {
        LEFT = 0,
        RIGHT,
        MIDDLE,
        X_BUTTON_1, // Back
        X_BUTTON_2, // Forward

        BUTTON_COUNT
    };

    /**
     * @brief Mouse axes, in desktop pixels
     */
    enum class MouseAxis : std::uint8_t {
        X_POSITION = 0,
        Y_POSITION,

        AXIS_COUNT
    };

    // ============================================================================
    // Joystick Input
    // ============================================================================

    /**
     * @brief Joystick button identifiers (Xbox layout reference)
     */
    enum class JoystickButton : std::uint8_t {
        A = 0, // Cross on PlayStation
        B, // Circle on PlayStation
        X, // Square on PlayStation
        Y, // Triangle on PlayStation
        START,
        BACK,
        GUIDE,
        LEFT_BUMPER,
        RIGHT_BUMPER,
        LEFT_TRIGGER, // Derived from the trigger axis
        RIGHT_TRIGGER, // Derived from the trigger axis
        LEFT_STICK,
        RIGHT_STICK,
        DPAD_UP,
        DPAD_DOWN,
        DPAD_LEFT,
        DPAD_RIGHT,

        BUTTON_COUNT
    };

    /**
     * @brief Joystick axis identifiers
     */
    enum class JoystickAxis : std::uint8_t {
        LEFT_STICK_X = 0,
        LEFT_STICK_Y,
        RIGHT_STICK_X,
        RIGHT_STICK_Y,
        LEFT_TRIGGER,
        RIGHT_TRIGGER,
        TRIGGERS, // RIGHT_TRIGGER - LEFT_TRIGGER

        AXIS_COUNT
    };

    // ============================================================================
    // Counts
    // ============================================================================

    constexpr std::size_t KEY_COUNT = static_cast<std::size_t>(KeyCode::KEY_COUNT);
    constexpr std::size_t MOUSE_BUTTON_COUNT = static_cast<std::size_t>(MouseButton::BUTTON_COUNT);
    constexpr std::size_t MOUSE_AXIS_COUNT = static_cast<std::size_t>(MouseAxis::AXIS_COUNT);
    constexpr std::size_t JOYSTICK_BUTTON_COUNT = static_cast<std::size_t>(JoystickButton::BUTTON_COUNT);
    constexpr std::size_t JOYSTICK_AXIS_COUNT = static_cast<std::size_t>(JoystickAxis::AXIS_COUNT);

    // ============================================================================
    // String Conversion Utilities
    // ============================================================================

    inline const char* deviceTypeToString(const DeviceType type) {
        switch (type) {
        case DeviceType::NONE: return "None";
        case DeviceType::KEYBOARD: return "Keyboard";
        case DeviceType::MOUSE: return "Mouse";
        case DeviceType::JOYSTICK: return "Joystick";
        default: return "Unknown";
        }
    }

    inline const char* bindingKindToString(const BindingKind kind) {
        switch (kind) {
        case BindingKind::BUTTON: return "button";
        case BindingKind::AXIS: return "axis";
        default: return "unknown";
        }
    }

    /**
     * @brief Parse a bindable device name (case-insensitive)
     */
    [[nodiscard]] inline std::optional<DeviceType> parseDeviceType(const std::string_view text) noexcept {
        const auto trimmed = utils::trim(text);
        if (utils::iequals(trimmed, "Keyboard")) return DeviceType::KEYBOARD;
        if (utils::iequals(trimmed, "Mouse")) return DeviceType::MOUSE;
        if (utils::iequals(trimmed, "Joystick")) return DeviceType::JOYSTICK;
        return std::nullopt;
    }

    /**
     * @brief Parse a binding kind from its element name (case-insensitive)
     */
    [[nodiscard]] inline std::optional<BindingKind> parseBindingKind(const std::string_view text) noexcept {
        const auto trimmed = utils::trim(text);
        if (utils::iequals(trimmed, "button")) return BindingKind::BUTTON;
        if (utils::iequals(trimmed, "axis")) return BindingKind::AXIS;
        return std::nullopt;
    }
} // namespace actuate::input
