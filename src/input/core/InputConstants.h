/**
 * @file InputConstants.h
 * @brief Compile-time constants for the input system
 * @author Actuate Team
 * @date 2025
 *
 * Central location for all input system constants to avoid magic numbers
 * and ensure consistency across the codebase.
 */

#pragma once

#include <cstdint>

namespace actuate::input {
    // ============================================================================
    // System Limits
    // ============================================================================

    // Bounds applied when loading bindings files
    constexpr std::uint32_t MAX_ACTIONS = 1024;
    constexpr std::uint32_t MAX_BINDINGS_PER_ACTION = 64;
    constexpr std::uint32_t MAX_ACTION_NAME_LENGTH = 128;

    // ============================================================================
    // Default Values
    // ============================================================================

    // Axis magnitude at which an axis counts as pressed
    constexpr float AXIS_PRESS_THRESHOLD = 0.4f;

    // Raw SDL axis range
    constexpr std::int32_t RAW_AXIS_MIN = -32768;
    constexpr std::int32_t RAW_AXIS_MAX = 32767;

    // Default memory log size
    constexpr std::uint32_t DEFAULT_MAX_MEMORY_LOG_ENTRIES = 1000;

    // ============================================================================
    // Error Codes
    // ============================================================================

    enum class InputErrorCode : std::int32_t {
        SUCCESS = 0,
        INVALID_PARAMETER = -4,
        BINDING_CONFLICT = -9,
        FILE_NOT_FOUND = -14,
        PARSE_ERROR = -15,
        ALREADY_EXISTS = -16,
        WRITE_FAILED = -17
    };

    /**
     * @brief Convert error code to string
     */
    inline const char* getErrorString(const InputErrorCode error) {
        switch (error) {
        case InputErrorCode::SUCCESS: return "Success";
        case InputErrorCode::INVALID_PARAMETER: return "Invalid parameter";
        case InputErrorCode::BINDING_CONFLICT: return "Binding conflict";
        case InputErrorCode::FILE_NOT_FOUND: return "File not found";
        case InputErrorCode::PARSE_ERROR: return "Parse error";
        case InputErrorCode::ALREADY_EXISTS: return "Already exists";
        case InputErrorCode::WRITE_FAILED: return "Write failed";
        default: return "Unknown error";
        }
    }

    // ============================================================================
    // String Constants
    // ============================================================================

    // Configuration file names
    constexpr auto DEFAULT_BINDINGS_PATH = "input.xml";
    constexpr auto DEFAULT_INPUT_CONFIG_FILE = "input_config.json";
    constexpr auto DEFAULT_INPUT_LOG_FILE = "input.log";

    // Bindings document element names
    constexpr auto XML_INPUT_ELEMENT = "input";
    constexpr auto XML_ACTION_SET_ELEMENT = "action_set";
    constexpr auto XML_ACTION_ELEMENT = "action";
    constexpr auto XML_BUTTON_ELEMENT = "button";
    constexpr auto XML_AXIS_ELEMENT = "axis";

    // Log categories
    constexpr auto LOG_CATEGORY_BINDING = "Binding";
    constexpr auto LOG_CATEGORY_ACTION = "Action";
    constexpr auto LOG_CATEGORY_ACTION_SET = "ActionSet";
    constexpr auto LOG_CATEGORY_CONFIG = "Config";
    constexpr auto LOG_CATEGORY_JOYSTICK = "Joystick";
    constexpr auto LOG_CATEGORY_BACKEND = "Backend";
    constexpr auto LOG_CATEGORY_INPUT = "Input";
} // namespace actuate::input
