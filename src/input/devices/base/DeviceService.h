/**
 * @file DeviceService.h
 * @brief Aggregate of the keyboard, mouse and joystick managers
 * @author Actuate Team
 * @date 2025
 *
 * Owns the three device managers, refreshes them in a fixed order and
 * dispatches (device, identifier) queries to the matching one.
 */

#pragma once

#include "../joystick/JoystickManager.h"
#include "../keyboard/KeyboardManager.h"
#include "../mouse/MouseManager.h"

#include <string_view>

namespace actuate::input {
    /**
     * @brief Device dispatch service
     *
     * The keyboard has no axes: axis queries on it read 0/false. Queries on
     * DeviceType::NONE read released/zero.
     */
    class DeviceService {
    public:
        explicit DeviceService(IInputBackend& backend) noexcept;

        DeviceService(const DeviceService&) = delete;
        DeviceService& operator=(const DeviceService&) = delete;

        /**
         * @brief Refresh the backend, then update keyboard, mouse and joystick in that order
         */
        void update();

        // ============================================================================
        // Button Queries
        // ============================================================================

        [[nodiscard]] bool isPressed(DeviceType device, std::string_view button) const;
        [[nodiscard]] bool justPressed(DeviceType device, std::string_view button) const;
        [[nodiscard]] bool justReleased(DeviceType device, std::string_view button) const;

        // ============================================================================
        // Axis Queries
        // ============================================================================

        [[nodiscard]] float getAxis(DeviceType device, std::string_view axis) const;
        [[nodiscard]] float getLastAxis(DeviceType device, std::string_view axis) const;
        [[nodiscard]] float axisDelta(DeviceType device, std::string_view axis) const;

        [[nodiscard]] bool isAxisPressed(DeviceType device, std::string_view axis, bool bidirectional = false) const;
        [[nodiscard]] bool axisJustPressed(DeviceType device, std::string_view axis, bool bidirectional = false) const;
        [[nodiscard]] bool axisJustReleased(DeviceType device, std::string_view axis, bool bidirectional = false) const;

        /**
         * @brief Check if the device changed state in the last update
         */
        [[nodiscard]] bool changedThisFrame(DeviceType device) const noexcept;

        // ============================================================================
        // Validation
        // ============================================================================

        /**
         * @brief Check if an identifier names a button of the device
         */
        [[nodiscard]] static bool isButton(DeviceType device, std::string_view button);

        /**
         * @brief Check if an identifier names an axis of the device
         */
        [[nodiscard]] static bool isAxis(DeviceType device, std::string_view axis);

        /**
         * @brief Parse with the table matching (device, kind)
         * @return UNKNOWN_NAME when the device has no such kind of input
         */
        [[nodiscard]] static NameParseResult parse(DeviceType device, BindingKind kind, std::string_view text);

        // ============================================================================
        // Managers
        // ============================================================================

        [[nodiscard]] KeyboardManager& keyboard() noexcept { return keyboard_; }
        [[nodiscard]] const KeyboardManager& keyboard() const noexcept { return keyboard_; }

        [[nodiscard]] MouseManager& mouse() noexcept { return mouse_; }
        [[nodiscard]] const MouseManager& mouse() const noexcept { return mouse_; }

        [[nodiscard]] JoystickManager& joystick() noexcept { return joystick_; }
        [[nodiscard]] const JoystickManager& joystick() const noexcept { return joystick_; }

    private:
        IInputBackend& backend_;
        KeyboardManager keyboard_;
        MouseManager mouse_;
        JoystickManager joystick_;
    };
} // namespace actuate::input
