/**
 * @file JoystickManager.h
 * @brief Active joystick selection, snapshots and edge queries
 * @author Actuate Team
 * @date 2025
 */

#pragma once

#include "JoystickState.h"

#include "../../core/NameTable.h"

#include <optional>
#include <string>
#include <string_view>

namespace actuate::input {
    /**
     * @brief Tracks the first connected joystick across frames
     *
     * When the active joystick disappears the next connected one is picked on
     * the following update. With no joystick every query reads released/zero.
     */
    class JoystickManager {
    public:
        explicit JoystickManager(IInputBackend& backend) noexcept;

        JoystickManager(const JoystickManager&) = delete;
        JoystickManager& operator=(const JoystickManager&) = delete;

        /**
         * @brief Select the active joystick, poll it and advance the snapshots
         */
        void update();

        // ============================================================================
        // Buttons
        // ============================================================================

        [[nodiscard]] bool isPressed(JoystickButton button) const noexcept;
        [[nodiscard]] bool justPressed(JoystickButton button) const noexcept;
        [[nodiscard]] bool justReleased(JoystickButton button) const noexcept;

        [[nodiscard]] bool isPressed(std::string_view button) const;
        [[nodiscard]] bool justPressed(std::string_view button) const;
        [[nodiscard]] bool justReleased(std::string_view button) const;

        // ============================================================================
        // Axes
        // ============================================================================

        [[nodiscard]] float getAxis(JoystickAxis axis) const noexcept;
        [[nodiscard]] float getLastAxis(JoystickAxis axis) const noexcept;
        [[nodiscard]] float axisDelta(JoystickAxis axis) const noexcept;

        [[nodiscard]] float getAxis(std::string_view axis) const;
        [[nodiscard]] float getLastAxis(std::string_view axis) const;
        [[nodiscard]] float axisDelta(std::string_view axis) const;

        [[nodiscard]] bool axisIsPressed(JoystickAxis axis, bool bidirectional = false) const noexcept;
        [[nodiscard]] bool axisJustPressed(JoystickAxis axis, bool bidirectional = false) const noexcept;
        [[nodiscard]] bool axisJustReleased(JoystickAxis axis, bool bidirectional = false) const noexcept;

        [[nodiscard]] bool axisIsPressed(std::string_view axis, bool bidirectional = false) const;
        [[nodiscard]] bool axisJustPressed(std::string_view axis, bool bidirectional = false) const;
        [[nodiscard]] bool axisJustReleased(std::string_view axis, bool bidirectional = false) const;

        // ============================================================================
        // Connection
        // ============================================================================

        [[nodiscard]] bool isConnected() const noexcept { return current_.isConnected(); }

        /**
         * @brief Joystick polled by the last update, INVALID_JOYSTICK_ID if none
         */
        [[nodiscard]] JoystickId getActiveJoystick() const noexcept { return activeJoystick_; }

        /**
         * @brief True if a button, an axis or the connection changed in the last update
         */
        [[nodiscard]] bool changedThisFrame() const noexcept;

        [[nodiscard]] const JoystickState& getCurrentState() const noexcept { return current_; }
        [[nodiscard]] const JoystickState& getPreviousState() const noexcept { return previous_; }

        /**
         * @brief Derive trigger buttons and the combined trigger axis from raw values
         */
        [[nodiscard]] static JoystickState buildState(const RawJoystickState& raw) noexcept;

        // ============================================================================
        // Names
        // ============================================================================

        [[nodiscard]] static bool isButton(std::string_view name);
        [[nodiscard]] static std::optional<JoystickButton> toButton(std::string_view name);
        [[nodiscard]] static std::string buttonName(JoystickButton button);

        [[nodiscard]] static bool isAxis(std::string_view name);
        [[nodiscard]] static std::optional<JoystickAxis> toAxis(std::string_view name);
        [[nodiscard]] static std::string axisName(JoystickAxis axis);

    private:
        IInputBackend& backend_;
        JoystickState current_;
        JoystickState previous_;
        JoystickId activeJoystick_ = INVALID_JOYSTICK_ID;

        void selectActiveJoystick();
    };
} // namespace actuate::input
