/**
 * @file JoystickState.h
 * @brief Immutable joystick snapshot for frame-based edge detection
 * @author Actuate Team
 * @date 2025
 */

#pragma once

#include "../../core/InputTypes.h"

#include "../../../math/core/MathTypes.h"

#include <array>
#include <bitset>

namespace actuate::input {
    /**
     * @brief Values read from a controller before derived inputs are computed
     *
     * Sticks in [-1, 1] with up positive on Y, triggers in [0, 1].
     * LEFT_TRIGGER/RIGHT_TRIGGER bits are ignored, they come from the triggers.
     */
    struct RawJoystickState {
        std::bitset<JOYSTICK_BUTTON_COUNT> buttons;
        math::Vec2 leftStick{0.0f, 0.0f};
        math::Vec2 rightStick{0.0f, 0.0f};
        float leftTrigger = 0.0f;
        float rightTrigger = 0.0f;
    };

    /**
     * @brief Buttons and axes of the active joystick at one poll
     *
     * A default-constructed state is the disconnected state: all buttons
     * released and all axes zero.
     */
    class JoystickState {
    public:
        using ButtonBits = std::bitset<JOYSTICK_BUTTON_COUNT>;
        using AxisValues = std::array<float, JOYSTICK_AXIS_COUNT>;

        JoystickState() noexcept
            : axes_{}
              , connected_(false) {
        }

        JoystickState(const ButtonBits& buttons, const AxisValues& axes) noexcept
            : buttons_(buttons)
              , axes_(axes)
              , connected_(true) {
        }

        [[nodiscard]] bool isButtonPressed(const JoystickButton button) const noexcept {
            return isButtonPressed(static_cast<std::size_t>(button));
        }

        [[nodiscard]] bool isButtonPressed(const std::size_t index) const noexcept {
            return index < buttons_.size() && buttons_[index];
        }

        [[nodiscard]] float getAxis(const JoystickAxis axis) const noexcept {
            return getAxis(static_cast<std::size_t>(axis));
        }

        [[nodiscard]] float getAxis(const std::size_t index) const noexcept {
            return index < axes_.size() ? axes_[index] : 0.0f;
        }

        [[nodiscard]] bool isConnected() const noexcept {
            return connected_;
        }

        [[nodiscard]] const ButtonBits& getButtons() const noexcept {
            return buttons_;
        }

        [[nodiscard]] const AxisValues& getAxes() const noexcept {
            return axes_;
        }

        [[nodiscard]] bool operator==(const JoystickState& other) const noexcept {
            return connected_ == other.connected_ && buttons_ == other.buttons_ && axes_ == other.axes_;
        }

    private:
        ButtonBits buttons_;
        AxisValues axes_;
        bool connected_;
    };
} // namespace actuate::input
