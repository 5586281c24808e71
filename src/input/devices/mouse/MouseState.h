/**
 * @file MouseState.h
 * @brief Immutable mouse snapshot for frame-based edge detection
 * @author Actuate Team
 * @date 2025
 */

#pragma once

#include "../../core/InputTypes.h"

#include "../../../math/core/MathTypes.h"

#include <bitset>

namespace actuate::input {
    /**
     * @brief Mouse buttons and desktop position at one poll
     */
    class MouseState {
    public:
        using ButtonBits = std::bitset<MOUSE_BUTTON_COUNT>;

        MouseState() noexcept
            : position_(0, 0) {
        }

        MouseState(const ButtonBits& buttons, const math::Vec2i& position) noexcept
            : buttons_(buttons)
              , position_(position) {
        }

        /**
         * @brief Check if button is pressed in this snapshot
         */
        [[nodiscard]] bool isButtonPressed(const MouseButton button) const noexcept {
            return isButtonPressed(static_cast<std::size_t>(button));
        }

        [[nodiscard]] bool isButtonPressed(const std::size_t index) const noexcept {
            return index < buttons_.size() && buttons_[index];
        }

        /**
         * @brief Axis value in pixels, 0 for an out-of-range axis
         */
        [[nodiscard]] float getAxis(const MouseAxis axis) const noexcept {
            return getAxis(static_cast<std::size_t>(axis));
        }

        [[nodiscard]] float getAxis(const std::size_t index) const noexcept {
            switch (index) {
            case 0: return static_cast<float>(position_.x);
            case 1: return static_cast<float>(position_.y);
            default: return 0.0f;
            }
        }

        [[nodiscard]] const math::Vec2i& getPosition() const noexcept {
            return position_;
        }

        [[nodiscard]] const ButtonBits& getButtons() const noexcept {
            return buttons_;
        }

        [[nodiscard]] bool operator==(const MouseState& other) const noexcept {
            return buttons_ == other.buttons_ && position_ == other.position_;
        }

    private:
        ButtonBits buttons_;
        math::Vec2i position_;
    };
} // namespace actuate::input
