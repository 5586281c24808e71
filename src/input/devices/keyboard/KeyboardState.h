/**
 * @file KeyboardState.h
 * @brief Immutable keyboard snapshot for frame-based edge detection
 * @author Actuate Team
 * @date 2025
 */

#pragma once

#include "../../core/InputTypes.h"

#include <bitset>

namespace actuate::input {
    /**
     * @brief Pressed state of every key at one poll
     *
     * Indexed by HID usage code. Captured once, never modified.
     */
    class KeyboardState {
    public:
        using KeyBits = std::bitset<KEY_COUNT>;

        KeyboardState() noexcept = default;

        explicit KeyboardState(const KeyBits& pressed) noexcept
            : pressed_(pressed) {
        }

        /**
         * @brief Check if key is pressed in this snapshot
         */
        [[nodiscard]] bool isKeyPressed(const KeyCode key) const noexcept {
            return isKeyPressed(static_cast<std::size_t>(key));
        }

        [[nodiscard]] bool isKeyPressed(const std::size_t index) const noexcept {
            return index < pressed_.size() && pressed_[index];
        }

        [[nodiscard]] bool hasAnyKeyPressed() const noexcept {
            return pressed_.any();
        }

        [[nodiscard]] const KeyBits& getPressed() const noexcept {
            return pressed_;
        }

        [[nodiscard]] bool operator==(const KeyboardState& other) const noexcept {
            return pressed_ == other.pressed_;
        }

    private:
        KeyBits pressed_;
    };
} // namespace actuate::input
