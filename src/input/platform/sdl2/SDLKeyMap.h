/**
 * @file SDLKeyMap.h
 * @brief SDL2 to Actuate device code mapping
 * @author Actuate Team
 * @date 2025
 *
 * Keyboard codes need no table: KeyCode values are HID usages, which SDL
 * uses as scancodes. Controller buttons, controller axes and mouse buttons
 * are mapped here.
 */

#pragma once

#include "../../core/InputTypes.h"

#include <SDL2/SDL.h>

#include <array>
#include <optional>

namespace actuate::input {
    /**
     * @brief Maps Actuate joystick and mouse codes to their SDL counterparts
     */
    class SDLKeyMap {
    public:
        SDLKeyMap() noexcept;

        /**
         * @brief SDL scancode for a key, nullopt outside SDL's scancode range
         */
        [[nodiscard]] static std::optional<SDL_Scancode> toScancode(KeyCode key) noexcept;

        /**
         * @brief SDL controller button for a joystick button
         *
         * Triggers have no SDL button; their state is derived from the trigger axes.
         */
        [[nodiscard]] std::optional<SDL_GameControllerButton> toControllerButton(JoystickButton button) const noexcept;

        /**
         * @brief SDL_BUTTON_* index for a mouse button
         */
        [[nodiscard]] static Uint8 toMouseButton(MouseButton button) noexcept;

    private:
        std::array<SDL_GameControllerButton, JOYSTICK_BUTTON_COUNT> buttonMap_;
    };

    /**
     * @brief Normalize a raw stick value to [-1, 1]
     *
     * Positive values divide by 32767 and negative values by 32768, so both
     * extremes reach exactly one.
     */
    [[nodiscard]] float normalizeAxisValue(Sint16 value) noexcept;

    /**
     * @brief Normalize a raw trigger value to [0, 1]
     */
    [[nodiscard]] float normalizeTriggerValue(Sint16 value) noexcept;
} // namespace actuate::input
