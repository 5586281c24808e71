/**
 * @file SDLKeyMap.cpp
 * @brief SDL2 mapping tables
 * @author Actuate Team
 * @date 2025
 */

#include "SDLKeyMap.h"

#include <algorithm>

namespace actuate::input {
    SDLKeyMap::SDLKeyMap() noexcept {
        buttonMap_.fill(SDL_CONTROLLER_BUTTON_INVALID);

        auto map = [this](const JoystickButton button, const SDL_GameControllerButton sdl) {
            buttonMap_[static_cast<std::size_t>(button)] = sdl;
        };

        map(JoystickButton::A, SDL_CONTROLLER_BUTTON_A);
        map(JoystickButton::B, SDL_CONTROLLER_BUTTON_B);
        map(JoystickButton::X, SDL_CONTROLLER_BUTTON_X);
        map(JoystickButton::Y, SDL_CONTROLLER_BUTTON_Y);
        map(JoystickButton::START, SDL_CONTROLLER_BUTTON_START);
        map(JoystickButton::BACK, SDL_CONTROLLER_BUTTON_BACK);
        map(JoystickButton::GUIDE, SDL_CONTROLLER_BUTTON_GUIDE);
        map(JoystickButton::LEFT_BUMPER, SDL_CONTROLLER_BUTTON_LEFTSHOULDER);
        map(JoystickButton::RIGHT_BUMPER, SDL_CONTROLLER_BUTTON_RIGHTSHOULDER);
        map(JoystickButton::LEFT_STICK, SDL_CONTROLLER_BUTTON_LEFTSTICK);
        map(JoystickButton::RIGHT_STICK, SDL_CONTROLLER_BUTTON_RIGHTSTICK);
        map(JoystickButton::DPAD_UP, SDL_CONTROLLER_BUTTON_DPAD_UP);
        map(JoystickButton::DPAD_DOWN, SDL_CONTROLLER_BUTTON_DPAD_DOWN);
        map(JoystickButton::DPAD_LEFT, SDL_CONTROLLER_BUTTON_DPAD_LEFT);
        map(JoystickButton::DPAD_RIGHT, SDL_CONTROLLER_BUTTON_DPAD_RIGHT);
    }

    std::optional<SDL_Scancode> SDLKeyMap::toScancode(const KeyCode key) noexcept {
        const auto code = static_cast<int>(key);
        if (code <= SDL_SCANCODE_UNKNOWN || code >= SDL_NUM_SCANCODES) {
            return std::nullopt;
        }
        return static_cast<SDL_Scancode>(code);
    }

    std::optional<SDL_GameControllerButton> SDLKeyMap::toControllerButton(const JoystickButton button) const noexcept {
        const auto index = static_cast<std::size_t>(button);
        if (index >= buttonMap_.size() || buttonMap_[index] == SDL_CONTROLLER_BUTTON_INVALID) {
            return std::nullopt;
        }
        return buttonMap_[index];
    }

    Uint8 SDLKeyMap::toMouseButton(const MouseButton button) noexcept {
        switch (button) {
        case MouseButton::LEFT: return SDL_BUTTON_LEFT;
        case MouseButton::RIGHT: return SDL_BUTTON_RIGHT;
        case MouseButton::MIDDLE: return SDL_BUTTON_MIDDLE;
        case MouseButton::X_BUTTON_1: return SDL_BUTTON_X1;
        case MouseButton::X_BUTTON_2: return SDL_BUTTON_X2;
        default: return 0;
        }
    }

    float normalizeAxisValue(const Sint16 value) noexcept {
        // SDL axis range is -32768 to 32767
        if (value > 0) {
            return static_cast<float>(value) / static_cast<float>(RAW_AXIS_MAX);
        }

        if (value < 0) {
            return static_cast<float>(value) / -static_cast<float>(RAW_AXIS_MIN);
        }

        return 0.0f;
    }

    float normalizeTriggerValue(const Sint16 value) noexcept {
        // SDL trigger range is 0 to 32767
        return std::clamp(static_cast<float>(value) / static_cast<float>(RAW_AXIS_MAX), 0.0f, 1.0f);
    }
} // namespace actuate::input
