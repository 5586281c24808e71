/**
 * @file IInputBackend.h
 * @brief Raw device polling interface
 * @author Actuate Team
 * @date 2025
 *
 * The device managers read hardware only through this interface. The SDL2
 * implementation lives in platform/sdl2, tests use an in-memory backend.
 */

#pragma once

#include "../core/InputTypes.h"
#include "../devices/joystick/JoystickState.h"
#include "../devices/mouse/MouseState.h"

#include <optional>
#include <vector>

namespace actuate::input {
    class IInputBackend {
    public:
        virtual ~IInputBackend() = default;

        /**
         * @brief Pump pending platform events so the next polls are current
         *
         * Called once per frame before any device is polled.
         */
        virtual void refresh() = 0;

        /**
         * @brief Check if a key is held right now
         */
        [[nodiscard]] virtual bool isKeyPressed(KeyCode key) const = 0;

        /**
         * @brief Read mouse buttons and desktop position
         */
        [[nodiscard]] virtual MouseState pollMouse() const = 0;

        /**
         * @brief Connected joysticks in connection order
         */
        [[nodiscard]] virtual std::vector<JoystickId> getConnectedJoysticks() const = 0;

        [[nodiscard]] virtual bool isJoystickConnected(JoystickId id) const = 0;

        /**
         * @brief Read one joystick
         * @return Raw values, or nullopt if the joystick is gone
         */
        [[nodiscard]] virtual std::optional<RawJoystickState> pollJoystick(JoystickId id) const = 0;
    };
} // namespace actuate::input
