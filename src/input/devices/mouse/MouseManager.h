/**
 * @file MouseManager.h
 * @brief Mouse current/previous snapshots, button edges and axis queries
 * @author Actuate Team
 * @date 2025
 */

#pragma once

#include "MouseState.h"

#include "../../core/NameTable.h"

#include <optional>
#include <string>
#include <string_view>

namespace actuate::input {
    /**
     * @brief Tracks the mouse across frames
     *
     * Axes are the desktop-space cursor position in pixels.
     */
    class MouseManager {
    public:
        explicit MouseManager(IInputBackend& backend) noexcept;

        MouseManager(const MouseManager&) = delete;
        MouseManager& operator=(const MouseManager&) = delete;

        /**
         * @brief Poll the backend and advance previous <- current <- polled
         */
        void update();

        // ============================================================================
        // Buttons
        // ============================================================================

        [[nodiscard]] bool isPressed(MouseButton button) const noexcept;
        [[nodiscard]] bool justPressed(MouseButton button) const noexcept;
        [[nodiscard]] bool justReleased(MouseButton button) const noexcept;

        [[nodiscard]] bool isPressed(std::string_view button) const;
        [[nodiscard]] bool justPressed(std::string_view button) const;
        [[nodiscard]] bool justReleased(std::string_view button) const;

        // ============================================================================
        // Axes
        // ============================================================================

        [[nodiscard]] float getAxis(MouseAxis axis) const noexcept;
        [[nodiscard]] float getLastAxis(MouseAxis axis) const noexcept;
        [[nodiscard]] float axisDelta(MouseAxis axis) const noexcept;

        [[nodiscard]] float getAxis(std::string_view axis) const;
        [[nodiscard]] float getLastAxis(std::string_view axis) const;
        [[nodiscard]] float axisDelta(std::string_view axis) const;

        /**
         * @brief Threshold test on the current axis value
         * @param bidirectional Compare |value| instead of value
         */
        [[nodiscard]] bool axisIsPressed(std::string_view axis, bool bidirectional = false) const;
        [[nodiscard]] bool axisJustPressed(std::string_view axis, bool bidirectional = false) const;
        [[nodiscard]] bool axisJustReleased(std::string_view axis, bool bidirectional = false) const;

        [[nodiscard]] const math::Vec2i& getPosition() const noexcept { return current_.getPosition(); }
        [[nodiscard]] const math::Vec2i& getLastPosition() const noexcept { return previous_.getPosition(); }
        [[nodiscard]] math::Vec2i getPositionDelta() const noexcept;

        /**
         * @brief True if a button changed or the cursor moved in the last update
         */
        [[nodiscard]] bool changedThisFrame() const noexcept;

        [[nodiscard]] const MouseState& getCurrentState() const noexcept { return current_; }
        [[nodiscard]] const MouseState& getPreviousState() const noexcept { return previous_; }

        // ============================================================================
        // Names
        // ============================================================================

        [[nodiscard]] static bool isButton(std::string_view name);
        [[nodiscard]] static std::optional<MouseButton> toButton(std::string_view name);
        [[nodiscard]] static std::string buttonName(MouseButton button);

        [[nodiscard]] static bool isAxis(std::string_view name);
        [[nodiscard]] static std::optional<MouseAxis> toAxis(std::string_view name);
        [[nodiscard]] static std::string axisName(MouseAxis axis);

    private:
        IInputBackend& backend_;
        MouseState current_;
        MouseState previous_;
    };
} // namespace actuate::input
