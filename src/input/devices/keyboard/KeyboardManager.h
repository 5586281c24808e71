/**
 * @file KeyboardManager.h
 * @brief Keyboard current/previous snapshots and edge queries
 * @author Actuate Team
 * @date 2025
 */

#pragma once

#include "KeyboardState.h"

#include "../../core/NameTable.h"

#include <optional>
#include <string>
#include <string_view>

namespace actuate::input {
    /**
     * @brief Tracks the keyboard across frames
     *
     * Keys are addressed by KeyCode or by name ("Space", "LShift") or HID
     * index ("44"). A name that does not resolve reads as released.
     */
    class KeyboardManager {
    public:
        explicit KeyboardManager(IInputBackend& backend) noexcept;

        KeyboardManager(const KeyboardManager&) = delete;
        KeyboardManager& operator=(const KeyboardManager&) = delete;

        /**
         * @brief Poll the backend and advance previous <- current <- polled
         */
        void update();

        // ============================================================================
        // Queries
        // ============================================================================

        [[nodiscard]] bool isPressed(KeyCode key) const noexcept;
        [[nodiscard]] bool justPressed(KeyCode key) const noexcept;
        [[nodiscard]] bool justReleased(KeyCode key) const noexcept;

        [[nodiscard]] bool isPressed(std::string_view key) const;
        [[nodiscard]] bool justPressed(std::string_view key) const;
        [[nodiscard]] bool justReleased(std::string_view key) const;

        /**
         * @brief True if any key changed state in the last update
         */
        [[nodiscard]] bool changedThisFrame() const noexcept;

        [[nodiscard]] const KeyboardState& getCurrentState() const noexcept { return current_; }
        [[nodiscard]] const KeyboardState& getPreviousState() const noexcept { return previous_; }

        // ============================================================================
        // Names
        // ============================================================================

        [[nodiscard]] static NameParseResult parseKey(std::string_view name);
        [[nodiscard]] static bool isKey(std::string_view name);
        [[nodiscard]] static std::optional<KeyCode> toKey(std::string_view name);
        [[nodiscard]] static std::string keyName(KeyCode key);

    private:
        IInputBackend& backend_;
        KeyboardState current_;
        KeyboardState previous_;
    };
} // namespace actuate::input
