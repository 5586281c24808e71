/**
 * @file KeyboardManager.cpp
 * @brief Keyboard manager implementation
 * @author Actuate Team
 * @date 2025
 */

#include "KeyboardManager.h"

#include "../../platform/IInputBackend.h"

#include <utility>

namespace actuate::input {
    KeyboardManager::KeyboardManager(IInputBackend& backend) noexcept
        : backend_(backend) {
    }

    void KeyboardManager::update() {
        KeyboardState::KeyBits pressed;
        // Index 0 is KeyCode::UNKNOWN
        for (std::size_t i = 1; i < KEY_COUNT; ++i) {
            if (backend_.isKeyPressed(static_cast<KeyCode>(i))) {
                pressed.set(i);
            }
        }

        previous_ = std::exchange(current_, KeyboardState(pressed));
    }

    bool KeyboardManager::isPressed(const KeyCode key) const noexcept {
        return current_.isKeyPressed(key);
    }

    bool KeyboardManager::justPressed(const KeyCode key) const noexcept {
        return current_.isKeyPressed(key) && !previous_.isKeyPressed(key);
    }

    bool KeyboardManager::justReleased(const KeyCode key) const noexcept {
        return !current_.isKeyPressed(key) && previous_.isKeyPressed(key);
    }

    bool KeyboardManager::isPressed(const std::string_view key) const {
        const auto code = toKey(key);
        return code && isPressed(*code);
    }

    bool KeyboardManager::justPressed(const std::string_view key) const {
        const auto code = toKey(key);
        return code && justPressed(*code);
    }

    bool KeyboardManager::justReleased(const std::string_view key) const {
        const auto code = toKey(key);
        return code && justReleased(*code);
    }

    bool KeyboardManager::changedThisFrame() const noexcept {
        return !(current_ == previous_);
    }

    NameParseResult KeyboardManager::parseKey(const std::string_view name) {
        return getKeyboardKeyTable().parse(name);
    }

    bool KeyboardManager::isKey(const std::string_view name) {
        return parseKey(name).ok();
    }

    std::optional<KeyCode> KeyboardManager::toKey(const std::string_view name) {
        const auto result = parseKey(name);
        if (!result) {
            return std::nullopt;
        }
        return static_cast<KeyCode>(result.index);
    }

    std::string KeyboardManager::keyName(const KeyCode key) {
        return getKeyboardKeyTable().nameOf(static_cast<std::uint32_t>(key));
    }
} // namespace actuate::input
