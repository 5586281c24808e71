/**
 * @file MouseManager.cpp
 * @brief Mouse manager implementation
 * @author Actuate Team
 * @date 2025
 */

#include "MouseManager.h"

#include "../../platform/IInputBackend.h"

#include <utility>

namespace actuate::input {
    MouseManager::MouseManager(IInputBackend& backend) noexcept
        : backend_(backend) {
    }

    void MouseManager::update() {
        previous_ = std::exchange(current_, backend_.pollMouse());
    }

    // ============================================================================
    // Buttons
    // ============================================================================

    bool MouseManager::isPressed(const MouseButton button) const noexcept {
        return current_.isButtonPressed(button);
    }

    bool MouseManager::justPressed(const MouseButton button) const noexcept {
        return current_.isButtonPressed(button) && !previous_.isButtonPressed(button);
    }

    bool MouseManager::justReleased(const MouseButton button) const noexcept {
        return !current_.isButtonPressed(button) && previous_.isButtonPressed(button);
    }

    bool MouseManager::isPressed(const std::string_view button) const {
        const auto id = toButton(button);
        return id && isPressed(*id);
    }

    bool MouseManager::justPressed(const std::string_view button) const {
        const auto id = toButton(button);
        return id && justPressed(*id);
    }

    bool MouseManager::justReleased(const std::string_view button) const {
        const auto id = toButton(button);
        return id && justReleased(*id);
    }

    // ============================================================================
    // Axes
    // ============================================================================

    float MouseManager::getAxis(const MouseAxis axis) const noexcept {
        return current_.getAxis(axis);
    }

    float MouseManager::getLastAxis(const MouseAxis axis) const noexcept {
        return previous_.getAxis(axis);
    }

    float MouseManager::axisDelta(const MouseAxis axis) const noexcept {
        return getAxis(axis) - getLastAxis(axis);
    }

    float MouseManager::getAxis(const std::string_view axis) const {
        const auto id = toAxis(axis);
        return id ? getAxis(*id) : 0.0f;
    }

    float MouseManager::getLastAxis(const std::string_view axis) const {
        const auto id = toAxis(axis);
        return id ? getLastAxis(*id) : 0.0f;
    }

    float MouseManager::axisDelta(const std::string_view axis) const {
        const auto id = toAxis(axis);
        return id ? axisDelta(*id) : 0.0f;
    }

    bool MouseManager::axisIsPressed(const std::string_view axis, const bool bidirectional) const {
        const auto id = toAxis(axis);
        return id && utils::isAxisPressed(getAxis(*id), bidirectional);
    }

    bool MouseManager::axisJustPressed(const std::string_view axis, const bool bidirectional) const {
        const auto id = toAxis(axis);
        return id &&
            utils::isAxisPressed(getAxis(*id), bidirectional) &&
            !utils::isAxisPressed(getLastAxis(*id), bidirectional);
    }

    bool MouseManager::axisJustReleased(const std::string_view axis, const bool bidirectional) const {
        const auto id = toAxis(axis);
        return id &&
            !utils::isAxisPressed(getAxis(*id), bidirectional) &&
            utils::isAxisPressed(getLastAxis(*id), bidirectional);
    }

    math::Vec2i MouseManager::getPositionDelta() const noexcept {
        return current_.getPosition() - previous_.getPosition();
    }

    bool MouseManager::changedThisFrame() const noexcept {
        return !(current_ == previous_);
    }

    // ============================================================================
    // Names
    // ============================================================================

    bool MouseManager::isButton(const std::string_view name) {
        return getMouseButtonTable().isValid(name);
    }

    std::optional<MouseButton> MouseManager::toButton(const std::string_view name) {
        const auto result = getMouseButtonTable().parse(name);
        if (!result) {
            return std::nullopt;
        }
        return static_cast<MouseButton>(result.index);
    }

    std::string MouseManager::buttonName(const MouseButton button) {
        return getMouseButtonTable().nameOf(static_cast<std::uint32_t>(button));
    }

    bool MouseManager::isAxis(const std::string_view name) {
        return getMouseAxisTable().isValid(name);
    }

    std::optional<MouseAxis> MouseManager::toAxis(const std::string_view name) {
        const auto result = getMouseAxisTable().parse(name);
        if (!result) {
            return std::nullopt;
        }
        return static_cast<MouseAxis>(result.index);
    }

    std::string MouseManager::axisName(const MouseAxis axis) {
        return getMouseAxisTable().nameOf(static_cast<std::uint32_t>(axis));
    }
} // namespace actuate::input
