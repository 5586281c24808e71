/**
 * @file JoystickManager.cpp
 * @brief Joystick manager implementation
 * @author Actuate Team
 * @date 2025
 */

#include "JoystickManager.h"

#include "../../debug/InputLogger.h"
#include "../../platform/IInputBackend.h"

#include <algorithm>
#include <utility>

namespace actuate::input {
    JoystickManager::JoystickManager(IInputBackend& backend) noexcept
        : backend_(backend) {
    }

    void JoystickManager::update() {
        selectActiveJoystick();

        JoystickState captured;
        if (activeJoystick_ != INVALID_JOYSTICK_ID) {
            if (const auto raw = backend_.pollJoystick(activeJoystick_)) {
                captured = buildState(*raw);
            }
            else {
                debug::getLogger().warning(LOG_CATEGORY_JOYSTICK,
                                           "Joystick " + std::to_string(activeJoystick_) +
                                           " could not be read, treating as disconnected");
                activeJoystick_ = INVALID_JOYSTICK_ID;
            }
        }

        previous_ = std::exchange(current_, captured);
    }

    void JoystickManager::selectActiveJoystick() {
        if (activeJoystick_ != INVALID_JOYSTICK_ID && backend_.isJoystickConnected(activeJoystick_)) {
            return;
        }

        const JoystickId previous = activeJoystick_;
        const auto connected = backend_.getConnectedJoysticks();
        activeJoystick_ = connected.empty() ? INVALID_JOYSTICK_ID : connected.front();

        if (activeJoystick_ == previous) {
            return;
        }

        auto& logger = debug::getLogger();
        if (previous != INVALID_JOYSTICK_ID && activeJoystick_ != INVALID_JOYSTICK_ID) {
            logger.info(LOG_CATEGORY_JOYSTICK,
                        "Joystick " + std::to_string(previous) + " disconnected, switched to joystick " +
                        std::to_string(activeJoystick_));
        }
        else if (activeJoystick_ != INVALID_JOYSTICK_ID) {
            logger.info(LOG_CATEGORY_JOYSTICK, "Using joystick " + std::to_string(activeJoystick_));
        }
        else {
            logger.info(LOG_CATEGORY_JOYSTICK,
                        "Joystick " + std::to_string(previous) + " disconnected, no joystick available");
        }
    }

    JoystickState JoystickManager::buildState(const RawJoystickState& raw) noexcept {
        const float leftTrigger = std::clamp(raw.leftTrigger, 0.0f, 1.0f);
        const float rightTrigger = std::clamp(raw.rightTrigger, 0.0f, 1.0f);

        JoystickState::ButtonBits buttons = raw.buttons;
        buttons.set(static_cast<std::size_t>(JoystickButton::LEFT_TRIGGER), leftTrigger >= AXIS_PRESS_THRESHOLD);
        buttons.set(static_cast<std::size_t>(JoystickButton::RIGHT_TRIGGER), rightTrigger >= AXIS_PRESS_THRESHOLD);

        JoystickState::AxisValues axes{};
        axes[static_cast<std::size_t>(JoystickAxis::LEFT_STICK_X)] = std::clamp(raw.leftStick.x, -1.0f, 1.0f);
        axes[static_cast<std::size_t>(JoystickAxis::LEFT_STICK_Y)] = std::clamp(raw.leftStick.y, -1.0f, 1.0f);
        axes[static_cast<std::size_t>(JoystickAxis::RIGHT_STICK_X)] = std::clamp(raw.rightStick.x, -1.0f, 1.0f);
        axes[static_cast<std::size_t>(JoystickAxis::RIGHT_STICK_Y)] = std::clamp(raw.rightStick.y, -1.0f, 1.0f);
        axes[static_cast<std::size_t>(JoystickAxis::LEFT_TRIGGER)] = leftTrigger;
        axes[static_cast<std::size_t>(JoystickAxis::RIGHT_TRIGGER)] = rightTrigger;
        axes[static_cast<std::size_t>(JoystickAxis::TRIGGERS)] = rightTrigger - leftTrigger;

        return JoystickState(buttons, axes);
    }

    // ============================================================================
    // Buttons
    // ============================================================================

    bool JoystickManager::isPressed(const JoystickButton button) const noexcept {
        return current_.isButtonPressed(button);
    }

    bool JoystickManager::justPressed(const JoystickButton button) const noexcept {
        return current_.isButtonPressed(button) && !previous_.isButtonPressed(button);
    }

    bool JoystickManager::justReleased(const JoystickButton button) const noexcept {
        return !current_.isButtonPressed(button) && previous_.isButtonPressed(button);
    }

    bool JoystickManager::isPressed(const std::string_view button) const {
        const auto id = toButton(button);
        return id && isPressed(*id);
    }

    bool JoystickManager::justPressed(const std::string_view button) const {
        const auto id = toButton(button);
        return id && justPressed(*id);
    }

    bool JoystickManager::justReleased(const std::string_view button) const {
        const auto id = toButton(button);
        return id && justReleased(*id);
    }

    // ============================================================================
    // Axes
    // ============================================================================

    float JoystickManager::getAxis(const JoystickAxis axis) const noexcept {
        return current_.getAxis(axis);
    }

    float JoystickManager::getLastAxis(const JoystickAxis axis) const noexcept {
        return previous_.getAxis(axis);
    }

    float JoystickManager::axisDelta(const JoystickAxis axis) const noexcept {
        return getAxis(axis) - getLastAxis(axis);
    }

    float JoystickManager::getAxis(const std::string_view axis) const {
        const auto id = toAxis(axis);
        return id ? getAxis(*id) : 0.0f;
    }

    float JoystickManager::getLastAxis(const std::string_view axis) const {
        const auto id = toAxis(axis);
        return id ? getLastAxis(*id) : 0.0f;
    }

    float JoystickManager::axisDelta(const std::string_view axis) const {
        const auto id = toAxis(axis);
        return id ? axisDelta(*id) : 0.0f;
    }

    bool JoystickManager::axisIsPressed(const JoystickAxis axis, const bool bidirectional) const noexcept {
        return utils::isAxisPressed(getAxis(axis), bidirectional);
    }

    bool JoystickManager::axisJustPressed(const JoystickAxis axis, const bool bidirectional) const noexcept {
        return utils::isAxisPressed(getAxis(axis), bidirectional) &&
            !utils::isAxisPressed(getLastAxis(axis), bidirectional);
    }

    bool JoystickManager::axisJustReleased(const JoystickAxis axis, const bool bidirectional) const noexcept {
        return !utils::isAxisPressed(getAxis(axis), bidirectional) &&
            utils::isAxisPressed(getLastAxis(axis), bidirectional);
    }

    bool JoystickManager::axisIsPressed(const std::string_view axis, const bool bidirectional) const {
        const auto id = toAxis(axis);
        return id && axisIsPressed(*id, bidirectional);
    }

    bool JoystickManager::axisJustPressed(const std::string_view axis, const bool bidirectional) const {
        const auto id = toAxis(axis);
        return id && axisJustPressed(*id, bidirectional);
    }

    bool JoystickManager::axisJustReleased(const std::string_view axis, const bool bidirectional) const {
        const auto id = toAxis(axis);
        return id && axisJustReleased(*id, bidirectional);
    }

    bool JoystickManager::changedThisFrame() const noexcept {
        return !(current_ == previous_);
    }

    // ============================================================================
    // Names
    // ============================================================================

    bool JoystickManager::isButton(const std::string_view name) {
        return getJoystickButtonTable().isValid(name);
    }

    std::optional<JoystickButton> JoystickManager::toButton(const std::string_view name) {
        const auto result = getJoystickButtonTable().parse(name);
        if (!result) {
            return std::nullopt;
        }
        return static_cast<JoystickButton>(result.index);
    }

    std::string JoystickManager::buttonName(const JoystickButton button) {
        return getJoystickButtonTable().nameOf(static_cast<std::uint32_t>(button));
    }

    bool JoystickManager::isAxis(const std::string_view name) {
        return getJoystickAxisTable().isValid(name);
    }

    std::optional<JoystickAxis> JoystickManager::toAxis(const std::string_view name) {
        const auto result = getJoystickAxisTable().parse(name);
        if (!result) {
            return std::nullopt;
        }
        return static_cast<JoystickAxis>(result.index);
    }

    std::string JoystickManager::axisName(const JoystickAxis axis) {
        return getJoystickAxisTable().nameOf(static_cast<std::uint32_t>(axis));
    }
} // namespace actuate::input
