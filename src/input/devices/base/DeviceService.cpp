/**
 * @file DeviceService.cpp
 * @brief Device dispatch service implementation
 * @author Actuate Team
 * @date 2025
 */

#include "DeviceService.h"

#include "../../platform/IInputBackend.h"

namespace actuate::input {
    DeviceService::DeviceService(IInputBackend& backend) noexcept
        : backend_(backend)
          , keyboard_(backend)
          , mouse_(backend)
          , joystick_(backend) {
    }

    void DeviceService::update() {
        backend_.refresh();

        keyboard_.update();
        mouse_.update();
        joystick_.update();
    }

    // ============================================================================
    // Button Queries
    // ============================================================================

    bool DeviceService::isPressed(const DeviceType device, const std::string_view button) const {
        switch (device) {
        case DeviceType::KEYBOARD: return keyboard_.isPressed(button);
        case DeviceType::MOUSE: return mouse_.isPressed(button);
        case DeviceType::JOYSTICK: return joystick_.isPressed(button);
        default: return false;
        }
    }

    bool DeviceService::justPressed(const DeviceType device, const std::string_view button) const {
        switch (device) {
        case DeviceType::KEYBOARD: return keyboard_.justPressed(button);
        case DeviceType::MOUSE: return mouse_.justPressed(button);
        case DeviceType::JOYSTICK: return joystick_.justPressed(button);
        default: return false;
        }
    }

    bool DeviceService::justReleased(const DeviceType device, const std::string_view button) const {
        switch (device) {
        case DeviceType::KEYBOARD: return keyboard_.justReleased(button);
        case DeviceType::MOUSE: return mouse_.justReleased(button);
        case DeviceType::JOYSTICK: return joystick_.justReleased(button);
        default: return false;
        }
    }

    // ============================================================================
    // Axis Queries
    // ============================================================================

    float DeviceService::getAxis(const DeviceType device, const std::string_view axis) const {
        switch (device) {
        case DeviceType::MOUSE: return mouse_.getAxis(axis);
        case DeviceType::JOYSTICK: return joystick_.getAxis(axis);
        default: return 0.0f;
        }
    }

    float DeviceService::getLastAxis(const DeviceType device, const std::string_view axis) const {
        switch (device) {
        case DeviceType::MOUSE: return mouse_.getLastAxis(axis);
        case DeviceType::JOYSTICK: return joystick_.getLastAxis(axis);
        default: return 0.0f;
        }
    }

    float DeviceService::axisDelta(const DeviceType device, const std::string_view axis) const {
        switch (device) {
        case DeviceType::MOUSE: return mouse_.axisDelta(axis);
        case DeviceType::JOYSTICK: return joystick_.axisDelta(axis);
        default: return 0.0f;
        }
    }

    bool DeviceService::isAxisPressed(const DeviceType device, const std::string_view axis,
                                      const bool bidirectional) const {
        switch (device) {
        case DeviceType::MOUSE: return mouse_.axisIsPressed(axis, bidirectional);
        case DeviceType::JOYSTICK: return joystick_.axisIsPressed(axis, bidirectional);
        default: return false;
        }
    }

    bool DeviceService::axisJustPressed(const DeviceType device, const std::string_view axis,
                                        const bool bidirectional) const {
        switch (device) {
        case DeviceType::MOUSE: return mouse_.axisJustPressed(axis, bidirectional);
        case DeviceType::JOYSTICK: return joystick_.axisJustPressed(axis, bidirectional);
        default: return false;
        }
    }

    bool DeviceService::axisJustReleased(const DeviceType device, const std::string_view axis,
                                         const bool bidirectional) const {
        switch (device) {
        case DeviceType::MOUSE: return mouse_.axisJustReleased(axis, bidirectional);
        case DeviceType::JOYSTICK: return joystick_.axisJustReleased(axis, bidirectional);
        default: return false;
        }
    }

    bool DeviceService::changedThisFrame(const DeviceType device) const noexcept {
        switch (device) {
        case DeviceType::KEYBOARD: return keyboard_.changedThisFrame();
        case DeviceType::MOUSE: return mouse_.changedThisFrame();
        case DeviceType::JOYSTICK: return joystick_.changedThisFrame();
        default: return false;
        }
    }

    // ============================================================================
    // Validation
    // ============================================================================

    bool DeviceService::isButton(const DeviceType device, const std::string_view button) {
        return parse(device, BindingKind::BUTTON, button).ok();
    }

    bool DeviceService::isAxis(const DeviceType device, const std::string_view axis) {
        return parse(device, BindingKind::AXIS, axis).ok();
    }

    NameParseResult DeviceService::parse(const DeviceType device, const BindingKind kind, const std::string_view text) {
        const NameTable* table = nullptr;
        switch (device) {
        case DeviceType::KEYBOARD:
            table = kind == BindingKind::BUTTON ? &getKeyboardKeyTable() : nullptr;
            break;
        case DeviceType::MOUSE:
            table = kind == BindingKind::BUTTON ? &getMouseButtonTable() : &getMouseAxisTable();
            break;
        case DeviceType::JOYSTICK:
            table = kind == BindingKind::BUTTON ? &getJoystickButtonTable() : &getJoystickAxisTable();
            break;
        default:
            break;
        }

        if (!table) {
            NameParseResult result;
            result.error = NameParseError::UNKNOWN_NAME;
            return result;
        }
        return table->parse(text);
    }
} // namespace actuate::input
