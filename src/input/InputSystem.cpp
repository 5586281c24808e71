/**
 * @file InputSystem.cpp
 * @brief Action-based input facade implementation
 * @author Actuate Team
 * @date 2025
 */

#include "InputSystem.h"

#include "debug/InputLogger.h"

#include <stdexcept>

namespace actuate::input {
    IInputBackend& InputSystem::requireBackend(const std::unique_ptr<IInputBackend>& backend) {
        if (!backend) {
            throw std::invalid_argument("InputSystem requires an input backend");
        }
        return *backend;
    }

    // Member order matters: devices_ binds to *backend_
    InputSystem::InputSystem(std::unique_ptr<IInputBackend> backend, InputConfig config)
        : backend_(std::move(backend))
          , config_(std::move(config))
          , devices_(requireBackend(backend_)) {
        if (!config_.validate()) {
            throw std::invalid_argument("Invalid input configuration");
        }

        auto& logger = debug::getLogger();
        if (config_.applyLoggerConfig && !logger.setConfig(config_.logger)) {
            logger.warning(LOG_CATEGORY_INPUT, "Cannot open log file " + config_.logger.logFilePath);
        }

        if (config_.bindings.loadOnStart && !loadFromFile()) {
            logger.warning(LOG_CATEGORY_INPUT, "Starting without bindings from " + config_.bindings.path);
        }
    }

    void InputSystem::update() {
        devices_.update();

        ++frameNumber_;
        debug::getLogger().setFrameNumber(frameNumber_);

        for (const auto device : {DeviceType::KEYBOARD, DeviceType::MOUSE, DeviceType::JOYSTICK}) {
            if (devices_.changedThisFrame(device)) {
                if (device != lastDevice_) {
                    debug::getLogger().verbose(LOG_CATEGORY_INPUT,
                                               std::string("Last device: ") + deviceTypeToString(device));
                }
                lastDevice_ = device;
                break;
            }
        }
    }

    // ============================================================================
    // Action Queries
    // ============================================================================

    bool InputSystem::isPressed(const std::string_view action) const {
        const Action* found = actions_.get(action);
        return found != nullptr && found->isPressed(devices_);
    }

    bool InputSystem::justPressed(const std::string_view action) const {
        const Action* found = actions_.get(action);
        return found != nullptr && found->justPressed(devices_);
    }

    bool InputSystem::justReleased(const std::string_view action) const {
        const Action* found = actions_.get(action);
        return found != nullptr && found->justReleased(devices_);
    }

    float InputSystem::getValue(const std::string_view action) const {
        const Action* found = actions_.get(action);
        return found != nullptr ? found->getValue(devices_) : 0.0f;
    }

    // ============================================================================
    // Bindings Persistence
    // ============================================================================

    bool InputSystem::loadFromFile(const std::string& path) {
        return configLoader_.loadBindings(resolvePath(path), actions_);
    }

    bool InputSystem::saveToFile(const std::string& path, const bool overwrite) {
        return configLoader_.saveBindings(resolvePath(path), actions_, overwrite);
    }
} // namespace actuate::input
