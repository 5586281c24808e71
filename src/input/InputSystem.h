/**
 * @file InputSystem.h
 * @brief Action-based input facade
 * @author Actuate Team
 * @date 2025
 *
 * Owns the device managers and the action set, and steps them once per frame.
 * Game code queries actions by name instead of raw device codes.
 */

#pragma once

#include "core/InputConfig.h"
#include "core/InputTypes.h"
#include "devices/base/DeviceService.h"
#include "mapping/ActionSet.h"
#include "platform/IInputBackend.h"
#include "utils/ConfigLoader.h"

#include <memory>
#include <string>
#include <string_view>

namespace actuate::input {
    /**
     * @brief Main input system class
     *
     * Single-threaded: update() and the queries of one instance must run on
     * the same thread.
     */
    class InputSystem {
    public:
        /**
         * @brief Constructor
         * @param backend Raw device source, owned by the system
         * @param config System configuration
         * @throws std::invalid_argument if backend is null or config is invalid
         */
        explicit InputSystem(std::unique_ptr<IInputBackend> backend, InputConfig config = {});

        ~InputSystem() = default;

        InputSystem(const InputSystem&) = delete;
        InputSystem& operator=(const InputSystem&) = delete;

        /**
         * @brief Advance every device by one frame
         *
         * Updates keyboard, mouse and joystick in that order, then records the
         * first of them that changed as the last used device.
         */
        void update();

        // ============================================================================
        // Device Queries
        // ============================================================================

        [[nodiscard]] bool isPressed(DeviceType device, std::string_view button) const {
            return devices_.isPressed(device, button);
        }

        [[nodiscard]] bool justPressed(DeviceType device, std::string_view button) const {
            return devices_.justPressed(device, button);
        }

        [[nodiscard]] bool justReleased(DeviceType device, std::string_view button) const {
            return devices_.justReleased(device, button);
        }

        [[nodiscard]] float getAxis(DeviceType device, std::string_view axis) const {
            return devices_.getAxis(device, axis);
        }

        [[nodiscard]] float getLastAxis(DeviceType device, std::string_view axis) const {
            return devices_.getLastAxis(device, axis);
        }

        [[nodiscard]] float axisDelta(DeviceType device, std::string_view axis) const {
            return devices_.axisDelta(device, axis);
        }

        [[nodiscard]] bool isAxisPressed(DeviceType device, std::string_view axis, bool bidirectional = false) const {
            return devices_.isAxisPressed(device, axis, bidirectional);
        }

        [[nodiscard]] bool axisJustPressed(DeviceType device, std::string_view axis, bool bidirectional = false) const {
            return devices_.axisJustPressed(device, axis, bidirectional);
        }

        [[nodiscard]] bool axisJustReleased(DeviceType device, std::string_view axis, bool bidirectional = false) const {
            return devices_.axisJustReleased(device, axis, bidirectional);
        }

        [[nodiscard]] static bool isButton(DeviceType device, std::string_view button) {
            return DeviceService::isButton(device, button);
        }

        [[nodiscard]] static bool isAxis(DeviceType device, std::string_view axis) {
            return DeviceService::isAxis(device, axis);
        }

        // ============================================================================
        // Action Queries
        // ============================================================================

        /**
         * @brief Check if action is pressed, false for unknown actions
         */
        [[nodiscard]] bool isPressed(std::string_view action) const;

        [[nodiscard]] bool justPressed(std::string_view action) const;

        [[nodiscard]] bool justReleased(std::string_view action) const;

        /**
         * @brief Get action value, 0 for unknown actions
         */
        [[nodiscard]] float getValue(std::string_view action) const;

        // ============================================================================
        // Bindings Persistence
        // ============================================================================

        /**
         * @brief Replace the action set from a bindings file
         * @param path XML or JSON file, the configured bindings path when empty
         * @return False on failure; the previous bindings stay active
         */
        bool loadFromFile(const std::string& path = {});

        /**
         * @brief Write the action set
         * @param path XML or JSON file, the configured bindings path when empty
         * @param overwrite Replace an existing file
         */
        bool saveToFile(const std::string& path = {}, bool overwrite = true);

        // ============================================================================
        // Accessors
        // ============================================================================

        [[nodiscard]] KeyboardManager& keyboard() noexcept { return devices_.keyboard(); }
        [[nodiscard]] const KeyboardManager& keyboard() const noexcept { return devices_.keyboard(); }

        [[nodiscard]] MouseManager& mouse() noexcept { return devices_.mouse(); }
        [[nodiscard]] const MouseManager& mouse() const noexcept { return devices_.mouse(); }

        [[nodiscard]] JoystickManager& joystick() noexcept { return devices_.joystick(); }
        [[nodiscard]] const JoystickManager& joystick() const noexcept { return devices_.joystick(); }

        [[nodiscard]] DeviceService& devices() noexcept { return devices_; }
        [[nodiscard]] const DeviceService& devices() const noexcept { return devices_; }

        [[nodiscard]] ActionSet& actions() noexcept { return actions_; }
        [[nodiscard]] const ActionSet& actions() const noexcept { return actions_; }

        [[nodiscard]] const InputConfig& getConfig() const noexcept { return config_; }

        [[nodiscard]] const utils::ConfigError& getLastError() const noexcept {
            return configLoader_.getLastError();
        }

        [[nodiscard]] FrameNumber getFrameNumber() const noexcept { return frameNumber_; }

        /**
         * @brief Device that most recently changed, NONE until one does
         */
        [[nodiscard]] DeviceType getLastDevice() const noexcept { return lastDevice_; }

    private:
        std::unique_ptr<IInputBackend> backend_;
        InputConfig config_;
        DeviceService devices_;
        ActionSet actions_;
        utils::ConfigLoader configLoader_;

        DeviceType lastDevice_ = DeviceType::NONE;
        FrameNumber frameNumber_ = 0;

        [[nodiscard]] std::string resolvePath(const std::string& path) const {
            return path.empty() ? config_.bindings.path : path;
        }

        [[nodiscard]] static IInputBackend& requireBackend(const std::unique_ptr<IInputBackend>& backend);
    };

    /**
     * @brief Process-wide input system on the SDL2 backend
     *
     * Constructed on first call, exactly once even under concurrent first
     * access, and kept alive until exit. The system configuration is read from
     * DEFAULT_INPUT_CONFIG_FILE when that file exists.
     */
    InputSystem& getGlobalInputSystem();
} // namespace actuate::input
