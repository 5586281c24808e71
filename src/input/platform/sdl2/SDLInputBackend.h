/**
 * @file SDLInputBackend.h
 * @brief SDL2 implementation of the raw device polling interface
 * @author Actuate Team
 * @date 2025
 */

#pragma once

#include "SDLKeyMap.h"
#include "../IInputBackend.h"
#include "../../core/InputConfig.h"

#include <SDL2/SDL.h>

#include <memory>
#include <string>
#include <vector>

namespace actuate::input {
    /**
     * @brief Polls keyboard, mouse and game controllers through SDL2
     *
     * Owns the SDL game controller and events subsystems and every opened
     * SDL_GameController. Controllers are tracked in connection order and
     * identified by their SDL joystick instance id.
     */
    class SDLInputBackend final : public IInputBackend {
    public:
        SDLInputBackend() noexcept = default;
        ~SDLInputBackend() override;

        SDLInputBackend(const SDLInputBackend&) = delete;
        SDLInputBackend& operator=(const SDLInputBackend&) = delete;

        /**
         * @brief Initialize SDL subsystems and open connected controllers
         * @return False if already initialized or SDL fails to start
         */
        bool initialize(const SDLBackendConfig& config = {});

        /**
         * @brief Close controllers and quit the SDL subsystems
         */
        void shutdown();

        [[nodiscard]] bool isInitialized() const noexcept { return initialized_; }

        /**
         * @brief Add controller mappings in gamecontrollerdb.txt format
         * @return Number of mappings added, -1 on error
         */
        int loadControllerMappings(const std::string& filepath) const;

        // ============================================================================
        // IInputBackend
        // ============================================================================

        void refresh() override;

        [[nodiscard]] bool isKeyPressed(KeyCode key) const override;

        [[nodiscard]] MouseState pollMouse() const override;

        [[nodiscard]] std::vector<JoystickId> getConnectedJoysticks() const override;

        [[nodiscard]] bool isJoystickConnected(JoystickId id) const override;

        [[nodiscard]] std::optional<RawJoystickState> pollJoystick(JoystickId id) const override;

    private:
        struct ControllerDeleter {
            void operator()(SDL_GameController* controller) const noexcept {
                SDL_GameControllerClose(controller);
            }
        };

        using ControllerHandle = std::unique_ptr<SDL_GameController, ControllerDeleter>;

        struct ControllerEntry {
            JoystickId instanceId;
            ControllerHandle controller;
        };

        static constexpr Uint32 SDL_SUBSYSTEMS = SDL_INIT_GAMECONTROLLER | SDL_INIT_EVENTS;

        SDLBackendConfig config_;
        SDLKeyMap keyMap_;
        std::vector<ControllerEntry> controllers_;
        bool initialized_ = false;

        void scanControllers();

        void openController(int deviceIndex);

        void removeDetachedControllers();

        [[nodiscard]] SDL_GameController* findController(JoystickId id) const;
    };
} // namespace actuate::input
