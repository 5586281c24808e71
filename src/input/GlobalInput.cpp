/**
 * @file GlobalInput.cpp
 * @brief Process-wide input system on the SDL2 backend
 * @author Actuate Team
 * @date 2025
 */

#include "InputSystem.h"

#include "debug/InputLogger.h"
#include "platform/sdl2/SDLInputBackend.h"
#include "utils/FileIO.h"

#include <mutex>

namespace actuate::input {
    namespace {
        InputConfig loadGlobalConfig() {
            InputConfig config;
            if (utils::fileExists(DEFAULT_INPUT_CONFIG_FILE)) {
                utils::ConfigLoader loader;
                if (!loader.loadSystemConfig(DEFAULT_INPUT_CONFIG_FILE, config)) {
                    debug::getLogger().warning(LOG_CATEGORY_CONFIG,
                                               "Using default input configuration: " +
                                               loader.getLastError().message);
                }
            }
            return config;
        }
    } // namespace

    InputSystem& getGlobalInputSystem() {
        static std::once_flag initFlag;
        // Never destroyed
        static InputSystem* system = nullptr;

        std::call_once(initFlag, [] {
            InputConfig config = loadGlobalConfig();

            auto backend = std::make_unique<SDLInputBackend>();
            if (!backend->initialize(config.backend)) {
                debug::getLogger().error(LOG_CATEGORY_BACKEND, "SDL backend unavailable, devices read as idle");
            }

            system = new InputSystem(std::move(backend), std::move(config));
        });

        return *system;
    }
} // namespace actuate::input
