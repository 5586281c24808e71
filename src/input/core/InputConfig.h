/**
 * @file InputConfig.h
 * @brief Configuration settings for the input system
 * @author Actuate Team
 * @date 2025
 *
 * Bindings file location, logger setup and platform backend options.
 * Serialized as JSON by utils::ConfigLoader.
 */

#pragma once

#include "../core/InputConstants.h"
#include "../debug/InputLogger.h"

#include <string>

namespace actuate::input {
    /**
     * @brief Options consumed by the SDL backend
     */
    struct SDLBackendConfig {
        // Extra SDL_GameController mappings (gamecontrollerdb.txt format)
        std::string controllerMappingsFile;

        // Desktop-space mouse position instead of window-relative
        bool useGlobalMousePosition = true;

        SDLBackendConfig() = default;
    };

    /**
     * @brief Input system configuration
     */
    struct InputConfig {
        // ============================================================================
        // Bindings Configuration
        // ============================================================================

        struct BindingsConfig {
            std::string path = DEFAULT_BINDINGS_PATH;
            bool loadOnStart = false;
            bool overwriteOnSave = true;

            BindingsConfig() = default;
        };

        // ============================================================================
        // Main Configuration Structure
        // ============================================================================

        BindingsConfig bindings;
        debug::LoggerConfig logger;
        SDLBackendConfig backend;

        // Apply `logger` to debug::getLogger() when an InputSystem is created
        bool applyLoggerConfig = false;

        InputConfig() = default;

        /**
         * @brief Reset to default values
         */
        void reset() {
            *this = InputConfig{};
        }

        /**
         * @brief Validate configuration
         */
        [[nodiscard]] bool validate() const {
            if (bindings.path.empty()) return false;
            if (logger.logToMemory && logger.maxMemoryEntries == 0) return false;
            if (logger.logToFile && logger.logFilePath.empty()) return false;

            return true;
        }
    };
} // namespace actuate::input
