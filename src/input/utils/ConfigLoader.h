/**
 * @file ConfigLoader.h
 * @brief Reading and writing of input configuration and bindings files
 * @author Actuate Team
 * @date 2025
 *
 * System configuration is stored as JSON. Bindings are stored as XML or JSON,
 * selected by file extension.
 */

#pragma once

#include "../core/InputConfig.h"
#include "../core/InputConstants.h"

#include <filesystem>
#include <string>

namespace actuate::input {
    class ActionSet;
}

namespace actuate::input::utils {
    /**
     * @brief Bindings file format
     */
    enum class ConfigFormat : std::uint8_t {
        XML,
        JSON
    };

    /**
     * @brief Last error recorded by a loader operation
     */
    struct ConfigError {
        InputErrorCode code = InputErrorCode::SUCCESS;
        std::string message;

        [[nodiscard]] bool ok() const noexcept { return code == InputErrorCode::SUCCESS; }
    };

    /**
     * @brief Loads and saves InputConfig and ActionSet files
     *
     * Every operation returns false on failure and records the reason, also
     * logged under the Config category. The target of a failed load is left
     * untouched.
     */
    class ConfigLoader {
    public:
        ConfigLoader() = default;

        /**
         * @brief Format for a path: JSON for ".json" (any case), XML otherwise
         */
        [[nodiscard]] static ConfigFormat detectFormat(const std::filesystem::path& path);

        // ============================================================================
        // Bindings
        // ============================================================================

        bool loadBindings(const std::filesystem::path& path, ActionSet& actions);

        bool saveBindings(const std::filesystem::path& path, const ActionSet& actions, bool overwrite = true);

        /**
         * @brief Parse the JSON bindings layout into `actions`
         */
        bool parseBindingsJson(const std::string& text, ActionSet& actions);

        [[nodiscard]] static std::string bindingsToJson(const ActionSet& actions);

        // ============================================================================
        // System Configuration
        // ============================================================================

        bool loadSystemConfig(const std::filesystem::path& path, InputConfig& config);

        bool saveSystemConfig(const std::filesystem::path& path, const InputConfig& config);

        /**
         * @brief Parse a JSON system configuration, missing keys keep their defaults
         */
        bool parseSystemConfig(const std::string& text, InputConfig& config);

        [[nodiscard]] static std::string systemConfigToJson(const InputConfig& config);

        // ============================================================================
        // Errors
        // ============================================================================

        [[nodiscard]] const ConfigError& getLastError() const noexcept { return lastError_; }

        void clearError() noexcept { lastError_ = {}; }

    private:
        ConfigError lastError_;

        bool recordError(InputErrorCode code, const std::string& message);

        bool writeText(const std::filesystem::path& path, const std::string& text, bool overwrite);
    };
} // namespace actuate::input::utils
