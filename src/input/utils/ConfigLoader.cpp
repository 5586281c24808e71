/**
 * @file ConfigLoader.cpp
 * @brief Configuration and bindings file loading implementation
 * @author Actuate Team
 * @date 2025
 */

#include "ConfigLoader.h"

#include "FileIO.h"
#include "InputUtils.h"
#include "../debug/InputLogger.h"
#include "../mapping/ActionSet.h"

#include <nlohmann/json.hpp>

#include <ranges>

namespace actuate::input::utils {
    using json = nlohmann::json;

    namespace {
        std::optional<debug::LogLevel> parseLogLevel(const std::string_view text) {
            const std::string lower = toLower(trim(text));
            if (lower == "none") return debug::LogLevel::NONE;
            if (lower == "error") return debug::LogLevel::ERROR;
            if (lower == "warn" || lower == "warning") return debug::LogLevel::WARNING;
            if (lower == "info") return debug::LogLevel::INFO;
            if (lower == "debug") return debug::LogLevel::DEBUG;
            if (lower == "verbose") return debug::LogLevel::VERBOSE;
            return std::nullopt;
        }

        std::optional<debug::LogFormat> parseLogFormat(const std::string_view text) {
            const std::string lower = toLower(trim(text));
            if (lower == "text") return debug::LogFormat::TEXT;
            if (lower == "json") return debug::LogFormat::JSON;
            return std::nullopt;
        }

        const char* logFormatToString(const debug::LogFormat format) {
            return format == debug::LogFormat::JSON ? "JSON" : "TEXT";
        }

        /**
         * @brief Parse one entry of an action's "bindings" array
         */
        std::optional<InputBinding> bindingFromJson(const json& j, std::string& error) {
            if (!j.is_object()) {
                error = "binding is not an object";
                return std::nullopt;
            }

            const auto kind = parseBindingKind(j.value("type", std::string{}));
            if (!kind) {
                error = "binding has no valid 'type' (button or axis)";
                return std::nullopt;
            }

            const auto device = parseDeviceType(j.value("device", std::string{}));
            if (!device || !isBindableDevice(*device)) {
                error = "binding has no valid 'device'";
                return std::nullopt;
            }

            InputBinding binding;
            binding.device = *device;
            binding.kind = *kind;
            binding.invert = j.value("invert", false);

            if (*kind == BindingKind::AXIS) {
                binding.positive = j.value("value", std::string{});
            }
            else {
                binding.positive = j.value("positive", j.value("value", std::string{}));
                binding.negative = j.value("negative", std::string{});
            }

            if (const auto reason = binding.getValidationError(); !reason.empty()) {
                error = reason;
                return std::nullopt;
            }

            return binding;
        }
    } // namespace

    ConfigFormat ConfigLoader::detectFormat(const std::filesystem::path& path) {
        return iequals(path.extension().string(), ".json") ? ConfigFormat::JSON : ConfigFormat::XML;
    }

    // ============================================================================
    // Bindings
    // ============================================================================

    bool ConfigLoader::loadBindings(const std::filesystem::path& path, ActionSet& actions) {
        clearError();

        const auto contents = readFileContents(path);
        if (!contents) {
            return recordError(InputErrorCode::FILE_NOT_FOUND, "Cannot read bindings file: " + path.string());
        }

        if (detectFormat(path) == ConfigFormat::JSON) {
            if (!parseBindingsJson(*contents, actions)) {
                return false;
            }
        }
        else if (!actions.loadFromString(*contents)) {
            return recordError(InputErrorCode::PARSE_ERROR, "Invalid bindings document: " + path.string());
        }

        debug::getLogger().info(LOG_CATEGORY_CONFIG,
                                "Loaded " + std::to_string(actions.size()) + " actions from " + path.string());
        return true;
    }

    bool ConfigLoader::saveBindings(const std::filesystem::path& path, const ActionSet& actions,
                                    const bool overwrite) {
        clearError();

        const std::string text = detectFormat(path) == ConfigFormat::JSON
                                     ? bindingsToJson(actions)
                                     : actions.toDocument();

        if (!writeText(path, text, overwrite)) {
            return false;
        }

        debug::getLogger().info(LOG_CATEGORY_CONFIG,
                                "Saved " + std::to_string(actions.size()) + " actions to " + path.string());
        return true;
    }

    bool ConfigLoader::parseBindingsJson(const std::string& text, ActionSet& actions) {
        try {
            const auto j = json::parse(text);

            if (!j.is_object() || !j.contains("action_set") || !j["action_set"].is_array()) {
                return recordError(InputErrorCode::PARSE_ERROR, "Bindings JSON has no 'action_set' array");
            }

            ActionSet loaded;
            for (const auto& actionJson : j["action_set"]) {
                if (!actionJson.is_object()) {
                    return recordError(InputErrorCode::PARSE_ERROR, "Action entry is not an object");
                }

                const std::string name = actionJson.value("name", std::string{});
                if (!isValidName(name)) {
                    return recordError(InputErrorCode::INVALID_PARAMETER, "Invalid action name '" + name + "'");
                }

                Action action(name);
                if (actionJson.contains("bindings")) {
                    const auto& bindings = actionJson["bindings"];
                    if (!bindings.is_array()) {
                        return recordError(InputErrorCode::PARSE_ERROR,
                                           "Action '" + name + "' has a non-array 'bindings'");
                    }
                    if (bindings.size() > MAX_BINDINGS_PER_ACTION) {
                        return recordError(InputErrorCode::PARSE_ERROR,
                                           "Action '" + name + "' has too many bindings");
                    }

                    for (const auto& bindingJson : bindings) {
                        std::string error;
                        const auto binding = bindingFromJson(bindingJson, error);
                        if (!binding) {
                            return recordError(InputErrorCode::INVALID_PARAMETER,
                                               "Action '" + name + "': " + error);
                        }
                        if (!action.add(*binding)) {
                            return recordError(InputErrorCode::BINDING_CONFLICT,
                                               "Action '" + name + "': binding " + binding->toString() +
                                               " rejected");
                        }
                    }
                }

                if (loaded.contains(name)) {
                    return recordError(InputErrorCode::ALREADY_EXISTS, "Duplicate action '" + name + "'");
                }
                if (loaded.size() >= MAX_ACTIONS) {
                    return recordError(InputErrorCode::PARSE_ERROR, "Too many actions");
                }
                if (!loaded.add(action)) {
                    return recordError(InputErrorCode::INVALID_PARAMETER, "Action '" + name + "' rejected");
                }
            }

            actions = std::move(loaded);
            return true;
        }
        catch (const json::exception& e) {
            return recordError(InputErrorCode::PARSE_ERROR, std::string("Bindings JSON error: ") + e.what());
        }
    }

    std::string ConfigLoader::bindingsToJson(const ActionSet& actions) {
        json j;
        j["action_set"] = json::array();

        for (const auto& action : actions | std::views::values) {
            json actionJson;
            actionJson["name"] = action.getName();
            actionJson["bindings"] = json::array();

            for (const auto& binding : action) {
                json bindingJson;
                bindingJson["type"] = bindingKindToString(binding.kind);
                bindingJson["device"] = deviceTypeToString(binding.device);

                if (binding.kind == BindingKind::AXIS) {
                    bindingJson["value"] = binding.positive;
                }
                else {
                    if (!binding.positive.empty()) bindingJson["positive"] = binding.positive;
                    if (!binding.negative.empty()) bindingJson["negative"] = binding.negative;
                }
                bindingJson["invert"] = binding.invert;

                actionJson["bindings"].push_back(bindingJson);
            }

            j["action_set"].push_back(actionJson);
        }

        return j.dump(2) + "\n";
    }

    // ============================================================================
    // System Configuration
    // ============================================================================

    bool ConfigLoader::loadSystemConfig(const std::filesystem::path& path, InputConfig& config) {
        clearError();

        const auto contents = readFileContents(path);
        if (!contents) {
            return recordError(InputErrorCode::FILE_NOT_FOUND, "Cannot read config file: " + path.string());
        }

        return parseSystemConfig(*contents, config);
    }

    bool ConfigLoader::saveSystemConfig(const std::filesystem::path& path, const InputConfig& config) {
        clearError();
        return writeText(path, systemConfigToJson(config), true);
    }

    bool ConfigLoader::parseSystemConfig(const std::string& text, InputConfig& config) {
        try {
            const auto j = json::parse(text);
            if (!j.is_object()) {
                return recordError(InputErrorCode::PARSE_ERROR, "Config root is not an object");
            }

            InputConfig loaded;

            if (j.contains("bindings")) {
                const auto& bindings = j["bindings"];
                loaded.bindings.path = bindings.value("path", loaded.bindings.path);
                loaded.bindings.loadOnStart = bindings.value("loadOnStart", loaded.bindings.loadOnStart);
                loaded.bindings.overwriteOnSave = bindings.value("overwriteOnSave",
                                                                 loaded.bindings.overwriteOnSave);
            }

            if (j.contains("logger")) {
                const auto& logger = j["logger"];
                auto& target = loaded.logger;

                if (logger.contains("minLevel")) {
                    const auto level = parseLogLevel(logger["minLevel"].get<std::string>());
                    if (!level) {
                        return recordError(InputErrorCode::PARSE_ERROR,
                                           "Unknown log level: " + logger["minLevel"].get<std::string>());
                    }
                    target.minLevel = *level;
                }
                if (logger.contains("format")) {
                    const auto format = parseLogFormat(logger["format"].get<std::string>());
                    if (!format) {
                        return recordError(InputErrorCode::PARSE_ERROR,
                                           "Unknown log format: " + logger["format"].get<std::string>());
                    }
                    target.format = *format;
                }

                target.logToConsole = logger.value("logToConsole", target.logToConsole);
                target.logToFile = logger.value("logToFile", target.logToFile);
                target.logFilePath = logger.value("logFilePath", target.logFilePath);
                target.logToMemory = logger.value("logToMemory", target.logToMemory);
                target.maxMemoryEntries = logger.value("maxMemoryEntries", target.maxMemoryEntries);
                target.includeTimestamp = logger.value("includeTimestamp", target.includeTimestamp);
                target.includeFrameNumber = logger.value("includeFrameNumber", target.includeFrameNumber);
                target.flushImmediately = logger.value("flushImmediately", target.flushImmediately);
            }

            if (j.contains("backend")) {
                const auto& backend = j["backend"];
                loaded.backend.controllerMappingsFile = backend.value("controllerMappingsFile",
                                                                      loaded.backend.controllerMappingsFile);
                loaded.backend.useGlobalMousePosition = backend.value("useGlobalMousePosition",
                                                                      loaded.backend.useGlobalMousePosition);
            }

            loaded.applyLoggerConfig = j.value("applyLoggerConfig", loaded.applyLoggerConfig);

            if (!loaded.validate()) {
                return recordError(InputErrorCode::INVALID_PARAMETER, "Configuration failed validation");
            }

            config = std::move(loaded);
            return true;
        }
        catch (const json::exception& e) {
            return recordError(InputErrorCode::PARSE_ERROR, std::string("Config JSON error: ") + e.what());
        }
    }

    std::string ConfigLoader::systemConfigToJson(const InputConfig& config) {
        json j;

        j["bindings"]["path"] = config.bindings.path;
        j["bindings"]["loadOnStart"] = config.bindings.loadOnStart;
        j["bindings"]["overwriteOnSave"] = config.bindings.overwriteOnSave;

        j["logger"]["minLevel"] = debug::logLevelToString(config.logger.minLevel);
        j["logger"]["format"] = logFormatToString(config.logger.format);
        j["logger"]["logToConsole"] = config.logger.logToConsole;
        j["logger"]["logToFile"] = config.logger.logToFile;
        j["logger"]["logFilePath"] = config.logger.logFilePath;
        j["logger"]["logToMemory"] = config.logger.logToMemory;
        j["logger"]["maxMemoryEntries"] = config.logger.maxMemoryEntries;
        j["logger"]["includeTimestamp"] = config.logger.includeTimestamp;
        j["logger"]["includeFrameNumber"] = config.logger.includeFrameNumber;
        j["logger"]["flushImmediately"] = config.logger.flushImmediately;

        j["backend"]["controllerMappingsFile"] = config.backend.controllerMappingsFile;
        j["backend"]["useGlobalMousePosition"] = config.backend.useGlobalMousePosition;

        j["applyLoggerConfig"] = config.applyLoggerConfig;

        return j.dump(2) + "\n";
    }

    // ============================================================================
    // Private Implementation
    // ============================================================================

    bool ConfigLoader::recordError(const InputErrorCode code, const std::string& message) {
        lastError_.code = code;
        lastError_.message = message;
        debug::getLogger().error(LOG_CATEGORY_CONFIG,
                                 std::string(getErrorString(code)) + ": " + message);
        return false;
    }

    bool ConfigLoader::writeText(const std::filesystem::path& path, const std::string& text, const bool overwrite) {
        if (!overwrite && fileExists(path)) {
            return recordError(InputErrorCode::ALREADY_EXISTS, "File exists: " + path.string());
        }

        std::string error;
        if (!atomicWriteFile(path, text, error)) {
            return recordError(InputErrorCode::WRITE_FAILED, error);
        }
        return true;
    }
} // namespace actuate::input::utils
