/**
 * @file InputLogger.cpp
 * @brief Input system logging utilities implementation
 * @author Actuate Team
 * @date 2025
 */

#include "InputLogger.h"

#include <nlohmann/json.hpp>

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace actuate::input::debug {
    const char* logLevelToString(const LogLevel level) {
        switch (level) {
        case LogLevel::NONE: return "NONE";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::VERBOSE: return "VERBOSE";
        default: return "UNKNOWN";
        }
    }

    InputLogger::InputLogger() noexcept = default;

    InputLogger::~InputLogger() {
        shutdown();
    }

    // ============================================================================
    // Initialization
    // ============================================================================

    bool InputLogger::initialize(const LoggerConfig& config) {
        if (initialized_.load(std::memory_order_acquire)) {
            return false;
        }

        if (config.logToFile && !openLogFile(config.logFilePath)) {
            return false;
        }

        {
            std::lock_guard lock(configMutex_);
            config_ = config;
        }

        if (config.logToMemory) {
            std::lock_guard lock(memoryMutex_);
            memoryLog_.reserve(config.maxMemoryEntries);
        }

        initialized_.store(true, std::memory_order_release);
        return true;
    }

    void InputLogger::shutdown() {
        if (!initialized_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }

        flush();
        closeLogFile();
        clearMemoryLog();
        clearCallbacks();
    }

    bool InputLogger::setConfig(const LoggerConfig& config) {
        closeLogFile();

        bool fileOpened = true;
        if (config.logToFile) {
            fileOpened = openLogFile(config.logFilePath);
        }

        {
            std::lock_guard lock(configMutex_);
            config_ = config;
            if (!fileOpened) {
                config_.logToFile = false;
            }
        }

        // Trim the memory log to the new bound
        {
            std::lock_guard lock(memoryMutex_);
            if (!config.logToMemory) {
                memoryLog_.clear();
            }
            else if (memoryLog_.size() > config.maxMemoryEntries) {
                const auto excess = static_cast<std::ptrdiff_t>(memoryLog_.size() - config.maxMemoryEntries);
                memoryLog_.erase(memoryLog_.begin(), memoryLog_.begin() + excess);
            }
        }

        return fileOpened;
    }

    LoggerConfig InputLogger::getConfig() const {
        std::lock_guard lock(configMutex_);
        return config_;
    }

    void InputLogger::setLogLevel(const LogLevel level) {
        std::lock_guard lock(configMutex_);
        config_.minLevel = level;
    }

    // ============================================================================
    // Logging
    // ============================================================================

    void InputLogger::log(const LogLevel level, const std::string& category, const std::string& message,
                          const std::string& details) {
        if (!initialized_.load(std::memory_order_acquire)) {
            return;
        }

        const LoggerConfig config = getConfig();
        if (!levelAccepted(level, config.minLevel) || !isCategoryEnabled(category)) {
            return;
        }

        LogEntry entry;
        entry.level = level;
        entry.timestamp = std::chrono::system_clock::now();
        entry.frameNumber = currentFrame_.load(std::memory_order_acquire);
        entry.category = category.empty() ? "General" : category;
        entry.message = message;
        entry.details = details;

        writeEntry(entry, config);
    }

    bool InputLogger::isEnabled(const LogLevel level) const {
        if (!initialized_.load(std::memory_order_acquire)) {
            return false;
        }
        std::lock_guard lock(configMutex_);
        return levelAccepted(level, config_.minLevel);
    }

    // ============================================================================
    // Output Management
    // ============================================================================

    void InputLogger::flush() {
        std::lock_guard lock(fileMutex_);
        if (fileStream_) {
            fileStream_->flush();
        }
    }

    void InputLogger::clearMemoryLog() {
        std::lock_guard lock(memoryMutex_);
        memoryLog_.clear();
    }

    std::vector<LogEntry> InputLogger::getMemoryLog(const std::size_t maxEntries) const {
        std::lock_guard lock(memoryMutex_);

        if (maxEntries == 0 || maxEntries >= memoryLog_.size()) {
            return memoryLog_;
        }

        // Return the most recent entries
        const std::size_t startIndex = memoryLog_.size() - maxEntries;
        return std::vector<LogEntry>(memoryLog_.begin() + static_cast<std::ptrdiff_t>(startIndex), memoryLog_.end());
    }

    void InputLogger::registerCallback(LogCallback callback) {
        std::lock_guard lock(callbackMutex_);
        callbacks_.push_back(std::move(callback));
    }

    void InputLogger::clearCallbacks() {
        std::lock_guard lock(callbackMutex_);
        callbacks_.clear();
    }

    // ============================================================================
    // Filtering
    // ============================================================================

    void InputLogger::setCategoryEnabled(const std::string& category, const bool enabled) {
        std::lock_guard lock(filterMutex_);
        categoryFilters_[category] = enabled;
    }

    bool InputLogger::isCategoryEnabled(const std::string& category) const {
        std::lock_guard lock(filterMutex_);
        const auto it = categoryFilters_.find(category);
        return it == categoryFilters_.end() || it->second; // Default enabled
    }

    // ============================================================================
    // Formatting
    // ============================================================================

    std::string InputLogger::formatText(const LogEntry& entry, const LoggerConfig& config) {
        std::stringstream ss;

        if (config.includeTimestamp) {
            const auto time = std::chrono::system_clock::to_time_t(entry.timestamp);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.timestamp.time_since_epoch()).count() % 1000;

            std::tm local{};
            localtime_r(&time, &local);
            ss << std::put_time(&local, "%H:%M:%S.")
                << std::setfill('0') << std::setw(3) << millis << " ";
        }

        if (config.includeFrameNumber) {
            ss << "[F" << entry.frameNumber << "] ";
        }

        ss << "[" << logLevelToString(entry.level) << "]";

        if (!entry.category.empty()) {
            ss << " [" << entry.category << "]";
        }

        ss << " " << entry.message;

        if (!entry.details.empty()) {
            ss << "\n  Details: " << entry.details;
        }

        return ss.str();
    }

    std::string InputLogger::formatJSON(const LogEntry& entry, const LoggerConfig& config) {
        nlohmann::json json;
        if (config.includeTimestamp) {
            json["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                entry.timestamp.time_since_epoch()).count();
        }
        if (config.includeFrameNumber) {
            json["frame"] = entry.frameNumber;
        }
        json["level"] = logLevelToString(entry.level);
        json["category"] = entry.category;
        json["message"] = entry.message;
        if (!entry.details.empty()) {
            json["details"] = entry.details;
        }
        // Replace invalid UTF-8 instead of throwing from a log call
        return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    // ============================================================================
    // Private Implementation
    // ============================================================================

    void InputLogger::writeEntry(const LogEntry& entry, const LoggerConfig& config) {
        stats_.totalEntries.fetch_add(1, std::memory_order_relaxed);

        const std::string formatted = config.format == LogFormat::JSON
                                          ? formatJSON(entry, config)
                                          : formatText(entry, config);

        if (config.logToFile) {
            std::lock_guard lock(fileMutex_);
            if (fileStream_) {
                *fileStream_ << formatted << "\n";
                if (config.flushImmediately) {
                    fileStream_->flush();
                }
                stats_.fileWrites.fetch_add(1, std::memory_order_relaxed);
            }
        }

        if (config.logToConsole) {
            // Use stderr for errors and warnings
            if (entry.level <= LogLevel::WARNING) {
                std::cerr << formatted << std::endl;
            }
            else {
                std::cout << formatted << std::endl;
            }
            stats_.consoleWrites.fetch_add(1, std::memory_order_relaxed);
        }

        if (config.logToMemory && config.maxMemoryEntries > 0) {
            std::lock_guard lock(memoryMutex_);

            if (memoryLog_.size() >= config.maxMemoryEntries) {
                memoryLog_.erase(memoryLog_.begin()); // Remove oldest
            }

            memoryLog_.push_back(entry);
        }

        std::vector<LogCallback> callbacks;
        {
            std::lock_guard lock(callbackMutex_);
            callbacks = callbacks_;
        }

        for (const auto& callback : callbacks) {
            if (!callback) {
                continue;
            }
            try {
                callback(entry);
            }
            catch (const std::exception& e) {
                // Logging through the logger here would recurse into the callback
                stats_.callbackFailures.fetch_add(1, std::memory_order_relaxed);
                std::cerr << "[InputLogger] log callback threw: " << e.what() << std::endl;
            }
        }
    }

    bool InputLogger::openLogFile(const std::string& path) {
        try {
            const std::filesystem::path logPath(path);
            const std::filesystem::path directory = logPath.parent_path();

            if (!directory.empty()) {
                std::filesystem::create_directories(directory);
            }
        }
        catch (const std::filesystem::filesystem_error& e) {
            std::cerr << "[InputLogger] cannot create log directory: " << e.what() << std::endl;
            return false;
        }

        std::lock_guard lock(fileMutex_);
        fileStream_ = std::make_unique<std::ofstream>(path, std::ios::app);

        if (!fileStream_->is_open()) {
            fileStream_.reset();
            std::cerr << "[InputLogger] cannot open log file: " << path << std::endl;
            return false;
        }

        return true;
    }

    void InputLogger::closeLogFile() {
        std::lock_guard lock(fileMutex_);
        if (fileStream_) {
            fileStream_->close();
            fileStream_.reset();
        }
    }

    bool InputLogger::levelAccepted(const LogLevel level, const LogLevel minLevel) noexcept {
        return level != LogLevel::NONE && minLevel != LogLevel::NONE && level <= minLevel;
    }

    // ============================================================================
    // Process Logger
    // ============================================================================

    InputLogger& getLogger() {
        static std::once_flag initFlag;
        static InputLogger logger;

        std::call_once(initFlag, [] {
            logger.initialize(LoggerConfig{});
        });

        return logger;
    }
} // namespace actuate::input::debug
