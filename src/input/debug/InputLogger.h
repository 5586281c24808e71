/**
 * @file InputLogger.h
 * @brief Input system logging utilities
 * @author Actuate Team
 * @date 2025
 *
 * Leveled, categorized logging for binding validation, file loading and
 * device changes. Supports console, file, in-memory and callback sinks.
 */

#pragma once

#include "../core/InputConstants.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace actuate::input::debug {
    /**
     * @brief Log level for input logging
     *
     * An entry is accepted when its level is not more verbose than the
     * configured minimum. NONE as minimum disables logging.
     */
    enum class LogLevel : std::uint8_t {
        NONE = 0,
        ERROR = 1,
        WARNING = 2,
        INFO = 3,
        DEBUG = 4,
        VERBOSE = 5
    };

    /**
     * @brief Log output format
     */
    enum class LogFormat : std::uint8_t {
        TEXT,
        JSON
    };

    const char* logLevelToString(LogLevel level);

    /**
     * @brief Log entry
     */
    struct LogEntry {
        LogLevel level;
        std::chrono::system_clock::time_point timestamp;
        std::uint64_t frameNumber;
        std::string category;
        std::string message;
        std::string details;

        LogEntry() noexcept
            : level(LogLevel::INFO)
              , timestamp(std::chrono::system_clock::now())
              , frameNumber(0) {
        }
    };

    /**
     * @brief Logger configuration
     */
    struct LoggerConfig {
        LogLevel minLevel = LogLevel::INFO;
        LogFormat format = LogFormat::TEXT;
        bool logToConsole = true;
        bool logToFile = false;
        std::string logFilePath = DEFAULT_INPUT_LOG_FILE;
        bool logToMemory = false;
        std::size_t maxMemoryEntries = DEFAULT_MAX_MEMORY_LOG_ENTRIES;
        bool includeTimestamp = true;
        bool includeFrameNumber = true;
        bool flushImmediately = false;

        LoggerConfig() = default;
    };

    /**
     * @brief Input system logger
     *
     * Thread-safe. Every method may be called concurrently.
     */
    class InputLogger {
    public:
        using LogCallback = std::function<void(const LogEntry&)>;

        InputLogger() noexcept;
        ~InputLogger();

        InputLogger(const InputLogger&) = delete;
        InputLogger& operator=(const InputLogger&) = delete;

        // ============================================================================
        // Initialization
        // ============================================================================

        /**
         * @brief Initialize the logger
         * @param config Logger configuration
         * @return False if already initialized or the log file cannot be opened
         */
        bool initialize(const LoggerConfig& config = {});

        /**
         * @brief Flush and close all sinks
         */
        void shutdown();

        [[nodiscard]] bool isInitialized() const noexcept {
            return initialized_.load(std::memory_order_acquire);
        }

        /**
         * @brief Replace the configuration, reopening the log file if needed
         * @return False if file logging is enabled and the file cannot be opened
         */
        bool setConfig(const LoggerConfig& config);

        [[nodiscard]] LoggerConfig getConfig() const;

        void setLogLevel(LogLevel level);

        // ============================================================================
        // Logging
        // ============================================================================

        /**
         * @brief Log message
         * @param level Log level
         * @param category Subsystem the entry belongs to
         * @param message Log message
         * @param details Optional details
         */
        void log(LogLevel level,
                 const std::string& category,
                 const std::string& message,
                 const std::string& details = "");

        void error(const std::string& category, const std::string& message) {
            log(LogLevel::ERROR, category, message);
        }

        void warning(const std::string& category, const std::string& message) {
            log(LogLevel::WARNING, category, message);
        }

        void info(const std::string& category, const std::string& message) {
            log(LogLevel::INFO, category, message);
        }

        void debug(const std::string& category, const std::string& message) {
            log(LogLevel::DEBUG, category, message);
        }

        void verbose(const std::string& category, const std::string& message) {
            log(LogLevel::VERBOSE, category, message);
        }

        /**
         * @brief Check whether an entry at this level would be accepted
         */
        [[nodiscard]] bool isEnabled(LogLevel level) const;

        // ============================================================================
        // Output Management
        // ============================================================================

        void flush();

        void clearMemoryLog();

        /**
         * @brief Get memory log entries
         * @param maxEntries Maximum entries to retrieve (0 for all)
         * @return The most recent entries, oldest first
         */
        [[nodiscard]] std::vector<LogEntry> getMemoryLog(std::size_t maxEntries = 0) const;

        void registerCallback(LogCallback callback);

        void clearCallbacks();

        // ============================================================================
        // Filtering
        // ============================================================================

        void setCategoryEnabled(const std::string& category, bool enabled);

        [[nodiscard]] bool isCategoryEnabled(const std::string& category) const;

        // ============================================================================
        // Statistics
        // ============================================================================

        struct Statistics {
            std::atomic<std::uint64_t> totalEntries{0};
            std::atomic<std::uint64_t> fileWrites{0};
            std::atomic<std::uint64_t> consoleWrites{0};
            std::atomic<std::uint64_t> callbackFailures{0};

            void reset() noexcept {
                totalEntries = 0;
                fileWrites = 0;
                consoleWrites = 0;
                callbackFailures = 0;
            }
        };

        [[nodiscard]] const Statistics& getStatistics() const noexcept {
            return stats_;
        }

        void resetStatistics() const noexcept {
            stats_.reset();
        }

        // ============================================================================
        // Frame Management
        // ============================================================================

        void setFrameNumber(const std::uint64_t frameNumber) noexcept {
            currentFrame_.store(frameNumber, std::memory_order_release);
        }

        [[nodiscard]] std::uint64_t getFrameNumber() const noexcept {
            return currentFrame_.load(std::memory_order_acquire);
        }

        // ============================================================================
        // Formatting
        // ============================================================================

        [[nodiscard]] static std::string formatText(const LogEntry& entry, const LoggerConfig& config);

        [[nodiscard]] static std::string formatJSON(const LogEntry& entry, const LoggerConfig& config);

    private:
        // Configuration
        LoggerConfig config_;
        mutable std::mutex configMutex_;
        std::atomic<bool> initialized_{false};

        // Output streams
        std::unique_ptr<std::ofstream> fileStream_;
        mutable std::mutex fileMutex_;

        // Memory log
        std::vector<LogEntry> memoryLog_;
        mutable std::mutex memoryMutex_;

        // Callbacks
        std::vector<LogCallback> callbacks_;
        mutable std::mutex callbackMutex_;

        // Category filters
        std::unordered_map<std::string, bool> categoryFilters_;
        mutable std::mutex filterMutex_;

        mutable Statistics stats_;

        std::atomic<std::uint64_t> currentFrame_{0};

        void writeEntry(const LogEntry& entry, const LoggerConfig& config);

        bool openLogFile(const std::string& path);

        void closeLogFile();

        [[nodiscard]] static bool levelAccepted(LogLevel level, LogLevel minLevel) noexcept;
    };

    /**
     * @brief Process-wide logger used by the input library
     *
     * Created on first use with the default configuration (console only).
     */
    InputLogger& getLogger();
} // namespace actuate::input::debug
