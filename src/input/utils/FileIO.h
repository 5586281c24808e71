/**
 * @file FileIO.h
 * @brief Whole-file read and atomic write helpers
 * @author Actuate Team
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace actuate::input::utils {
    /**
     * @brief Read a file into memory
     * @return File contents, or nullopt if the file cannot be opened or read
     */
    [[nodiscard]] std::optional<std::string> readFileContents(const std::filesystem::path& path);

    /**
     * @brief Write through a temporary file renamed over the target
     * @param error Receives the failure reason
     * @return True if the target now holds `content`
     */
    bool atomicWriteFile(const std::filesystem::path& path, const std::string& content, std::string& error);

    [[nodiscard]] bool fileExists(const std::filesystem::path& path) noexcept;
} // namespace actuate::input::utils
