/**
 * @file FileIO.cpp
 * @brief Whole-file read and atomic write helpers implementation
 * @author Actuate Team
 * @date 2025
 */

#include "FileIO.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace actuate::input::utils {
    std::optional<std::string> readFileContents(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        if (file.bad()) {
            return std::nullopt;
        }
        return buffer.str();
    }

    bool atomicWriteFile(const std::filesystem::path& path, const std::string& content, std::string& error) {
        std::error_code ec;

        if (const auto directory = path.parent_path(); !directory.empty()) {
            std::filesystem::create_directories(directory, ec);
            if (ec) {
                error = "Failed to create directory " + directory.string() + ": " + ec.message();
                return false;
            }
        }

        // Write to temp file first
        auto tempPath = path;
        tempPath += ".tmp";

        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                error = "Failed to open " + tempPath.string() + " for writing";
                return false;
            }
            file << content;
            file.flush();
            if (!file.good()) {
                error = "Failed to write " + tempPath.string();
                file.close();
                std::filesystem::remove(tempPath, ec);
                return false;
            }
        }

        // Atomically rename temp file to target
        std::filesystem::rename(tempPath, path, ec);
        if (ec) {
            error = "Failed to replace " + path.string() + ": " + ec.message();
            std::error_code removeError;
            std::filesystem::remove(tempPath, removeError);
            return false;
        }

        return true;
    }

    bool fileExists(const std::filesystem::path& path) noexcept {
        std::error_code ec;
        return std::filesystem::is_regular_file(path, ec);
    }
} // namespace actuate::input::utils
