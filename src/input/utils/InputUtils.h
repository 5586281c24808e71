/**
 * @file InputUtils.h
 * @brief String and naming helpers shared by the input system
 * @author Actuate Team
 * @date 2025
 *
 * Case-insensitive comparison, trimming and numeric index parsing used by the
 * device name tables, the identifier rules applied to action names and the
 * axis threshold tests shared by devices and actions.
 */

#pragma once

#include "../core/InputConstants.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace actuate::input::utils {
    // ============================================================================
    // Character Helpers
    // ============================================================================

    [[nodiscard]] inline char toLowerChar(const char c) noexcept {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    [[nodiscard]] inline bool isSpaceChar(const char c) noexcept {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    [[nodiscard]] inline bool isAlphaChar(const char c) noexcept {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    }

    [[nodiscard]] inline bool isDigitChar(const char c) noexcept {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }

    // ============================================================================
    // String Helpers
    // ============================================================================

    [[nodiscard]] inline std::string toLower(const std::string_view text) {
        std::string result(text);
        std::ranges::transform(result, result.begin(), toLowerChar);
        return result;
    }

    [[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
        while (!text.empty() && isSpaceChar(text.front())) {
            text.remove_prefix(1);
        }
        while (!text.empty() && isSpaceChar(text.back())) {
            text.remove_suffix(1);
        }
        return text;
    }

    [[nodiscard]] inline bool isBlank(const std::string_view text) noexcept {
        return trim(text).empty();
    }

    /**
     * @brief Case-insensitive equality (ASCII)
     */
    [[nodiscard]] inline bool iequals(const std::string_view a, const std::string_view b) noexcept {
        return std::ranges::equal(a, b, [](const char x, const char y) {
            return toLowerChar(x) == toLowerChar(y);
        });
    }

    /**
     * @brief Parse a non-negative decimal index
     * @return The index, or nullopt if the text is not entirely digits
     */
    [[nodiscard]] inline std::optional<std::uint32_t> parseIndex(std::string_view text) noexcept {
        text = trim(text);
        if (text.empty()) {
            return std::nullopt;
        }

        std::uint32_t value = 0;
        const auto* first = text.data();
        const auto* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * @brief Parse "true"/"false" case-insensitively
     */
    [[nodiscard]] inline std::optional<bool> parseBool(const std::string_view text) noexcept {
        const auto trimmed = trim(text);
        if (iequals(trimmed, "true")) return true;
        if (iequals(trimmed, "false")) return false;
        return std::nullopt;
    }

    // ============================================================================
    // Identifier Rules
    // ============================================================================

    [[nodiscard]] inline bool isNameChar(const char c) noexcept {
        return isAlphaChar(c) || isDigitChar(c) || c == '_' || c == '-' || c == '.';
    }

    /**
     * @brief Check if text is a valid action identifier
     *
     * Non-empty, at most MAX_ACTION_NAME_LENGTH characters of letters, digits,
     * '_', '-' or '.', not starting with a digit.
     */
    [[nodiscard]] inline bool isValidName(const std::string_view name) noexcept {
        if (name.empty() || name.size() > MAX_ACTION_NAME_LENGTH || isDigitChar(name.front())) {
            return false;
        }
        return std::ranges::all_of(name, isNameChar);
    }

    /**
     * @brief Normalize text into a valid identifier
     *
     * Surrounding whitespace is dropped, every other invalid character becomes
     * '_' and a leading digit is prefixed with '_'. The result is cut to
     * MAX_ACTION_NAME_LENGTH characters. Blank text yields "".
     */
    [[nodiscard]] inline std::string makeValidName(const std::string_view text) {
        const auto trimmed = trim(text);
        if (trimmed.empty()) {
            return {};
        }

        std::string result;
        result.reserve(trimmed.size() + 1);
        if (isDigitChar(trimmed.front())) {
            result.push_back('_');
        }
        for (const char c : trimmed) {
            if (result.size() == MAX_ACTION_NAME_LENGTH) {
                break;
            }
            result.push_back(isNameChar(c) ? c : '_');
        }
        return result;
    }

    // ============================================================================
    // Axis Helpers
    // ============================================================================

    /**
     * @brief Threshold test for axes
     * @param bidirectional Compare |value| instead of the signed value
     */
    [[nodiscard]] inline bool isAxisPressed(const float value, const bool bidirectional,
                                            const float threshold = AXIS_PRESS_THRESHOLD) noexcept {
        return (bidirectional ? std::abs(value) : value) >= threshold;
    }
} // namespace actuate::input::utils
