/**
 * @file NameTable.h
 * @brief Bidirectional symbolic name <-> index tables for device inputs
 * @author Actuate Team
 * @date 2025
 *
 * Each device exposes its buttons and axes by symbolic name ("Space",
 * "LeftStickX") or by raw numeric index ("44"). Lookups are
 * case-insensitive and never throw.
 */

#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>

namespace actuate::input {
    /**
     * @brief Reason a name failed to resolve
     */
    enum class NameParseError : std::uint8_t {
        NONE = 0,
        EMPTY,
        UNKNOWN_NAME,
        INDEX_OUT_OF_RANGE
    };

    const char* nameParseErrorToString(NameParseError error);

    /**
     * @brief Outcome of NameTable::parse
     */
    struct NameParseResult {
        std::uint32_t index = 0;
        NameParseError error = NameParseError::NONE;

        [[nodiscard]] bool ok() const noexcept {
            return error == NameParseError::NONE;
        }

        explicit operator bool() const noexcept {
            return ok();
        }
    };

    /**
     * @brief Name table for one (device, kind) pair
     */
    class NameTable {
    public:
        struct Entry {
            std::uint32_t index;
            const char* name;
        };

        /**
         * @brief Build a table
         * @param entries Symbolic names, first one wins when an index repeats
         * @param minIndex Smallest valid numeric index
         * @param maxIndex Largest valid numeric index
         */
        NameTable(std::initializer_list<Entry> entries, std::uint32_t minIndex, std::uint32_t maxIndex);

        /**
         * @brief Resolve a symbolic name or a numeric index
         *
         * Names are matched first, then the text is read as a decimal index.
         */
        [[nodiscard]] NameParseResult parse(std::string_view text) const;

        [[nodiscard]] bool isValid(const std::string_view text) const {
            return parse(text).ok();
        }

        [[nodiscard]] bool isValidIndex(const std::uint32_t index) const noexcept {
            return index >= minIndex_ && index <= maxIndex_;
        }

        /**
         * @brief Canonical name of an index
         * @return The symbolic name, the decimal index when it has none, or ""
         *         when the index is out of range
         */
        [[nodiscard]] std::string nameOf(std::uint32_t index) const;

        [[nodiscard]] std::uint32_t getMinIndex() const noexcept { return minIndex_; }
        [[nodiscard]] std::uint32_t getMaxIndex() const noexcept { return maxIndex_; }
        [[nodiscard]] std::size_t getNameCount() const noexcept { return nameToIndex_.size(); }

    private:
        std::unordered_map<std::string, std::uint32_t> nameToIndex_; // lowercase keys
        std::unordered_map<std::uint32_t, std::string> indexToName_;
        std::uint32_t minIndex_;
        std::uint32_t maxIndex_;
    };

    // ============================================================================
    // Device Tables
    // ============================================================================

    [[nodiscard]] const NameTable& getKeyboardKeyTable();
    [[nodiscard]] const NameTable& getMouseButtonTable();
    [[nodiscard]] const NameTable& getMouseAxisTable();
    [[nodiscard]] const NameTable& getJoystickButtonTable();
    [[nodiscard]] const NameTable& getJoystickAxisTable();
} // namespace actuate::input
