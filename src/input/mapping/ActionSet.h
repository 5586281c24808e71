/**
 * @file ActionSet.h
 * @brief Case-insensitive collection of actions with XML persistence
 * @author Actuate Team
 * @date 2025
 */

#pragma once

#include "Action.h"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace actuate::input {
    namespace utils {
        class XmlElement;
    }

    /**
     * @brief Set of uniquely named actions
     *
     * Keys are lowercased action names, so lookups are case-insensitive and
     * iteration (and serialization) follows lowercase name order. Every stored
     * action is valid.
     */
    class ActionSet {
    public:
        using ActionMap = std::map<std::string, Action>;
        using const_iterator = ActionMap::const_iterator;

        ActionSet() = default;

        // ============================================================================
        // Actions
        // ============================================================================

        /**
         * @brief Insert an action
         * @param replace Replace an action with the same name instead of failing
         * @return False if the action is invalid or the name is taken and `replace` is false
         */
        bool add(const Action& action, bool replace = false);

        /**
         * @brief Insert actions in order
         * @return Number of actions added
         */
        std::size_t add(const std::vector<Action>& actions, bool replace = false);

        bool remove(std::string_view name);

        bool remove(const Action& action) {
            return remove(action.getName());
        }

        void clear() noexcept { actions_.clear(); }

        [[nodiscard]] bool contains(std::string_view name) const;

        [[nodiscard]] bool contains(const Action& action) const {
            return contains(action.getName());
        }

        /**
         * @brief Action by case-insensitive name, nullptr when absent
         */
        [[nodiscard]] const Action* get(std::string_view name) const;

        [[nodiscard]] std::size_t size() const noexcept { return actions_.size(); }
        [[nodiscard]] bool empty() const noexcept { return actions_.empty(); }

        [[nodiscard]] const_iterator begin() const noexcept { return actions_.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return actions_.end(); }

        // ============================================================================
        // Serialization
        // ============================================================================

        /**
         * @brief `<action_set>` element, `<action_set/>` when empty
         */
        [[nodiscard]] std::string toString(std::size_t indent = 0) const;

        /**
         * @brief Complete bindings document with the `<input>` wrapper
         */
        [[nodiscard]] std::string toDocument() const;

        /**
         * @brief Replace the contents from an `action_set` or `input` element
         *
         * The set is left untouched when any action fails to load.
         */
        bool loadFromXml(const utils::XmlElement& element);

        bool loadFromString(std::string_view xml);

        /**
         * @brief Load a bindings file
         * @param path File to read, DEFAULT_BINDINGS_PATH when empty
         */
        bool loadFromFile(const std::string& path = {});

        /**
         * @brief Write the bindings document
         * @param path File to write, DEFAULT_BINDINGS_PATH when empty
         * @param overwrite Replace an existing file
         */
        bool saveToFile(const std::string& path = {}, bool overwrite = true) const;

        [[nodiscard]] bool operator==(const ActionSet& other) const {
            return actions_ == other.actions_;
        }

    private:
        ActionMap actions_;
    };
} // namespace actuate::input
