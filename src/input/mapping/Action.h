/**
 * @file Action.h
 * @brief Named logical input resolved from an ordered list of bindings
 * @author Actuate Team
 * @date 2025
 */

#pragma once

#include "InputBinding.h"

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace actuate::input {
    namespace utils {
        class XmlElement;
    }

    /**
     * @brief Logical input ("jump", "horizontal") backed by bindings
     *
     * Binding order is resolution priority. getValue() and isPressed() stop at
     * the first binding with a decisive reading; justPressed() and
     * justReleased() OR across every binding. No two bindings of an action
     * collide.
     */
    class Action {
    public:
        using BindingList = std::vector<InputBinding>;
        using const_iterator = BindingList::const_iterator;

        Action() = default;

        /**
         * @brief Create an action
         * @param name Normalized with utils::makeValidName
         */
        explicit Action(std::string_view name);

        Action(std::string_view name, std::initializer_list<InputBinding> bindings);

        // ============================================================================
        // Identity
        // ============================================================================

        [[nodiscard]] const std::string& getName() const noexcept { return name_; }

        /**
         * @brief Rename, normalizing the text into a valid identifier
         * @return False if nothing valid remains (name unchanged)
         */
        bool setName(std::string_view name);

        /**
         * @brief Valid name, every binding valid and no colliding pair
         */
        [[nodiscard]] bool isValid() const;

        // ============================================================================
        // Evaluation
        // ============================================================================

        /**
         * @brief Value of the first binding with a non-neutral reading
         *
         * Axis bindings yield the axis value, button bindings +1/-1. A button
         * binding with both or neither side held is neutral. Returns 0 when
         * every binding is neutral.
         */
        [[nodiscard]] float getValue(const DeviceService& devices) const;

        /**
         * @brief Positive side of the first binding with exactly one active side
         */
        [[nodiscard]] bool isPressed(const DeviceService& devices) const;

        /**
         * @brief Any binding's positive side pressed this frame without its negative side
         */
        [[nodiscard]] bool justPressed(const DeviceService& devices) const;

        /**
         * @brief Any binding's positive side released this frame without its negative side
         */
        [[nodiscard]] bool justReleased(const DeviceService& devices) const;

        [[nodiscard]] bool isPositive(const DeviceService& devices) const;
        [[nodiscard]] bool isNegative(const DeviceService& devices) const;

        // ============================================================================
        // Bindings
        // ============================================================================

        /**
         * @brief Append a binding
         * @return False if the binding is invalid or collides with an existing one
         */
        bool add(const InputBinding& binding);

        /**
         * @brief Append bindings in order
         * @return Number of bindings added
         */
        std::size_t add(const std::vector<InputBinding>& bindings);

        /**
         * @brief Replace the binding at index
         * @return False on a bad index, an invalid binding, or a collision with another binding
         */
        bool set(std::size_t index, const InputBinding& binding);

        bool remove(std::size_t index);

        /**
         * @brief Remove the first binding equal to `binding`
         */
        bool remove(const InputBinding& binding);

        void clear() noexcept { bindings_.clear(); }

        /**
         * @brief Binding at index, nullptr when out of range
         */
        [[nodiscard]] const InputBinding* get(std::size_t index) const noexcept;

        [[nodiscard]] bool contains(const InputBinding& binding) const;

        /**
         * @brief Check if `binding` collides with any binding except the one at `ignoreIndex`
         */
        [[nodiscard]] bool collidesWithAny(const InputBinding& binding,
                                           std::size_t ignoreIndex = static_cast<std::size_t>(-1)) const;

        [[nodiscard]] std::size_t size() const noexcept { return bindings_.size(); }
        [[nodiscard]] bool empty() const noexcept { return bindings_.empty(); }
        [[nodiscard]] const BindingList& getBindings() const noexcept { return bindings_; }

        [[nodiscard]] const_iterator begin() const noexcept { return bindings_.begin(); }
        [[nodiscard]] const_iterator end() const noexcept { return bindings_.end(); }

        // ============================================================================
        // Serialization
        // ============================================================================

        /**
         * @brief `<action>` element with one child per binding, no trailing newline
         */
        [[nodiscard]] std::string toXml(std::size_t indent = 0) const;

        /**
         * @brief Replace this action with the contents of an `<action>` element
         * @return False after logging the reason; the action is left unchanged
         */
        bool loadFromXml(const utils::XmlElement& element);

        [[nodiscard]] bool operator==(const Action& other) const;

    private:
        std::string name_;
        BindingList bindings_;
    };
} // namespace actuate::input
