/**
 * @file InputBinding.h
 * @brief Binding of one physical input (or a +/- pair) to an action
 * @author Actuate Team
 * @date 2025
 *
 * A binding names its inputs symbolically ("Space", "LeftStickX") and holds
 * no device state. Identifiers are resolved against the device name tables.
 */

#pragma once

#include "../core/InputTypes.h"

#include <optional>
#include <string>

namespace actuate::input {
    namespace utils {
        class XmlElement;
    }

    /**
     * @brief Represents a binding between physical input and action
     *
     * Button bindings read `positive` as +1 and `negative` as -1; either may be
     * empty. Axis bindings read the axis named by `positive`; `negative` must
     * stay empty.
     */
    struct InputBinding {
        DeviceType device;
        BindingKind kind;
        std::string positive;
        std::string negative;
        bool invert;

        InputBinding() noexcept
            : device(DeviceType::KEYBOARD)
              , kind(BindingKind::BUTTON)
              , invert(false) {
        }

        InputBinding(const DeviceType device, const BindingKind kind, std::string positive,
                     std::string negative = {}, const bool invert = false)
            : device(device)
              , kind(kind)
              , positive(std::move(positive))
              , negative(std::move(negative))
              , invert(invert) {
        }

        /**
         * @brief Button binding with an optional opposite button
         */
        [[nodiscard]] static InputBinding button(DeviceType device, std::string positive,
                                                 std::string negative = {}, bool invert = false);

        /**
         * @brief Axis binding
         */
        [[nodiscard]] static InputBinding axis(DeviceType device, std::string axisName, bool invert = false);

        // ============================================================================
        // Validation
        // ============================================================================

        [[nodiscard]] bool isValid() const {
            return getValidationError().empty();
        }

        /**
         * @brief Human-readable reason the binding is invalid, empty when valid
         */
        [[nodiscard]] std::string getValidationError() const;

        /**
         * @brief Check if two bindings would fight over the same input
         *
         * True iff both are valid, share device and kind, and one's positive
         * names the other's negative (case-insensitive, empty never matches).
         */
        [[nodiscard]] static bool collides(const InputBinding& a, const InputBinding& b);

        /**
         * @brief Compare device, kind, invert and identifiers (case-insensitive)
         */
        [[nodiscard]] bool operator==(const InputBinding& other) const;

        // ============================================================================
        // Serialization
        // ============================================================================

        /**
         * @brief XML element for this binding, no trailing newline
         * @param indent Leading spaces
         */
        [[nodiscard]] std::string toXml(std::size_t indent = 0) const;

        /**
         * @brief Parse a `button` or `axis` element
         * @return The binding, or nullopt after logging the reason
         */
        [[nodiscard]] static std::optional<InputBinding> fromXml(const utils::XmlElement& element);

        /**
         * @brief Short description, e.g. "Keyboard button D/A"
         */
        [[nodiscard]] std::string toString() const;
    };
} // namespace actuate::input
