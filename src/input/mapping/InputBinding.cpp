/**
 * @file InputBinding.cpp
 * @brief Input binding validation and XML conversion
 * @author Actuate Team
 * @date 2025
 */

#include "InputBinding.h"

#include "../debug/InputLogger.h"
#include "../devices/base/DeviceService.h"
#include "../utils/XmlDocument.h"

namespace actuate::input {
    namespace {
        bool sameIdentifier(const std::string& a, const std::string& b) {
            return !a.empty() && !b.empty() && utils::iequals(a, b);
        }

        std::string identifierError(const DeviceType device, const BindingKind kind, const std::string& id) {
            const auto result = DeviceService::parse(device, kind, id);
            if (result.ok()) {
                return {};
            }
            return std::string(deviceTypeToString(device)) + " has no " + bindingKindToString(kind) + " '" + id +
                "' (" + nameParseErrorToString(result.error) + ")";
        }

        void logParseFailure(const utils::XmlElement& element, const std::string& reason) {
            debug::getLogger().error(LOG_CATEGORY_BINDING,
                                     "Invalid <" + element.getName() + "> at line " +
                                     std::to_string(element.getLine()) + ": " + reason);
        }
    } // namespace

    InputBinding InputBinding::button(const DeviceType device, std::string positive, std::string negative,
                                      const bool invert) {
        return InputBinding(device, BindingKind::BUTTON, std::move(positive), std::move(negative), invert);
    }

    InputBinding InputBinding::axis(const DeviceType device, std::string axisName, const bool invert) {
        return InputBinding(device, BindingKind::AXIS, std::move(axisName), {}, invert);
    }

    // ============================================================================
    // Validation
    // ============================================================================

    std::string InputBinding::getValidationError() const {
        if (!isBindableDevice(device)) {
            return "Invalid device";
        }
        if (kind != BindingKind::BUTTON && kind != BindingKind::AXIS) {
            return "Invalid binding kind";
        }
        if (device == DeviceType::KEYBOARD && kind == BindingKind::AXIS) {
            return "Keyboard has no axes";
        }
        if (positive.empty() && negative.empty()) {
            return "Binding has no input identifier";
        }
        if (kind == BindingKind::AXIS) {
            if (positive.empty()) {
                return "Axis binding has no axis identifier";
            }
            if (!negative.empty()) {
                return "Axis binding takes a single axis identifier";
            }
        }

        if (!positive.empty()) {
            if (auto error = identifierError(device, kind, positive); !error.empty()) {
                return error;
            }
        }
        if (!negative.empty()) {
            if (auto error = identifierError(device, kind, negative); !error.empty()) {
                return error;
            }
        }

        return {};
    }

    bool InputBinding::collides(const InputBinding& a, const InputBinding& b) {
        if (a.device != b.device || a.kind != b.kind) {
            return false;
        }
        if (!a.isValid() || !b.isValid()) {
            return false;
        }
        return sameIdentifier(a.positive, b.negative) || sameIdentifier(b.positive, a.negative);
    }

    bool InputBinding::operator==(const InputBinding& other) const {
        return device == other.device &&
            kind == other.kind &&
            invert == other.invert &&
            utils::iequals(positive, other.positive) &&
            utils::iequals(negative, other.negative);
    }

    // ============================================================================
    // Serialization
    // ============================================================================

    std::string InputBinding::toXml(const std::size_t indent) const {
        std::string xml(indent, ' ');
        xml += "<";
        xml += bindingKindToString(kind);
        xml += " device=\"";
        xml += deviceTypeToString(device);
        xml += "\"";

        if (kind == BindingKind::AXIS) {
            xml += " value=\"" + utils::escapeXml(positive) + "\"";
        }
        else {
            if (!positive.empty()) {
                xml += " positive=\"" + utils::escapeXml(positive) + "\"";
            }
            if (!negative.empty()) {
                xml += " negative=\"" + utils::escapeXml(negative) + "\"";
            }
        }

        xml += invert ? " invert=\"true\"/>" : " invert=\"false\"/>";
        return xml;
    }

    std::optional<InputBinding> InputBinding::fromXml(const utils::XmlElement& element) {
        const auto kind = parseBindingKind(element.getName());
        if (!kind) {
            logParseFailure(element, "expected <button> or <axis>");
            return std::nullopt;
        }

        const auto deviceText = element.getAttribute("device");
        if (!deviceText) {
            logParseFailure(element, "missing 'device' attribute");
            return std::nullopt;
        }
        const auto device = parseDeviceType(*deviceText);
        if (!device) {
            logParseFailure(element, "unknown device '" + *deviceText + "'");
            return std::nullopt;
        }

        InputBinding binding;
        binding.device = *device;
        binding.kind = *kind;

        if (*kind == BindingKind::AXIS) {
            const auto value = element.getAttribute("value");
            if (!value || utils::isBlank(*value)) {
                logParseFailure(element, "missing 'value' attribute");
                return std::nullopt;
            }
            binding.positive = std::string(utils::trim(*value));
        }
        else {
            auto positive = element.getAttribute("positive");
            if (!positive) {
                positive = element.getAttribute("value");
            }
            const auto negative = element.getAttribute("negative");

            if (positive) binding.positive = std::string(utils::trim(*positive));
            if (negative) binding.negative = std::string(utils::trim(*negative));

            if (binding.positive.empty() && binding.negative.empty()) {
                logParseFailure(element, "needs a 'positive' and/or 'negative' attribute");
                return std::nullopt;
            }
        }

        if (const auto invertText = element.getAttribute("invert")) {
            const auto invert = utils::parseBool(*invertText);
            if (!invert) {
                logParseFailure(element, "'invert' must be true or false, got '" + *invertText + "'");
                return std::nullopt;
            }
            binding.invert = *invert;
        }

        if (auto error = binding.getValidationError(); !error.empty()) {
            logParseFailure(element, error);
            return std::nullopt;
        }

        return binding;
    }

    std::string InputBinding::toString() const {
        std::string text = std::string(deviceTypeToString(device)) + " " + bindingKindToString(kind) + " " +
            (positive.empty() ? "-" : positive);
        if (!negative.empty()) {
            text += "/" + negative;
        }
        if (invert) {
            text += " (inverted)";
        }
        return text;
    }
} // namespace actuate::input
