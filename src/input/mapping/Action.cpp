/**
 * @file Action.cpp
 * @brief Action evaluation and binding management
 * @author Actuate Team
 * @date 2025
 */

#include "Action.h"

#include "../debug/InputLogger.h"
#include "../devices/base/DeviceService.h"
#include "../utils/XmlDocument.h"

#include <utility>

namespace actuate::input {
    namespace {
        /**
         * @brief Active state of the two sides of one binding
         */
        struct Sides {
            bool positive = false;
            bool negative = false;
        };

        Sides axisSides(const float value) noexcept {
            return {value >= AXIS_PRESS_THRESHOLD, value <= -AXIS_PRESS_THRESHOLD};
        }

        Sides pressedSides(const InputBinding& binding, const DeviceService& devices) {
            Sides sides;
            if (binding.kind == BindingKind::AXIS) {
                sides = axisSides(devices.getAxis(binding.device, binding.positive));
            }
            else {
                sides.positive = !binding.positive.empty() && devices.isPressed(binding.device, binding.positive);
                sides.negative = !binding.negative.empty() && devices.isPressed(binding.device, binding.negative);
            }
            return sides;
        }

        Sides pressEdges(const InputBinding& binding, const DeviceService& devices) {
            Sides edges;
            if (binding.kind == BindingKind::AXIS) {
                const Sides now = axisSides(devices.getAxis(binding.device, binding.positive));
                const Sides before = axisSides(devices.getLastAxis(binding.device, binding.positive));
                edges.positive = now.positive && !before.positive;
                edges.negative = now.negative && !before.negative;
            }
            else {
                edges.positive = !binding.positive.empty() && devices.justPressed(binding.device, binding.positive);
                edges.negative = !binding.negative.empty() && devices.justPressed(binding.device, binding.negative);
            }
            return edges;
        }

        Sides releaseEdges(const InputBinding& binding, const DeviceService& devices) {
            Sides edges;
            if (binding.kind == BindingKind::AXIS) {
                const Sides now = axisSides(devices.getAxis(binding.device, binding.positive));
                const Sides before = axisSides(devices.getLastAxis(binding.device, binding.positive));
                edges.positive = !now.positive && before.positive;
                edges.negative = !now.negative && before.negative;
            }
            else {
                edges.positive = !binding.positive.empty() && devices.justReleased(binding.device, binding.positive);
                edges.negative = !binding.negative.empty() && devices.justReleased(binding.device, binding.negative);
            }
            return edges;
        }
    } // namespace

    Action::Action(const std::string_view name)
        : name_(utils::makeValidName(name)) {
    }

    Action::Action(const std::string_view name, const std::initializer_list<InputBinding> bindings)
        : name_(utils::makeValidName(name)) {
        for (const auto& binding : bindings) {
            add(binding);
        }
    }

    // ============================================================================
    // Identity
    // ============================================================================

    bool Action::setName(const std::string_view name) {
        auto normalized = utils::makeValidName(name);
        if (normalized.empty()) {
            return false;
        }
        name_ = std::move(normalized);
        return true;
    }

    bool Action::isValid() const {
        if (!utils::isValidName(name_)) {
            return false;
        }

        for (std::size_t i = 0; i < bindings_.size(); ++i) {
            if (!bindings_[i].isValid()) {
                return false;
            }
            for (std::size_t j = i + 1; j < bindings_.size(); ++j) {
                if (InputBinding::collides(bindings_[i], bindings_[j])) {
                    return false;
                }
            }
        }

        return true;
    }

    // ============================================================================
    // Evaluation
    // ============================================================================

    float Action::getValue(const DeviceService& devices) const {
        for (const auto& binding : bindings_) {
            if (!binding.isValid()) {
                continue;
            }

            if (binding.kind == BindingKind::AXIS) {
                const float value = devices.getAxis(binding.device, binding.positive);
                if (value != 0.0f) {
                    return binding.invert ? -value : value;
                }
                continue;
            }

            const Sides sides = pressedSides(binding, devices);
            if (sides.positive == sides.negative) {
                continue; // Both or neither held
            }
            const float value = sides.positive ? 1.0f : -1.0f;
            return binding.invert ? -value : value;
        }

        return 0.0f;
    }

    bool Action::isPressed(const DeviceService& devices) const {
        for (const auto& binding : bindings_) {
            if (!binding.isValid()) {
                continue;
            }

            const Sides sides = pressedSides(binding, devices);
            if (sides.positive != sides.negative) {
                return sides.positive;
            }
        }

        return false;
    }

    bool Action::justPressed(const DeviceService& devices) const {
        for (const auto& binding : bindings_) {
            if (!binding.isValid()) {
                continue;
            }

            if (const Sides edges = pressEdges(binding, devices); edges.positive && !edges.negative) {
                return true;
            }
        }

        return false;
    }

    bool Action::justReleased(const DeviceService& devices) const {
        for (const auto& binding : bindings_) {
            if (!binding.isValid()) {
                continue;
            }

            if (const Sides edges = releaseEdges(binding, devices); edges.positive && !edges.negative) {
                return true;
            }
        }

        return false;
    }

    bool Action::isPositive(const DeviceService& devices) const {
        return getValue(devices) >= AXIS_PRESS_THRESHOLD;
    }

    bool Action::isNegative(const DeviceService& devices) const {
        return getValue(devices) <= -AXIS_PRESS_THRESHOLD;
    }

    // ============================================================================
    // Bindings
    // ============================================================================

    bool Action::add(const InputBinding& binding) {
        if (auto error = binding.getValidationError(); !error.empty()) {
            debug::getLogger().warning(LOG_CATEGORY_ACTION,
                                       "Action '" + name_ + "' rejected " + binding.toString() + ": " + error);
            return false;
        }

        if (collidesWithAny(binding)) {
            debug::getLogger().warning(LOG_CATEGORY_ACTION,
                                       "Action '" + name_ + "' rejected " + binding.toString() +
                                       ": collides with an existing binding");
            return false;
        }

        bindings_.push_back(binding);
        return true;
    }

    std::size_t Action::add(const std::vector<InputBinding>& bindings) {
        std::size_t added = 0;
        for (const auto& binding : bindings) {
            if (add(binding)) {
                ++added;
            }
        }
        return added;
    }

    bool Action::set(const std::size_t index, const InputBinding& binding) {
        if (index >= bindings_.size()) {
            debug::getLogger().warning(LOG_CATEGORY_ACTION,
                                       "Action '" + name_ + "': binding index " + std::to_string(index) +
                                       " out of range");
            return false;
        }

        if (auto error = binding.getValidationError(); !error.empty()) {
            debug::getLogger().warning(LOG_CATEGORY_ACTION,
                                       "Action '" + name_ + "' rejected " + binding.toString() + ": " + error);
            return false;
        }

        if (collidesWithAny(binding, index)) {
            debug::getLogger().warning(LOG_CATEGORY_ACTION,
                                       "Action '" + name_ + "' rejected " + binding.toString() +
                                       ": collides with another binding");
            return false;
        }

        bindings_[index] = binding;
        return true;
    }

    bool Action::remove(const std::size_t index) {
        if (index >= bindings_.size()) {
            return false;
        }
        bindings_.erase(bindings_.begin() + static_cast<std::ptrdiff_t>(index));
        return true;
    }

    bool Action::remove(const InputBinding& binding) {
        for (auto it = bindings_.begin(); it != bindings_.end(); ++it) {
            if (*it == binding) {
                bindings_.erase(it);
                return true;
            }
        }
        return false;
    }

    const InputBinding* Action::get(const std::size_t index) const noexcept {
        return index < bindings_.size() ? &bindings_[index] : nullptr;
    }

    bool Action::contains(const InputBinding& binding) const {
        for (const auto& existing : bindings_) {
            if (existing == binding) {
                return true;
            }
        }
        return false;
    }

    bool Action::collidesWithAny(const InputBinding& binding, const std::size_t ignoreIndex) const {
        for (std::size_t i = 0; i < bindings_.size(); ++i) {
            if (i != ignoreIndex && InputBinding::collides(bindings_[i], binding)) {
                return true;
            }
        }
        return false;
    }

    // ============================================================================
    // Serialization
    // ============================================================================

    std::string Action::toXml(const std::size_t indent) const {
        const std::string pad(indent, ' ');
        std::string xml = pad + "<" + XML_ACTION_ELEMENT + " name=\"" + utils::escapeXml(name_) + "\"";

        if (bindings_.empty()) {
            return xml + "/>";
        }

        xml += ">\n";
        for (const auto& binding : bindings_) {
            xml += binding.toXml(indent + 2);
            xml += "\n";
        }
        xml += pad + "</" + XML_ACTION_ELEMENT + ">";
        return xml;
    }

    bool Action::loadFromXml(const utils::XmlElement& element) {
        auto& logger = debug::getLogger();
        const std::string where = " (line " + std::to_string(element.getLine()) + ")";

        if (!element.nameIs(XML_ACTION_ELEMENT)) {
            logger.error(LOG_CATEGORY_ACTION, "Expected <action>, found <" + element.getName() + ">" + where);
            return false;
        }

        const auto name = element.getAttribute("name");
        if (!name) {
            logger.error(LOG_CATEGORY_ACTION, "Action has no 'name' attribute" + where);
            return false;
        }
        if (!utils::isValidName(*name)) {
            logger.error(LOG_CATEGORY_ACTION, "Invalid action name '" + *name + "'" + where);
            return false;
        }

        Action loaded;
        loaded.name_ = *name;

        for (const auto& child : element.getChildren()) {
            if (!child.nameIs(XML_BUTTON_ELEMENT) && !child.nameIs(XML_AXIS_ELEMENT)) {
                logger.debug(LOG_CATEGORY_ACTION, "Ignoring <" + child.getName() + "> in action '" + *name + "'");
                continue;
            }

            const auto binding = InputBinding::fromXml(child);
            if (!binding) {
                logger.error(LOG_CATEGORY_ACTION, "Failed loading action '" + *name + "': invalid binding");
                return false;
            }

            if (loaded.collidesWithAny(*binding)) {
                logger.error(LOG_CATEGORY_ACTION,
                             "Failed loading action '" + *name + "': " + binding->toString() +
                             " collides with an earlier binding (line " + std::to_string(child.getLine()) + ")");
                return false;
            }

            if (loaded.bindings_.size() >= MAX_BINDINGS_PER_ACTION) {
                logger.error(LOG_CATEGORY_ACTION,
                             "Failed loading action '" + *name + "': more than " +
                             std::to_string(MAX_BINDINGS_PER_ACTION) + " bindings");
                return false;
            }

            loaded.bindings_.push_back(*binding);
        }

        *this = std::move(loaded);
        return true;
    }

    bool Action::operator==(const Action& other) const {
        return utils::iequals(name_, other.name_) && bindings_ == other.bindings_;
    }
} // namespace actuate::input
