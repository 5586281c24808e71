/**
 * @file ActionSet.cpp
 * @brief Action set management and persistence
 * @author Actuate Team
 * @date 2025
 */

#include "ActionSet.h"

#include "../debug/InputLogger.h"
#include "../utils/FileIO.h"
#include "../utils/XmlDocument.h"

#include <optional>
#include <ranges>
#include <utility>

namespace actuate::input {
    // ============================================================================
    // Actions
    // ============================================================================

    bool ActionSet::add(const Action& action, const bool replace) {
        if (!action.isValid()) {
            debug::getLogger().warning(LOG_CATEGORY_ACTION_SET,
                                       "Rejected invalid action '" + action.getName() + "'");
            return false;
        }

        auto key = utils::toLower(action.getName());
        if (const auto it = actions_.find(key); it != actions_.end()) {
            if (!replace) {
                debug::getLogger().warning(LOG_CATEGORY_ACTION_SET,
                                           "Action '" + action.getName() + "' already exists");
                return false;
            }
            actions_.erase(it);
        }

        actions_.emplace(std::move(key), action);
        return true;
    }

    std::size_t ActionSet::add(const std::vector<Action>& actions, const bool replace) {
        std::size_t added = 0;
        for (const auto& action : actions) {
            if (add(action, replace)) {
                ++added;
            }
        }
        return added;
    }

    bool ActionSet::remove(const std::string_view name) {
        return actions_.erase(utils::toLower(name)) > 0;
    }

    bool ActionSet::contains(const std::string_view name) const {
        return actions_.contains(utils::toLower(name));
    }

    const Action* ActionSet::get(const std::string_view name) const {
        const auto it = actions_.find(utils::toLower(name));
        return it != actions_.end() ? &it->second : nullptr;
    }

    // ============================================================================
    // Serialization
    // ============================================================================

    std::string ActionSet::toString(const std::size_t indent) const {
        const std::string pad(indent, ' ');
        if (actions_.empty()) {
            return pad + "<" + XML_ACTION_SET_ELEMENT + "/>";
        }

        std::string xml = pad + "<" + XML_ACTION_SET_ELEMENT + ">\n";
        for (const auto& action : actions_ | std::views::values) {
            xml += action.toXml(indent + 2);
            xml += "\n";
        }
        xml += pad + "</" + XML_ACTION_SET_ELEMENT + ">";
        return xml;
    }

    std::string ActionSet::toDocument() const {
        std::string xml = "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
        xml += std::string("<") + XML_INPUT_ELEMENT + ">\n";
        xml += toString(2);
        xml += "\n";
        xml += std::string("</") + XML_INPUT_ELEMENT + ">\n";
        return xml;
    }

    bool ActionSet::loadFromXml(const utils::XmlElement& element) {
        auto& logger = debug::getLogger();

        std::optional<utils::XmlElement> setElement;
        if (element.nameIs(XML_ACTION_SET_ELEMENT)) {
            setElement = element;
        }
        else if (element.nameIs(XML_INPUT_ELEMENT)) {
            setElement = element.getFirstChild(XML_ACTION_SET_ELEMENT);
            if (!setElement) {
                logger.error(LOG_CATEGORY_ACTION_SET, "<input> has no <action_set> element");
                return false;
            }
        }
        else {
            logger.error(LOG_CATEGORY_ACTION_SET,
                         "Expected <action_set> or <input>, found <" + element.getName() + ">");
            return false;
        }

        ActionSet loaded;
        for (const auto& child : setElement->getChildren()) {
            if (!child.nameIs(XML_ACTION_ELEMENT)) {
                logger.debug(LOG_CATEGORY_ACTION_SET, "Ignoring <" + child.getName() + "> in action set");
                continue;
            }

            Action action;
            if (!action.loadFromXml(child)) {
                logger.error(LOG_CATEGORY_ACTION_SET, "Failed loading action set: invalid action");
                return false;
            }

            if (loaded.contains(action)) {
                logger.error(LOG_CATEGORY_ACTION_SET,
                             "Failed loading action set: duplicate action '" + action.getName() + "' (line " +
                             std::to_string(child.getLine()) + ")");
                return false;
            }

            if (loaded.size() >= MAX_ACTIONS) {
                logger.error(LOG_CATEGORY_ACTION_SET,
                             "Failed loading action set: more than " + std::to_string(MAX_ACTIONS) + " actions");
                return false;
            }

            if (!loaded.add(action)) {
                logger.error(LOG_CATEGORY_ACTION_SET,
                             "Failed loading action set: action '" + action.getName() + "' rejected");
                return false;
            }
        }

        actions_ = std::move(loaded.actions_);
        logger.debug(LOG_CATEGORY_ACTION_SET, "Loaded " + std::to_string(actions_.size()) + " actions");
        return true;
    }

    bool ActionSet::loadFromString(const std::string_view xml) {
        utils::XmlDocument document;
        if (!document.parse(xml)) {
            debug::getLogger().error(LOG_CATEGORY_ACTION_SET, "Malformed bindings document: " + document.getLastError());
            return false;
        }

        const auto root = document.getRoot();
        return root && loadFromXml(*root);
    }

    bool ActionSet::loadFromFile(const std::string& path) {
        const std::string target = path.empty() ? DEFAULT_BINDINGS_PATH : path;

        const auto contents = utils::readFileContents(target);
        if (!contents) {
            debug::getLogger().error(LOG_CATEGORY_ACTION_SET, "Cannot read bindings file: " + target);
            return false;
        }

        if (!loadFromString(*contents)) {
            debug::getLogger().error(LOG_CATEGORY_ACTION_SET, "Failed loading bindings file: " + target);
            return false;
        }

        debug::getLogger().info(LOG_CATEGORY_ACTION_SET,
                                "Loaded " + std::to_string(actions_.size()) + " actions from " + target);
        return true;
    }

    bool ActionSet::saveToFile(const std::string& path, const bool overwrite) const {
        const std::string target = path.empty() ? DEFAULT_BINDINGS_PATH : path;

        if (!overwrite && utils::fileExists(target)) {
            debug::getLogger().warning(LOG_CATEGORY_ACTION_SET, "Not overwriting existing file: " + target);
            return false;
        }

        std::string error;
        if (!utils::atomicWriteFile(target, toDocument(), error)) {
            debug::getLogger().error(LOG_CATEGORY_ACTION_SET, "Failed saving bindings: " + error);
            return false;
        }

        debug::getLogger().info(LOG_CATEGORY_ACTION_SET,
                                "Saved " + std::to_string(actions_.size()) + " actions to " + target);
        return true;
    }
} // namespace actuate::input
