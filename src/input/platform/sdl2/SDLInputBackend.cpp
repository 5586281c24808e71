/**
 * @file SDLInputBackend.cpp
 * @brief SDL2 input backend implementation
 * @author Actuate Team
 * @date 2025
 */

#include "SDLInputBackend.h"

#include "../../debug/InputLogger.h"
#include "../../utils/FileIO.h"

#include <algorithm>

namespace actuate::input {
    SDLInputBackend::~SDLInputBackend() {
        shutdown();
    }

    bool SDLInputBackend::initialize(const SDLBackendConfig& config) {
        if (initialized_) {
            return false;
        }

        config_ = config;

        if (SDL_InitSubSystem(SDL_SUBSYSTEMS) != 0) {
            debug::getLogger().error(LOG_CATEGORY_BACKEND,
                                     std::string("Failed to initialize SDL: ") + SDL_GetError());
            return false;
        }

        if (!config_.controllerMappingsFile.empty()) {
            const int added = loadControllerMappings(config_.controllerMappingsFile);
            if (added < 0) {
                debug::getLogger().warning(LOG_CATEGORY_BACKEND,
                                           "Cannot load controller mappings from " + config_.controllerMappingsFile +
                                           ": " + SDL_GetError());
            }
            else {
                debug::getLogger().info(LOG_CATEGORY_BACKEND,
                                        "Added " + std::to_string(added) + " controller mappings");
            }
        }

        initialized_ = true;
        scanControllers();
        return true;
    }

    void SDLInputBackend::shutdown() {
        if (!initialized_) {
            return;
        }

        // Handles close before the subsystem goes away
        controllers_.clear();

        SDL_QuitSubSystem(SDL_SUBSYSTEMS);
        initialized_ = false;
    }

    int SDLInputBackend::loadControllerMappings(const std::string& filepath) const {
        if (!utils::fileExists(filepath)) {
            SDL_SetError("File not found: %s", filepath.c_str());
            return -1;
        }
        return SDL_GameControllerAddMappingsFromFile(filepath.c_str());
    }

    // ============================================================================
    // IInputBackend
    // ============================================================================

    void SDLInputBackend::refresh() {
        if (!initialized_) {
            return;
        }

        SDL_PumpEvents();

        // Device events stay in the queue for the application
        removeDetachedControllers();
        scanControllers();
    }

    bool SDLInputBackend::isKeyPressed(const KeyCode key) const {
        const auto scancode = SDLKeyMap::toScancode(key);
        if (!scancode) {
            return false;
        }

        int numKeys = 0;
        const Uint8* state = SDL_GetKeyboardState(&numKeys);
        return state != nullptr && *scancode < numKeys && state[*scancode] != 0;
    }

    MouseState SDLInputBackend::pollMouse() const {
        int x = 0;
        int y = 0;
        const Uint32 mask = config_.useGlobalMousePosition
                                ? SDL_GetGlobalMouseState(&x, &y)
                                : SDL_GetMouseState(&x, &y);

        MouseState::ButtonBits buttons;
        for (std::size_t i = 0; i < MOUSE_BUTTON_COUNT; ++i) {
            const Uint8 sdlButton = SDLKeyMap::toMouseButton(static_cast<MouseButton>(i));
            buttons[i] = sdlButton != 0 && (mask & SDL_BUTTON(sdlButton)) != 0;
        }

        return MouseState(buttons, math::Vec2i(x, y));
    }

    std::vector<JoystickId> SDLInputBackend::getConnectedJoysticks() const {
        std::vector<JoystickId> ids;
        ids.reserve(controllers_.size());
        for (const auto& entry : controllers_) {
            if (SDL_GameControllerGetAttached(entry.controller.get())) {
                ids.push_back(entry.instanceId);
            }
        }
        return ids;
    }

    bool SDLInputBackend::isJoystickConnected(const JoystickId id) const {
        SDL_GameController* controller = findController(id);
        return controller != nullptr && SDL_GameControllerGetAttached(controller);
    }

    std::optional<RawJoystickState> SDLInputBackend::pollJoystick(const JoystickId id) const {
        SDL_GameController* controller = findController(id);
        if (controller == nullptr || !SDL_GameControllerGetAttached(controller)) {
            return std::nullopt;
        }

        RawJoystickState raw;
        for (std::size_t i = 0; i < JOYSTICK_BUTTON_COUNT; ++i) {
            if (const auto sdlButton = keyMap_.toControllerButton(static_cast<JoystickButton>(i))) {
                raw.buttons[i] = SDL_GameControllerGetButton(controller, *sdlButton) != 0;
            }
        }

        // SDL reports Y down-positive
        raw.leftStick.x = normalizeAxisValue(SDL_GameControllerGetAxis(controller, SDL_CONTROLLER_AXIS_LEFTX));
        raw.leftStick.y = -normalizeAxisValue(SDL_GameControllerGetAxis(controller, SDL_CONTROLLER_AXIS_LEFTY));
        raw.rightStick.x = normalizeAxisValue(SDL_GameControllerGetAxis(controller, SDL_CONTROLLER_AXIS_RIGHTX));
        raw.rightStick.y = -normalizeAxisValue(SDL_GameControllerGetAxis(controller, SDL_CONTROLLER_AXIS_RIGHTY));
        raw.leftTrigger = normalizeTriggerValue(
            SDL_GameControllerGetAxis(controller, SDL_CONTROLLER_AXIS_TRIGGERLEFT));
        raw.rightTrigger = normalizeTriggerValue(
            SDL_GameControllerGetAxis(controller, SDL_CONTROLLER_AXIS_TRIGGERRIGHT));

        return raw;
    }

    // ============================================================================
    // Controller Tracking
    // ============================================================================

    void SDLInputBackend::scanControllers() {
        const int numJoysticks = SDL_NumJoysticks();
        for (int i = 0; i < numJoysticks; ++i) {
            if (!SDL_IsGameController(i)) {
                continue;
            }

            const JoystickId instanceId = SDL_JoystickGetDeviceInstanceID(i);
            if (instanceId >= 0 && findController(instanceId) == nullptr) {
                openController(i);
            }
        }
    }

    void SDLInputBackend::openController(const int deviceIndex) {
        ControllerHandle controller(SDL_GameControllerOpen(deviceIndex));
        if (!controller) {
            debug::getLogger().warning(LOG_CATEGORY_BACKEND,
                                       std::string("Cannot open game controller: ") + SDL_GetError());
            return;
        }

        SDL_Joystick* joystick = SDL_GameControllerGetJoystick(controller.get());
        const JoystickId instanceId = SDL_JoystickInstanceID(joystick);
        const char* name = SDL_GameControllerName(controller.get());

        debug::getLogger().info(LOG_CATEGORY_BACKEND,
                                "Controller connected: " + std::string(name ? name : "unknown") +
                                " (id " + std::to_string(instanceId) + ")");

        controllers_.push_back({instanceId, std::move(controller)});
    }

    void SDLInputBackend::removeDetachedControllers() {
        std::erase_if(controllers_, [](const ControllerEntry& entry) {
            if (SDL_GameControllerGetAttached(entry.controller.get())) {
                return false;
            }
            debug::getLogger().info(LOG_CATEGORY_BACKEND,
                                    "Controller disconnected (id " + std::to_string(entry.instanceId) + ")");
            return true;
        });
    }

    SDL_GameController* SDLInputBackend::findController(const JoystickId id) const {
        const auto it = std::ranges::find(controllers_, id, &ControllerEntry::instanceId);
        return it != controllers_.end() ? it->controller.get() : nullptr;
    }
} // namespace actuate::input
