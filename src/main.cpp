// Actuate demo: prints action values for a small set of bindings

#include <SDL2/SDL.h>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <ranges>
#include <thread>

#include "input/InputSystem.h"
#include "input/debug/InputLogger.h"
#include "input/utils/FileIO.h"

using namespace actuate::input;

/**
 * @brief Window plus frame loop reading actions from the global input system
 */
class InputDemo {
public:
    InputDemo() = default;
    ~InputDemo() = default;

    static constexpr int WINDOW_WIDTH = 640;
    static constexpr int WINDOW_HEIGHT = 360;
    static constexpr auto FRAME_TIME = std::chrono::milliseconds(16);

    bool initialize() {
        std::cout << "=== Initializing SDL ===" << std::endl;

        if (SDL_Init(SDL_INIT_VIDEO) < 0) {
            std::cerr << "SDL_Init failed: " << SDL_GetError() << std::endl;
            return false;
        }

        // Keyboard state is only reported while a window has focus
        window_ = SDL_CreateWindow("Actuate Demo",
                                   SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                                   WINDOW_WIDTH, WINDOW_HEIGHT, SDL_WINDOW_SHOWN);
        if (!window_) {
            std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << std::endl;
            SDL_Quit();
            return false;
        }

        std::cout << "=== Loading Bindings ===" << std::endl;

        auto& input = getGlobalInputSystem();
        const std::string& path = input.getConfig().bindings.path;

        if (!utils::fileExists(path) || !input.loadFromFile()) {
            std::cout << "Creating default bindings in " << path << std::endl;
            createDefaultBindings(input.actions());
            if (!input.saveToFile()) {
                std::cerr << "Could not save default bindings" << std::endl;
            }
        }

        for (const auto& action : input.actions() | std::views::values) {
            std::cout << "  " << action.getName() << ": " << action.size() << " bindings" << std::endl;
        }

        return true;
    }

    void run() {
        auto& input = getGlobalInputSystem();
        running_ = true;

        while (running_) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) {
                if (event.type == SDL_QUIT) {
                    running_ = false;
                }
            }

            input.update();

            if (input.justPressed("quit")) {
                running_ = false;
            }

            if (input.justPressed("jump")) {
                std::cout << "[F" << input.getFrameNumber() << "] jump" << std::endl;
            }

            const float horizontal = input.getValue("horizontal");
            const float vertical = input.getValue("vertical");
            if (horizontal != lastHorizontal_ || vertical != lastVertical_) {
                std::cout << std::fixed << std::setprecision(2)
                    << "[F" << input.getFrameNumber() << "] move (" << horizontal << ", " << vertical
                    << ") via " << deviceTypeToString(input.getLastDevice()) << std::endl;
                lastHorizontal_ = horizontal;
                lastVertical_ = vertical;
            }

            std::this_thread::sleep_for(FRAME_TIME);
        }
    }

    void cleanup() {
        if (window_) {
            SDL_DestroyWindow(window_);
            window_ = nullptr;
        }
        SDL_QuitSubSystem(SDL_INIT_VIDEO);
    }

private:
    SDL_Window* window_ = nullptr;
    bool running_ = false;
    float lastHorizontal_ = 0.0f;
    float lastVertical_ = 0.0f;

    static void createDefaultBindings(ActionSet& actions) {
        actions.clear();

        actions.add(Action("horizontal", {
                               InputBinding::axis(DeviceType::JOYSTICK, "LeftStickX"),
                               InputBinding::button(DeviceType::KEYBOARD, "D", "A"),
                               InputBinding::button(DeviceType::KEYBOARD, "Right", "Left"),
                               InputBinding::button(DeviceType::JOYSTICK, "DPadRight", "DPadLeft")
                           }));

        actions.add(Action("vertical", {
                               InputBinding::axis(DeviceType::JOYSTICK, "LeftStickY"),
                               InputBinding::button(DeviceType::KEYBOARD, "W", "S"),
                               InputBinding::button(DeviceType::KEYBOARD, "Up", "Down"),
                               InputBinding::button(DeviceType::JOYSTICK, "DPadUp", "DPadDown")
                           }));

        actions.add(Action("jump", {
                               InputBinding::button(DeviceType::KEYBOARD, "Space"),
                               InputBinding::button(DeviceType::JOYSTICK, "A"),
                               InputBinding::button(DeviceType::MOUSE, "Left")
                           }));

        actions.add(Action("quit", {
                               InputBinding::button(DeviceType::KEYBOARD, "Escape"),
                               InputBinding::button(DeviceType::JOYSTICK, "Back")
                           }));
    }
};

int main() {
    std::cout << "=== Actuate Input Demo ===" << std::endl;
    std::cout << "Move with WASD, arrows or the left stick. Space jumps, Escape quits." << std::endl;

    InputDemo demo;

    if (!demo.initialize()) {
        std::cerr << "\nFailed to initialize demo!" << std::endl;
        return -1;
    }

    try {
        demo.run();
    } catch (const std::exception& e) {
        std::cerr << "\nException during input loop: " << e.what() << std::endl;
        return -1;
    }

    demo.cleanup();
    return 0;
}
