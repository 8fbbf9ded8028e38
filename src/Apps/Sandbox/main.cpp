#include <chrono>
#include <thread>
#include <utility>
#include <vector>
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>

import Core;
import Input;
import Sandbox.GlfwInput;

using namespace Core;

namespace
{
    // One map per category the GLFW source exposes.
    std::vector<Input::ActionMap> BuildActionMaps()
    {
        using Input::Binding;
        using Input::LogicalAction;

        std::vector<Input::ActionMap> maps;

        Input::ActionMap keyboard("Keyboard", Input::DeviceCategory::Keyboard);
        keyboard.Bind(LogicalAction::Move, Binding::MakeComposite("Keyboard/WASD", Sandbox::Key::W, Sandbox::Key::S,
                                                                  Sandbox::Key::A, Sandbox::Key::D))
                .Bind(LogicalAction::PrimaryInteract, Binding::MakeButton("Keyboard/Space", Sandbox::Key::Space))
                .Bind(LogicalAction::SecondaryInteract, Binding::MakeButton("Keyboard/E", Sandbox::Key::E))
                .Bind(LogicalAction::MenuButton, Binding::MakeButton("Keyboard/Escape", Sandbox::Key::Escape));
        maps.push_back(std::move(keyboard));

        Input::ActionMap gamepad("Gamepad", Input::DeviceCategory::Gamepad);
        gamepad.Bind(LogicalAction::Move, Binding::MakeAxis("Gamepad/LeftStick", Sandbox::Pad::LeftX,
                                                            Sandbox::Pad::LeftY, 0.2f))
               .Bind(LogicalAction::PrimaryInteract, Binding::MakeButton("Gamepad/A", Sandbox::Pad::ButtonA))
               .Bind(LogicalAction::SecondaryInteract, Binding::MakeButton("Gamepad/B", Sandbox::Pad::ButtonB))
               .Bind(LogicalAction::MenuButton, Binding::MakeButton("Gamepad/Start", Sandbox::Pad::ButtonStart));
        maps.push_back(std::move(gamepad));

        // Pointer stands in for touch; there is no move gesture.
        Input::ActionMap touch("Touch", Input::DeviceCategory::Touch);
        touch.Bind(LogicalAction::PrimaryInteract, Binding::MakeButton("Touch/Press", Sandbox::Pointer::Left))
             .Bind(LogicalAction::SecondaryInteract, Binding::MakeButton("Touch/Hold", Sandbox::Pointer::Right));
        maps.push_back(std::move(touch));

        return maps;
    }

    bool SubscribeListeners(Input::InputSystem& input, bool& quit)
    {
        using Input::EventKind;

        const Expected<Input::ListenerHandle> handles[] = {
            input.Subscribe(EventKind::MoveStarted, Input::Vec2Callback([](const glm::vec2& v)
            {
                Log::Info("Move started ({:.2f}, {:.2f})", v.x, v.y);
            })),
            input.Subscribe(EventKind::Move, Input::Vec2Callback([](const glm::vec2& v)
            {
                Log::Debug("Move ({:.2f}, {:.2f})", v.x, v.y);
            })),
            input.Subscribe(EventKind::MoveCanceled, Input::TriggerCallback([] { Log::Info("Move canceled"); })),
            input.Subscribe(EventKind::PrimaryInteract, Input::TriggerCallback([] { Log::Info("Primary"); })),
            input.Subscribe(EventKind::PrimaryCanceled, Input::TriggerCallback([] { Log::Info("Primary released"); })),
            input.Subscribe(EventKind::SecondaryInteract, Input::TriggerCallback([] { Log::Info("Secondary"); })),
            input.Subscribe(EventKind::SecondaryCanceled, Input::TriggerCallback([] { Log::Info("Secondary released"); })),
            input.Subscribe(EventKind::Menu, Input::TriggerCallback([&quit]
            {
                Log::Info("Menu pressed, closing sandbox");
                quit = true;
            })),
        };

        for (const auto& handle : handles)
        {
            if (!handle)
            {
                Log::Error("Failed to subscribe listener: {}", ErrorCodeToString(handle.error()));
                return false;
            }
        }
        return true;
    }
}

int main()
{
    if (!glfwInit())
    {
        Log::Error("Failed to initialize GLFW");
        return 1;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    GLFWwindow* window = glfwCreateWindow(640, 360, "Universal Input Sandbox", nullptr, nullptr);
    if (!window)
    {
        Log::Error("Failed to create window");
        glfwTerminate();
        return 1;
    }

    int exitCode = 0;
    {
        Sandbox::GlfwInputSource source(window);
        Input::InputSystem input;

        Input::InputConfig config;
        config.Maps = BuildActionMaps();
        config.ArbitrateEveryTick = true;

        bool quit = false;
        if (auto result = input.Initialize(std::move(config), source); !result)
        {
            Log::Error("Input initialization failed: {}", ErrorCodeToString(result.error()));
            exitCode = 1;
        }
        else if (!SubscribeListeners(input, quit))
        {
            exitCode = 1;
        }
        else
        {
            Log::Info("Sandbox Started! WASD/Space/E, gamepad or mouse. Escape or Start quits.");
            while (!quit && !glfwWindowShouldClose(window))
            {
                glfwPollEvents();
                source.Poll();
                input.Tick();
                std::this_thread::sleep_for(std::chrono::milliseconds(16));
            }
        }

        input.Shutdown();
    }

    glfwDestroyWindow(window);
    glfwTerminate();
    return exitCode;
}
