#pragma once

// =============================================================================
// Shared fixtures for the input test suites.
//
// Usage: #include "InputTestHelpers.h" AFTER `import Core;` and `import Input;`
// in each test file. All functions are inline to avoid ODR issues across
// translation units.
// =============================================================================

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

// Records every event published through a registry as "Kind" or
// "Kind(x,y)", in dispatch order.
class EventRecorder
{
public:
    explicit EventRecorder(Input::EventRegistry& events)
    {
        for (size_t i = 0; i < Input::kEventKindCount; ++i)
        {
            const auto kind = static_cast<Input::EventKind>(i);
            if (Input::CarriesVector(kind))
            {
                (void)events.Subscribe(kind, Input::Vec2Callback([this, kind](const glm::vec2& v)
                {
                    Record(kind, v);
                }));
            }
            else
            {
                (void)events.Subscribe(kind, Input::TriggerCallback([this, kind]
                {
                    Entries.emplace_back(Input::ToString(kind));
                }));
            }
        }
    }

    void Record(Input::EventKind kind, const glm::vec2& v)
    {
        std::string entry(Input::ToString(kind));
        entry += "(" + Format(v.x) + "," + Format(v.y) + ")";
        Entries.push_back(std::move(entry));
    }

    // Returns and clears what was recorded so far.
    std::vector<std::string> Take()
    {
        return std::exchange(Entries, {});
    }

    std::vector<std::string> Entries;

private:
    static std::string Format(float f)
    {
        std::string s = std::to_string(f);
        s.erase(s.find_last_not_of('0') + 1);
        if (!s.empty() && s.back() == '.')
            s.pop_back();
        return s;
    }
};

// Routes log output into memory for the lifetime of the object.
class LogCapture
{
public:
    explicit LogCapture(Core::Log::Level level = Core::Log::Level::Info)
    {
        m_PreviousLevel = Core::Log::GetLevel();
        Core::Log::SetLevel(level);
        Core::Log::SetSink([this](Core::Log::Level level, std::string_view msg)
        {
            Messages.emplace_back(level, std::string(msg));
        });
    }

    ~LogCapture()
    {
        Core::Log::SetSink({});
        Core::Log::SetLevel(m_PreviousLevel);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] size_t Count(Core::Log::Level level) const
    {
        size_t n = 0;
        for (const auto& [l, msg] : Messages)
            n += l == level ? 1 : 0;
        return n;
    }

    [[nodiscard]] bool Contains(std::string_view needle) const
    {
        for (const auto& entry : Messages)
        {
            if (entry.second.find(needle) != std::string::npos)
                return true;
        }
        return false;
    }

    std::vector<std::pair<Core::Log::Level, std::string>> Messages;

private:
    Core::Log::Level m_PreviousLevel = Core::Log::Level::Info;
};

inline Input::ActionMap MakeKeyboardMap()
{
    using Input::Binding;
    using Input::LogicalAction;

    Input::ActionMap map("Keyboard", Input::DeviceCategory::Keyboard);
    map.Bind(LogicalAction::Move, Binding::MakeComposite("Keyboard/WASD", 87, 83, 65, 68))
       .Bind(LogicalAction::PrimaryInteract, Binding::MakeButton("Keyboard/Space", 32))
       .Bind(LogicalAction::SecondaryInteract, Binding::MakeButton("Keyboard/E", 69))
       .Bind(LogicalAction::MenuButton, Binding::MakeButton("Keyboard/Escape", 256));
    return map;
}

inline Input::ActionMap MakeGamepadMap(float deadzone = 0.0f)
{
    using Input::Binding;
    using Input::LogicalAction;

    Input::ActionMap map("Gamepad", Input::DeviceCategory::Gamepad);
    map.Bind(LogicalAction::Move, Binding::MakeAxis("Gamepad/LeftStick", 0, 1, deadzone))
       .Bind(LogicalAction::PrimaryInteract, Binding::MakeButton("Gamepad/A", 0))
       .Bind(LogicalAction::SecondaryInteract, Binding::MakeButton("Gamepad/B", 1))
       .Bind(LogicalAction::MenuButton, Binding::MakeButton("Gamepad/Start", 7));
    return map;
}

// Touch maps commonly leave move and menu unbound.
inline Input::ActionMap MakeTouchMap()
{
    using Input::Binding;
    using Input::LogicalAction;

    Input::ActionMap map("Touch", Input::DeviceCategory::Touch);
    map.Bind(LogicalAction::PrimaryInteract, Binding::MakeButton("Touch/Tap", 0));
    return map;
}

inline std::vector<Input::ActionMap> MakeAllMaps()
{
    std::vector<Input::ActionMap> maps;
    maps.push_back(MakeKeyboardMap());
    maps.push_back(MakeGamepadMap());
    maps.push_back(MakeTouchMap());
    return maps;
}
