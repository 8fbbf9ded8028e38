module;
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <glm/glm.hpp>

export module Input:Types;

export namespace Input
{
    // Arbitration priority is not the declaration order; see Arbiter.
    enum class DeviceCategory : uint8_t
    {
        None = 0,
        Keyboard,
        Touch,
        Gamepad
    };

    inline constexpr size_t kDeviceCategoryCount = 4;

    enum class DeviceChangeKind : uint8_t
    {
        Added = 0,
        Removed,
        ConfigurationChanged,
        ControlSchemeChanged
    };

    struct DeviceInfo
    {
        DeviceCategory Category = DeviceCategory::None;
        std::string DisplayName;
        uint32_t DeviceId = 0;
        bool UpdatedThisTick = false;
    };

    struct DeviceChangeEvent
    {
        DeviceInfo Device;
        DeviceChangeKind Kind = DeviceChangeKind::ConfigurationChanged;
    };

    // The four semantic actions every map resolves.
    enum class LogicalAction : uint8_t
    {
        Move = 0,
        PrimaryInteract,
        SecondaryInteract,
        MenuButton
    };

    inline constexpr size_t kLogicalActionCount = 4;

    inline constexpr std::array<LogicalAction, kLogicalActionCount> kAllActions{
        LogicalAction::Move,
        LogicalAction::PrimaryInteract,
        LogicalAction::SecondaryInteract,
        LogicalAction::MenuButton
    };

    enum class ActionValueKind : uint8_t
    {
        Vector2D = 0,
        Button
    };

    [[nodiscard]] constexpr ActionValueKind ValueKindOf(LogicalAction action)
    {
        return action == LogicalAction::Move ? ActionValueKind::Vector2D : ActionValueKind::Button;
    }

    [[nodiscard]] constexpr size_t IndexOf(LogicalAction action)
    {
        return static_cast<size_t>(action);
    }

    // Raw per-tick values for the four actions under the active map.
    struct ActionSamples
    {
        glm::vec2 Move{0.0f};
        bool PrimaryInteract = false;
        bool SecondaryInteract = false;
        bool MenuButton = false;
    };

    // Event kinds published by the router. Move-family kinds carry a vector payload
    // except MoveCanceled.
    enum class EventKind : uint8_t
    {
        MoveStarted = 0,
        Move,
        MoveCanceled,
        PrimaryInteract,
        PrimaryCanceled,
        SecondaryInteract,
        SecondaryCanceled,
        Menu
    };

    inline constexpr size_t kEventKindCount = 8;

    [[nodiscard]] constexpr bool CarriesVector(EventKind kind)
    {
        return kind == EventKind::MoveStarted || kind == EventKind::Move;
    }

    constexpr std::string_view ToString(DeviceCategory category)
    {
        switch (category)
        {
        case DeviceCategory::None:     return "None";
        case DeviceCategory::Keyboard: return "Keyboard";
        case DeviceCategory::Touch:    return "Touch";
        case DeviceCategory::Gamepad:  return "Gamepad";
        }
        return "Unknown";
    }

    constexpr std::string_view ToString(DeviceChangeKind kind)
    {
        switch (kind)
        {
        case DeviceChangeKind::Added:                return "Added";
        case DeviceChangeKind::Removed:              return "Removed";
        case DeviceChangeKind::ConfigurationChanged: return "ConfigurationChanged";
        case DeviceChangeKind::ControlSchemeChanged: return "ControlSchemeChanged";
        }
        return "Unknown";
    }

    // Canonical action names as they appear in action map definitions.
    constexpr std::string_view ToString(LogicalAction action)
    {
        switch (action)
        {
        case LogicalAction::Move:              return "Move";
        case LogicalAction::PrimaryInteract:   return "PrimaryInteract";
        case LogicalAction::SecondaryInteract: return "SecondaryInteract";
        case LogicalAction::MenuButton:        return "MenuButton";
        }
        return "Unknown";
    }

    constexpr std::string_view ToString(EventKind kind)
    {
        switch (kind)
        {
        case EventKind::MoveStarted:       return "MoveStarted";
        case EventKind::Move:              return "Move";
        case EventKind::MoveCanceled:      return "MoveCanceled";
        case EventKind::PrimaryInteract:   return "PrimaryInteract";
        case EventKind::PrimaryCanceled:   return "PrimaryCanceled";
        case EventKind::SecondaryInteract: return "SecondaryInteract";
        case EventKind::SecondaryCanceled: return "SecondaryCanceled";
        case EventKind::Menu:              return "Menu";
        }
        return "Unknown";
    }
}
