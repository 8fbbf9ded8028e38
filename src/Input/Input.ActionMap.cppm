module;
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

export module Input:ActionMap;

import Core.Error;
import :Types;

export namespace Input
{
    // How a source should interpret Binding::Controls.
    enum class ControlType : uint8_t
    {
        Button = 0,   // Controls[0] = button / key code
        Axis2D,       // Controls[0] = x axis, Controls[1] = y axis
        Composite2D   // Controls = up, down, left, right button codes
    };

    inline constexpr int kUnboundControl = -1;

    // -------------------------------------------------------------------------
    // Binding - device-specific control description
    // -------------------------------------------------------------------------
    // Path is the stable lookup key a source uses to find the control
    // ("Keyboard/WASD", "Gamepad/LeftStick"). Control codes are opaque to the
    // core and only interpreted by the source that owns the device.
    // -------------------------------------------------------------------------
    struct Binding
    {
        std::string Path;
        ControlType Type = ControlType::Button;
        std::array<int, 4> Controls{kUnboundControl, kUnboundControl, kUnboundControl, kUnboundControl};

        // Radial deadzone for 2D reads; magnitudes at or below it read as zero.
        float Deadzone = 0.0f;

        [[nodiscard]] static Binding MakeButton(std::string path, int code);
        [[nodiscard]] static Binding MakeAxis(std::string path, int xAxis, int yAxis, float deadzone = 0.0f);
        [[nodiscard]] static Binding MakeComposite(std::string path, int up, int down, int left, int right);

        [[nodiscard]] ActionValueKind ValueKind() const
        {
            return Type == ControlType::Button ? ActionValueKind::Button : ActionValueKind::Vector2D;
        }
    };

    // -------------------------------------------------------------------------
    // ActionMap - per-device-category binding table
    // -------------------------------------------------------------------------
    // Any of the four logical actions may be left unbound; an unbound action is
    // inert while the map is active. Built once from configuration and treated
    // as immutable after it is handed to the InputSystem.
    // -------------------------------------------------------------------------
    class ActionMap
    {
    public:
        ActionMap() = default;
        ActionMap(std::string name, DeviceCategory category);

        // Fluent setup helper. Rebinding an action replaces the previous binding.
        ActionMap& Bind(LogicalAction action, Binding binding);

        [[nodiscard]] const std::string& GetName() const { return m_Name; }
        [[nodiscard]] DeviceCategory GetCategory() const { return m_Category; }

        // Returns nullptr if the map has no binding for the action.
        [[nodiscard]] const Binding* Find(LogicalAction action) const;

        // Lookup by canonical action name ("Move", "PrimaryInteract", ...).
        [[nodiscard]] const Binding* Find(std::string_view actionName) const;

        [[nodiscard]] bool IsBound(LogicalAction action) const { return Find(action) != nullptr; }

    private:
        std::string m_Name;
        DeviceCategory m_Category = DeviceCategory::None;
        std::array<std::optional<Binding>, kLogicalActionCount> m_Bindings{};
    };

    // Bindings captured once when a map becomes active. Pointers stay valid
    // as long as the owning ActionMap is alive and unmodified.
    struct ResolvedActionMap
    {
        const ActionMap* Map = nullptr;
        std::array<const Binding*, kLogicalActionCount> Bindings{};

        [[nodiscard]] const Binding* Get(LogicalAction action) const { return Bindings[IndexOf(action)]; }
        [[nodiscard]] bool IsBound(LogicalAction action) const { return Get(action) != nullptr; }
        [[nodiscard]] size_t BoundCount() const;
    };

    [[nodiscard]] ResolvedActionMap Resolve(const ActionMap& map);

    [[nodiscard]] std::optional<LogicalAction> ParseLogicalAction(std::string_view name);

    // Configuration-time validation. Fails on an empty set, a map for
    // DeviceCategory::None, two maps for one category, or a binding whose
    // control type cannot produce the action's value kind.
    [[nodiscard]] Core::Result ValidateActionMaps(std::span<const ActionMap> maps);
}
