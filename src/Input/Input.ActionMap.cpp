module;
#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

module Input:ActionMap.Impl;

import Core.Error;
import Core.Logging;
import :Types;
import :ActionMap;

namespace Input
{
    // -------------------------------------------------------------------------
    // Binding
    // -------------------------------------------------------------------------

    Binding Binding::MakeButton(std::string path, int code)
    {
        Binding b{};
        b.Path = std::move(path);
        b.Type = ControlType::Button;
        b.Controls[0] = code;
        return b;
    }

    Binding Binding::MakeAxis(std::string path, int xAxis, int yAxis, float deadzone)
    {
        Binding b{};
        b.Path = std::move(path);
        b.Type = ControlType::Axis2D;
        b.Controls[0] = xAxis;
        b.Controls[1] = yAxis;
        b.Deadzone = deadzone;
        return b;
    }

    Binding Binding::MakeComposite(std::string path, int up, int down, int left, int right)
    {
        Binding b{};
        b.Path = std::move(path);
        b.Type = ControlType::Composite2D;
        b.Controls = {up, down, left, right};
        return b;
    }

    // -------------------------------------------------------------------------
    // ActionMap
    // -------------------------------------------------------------------------

    ActionMap::ActionMap(std::string name, DeviceCategory category)
        : m_Name(std::move(name)), m_Category(category)
    {
    }

    ActionMap& ActionMap::Bind(LogicalAction action, Binding binding)
    {
        m_Bindings[IndexOf(action)] = std::move(binding);
        return *this;
    }

    const Binding* ActionMap::Find(LogicalAction action) const
    {
        const auto& slot = m_Bindings[IndexOf(action)];
        return slot ? &*slot : nullptr;
    }

    const Binding* ActionMap::Find(std::string_view actionName) const
    {
        const auto action = ParseLogicalAction(actionName);
        return action ? Find(*action) : nullptr;
    }

    // -------------------------------------------------------------------------
    // Resolution
    // -------------------------------------------------------------------------

    size_t ResolvedActionMap::BoundCount() const
    {
        size_t count = 0;
        for (const Binding* binding : Bindings)
        {
            if (binding) ++count;
        }
        return count;
    }

    ResolvedActionMap Resolve(const ActionMap& map)
    {
        ResolvedActionMap resolved{};
        resolved.Map = &map;
        for (LogicalAction action : kAllActions)
        {
            resolved.Bindings[IndexOf(action)] = map.Find(action);
        }
        return resolved;
    }

    std::optional<LogicalAction> ParseLogicalAction(std::string_view name)
    {
        for (LogicalAction action : kAllActions)
        {
            if (ToString(action) == name)
                return action;
        }
        return std::nullopt;
    }

    // -------------------------------------------------------------------------
    // Validation
    // -------------------------------------------------------------------------

    Core::Result ValidateActionMaps(std::span<const ActionMap> maps)
    {
        if (maps.empty())
        {
            Core::Log::Error("ActionMap: no action maps supplied");
            return Core::Err(Core::ErrorCode::NoActionMaps);
        }

        std::array<const ActionMap*, kDeviceCategoryCount> seen{};
        for (const ActionMap& map : maps)
        {
            if (map.GetCategory() == DeviceCategory::None)
            {
                Core::Log::Error("ActionMap: '{}' is registered for category None", map.GetName());
                return Core::Err(Core::ErrorCode::InvalidCategory);
            }

            const auto slot = static_cast<size_t>(map.GetCategory());
            if (seen[slot])
            {
                Core::Log::Error("ActionMap: '{}' and '{}' both target {}",
                                 seen[slot]->GetName(), map.GetName(), ToString(map.GetCategory()));
                return Core::Err(Core::ErrorCode::DuplicateActionMap);
            }
            seen[slot] = &map;

            for (LogicalAction action : kAllActions)
            {
                const Binding* binding = map.Find(action);
                if (binding && binding->ValueKind() != ValueKindOf(action))
                {
                    Core::Log::Error("ActionMap: '{}' binds {} to '{}' with an incompatible control type",
                                     map.GetName(), ToString(action), binding->Path);
                    return Core::Err(Core::ErrorCode::BindingTypeMismatch);
                }
            }
        }
        return Core::Ok();
    }
}
