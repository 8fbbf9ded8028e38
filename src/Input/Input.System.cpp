module;
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module Input:System.Impl;

import Core.Error;
import Core.Logging;
import :Types;
import :ActionMap;
import :Arbiter;
import :Events;
import :Router;
import :Source;
import :System;

namespace Input
{
    namespace
    {
        InputSystem* s_ActiveSystem = nullptr;

        // Clears the in-tick flag even if a listener throws.
        struct TickScope
        {
            explicit TickScope(bool& flag) : Flag(flag) { Flag = true; }
            ~TickScope() { Flag = false; }

            TickScope(const TickScope&) = delete;
            TickScope& operator=(const TickScope&) = delete;

            bool& Flag;
        };

        [[nodiscard]] glm::vec2 ApplyDeadzone(const glm::vec2& value, float deadzone)
        {
            if (deadzone > 0.0f && glm::length(value) <= deadzone)
                return glm::vec2(0.0f);
            return value;
        }
    }

    InputSystem::InputSystem() = default;

    InputSystem::~InputSystem()
    {
        Shutdown();
    }

    InputSystem* InputSystem::Active()
    {
        return s_ActiveSystem;
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    Core::Result InputSystem::Initialize(InputConfig config, IInputSource& source)
    {
        if (m_Initialized)
        {
            Core::Log::Error("InputSystem: Initialize called twice without Shutdown");
            return Core::Err(Core::ErrorCode::AlreadyInitialized);
        }

        if (auto valid = ValidateActionMaps(config.Maps); !valid)
        {
            Core::Log::Error("InputSystem: invalid configuration ({})", Core::ErrorCodeToString(valid.error()));
            return valid;
        }

        m_Router.Configure(std::move(config.Maps));
        m_ArbitrateEveryTick = config.ArbitrateEveryTick;
        m_LogDeviceChanges = config.LogDeviceChanges;
        m_Source = &source;
        m_Enabled = true;
        m_PendingChanges.clear();

        const std::vector<DeviceInfo> devices = m_Source->ConnectedDevices();
        RefreshConnectedDevices(devices);
        if (m_LogDeviceChanges)
        {
            Core::Log::Info("Connected Devices:");
            for (size_t i = 0; i < devices.size(); ++i)
            {
                Core::Log::Info("- {} ({}) :: index {}", devices[i].DisplayName, devices[i].DeviceId, i);
            }
        }

        m_Source->SetDeviceChangeCallback([this](const DeviceChangeEvent& event) { OnDeviceChange(event); });

        m_Initialized = true;
        s_ActiveSystem = this;

        Core::Log::Info("InputSystem: initialized with {} action map(s)", m_Router.GetMaps().size());

        DeviceChangeEvent startup{};
        startup.Device.DisplayName = "startup";
        startup.Kind = DeviceChangeKind::ConfigurationChanged;
        Arbitrate(startup);

        return Core::Ok();
    }

    void InputSystem::Shutdown()
    {
        if (!m_Initialized)
            return;

        Core::Log::Info("InputSystem: resetting input events");

        if (m_Source)
            m_Source->SetDeviceChangeCallback({});

        m_Events.Clear();
        m_Router.Disable();
        m_Arbiter.Reset();
        m_PendingChanges.clear();
        m_ConnectedDeviceNames.clear();
        m_Source = nullptr;
        m_Initialized = false;

        if (s_ActiveSystem == this)
            s_ActiveSystem = nullptr;
    }

    void InputSystem::SetEnabled(bool enabled)
    {
        if (m_Enabled == enabled)
            return;

        m_Enabled = enabled;
        m_Router.ResetStates();
        Core::Log::Info("InputSystem: {}", enabled ? "enabled" : "disabled");
    }

    // -------------------------------------------------------------------------
    // Device changes
    // -------------------------------------------------------------------------

    void InputSystem::OnDeviceChange(const DeviceChangeEvent& event)
    {
        if (!m_Initialized)
            return;

        if (m_LogDeviceChanges)
            Core::Log::Info("Current input device: {} ({})", event.Device.DisplayName, ToString(event.Kind));

        if (m_InTick)
        {
            // Never swap maps halfway through an evaluation pass.
            m_PendingChanges.push_back(event);
            return;
        }

        Arbitrate(event);
    }

    void InputSystem::ApplyPendingChanges()
    {
        if (m_PendingChanges.empty())
            return;

        std::vector<DeviceChangeEvent> pending = std::move(m_PendingChanges);
        m_PendingChanges.clear();

        for (const DeviceChangeEvent& event : pending)
        {
            if (!m_Initialized)
                return;
            Arbitrate(event);
        }
    }

    void InputSystem::Arbitrate(const DeviceChangeEvent& event)
    {
        const std::vector<DeviceInfo> devices = m_Source->ConnectedDevices();
        RefreshConnectedDevices(devices);

        const DeviceCategory category = m_Arbiter.SelectCategory(devices, event);
        if (m_Arbiter.HasChanged())
            ApplyCategoryChange(category);
    }

    void InputSystem::PollArbitration()
    {
        const std::vector<DeviceInfo> devices = m_Source->ConnectedDevices();
        RefreshConnectedDevices(devices);

        const DeviceCategory category = m_Arbiter.Poll(devices);
        if (m_Arbiter.HasChanged())
            ApplyCategoryChange(category);
    }

    void InputSystem::ApplyCategoryChange(DeviceCategory category)
    {
        if (category == DeviceCategory::None)
        {
            m_Router.Disable();
            return;
        }

        if (!m_Router.SwitchMap(category))
        {
            Core::Log::Warn("InputSystem: no action map registered for {}, input disabled until the next device change",
                            ToString(category));
            return;
        }

        Core::Log::Info("InputSystem: active action map '{}'", m_Router.GetActiveMap()->GetName());
    }

    void InputSystem::RefreshConnectedDevices(const std::vector<DeviceInfo>& devices)
    {
        m_ConnectedDeviceNames.clear();
        m_ConnectedDeviceNames.reserve(devices.size());
        for (const DeviceInfo& device : devices)
            m_ConnectedDeviceNames.push_back(device.DisplayName);
    }

    // -------------------------------------------------------------------------
    // Tick
    // -------------------------------------------------------------------------

    void InputSystem::Tick()
    {
        if (!m_Initialized)
            return;

        TickScope scope(m_InTick);

        ApplyPendingChanges();
        if (!m_Initialized)
            return;

        if (m_ArbitrateEveryTick)
            PollArbitration();

        if (!m_Enabled || !m_Router.IsActive())
            return;

        m_Router.Tick(Sample());
    }

    ActionSamples InputSystem::Sample() const
    {
        ActionSamples samples{};
        const ResolvedActionMap& resolved = m_Router.GetResolved();

        if (const Binding* binding = resolved.Get(LogicalAction::Move))
            samples.Move = ApplyDeadzone(m_Source->ReadVector(*binding), binding->Deadzone);

        if (const Binding* binding = resolved.Get(LogicalAction::PrimaryInteract))
            samples.PrimaryInteract = m_Source->ReadButton(*binding);

        if (const Binding* binding = resolved.Get(LogicalAction::SecondaryInteract))
            samples.SecondaryInteract = m_Source->ReadButton(*binding);

        if (const Binding* binding = resolved.Get(LogicalAction::MenuButton))
            samples.MenuButton = m_Source->ReadButton(*binding);

        return samples;
    }

    // -------------------------------------------------------------------------
    // Subscriptions
    // -------------------------------------------------------------------------

    Core::Expected<ListenerHandle> InputSystem::Subscribe(EventKind kind, Vec2Callback callback)
    {
        return m_Events.Subscribe(kind, std::move(callback));
    }

    Core::Expected<ListenerHandle> InputSystem::Subscribe(EventKind kind, TriggerCallback callback)
    {
        return m_Events.Subscribe(kind, std::move(callback));
    }

    bool InputSystem::Unsubscribe(ListenerHandle handle)
    {
        return m_Events.Unsubscribe(handle);
    }
}
