module;
#include <cstddef>
#include <string>
#include <vector>

export module Input:System;

import Core.Error;
import :Types;
import :ActionMap;
import :Arbiter;
import :Events;
import :Router;
import :Source;

export namespace Input
{
    struct InputConfig
    {
        // One map per device category (None excluded). Must not be empty.
        std::vector<ActionMap> Maps;

        // Re-run arbitration at the start of every tick, not only on device
        // change notifications.
        bool ArbitrateEveryTick = false;

        // Log the connected device list and each notified device by name.
        bool LogDeviceChanges = true;
    };

    // -------------------------------------------------------------------------
    // InputSystem - the host-owned input core
    // -------------------------------------------------------------------------
    // Lifecycle: construct, Initialize(config, source), Tick() once per polling
    // cycle, Shutdown() (or destroy). The source must outlive the Initialize /
    // Shutdown window.
    //
    // PRECONDITION: single-threaded use. Tick, OnDeviceChange, subscription and
    // lifecycle calls must all be serialized by the host; nothing here locks.
    //
    // Device changes that arrive while Tick is running (e.g. raised from a
    // listener) are queued and applied at the start of the next Tick, so one
    // tick never evaluates actions against two different maps.
    // -------------------------------------------------------------------------
    class InputSystem
    {
    public:
        InputSystem();
        ~InputSystem();

        InputSystem(const InputSystem&) = delete;
        InputSystem& operator=(const InputSystem&) = delete;

        // Validates the maps, attaches to the source and runs the initial
        // arbitration. Fails without side effects on any configuration error.
        [[nodiscard]] Core::Result Initialize(InputConfig config, IInputSource& source);

        // Detaches from the source, drops all listeners and maps. Tick becomes
        // a no-op until the next Initialize. Safe to call repeatedly.
        void Shutdown();

        [[nodiscard]] bool IsInitialized() const { return m_Initialized; }

        void OnDeviceChange(const DeviceChangeEvent& event);

        void Tick();

        // Suspend/resume action processing. Both directions drop held state
        // silently; device changes are still tracked while suspended. Called
        // from a listener, the rest of the current tick's evaluation is skipped.
        void SetEnabled(bool enabled);
        [[nodiscard]] bool IsEnabled() const { return m_Enabled; }

        [[nodiscard]] DeviceCategory CurrentCategory() const { return m_Arbiter.Current(); }
        [[nodiscard]] bool IsRouterActive() const { return m_Router.IsActive(); }
        [[nodiscard]] bool IsTicking() const { return m_InTick; }
        [[nodiscard]] size_t GetPendingChangeCount() const { return m_PendingChanges.size(); }
        [[nodiscard]] const std::vector<std::string>& GetConnectedDeviceNames() const { return m_ConnectedDeviceNames; }

        [[nodiscard]] Core::Expected<ListenerHandle> Subscribe(EventKind kind, Vec2Callback callback);
        [[nodiscard]] Core::Expected<ListenerHandle> Subscribe(EventKind kind, TriggerCallback callback);
        bool Unsubscribe(ListenerHandle handle);

        [[nodiscard]] EventRegistry& GetEvents() { return m_Events; }
        [[nodiscard]] const EventRegistry& GetEvents() const { return m_Events; }
        [[nodiscard]] const ActionRouter& GetRouter() const { return m_Router; }
        [[nodiscard]] const DeviceArbiter& GetArbiter() const { return m_Arbiter; }

        // The most recently initialized system, or nullptr. Cleared by its
        // Shutdown. Never creates an instance.
        [[nodiscard]] static InputSystem* Active();

    private:
        void Arbitrate(const DeviceChangeEvent& event);
        void PollArbitration();
        void ApplyCategoryChange(DeviceCategory category);
        void ApplyPendingChanges();
        void RefreshConnectedDevices(const std::vector<DeviceInfo>& devices);
        [[nodiscard]] ActionSamples Sample() const;

        EventRegistry m_Events;
        ActionRouter m_Router{m_Events};
        DeviceArbiter m_Arbiter;

        IInputSource* m_Source = nullptr;
        bool m_ArbitrateEveryTick = false;
        bool m_LogDeviceChanges = true;

        bool m_Initialized = false;
        bool m_Enabled = true;
        bool m_InTick = false;

        std::vector<DeviceChangeEvent> m_PendingChanges;
        std::vector<std::string> m_ConnectedDeviceNames;
    };
}
