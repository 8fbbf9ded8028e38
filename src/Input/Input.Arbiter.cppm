module;
#include <array>
#include <optional>
#include <span>

export module Input:Arbiter;

import :Types;

export namespace Input
{
    // Fixed arbitration order. When several devices report activity in the same
    // tick, the earliest category in this list wins.
    inline constexpr std::array<DeviceCategory, 3> kArbitrationPriority{
        DeviceCategory::Keyboard,
        DeviceCategory::Gamepad,
        DeviceCategory::Touch
    };

    // -------------------------------------------------------------------------
    // DeviceArbiter - picks the single active device category
    // -------------------------------------------------------------------------
    // Stateless policy plus a record of the last decision. Selecting None is a
    // valid steady state (nothing connected or nothing touched), never an error.
    // -------------------------------------------------------------------------
    class DeviceArbiter
    {
    public:
        // Pure policy: first category in kArbitrationPriority that has a
        // connected device flagged UpdatedThisTick, otherwise None.
        [[nodiscard]] static DeviceCategory Choose(std::span<const DeviceInfo> connectedDevices);

        // Applies the policy, records the decision and the triggering event.
        DeviceCategory SelectCategory(std::span<const DeviceInfo> connectedDevices,
                                      const DeviceChangeEvent& changeEvent);

        // Applies the policy without a notification (per-tick polling). Logs only
        // when the selection changes and leaves LastChange() untouched.
        DeviceCategory Poll(std::span<const DeviceInfo> connectedDevices);

        [[nodiscard]] DeviceCategory Current() const { return m_Current; }

        // True if the most recent SelectCategory or Poll call changed Current().
        [[nodiscard]] bool HasChanged() const { return m_Changed; }

        [[nodiscard]] const std::optional<DeviceChangeEvent>& LastChange() const { return m_LastChange; }

        // Forget the current selection (shutdown). Does not count as a change.
        void Reset();

    private:
        DeviceCategory m_Current = DeviceCategory::None;
        bool m_Changed = false;
        std::optional<DeviceChangeEvent> m_LastChange;
    };
}
