module;
#include <algorithm>
#include <optional>
#include <span>

module Input:Arbiter.Impl;

import Core.Logging;
import :Types;
import :Arbiter;

namespace Input
{
    DeviceCategory DeviceArbiter::Choose(std::span<const DeviceInfo> connectedDevices)
    {
        for (DeviceCategory category : kArbitrationPriority)
        {
            const bool active = std::ranges::any_of(connectedDevices, [category](const DeviceInfo& device) {
                return device.Category == category && device.UpdatedThisTick;
            });
            if (active)
                return category;
        }
        return DeviceCategory::None;
    }

    DeviceCategory DeviceArbiter::SelectCategory(std::span<const DeviceInfo> connectedDevices,
                                                 const DeviceChangeEvent& changeEvent)
    {
        const DeviceCategory previous = m_Current;
        m_Current = Choose(connectedDevices);
        m_Changed = m_Current != previous;
        m_LastChange = changeEvent;

        if (m_Changed)
        {
            Core::Log::Info("DeviceArbiter: {} '{}' -> active category {} (was {})",
                            ToString(changeEvent.Kind), changeEvent.Device.DisplayName,
                            ToString(m_Current), ToString(previous));
        }
        else
        {
            Core::Log::Debug("DeviceArbiter: {} '{}', category stays {}",
                             ToString(changeEvent.Kind), changeEvent.Device.DisplayName, ToString(m_Current));
        }
        return m_Current;
    }

    DeviceCategory DeviceArbiter::Poll(std::span<const DeviceInfo> connectedDevices)
    {
        const DeviceCategory previous = m_Current;
        m_Current = Choose(connectedDevices);
        m_Changed = m_Current != previous;

        if (m_Changed)
        {
            Core::Log::Info("DeviceArbiter: device activity -> active category {} (was {})",
                            ToString(m_Current), ToString(previous));
        }
        return m_Current;
    }

    void DeviceArbiter::Reset()
    {
        m_Current = DeviceCategory::None;
        m_Changed = false;
        m_LastChange.reset();
    }
}
