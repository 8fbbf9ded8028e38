module;
#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

module Input:ScriptedSource.Impl;

import :Types;
import :ActionMap;
import :Source;
import :ScriptedSource;

namespace Input
{
    // -------------------------------------------------------------------------
    // Devices
    // -------------------------------------------------------------------------

    uint32_t ScriptedInputSource::AddDevice(DeviceCategory category, std::string displayName, bool updatedThisTick)
    {
        DeviceInfo device{};
        device.Category = category;
        device.DisplayName = std::move(displayName);
        device.DeviceId = m_NextDeviceId++;
        device.UpdatedThisTick = updatedThisTick;
        m_Devices.push_back(device);

        Notify(device, DeviceChangeKind::Added);
        return device.DeviceId;
    }

    bool ScriptedInputSource::RemoveDevice(uint32_t deviceId)
    {
        auto it = std::ranges::find(m_Devices, deviceId, &DeviceInfo::DeviceId);
        if (it == m_Devices.end())
            return false;

        const DeviceInfo removed = *it;
        m_Devices.erase(it);
        Notify(removed, DeviceChangeKind::Removed);
        return true;
    }

    bool ScriptedInputSource::NotifyChanged(uint32_t deviceId, DeviceChangeKind kind)
    {
        const DeviceInfo* device = FindDevice(deviceId);
        if (!device)
            return false;

        Notify(*device, kind);
        return true;
    }

    bool ScriptedInputSource::SetUpdated(uint32_t deviceId, bool updatedThisTick)
    {
        DeviceInfo* device = FindDevice(deviceId);
        if (!device)
            return false;

        device->UpdatedThisTick = updatedThisTick;
        return true;
    }

    void ScriptedInputSource::ClearUpdatedFlags()
    {
        for (DeviceInfo& device : m_Devices)
            device.UpdatedThisTick = false;
    }

    DeviceInfo* ScriptedInputSource::FindDevice(uint32_t deviceId)
    {
        auto it = std::ranges::find(m_Devices, deviceId, &DeviceInfo::DeviceId);
        return it != m_Devices.end() ? &*it : nullptr;
    }

    void ScriptedInputSource::SetDeviceChangeCallback(DeviceChangeCallbackFn callback)
    {
        m_Callback = std::move(callback);
    }

    void ScriptedInputSource::Notify(const DeviceInfo& device, DeviceChangeKind kind) const
    {
        if (!m_Callback)
            return;

        // The receiver may detach itself while handling the event.
        const DeviceChangeCallbackFn callback = m_Callback;
        callback(DeviceChangeEvent{device, kind});
    }

    // -------------------------------------------------------------------------
    // Values
    // -------------------------------------------------------------------------

    void ScriptedInputSource::SetButton(std::string_view path, bool pressed)
    {
        auto it = m_Buttons.find(path);
        if (it != m_Buttons.end())
            it->second = pressed;
        else
            m_Buttons.emplace(std::string(path), pressed);
    }

    void ScriptedInputSource::SetVector(std::string_view path, const glm::vec2& value)
    {
        auto it = m_Vectors.find(path);
        if (it != m_Vectors.end())
            it->second = value;
        else
            m_Vectors.emplace(std::string(path), value);
    }

    void ScriptedInputSource::ResetValues()
    {
        m_Buttons.clear();
        m_Vectors.clear();
    }

    bool ScriptedInputSource::ReadButton(const Binding& binding) const
    {
        auto it = m_Buttons.find(binding.Path);
        return it != m_Buttons.end() && it->second;
    }

    glm::vec2 ScriptedInputSource::ReadVector(const Binding& binding) const
    {
        auto it = m_Vectors.find(binding.Path);
        return it != m_Vectors.end() ? it->second : glm::vec2(0.0f);
    }
}
