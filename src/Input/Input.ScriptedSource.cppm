module;
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <glm/glm.hpp>

export module Input:ScriptedSource;

import :Types;
import :ActionMap;
import :Source;

export namespace Input
{
    // In-memory input source for headless hosts, replays and tests. Values are
    // keyed by Binding::Path; control codes are ignored. Device mutations raise
    // the matching change notification synchronously.
    class ScriptedInputSource final : public IInputSource
    {
    public:
        // Returns the assigned device id. Raises Added.
        uint32_t AddDevice(DeviceCategory category, std::string displayName, bool updatedThisTick = true);

        // Raises Removed. Returns false for an unknown id.
        bool RemoveDevice(uint32_t deviceId);

        // Raises the given kind (ConfigurationChanged or ControlSchemeChanged).
        bool NotifyChanged(uint32_t deviceId, DeviceChangeKind kind = DeviceChangeKind::ConfigurationChanged);

        // Silent: flags are only observed on the next arbitration.
        bool SetUpdated(uint32_t deviceId, bool updatedThisTick);
        void ClearUpdatedFlags();

        void SetButton(std::string_view path, bool pressed);
        void SetVector(std::string_view path, const glm::vec2& value);
        void ResetValues();

        [[nodiscard]] bool HasDeviceChangeCallback() const { return static_cast<bool>(m_Callback); }

        // IInputSource
        [[nodiscard]] std::vector<DeviceInfo> ConnectedDevices() const override { return m_Devices; }
        void SetDeviceChangeCallback(DeviceChangeCallbackFn callback) override;
        [[nodiscard]] bool ReadButton(const Binding& binding) const override;
        [[nodiscard]] glm::vec2 ReadVector(const Binding& binding) const override;

    private:
        [[nodiscard]] DeviceInfo* FindDevice(uint32_t deviceId);
        void Notify(const DeviceInfo& device, DeviceChangeKind kind) const;

        std::vector<DeviceInfo> m_Devices;
        uint32_t m_NextDeviceId = 1;

        std::map<std::string, bool, std::less<>> m_Buttons;
        std::map<std::string, glm::vec2, std::less<>> m_Vectors;

        DeviceChangeCallbackFn m_Callback;
    };
}
