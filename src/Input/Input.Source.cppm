module;
#include <functional>
#include <vector>
#include <glm/glm.hpp>

export module Input:Source;

import :Types;
import :ActionMap;

export namespace Input
{
    using DeviceChangeCallbackFn = std::function<void(const DeviceChangeEvent&)>;

    // -------------------------------------------------------------------------
    // IInputSource - boundary to whatever owns the physical devices
    // -------------------------------------------------------------------------
    // The InputSystem polls ConnectedDevices() when it arbitrates and reads one
    // value per bound action each tick. Change notifications are delivered
    // synchronously on the ticking thread through the registered callback.
    // -------------------------------------------------------------------------
    class IInputSource
    {
    public:
        virtual ~IInputSource() = default;

        [[nodiscard]] virtual std::vector<DeviceInfo> ConnectedDevices() const = 0;

        // A single callback slot; an empty function detaches.
        virtual void SetDeviceChangeCallback(DeviceChangeCallbackFn callback) = 0;

        [[nodiscard]] virtual bool ReadButton(const Binding& binding) const = 0;

        // Raw 2D value; deadzone handling is done by the caller.
        [[nodiscard]] virtual glm::vec2 ReadVector(const Binding& binding) const = 0;
    };
}
