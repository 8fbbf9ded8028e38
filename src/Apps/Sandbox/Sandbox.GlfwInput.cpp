module;
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>

module Sandbox.GlfwInput;

import Core.Logging;
import Input;

namespace Sandbox
{
    namespace
    {
        constexpr uint32_t kKeyboardId = 1;
        constexpr uint32_t kPointerId = 2;
        constexpr uint32_t kGamepadIdBase = 100;
        constexpr float kStickActivity = 0.25f;

        // GLFW joystick callbacks carry no user pointer.
        GlfwInputSource* s_Instance = nullptr;

        [[nodiscard]] bool StartsWith(const std::string& path, const char* prefix)
        {
            return path.rfind(prefix, 0) == 0;
        }
    }

    GlfwInputSource::GlfwInputSource(void* windowHandle)
        : m_WindowHandle(windowHandle)
    {
        auto* window = static_cast<GLFWwindow*>(m_WindowHandle);
        glfwSetWindowUserPointer(window, this);

        glfwSetKeyCallback(window, [](GLFWwindow* w, int, int, int action, int)
        {
            if (action == GLFW_PRESS)
                static_cast<GlfwInputSource*>(glfwGetWindowUserPointer(w))->m_KeyActivity = true;
        });

        glfwSetMouseButtonCallback(window, [](GLFWwindow* w, int, int action, int)
        {
            if (action == GLFW_PRESS)
                static_cast<GlfwInputSource*>(glfwGetWindowUserPointer(w))->m_PointerActivity = true;
        });

        s_Instance = this;
        glfwSetJoystickCallback(&GlfwInputSource::OnJoystick);
    }

    GlfwInputSource::~GlfwInputSource()
    {
        glfwSetJoystickCallback(nullptr);
        if (s_Instance == this)
            s_Instance = nullptr;

        auto* window = static_cast<GLFWwindow*>(m_WindowHandle);
        glfwSetKeyCallback(window, nullptr);
        glfwSetMouseButtonCallback(window, nullptr);
        glfwSetWindowUserPointer(window, nullptr);
    }

    // -------------------------------------------------------------------------
    // Devices
    // -------------------------------------------------------------------------

    void GlfwInputSource::Poll()
    {
        if (std::exchange(m_KeyActivity, false))
            MarkUsed(Input::DeviceCategory::Keyboard);

        if (std::exchange(m_PointerActivity, false))
            MarkUsed(Input::DeviceCategory::Touch);

        const int jid = FirstGamepad();
        GLFWgamepadstate state;
        if (jid >= 0 && glfwGetGamepadState(jid, &state))
        {
            bool active = false;
            for (unsigned char button : state.buttons)
                active |= button == GLFW_PRESS;
            active |= std::abs(state.axes[GLFW_GAMEPAD_AXIS_LEFT_X]) > kStickActivity;
            active |= std::abs(state.axes[GLFW_GAMEPAD_AXIS_LEFT_Y]) > kStickActivity;
            if (active)
                MarkUsed(Input::DeviceCategory::Gamepad);
        }
    }

    void GlfwInputSource::MarkUsed(Input::DeviceCategory category)
    {
        if (m_LastUsed == category)
            return;

        m_LastUsed = category;
        Core::Log::Debug("GlfwInputSource: last used category is now {}", Input::ToString(category));
    }

    std::vector<Input::DeviceInfo> GlfwInputSource::ConnectedDevices() const
    {
        std::vector<Input::DeviceInfo> devices;

        Input::DeviceInfo keyboard{};
        keyboard.Category = Input::DeviceCategory::Keyboard;
        keyboard.DisplayName = "Keyboard";
        keyboard.DeviceId = kKeyboardId;
        keyboard.UpdatedThisTick = m_LastUsed == Input::DeviceCategory::Keyboard;
        devices.push_back(keyboard);

        Input::DeviceInfo pointer{};
        pointer.Category = Input::DeviceCategory::Touch;
        pointer.DisplayName = "Mouse";
        pointer.DeviceId = kPointerId;
        pointer.UpdatedThisTick = m_LastUsed == Input::DeviceCategory::Touch;
        devices.push_back(pointer);

        for (int jid = GLFW_JOYSTICK_1; jid <= GLFW_JOYSTICK_LAST; ++jid)
        {
            if (glfwJoystickIsGamepad(jid))
                devices.push_back(MakeGamepadDevice(jid));
        }
        return devices;
    }

    Input::DeviceInfo GlfwInputSource::MakeGamepadDevice(int jid) const
    {
        Input::DeviceInfo device{};
        device.Category = Input::DeviceCategory::Gamepad;
        const char* name = glfwGetGamepadName(jid);
        device.DisplayName = name ? name : "Gamepad";
        device.DeviceId = kGamepadIdBase + static_cast<uint32_t>(jid);
        device.UpdatedThisTick = m_LastUsed == Input::DeviceCategory::Gamepad;
        return device;
    }

    int GlfwInputSource::FirstGamepad() const
    {
        for (int jid = GLFW_JOYSTICK_1; jid <= GLFW_JOYSTICK_LAST; ++jid)
        {
            if (glfwJoystickIsGamepad(jid))
                return jid;
        }
        return -1;
    }

    void GlfwInputSource::SetDeviceChangeCallback(Input::DeviceChangeCallbackFn callback)
    {
        m_Callback = std::move(callback);
    }

    void GlfwInputSource::Notify(const Input::DeviceInfo& device, Input::DeviceChangeKind kind) const
    {
        if (!m_Callback)
            return;

        const Input::DeviceChangeCallbackFn callback = m_Callback;
        callback(Input::DeviceChangeEvent{device, kind});
    }

    void GlfwInputSource::OnJoystick(int jid, int event)
    {
        if (!s_Instance)
            return;

        if (event == GLFW_CONNECTED)
        {
            if (!glfwJoystickIsGamepad(jid))
            {
                Core::Log::Warn("GlfwInputSource: joystick {} has no gamepad mapping, ignored", jid);
                return;
            }
            // A freshly connected pad takes over, like any other input from it.
            s_Instance->MarkUsed(Input::DeviceCategory::Gamepad);
            s_Instance->Notify(s_Instance->MakeGamepadDevice(jid), Input::DeviceChangeKind::Added);
        }
        else if (event == GLFW_DISCONNECTED)
        {
            Input::DeviceInfo device{};
            device.Category = Input::DeviceCategory::Gamepad;
            device.DisplayName = "Gamepad";
            device.DeviceId = kGamepadIdBase + static_cast<uint32_t>(jid);

            if (s_Instance->m_LastUsed == Input::DeviceCategory::Gamepad && s_Instance->FirstGamepad() < 0)
                s_Instance->m_LastUsed = Input::DeviceCategory::Keyboard;
            s_Instance->Notify(device, Input::DeviceChangeKind::Removed);
        }
    }

    // -------------------------------------------------------------------------
    // Values
    // -------------------------------------------------------------------------

    bool GlfwInputSource::ReadButton(const Input::Binding& binding) const
    {
        const int code = binding.Controls[0];
        if (code == Input::kUnboundControl)
            return false;

        auto* window = static_cast<GLFWwindow*>(m_WindowHandle);

        if (StartsWith(binding.Path, "Gamepad/"))
        {
            GLFWgamepadstate state;
            const int jid = FirstGamepad();
            if (jid < 0 || !glfwGetGamepadState(jid, &state) || code > GLFW_GAMEPAD_BUTTON_LAST)
                return false;
            return state.buttons[code] == GLFW_PRESS;
        }

        if (StartsWith(binding.Path, "Touch/"))
            return glfwGetMouseButton(window, code) == GLFW_PRESS;

        const int state = glfwGetKey(window, code);
        return state == GLFW_PRESS || state == GLFW_REPEAT;
    }

    glm::vec2 GlfwInputSource::ReadVector(const Input::Binding& binding) const
    {
        if (binding.Type == Input::ControlType::Axis2D)
        {
            GLFWgamepadstate state;
            const int jid = FirstGamepad();
            if (jid < 0 || !glfwGetGamepadState(jid, &state))
                return glm::vec2(0.0f);

            const int x = binding.Controls[0];
            const int y = binding.Controls[1];
            if (x < 0 || y < 0 || x > GLFW_GAMEPAD_AXIS_LAST || y > GLFW_GAMEPAD_AXIS_LAST)
                return glm::vec2(0.0f);

            // GLFW reports stick-down as positive Y.
            return {state.axes[x], -state.axes[y]};
        }

        if (binding.Type == Input::ControlType::Composite2D)
        {
            auto* window = static_cast<GLFWwindow*>(m_WindowHandle);
            const auto down = [window](int code)
            {
                return code != Input::kUnboundControl && glfwGetKey(window, code) != GLFW_RELEASE ? 1.0f : 0.0f;
            };

            glm::vec2 value{down(binding.Controls[3]) - down(binding.Controls[2]),
                            down(binding.Controls[0]) - down(binding.Controls[1])};
            return glm::length(value) > 1.0f ? glm::normalize(value) : value;
        }

        return glm::vec2(0.0f);
    }
}
