module;
#include <cstdint>
#include <vector>
#include <glm/glm.hpp>

export module Sandbox.GlfwInput;

import Input;

export namespace Sandbox
{
    // Control codes the sandbox maps use. Keyboard codes are GLFW key codes,
    // gamepad codes are GLFW gamepad button / axis indices.
    namespace Key
    {
        constexpr int W = 87;
        constexpr int A = 65;
        constexpr int S = 83;
        constexpr int D = 68;
        constexpr int E = 69;
        constexpr int Space = 32;
        constexpr int Escape = 256;
    }

    namespace Pad
    {
        constexpr int ButtonA = 0;
        constexpr int ButtonB = 1;
        constexpr int ButtonStart = 7;
        constexpr int LeftX = 0;
        constexpr int LeftY = 1;
    }

    namespace Pointer
    {
        constexpr int Left = 0;
        constexpr int Right = 1;
    }

    // -------------------------------------------------------------------------
    // GlfwInputSource - keyboard, mouse (as Touch) and gamepads from one window
    // -------------------------------------------------------------------------
    // The most recently used device category keeps UpdatedThisTick set until a
    // device of another category produces input, so per-tick arbitration does
    // not fall back to None while the user is idle.
    //
    // Bindings are routed by path prefix: "Gamepad/", "Touch/", otherwise the
    // keyboard.
    // -------------------------------------------------------------------------
    class GlfwInputSource final : public Input::IInputSource
    {
    public:
        explicit GlfwInputSource(void* windowHandle); // GLFWwindow*
        ~GlfwInputSource() override;

        GlfwInputSource(const GlfwInputSource&) = delete;
        GlfwInputSource& operator=(const GlfwInputSource&) = delete;

        // Call once per frame after glfwPollEvents.
        void Poll();

        // IInputSource
        [[nodiscard]] std::vector<Input::DeviceInfo> ConnectedDevices() const override;
        void SetDeviceChangeCallback(Input::DeviceChangeCallbackFn callback) override;
        [[nodiscard]] bool ReadButton(const Input::Binding& binding) const override;
        [[nodiscard]] glm::vec2 ReadVector(const Input::Binding& binding) const override;

    private:
        static void OnJoystick(int jid, int event);

        void MarkUsed(Input::DeviceCategory category);
        void Notify(const Input::DeviceInfo& device, Input::DeviceChangeKind kind) const;
        [[nodiscard]] Input::DeviceInfo MakeGamepadDevice(int jid) const;
        [[nodiscard]] int FirstGamepad() const;

        void* m_WindowHandle = nullptr;
        Input::DeviceCategory m_LastUsed = Input::DeviceCategory::None;
        bool m_KeyActivity = false;
        bool m_PointerActivity = false;
        Input::DeviceChangeCallbackFn m_Callback;
    };
}
