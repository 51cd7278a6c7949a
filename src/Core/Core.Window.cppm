module;
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

export module Core:Window;

export namespace Core::Windowing
{
    struct WindowProps
    {
        std::string Title = "Cairn";
        uint32_t Width = 1280;
        uint32_t Height = 720;
        bool Resizable = true;
    };

    struct WindowCloseEvent
    {
    };

    // Framebuffer size in pixels. 0x0 while minimised.
    struct WindowResizeEvent
    {
        uint32_t Width = 0;
        uint32_t Height = 0;
    };

    struct KeyEvent
    {
        int KeyCode = 0;
        bool IsPressed = false;
    };

    using Event = std::variant<
        WindowCloseEvent,
        WindowResizeEvent,
        KeyEvent
    >;

    using EventCallbackFn = std::function<void(const Event&)>;

    // GLFW window without a client API; presentation goes through a Vulkan
    // surface created on request. GLFW stays initialised while any window
    // is alive.
    class Window
    {
    public:
        explicit Window(const WindowProps& props);
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;

        [[nodiscard]] bool IsValid() const { return m_Handle != nullptr; }

        // Dispatches pending events without blocking.
        void PollEvents();
        // Blocks until at least one event arrives. Used while minimised.
        void WaitEvents();

        [[nodiscard]] bool ShouldClose() const;
        void RequestClose();

        [[nodiscard]] uint32_t GetFramebufferWidth() const { return m_State.FramebufferWidth; }
        [[nodiscard]] uint32_t GetFramebufferHeight() const { return m_State.FramebufferHeight; }
        [[nodiscard]] bool IsMinimized() const { return m_State.FramebufferWidth == 0 || m_State.FramebufferHeight == 0; }

        void SetEventCallback(EventCallbackFn callback) { m_State.Callback = std::move(callback); }

        // Instance extensions a Vulkan instance needs to present to this
        // kind of window. Empty when GLFW found no Vulkan loader.
        [[nodiscard]] static std::vector<const char*> RequiredSurfaceExtensions();

        // void* keeps vulkan.h out of the interface.
        // instance is a VkInstance, surfaceOut is VkSurfaceKHR*
        [[nodiscard]] bool CreateSurface(void* instance, void* surfaceOut) const;

    private:
        struct State
        {
            uint32_t FramebufferWidth = 0;
            uint32_t FramebufferHeight = 0;
            EventCallbackFn Callback;
        };

        void* m_Handle = nullptr; // GLFWwindow*
        State m_State;
    };
}
