module;
#include <cstdint>
#include <utility>
#include <vector>
#define GLFW_INCLUDE_VULKAN
#include <GLFW/glfw3.h>

module Core:Window.Impl;
import :Logging;
import :Window;

namespace Core::Windowing
{
    namespace
    {
        uint32_t s_LiveWindows = 0;

        void OnGlfwError(int error, const char* description)
        {
            Log::Error("GLFW error {}: {}", error, description);
        }

        bool AcquireGlfw()
        {
            if (s_LiveWindows == 0)
            {
                glfwSetErrorCallback(OnGlfwError);
                if (!glfwInit())
                {
                    Log::Error("GLFW initialisation failed");
                    return false;
                }
            }
            ++s_LiveWindows;
            return true;
        }

        void ReleaseGlfw()
        {
            if (s_LiveWindows > 0 && --s_LiveWindows == 0)
                glfwTerminate();
        }

        uint32_t ToPixels(int value) { return value > 0 ? static_cast<uint32_t>(value) : 0u; }
    }

    Window::Window(const WindowProps& props)
    {
        if (!AcquireGlfw()) return;

        glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
        glfwWindowHint(GLFW_RESIZABLE, props.Resizable ? GLFW_TRUE : GLFW_FALSE);

        GLFWwindow* window = glfwCreateWindow(static_cast<int>(props.Width), static_cast<int>(props.Height),
                                              props.Title.c_str(), nullptr, nullptr);
        if (!window)
        {
            Log::Error("Window '{}' could not be created", props.Title);
            ReleaseGlfw();
            return;
        }
        m_Handle = window;

        int width = 0;
        int height = 0;
        glfwGetFramebufferSize(window, &width, &height);
        m_State.FramebufferWidth = ToPixels(width);
        m_State.FramebufferHeight = ToPixels(height);
        Log::Info("Window '{}' created, framebuffer {}x{}", props.Title, m_State.FramebufferWidth,
                  m_State.FramebufferHeight);

        // The callbacks reach the window state through the user pointer;
        // m_State lives as long as the GLFW window.
        glfwSetWindowUserPointer(window, &m_State);

        glfwSetFramebufferSizeCallback(window, [](GLFWwindow* w, int fbWidth, int fbHeight)
        {
            auto* state = static_cast<State*>(glfwGetWindowUserPointer(w));
            state->FramebufferWidth = ToPixels(fbWidth);
            state->FramebufferHeight = ToPixels(fbHeight);
            if (state->Callback)
                state->Callback(WindowResizeEvent{state->FramebufferWidth, state->FramebufferHeight});
        });

        glfwSetWindowCloseCallback(window, [](GLFWwindow* w)
        {
            auto* state = static_cast<State*>(glfwGetWindowUserPointer(w));
            if (state->Callback) state->Callback(WindowCloseEvent{});
        });

        glfwSetKeyCallback(window, [](GLFWwindow* w, int key, int, int action, int)
        {
            if (action == GLFW_REPEAT) return;
            auto* state = static_cast<State*>(glfwGetWindowUserPointer(w));
            if (state->Callback) state->Callback(KeyEvent{key, action == GLFW_PRESS});
        });
    }

    Window::~Window()
    {
        if (!m_Handle) return;
        glfwDestroyWindow(static_cast<GLFWwindow*>(m_Handle));
        m_Handle = nullptr;
        ReleaseGlfw();
    }

    void Window::PollEvents()
    {
        if (m_Handle) glfwPollEvents();
    }

    void Window::WaitEvents()
    {
        if (m_Handle) glfwWaitEvents();
    }

    bool Window::ShouldClose() const
    {
        return !m_Handle || glfwWindowShouldClose(static_cast<GLFWwindow*>(m_Handle));
    }

    void Window::RequestClose()
    {
        if (m_Handle) glfwSetWindowShouldClose(static_cast<GLFWwindow*>(m_Handle), GLFW_TRUE);
    }

    std::vector<const char*> Window::RequiredSurfaceExtensions()
    {
        uint32_t count = 0;
        const char** names = glfwGetRequiredInstanceExtensions(&count);
        if (!names) return {};
        return {names, names + count};
    }

    bool Window::CreateSurface(void* instance, void* surfaceOut) const
    {
        if (!m_Handle) return false;

        const VkResult result = glfwCreateWindowSurface(static_cast<VkInstance>(instance),
                                                        static_cast<GLFWwindow*>(m_Handle), nullptr,
                                                        static_cast<VkSurfaceKHR*>(surfaceOut));
        if (result != VK_SUCCESS)
        {
            Log::Error("Window surface creation failed ({})", static_cast<int>(result));
            return false;
        }
        return true;
    }
}
