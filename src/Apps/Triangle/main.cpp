#include <array>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>
#include <glm/glm.hpp>

import Core;
import RHI;
import RHI.Vulkan;
import Cairn;

namespace
{
    constexpr const char* kVertexShader = R"(
#version 450
layout(location = 0) in vec2 inPosition;
layout(location = 0) out vec3 outColor;

const vec3 colors[3] = vec3[](vec3(1.0, 0.2, 0.2), vec3(0.2, 1.0, 0.2), vec3(0.2, 0.2, 1.0));

void main()
{
    gl_Position = vec4(inPosition, 0.0, 1.0);
    outColor = colors[gl_VertexIndex % 3];
}
)";

    constexpr const char* kFragmentShader = R"(
#version 450
layout(location = 0) in vec3 inColor;
layout(location = 0) out vec4 outColor;

void main()
{
    outColor = vec4(inColor, 1.0);
}
)";
}

int main()
{
    Core::Windowing::Window window({.Title = "Cairn Triangle", .Width = 1280, .Height = 720});
    if (!window.IsValid())
        return EXIT_FAILURE;

    auto device = RHI::CreateVulkanDevice(window, {.AppName = "Cairn Triangle"});
    if (!device)
    {
        Core::Log::Error("No Vulkan device: {}", Core::ErrorCodeToString(device.error()));
        return EXIT_FAILURE;
    }

    Cairn::Context ctx(std::move(*device), {.AppName = "Cairn Triangle"});

    auto vs = ctx.RegisterShader(kVertexShader, RHI::ShaderStage::Vertex, "triangle.vert");
    auto fs = ctx.RegisterShader(kFragmentShader, RHI::ShaderStage::Fragment, "triangle.frag");
    if (!vs || !fs)
        return EXIT_FAILURE;

    const std::array<glm::vec2, 3> points = {
        glm::vec2{0.0f, -0.5f},
        glm::vec2{0.5f, 0.5f},
        glm::vec2{-0.5f, 0.5f},
    };

    auto vertices = ctx.CreateBuffer<glm::vec2>()
        .Vertex()
        .Label("Triangle Vertices")
        .BuildInit(points);
    if (!vertices)
        return EXIT_FAILURE;

    auto pipeline = ctx.CreateRenderPipeline()
        .VertexShader(*vs)
        .FragmentShader(*fs)
        .Topology(RHI::PrimitiveTopology::TriangleList)
        .FrontFace(RHI::FrontFace::Ccw)
        .AddVertexBuffer(*vertices)
        .Label("Triangle")
        .Build();
    if (!pipeline)
        return EXIT_FAILURE;

    auto pass = ctx.CreateRenderPass()
        .AddColorAttachment(Cairn::SurfaceTexture, RHI::ClearColor{0.05f, 0.05f, 0.08f, 1.0f})
        .AddPipeline(*pipeline)
        .Label("Main")
        .Build();
    if (!pass)
        return EXIT_FAILURE;

    bool running = true;
    window.SetEventCallback([&](const Core::Windowing::Event& event)
    {
        std::visit([&](auto&& e)
        {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, Core::Windowing::WindowCloseEvent>)
            {
                running = false;
            }
            else if constexpr (std::is_same_v<T, Core::Windowing::WindowResizeEvent>)
            {
                const RHI::Extent2D size{e.Width, e.Height};
                if (auto resized = ctx.Resize(size); !resized)
                    Core::Log::Error("Resize failed: {}", Core::ErrorCodeToString(resized.error()));
            }
        }, event);
    });

    while (running && !window.ShouldClose())
    {
        if (window.IsMinimized())
        {
            window.WaitEvents();
            continue;
        }
        window.PollEvents();

        auto frame = ctx.Render();
        if (!frame)
        {
            Core::Log::Error("Frame failed: {}", Core::ErrorCodeToString(frame.error()));
            break;
        }
    }

    return EXIT_SUCCESS;
}
