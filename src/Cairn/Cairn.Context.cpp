module;
#include <expected>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

module Cairn:Context.Impl;
import :Context;
import Core;
import RHI;

namespace Cairn
{
    Context::Context(std::unique_ptr<RHI::IDevice> device, const ContextConfig& config)
        : m_Device(std::move(device)), m_Config(config), m_Store(*m_Device)
    {
        const RHI::Extent2D extent = m_Store.GetSurfaceExtent();
        Core::Log::Info("Context '{}' created on the {} device, surface {}x{}",
                        m_Config.AppName, m_Device->GetName(), extent.Width, extent.Height);
    }

    Context::~Context()
    {
        // Resources must not be released while the GPU may still read them.
        m_Device->WaitIdle();
    }

    Core::Expected<ShaderHandle> Context::RegisterShader(std::string_view source, RHI::ShaderStage stage,
                                                         std::string_view label)
    {
        if (!m_Config.Compiler)
        {
            Core::Log::Error("RegisterShader(): no shader compiler configured for '{}'", label);
            return std::unexpected(Core::ErrorCode::InvalidState);
        }

        auto spirv = m_Config.Compiler(source, stage);
        if (!spirv)
        {
            Core::Log::Error("RegisterShader(): '{}' failed to compile", label);
            return std::unexpected(spirv.error());
        }

        auto gpu = m_Device->CreateShaderModule(*spirv, stage, label);
        if (!gpu)
        {
            Core::Log::Error("RegisterShader(): '{}' was rejected by the device", label);
            return std::unexpected(gpu.error());
        }

        const ShaderHandle handle = m_Store.GetShaders().Create(std::move(*gpu), std::string(label));
        Core::Log::Debug("Shader '{}' registered ({} words)", label, spirv->size());
        return handle;
    }

    Core::Expected<ShaderHandle> Context::RegisterShaderFile(const std::filesystem::path& path, RHI::ShaderStage stage)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            Core::Log::Error("RegisterShaderFile(): '{}' does not exist", path.string());
            return std::unexpected(Core::ErrorCode::FileNotFound);
        }

        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            Core::Log::Error("RegisterShaderFile(): '{}' could not be opened", path.string());
            return std::unexpected(Core::ErrorCode::FileReadError);
        }

        std::string source{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
        if (file.bad())
        {
            Core::Log::Error("RegisterShaderFile(): reading '{}' failed", path.string());
            return std::unexpected(Core::ErrorCode::FileReadError);
        }

        return RegisterShader(source, stage, path.filename().string());
    }

    Core::Expected<bool> Context::ResizeTexture(TextureHandle handle, RHI::Extent3D extent)
    {
        return m_Store.ResizeTexture(handle, extent);
    }

    Core::Result Context::RecreateBindGroup(BindGroupHandle handle)
    {
        return m_Store.RecreateBindGroup(handle);
    }

    Core::Result Context::Resize(RHI::Extent2D size)
    {
        if (size.Width == 0 || size.Height == 0)
        {
            // Minimised: keep everything, render nothing until the next resize.
            m_Store.SetSurfaceExtent(size);
            Core::Log::Debug("Resize(): surface has no area, rendering paused");
            return Core::Ok();
        }

        if (size != m_Device->GetSurfaceExtent())
        {
            if (auto configured = m_Device->ConfigureSurface(size); !configured)
            {
                Core::Log::Error("Resize(): surface configuration at {}x{} failed", size.Width, size.Height);
                return configured;
            }
            Core::Log::Info("Surface configured at {}x{}", size.Width, size.Height);
        }

        const RHI::Extent2D extent = m_Device->GetSurfaceExtent();
        m_Store.SetSurfaceExtent(extent);

        auto reallocated = m_Store.ResizeSurfaceTextures(extent);
        if (!reallocated) return std::unexpected(reallocated.error());

        return Core::Ok();
    }

    Core::Result Context::Recreate()
    {
        const RHI::Extent2D extent = m_Store.GetSurfaceExtent();
        if (extent.Width == 0 || extent.Height == 0)
            return Core::Ok();

        if (auto configured = m_Device->ConfigureSurface(extent); !configured)
        {
            Core::Log::Error("Recreate(): surface configuration at {}x{} failed", extent.Width, extent.Height);
            return configured;
        }

        Core::Log::Info("Surface reconfigured at {}x{}", extent.Width, extent.Height);
        return Core::Ok();
    }

    Core::Expected<FrameStatus> Context::Render()
    {
        return m_Executor.Execute(m_Store);
    }

    Core::Result Context::ReorderPipelines(RenderPassHandle pass, std::span<const RenderPipelineHandle> pipelines)
    {
        auto found = m_Store.GetRenderPasses().Get(pass);
        if (!found)
        {
            Core::Log::Error("ReorderPipelines(): render pass handle {} is not registered", pass.Index);
            return std::unexpected(found.error());
        }

        for (RenderPipelineHandle pipeline : pipelines)
        {
            if (!m_Store.GetRenderPipelines().Contains(pipeline))
            {
                Core::Log::Error("ReorderPipelines(): pass '{}' references unknown pipeline {}",
                                 (*found)->GetLabel(), pipeline.Index);
                return Core::Err(Core::ErrorCode::ResourceNotFound);
            }
        }

        (*found)->SetPipelines({pipelines.begin(), pipelines.end()});
        return Core::Ok();
    }

    Core::Result Context::ReorderPipelines(ComputePassHandle pass, std::span<const ComputePipelineHandle> pipelines)
    {
        auto found = m_Store.GetComputePasses().Get(pass);
        if (!found)
        {
            Core::Log::Error("ReorderPipelines(): compute pass handle {} is not registered", pass.Index);
            return std::unexpected(found.error());
        }

        for (ComputePipelineHandle pipeline : pipelines)
        {
            if (!m_Store.GetComputePipelines().Contains(pipeline))
            {
                Core::Log::Error("ReorderPipelines(): pass '{}' references unknown pipeline {}",
                                 (*found)->GetLabel(), pipeline.Index);
                return Core::Err(Core::ErrorCode::ResourceNotFound);
            }
        }

        (*found)->SetPipelines({pipelines.begin(), pipelines.end()});
        return Core::Ok();
    }
}
