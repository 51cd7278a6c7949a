module;
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

export module Cairn:Pipeline;

import RHI;
import :Types;

export namespace Cairn
{
    // Resources a render pipeline draws with. Vertex buffers occupy the first
    // vertex slots, instance buffers follow; bind groups bind at their index.
    struct RenderPipelineBindings
    {
        std::vector<BufferHandle> VertexBuffers;
        std::vector<BufferHandle> InstanceBuffers;
        std::optional<BufferHandle> IndexBuffer;
        std::vector<BindGroupHandle> BindGroups;
    };

    class RenderPipeline
    {
    public:
        RenderPipeline(std::unique_ptr<RHI::IRenderPipeline> gpu, RenderPipelineBindings bindings,
                       RHI::PrimitiveTopology topology, std::string label)
            : m_Gpu(std::move(gpu)), m_Bindings(std::move(bindings)), m_Topology(topology), m_Label(std::move(label))
        {
        }

        RenderPipeline(const RenderPipeline&) = delete;
        RenderPipeline& operator=(const RenderPipeline&) = delete;

        [[nodiscard]] const RHI::IRenderPipeline& GetGpu() const { return *m_Gpu; }
        [[nodiscard]] const RenderPipelineBindings& GetBindings() const { return m_Bindings; }
        [[nodiscard]] RHI::PrimitiveTopology GetTopology() const { return m_Topology; }
        [[nodiscard]] const std::string& GetLabel() const { return m_Label; }

    private:
        std::unique_ptr<RHI::IRenderPipeline> m_Gpu;
        RenderPipelineBindings m_Bindings;
        RHI::PrimitiveTopology m_Topology;
        std::string m_Label;
    };

    class ComputePipeline
    {
    public:
        ComputePipeline(std::unique_ptr<RHI::IComputePipeline> gpu, std::vector<BindGroupHandle> bindGroups,
                        std::array<uint32_t, 3> workGroups, std::string label)
            : m_Gpu(std::move(gpu)), m_BindGroups(std::move(bindGroups)), m_WorkGroups(workGroups),
              m_Label(std::move(label))
        {
        }

        ComputePipeline(const ComputePipeline&) = delete;
        ComputePipeline& operator=(const ComputePipeline&) = delete;

        [[nodiscard]] const RHI::IComputePipeline& GetGpu() const { return *m_Gpu; }
        [[nodiscard]] const std::vector<BindGroupHandle>& GetBindGroups() const { return m_BindGroups; }
        [[nodiscard]] const std::array<uint32_t, 3>& GetWorkGroups() const { return m_WorkGroups; }
        [[nodiscard]] const std::string& GetLabel() const { return m_Label; }

    private:
        std::unique_ptr<RHI::IComputePipeline> m_Gpu;
        std::vector<BindGroupHandle> m_BindGroups;
        std::array<uint32_t, 3> m_WorkGroups;
        std::string m_Label;
    };
}
