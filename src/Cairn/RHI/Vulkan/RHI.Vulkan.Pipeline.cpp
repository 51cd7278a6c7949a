module;
#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI.Vulkan:Pipeline.Impl;
import :Pipeline;
import :Convert;
import :Descriptors;
import :Shader;
import Core;

namespace RHI
{
    namespace
    {
        void DestroyPipeline(VulkanDevice& device, VkPipeline pipeline, VkPipelineLayout layout)
        {
            VkDevice logicalDevice = device.GetLogicalDevice();
            if (pipeline)
            {
                device.DeferDestroy([logicalDevice, pipeline]()
                {
                    vkDestroyPipeline(logicalDevice, pipeline, nullptr);
                });
            }

            if (layout)
            {
                device.DeferDestroy([logicalDevice, layout]()
                {
                    vkDestroyPipelineLayout(logicalDevice, layout, nullptr);
                });
            }
        }

        Core::Expected<VkPipelineLayout> CreateLayout(VulkanDevice& device,
                                                      std::span<const IBindGroupLayout* const> groupLayouts)
        {
            std::vector<VkDescriptorSetLayout> setLayouts;
            setLayouts.reserve(groupLayouts.size());
            for (const IBindGroupLayout* layout : groupLayouts)
                setLayouts.push_back(static_cast<const VulkanBindGroupLayout*>(layout)->GetHandle());

            VkPipelineLayoutCreateInfo pipelineLayoutInfo{};
            pipelineLayoutInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
            pipelineLayoutInfo.setLayoutCount = static_cast<uint32_t>(setLayouts.size());
            pipelineLayoutInfo.pSetLayouts = setLayouts.data();

            VkPipelineLayout layout = VK_NULL_HANDLE;
            if (vkCreatePipelineLayout(device.GetLogicalDevice(), &pipelineLayoutInfo, nullptr, &layout) != VK_SUCCESS)
            {
                Core::Log::Error("Failed to create pipeline layout!");
                return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
            }
            return layout;
        }

        VkStencilOpState ToVkStencilState(const StencilFaceState& face, const StencilState& stencil)
        {
            VkStencilOpState state{};
            state.failOp = Vk::ToVkStencilOp(face.FailOp);
            state.passOp = Vk::ToVkStencilOp(face.PassOp);
            state.depthFailOp = Vk::ToVkStencilOp(face.DepthFailOp);
            state.compareOp = Vk::ToVkCompareOp(face.Compare);
            state.compareMask = stencil.ReadMask;
            state.writeMask = stencil.WriteMask;
            return state;
        }
    }

    VulkanRenderPipeline::~VulkanRenderPipeline()
    {
        DestroyPipeline(m_Device, m_Pipeline, m_Layout);
    }

    VulkanComputePipeline::~VulkanComputePipeline()
    {
        DestroyPipeline(m_Device, m_Pipeline, m_Layout);
    }

    Core::Expected<std::unique_ptr<VulkanRenderPipeline>> VulkanRenderPipeline::Create(
        VulkanDevice& device, uint64_t id, const RenderPipelineDesc& desc)
    {
        if (!desc.Vertex.Module)
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);

        auto layout = CreateLayout(device, desc.BindGroupLayouts);
        if (!layout) return std::unexpected(layout.error());

        // 1. Shaders. Entry point names must outlive vkCreateGraphicsPipelines.
        const std::string vertexEntry(desc.Vertex.EntryPoint);
        const std::string fragmentEntry(desc.Fragment ? desc.Fragment->EntryPoint : std::string_view{});

        std::vector<VkPipelineShaderStageCreateInfo> shaderStages;
        shaderStages.push_back(static_cast<const VulkanShaderModule*>(desc.Vertex.Module)->GetStageInfo(vertexEntry));
        if (desc.Fragment && desc.Fragment->Module)
        {
            shaderStages.push_back(
                static_cast<const VulkanShaderModule*>(desc.Fragment->Module)->GetStageInfo(fragmentEntry));
        }

        // 2. Vertex input, one binding per vertex buffer slot.
        std::vector<VkVertexInputBindingDescription> bindings;
        std::vector<VkVertexInputAttributeDescription> attributes;
        for (uint32_t slot = 0; slot < desc.VertexBuffers.size(); ++slot)
        {
            const VertexBufferLayout& bufferLayout = desc.VertexBuffers[slot];
            bindings.push_back({
                .binding = slot,
                .stride = bufferLayout.Stride,
                .inputRate = bufferLayout.StepMode == VertexStepMode::Instance ? VK_VERTEX_INPUT_RATE_INSTANCE
                                                                               : VK_VERTEX_INPUT_RATE_VERTEX,
            });

            for (const VertexAttribute& attribute : bufferLayout.Attributes)
            {
                attributes.push_back({
                    .location = attribute.ShaderLocation,
                    .binding = slot,
                    .format = Vk::ToVkFormat(attribute.Format),
                    .offset = attribute.Offset,
                });
            }
        }

        VkPipelineVertexInputStateCreateInfo vertexInputInfo{};
        vertexInputInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
        vertexInputInfo.vertexBindingDescriptionCount = static_cast<uint32_t>(bindings.size());
        vertexInputInfo.pVertexBindingDescriptions = bindings.data();
        vertexInputInfo.vertexAttributeDescriptionCount = static_cast<uint32_t>(attributes.size());
        vertexInputInfo.pVertexAttributeDescriptions = attributes.data();

        // 3. Input assembly. Strips with an index format restart on the max index.
        VkPipelineInputAssemblyStateCreateInfo inputAssembly{};
        inputAssembly.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
        inputAssembly.topology = Vk::ToVkTopology(desc.Topology);
        inputAssembly.primitiveRestartEnable = desc.StripIndexFormat.has_value() ? VK_TRUE : VK_FALSE;

        // 4. Viewport & scissor are dynamic.
        VkPipelineViewportStateCreateInfo viewportState{};
        viewportState.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
        viewportState.viewportCount = 1;
        viewportState.scissorCount = 1;

        // 5. Rasterizer
        VkPipelineRasterizationStateCreateInfo rasterizer{};
        rasterizer.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
        rasterizer.depthClampEnable = desc.UnclippedDepth ? VK_TRUE : VK_FALSE;
        rasterizer.rasterizerDiscardEnable = VK_FALSE;
        rasterizer.polygonMode = Vk::ToVkPolygonMode(desc.Polygon);
        rasterizer.lineWidth = 1.0f;
        rasterizer.cullMode = Vk::ToVkCullMode(desc.Cull);
        rasterizer.frontFace = desc.Winding == FrontFace::Ccw ? VK_FRONT_FACE_COUNTER_CLOCKWISE
                                                              : VK_FRONT_FACE_CLOCKWISE;

        // 6. Multisampling
        VkPipelineMultisampleStateCreateInfo multisampling{};
        multisampling.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
        multisampling.sampleShadingEnable = VK_FALSE;
        multisampling.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

        // 7. Color blending, opaque writes to every target.
        std::vector<VkFormat> colorFormats;
        std::vector<VkPipelineColorBlendAttachmentState> blendAttachments;
        for (TextureFormat format : desc.ColorTargets)
        {
            colorFormats.push_back(Vk::ToVkFormat(format));

            VkPipelineColorBlendAttachmentState blend{};
            blend.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
            blend.blendEnable = VK_FALSE;
            blendAttachments.push_back(blend);
        }

        VkPipelineColorBlendStateCreateInfo colorBlending{};
        colorBlending.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
        colorBlending.logicOpEnable = VK_FALSE;
        colorBlending.attachmentCount = static_cast<uint32_t>(blendAttachments.size());
        colorBlending.pAttachments = blendAttachments.data();

        // 8. Dynamic states
        const std::array<VkDynamicState, 2> dynamicStates = {
            VK_DYNAMIC_STATE_VIEWPORT,
            VK_DYNAMIC_STATE_SCISSOR,
        };
        VkPipelineDynamicStateCreateInfo dynamicState{};
        dynamicState.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
        dynamicState.dynamicStateCount = static_cast<uint32_t>(dynamicStates.size());
        dynamicState.pDynamicStates = dynamicStates.data();

        // 9. Depth & stencil
        VkPipelineDepthStencilStateCreateInfo depthStencil{};
        depthStencil.sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO;
        depthStencil.depthBoundsTestEnable = VK_FALSE;

        VkPipelineRenderingCreateInfo renderingInfo{};
        renderingInfo.sType = VK_STRUCTURE_TYPE_PIPELINE_RENDERING_CREATE_INFO;
        renderingInfo.colorAttachmentCount = static_cast<uint32_t>(colorFormats.size());
        renderingInfo.pColorAttachmentFormats = colorFormats.data();

        if (desc.DepthStencil)
        {
            const DepthStencilState& state = *desc.DepthStencil;
            depthStencil.depthTestEnable = VK_TRUE;
            depthStencil.depthWriteEnable = state.DepthWriteEnabled ? VK_TRUE : VK_FALSE;
            depthStencil.depthCompareOp = Vk::ToVkCompareOp(state.DepthCompare);
            depthStencil.stencilTestEnable = state.Stencil.IsEnabled() ? VK_TRUE : VK_FALSE;
            depthStencil.front = ToVkStencilState(state.Stencil.Front, state.Stencil);
            depthStencil.back = ToVkStencilState(state.Stencil.Back, state.Stencil);

            if (state.Bias.IsEnabled())
            {
                rasterizer.depthBiasEnable = VK_TRUE;
                rasterizer.depthBiasConstantFactor = static_cast<float>(state.Bias.Constant);
                rasterizer.depthBiasSlopeFactor = state.Bias.SlopeScale;
                rasterizer.depthBiasClamp = state.Bias.Clamp;
            }

            renderingInfo.depthAttachmentFormat = Vk::ToVkFormat(state.Format);
            if (HasStencil(state.Format))
                renderingInfo.stencilAttachmentFormat = renderingInfo.depthAttachmentFormat;
        }

        // 10. Create
        VkGraphicsPipelineCreateInfo pipelineInfo{};
        pipelineInfo.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
        pipelineInfo.pNext = &renderingInfo;
        pipelineInfo.stageCount = static_cast<uint32_t>(shaderStages.size());
        pipelineInfo.pStages = shaderStages.data();
        pipelineInfo.pVertexInputState = &vertexInputInfo;
        pipelineInfo.pInputAssemblyState = &inputAssembly;
        pipelineInfo.pViewportState = &viewportState;
        pipelineInfo.pRasterizationState = &rasterizer;
        pipelineInfo.pMultisampleState = &multisampling;
        pipelineInfo.pColorBlendState = &colorBlending;
        pipelineInfo.pDynamicState = &dynamicState;
        pipelineInfo.pDepthStencilState = &depthStencil;
        pipelineInfo.layout = *layout;
        pipelineInfo.renderPass = VK_NULL_HANDLE;
        pipelineInfo.subpass = 0;

        VkPipeline pipeline = VK_NULL_HANDLE;
        const VkResult res = vkCreateGraphicsPipelines(device.GetLogicalDevice(), VK_NULL_HANDLE, 1, &pipelineInfo,
                                                       nullptr, &pipeline);
        if (res != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create graphics pipeline '{}' ({})", desc.Label, static_cast<int>(res));
            vkDestroyPipelineLayout(device.GetLogicalDevice(), *layout, nullptr);
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }

        return std::make_unique<VulkanRenderPipeline>(device, id, pipeline, *layout);
    }

    Core::Expected<std::unique_ptr<VulkanComputePipeline>> VulkanComputePipeline::Create(
        VulkanDevice& device, uint64_t id, const ComputePipelineDesc& desc)
    {
        if (!desc.Compute.Module)
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);

        auto layout = CreateLayout(device, desc.BindGroupLayouts);
        if (!layout) return std::unexpected(layout.error());

        const std::string entry(desc.Compute.EntryPoint);

        VkComputePipelineCreateInfo pipelineInfo{};
        pipelineInfo.sType = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
        pipelineInfo.stage = static_cast<const VulkanShaderModule*>(desc.Compute.Module)->GetStageInfo(entry);
        pipelineInfo.layout = *layout;

        VkPipeline pipeline = VK_NULL_HANDLE;
        const VkResult res = vkCreateComputePipelines(device.GetLogicalDevice(), VK_NULL_HANDLE, 1, &pipelineInfo,
                                                      nullptr, &pipeline);
        if (res != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create compute pipeline '{}' ({})", desc.Label, static_cast<int>(res));
            vkDestroyPipelineLayout(device.GetLogicalDevice(), *layout, nullptr);
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }

        return std::make_unique<VulkanComputePipeline>(device, id, pipeline, *layout);
    }
}
