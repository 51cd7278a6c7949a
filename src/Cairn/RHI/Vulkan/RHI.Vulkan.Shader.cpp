module;
#include <cstdint>
#include <span>
#include <string>
#include "RHI.Vulkan.hpp"

module RHI.Vulkan:Shader.Impl;
import :Shader;
import :Convert;
import Core;

namespace RHI
{
    VulkanShaderModule::VulkanShaderModule(VulkanDevice& device, uint64_t id, std::span<const uint32_t> spirv,
                                           ShaderStage stage)
        : m_Device(device), m_Id(id), m_Stage(stage)
    {
        VkShaderModuleCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
        createInfo.codeSize = spirv.size_bytes();
        createInfo.pCode = spirv.data();

        if (vkCreateShaderModule(m_Device.GetLogicalDevice(), &createInfo, nullptr, &m_Module) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create shader module ({} words)", spirv.size());
            m_Module = VK_NULL_HANDLE;
        }
    }

    VulkanShaderModule::~VulkanShaderModule()
    {
        // Only needed while pipelines are created; nothing in flight uses it.
        if (m_Module) vkDestroyShaderModule(m_Device.GetLogicalDevice(), m_Module, nullptr);
    }

    VkPipelineShaderStageCreateInfo VulkanShaderModule::GetStageInfo(const std::string& entryPoint) const
    {
        VkPipelineShaderStageCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        info.stage = Vk::ToVkShaderStage(m_Stage);
        info.module = m_Module;
        info.pName = entryPoint.c_str();
        return info;
    }
}
