module;
#include <memory>
#include <string>
#include <utility>

export module Cairn:Shader;

import RHI;

export namespace Cairn
{
    // Compiled module; pipelines pick an entry point out of it.
    class Shader
    {
    public:
        Shader(std::unique_ptr<RHI::IShaderModule> gpu, std::string label)
            : m_Gpu(std::move(gpu)), m_Label(std::move(label))
        {
        }

        Shader(const Shader&) = delete;
        Shader& operator=(const Shader&) = delete;

        [[nodiscard]] const RHI::IShaderModule& GetGpu() const { return *m_Gpu; }
        [[nodiscard]] RHI::ShaderStage GetStage() const { return m_Gpu->GetStage(); }
        [[nodiscard]] const std::string& GetLabel() const { return m_Label; }

    private:
        std::unique_ptr<RHI::IShaderModule> m_Gpu;
        std::string m_Label;
    };
}
