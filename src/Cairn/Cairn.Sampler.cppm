module;
#include <memory>
#include <utility>

export module Cairn:Sampler;

import RHI;

export namespace Cairn
{
    class Sampler
    {
    public:
        Sampler(std::unique_ptr<RHI::ISampler> gpu, RHI::SamplerDesc desc)
            : m_Gpu(std::move(gpu)), m_Desc(std::move(desc))
        {
        }

        Sampler(const Sampler&) = delete;
        Sampler& operator=(const Sampler&) = delete;

        [[nodiscard]] const RHI::ISampler& GetGpu() const { return *m_Gpu; }
        [[nodiscard]] const RHI::SamplerDesc& GetDesc() const { return m_Desc; }

    private:
        std::unique_ptr<RHI::ISampler> m_Gpu;
        RHI::SamplerDesc m_Desc;
    };
}
