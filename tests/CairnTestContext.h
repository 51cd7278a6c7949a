#pragma once

// =============================================================================
// Shared fixture for Cairn test suites: a Context over a NullDevice with a
// fake shader compiler, plus helpers to inspect the last submitted frame.
//
// Usage: #include "CairnTestContext.h" AFTER `import Core; import RHI;
// import Cairn;` in each test file. Everything here is inline.
// =============================================================================

#include <cstdint>
#include <expected>
#include <memory>
#include <string_view>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

// Any source containing "#error" fails; everything else yields a tiny module
// tagged with the requested stage.
inline Core::Expected<std::vector<uint32_t>> FakeCompile(std::string_view source, RHI::ShaderStage stage)
{
    if (source.find("#error") != std::string_view::npos)
        return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);

    return std::vector<uint32_t>{0x07230203u, static_cast<uint32_t>(stage), static_cast<uint32_t>(source.size())};
}

class CairnTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        CreateContext({});
    }

    void CreateContext(const RHI::NullDeviceConfig& config)
    {
        m_Ctx.reset();
        auto device = std::make_unique<RHI::NullDevice>(config);
        m_Null = device.get();
        m_Ctx = std::make_unique<Cairn::Context>(std::move(device),
                                                 Cairn::ContextConfig{.AppName = "CairnTests", .Compiler = FakeCompile});
    }

    [[nodiscard]] Cairn::Context& Ctx() { return *m_Ctx; }
    [[nodiscard]] RHI::NullDevice& Device() { return *m_Null; }
    [[nodiscard]] Cairn::ResourceStore& Store() { return m_Ctx->GetResources(); }

    [[nodiscard]] Cairn::ShaderHandle Shader(RHI::ShaderStage stage)
    {
        auto shader = m_Ctx->RegisterShader("void main() {}", stage, "test");
        EXPECT_TRUE(shader.has_value());
        return shader.value_or(Cairn::ShaderHandle{});
    }

    [[nodiscard]] const Cairn::Buffer& GetBuffer(Cairn::BufferHandle handle)
    {
        return *Store().GetBuffers().Get(handle).value();
    }

    [[nodiscard]] const Cairn::Texture& GetTexture(Cairn::TextureHandle handle)
    {
        return *Store().GetTextures().Get(handle).value();
    }

    [[nodiscard]] const Cairn::BindGroup& GetBindGroup(Cairn::BindGroupHandle handle)
    {
        return *Store().GetBindGroups().Get(handle).value();
    }

    [[nodiscard]] const RHI::NullRenderPipeline& GetNullPipeline(Cairn::RenderPipelineHandle handle)
    {
        return static_cast<const RHI::NullRenderPipeline&>(Store().GetRenderPipelines().Get(handle).value()->GetGpu());
    }

    // (binding, resource id) pairs of the bind group's current instance.
    [[nodiscard]] std::vector<RHI::NullBinding> BoundResources(Cairn::BindGroupHandle handle)
    {
        const auto* instance = static_cast<const RHI::NullBindGroup*>(GetBindGroup(handle).GetInstance());
        return instance ? instance->GetBindings() : std::vector<RHI::NullBinding>{};
    }

    template<typename T>
    [[nodiscard]] std::vector<T> Commands() const
    {
        std::vector<T> out;
        for (const RHI::RecordedCommand& cmd : m_Null->GetLastSubmittedCommands())
        {
            if (const T* typed = std::get_if<T>(&cmd))
                out.push_back(*typed);
        }
        return out;
    }

    std::unique_ptr<Cairn::Context> m_Ctx;
    RHI::NullDevice* m_Null = nullptr;
};
