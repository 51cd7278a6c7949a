module;
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <shaderc/shaderc.hpp>

module RHI:ShaderCompiler.Impl;
import :ShaderCompiler;
import Core;

namespace RHI
{
    namespace
    {
        shaderc_shader_kind ToShadercKind(ShaderStage stage)
        {
            switch (stage)
            {
            case ShaderStage::Vertex:   return shaderc_vertex_shader;
            case ShaderStage::Fragment: return shaderc_fragment_shader;
            case ShaderStage::Compute:  return shaderc_compute_shader;
            }
            return shaderc_vertex_shader;
        }

        constexpr const char* StageName(ShaderStage stage)
        {
            switch (stage)
            {
            case ShaderStage::Vertex:   return "vertex";
            case ShaderStage::Fragment: return "fragment";
            case ShaderStage::Compute:  return "compute";
            }
            return "vertex";
        }
    }

    Core::Expected<std::vector<uint32_t>> CompileGlsl(std::string_view source, ShaderStage stage)
    {
        shaderc::Compiler compiler;
        if (!compiler.IsValid())
        {
            Core::Log::Error("CompileGlsl: shaderc compiler could not be initialised");
            return std::unexpected(Core::ErrorCode::InvalidState);
        }

        shaderc::CompileOptions options;
        options.SetTargetEnvironment(shaderc_target_env_vulkan, shaderc_env_version_vulkan_1_3);
        options.SetSourceLanguage(shaderc_source_language_glsl);
        options.SetOptimizationLevel(shaderc_optimization_level_performance);

        const shaderc::SpvCompilationResult result = compiler.CompileGlslToSpv(
            source.data(), source.size(), ToShadercKind(stage), StageName(stage), "main", options);

        if (result.GetCompilationStatus() != shaderc_compilation_status_success)
        {
            Core::Log::Error("CompileGlsl: {} shader failed ({} error(s), {} warning(s))\n{}",
                             StageName(stage), result.GetNumErrors(), result.GetNumWarnings(),
                             result.GetErrorMessage());
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        }

        if (result.GetNumWarnings() > 0)
            Core::Log::Warn("CompileGlsl: {} shader compiled with warnings\n{}", StageName(stage),
                            result.GetErrorMessage());

        std::vector<uint32_t> words(result.cbegin(), result.cend());
        if (words.empty())
        {
            Core::Log::Error("CompileGlsl: shaderc returned an empty {} module", StageName(stage));
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        }
        return words;
    }
}
