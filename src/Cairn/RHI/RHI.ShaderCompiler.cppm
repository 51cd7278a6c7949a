module;
#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

export module RHI:ShaderCompiler;

import Core;
import :Types;

export namespace RHI
{
    // Text in, SPIR-V words out. Anything callable with this shape can stand in
    // for the default compiler.
    using ShaderCompiler = std::function<Core::Expected<std::vector<uint32_t>>(std::string_view source, ShaderStage stage)>;

    // In-process GLSL to SPIR-V (Vulkan 1.3 target) through shaderc.
    // Diagnostics are logged at Error level.
    [[nodiscard]] Core::Expected<std::vector<uint32_t>> CompileGlsl(std::string_view source, ShaderStage stage);
}
