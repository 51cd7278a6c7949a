#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>

import Core;
import RHI;
import Cairn;

#include "CairnTestContext.h"

class ShaderTest : public CairnTest
{
};

TEST_F(ShaderTest, RegisterRecordsStageAndLabel)
{
    auto vs = Ctx().RegisterShader("void main() { gl_Position = vec4(0.0); }", RHI::ShaderStage::Vertex, "fullscreen");
    ASSERT_TRUE(vs.has_value());

    auto shader = Store().GetShaders().Get(*vs);
    ASSERT_TRUE(shader.has_value());
    EXPECT_EQ((*shader)->GetStage(), RHI::ShaderStage::Vertex);
    EXPECT_EQ((*shader)->GetLabel(), "fullscreen");
    EXPECT_EQ(Device().GetStats().ShaderModulesCreated, 1u);
}

TEST_F(ShaderTest, CompileFailureAddsNothing)
{
    auto broken = Ctx().RegisterShader("#error unfinished", RHI::ShaderStage::Fragment, "broken");
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error(), Core::ErrorCode::ShaderCompilationFailed);
    EXPECT_EQ(Store().GetShaders().Size(), 0u);
    EXPECT_EQ(Device().GetStats().ShaderModulesCreated, 0u);
}

TEST_F(ShaderTest, HandlesAreSequential)
{
    const auto a = Shader(RHI::ShaderStage::Vertex);
    const auto b = Shader(RHI::ShaderStage::Fragment);
    EXPECT_EQ(a.Index, 0u);
    EXPECT_EQ(b.Index, 1u);
}

TEST(ShaderCompilerConfig, MissingCompilerIsInvalidState)
{
    Cairn::Context ctx(std::make_unique<RHI::NullDevice>(),
                       Cairn::ContextConfig{.AppName = "NoCompiler", .Compiler = nullptr});

    auto shader = ctx.RegisterShader("void main() {}", RHI::ShaderStage::Compute, "cs");
    ASSERT_FALSE(shader.has_value());
    EXPECT_EQ(shader.error(), Core::ErrorCode::InvalidState);
}

TEST_F(ShaderTest, MissingFileIsFileNotFound)
{
    const auto path = std::filesystem::temp_directory_path() / "cairn_missing_shader.vert";
    std::filesystem::remove(path);

    auto shader = Ctx().RegisterShaderFile(path, RHI::ShaderStage::Vertex);
    ASSERT_FALSE(shader.has_value());
    EXPECT_EQ(shader.error(), Core::ErrorCode::FileNotFound);
}

TEST_F(ShaderTest, FileLabelIsFileName)
{
    const auto path = std::filesystem::temp_directory_path() / "cairn_test_shader.frag";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        ASSERT_TRUE(out.good());
        out << "#version 450\nlayout(location = 0) out vec4 color;\nvoid main() { color = vec4(1.0); }\n";
    }

    auto shader = Ctx().RegisterShaderFile(path, RHI::ShaderStage::Fragment);
    std::filesystem::remove(path);

    ASSERT_TRUE(shader.has_value());
    auto record = Store().GetShaders().Get(*shader);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ((*record)->GetLabel(), "cairn_test_shader.frag");
    EXPECT_EQ((*record)->GetStage(), RHI::ShaderStage::Fragment);
}

TEST_F(ShaderTest, FileCompileErrorsPropagate)
{
    const auto path = std::filesystem::temp_directory_path() / "cairn_broken_shader.comp";
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        ASSERT_TRUE(out.good());
        out << "#error not ready\n";
    }

    auto shader = Ctx().RegisterShaderFile(path, RHI::ShaderStage::Compute);
    std::filesystem::remove(path);

    ASSERT_FALSE(shader.has_value());
    EXPECT_EQ(shader.error(), Core::ErrorCode::ShaderCompilationFailed);
}

TEST(GlslCompiler, ProducesSpirvForEachStage)
{
    auto vs = RHI::CompileGlsl("#version 450\nvoid main() { gl_Position = vec4(0.0, 0.0, 0.0, 1.0); }\n",
                               RHI::ShaderStage::Vertex);
    ASSERT_TRUE(vs.has_value());
    ASSERT_FALSE(vs->empty());
    EXPECT_EQ(vs->front(), 0x07230203u);

    auto fs = RHI::CompileGlsl("#version 450\nlayout(location = 0) out vec4 color;\n"
                               "void main() { color = vec4(1.0); }\n",
                               RHI::ShaderStage::Fragment);
    ASSERT_TRUE(fs.has_value());
    EXPECT_EQ(fs->front(), 0x07230203u);

    auto cs = RHI::CompileGlsl("#version 450\nlayout(local_size_x = 64) in;\nvoid main() {}\n",
                               RHI::ShaderStage::Compute);
    ASSERT_TRUE(cs.has_value());
    EXPECT_EQ(cs->front(), 0x07230203u);
}

TEST(GlslCompiler, SyntaxErrorIsCompilationFailure)
{
    auto broken = RHI::CompileGlsl("#version 450\nvoid main() { gl_Position = ; }\n", RHI::ShaderStage::Vertex);
    ASSERT_FALSE(broken.has_value());
    EXPECT_EQ(broken.error(), Core::ErrorCode::ShaderCompilationFailed);
}

TEST(GlslCompiler, WrongStageIsCompilationFailure)
{
    // gl_Position is not writable from a compute shader.
    auto misplaced = RHI::CompileGlsl("#version 450\nvoid main() { gl_Position = vec4(0.0); }\n",
                                      RHI::ShaderStage::Compute);
    ASSERT_FALSE(misplaced.has_value());
    EXPECT_EQ(misplaced.error(), Core::ErrorCode::ShaderCompilationFailed);
}
