#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

import Core;

namespace
{
    class LoggingTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            m_Saved = Core::Log::GetThreshold();
            Core::Log::SetSink([this](Core::Log::Level level, std::string_view msg)
            {
                m_Lines.emplace_back(level, std::string(msg));
            });
        }

        void TearDown() override
        {
            Core::Log::SetSink({});
            Core::Log::SetThreshold(m_Saved);
        }

        std::vector<std::pair<Core::Log::Level, std::string>> m_Lines;
        Core::Log::Level m_Saved = Core::Log::Level::Info;
    };
}

TEST_F(LoggingTest, SinkReceivesFormattedMessage)
{
    Core::Log::SetThreshold(Core::Log::Level::Debug);
    Core::Log::Info("buffer {} grown to {} bytes", "Vertices", 4096);

    ASSERT_EQ(m_Lines.size(), 1u);
    EXPECT_EQ(m_Lines[0].first, Core::Log::Level::Info);
    EXPECT_EQ(m_Lines[0].second, "buffer Vertices grown to 4096 bytes");
}

TEST_F(LoggingTest, ThresholdDropsLowerLevels)
{
    Core::Log::SetThreshold(Core::Log::Level::Warning);
    Core::Log::Debug("debug");
    Core::Log::Info("info");
    Core::Log::Warn("warn");
    Core::Log::Error("error");

    ASSERT_EQ(m_Lines.size(), 2u);
    EXPECT_EQ(m_Lines[0].first, Core::Log::Level::Warning);
    EXPECT_EQ(m_Lines[1].first, Core::Log::Level::Error);
}

TEST_F(LoggingTest, ErrorsAlwaysPass)
{
    Core::Log::SetThreshold(Core::Log::Level::Error);
    Core::Log::Warn("dropped");
    Core::Log::Error("kept {}", 1);

    ASSERT_EQ(m_Lines.size(), 1u);
    EXPECT_EQ(m_Lines[0].second, "kept 1");
}

TEST(Logging, LevelLabels)
{
    EXPECT_EQ(Core::Log::LevelLabel(Core::Log::Level::Debug), "[DBG]");
    EXPECT_EQ(Core::Log::LevelLabel(Core::Log::Level::Info), "[INFO]");
    EXPECT_EQ(Core::Log::LevelLabel(Core::Log::Level::Warning), "[WARN]");
    EXPECT_EQ(Core::Log::LevelLabel(Core::Log::Level::Error), "[ERR]");
}
