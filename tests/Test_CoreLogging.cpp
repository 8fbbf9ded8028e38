#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

import Core;

namespace
{
    using Captured = std::vector<std::pair<Core::Log::Level, std::string>>;

    // Restores the console sink and the default level after each test.
    class LoggingTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            PreviousLevel = Core::Log::GetLevel();
            Core::Log::SetLevel(Core::Log::Level::Debug);
            Core::Log::SetSink([this](Core::Log::Level level, std::string_view msg)
            {
                Messages.emplace_back(level, std::string(msg));
            });
        }

        void TearDown() override
        {
            Core::Log::SetSink({});
            Core::Log::SetLevel(PreviousLevel);
        }

        Captured Messages;
        Core::Log::Level PreviousLevel = Core::Log::Level::Info;
    };
}

// -----------------------------------------------------------------------------
// Sink and levels
// -----------------------------------------------------------------------------

TEST_F(LoggingTest, Sink_ReceivesFormattedMessage)
{
    Core::Log::Info("device {} :: index {}", "Keyboard", 0);
    ASSERT_EQ(Messages.size(), 1u);
    EXPECT_EQ(Messages[0].first, Core::Log::Level::Info);
    EXPECT_EQ(Messages[0].second, "device Keyboard :: index 0");
}

TEST_F(LoggingTest, Level_FiltersLowerSeverities)
{
    Core::Log::SetLevel(Core::Log::Level::Warning);
    Core::Log::Info("dropped");
    Core::Log::Warn("kept {}", 1);
    Core::Log::Error("kept {}", 2);

    ASSERT_EQ(Messages.size(), 2u);
    EXPECT_EQ(Messages[0].first, Core::Log::Level::Warning);
    EXPECT_EQ(Messages[1].first, Core::Log::Level::Error);
    EXPECT_EQ(Core::Log::GetLevel(), Core::Log::Level::Warning);
}

TEST_F(LoggingTest, IsEnabled_MatchesLevel)
{
    Core::Log::SetLevel(Core::Log::Level::Error);
    EXPECT_FALSE(Core::Log::IsEnabled(Core::Log::Level::Warning));
    EXPECT_TRUE(Core::Log::IsEnabled(Core::Log::Level::Error));
}

TEST_F(LoggingTest, DefaultLevel_MatchesBuildType)
{
    // Every fixture restores the level it found, so this is the startup value.
#ifndef NDEBUG
    EXPECT_EQ(PreviousLevel, Core::Log::Level::Debug);
#else
    EXPECT_EQ(PreviousLevel, Core::Log::Level::Info);
#endif
}

#ifndef NDEBUG
TEST_F(LoggingTest, Debug_EmittedInDebugBuilds)
{
    Core::Log::Debug("trace {}", 42);
    ASSERT_EQ(Messages.size(), 1u);
    EXPECT_EQ(Messages[0].first, Core::Log::Level::Debug);
}
#endif

// -----------------------------------------------------------------------------
// Error codes
// -----------------------------------------------------------------------------

TEST(CoreError, ErrorCodeToString_NamesInputErrors)
{
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::NoActionMaps), "NoActionMaps");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::DuplicateActionMap), "DuplicateActionMap");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::AlreadyInitialized), "AlreadyInitialized");
}

TEST(CoreError, ResultHelpers)
{
    const Core::Result ok = Core::Ok();
    EXPECT_TRUE(ok.has_value());

    const Core::Result failed = Core::Err(Core::ErrorCode::TypeMismatch);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), Core::ErrorCode::TypeMismatch);

    const Core::Expected<int> value = Core::Ok(5);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 5);
}
