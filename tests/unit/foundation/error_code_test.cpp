#include <gtest/gtest.h>

#include <string>

#include "interact/foundation/error_code.hpp"
#include "interact/foundation/game_error.hpp"
#include "interact/foundation/game_result.hpp"

using namespace interact::foundation;

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ObjectNotFound), "World");
    EXPECT_EQ(errorSubsystem(ErrorCode::ScriptUsage), "Script");
    EXPECT_EQ(errorSubsystem(ErrorCode::HookEnableFailed), "Hook");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigTypeMismatch), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0x7F00)), "Unknown");
}

TEST(ErrorCodeTest, SubsystemBlocksAreDistinct) {
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::ScriptUsage) & 0xFF00u, 0x0200u);
    EXPECT_EQ(static_cast<uint32_t>(ErrorCode::HookInitFailed) & 0xFF00u, 0x0300u);
}

TEST(GameErrorTest, DefaultIsUnknown) {
    GameError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(GameErrorTest, CarriesMessageAndSubsystem) {
    GameError err(ErrorCode::ScriptUsage, "Usage: InteractNearest(autoloot)");
    EXPECT_EQ(err.message(), "Usage: InteractNearest(autoloot)");
    EXPECT_EQ(err.subsystem(), "Script");
}

TEST(GameErrorTest, TypedContext) {
    GameError err(ErrorCode::NotFound, "missing", std::string("InteractNearest"));
    ASSERT_TRUE(err.hasContext());
    ASSERT_NE(err.context<std::string>(), nullptr);
    EXPECT_EQ(*err.context<std::string>(), "InteractNearest");
    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(GameResultTest, ErrorPropagation) {
    auto fail = []() -> GameResult<int> {
        return GameResult<int>::err(GameError(ErrorCode::ConfigKeyNotFound, "nope"));
    };
    auto result = fail();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigKeyNotFound);
    EXPECT_EQ(result.valueOr(7), 7);
}
