#include <gtest/gtest.h>

#include <string>

#include "interact/foundation/game_logger.hpp"
#include "support/mock_logger.hpp"

using namespace interact::foundation;
using interact::test::log_level;
using interact::test::MockLoggerTest;

using GameLoggerTest = MockLoggerTest;

// ── Names ───────────────────────────────────────────────────────────

TEST(LogNamesTest, CategoriesByName) {
    EXPECT_EQ(logCategoryName(LogCategory::Hook), "Hook");
    EXPECT_EQ(logCategoryName(LogCategory::Selection), "Selection");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");

    EXPECT_EQ(logCategoryFromName("selection"), LogCategory::Selection);
    EXPECT_EQ(logCategoryFromName("HOOK"), LogCategory::Hook);
    EXPECT_FALSE(logCategoryFromName("network").has_value());
}

TEST(LogNamesTest, LevelsByName) {
    EXPECT_EQ(logLevelFromName("trace"), LogLevel::Trace);
    EXPECT_EQ(logLevelFromName("Debug"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromName("warn"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromName("WARNING"), LogLevel::Warning);
    EXPECT_EQ(logLevelFromName("off"), LogLevel::Off);
    EXPECT_FALSE(logLevelFromName("verbose").has_value());
    EXPECT_FALSE(logLevelFromName("").has_value());

    for (auto level : {LogLevel::Trace, LogLevel::Info, LogLevel::Critical}) {
        EXPECT_EQ(logLevelFromName(logLevelName(level)), level);
    }
}

// ── Levels ──────────────────────────────────────────────────────────

TEST(GameLoggerLevelTest, SelectionIsVerboseByDefault) {
    GameLogger logger;
    EXPECT_TRUE(logger.isEnabled(LogLevel::Debug, LogCategory::Selection));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Trace, LogCategory::Selection));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug, LogCategory::Hook));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Info, LogCategory::World));
}

TEST(GameLoggerLevelTest, PerCategoryOverride) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::World, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::World));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Trace, LogCategory::Script));

    logger.setCategoryLevel(LogCategory::Script, LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Script));
}

TEST(GameLoggerLevelTest, SilenceEverythingThenRestore) {
    GameLogger logger;
    logger.setAllCategoryLevels(LogLevel::Off);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Critical, LogCategory::Core));
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Selection), LogLevel::Off);

    logger.resetCategoryLevels();
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Selection), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
}

TEST(GameLoggerLevelTest, OffNeverPasses) {
    GameLogger logger;
    logger.setCategoryLevel(LogCategory::Core, LogLevel::Trace);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Core));
    EXPECT_EQ(logger.getCategoryLevel(static_cast<LogCategory>(99)), LogLevel::Off);
}

// ── Output ──────────────────────────────────────────────────────────

TEST_F(GameLoggerTest, MessagesCarryCategoryPrefix) {
    GameLogger logger;
    logger.log(LogLevel::Info, LogCategory::Hook, "SysMsgInitialize hook installed");
    logger.log(LogLevel::Debug, LogCategory::Core, "dropped");

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::info);
    EXPECT_EQ(records[0].message, "[Hook] SysMsgInitialize hook installed");
}

TEST_F(GameLoggerTest, SelectionContextFormatting) {
    GameLogger logger;

    LogContext ctx;
    ctx.objectGuid = ObjectGuid(0xF130000A4B000010ull);
    ctx.distance = 4.987f;
    ctx.extra["class"] = "LootableRemains";
    ctx.extra["autoloot"] = "1";

    logger.logWithContext(LogLevel::Debug, LogCategory::Selection, "Selected candidate", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::debug);
    EXPECT_EQ(records[0].message,
              "[Selection] Selected candidate "
              "{guid=0xf130000a4b000010, distance=4.99, autoloot=1, class=LootableRemains}");
}

TEST_F(GameLoggerTest, EmptyGuidAndContextAreOmitted) {
    GameLogger logger;

    LogContext ctx;
    ctx.objectGuid = ObjectGuid{};
    logger.logWithContext(LogLevel::Info, LogCategory::World, "nothing to do", ctx);

    auto records = mockLogger_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[World] nothing to do");
}

TEST_F(GameLoggerTest, FlushReachesTheSink) {
    GameLogger logger;
    EXPECT_TRUE(logger.flush().hasValue());
    EXPECT_TRUE(mockLogger_->wasFlushed());
}

// ── INTERACT_LOG macros ─────────────────────────────────────────────

TEST_F(GameLoggerTest, MacrosHonourCategoryLevel) {
    auto& logger = GameLogger::instance();
    logger.setCategoryLevel(LogCategory::Script, LogLevel::Error);
    INTERACT_LOG_WARN(LogCategory::Script, "should not appear");
    EXPECT_TRUE(mockLogger_->records().empty());

    logger.setCategoryLevel(LogCategory::Script, LogLevel::Debug);
    INTERACT_LOG_DEBUG(LogCategory::Script, "macro test");
    EXPECT_TRUE(mockLogger_->contains("[Script] macro test"));
}
