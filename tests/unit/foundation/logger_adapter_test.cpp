#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "arena/foundation/game_logger.hpp"

#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace arena::foundation;
namespace kci = kcenon::common::interfaces;

namespace {

/// Backend that keeps every line it receives.
class CapturingLogger : public kci::ILogger {
public:
    struct Line {
        kci::log_level level;
        std::string text;
    };

    kcenon::common::VoidResult log(kci::log_level level, const std::string& message) override {
        lines.push_back({level, message});
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(kci::log_level level, std::string_view message,
                                   const kci::source_location& /*where*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kci::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(kci::log_level /*level*/) const override { return true; }

    kcenon::common::VoidResult set_level(kci::log_level /*level*/) override {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kci::log_level get_level() const override { return kci::log_level::trace; }

    kcenon::common::VoidResult flush() override {
        ++flushes;
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<Line> lines;
    int flushes = 0;
};

} // namespace

/// Routes the process-wide registry to a CapturingLogger for each test.
class MatchLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        kci::GlobalLoggerRegistry::instance().clear();
        kci::GlobalLoggerRegistry::instance().set_default_logger(sink);
    }

    void TearDown() override {
        kci::GlobalLoggerRegistry::instance().clear();
    }

    [[nodiscard]] std::vector<std::string> texts() const {
        std::vector<std::string> out;
        for (const auto& line : sink->lines) {
            out.push_back(line.text);
        }
        return out;
    }

    std::shared_ptr<CapturingLogger> sink = std::make_shared<CapturingLogger>();
    GameLogger logger;
};

// ═══════════════════════════════════════════════════════════════════════════
// Category names and defaults
// ═══════════════════════════════════════════════════════════════════════════

TEST(LogCategoryTest, NamesFollowSimulationLayers) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::ECS), "ECS");
    EXPECT_EQ(logCategoryName(LogCategory::Combat), "Combat");
    EXPECT_EQ(logCategoryName(LogCategory::Ability), "Ability");
    EXPECT_EQ(logCategoryName(LogCategory::Match), "Match");
    EXPECT_EQ(logCategoryName(LogCategory::World), "World");
    EXPECT_EQ(logCategoryName(LogCategory::Input), "Input");
    EXPECT_EQ(logCategoryName(LogCategory::Config), "Config");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(kLogCategoryCount)), "Unknown");
    EXPECT_EQ(logLevelName(LogLevel::Warning), "WARNING");
}

TEST(LogCategoryTest, CombatAndAbilityStartVerbose) {
    GameLogger fresh;
    for (auto cat : {LogCategory::Combat, LogCategory::Ability}) {
        EXPECT_EQ(fresh.getCategoryLevel(cat), LogLevel::Debug) << logCategoryName(cat);
        EXPECT_TRUE(fresh.isEnabled(LogLevel::Debug, cat));
        EXPECT_FALSE(fresh.isEnabled(LogLevel::Trace, cat));
    }
    for (auto cat : {LogCategory::Core, LogCategory::ECS, LogCategory::Match,
                     LogCategory::World, LogCategory::Input, LogCategory::Config}) {
        EXPECT_EQ(fresh.getCategoryLevel(cat), LogLevel::Info) << logCategoryName(cat);
        EXPECT_FALSE(fresh.isEnabled(LogLevel::Debug, cat));
    }
}

TEST(LogCategoryTest, OutOfRangeCategoryIsSilent) {
    GameLogger fresh;
    const auto bogus = static_cast<LogCategory>(200);
    EXPECT_EQ(fresh.getCategoryLevel(bogus), LogLevel::Off);
    EXPECT_FALSE(fresh.isEnabled(LogLevel::Critical, bogus));
}

// ═══════════════════════════════════════════════════════════════════════════
// Formatting
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(MatchLogTest, PhaseChangeCarriesCategoryPrefix) {
    logger.log(LogLevel::Info, LogCategory::Match, "phase WARNING -> COLLAPSE");

    ASSERT_EQ(sink->lines.size(), 1u);
    EXPECT_EQ(sink->lines[0].level, kci::log_level::info);
    EXPECT_EQ(sink->lines[0].text, "[Match] phase WARNING -> COLLAPSE");
}

TEST_F(MatchLogTest, HitReportListsUnitTeamAndTick) {
    LogContext ctx;
    ctx.entityId = 12;
    ctx.teamId = 0;
    ctx.tick = 3601;
    ctx.extra["damage"] = "40";

    logger.logWithContext(LogLevel::Debug, LogCategory::Ability, "projectile hit", ctx);

    EXPECT_EQ(texts(), (std::vector<std::string>{
                           "[Ability] projectile hit {entity_id=12, team=0, tick=3601, damage=40}"}));
}

TEST_F(MatchLogTest, ContextWithoutFieldsAddsNothing) {
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "simulation created", LogContext{});
    EXPECT_EQ(texts(), (std::vector<std::string>{"[Core] simulation created"}));
}

TEST_F(MatchLogTest, SeverityReachesBackendUnchanged) {
    logger.setCategoryLevel(LogCategory::World, LogLevel::Trace);
    logger.log(LogLevel::Trace, LogCategory::World, "cell rebuilt");
    logger.log(LogLevel::Warning, LogCategory::World, "index entry repaired");
    logger.log(LogLevel::Critical, LogCategory::World, "index lost");

    ASSERT_EQ(sink->lines.size(), 3u);
    EXPECT_EQ(sink->lines[0].level, kci::log_level::trace);
    EXPECT_EQ(sink->lines[1].level, kci::log_level::warning);
    EXPECT_EQ(sink->lines[2].level, kci::log_level::critical);
}

// ═══════════════════════════════════════════════════════════════════════════
// Filtering
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(MatchLogTest, QuietingCombatKeepsMatchTimeline) {
    logger.setCategoryLevel(LogCategory::Combat, LogLevel::Warning);

    logger.log(LogLevel::Debug, LogCategory::Combat, "auto-attack");
    LogContext ctx;
    ctx.entityId = 4;
    logger.logWithContext(LogLevel::Info, LogCategory::Combat, "unit died", ctx);
    logger.log(LogLevel::Info, LogCategory::Match, "victory: team 1");

    EXPECT_EQ(texts(), (std::vector<std::string>{"[Match] victory: team 1"}));
}

TEST_F(MatchLogTest, OffSilencesEvenCritical) {
    logger.setCategoryLevel(LogCategory::Input, LogLevel::Off);
    logger.log(LogLevel::Critical, LogCategory::Input, "input rejected");

    logger.setCategoryLevel(LogCategory::Input, LogLevel::Trace);
    logger.log(LogLevel::Off, LogCategory::Input, "never emitted");

    EXPECT_TRUE(sink->lines.empty());
}

TEST_F(MatchLogTest, FlushReachesBackend) {
    ASSERT_TRUE(logger.flush().hasValue());
    EXPECT_EQ(sink->flushes, 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Macros and the shared instance
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(MatchLogTest, MacrosGoThroughSharedInstance) {
    auto& shared = GameLogger::instance();
    EXPECT_EQ(&shared, &GameLogger::instance());

    const auto previous = shared.getCategoryLevel(LogCategory::Config);
    shared.setCategoryLevel(LogCategory::Config, LogLevel::Warning);

    ARENA_LOG_INFO(LogCategory::Config, "loaded config/arena.yaml");
    ARENA_LOG_WARN(LogCategory::Config, "ignoring unknown key movement.sped");

    LogContext ctx;
    ctx.tick = 9;
    ARENA_LOG_CTX(LogLevel::Error, LogCategory::Config, "reload refused", ctx);

    shared.setCategoryLevel(LogCategory::Config, previous);

    EXPECT_EQ(texts(), (std::vector<std::string>{
                           "[Config] ignoring unknown key movement.sped",
                           "[Config] reload refused {tick=9}"}));
}
