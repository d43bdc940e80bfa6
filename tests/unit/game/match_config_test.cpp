#include <gtest/gtest.h>

#include "arena/foundation/config_manager.hpp"
#include "arena/foundation/error_code.hpp"
#include "arena/game/match_config.hpp"

using namespace arena::game;
using arena::foundation::ConfigManager;
using arena::foundation::ErrorCode;

// ═══════════════════════════════════════════════════════════════════════════
// Defaults
// ═══════════════════════════════════════════════════════════════════════════

TEST(MatchConfigTest, DefaultsMatchArenaRules) {
    MatchConfig config;
    EXPECT_FLOAT_EQ(config.phases.warning, 120.0f);
    EXPECT_FLOAT_EQ(config.phases.collapse, 135.0f);
    EXPECT_FLOAT_EQ(config.phases.showdown, 150.0f);
    EXPECT_FLOAT_EQ(config.matchEndTime, 180.0f);
    EXPECT_FLOAT_EQ(config.arenaCenter.x, 960.0f);
    EXPECT_FLOAT_EQ(config.arenaCenter.y, 540.0f);
    EXPECT_FLOAT_EQ(config.teleportRadius, 200.0f);
    EXPECT_FLOAT_EQ(config.movement.speed, 100.0f);
    EXPECT_FLOAT_EQ(config.movement.arrivalRadius, 5.0f);

    EXPECT_FLOAT_EQ(config.dash.cooldown, 10.0f);
    EXPECT_FLOAT_EQ(config.dash.distance, 150.0f);
    EXPECT_FLOAT_EQ(config.shield.cooldown, 15.0f);
    EXPECT_FLOAT_EQ(config.shield.duration, 3.0f);
    EXPECT_FLOAT_EQ(config.shield.reduction, 0.5f);
    EXPECT_FLOAT_EQ(config.ranged.cooldown, 8.0f);
    EXPECT_FLOAT_EQ(config.ranged.range, 300.0f);
    EXPECT_FLOAT_EQ(config.ranged.damage, 40.0f);

    EXPECT_TRUE(ValidateMatchConfig(config).hasValue());
}

TEST(MatchConfigTest, EmptyDocumentYieldsDefaults) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadString("{}").hasValue());

    auto loaded = LoadMatchConfig(manager);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_FLOAT_EQ(loaded.value().phases.showdown, 150.0f);
    EXPECT_EQ(loaded.value().seed, 0x5EEDu);
}

// ═══════════════════════════════════════════════════════════════════════════
// YAML overlay
// ═══════════════════════════════════════════════════════════════════════════

TEST(MatchConfigTest, OverlayReplacesPresentKeysOnly) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadString(R"(
match:
  phases:
    warning: 10
    collapse: 20
    showdown: 30
  end_time: 60
  seed: 42
arena:
  center_x: 0
  center_y: 0
  teleport_radius: 50
abilities:
  dash:
    distance: 75
  ranged:
    hit_radius: 5
combat:
  base_attack:
    damage: 4
movement:
  speed: 250
)").hasValue());

    auto loaded = LoadMatchConfig(manager);
    ASSERT_TRUE(loaded.hasValue());
    const auto& config = loaded.value();

    EXPECT_FLOAT_EQ(config.phases.warning, 10.0f);
    EXPECT_FLOAT_EQ(config.phases.collapse, 20.0f);
    EXPECT_FLOAT_EQ(config.phases.showdown, 30.0f);
    EXPECT_FLOAT_EQ(config.matchEndTime, 60.0f);
    EXPECT_EQ(config.seed, 42u);
    EXPECT_FLOAT_EQ(config.arenaCenter.x, 0.0f);
    EXPECT_FLOAT_EQ(config.teleportRadius, 50.0f);
    EXPECT_FLOAT_EQ(config.dash.distance, 75.0f);
    EXPECT_FLOAT_EQ(config.ranged.hitRadius, 5.0f);
    EXPECT_FLOAT_EQ(config.baseAttack.damage, 4.0f);
    EXPECT_FLOAT_EQ(config.movement.speed, 250.0f);

    // Untouched keys keep their defaults.
    EXPECT_FLOAT_EQ(config.dash.cooldown, 10.0f);
    EXPECT_FLOAT_EQ(config.shield.reduction, 0.5f);
    EXPECT_FLOAT_EQ(config.chaseSpeed, 100.0f);
    EXPECT_FLOAT_EQ(config.movement.arrivalRadius, 5.0f);
}

TEST(MatchConfigTest, NonNumericValueIsTypeMismatch) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadString("abilities:\n  shield:\n    duration: long\n").hasValue());

    auto loaded = LoadMatchConfig(manager);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(MatchConfigTest, MisspelledKeyIsIgnored) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadString(
        "movement:\n  sped: 999\nheadless:\n  team_size: 3\n").hasValue());

    auto loaded = LoadMatchConfig(manager);
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_FLOAT_EQ(loaded.value().movement.speed, 100.0f);
}

TEST(MatchConfigTest, UnorderedThresholdsAreRejected) {
    ConfigManager manager;
    ASSERT_TRUE(manager.loadString(
        "match:\n  phases:\n    warning: 140\n    collapse: 130\n").hasValue());

    auto loaded = LoadMatchConfig(manager);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::InvalidArgument);
}

// ═══════════════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════════════

TEST(MatchConfigValidationTest, EqualThresholdsAreAllowed) {
    MatchConfig config;
    config.phases = PhaseThresholds{5.0f, 5.0f, 5.0f};
    config.matchEndTime = 5.0f;
    EXPECT_TRUE(ValidateMatchConfig(config).hasValue());
}

TEST(MatchConfigValidationTest, EndTimeBeforeShowdownIsRejected) {
    MatchConfig config;
    config.matchEndTime = 149.0f;
    auto result = ValidateMatchConfig(config);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(MatchConfigValidationTest, NegativeWarningIsRejected) {
    MatchConfig config;
    config.phases.warning = -1.0f;
    EXPECT_TRUE(ValidateMatchConfig(config).hasError());
}

TEST(MatchConfigValidationTest, NonPositiveRadiiAreRejected) {
    MatchConfig teleport;
    teleport.teleportRadius = 0.0f;
    EXPECT_TRUE(ValidateMatchConfig(teleport).hasError());

    MatchConfig cell;
    cell.cellSize = -10.0f;
    EXPECT_TRUE(ValidateMatchConfig(cell).hasError());

    MatchConfig hit;
    hit.ranged.hitRadius = 0.0f;
    EXPECT_TRUE(ValidateMatchConfig(hit).hasError());

    MatchConfig arrival;
    arrival.movement.arrivalRadius = 0.0f;
    EXPECT_TRUE(ValidateMatchConfig(arrival).hasError());
}

TEST(MatchConfigValidationTest, NegativeMoveSpeedIsRejected) {
    MatchConfig config;
    config.movement.speed = -1.0f;
    EXPECT_TRUE(ValidateMatchConfig(config).hasError());

    config.movement.speed = 0.0f;
    EXPECT_TRUE(ValidateMatchConfig(config).hasValue());
}

TEST(MatchConfigValidationTest, ShieldReductionMustBeAFraction) {
    MatchConfig config;
    config.shield.reduction = 1.5f;
    EXPECT_TRUE(ValidateMatchConfig(config).hasError());

    config.shield.reduction = 1.0f;
    EXPECT_TRUE(ValidateMatchConfig(config).hasValue());
}

TEST(MatchConfigValidationTest, NegativeCooldownIsRejected) {
    MatchConfig config;
    config.ranged.cooldown = -0.5f;
    EXPECT_TRUE(ValidateMatchConfig(config).hasError());
}
