#include <gtest/gtest.h>

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/entity_manager.hpp"
#include "arena/game/ability_components.hpp"
#include "arena/game/combat_system.hpp"
#include "arena/game/components.hpp"
#include "arena/game/match_components.hpp"
#include "arena/game/targeting.hpp"
#include "arena/game/tick_events.hpp"

using namespace arena::ecs;
using namespace arena::game;

// ═══════════════════════════════════════════════════════════════════════════
// CalculateDamage
// ═══════════════════════════════════════════════════════════════════════════

TEST(CalculateDamageTest, AppliesMultiplier) {
    EXPECT_FLOAT_EQ(CombatSystem::CalculateDamage(10.0f, 1.0f), 10.0f);
    EXPECT_FLOAT_EQ(CombatSystem::CalculateDamage(10.0f, 0.5f), 5.0f);
}

TEST(CalculateDamageTest, NegativeInputsClampToZero) {
    EXPECT_FLOAT_EQ(CombatSystem::CalculateDamage(-3.0f, 1.0f), 0.0f);
    EXPECT_FLOAT_EQ(CombatSystem::CalculateDamage(10.0f, -1.0f), 0.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Fixture
// ═══════════════════════════════════════════════════════════════════════════

class CombatSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        mgr.RegisterStorage(&positions);
        mgr.RegisterStorage(&teams);
        mgr.RegisterStorage(&healths);
        mgr.RegisterStorage(&damages);
        mgr.RegisterStorage(&shields);
    }

    Entity unit(float x, uint8_t team, float hp = 100.0f) {
        Entity e = mgr.Create();
        positions.Add(e, x, 0.0f);
        teams.Add(e, team);
        healths.Add(e, hp, 100.0f);
        return e;
    }

    Entity attacker(float x, uint8_t team, float amount, float range, float speed) {
        Entity e = unit(x, team);
        damages.Add(e, amount, range, speed, 0.0f);
        return e;
    }

    EntityManager mgr;
    ComponentStorage<Position> positions;
    ComponentStorage<Team> teams;
    ComponentStorage<Health> healths;
    ComponentStorage<Damage> damages;
    ComponentStorage<Shield> shields;
    ComponentStorage<ShowdownState> showdown;
    TickEvents events;
    Targeting targeting{positions, healths, teams};
    DamageResolver resolver{healths, shields, positions, events};
    CombatSystem combat{damages, positions, teams, healths, showdown, targeting, resolver};
};

// ═══════════════════════════════════════════════════════════════════════════
// Auto-attack timing
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatSystemTest, ReadyAttackerStrikesOnFirstTick) {
    Entity a = attacker(0.0f, 0, 10.0f, 200.0f, 1.0f);
    Entity b = unit(100.0f, 1);

    combat.Execute(0.25f);

    EXPECT_FLOAT_EQ(healths.Get(b).current, 90.0f);
    EXPECT_FLOAT_EQ(damages.Get(a).cooldown, 1.0f);
    ASSERT_EQ(events.damage.size(), 1u);
    EXPECT_EQ(events.damage[0].source, a);
    EXPECT_EQ(events.damage[0].target, b);
    EXPECT_FLOAT_EQ(events.damage[0].amount, 10.0f);
    EXPECT_FLOAT_EQ(events.damage[0].position.x, 100.0f);
}

TEST_F(CombatSystemTest, AttackSpeedTwoHitsTwicePerSecond) {
    attacker(0.0f, 0, 10.0f, 200.0f, 2.0f);
    Entity b = unit(100.0f, 1);

    for (int i = 0; i < 4; ++i) {
        combat.Execute(0.25f);
    }

    EXPECT_EQ(events.damage.size(), 2u);
    EXPECT_FLOAT_EQ(healths.Get(b).current, 80.0f);
}

TEST_F(CombatSystemTest, AttackSpeedOneHitsOncePerSecond) {
    attacker(0.0f, 0, 10.0f, 200.0f, 1.0f);
    Entity b = unit(100.0f, 1);

    // 64 ticks of 1/64 s: hits at t = 1/64 and t = 1 + 1/64 lie on
    // either side of the 1 s mark.
    for (int i = 0; i < 64; ++i) {
        combat.Execute(1.0f / 64.0f);
    }
    EXPECT_FLOAT_EQ(healths.Get(b).current, 90.0f);

    combat.Execute(1.0f / 64.0f);
    EXPECT_FLOAT_EQ(healths.Get(b).current, 80.0f);
}

TEST_F(CombatSystemTest, OutOfRangeKeepsCooldownAtZero) {
    Entity a = attacker(0.0f, 0, 10.0f, 50.0f, 1.0f);
    Entity b = unit(100.0f, 1);

    combat.Execute(0.25f);

    EXPECT_FLOAT_EQ(healths.Get(b).current, 100.0f);
    EXPECT_FLOAT_EQ(damages.Get(a).cooldown, 0.0f);
    EXPECT_TRUE(events.damage.empty());
}

TEST_F(CombatSystemTest, AlliesAreNeverAttacked) {
    attacker(0.0f, 0, 10.0f, 200.0f, 1.0f);
    Entity friendly = unit(10.0f, 0);

    combat.Execute(0.25f);
    EXPECT_FLOAT_EQ(healths.Get(friendly).current, 100.0f);
}

// ═══════════════════════════════════════════════════════════════════════════
// Damage pipeline
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatSystemTest, ActiveShieldHalvesIncomingDamage) {
    attacker(0.0f, 0, 10.0f, 200.0f, 1.0f);
    Entity b = unit(100.0f, 1);
    auto& shield = shields.Add(b);
    shield.active = 3.0f;
    shield.reduction = 0.5f;

    combat.Execute(0.25f);

    EXPECT_FLOAT_EQ(healths.Get(b).current, 95.0f);
    ASSERT_EQ(events.damage.size(), 1u);
    EXPECT_FLOAT_EQ(events.damage[0].amount, 5.0f);
}

TEST_F(CombatSystemTest, InactiveShieldDoesNotMitigate) {
    Entity b = unit(100.0f, 1);
    auto& shield = shields.Add(b);
    shield.active = 0.0f;
    shield.cooldown = 4.0f;

    EXPECT_FLOAT_EQ(resolver.DefenseMultiplier(b), 1.0f);
}

TEST_F(CombatSystemTest, HealthClampsAtZeroAndEmitsOneDeath) {
    Entity a = attacker(0.0f, 0, 25.0f, 200.0f, 4.0f);
    Entity b = unit(100.0f, 1, 10.0f);

    combat.Execute(0.25f);
    combat.Execute(0.25f);

    EXPECT_FLOAT_EQ(healths.Get(b).current, 0.0f);
    EXPECT_FALSE(healths.Get(b).IsAlive());
    ASSERT_EQ(events.deaths.size(), 1u);
    EXPECT_EQ(events.deaths[0].entity, b);
    EXPECT_EQ(events.deaths[0].killer, a);
    EXPECT_EQ(events.damage.size(), 1u);
}

TEST_F(CombatSystemTest, ResolverIgnoresDeadOrMissingTargets) {
    Entity a = unit(0.0f, 0);
    Entity corpse = unit(10.0f, 1, 0.0f);
    Entity nothing = mgr.Create();

    EXPECT_FLOAT_EQ(resolver.Apply(a, corpse, 50.0f), 0.0f);
    EXPECT_FLOAT_EQ(resolver.Apply(a, nothing, 50.0f), 0.0f);
    EXPECT_TRUE(events.damage.empty());
    EXPECT_TRUE(events.deaths.empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Ordering and gating
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatSystemTest, LowerIdResolvesFirstAndVictimDoesNotRetaliate) {
    Entity a = attacker(0.0f, 0, 10.0f, 200.0f, 1.0f);
    Entity b = attacker(100.0f, 1, 10.0f, 200.0f, 1.0f);
    healths.Get(a).current = 10.0f;
    healths.Get(b).current = 10.0f;

    combat.Execute(0.25f);

    EXPECT_TRUE(healths.Get(a).IsAlive());
    EXPECT_FALSE(healths.Get(b).IsAlive());
    ASSERT_EQ(events.deaths.size(), 1u);
    EXPECT_EQ(events.deaths[0].entity, b);
}

TEST_F(CombatSystemTest, DeadAttackerDoesNotAttack) {
    Entity a = attacker(0.0f, 0, 10.0f, 200.0f, 1.0f);
    healths.Get(a).current = 0.0f;
    Entity b = unit(100.0f, 1);

    combat.Execute(0.25f);
    EXPECT_FLOAT_EQ(healths.Get(b).current, 100.0f);
}

TEST_F(CombatSystemTest, NothingHappensOnceMatchEnded) {
    attacker(0.0f, 0, 10.0f, 200.0f, 1.0f);
    Entity b = unit(100.0f, 1);
    Entity match = mgr.Create();
    showdown.Add(match).state = MatchPhase::Ended;

    combat.Execute(0.25f);
    EXPECT_FLOAT_EQ(healths.Get(b).current, 100.0f);
    EXPECT_TRUE(events.damage.empty());
}
