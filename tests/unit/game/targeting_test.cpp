#include <gtest/gtest.h>

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/entity_manager.hpp"
#include "arena/game/components.hpp"
#include "arena/game/spatial_index.hpp"
#include "arena/game/targeting.hpp"

using namespace arena::ecs;
using namespace arena::game;

// ═══════════════════════════════════════════════════════════════════════════
// Fixture
// ═══════════════════════════════════════════════════════════════════════════

class TargetingTest : public ::testing::Test {
protected:
    void SetUp() override {
        mgr.RegisterStorage(&positions);
        mgr.RegisterStorage(&healths);
        mgr.RegisterStorage(&teams);
    }

    Entity spawn(float x, float y, uint8_t team, float hp = 100.0f) {
        Entity e = mgr.Create();
        positions.Add(e, x, y);
        healths.Add(e, hp, 100.0f);
        teams.Add(e, team);
        index.Insert(e, {x, y});
        return e;
    }

    EntityManager mgr;
    ComponentStorage<Position> positions;
    ComponentStorage<Health> healths;
    ComponentStorage<Team> teams;
    SpatialIndex index{100.0f};
    Targeting indexed{positions, healths, teams, &index};
    Targeting linear{positions, healths, teams};
};

// ═══════════════════════════════════════════════════════════════════════════
// Nearest enemy
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TargetingTest, IgnoresAllies) {
    spawn(10.0f, 0.0f, 0);
    Entity enemy = spawn(80.0f, 0.0f, 1);

    EXPECT_EQ(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 200.0f), enemy);
    EXPECT_EQ(linear.FindNearestEnemy({0.0f, 0.0f}, 0, 200.0f), enemy);
}

TEST_F(TargetingTest, PicksClosestEnemy) {
    spawn(150.0f, 0.0f, 1);
    Entity near = spawn(0.0f, 60.0f, 1);
    spawn(-90.0f, 0.0f, 1);

    EXPECT_EQ(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 500.0f), near);
    EXPECT_EQ(linear.FindNearestEnemy({0.0f, 0.0f}, 0), near);
}

TEST_F(TargetingTest, EqualDistanceResolvesToLowestId) {
    Entity first = spawn(50.0f, 0.0f, 1);
    spawn(-50.0f, 0.0f, 1);
    spawn(0.0f, 50.0f, 1);

    EXPECT_EQ(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 100.0f), first);
    EXPECT_EQ(linear.FindNearestEnemy({0.0f, 0.0f}, 0), first);
}

TEST_F(TargetingTest, RadiusBoundIsInclusive) {
    Entity edge = spawn(100.0f, 0.0f, 1);

    EXPECT_EQ(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 100.0f), edge);
    EXPECT_FALSE(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 99.0f).isValid());
    EXPECT_FALSE(linear.FindNearestEnemy({0.0f, 0.0f}, 0, 99.0f).isValid());
}

TEST_F(TargetingTest, DeadEnemiesAreSkipped) {
    spawn(10.0f, 0.0f, 1, 0.0f);
    Entity alive = spawn(40.0f, 0.0f, 1);

    EXPECT_EQ(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 100.0f), alive);
    EXPECT_EQ(linear.FindNearestEnemy({0.0f, 0.0f}, 0), alive);
}

TEST_F(TargetingTest, NegativeRadiusFindsNothing) {
    spawn(0.0f, 0.0f, 1);
    EXPECT_FALSE(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, -1.0f).isValid());
    EXPECT_FALSE(linear.FindNearestEnemy({0.0f, 0.0f}, 0, -1.0f).isValid());
}

TEST_F(TargetingTest, UnboundedSearchReachesAcrossTheArena) {
    Entity far = spawn(5000.0f, 5000.0f, 1);
    EXPECT_EQ(indexed.FindNearestEnemy({0.0f, 0.0f}, 0), far);
}

TEST_F(TargetingTest, NoEnemiesYieldsInvalid) {
    spawn(10.0f, 10.0f, 0);
    EXPECT_FALSE(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 100.0f).isValid());
}

TEST_F(TargetingTest, IsTargetableNeedsLivingHealthPositionAndTeam) {
    Entity unit = spawn(0.0f, 0.0f, 0);
    Entity corpse = spawn(0.0f, 0.0f, 1, 0.0f);
    Entity bare = mgr.Create();
    positions.Add(bare, 0.0f, 0.0f);

    EXPECT_TRUE(linear.IsTargetable(unit));
    EXPECT_FALSE(linear.IsTargetable(corpse));
    EXPECT_FALSE(linear.IsTargetable(bare));
    EXPECT_FALSE(linear.IsTargetable(Entity::invalid()));
}

// ═══════════════════════════════════════════════════════════════════════════
// Index desync repair
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(TargetingTest, StaleIndexEntryIsMovedAndRequeried) {
    Entity runner = spawn(100.0f, 0.0f, 1);
    // Moved without telling the index.
    positions.Get(runner).Set({500.0f, 0.0f});

    EXPECT_FALSE(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 150.0f).isValid());
    EXPECT_EQ(indexed.RepairCount(), 1u);

    auto where = index.IndexedPosition(runner);
    ASSERT_TRUE(where.has_value());
    EXPECT_FLOAT_EQ(where->x, 500.0f);

    // The repaired entry is found at its real position.
    EXPECT_EQ(indexed.FindNearestEnemy({450.0f, 0.0f}, 0, 100.0f), runner);
    EXPECT_EQ(indexed.RepairCount(), 1u);
}

TEST_F(TargetingTest, EntryWithoutComponentsIsDropped) {
    Entity ghost = spawn(20.0f, 0.0f, 1);
    Entity real = spawn(60.0f, 0.0f, 1);
    healths.Remove(ghost);

    EXPECT_EQ(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 100.0f), real);
    EXPECT_FALSE(index.Contains(ghost));
    EXPECT_EQ(indexed.RepairCount(), 1u);
}

TEST_F(TargetingTest, EnemyMovedIntoRangeThroughStoreIsFound) {
    Entity target = spawn(1000.0f, 1000.0f, 1);
    EXPECT_FALSE(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 100.0f).isValid());
    EXPECT_EQ(indexed.RepairCount(), 0u);

    // Between ticks the unit walks into range; only its Position changes.
    positions.Get(target).Set({50.0f, 0.0f});
    indexed.MarkUnverified();

    EXPECT_EQ(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 100.0f), target);
    EXPECT_EQ(indexed.RepairCount(), 1u);
    EXPECT_TRUE(indexed.IsVerified());
}

TEST_F(TargetingTest, UnindexedEnemyIsInsertedBeforeFirstQuery) {
    Entity target = spawn(40.0f, 0.0f, 1);
    index.Remove(target);

    EXPECT_EQ(indexed.FindNearestEnemy({0.0f, 0.0f}, 0, 100.0f), target);
    EXPECT_TRUE(index.Contains(target));
    EXPECT_EQ(indexed.RepairCount(), 1u);
}

TEST_F(TargetingTest, ReconcileWithoutIndexDoesNothing) {
    Entity target = spawn(40.0f, 0.0f, 1);
    index.Remove(target);

    EXPECT_EQ(linear.Reconcile(), 0u);
    EXPECT_FALSE(index.Contains(target));
}

TEST_F(TargetingTest, LinearScanIgnoresIndexState) {
    Entity runner = spawn(100.0f, 0.0f, 1);
    positions.Get(runner).Set({30.0f, 0.0f});
    index.Remove(runner);

    EXPECT_EQ(linear.FindNearestEnemy({0.0f, 0.0f}, 0, 50.0f), runner);
    EXPECT_EQ(linear.RepairCount(), 0u);
}

TEST_F(TargetingTest, AttachIndexSwitchesStrategy) {
    EXPECT_EQ(linear.Index(), nullptr);
    linear.AttachIndex(&index);
    EXPECT_EQ(linear.Index(), &index);
    EXPECT_FALSE(linear.IsVerified());
    linear.AttachIndex(nullptr);
    EXPECT_EQ(linear.Index(), nullptr);
}
