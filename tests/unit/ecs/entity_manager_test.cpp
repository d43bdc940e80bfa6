#include <gtest/gtest.h>

#include <unordered_set>
#include <vector>

#include "arena/ecs/component_storage.hpp"
#include "arena/ecs/entity_manager.hpp"

using namespace arena::ecs;

// ── Test component types ────────────────────────────────────────────────────

struct Position {
    float x = 0.0f;
    float y = 0.0f;
};

struct Health {
    int32_t current = 100;
    int32_t max = 100;
};

struct Tag {};

// ===========================================================================
// Entity handle
// ===========================================================================

TEST(EntityTest, DefaultIsInvalid) {
    Entity e;
    EXPECT_FALSE(e.isValid());
    EXPECT_EQ(e, Entity::invalid());
}

TEST(EntityTest, PacksIdAndVersion) {
    Entity e(1234, 7);
    EXPECT_EQ(e.id(), 1234u);
    EXPECT_EQ(e.version(), 7u);
    EXPECT_TRUE(e.isValid());
}

TEST(EntityTest, IdLessIgnoresVersion) {
    EntityIdLess less;
    EXPECT_TRUE(less(Entity(1, 9), Entity(2, 0)));
    EXPECT_FALSE(less(Entity(2, 0), Entity(1, 9)));
    EXPECT_FALSE(less(Entity(3, 0), Entity(3, 1)));
}

TEST(EntityTest, HashDistinguishesVersions) {
    std::unordered_set<Entity> set;
    set.insert(Entity(5, 0));
    set.insert(Entity(5, 1));
    EXPECT_EQ(set.size(), 2u);
}

// ===========================================================================
// EntityManager: creation
// ===========================================================================

TEST(EntityManagerTest, CreateReturnsValidEntity) {
    EntityManager mgr;
    Entity e = mgr.Create();
    EXPECT_TRUE(e.isValid());
    EXPECT_TRUE(mgr.IsAlive(e));
}

TEST(EntityManagerTest, CreateAssignsSequentialIds) {
    EntityManager mgr;
    Entity a = mgr.Create();
    Entity b = mgr.Create();
    Entity c = mgr.Create();

    EXPECT_EQ(a.id(), 0u);
    EXPECT_EQ(b.id(), 1u);
    EXPECT_EQ(c.id(), 2u);
    EXPECT_EQ(mgr.Count(), 3u);
    EXPECT_EQ(mgr.Capacity(), 3u);
}

TEST(EntityManagerTest, InvalidEntityIsNeverAlive) {
    EntityManager mgr;
    EXPECT_FALSE(mgr.IsAlive(Entity::invalid()));
    EXPECT_FALSE(mgr.IsAlive(Entity(40, 0)));
}

// ===========================================================================
// EntityManager: destruction and recycling
// ===========================================================================

TEST(EntityManagerTest, DestroyMakesEntityDead) {
    EntityManager mgr;
    Entity e = mgr.Create();
    mgr.Destroy(e);

    EXPECT_FALSE(mgr.IsAlive(e));
    EXPECT_EQ(mgr.Count(), 0u);
}

TEST(EntityManagerTest, DestroyTwiceIsNoOp) {
    EntityManager mgr;
    Entity e = mgr.Create();
    [[maybe_unused]] Entity other = mgr.Create();
    mgr.Destroy(e);
    mgr.Destroy(e);

    EXPECT_EQ(mgr.Count(), 1u);
}

TEST(EntityManagerTest, RecycledIdGetsNewVersion) {
    EntityManager mgr;
    Entity first = mgr.Create();
    mgr.Destroy(first);

    Entity second = mgr.Create();
    EXPECT_EQ(second.id(), first.id());
    EXPECT_EQ(second.version(), static_cast<uint8_t>(first.version() + 1));
    EXPECT_TRUE(mgr.IsAlive(second));
    EXPECT_FALSE(mgr.IsAlive(first));
}

TEST(EntityManagerTest, LowestReleasedIdIsReusedFirst) {
    EntityManager mgr;
    Entity a = mgr.Create();
    Entity b = mgr.Create();
    Entity c = mgr.Create();

    mgr.Destroy(c);
    mgr.Destroy(a);
    mgr.Destroy(b);

    // Release order does not matter, only the ids.
    EXPECT_EQ(mgr.Create().id(), a.id());
    EXPECT_EQ(mgr.Create().id(), b.id());
    EXPECT_EQ(mgr.Create().id(), c.id());
    EXPECT_EQ(mgr.Create().id(), 3u);
    EXPECT_EQ(mgr.Capacity(), 4u);
}

TEST(EntityManagerTest, SameLifecycleYieldsSameHandles) {
    auto run = [] {
        EntityManager mgr;
        std::vector<Entity> units;
        for (int i = 0; i < 6; ++i) {
            units.push_back(mgr.Create());
        }
        mgr.DestroyDeferred(units[4]);
        mgr.DestroyDeferred(units[1]);
        mgr.FlushDeferred();
        units.push_back(mgr.Create());
        units.push_back(mgr.Create());
        return units;
    };

    const auto first = run();
    const auto second = run();
    EXPECT_EQ(first, second);
    EXPECT_EQ(first[6], Entity(1, 1));
    EXPECT_EQ(first[7], Entity(4, 1));
}

TEST(EntityManagerTest, VersionWrapsAfter256Recycles) {
    EntityManager mgr;
    Entity e = mgr.Create();
    for (int i = 0; i < 256; ++i) {
        mgr.Destroy(e);
        e = mgr.Create();
    }
    EXPECT_EQ(e.id(), 0u);
    EXPECT_EQ(e.version(), 0u);
    EXPECT_TRUE(mgr.IsAlive(e));
}

// ===========================================================================
// EntityManager: deferred destruction
// ===========================================================================

TEST(EntityManagerTest, DeferredDestroyWaitsForFlush) {
    EntityManager mgr;
    Entity e = mgr.Create();
    mgr.DestroyDeferred(e);

    EXPECT_TRUE(mgr.IsAlive(e));
    EXPECT_EQ(mgr.PendingCount(), 1u);

    EXPECT_EQ(mgr.FlushDeferred(), 1u);
    EXPECT_FALSE(mgr.IsAlive(e));
    EXPECT_EQ(mgr.PendingCount(), 0u);
}

TEST(EntityManagerTest, DestroyedWhileMarkedIsNotCountedAtFlush) {
    EntityManager mgr;
    Entity e = mgr.Create();
    mgr.DestroyDeferred(e);
    mgr.Destroy(e);

    EXPECT_EQ(mgr.FlushDeferred(), 0u);
    EXPECT_EQ(mgr.Count(), 0u);

    // The recycled slot can be marked again.
    Entity again = mgr.Create();
    mgr.DestroyDeferred(again);
    EXPECT_EQ(mgr.PendingCount(), 1u);
}

TEST(EntityManagerTest, DeferredDuplicatesDestroyOnce) {
    EntityManager mgr;
    Entity e = mgr.Create();
    [[maybe_unused]] Entity keep = mgr.Create();
    mgr.DestroyDeferred(e);
    mgr.DestroyDeferred(e);
    EXPECT_EQ(mgr.PendingCount(), 1u);
    EXPECT_EQ(mgr.FlushDeferred(), 1u);

    EXPECT_EQ(mgr.Count(), 1u);
    // A single recycle: the next handle carries version 1, not 2.
    Entity reused = mgr.Create();
    EXPECT_EQ(reused.id(), e.id());
    EXPECT_EQ(reused.version(), 1u);
}

TEST(EntityManagerTest, DeferredDestroyOfDeadEntityIsIgnored) {
    EntityManager mgr;
    Entity e = mgr.Create();
    mgr.Destroy(e);
    mgr.DestroyDeferred(e);
    EXPECT_EQ(mgr.PendingCount(), 0u);
}

// ===========================================================================
// EntityManager: registered storages
// ===========================================================================

TEST(EntityManagerTest, DestroyRemovesRegisteredComponents) {
    EntityManager mgr;
    ComponentStorage<Position> positions;
    ComponentStorage<Health> healths;
    ComponentStorage<Tag> tags;
    mgr.RegisterStorage(&positions);
    mgr.RegisterStorage(&healths);
    mgr.RegisterStorage(&tags);

    Entity a = mgr.Create();
    Entity b = mgr.Create();
    positions.Add(a, 1.0f, 2.0f);
    healths.Add(a);
    tags.Add(a);
    positions.Add(b, 3.0f, 4.0f);

    mgr.Destroy(a);

    EXPECT_FALSE(positions.Has(a));
    EXPECT_FALSE(healths.Has(a));
    EXPECT_FALSE(tags.Has(a));
    ASSERT_TRUE(positions.Has(b));
    EXPECT_FLOAT_EQ(positions.Get(b).x, 3.0f);
}

TEST(EntityManagerTest, FlushDeferredRemovesRegisteredComponents) {
    EntityManager mgr;
    ComponentStorage<Health> healths;
    mgr.RegisterStorage(&healths);

    Entity e = mgr.Create();
    healths.Add(e, 0, 100);
    mgr.DestroyDeferred(e);
    EXPECT_TRUE(healths.Has(e));

    mgr.FlushDeferred();
    EXPECT_FALSE(healths.Has(e));
    EXPECT_TRUE(healths.Empty());
}

TEST(EntityManagerTest, StaleHandleDoesNotSeeRecycledComponents) {
    EntityManager mgr;
    ComponentStorage<Health> healths;
    mgr.RegisterStorage(&healths);

    Entity old = mgr.Create();
    mgr.Destroy(old);
    Entity fresh = mgr.Create();
    healths.Add(fresh, 50, 100);

    EXPECT_TRUE(healths.Has(fresh));
    EXPECT_FALSE(healths.Has(old));
    EXPECT_EQ(healths.Find(old), nullptr);
}
