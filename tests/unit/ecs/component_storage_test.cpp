#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "evolve/ecs/component_storage.hpp"
#include "evolve/ecs/entity.hpp"

using namespace evolve::ecs;

namespace {

struct Health {
    float current = 100.0f;
    float max = 100.0f;
};

struct Tags {
    std::vector<std::string> values;
};

} // namespace

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
    EXPECT_TRUE(e.isValid());
    EXPECT_EQ(e.id(), 1234u);
    EXPECT_EQ(e.version(), 7u);
    EXPECT_EQ(Entity::fromRaw(e.raw), e);
}

TEST(EntityTest, VersionDistinguishesHandles) {
    EXPECT_NE(Entity(3, 0), Entity(3, 1));
    EXPECT_LT(Entity(2, 0), Entity(3, 0));
}

// ===========================================================================
// ComponentStorage
// ===========================================================================

TEST(ComponentStorageTest, AddAndGet) {
    ComponentStorage<Health> storage;
    Entity e(0, 0);
    storage.Add(e, Health{40.0f, 120.0f});

    ASSERT_TRUE(storage.Has(e));
    EXPECT_FLOAT_EQ(storage.Get(e).current, 40.0f);
    EXPECT_FLOAT_EQ(storage.Get(e).max, 120.0f);
    EXPECT_EQ(storage.Size(), 1u);
}

TEST(ComponentStorageTest, TryGetMissingIsNull) {
    ComponentStorage<Health> storage;
    EXPECT_EQ(storage.TryGet(Entity(5, 0)), nullptr);
    EXPECT_EQ(storage.TryGet(Entity::invalid()), nullptr);
}

TEST(ComponentStorageTest, StaleHandleDoesNotSeeSuccessor) {
    ComponentStorage<Health> storage;
    storage.Add(Entity(2, 1));
    EXPECT_FALSE(storage.Has(Entity(2, 0)));
    EXPECT_TRUE(storage.Has(Entity(2, 1)));
}

TEST(ComponentStorageTest, RemoveKeepsOthersReachable) {
    ComponentStorage<Health> storage;
    Entity a(0, 0), b(1, 0), c(2, 0);
    storage.Add(a, Health{1.0f, 1.0f});
    storage.Add(b, Health{2.0f, 2.0f});
    storage.Add(c, Health{3.0f, 3.0f});

    storage.Remove(a);

    EXPECT_FALSE(storage.Has(a));
    EXPECT_EQ(storage.Size(), 2u);
    EXPECT_FLOAT_EQ(storage.Get(b).current, 2.0f);
    EXPECT_FLOAT_EQ(storage.Get(c).current, 3.0f);
}

TEST(ComponentStorageTest, RemoveMissingIsNoop) {
    ComponentStorage<Health> storage;
    storage.Remove(Entity(9, 0));
    EXPECT_TRUE(storage.Empty());
}

TEST(ComponentStorageTest, EntityAtFollowsDenseOrder) {
    ComponentStorage<Tags> storage;
    Entity a(4, 0), b(1, 0);
    storage.Add(a);
    storage.Add(b);

    EXPECT_EQ(storage.EntityAt(0), a);
    EXPECT_EQ(storage.EntityAt(1), b);

    storage.Remove(a);
    EXPECT_EQ(storage.EntityAt(0), b);
}

TEST(ComponentStorageTest, GetOrAddCreatesOnce) {
    ComponentStorage<Tags> storage;
    Entity e(0, 0);
    storage.GetOrAdd(e).values.push_back("burning");
    storage.GetOrAdd(e).values.push_back("slowed");

    EXPECT_EQ(storage.Size(), 1u);
    EXPECT_EQ(storage.Get(e).values.size(), 2u);
}

TEST(ComponentStorageTest, IterationVisitsEveryComponent) {
    ComponentStorage<Health> storage;
    for (uint32_t i = 0; i < 4; ++i) {
        storage.Add(Entity(i, 0), Health{static_cast<float>(i), 10.0f});
    }
    float sum = 0.0f;
    for (const auto& h : storage) {
        sum += h.current;
    }
    EXPECT_FLOAT_EQ(sum, 6.0f);
}

TEST(ComponentStorageTest, ClearEmptiesStorage) {
    ComponentStorage<Health> storage;
    storage.Add(Entity(0, 0));
    storage.Add(Entity(1, 0));
    storage.Clear();
    EXPECT_TRUE(storage.Empty());
    EXPECT_FALSE(storage.Has(Entity(0, 0)));
}
