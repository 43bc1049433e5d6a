#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <unordered_set>
#include <vector>

#include "Quarry/Entity/Entity.hpp"
#include "Quarry/Entity/EntityManager.hpp"

class EntityTest : public ::testing::Test
{
};

TEST_F(EntityTest, DefaultIsInvalid)
{
    Quarry::Entity entity;

    EXPECT_FALSE(entity.IsValid());
    EXPECT_FALSE(static_cast<bool>(entity));
    EXPECT_EQ(entity, Quarry::Entity::Invalid());
}

TEST_F(EntityTest, PacksIdAndVersion)
{
    Quarry::Entity entity(100, 5);

    EXPECT_TRUE(entity.IsValid());
    EXPECT_EQ(entity.GetID(), 100u);
    EXPECT_EQ(entity.GetVersion(), 5u);

    Quarry::Entity raw(entity.GetValue());
    EXPECT_EQ(raw, entity);
}

TEST_F(EntityTest, HashDistinguishesVersions)
{
    std::unordered_set<Quarry::Entity> set;
    set.insert(Quarry::Entity(1, 1));
    set.insert(Quarry::Entity(1, 2));
    set.insert(Quarry::Entity(1, 1));
    EXPECT_EQ(set.size(), 2u);
}

class EntityManagerTest : public ::testing::Test
{
protected:
    std::unique_ptr<Quarry::EntityManager> manager;

    void SetUp() override
    {
        manager = std::make_unique<Quarry::EntityManager>(Quarry::EntityManager::Config{16});
    }
};

TEST_F(EntityManagerTest, CreatesSequentialIds)
{
    auto a = manager->Create();
    auto b = manager->Create();

    EXPECT_EQ(a.GetID(), 0u);
    EXPECT_EQ(b.GetID(), 1u);
    EXPECT_EQ(a.GetVersion(), Quarry::EntityManager::INITIAL_VERSION);
    EXPECT_EQ(manager->Size(), 2u);
    EXPECT_TRUE(manager->IsValid(a));
}

TEST_F(EntityManagerTest, RecyclesWithNewVersion)
{
    auto a = manager->Create();
    ASSERT_TRUE(manager->Destroy(a));
    EXPECT_FALSE(manager->IsValid(a));
    EXPECT_FALSE(manager->Destroy(a));

    auto b = manager->Create();
    EXPECT_EQ(b.GetID(), a.GetID());
    EXPECT_EQ(b.GetVersion(), a.GetVersion() + 1);
    EXPECT_FALSE(manager->IsValid(a));
    EXPECT_TRUE(manager->IsValid(b));
}

TEST_F(EntityManagerTest, VersionWrapsPastZero)
{
    auto entity = manager->Create();
    for (int i = 0; i < 255; ++i)
    {
        ASSERT_TRUE(manager->Destroy(entity));
        entity = manager->Create();
        ASSERT_NE(entity.GetVersion(), Quarry::EntityManager::NULL_VERSION);
    }
    EXPECT_EQ(entity.GetID(), 0u);
    EXPECT_EQ(entity.GetVersion(), 1u);
}

TEST_F(EntityManagerTest, ForEachVisitsLiveEntities)
{
    std::vector<Quarry::Entity> created;
    for (int i = 0; i < 5; ++i)
        created.push_back(manager->Create());

    manager->Destroy(created[2]);

    std::vector<Quarry::Entity> visited;
    manager->ForEach([&](Quarry::Entity e) { visited.push_back(e); });

    EXPECT_EQ(visited.size(), 4u);
    EXPECT_EQ(std::count(visited.begin(), visited.end(), created[2]), 0);
}

TEST_F(EntityManagerTest, ClearForgetsEverything)
{
    auto entity = manager->Create();
    manager->Clear();

    EXPECT_TRUE(manager->IsEmpty());
    EXPECT_FALSE(manager->IsValid(entity));
    EXPECT_EQ(manager->Capacity(), 0u);
}
