#include <gtest/gtest.h>
#include <memory>
#include <vector>

#include "../TestComponents.hpp"
#include "Quarry/Registry/Registry.hpp"

using namespace Quarry;
using namespace Quarry::Test;

class QueryEngineTest : public ::testing::Test
{
protected:
    std::unique_ptr<Registry> registry;

    void SetUp() override
    {
        registry = std::make_unique<Registry>();
        ASSERT_TRUE((registry->RegisterComponent<Dummy, ICompType1, ICompType2>({.netId = 7})));
        ASSERT_TRUE((registry->RegisterComponent<Marker, ICompType1>()));
        ASSERT_TRUE((registry->RegisterComponent<Health, IDamageable>()));
        ASSERT_TRUE(registry->RegisterComponent<Position>());
    }

    void TearDown() override
    {
        registry.reset();
    }

    const QueryEngine& Engine() const { return registry->GetQueryEngine(); }
};

TEST_F(QueryEngineTest, QueryYieldsTriplesInAttachOrder)
{
    Entity a = registry->CreateEntity();
    Entity b = registry->CreateEntity();
    ASSERT_TRUE(registry->AddComponent<Dummy>(b, 2));
    ASSERT_TRUE(registry->AddComponent<Dummy>(a, 1));

    std::vector<int> values;
    std::vector<Entity> owners;
    for (auto&& item : Engine().Query<Dummy>())
    {
        EXPECT_EQ(item.type, TypeID<Dummy>::Value());
        owners.push_back(item.entity);
        values.push_back(item.component.value);
    }

    EXPECT_EQ(owners, (std::vector<Entity>{b, a}));
    EXPECT_EQ(values, (std::vector<int>{2, 1}));
}

TEST_F(QueryEngineTest, QueryGivesMutableAccess)
{
    Entity a = registry->CreateEntity();
    ASSERT_TRUE(registry->AddComponent<Dummy>(a, 1));

    for (auto&& item : Engine().Query<Dummy>())
        item.component.value = 50;

    EXPECT_EQ(registry->TryGetComponent<Dummy>(a)->value, 50);
}

TEST_F(QueryEngineTest, PendingComponentsOnlyWithIncludePending)
{
    Entity a = registry->CreateEntity();
    Entity b = registry->CreateEntity();
    ASSERT_TRUE(registry->AddComponent<Dummy>(a, 1));
    ASSERT_TRUE(registry->AddComponent<Dummy>(b, 2));
    ASSERT_TRUE(*registry->RemoveComponent<Dummy>(a));

    std::vector<Entity> live;
    for (auto&& item : Engine().Query<Dummy>())
        live.push_back(item.entity);
    EXPECT_EQ(live, std::vector<Entity>{b});

    std::vector<Entity> all;
    for (auto&& item : Engine().Query<Dummy>(true))
        all.push_back(item.entity);
    EXPECT_EQ(all, (std::vector<Entity>{a, b}));

    registry->Cull();

    std::vector<Entity> afterCull;
    for (auto&& item : Engine().Query<Dummy>(true))
        afterCull.push_back(item.entity);
    EXPECT_EQ(afterCull, std::vector<Entity>{b});
}

TEST_F(QueryEngineTest, RemovalDuringIterationIsVisibleImmediately)
{
    std::vector<Entity> entities;
    for (int i = 0; i < 4; ++i)
    {
        entities.push_back(registry->CreateEntity());
        ASSERT_TRUE(registry->AddComponent<Dummy>(entities.back(), i));
    }

    std::vector<int> visited;
    for (auto&& item : Engine().Query<Dummy>())
    {
        visited.push_back(item.component.value);
        if (item.component.value == 0)
        {
            registry->RemoveComponent<Dummy>(entities[1]);
        }
    }

    EXPECT_EQ(visited, (std::vector<int>{0, 2, 3}));
    EXPECT_EQ(registry->PendingRemovals(), 1u);
}

TEST_F(QueryEngineTest, UntypedQuery)
{
    Entity a = registry->CreateEntity();
    auto dummy = registry->AddComponent<Dummy>(a, 3);
    ASSERT_TRUE(dummy);

    std::vector<ComponentRef> refs;
    for (const ComponentRef& ref : Engine().Query(TypeID<Dummy>::Value()))
        refs.push_back(ref);

    ASSERT_EQ(refs.size(), 1u);
    EXPECT_EQ(refs[0].entity, a);
    EXPECT_EQ(refs[0].component, static_cast<void*>(*dummy));
}

TEST_F(QueryEngineTest, CapabilityQueryCoversEveryDeclaringType)
{
    Entity a = registry->CreateEntity();
    Entity b = registry->CreateEntity();
    auto dummy = registry->AddComponent<Dummy>(a, 1);
    auto marker = registry->AddComponent<Marker>(b);
    ASSERT_TRUE(registry->AddComponent<Health>(b, 10));
    ASSERT_TRUE(dummy);
    ASSERT_TRUE(marker);

    std::vector<ICompType1*> type1;
    for (auto&& item : Engine().QueryCapability<ICompType1>())
        type1.push_back(&item.component);

    ASSERT_EQ(type1.size(), 2u);
    EXPECT_EQ(type1[0], static_cast<ICompType1*>(*dummy));
    EXPECT_EQ(type1[1], static_cast<ICompType1*>(*marker));

    std::vector<Entity> type2Owners;
    for (auto&& item : Engine().QueryCapability<ICompType2>())
    {
        EXPECT_EQ(item.component.Kind2(), 2);
        type2Owners.push_back(item.entity);
    }
    EXPECT_EQ(type2Owners, std::vector<Entity>{a});

    for (auto&& item : Engine().QueryCapability<IDamageable>())
        item.component.ApplyDamage(4);
    EXPECT_EQ(registry->TryGetComponent<Health>(b)->current, 6);
}

TEST_F(QueryEngineTest, CapabilityQuerySkipsPending)
{
    Entity a = registry->CreateEntity();
    ASSERT_TRUE(registry->AddComponent<Dummy>(a, 1));
    ASSERT_TRUE(*registry->RemoveComponent<Dummy>(a));

    int count = 0;
    for (auto&& item : Engine().QueryCapability<ICompType1>())
    {
        (void)item;
        ++count;
    }
    EXPECT_EQ(count, 0);
}

TEST_F(QueryEngineTest, HasByTypeAndNetworkIdAgree)
{
    Entity a = registry->CreateEntity();
    Entity b = registry->CreateEntity();
    ASSERT_TRUE(registry->AddComponent<Dummy>(a, 1));

    EXPECT_TRUE(Engine().Has<Dummy>(a));
    EXPECT_FALSE(Engine().Has<Dummy>(b));

    auto viaNet = Engine().HasByNetID(a, 7);
    ASSERT_TRUE(viaNet);
    EXPECT_TRUE(*viaNet);

    auto otherViaNet = Engine().HasByNetID(b, 7);
    ASSERT_TRUE(otherViaNet);
    EXPECT_FALSE(*otherViaNet);

    auto unknown = Engine().HasByNetID(a, 8);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.Error(), ErrorCode::UnknownNetworkId);

    ASSERT_TRUE(*registry->RemoveComponent<Dummy>(a));
    EXPECT_FALSE(Engine().Has<Dummy>(a));
    EXPECT_FALSE(*Engine().HasByNetID(a, 7));
}

TEST_F(QueryEngineTest, ForEachAndCount)
{
    for (int i = 0; i < 3; ++i)
    {
        Entity entity = registry->CreateEntity();
        ASSERT_TRUE(registry->AddComponent<Dummy>(entity, i));
    }

    int sum = 0;
    Engine().ForEach<Dummy>([&sum](Entity, Dummy& dummy) { sum += dummy.value; });
    EXPECT_EQ(sum, 3);
    EXPECT_EQ(Engine().Count<Dummy>(), 3u);
    EXPECT_EQ(Engine().Count<Position>(), 0u);
}
