#include <gtest/gtest.h>
#include <memory>
#include <ranges>
#include <vector>

#include "../TestComponents.hpp"
#include "Quarry/Component/ComponentRegistry.hpp"
#include "Quarry/Storage/ComponentIndex.hpp"
#include "Quarry/Storage/EntityDirectory.hpp"

using namespace Quarry;
using namespace Quarry::Test;

class EntityDirectoryTest : public ::testing::Test
{
protected:
    ComponentRegistry registry;
    std::unique_ptr<ComponentIndex> index;
    std::unique_ptr<EntityDirectory> directory;

    const Entity e1{1, 1};
    const Entity e2{2, 1};

    void SetUp() override
    {
        ASSERT_TRUE(registry.RegisterComponent<Position>());
        ASSERT_TRUE(registry.RegisterComponent<Velocity>());
        ASSERT_TRUE((registry.RegisterComponent<Dummy, ICompType1, ICompType2>({.netId = 7})));
        ASSERT_TRUE((registry.RegisterComponent<Marker, ICompType1>()));

        index = std::make_unique<ComponentIndex>(registry);
        directory = std::make_unique<EntityDirectory>(registry, *index);
        directory->Track(e1);
        directory->Track(e2);
    }

    void TearDown() override
    {
        directory.reset();
        index.reset();
    }
};

TEST_F(EntityDirectoryTest, AttachThenGet)
{
    auto attached = directory->Attach(e1, Position{1.0f, 2.0f, 3.0f});
    ASSERT_TRUE(attached);

    auto got = directory->Get<Position>(e1);
    ASSERT_TRUE(got);
    EXPECT_EQ(*got, *attached);
    EXPECT_FLOAT_EQ((*got)->y, 2.0f);

    EXPECT_EQ(directory->TryGet<Position>(e1), *attached);
    EXPECT_EQ(directory->TryGet(e1, TypeID<Position>::Value()), static_cast<void*>(*attached));
    EXPECT_EQ(index->Bucket(TypeID<Position>::Value()).size(), 1u);
}

TEST_F(EntityDirectoryTest, GetMissingComponentFails)
{
    auto missing = directory->Get<Velocity>(e1);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.Error(), ErrorCode::ComponentNotFound);
    EXPECT_EQ(directory->TryGet<Velocity>(e1), nullptr);
}

TEST_F(EntityDirectoryTest, UntrackedEntityIsInvalid)
{
    const Entity stranger(9, 1);

    auto attached = directory->Attach(stranger, Position{});
    ASSERT_FALSE(attached);
    EXPECT_EQ(attached.Error(), ErrorCode::InvalidEntity);

    auto got = directory->Get<Position>(stranger);
    ASSERT_FALSE(got);
    EXPECT_EQ(got.Error(), ErrorCode::InvalidEntity);
}

TEST_F(EntityDirectoryTest, UnregisteredTypeIsRejected)
{
    auto attached = directory->Attach(e1, Health{});
    ASSERT_FALSE(attached);
    EXPECT_EQ(attached.Error(), ErrorCode::InvalidComponent);
    EXPECT_EQ(directory->LiveCount(e1), 0u);
}

TEST_F(EntityDirectoryTest, SecondAttachWithoutOverwriteFails)
{
    auto original = directory->Attach(e1, Position{1.0f, 0.0f, 0.0f});
    ASSERT_TRUE(original);

    auto second = directory->Attach(e1, Position{2.0f, 0.0f, 0.0f});
    ASSERT_FALSE(second);
    EXPECT_EQ(second.Error(), ErrorCode::AlreadyAttached);

    // Original untouched
    auto got = directory->Get<Position>(e1);
    ASSERT_TRUE(got);
    EXPECT_EQ(*got, *original);
    EXPECT_FLOAT_EQ((*got)->x, 1.0f);
    EXPECT_EQ(index->Bucket(TypeID<Position>::Value()).size(), 1u);
}

TEST_F(EntityDirectoryTest, OverwriteReplacesAndReportsDisplaced)
{
    std::vector<float> displaced;
    directory->SetDisplacedHandler([&](ComponentRecord& record)
    {
        EXPECT_TRUE(record.IsCulled());
        displaced.push_back(static_cast<Position*>(record.Get())->x);
    });

    ASSERT_TRUE(directory->Attach(e1, Position{1.0f, 0.0f, 0.0f}));
    auto replaced = directory->Attach(e1, Position{2.0f, 0.0f, 0.0f}, true);
    ASSERT_TRUE(replaced);

    ASSERT_EQ(displaced.size(), 1u);
    EXPECT_FLOAT_EQ(displaced[0], 1.0f);

    EXPECT_FLOAT_EQ(directory->TryGet<Position>(e1)->x, 2.0f);
    EXPECT_EQ(directory->Records(e1).size(), 1u);

    const auto& bucket = index->Bucket(TypeID<Position>::Value());
    ASSERT_EQ(bucket.size(), 1u);
    EXPECT_EQ(bucket[0]->Get(), static_cast<void*>(*replaced));
}

TEST_F(EntityDirectoryTest, GetByNetworkId)
{
    auto dummy = directory->Attach(e1, Dummy(3));
    ASSERT_TRUE(dummy);

    auto byNet = directory->GetByNetID(e1, 7);
    ASSERT_TRUE(byNet);
    EXPECT_EQ(*byNet, static_cast<void*>(*dummy));

    auto unknown = directory->GetByNetID(e1, 99);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.Error(), ErrorCode::UnknownNetworkId);

    auto absent = directory->GetByNetID(e2, 7);
    ASSERT_FALSE(absent);
    EXPECT_EQ(absent.Error(), ErrorCode::ComponentNotFound);
}

TEST_F(EntityDirectoryTest, EnumerateSkipsPendingRecords)
{
    ASSERT_TRUE(directory->Attach(e1, Position{}));
    ASSERT_TRUE(directory->Attach(e1, Velocity{}));
    ASSERT_TRUE(directory->Attach(e1, Dummy{}));

    directory->FindRecord(e1, TypeID<Velocity>::Value())->SetStage(ComponentStage::PendingRemoval);

    std::vector<ComponentTypeID> types;
    for (const ComponentRef& ref : directory->Enumerate(e1))
    {
        EXPECT_EQ(ref.entity, e1);
        types.push_back(ref.type);
    }

    ASSERT_EQ(types.size(), 2u);
    EXPECT_EQ(types[0], TypeID<Position>::Value());
    EXPECT_EQ(types[1], TypeID<Dummy>::Value());

    EXPECT_EQ(directory->TryGet<Velocity>(e1), nullptr);
    EXPECT_EQ(directory->LiveCount(e1), 2u);

    // Restartable
    auto view = directory->Enumerate(e1);
    EXPECT_EQ(std::ranges::distance(view), 2);
    EXPECT_EQ(std::ranges::distance(view), 2);
}

TEST_F(EntityDirectoryTest, PendingAndLiveOfSameTypeCoexist)
{
    ASSERT_TRUE(directory->Attach(e1, Position{1.0f, 0.0f, 0.0f}));
    directory->FindRecord(e1, TypeID<Position>::Value())->SetStage(ComponentStage::PendingRemoval);

    auto fresh = directory->Attach(e1, Position{2.0f, 0.0f, 0.0f});
    ASSERT_TRUE(fresh);
    EXPECT_EQ(directory->Records(e1).size(), 2u);
    EXPECT_FLOAT_EQ(directory->TryGet<Position>(e1)->x, 2.0f);
}

TEST_F(EntityDirectoryTest, EnumerateByCapability)
{
    auto dummy = directory->Attach(e1, Dummy(1));
    auto marker = directory->Attach(e1, Marker{});
    ASSERT_TRUE(directory->Attach(e1, Position{}));
    ASSERT_TRUE(dummy);
    ASSERT_TRUE(marker);

    std::vector<ICompType1*> type1;
    for (ICompType1* component : directory->EnumerateByCapability<ICompType1>(e1))
        type1.push_back(component);

    ASSERT_EQ(type1.size(), 2u);
    EXPECT_EQ(type1[0], static_cast<ICompType1*>(*dummy));
    EXPECT_EQ(type1[1], static_cast<ICompType1*>(*marker));
    EXPECT_EQ(type1[1]->Kind1(), 10);

    std::vector<ICompType2*> type2;
    for (ICompType2* component : directory->EnumerateByCapability<ICompType2>(e1))
        type2.push_back(component);

    ASSERT_EQ(type2.size(), 1u);
    EXPECT_EQ(type2[0], static_cast<ICompType2*>(*dummy));
    EXPECT_EQ(type2[0]->Kind2(), 2);
}

TEST_F(EntityDirectoryTest, ReleaseHandsOverOwnership)
{
    ASSERT_TRUE(directory->Attach(e1, Position{}));
    ComponentRecord* record = directory->FindRecord(e1, TypeID<Position>::Value());
    ASSERT_NE(record, nullptr);

    index->Remove(*record);
    std::unique_ptr<ComponentRecord> owned = directory->Release(*record);
    ASSERT_EQ(owned.get(), record);
    EXPECT_TRUE(directory->Records(e1).empty());
    EXPECT_FALSE(directory->Release(*record));
}

TEST_F(EntityDirectoryTest, UntrackDetachesFromIndex)
{
    ASSERT_TRUE(directory->Attach(e1, Position{}));
    ASSERT_TRUE(directory->Attach(e2, Position{}));

    EXPECT_TRUE(directory->Untrack(e1));
    EXPECT_FALSE(directory->Contains(e1));
    EXPECT_FALSE(directory->Untrack(e1));

    const auto& bucket = index->Bucket(TypeID<Position>::Value());
    ASSERT_EQ(bucket.size(), 1u);
    EXPECT_EQ(bucket[0]->GetOwner(), e2);
}
