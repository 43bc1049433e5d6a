#include <gtest/gtest.h>
#include <memory>
#include <utility>
#include <vector>

#include "Quarry/Core/Signal.hpp"
#include "Quarry/Registry/SubscriptionLedger.hpp"

using namespace Quarry;

class SubscriptionLedgerTest : public ::testing::Test
{
protected:
    SignalManager signals{Signal::All};
    std::unique_ptr<SubscriptionLedger> ledger;

    std::vector<std::pair<Entity, SubscriberID>> added;
    std::vector<std::pair<Entity, SubscriberID>> removed;

    const Entity e1{1, 1};
    const Entity e2{2, 1};

    void SetUp() override
    {
        ledger = std::make_unique<SubscriptionLedger>(signals);
        signals.On<Events::SubscriptionAdded>().Register([this](const Events::SubscriptionAdded& e)
        {
            added.emplace_back(e.entity, e.subscriber);
        });
        signals.On<Events::SubscriptionRemoved>().Register([this](const Events::SubscriptionRemoved& e)
        {
            removed.emplace_back(e.entity, e.subscriber);
        });
    }
};

TEST_F(SubscriptionLedgerTest, SubscribeRecordsBothSides)
{
    EXPECT_TRUE(ledger->Subscribe(e1, 10));

    EXPECT_TRUE(ledger->IsSubscribed(e1, 10));
    EXPECT_EQ(ledger->GetSubscribers(e1), std::vector<SubscriberID>{10});
    EXPECT_EQ(ledger->GetSubscriptions(10), std::vector<Entity>{e1});
    ASSERT_EQ(added.size(), 1u);
    EXPECT_EQ(added[0].first, e1);
    EXPECT_EQ(added[0].second, 10u);
}

TEST_F(SubscriptionLedgerTest, SubscribeTwiceIsIdempotent)
{
    EXPECT_TRUE(ledger->Subscribe(e1, 10));
    EXPECT_FALSE(ledger->Subscribe(e1, 10));

    EXPECT_EQ(added.size(), 1u);
    EXPECT_EQ(ledger->SubscriberCount(e1), 1u);
    EXPECT_EQ(ledger->GetSubscriptions(10).size(), 1u);
}

TEST_F(SubscriptionLedgerTest, UnsubscribeNeverSubscribedEmitsNothing)
{
    EXPECT_FALSE(ledger->Unsubscribe(e1, 10));
    EXPECT_TRUE(removed.empty());

    ASSERT_TRUE(ledger->Subscribe(e1, 10));
    EXPECT_FALSE(ledger->Unsubscribe(e1, 11));
    EXPECT_FALSE(ledger->Unsubscribe(e2, 10));
    EXPECT_TRUE(removed.empty());
}

TEST_F(SubscriptionLedgerTest, UnsubscribeClearsBothSidesAndNotifies)
{
    ASSERT_TRUE(ledger->Subscribe(e1, 10));
    ASSERT_TRUE(ledger->Subscribe(e2, 10));

    EXPECT_TRUE(ledger->Unsubscribe(e1, 10));
    EXPECT_FALSE(ledger->IsSubscribed(e1, 10));
    EXPECT_EQ(ledger->GetSubscriptions(10), std::vector<Entity>{e2});
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].first, e1);
}

TEST_F(SubscriptionLedgerTest, EntityShutdownCascadesSilently)
{
    ASSERT_TRUE(ledger->Subscribe(e1, 1));
    ASSERT_TRUE(ledger->Subscribe(e1, 2));
    ASSERT_TRUE(ledger->Subscribe(e2, 2));

    EXPECT_EQ(ledger->OnEntityShutdown(e1), 2u);

    EXPECT_TRUE(removed.empty());
    EXPECT_TRUE(ledger->GetSubscribers(e1).empty());
    EXPECT_TRUE(ledger->GetSubscriptions(1).empty());
    EXPECT_EQ(ledger->GetSubscriptions(2), std::vector<Entity>{e2});

    EXPECT_EQ(ledger->OnEntityShutdown(e1), 0u);
}

TEST_F(SubscriptionLedgerTest, SubscriberDisconnectUnsubscribesEverything)
{
    ASSERT_TRUE(ledger->Subscribe(e1, 5));
    ASSERT_TRUE(ledger->Subscribe(e2, 5));
    ASSERT_TRUE(ledger->Subscribe(e2, 6));

    EXPECT_EQ(ledger->OnSubscriberDisconnected(5), 2u);

    ASSERT_EQ(removed.size(), 2u);
    EXPECT_EQ(removed[0].first, e1);
    EXPECT_EQ(removed[1].first, e2);
    EXPECT_TRUE(ledger->GetSubscriptions(5).empty());
    EXPECT_EQ(ledger->GetSubscribers(e2), std::vector<SubscriberID>{6});
}

TEST_F(SubscriptionLedgerTest, EntityHandlersReceiveOnlyTheirEntity)
{
    int hits = 0;
    signals.OnEntity<Events::SubscriptionAdded>(e2).Register([&hits](const Events::SubscriptionAdded&) { ++hits; });

    ASSERT_TRUE(ledger->Subscribe(e1, 1));
    ASSERT_TRUE(ledger->Subscribe(e2, 1));
    EXPECT_EQ(hits, 1);
}

TEST_F(SubscriptionLedgerTest, ClearDropsEverythingSilently)
{
    ASSERT_TRUE(ledger->Subscribe(e1, 1));
    ledger->Clear();

    EXPECT_TRUE(ledger->IsEmpty());
    EXPECT_FALSE(ledger->IsSubscribed(e1, 1));
    EXPECT_TRUE(removed.empty());
}
