#include <gtest/gtest.h>
#include "core/errors.h"
#include "service/trade_data_service.h"
#include "support/test_fakes.h"

#include <atomic>
#include <memory>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace tradecast;
using namespace tradecast::service;
using tradecast::market::Symbol;
using tradecast::testing::FakeDelayProvider;
using tradecast::testing::FakeTradeFeedClient;
using tradecast::testing::ids_of;
using tradecast::testing::make_trade;
using tradecast::testing::ts_us;
using tradecast::testing::wait_until;

/**
 * @brief Service wired to a scripted upstream client and instant backoff
 */
class TradeDataServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        client = std::make_shared<FakeTradeFeedClient>();
        delays = std::make_shared<FakeDelayProvider>();
        service = std::make_unique<TradeDataService>(
            client,
            std::make_unique<ConnectionManager>(client, ConnectionManagerSettings{}, delays),
            std::make_unique<SubscriptionManager>(),
            std::make_unique<cache::TradeCache>());

        service->trade_received.add([this](const market::Trade& t) {
            std::lock_guard<std::mutex> lk(mutex);
            received.push_back(t.trade_id());
        });
        service->subscription_confirmed.add([this](const market::SubscriptionResponse&) { ++confirmations; });
        service->connection_lost.add([this] { ++lost; });
        service->connection_restored.add([this] { ++restored; });
    }

    void TearDown() override {
        service->stop();
    }

    std::vector<std::string> received_ids() {
        std::lock_guard<std::mutex> lk(mutex);
        return received;
    }

    std::shared_ptr<FakeTradeFeedClient> client;
    std::shared_ptr<FakeDelayProvider> delays;
    std::unique_ptr<TradeDataService> service;

    std::mutex mutex;
    std::vector<std::string> received;
    std::atomic<int> confirmations{0};
    std::atomic<int> lost{0};
    std::atomic<int> restored{0};
};

TEST(TradeDataServiceConstruction, RejectsNullCollaborators) {
    auto client = std::make_shared<FakeTradeFeedClient>();
    EXPECT_THROW(std::make_unique<TradeDataService>(
                     nullptr,
                     std::make_unique<ConnectionManager>(client, ConnectionManagerSettings{}),
                     std::make_unique<SubscriptionManager>(),
                     std::make_unique<cache::TradeCache>()),
                 std::invalid_argument);
    EXPECT_THROW(std::make_unique<TradeDataService>(
                     client,
                     std::make_unique<ConnectionManager>(client, ConnectionManagerSettings{}),
                     std::make_unique<SubscriptionManager>(),
                     nullptr),
                 std::invalid_argument);
}

TEST_F(TradeDataServiceTest, StartConnectsAndStopDisconnects) {
    service->start();
    EXPECT_TRUE(service->is_running());
    EXPECT_TRUE(service->is_connected());
    EXPECT_EQ(client->connect_calls(), 1);

    service->stop();
    EXPECT_FALSE(service->is_running());
    EXPECT_FALSE(service->is_connected());
    EXPECT_EQ(client->disconnect_calls(), 1);
}

TEST_F(TradeDataServiceTest, StartRetriesUntilConnected) {
    client->fail_next_connects(3);
    service->start();
    EXPECT_TRUE(service->is_connected());
    EXPECT_EQ(client->connect_calls(), 4);
    EXPECT_EQ(delays->delays().size(), 3u);
}

TEST_F(TradeDataServiceTest, StartTwiceIsNoOp) {
    service->start();
    service->start();
    EXPECT_EQ(client->connect_calls(), 1);
}

TEST_F(TradeDataServiceTest, SubscribeOnlyUpstreamOnFirstInterest) {
    service->start();
    service->subscribe_to_trades(Symbol::BTC_USD);
    service->subscribe_to_trades(Symbol::BTC_USD);
    service->subscribe_to_trades(Symbol::ETH_USD);

    EXPECT_EQ(client->subscribe_calls(), (std::vector<Symbol>{Symbol::BTC_USD, Symbol::ETH_USD}));
    EXPECT_EQ(service->subscriptions().ref_count(Symbol::BTC_USD), 2);
}

TEST_F(TradeDataServiceTest, UnsubscribeOnlyUpstreamOnLastInterest) {
    service->start();
    service->subscribe_to_trades(Symbol::BTC_USD);
    service->subscribe_to_trades(Symbol::BTC_USD);

    service->unsubscribe_from_trades(Symbol::BTC_USD);
    EXPECT_TRUE(client->unsubscribe_calls().empty());
    service->unsubscribe_from_trades(Symbol::BTC_USD);
    EXPECT_EQ(client->unsubscribe_calls(), (std::vector<Symbol>{Symbol::BTC_USD}));
}

TEST_F(TradeDataServiceTest, UnsubscribeWithoutInterestIsNoOp) {
    service->start();
    service->unsubscribe_from_trades(Symbol::SOL_USD);
    EXPECT_TRUE(client->unsubscribe_calls().empty());
    EXPECT_EQ(service->subscriptions().ref_count(Symbol::SOL_USD), 0);
}

TEST_F(TradeDataServiceTest, FailedUpstreamSubscribeRollsBackInterest) {
    service->start();
    client->fail_requests(true);
    EXPECT_THROW(service->subscribe_to_trades(Symbol::SOL_USD), ConnectionError);
    EXPECT_EQ(service->subscriptions().ref_count(Symbol::SOL_USD), 0);

    client->fail_requests(false);
    service->subscribe_to_trades(Symbol::SOL_USD);
    EXPECT_EQ(client->subscribe_calls(), (std::vector<Symbol>{Symbol::SOL_USD}));
}

TEST_F(TradeDataServiceTest, TradesAreCachedAndReemittedOnce) {
    service->start();
    client->fire_trade(make_trade(Symbol::BTC_USD, "t1", 1000));
    client->fire_trade(make_trade(Symbol::BTC_USD, "t1", 1000));
    client->fire_trade(make_trade(Symbol::BTC_USD, "t2", 2000));

    EXPECT_EQ(received_ids(), (std::vector<std::string>{"t1", "t2"}));
    EXPECT_EQ(ids_of(service->get_recent_trades(Symbol::BTC_USD, 10)),
              (std::vector<std::string>{"t2", "t1"}));
}

TEST_F(TradeDataServiceTest, SameTradeIdOnAnotherSymbolIsDistinct) {
    service->start();
    client->fire_trade(make_trade(Symbol::BTC_USD, "t1", 1000));
    client->fire_trade(make_trade(Symbol::ETH_USD, "t1", 1000));
    EXPECT_EQ(received_ids().size(), 2u);
}

TEST_F(TradeDataServiceTest, ConfirmationsAreForwarded) {
    service->start();
    client->fire_confirmation({7, market::TradeEvent::SUBSCRIBED, Symbol::ETH_USD});
    EXPECT_EQ(confirmations.load(), 1);
}

TEST_F(TradeDataServiceTest, LostConnectionReconnectsAndResubscribesActiveSymbols) {
    service->start();
    service->subscribe_to_trades(Symbol::BTC_USD);
    service->subscribe_to_trades(Symbol::ETH_USD);
    service->subscribe_to_trades(Symbol::SOL_USD);
    service->unsubscribe_from_trades(Symbol::SOL_USD);
    client->clear_calls();

    client->fire_connection_lost();
    EXPECT_EQ(lost.load(), 1);

    ASSERT_TRUE(wait_until([this] { return restored.load() == 1; }));
    EXPECT_TRUE(service->is_connected());
    EXPECT_EQ(client->subscribe_calls(), (std::vector<Symbol>{Symbol::BTC_USD, Symbol::ETH_USD}));
}

TEST_F(TradeDataServiceTest, ReconnectBacksOffWhileUpstreamIsDown) {
    service->start();
    client->fail_next_connects(2);
    client->fire_connection_lost();

    ASSERT_TRUE(wait_until([this] { return restored.load() == 1; }));
    EXPECT_EQ(delays->delays(),
              (std::vector<std::chrono::milliseconds>{std::chrono::seconds(5), std::chrono::seconds(10)}));
}

TEST_F(TradeDataServiceTest, ResubscribeFailureStillReportsRestored) {
    service->start();
    service->subscribe_to_trades(Symbol::BTC_USD);
    client->fail_requests(true);
    client->fire_connection_lost();

    ASSERT_TRUE(wait_until([this] { return restored.load() == 1; }));
    EXPECT_EQ(service->subscriptions().ref_count(Symbol::BTC_USD), 1);
}

TEST_F(TradeDataServiceTest, NothingIsEmittedOrCachedAfterStop) {
    service->start();
    service->stop();

    client->fire_trade(make_trade(Symbol::BTC_USD, "late", 1000));
    client->fire_confirmation({1, market::TradeEvent::SUBSCRIBED, Symbol::BTC_USD});
    client->fire_connection_lost();

    EXPECT_TRUE(received_ids().empty());
    EXPECT_EQ(confirmations.load(), 0);
    EXPECT_EQ(lost.load(), 0);
    EXPECT_TRUE(service->get_recent_trades(Symbol::BTC_USD, 10).empty());
    EXPECT_EQ(client->trade_received.handler_count(), 0u);
}

TEST_F(TradeDataServiceTest, CanRestartAfterStop) {
    service->start();
    service->stop();
    service->start();
    EXPECT_TRUE(service->is_connected());

    client->fire_trade(make_trade(Symbol::BTC_USD, "t1", 1000));
    EXPECT_EQ(received_ids().size(), 1u);
    EXPECT_EQ(client->trade_received.handler_count(), 1u);
}

TEST_F(TradeDataServiceTest, RestartResubscribesRetainedInterest) {
    service->start();
    service->subscribe_to_trades(Symbol::BTC_USD);
    service->stop();
    client->clear_calls();

    service->start();
    EXPECT_EQ(client->subscribe_calls(), (std::vector<Symbol>{Symbol::BTC_USD}));

    // A further subscriber only bumps the count.
    service->subscribe_to_trades(Symbol::BTC_USD);
    EXPECT_EQ(service->subscriptions().ref_count(Symbol::BTC_USD), 2);
    EXPECT_EQ(client->subscribe_calls().size(), 1u);
}

TEST_F(TradeDataServiceTest, RestartWithoutInterestSendsNoSubscribe) {
    service->start();
    service->subscribe_to_trades(Symbol::ETH_USD);
    service->unsubscribe_from_trades(Symbol::ETH_USD);
    service->stop();
    client->clear_calls();

    service->start();
    EXPECT_TRUE(client->subscribe_calls().empty());
}

TEST_F(TradeDataServiceTest, UnsubscribeWaitsForInFlightSubscribe) {
    service->start();

    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    std::atomic<bool> first{true};
    client->set_on_subscribe([&](Symbol) {
        if (first.exchange(false)) {
            entered.set_value();
            release_future.wait();
        }
    });

    std::thread subscriber([this] { service->subscribe_to_trades(Symbol::BTC_USD); });
    entered.get_future().wait();
    std::thread unsubscriber([this] { service->unsubscribe_from_trades(Symbol::BTC_USD); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_TRUE(client->unsubscribe_calls().empty());
    release.set_value();
    subscriber.join();
    unsubscriber.join();

    EXPECT_EQ(client->upstream_log(), (std::vector<std::string>{"subscribe BTC-USD", "unsubscribe BTC-USD"}));
    EXPECT_EQ(service->subscriptions().ref_count(Symbol::BTC_USD), 0);
}

TEST_F(TradeDataServiceTest, SubscriberAfterFailedFirstSubscribeGoesUpstream) {
    service->start();

    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    std::atomic<bool> first{true};
    client->set_on_subscribe([&](Symbol) {
        if (first.exchange(false)) {
            entered.set_value();
            release_future.wait();
            throw std::runtime_error("upstream rejected");
        }
    });

    std::atomic<bool> first_failed{false};
    std::thread failing([&] {
        try {
            service->subscribe_to_trades(Symbol::ETH_USD);
        } catch (const ConnectionError&) {
            first_failed.store(true);
        }
    });
    entered.get_future().wait();
    std::thread second([this] { service->subscribe_to_trades(Symbol::ETH_USD); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    release.set_value();
    failing.join();
    second.join();

    EXPECT_TRUE(first_failed.load());
    EXPECT_EQ(client->subscribe_calls(), (std::vector<Symbol>{Symbol::ETH_USD}));
    EXPECT_EQ(service->subscriptions().ref_count(Symbol::ETH_USD), 1);
}

TEST_F(TradeDataServiceTest, QueriesPassThroughToCache) {
    service->start();
    for (int i = 1; i <= 5; ++i) {
        client->fire_trade(make_trade(Symbol::SOL_USD, "s" + std::to_string(i), i * 1000));
    }

    EXPECT_EQ(ids_of(service->get_recent_trades(Symbol::SOL_USD, 2)),
              (std::vector<std::string>{"s5", "s4"}));
    EXPECT_EQ(ids_of(service->get_recent_trades(Symbol::SOL_USD, 2, ts_us(4000))),
              (std::vector<std::string>{"s3", "s2"}));
    EXPECT_EQ(ids_of(service->get_trades_since(Symbol::SOL_USD, 10, ts_us(3000))),
              (std::vector<std::string>{"s5", "s4"}));
    EXPECT_THROW(service->get_recent_trades(Symbol::SOL_USD, -1), std::invalid_argument);

    service->clear_trades(Symbol::SOL_USD);
    EXPECT_TRUE(service->get_recent_trades(Symbol::SOL_USD, 10).empty());
}
