#include <gtest/gtest.h>
#include "connector/blockchain_trade_client.h"
#include "core/errors.h"
#include "support/test_fakes.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

using namespace tradecast;
using namespace tradecast::connector;
using tradecast::market::Symbol;
using tradecast::testing::ScriptedWsTransport;
using tradecast::testing::wait_until;

namespace {

std::string trade_frame(const std::string& trade_id, const std::string& symbol = "BTC-USD") {
    nlohmann::json j = {
        {"seqnum", 10},
        {"event", "updated"},
        {"channel", "trades"},
        {"symbol", symbol},
        {"timestamp", "2024-01-15T10:30:00.000001Z"},
        {"side", "buy"},
        {"qty", 0.1},
        {"price", 42000.0},
        {"trade_id", trade_id}
    };
    return j.dump();
}

}  // namespace

/**
 * @brief Client driven through an in-memory transport
 */
class BlockchainTradeClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<ScriptedWsTransport>();
        BlockchainClientOptions options;
        options.url = "wss://example.test/ws";
        options.api_token = "tok";
        client = std::make_unique<BlockchainTradeClient>(options, transport);

        client->trade_received.add([this](const market::Trade& t) {
            std::lock_guard<std::mutex> lk(mutex);
            trades.push_back(t.trade_id());
        });
        client->subscription_confirmed.add([this](const market::SubscriptionResponse& r) {
            std::lock_guard<std::mutex> lk(mutex);
            confirmations.push_back(r.symbol);
        });
        client->connection_lost.add([this] { ++lost; });
        client->connection_restored.add([this] { ++restored; });
    }

    void TearDown() override {
        client->disconnect(sync::CancellationToken{});
    }

    size_t trade_count() {
        std::lock_guard<std::mutex> lk(mutex);
        return trades.size();
    }

    std::shared_ptr<ScriptedWsTransport> transport;
    std::unique_ptr<BlockchainTradeClient> client;
    sync::CancellationSource source;

    std::mutex mutex;
    std::vector<std::string> trades;
    std::vector<Symbol> confirmations;
    std::atomic<int> lost{0};
    std::atomic<int> restored{0};
};

TEST_F(BlockchainTradeClientTest, RequiresTransport) {
    EXPECT_THROW(BlockchainTradeClient(BlockchainClientOptions{}, nullptr), std::invalid_argument);
}

TEST_F(BlockchainTradeClientTest, DefaultUrlIsExchangeGateway) {
    EXPECT_EQ(BlockchainClientOptions{}.url, "wss://ws.blockchain.info/mercury-gateway/v1/ws");
}

TEST_F(BlockchainTradeClientTest, ConnectOpensConfiguredUrl) {
    EXPECT_FALSE(client->is_connected());
    client->connect(source.token());
    EXPECT_TRUE(client->is_connected());
    EXPECT_EQ(transport->opened_urls(), (std::vector<std::string>{"wss://example.test/ws"}));
    EXPECT_EQ(restored.load(), 0);
}

TEST_F(BlockchainTradeClientTest, ConnectWhenConnectedIsNoOp) {
    client->connect(source.token());
    client->connect(source.token());
    EXPECT_EQ(transport->opened_urls().size(), 1u);
}

TEST_F(BlockchainTradeClientTest, FailedOpenPropagatesConnectionError) {
    transport->fail_next_opens(1);
    EXPECT_THROW(client->connect(source.token()), ConnectionError);
    EXPECT_FALSE(client->is_connected());
}

TEST_F(BlockchainTradeClientTest, CancelledTokenRefusesToConnect) {
    source.cancel();
    EXPECT_THROW(client->connect(source.token()), OperationCancelled);
    EXPECT_TRUE(transport->opened_urls().empty());
}

TEST_F(BlockchainTradeClientTest, SubscribeWritesRequestWithToken) {
    client->connect(source.token());
    client->subscribe_to_trades(Symbol::BTC_USD, source.token());
    client->unsubscribe_from_trades(Symbol::BTC_USD, source.token());

    const auto written = transport->written();
    ASSERT_EQ(written.size(), 2u);
    const auto sub = nlohmann::json::parse(written[0]);
    EXPECT_EQ(sub["action"], "subscribe");
    EXPECT_EQ(sub["channel"], "trades");
    EXPECT_EQ(sub["symbol"], "BTC-USD");
    EXPECT_EQ(sub["token"], "tok");
    EXPECT_EQ(nlohmann::json::parse(written[1])["action"], "unsubscribe");
}

TEST_F(BlockchainTradeClientTest, SubscribeWhileDisconnectedThrows) {
    EXPECT_THROW(client->subscribe_to_trades(Symbol::ETH_USD, source.token()), ConnectionError);
    EXPECT_TRUE(transport->written().empty());
}

TEST_F(BlockchainTradeClientTest, FramesAreDecodedIntoEvents) {
    client->connect(source.token());
    transport->push_frame(R"({"seqnum":1,"event":"subscribed","channel":"trades","symbol":"ETH-USD"})");
    transport->push_frame(trade_frame("t-1"));
    transport->push_frame(trade_frame("t-2", "SOL-USD"));

    ASSERT_TRUE(wait_until([this] { return trade_count() == 2; }));
    std::lock_guard<std::mutex> lk(mutex);
    EXPECT_EQ(trades, (std::vector<std::string>{"t-1", "t-2"}));
    EXPECT_EQ(confirmations, (std::vector<Symbol>{Symbol::ETH_USD}));
}

TEST_F(BlockchainTradeClientTest, BadFramesAreCountedAndSkipped) {
    client->connect(source.token());
    transport->push_frame("{garbage");
    transport->push_frame(R"({"event":"updated","channel":"trades","symbol":"BTC-USD"})");
    transport->push_frame(R"({"channel":"heartbeat"})");
    transport->push_frame(trade_frame("after"));

    ASSERT_TRUE(wait_until([this] { return trade_count() == 1; }));
    EXPECT_EQ(client->decode_errors(), 2u);
    EXPECT_TRUE(client->is_connected());
}

TEST_F(BlockchainTradeClientTest, ThrowingHandlerDoesNotStopReceiveLoop) {
    client->trade_received.add([](const market::Trade& t) {
        if (t.trade_id() == "boom") throw std::runtime_error("handler failure");
    });
    client->connect(source.token());
    transport->push_frame(trade_frame("boom"));
    transport->push_frame(trade_frame("fine"));
    ASSERT_TRUE(wait_until([this] { return trade_count() == 2; }));
}

TEST_F(BlockchainTradeClientTest, DropFiresLostOnceAndReconnectFiresRestored) {
    client->connect(source.token());
    transport->drop_connection();

    ASSERT_TRUE(wait_until([this] { return lost.load() == 1; }));
    EXPECT_FALSE(client->is_connected());
    EXPECT_THROW(client->subscribe_to_trades(Symbol::BTC_USD, source.token()), ConnectionError);

    client->connect(source.token());
    EXPECT_TRUE(client->is_connected());
    EXPECT_EQ(restored.load(), 1);
    EXPECT_EQ(lost.load(), 1);

    transport->push_frame(trade_frame("post-reconnect"));
    ASSERT_TRUE(wait_until([this] { return trade_count() == 1; }));
}

TEST_F(BlockchainTradeClientTest, IntentionalDisconnectIsNotALoss) {
    client->connect(source.token());
    client->disconnect(sync::CancellationToken{});
    EXPECT_FALSE(client->is_connected());
    EXPECT_EQ(lost.load(), 0);

    client->connect(source.token());
    EXPECT_EQ(restored.load(), 0);
}
