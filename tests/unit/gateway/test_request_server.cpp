#include <gtest/gtest.h>
#include "gateway/request_server.h"
#include "support/test_fakes.h"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <memory>
#include <string>

using namespace tradecast;
using namespace tradecast::gateway;
using tradecast::market::Symbol;
using tradecast::testing::FakeDelayProvider;
using tradecast::testing::FakeTradeFeedClient;
using tradecast::testing::make_trade;

/**
 * @brief REP server on an inproc endpoint, exercised through a REQ socket
 */
class RequestServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        context = std::make_shared<zmq::context_t>(1);
        client = std::make_shared<FakeTradeFeedClient>();
        trade_service = std::make_unique<service::TradeDataService>(
            client,
            std::make_unique<service::ConnectionManager>(
                client, service::ConnectionManagerSettings{}, std::make_shared<FakeDelayProvider>()),
            std::make_unique<service::SubscriptionManager>(),
            std::make_unique<cache::TradeCache>());
        trade_service->start();
        dispatcher = std::make_unique<RequestDispatcher>(*trade_service);
        server = std::make_unique<RequestServer>(context, "inproc://rpc-test", *dispatcher,
                                                 std::chrono::milliseconds(20));
    }

    void TearDown() override {
        server->stop();
        trade_service->stop();
    }

    std::string round_trip(zmq::socket_t& req, const std::string& text) {
        zmq::message_t out(text.data(), text.size());
        EXPECT_TRUE(req.send(out, zmq::send_flags::none));
        zmq::message_t in;
        if (!req.recv(in)) {
            return {};
        }
        return in.to_string();
    }

    zmq::socket_t connect_req() {
        zmq::socket_t req(*context, zmq::socket_type::req);
        req.set(zmq::sockopt::linger, 0);
        req.set(zmq::sockopt::rcvtimeo, 2000);
        req.connect("inproc://rpc-test");
        return req;
    }

    std::shared_ptr<zmq::context_t> context;
    std::shared_ptr<FakeTradeFeedClient> client;
    std::unique_ptr<service::TradeDataService> trade_service;
    std::unique_ptr<RequestDispatcher> dispatcher;
    std::unique_ptr<RequestServer> server;
};

TEST_F(RequestServerTest, RequiresContext) {
    EXPECT_THROW(RequestServer(nullptr, "inproc://x", *dispatcher), std::invalid_argument);
}

TEST_F(RequestServerTest, StartAndStop) {
    EXPECT_FALSE(server->is_running());
    server->start();
    EXPECT_TRUE(server->is_running());
    server->start();
    server->stop();
    EXPECT_FALSE(server->is_running());
    server->stop();
}

TEST_F(RequestServerTest, AnswersRequestsInOrder) {
    client->fire_trade(make_trade(Symbol::BTC_USD, "t1", 1000));
    server->start();
    auto req = connect_req();

    const auto subscribed = nlohmann::json::parse(round_trip(
        req, R"({"jsonrpc":"2.0","id":1,"method":"subscribe","params":{"channel":"trades","symbol":"BTC-USD"}})"));
    EXPECT_EQ(subscribed["id"], 1);
    EXPECT_EQ(subscribed["result"]["event"], "subscribed");

    const auto recent = nlohmann::json::parse(round_trip(
        req, R"({"jsonrpc":"2.0","id":2,"method":"get_recent_trades","params":{"symbol":"BTC-USD"}})"));
    EXPECT_EQ(recent["id"], 2);
    ASSERT_EQ(recent["result"]["trades"].size(), 1u);
    EXPECT_EQ(recent["result"]["trades"][0]["tradeId"], "t1");
}

TEST_F(RequestServerTest, MalformedRequestStillGetsReply) {
    server->start();
    auto req = connect_req();
    const auto reply = nlohmann::json::parse(round_trip(req, "not json"));
    EXPECT_EQ(reply["error"]["code"], -32700);

    // The REP socket is ready for the next request.
    const auto next = nlohmann::json::parse(round_trip(
        req, R"({"jsonrpc":"2.0","id":3,"method":"nope"})"));
    EXPECT_EQ(next["error"]["code"], -32601);
}

TEST_F(RequestServerTest, BindConflictThrows) {
    server->start();
    RequestServer second(context, "inproc://rpc-test", *dispatcher);
    EXPECT_THROW(second.start(), zmq::error_t);
    EXPECT_FALSE(second.is_running());
}
