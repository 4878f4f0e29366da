/**
 * @file trade_message_codec.h
 * @brief JSON encoding/decoding for the exchange "trades" channel
 *
 * Inbound frames:
 *   {"seqnum":2,"event":"subscribed","channel":"trades","symbol":"BTC-USD"}
 *   {"seqnum":3,"event":"updated","channel":"trades","symbol":"BTC-USD",
 *    "timestamp":"2024-01-15T10:30:00.123456Z","side":"buy","qty":0.5,"price":42000.5,
 *    "trade_id":"12345"}
 *
 * Outbound: {"action":"subscribe","channel":"trades","symbol":"BTC-USD"[,"token":"..."]}
 */

#pragma once

#include "market/trade.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace tradecast::connector {

/**
 * @struct DecodedMessage
 * @brief Outcome of decoding one inbound frame
 */
struct DecodedMessage {
    enum class Kind {
        IGNORED,        // no "event" field, or an event we do not handle
        TRADE,
        SUBSCRIPTION,
        ERROR           // malformed JSON or a trade/subscription missing required fields
    };

    Kind kind = Kind::IGNORED;
    std::optional<market::Trade> trade;
    std::optional<market::SubscriptionResponse> subscription;
    std::string error;
};

std::string to_string(DecodedMessage::Kind kind);

class TradeMessageCodec {
public:
    static constexpr const char* kChannel = "trades";

    /// Never throws; problems are reported as Kind::ERROR
    static DecodedMessage decode(std::string_view frame);

    static std::string encode_subscribe(market::Symbol symbol, const std::optional<std::string>& api_token);
    static std::string encode_unsubscribe(market::Symbol symbol, const std::optional<std::string>& api_token);

    /// Downstream representation shared by the publisher and the request gateway
    static nlohmann::json trade_to_json(const market::Trade& trade);
};

} // namespace tradecast::connector
