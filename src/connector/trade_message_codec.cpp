/**
 * @file trade_message_codec.cpp
 */

#include "connector/trade_message_codec.h"

#include <algorithm>
#include <cctype>

namespace tradecast::connector {

namespace {

DecodedMessage make_error(std::string message) {
    DecodedMessage out;
    out.kind = DecodedMessage::Kind::ERROR;
    out.error = std::move(message);
    return out;
}

std::optional<std::string> get_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

/// Numbers may arrive as JSON numbers or as decimal strings
std::optional<double> get_number(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) {
        return std::nullopt;
    }
    if (it->is_number()) {
        return it->get<double>();
    }
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        try {
            size_t consumed = 0;
            const double value = std::stod(s, &consumed);
            if (consumed == s.size()) {
                return value;
            }
        } catch (const std::exception&) {
            // not a number
        }
    }
    return std::nullopt;
}

int64_t get_seqnum(const nlohmann::json& j) {
    auto it = j.find("seqnum");
    return (it != j.end() && it->is_number_integer()) ? it->get<int64_t>() : 0;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string encode_action(const char* action, market::Symbol symbol,
                          const std::optional<std::string>& api_token) {
    nlohmann::json request = {
        {"action", action},
        {"channel", TradeMessageCodec::kChannel},
        {"symbol", market::to_string(symbol)}
    };
    if (api_token && !api_token->empty()) {
        request["token"] = *api_token;
    }
    return request.dump();
}

DecodedMessage decode_subscription(const nlohmann::json& root, market::TradeEvent event) {
    const auto symbol_str = get_string(root, "symbol");
    if (!symbol_str) {
        return make_error("subscription response without symbol");
    }
    const auto symbol = market::parse_symbol(*symbol_str);
    if (!symbol) {
        return make_error("subscription response for unknown symbol '" + *symbol_str + "'");
    }

    DecodedMessage out;
    out.kind = DecodedMessage::Kind::SUBSCRIPTION;
    out.subscription = market::SubscriptionResponse{get_seqnum(root), event, *symbol};
    return out;
}

DecodedMessage decode_trade(const nlohmann::json& root, market::TradeEvent event) {
    const auto symbol_str = get_string(root, "symbol");
    if (!symbol_str) return make_error("trade without symbol");
    const auto symbol = market::parse_symbol(*symbol_str);
    if (!symbol) return make_error("trade for unknown symbol '" + *symbol_str + "'");

    const auto ts_str = get_string(root, "timestamp");
    if (!ts_str) return make_error("trade without timestamp");
    const auto timestamp = market::parse_timestamp(*ts_str);
    if (!timestamp) return make_error("trade with invalid timestamp '" + *ts_str + "'");

    const auto side_str = get_string(root, "side");
    if (!side_str) return make_error("trade without side");
    const auto side = market::parse_side(lower(*side_str));
    if (!side) return make_error("trade with invalid side '" + *side_str + "'");

    const auto qty = get_number(root, "qty");
    if (!qty) return make_error("trade without numeric qty");
    const auto price = get_number(root, "price");
    if (!price) return make_error("trade without numeric price");

    auto trade_id = get_string(root, "trade_id");
    if (!trade_id) {
        // Some feeds send numeric ids.
        auto it = root.find("trade_id");
        if (it != root.end() && it->is_number_integer()) {
            trade_id = std::to_string(it->get<int64_t>());
        }
    }
    if (!trade_id || trade_id->empty()) return make_error("trade without trade_id");

    DecodedMessage out;
    out.kind = DecodedMessage::Kind::TRADE;
    out.trade.emplace(get_seqnum(root), event, *symbol, *timestamp, *side, *qty, *price, *trade_id);
    return out;
}

} // namespace

std::string to_string(DecodedMessage::Kind kind) {
    switch (kind) {
        case DecodedMessage::Kind::IGNORED: return "IGNORED";
        case DecodedMessage::Kind::TRADE: return "TRADE";
        case DecodedMessage::Kind::SUBSCRIPTION: return "SUBSCRIPTION";
        case DecodedMessage::Kind::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

DecodedMessage TradeMessageCodec::decode(std::string_view frame) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(frame.begin(), frame.end());
    } catch (const nlohmann::json::parse_error& e) {
        return make_error(std::string("malformed JSON: ") + e.what());
    }
    if (!root.is_object()) {
        return make_error("frame is not a JSON object");
    }

    const auto event_str = get_string(root, "event");
    if (!event_str) {
        return {};
    }
    const auto channel = get_string(root, "channel");
    if (channel && *channel != kChannel) {
        return {};
    }
    const auto event = market::parse_trade_event(*event_str);
    if (!event) {
        return {};
    }

    switch (*event) {
        case market::TradeEvent::SUBSCRIBED:
        case market::TradeEvent::UNSUBSCRIBED:
        case market::TradeEvent::REJECTED:
            return decode_subscription(root, *event);
        case market::TradeEvent::SNAPSHOT:
        case market::TradeEvent::UPDATED:
            return decode_trade(root, *event);
    }
    return {};
}

std::string TradeMessageCodec::encode_subscribe(market::Symbol symbol,
                                                const std::optional<std::string>& api_token) {
    return encode_action("subscribe", symbol, api_token);
}

std::string TradeMessageCodec::encode_unsubscribe(market::Symbol symbol,
                                                  const std::optional<std::string>& api_token) {
    return encode_action("unsubscribe", symbol, api_token);
}

nlohmann::json TradeMessageCodec::trade_to_json(const market::Trade& trade) {
    nlohmann::json j;
    j["seqnum"] = trade.sequence_number();
    j["event"] = market::to_string(trade.event());
    j["channel"] = kChannel;
    j["symbol"] = market::to_string(trade.symbol());
    j["timestamp"] = market::format_timestamp(trade.timestamp());
    j["side"] = market::to_string(trade.side());
    j["qty"] = trade.quantity();
    j["price"] = trade.price();
    j["tradeId"] = trade.trade_id();
    return j;
}

} // namespace tradecast::connector
