/**
 * @file request_dispatcher.h
 * @brief Maps JSON-RPC requests onto TradeDataService operations
 *
 * Methods:
 *   subscribe          {"channel":"trades","symbol":"BTC-USD"}
 *   unsubscribe        {"channel":"trades","symbol":"BTC-USD"}
 *   get_recent_trades  {"symbol":"BTC-USD","count":100,"before":"<ISO-8601>"}
 *   get_trades_since   {"symbol":"BTC-USD","count":100,"after":"<ISO-8601>"}
 *   clear_trades       {"symbol":"BTC-USD"}
 */

#pragma once

#include "gateway/json_rpc.h"
#include "market/trade.h"
#include "service/trade_data_service.h"

#include <nlohmann/json.hpp>

#include <string>

namespace tradecast::gateway {

class RequestDispatcher {
public:
    static constexpr int kDefaultCount = 100;

    explicit RequestDispatcher(service::TradeDataService& service);

    /// Raw request text in, response text out. Never throws.
    std::string handle(const std::string& request_text);

    /// Dispatch an already parsed request. Never throws.
    nlohmann::json dispatch(const nlohmann::json& request);

private:
    nlohmann::json handle_subscribe(const nlohmann::json& params);
    nlohmann::json handle_unsubscribe(const nlohmann::json& params);
    nlohmann::json handle_get_recent_trades(const nlohmann::json& params);
    nlohmann::json handle_get_trades_since(const nlohmann::json& params);
    nlohmann::json handle_clear_trades(const nlohmann::json& params);

    service::TradeDataService& service_;
};

} // namespace tradecast::gateway
