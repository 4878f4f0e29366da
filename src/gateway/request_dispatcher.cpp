/**
 * @file request_dispatcher.cpp
 */

#include "gateway/request_dispatcher.h"
#include "connector/trade_message_codec.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>

namespace tradecast::gateway {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void require_trades_channel(const nlohmann::json& params) {
    auto it = params.find("channel");
    if (it == params.end() || !it->is_string() ||
        lower(it->get<std::string>()) != connector::TradeMessageCodec::kChannel) {
        throw RpcError(RpcErrorCode::INVALID_PARAMS, "Only 'trades' channel is supported");
    }
}

market::Symbol require_symbol(const nlohmann::json& params) {
    auto it = params.find("symbol");
    if (it == params.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw RpcError(RpcErrorCode::INVALID_PARAMS, "Symbol is required");
    }
    const auto& value = it->get_ref<const std::string&>();
    auto symbol = market::parse_symbol(value);
    if (!symbol) {
        throw RpcError(RpcErrorCode::INVALID_PARAMS, "Invalid symbol: " + value);
    }
    return *symbol;
}

int optional_count(const nlohmann::json& params, int fallback) {
    auto it = params.find("count");
    if (it == params.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw RpcError(RpcErrorCode::INVALID_PARAMS, "count must be an integer");
    }
    const auto count = it->get<int64_t>();
    if (count < 0) {
        throw RpcError(RpcErrorCode::INVALID_PARAMS, "count must be >= 0");
    }
    if (count > std::numeric_limits<int>::max()) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(count);
}

std::optional<market::Timestamp> optional_timestamp(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw RpcError(RpcErrorCode::INVALID_PARAMS, std::string(key) + " must be an ISO-8601 timestamp");
    }
    auto ts = market::parse_timestamp(it->get<std::string>());
    if (!ts) {
        throw RpcError(RpcErrorCode::INVALID_PARAMS,
                       std::string("Invalid ") + key + " timestamp: " + it->get<std::string>());
    }
    return ts;
}

nlohmann::json trades_result(market::Symbol symbol, const std::vector<market::Trade>& trades) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& trade : trades) {
        list.push_back(connector::TradeMessageCodec::trade_to_json(trade));
    }
    return nlohmann::json{
        {"symbol", market::to_string(symbol)},
        {"trades", std::move(list)}
    };
}

} // namespace

RequestDispatcher::RequestDispatcher(service::TradeDataService& service)
    : service_(service) {}

std::string RequestDispatcher::handle(const std::string& request_text) {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(request_text);
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("[RequestDispatcher] parse error: {}", e.what());
        return make_error(nullptr, RpcErrorCode::PARSE_ERROR, "").dump();
    }
    return dispatch(request).dump();
}

nlohmann::json RequestDispatcher::dispatch(const nlohmann::json& request) {
    if (!is_valid_request(request)) {
        nlohmann::json id = nullptr;
        if (request.is_object()) {
            auto it = request.find("id");
            if (it != request.end() && (it->is_string() || it->is_number())) {
                id = *it;
            }
        }
        return make_error(id, RpcErrorCode::INVALID_REQUEST, "");
    }

    const nlohmann::json id = request.value("id", nlohmann::json(nullptr));
    const std::string method = lower(request["method"].get<std::string>());
    nlohmann::json params = nlohmann::json::object();
    if (request.contains("params") && request["params"].is_object()) {
        params = request["params"];
    }

    try {
        if (method == "subscribe") {
            return make_success(id, handle_subscribe(params));
        }
        if (method == "unsubscribe") {
            return make_success(id, handle_unsubscribe(params));
        }
        if (method == "get_recent_trades") {
            return make_success(id, handle_get_recent_trades(params));
        }
        if (method == "get_trades_since") {
            return make_success(id, handle_get_trades_since(params));
        }
        if (method == "clear_trades") {
            return make_success(id, handle_clear_trades(params));
        }
        return make_error(id, RpcErrorCode::METHOD_NOT_FOUND, "Unknown method: " + method);
    } catch (const RpcError& e) {
        return make_error(id, e.code(), e.what());
    } catch (const std::invalid_argument& e) {
        return make_error(id, RpcErrorCode::INVALID_PARAMS, e.what());
    } catch (const std::exception& e) {
        spdlog::error("[RequestDispatcher] {} failed: {}", method, e.what());
        return make_error(id, RpcErrorCode::INTERNAL_ERROR, e.what());
    }
}

// ============================================================================
// METHODS
// ============================================================================

nlohmann::json RequestDispatcher::handle_subscribe(const nlohmann::json& params) {
    require_trades_channel(params);
    const auto symbol = require_symbol(params);
    service_.subscribe_to_trades(symbol);
    spdlog::info("[RequestDispatcher] client subscribed to {}", market::to_string(symbol));
    return nlohmann::json{
        {"channel", connector::TradeMessageCodec::kChannel},
        {"symbol", market::to_string(symbol)},
        {"event", "subscribed"}
    };
}

nlohmann::json RequestDispatcher::handle_unsubscribe(const nlohmann::json& params) {
    require_trades_channel(params);
    const auto symbol = require_symbol(params);
    service_.unsubscribe_from_trades(symbol);
    spdlog::info("[RequestDispatcher] client unsubscribed from {}", market::to_string(symbol));
    return nlohmann::json{
        {"channel", connector::TradeMessageCodec::kChannel},
        {"symbol", market::to_string(symbol)},
        {"event", "unsubscribed"}
    };
}

nlohmann::json RequestDispatcher::handle_get_recent_trades(const nlohmann::json& params) {
    const auto symbol = require_symbol(params);
    const int count = optional_count(params, kDefaultCount);
    const auto before = optional_timestamp(params, "before");
    if (before) {
        return trades_result(symbol, service_.get_recent_trades(symbol, count, *before));
    }
    return trades_result(symbol, service_.get_recent_trades(symbol, count));
}

nlohmann::json RequestDispatcher::handle_get_trades_since(const nlohmann::json& params) {
    const auto symbol = require_symbol(params);
    const int count = optional_count(params, kDefaultCount);
    const auto after = optional_timestamp(params, "after");
    if (!after) {
        throw RpcError(RpcErrorCode::INVALID_PARAMS, "after is required");
    }
    return trades_result(symbol, service_.get_trades_since(symbol, count, *after));
}

nlohmann::json RequestDispatcher::handle_clear_trades(const nlohmann::json& params) {
    const auto symbol = require_symbol(params);
    service_.clear_trades(symbol);
    return nlohmann::json{
        {"symbol", market::to_string(symbol)},
        {"cleared", true}
    };
}

} // namespace tradecast::gateway
