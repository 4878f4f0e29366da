/**
 * @file trade_data_service.cpp
 */

#include "service/trade_data_service.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace tradecast::service {

TradeDataService::TradeDataService(std::shared_ptr<connector::TradeFeedClient> client,
                                   std::unique_ptr<ConnectionManager> connection_manager,
                                   std::unique_ptr<SubscriptionManager> subscription_manager,
                                   std::unique_ptr<cache::TradeCache> trade_cache)
    : client_(std::move(client)),
      connection_manager_(std::move(connection_manager)),
      subscription_manager_(std::move(subscription_manager)),
      trade_cache_(std::move(trade_cache)),
      lifetime_(std::make_shared<sync::CancellationSource>()) {
    if (!client_ || !connection_manager_ || !subscription_manager_ || !trade_cache_) {
        throw std::invalid_argument("TradeDataService requires client, connection manager, "
                                    "subscription manager and trade cache");
    }
}

TradeDataService::~TradeDataService() {
    if (running_.load()) {
        try {
            stop();
        } catch (const std::exception& e) {
            spdlog::error("[TradeDataService] stop during destruction failed: {}", e.what());
        }
    }
}

sync::CancellationToken TradeDataService::lifetime_token() const {
    std::lock_guard<std::mutex> lk(lifetime_mutex_);
    return lifetime_->token();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void TradeDataService::start() {
    sync::CancellationToken token;
    {
        std::lock_guard<std::mutex> lk(lifecycle_mutex_);
        if (running_.load()) {
            spdlog::debug("[TradeDataService] already running");
            return;
        }
        {
            std::lock_guard<std::mutex> lt(lifetime_mutex_);
            if (lifetime_->is_cancelled()) {
                lifetime_ = std::make_shared<sync::CancellationSource>();
            }
            token = lifetime_->token();
        }
        attach_handlers();
        running_.store(true);
    }

    spdlog::info("[TradeDataService] starting");
    const uint64_t passes_before = resubscribe_passes_.load();
    connection_manager_->start(token);

    // Interest kept across stop()/start() has no upstream subscription on the new connection.
    if (is_connected() && resubscribe_passes_.load() == passes_before) {
        std::shared_lock<std::shared_mutex> gate(dispatch_gate_);
        if (accepting_) {
            resubscribe_active(token);
        }
    }
}

void TradeDataService::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (!running_.load()) {
        return;
    }
    spdlog::info("[TradeDataService] stopping");

    // In-flight upstream requests must give up before the gate closes.
    std::shared_ptr<sync::CancellationSource> lifetime;
    {
        std::lock_guard<std::mutex> lt(lifetime_mutex_);
        lifetime = lifetime_;
    }
    lifetime->cancel();

    detach_handlers();

    connection_manager_->stop(sync::CancellationToken{});
    running_.store(false);
    spdlog::info("[TradeDataService] stopped");
}

void TradeDataService::attach_handlers() {
    {
        std::unique_lock<std::shared_mutex> gate(dispatch_gate_);
        accepting_ = true;
    }
    trade_token_ = client_->trade_received.add([this](const market::Trade& t) { on_trade(t); });
    confirmed_token_ = client_->subscription_confirmed.add(
        [this](const market::SubscriptionResponse& r) { on_subscription_confirmed(r); });
    lost_token_ = client_->connection_lost.add([this]() { on_connection_lost(); });
    restored_token_ = client_->connection_restored.add([this]() { on_connection_restored(); });
}

void TradeDataService::detach_handlers() {
    {
        // Waits for handlers already past the gate.
        std::unique_lock<std::shared_mutex> gate(dispatch_gate_);
        accepting_ = false;
    }
    client_->trade_received.remove(trade_token_);
    client_->subscription_confirmed.remove(confirmed_token_);
    client_->connection_lost.remove(lost_token_);
    client_->connection_restored.remove(restored_token_);
    trade_token_ = confirmed_token_ = lost_token_ = restored_token_ = event::HandlerToken{};
}

bool TradeDataService::is_connected() const {
    return connection_manager_->is_connected();
}

// ============================================================================
// SUBSCRIPTIONS
// ============================================================================

void TradeDataService::subscribe_to_trades(market::Symbol symbol) {
    std::lock_guard<std::mutex> lk(subscription_mutex_);
    if (!subscription_manager_->should_subscribe_downstream(symbol)) {
        return;
    }
    try {
        client_->subscribe_to_trades(symbol, lifetime_token());
        spdlog::info("[TradeDataService] subscribed upstream to {}", market::to_string(symbol));
    } catch (const ConnectionError&) {
        subscription_manager_->should_unsubscribe_downstream(symbol);
        throw;
    } catch (const std::exception& e) {
        subscription_manager_->should_unsubscribe_downstream(symbol);
        throw ConnectionError("subscribe to " + market::to_string(symbol) + " failed: " + e.what());
    }
}

void TradeDataService::unsubscribe_from_trades(market::Symbol symbol) {
    std::lock_guard<std::mutex> lk(subscription_mutex_);
    if (!subscription_manager_->should_unsubscribe_downstream(symbol)) {
        return;
    }
    try {
        client_->unsubscribe_from_trades(symbol, lifetime_token());
        spdlog::info("[TradeDataService] unsubscribed upstream from {}", market::to_string(symbol));
    } catch (const ConnectionError&) {
        throw;
    } catch (const std::exception& e) {
        throw ConnectionError("unsubscribe from " + market::to_string(symbol) + " failed: " + e.what());
    }
}

// ============================================================================
// QUERIES
// ============================================================================

std::vector<market::Trade> TradeDataService::get_recent_trades(market::Symbol symbol, int count) const {
    return trade_cache_->get_recent(symbol, count);
}

std::vector<market::Trade> TradeDataService::get_recent_trades(market::Symbol symbol, int count,
                                                               market::Timestamp before) const {
    return trade_cache_->get_recent(symbol, count, before);
}

std::vector<market::Trade> TradeDataService::get_trades_since(market::Symbol symbol, int count,
                                                              market::Timestamp after) const {
    return trade_cache_->get_since(symbol, count, after);
}

void TradeDataService::clear_trades(market::Symbol symbol) {
    trade_cache_->clear(symbol);
}

// ============================================================================
// UPSTREAM EVENT HANDLERS
// ============================================================================

void TradeDataService::on_trade(const market::Trade& trade) {
    std::shared_lock<std::shared_mutex> gate(dispatch_gate_);
    if (!accepting_) {
        return;
    }
    if (trade_cache_->try_add(trade)) {
        trade_received.emit(trade);
    }
}

void TradeDataService::on_subscription_confirmed(const market::SubscriptionResponse& response) {
    std::shared_lock<std::shared_mutex> gate(dispatch_gate_);
    if (!accepting_) {
        return;
    }
    spdlog::info("[TradeDataService] {} {}", market::to_string(response.symbol),
                 market::to_string(response.event));
    subscription_confirmed.emit(response);
}

void TradeDataService::on_connection_lost() {
    std::shared_lock<std::shared_mutex> gate(dispatch_gate_);
    if (!accepting_) {
        return;
    }
    spdlog::warn("[TradeDataService] upstream connection lost");
    connection_lost.emit();
    connection_manager_->request_reconnect();
}

void TradeDataService::on_connection_restored() {
    std::shared_lock<std::shared_mutex> gate(dispatch_gate_);
    if (!accepting_) {
        return;
    }
    resubscribe_active(lifetime_token());
    spdlog::info("[TradeDataService] upstream connection restored");
    connection_restored.emit();
}

void TradeDataService::resubscribe_active(const sync::CancellationToken& token) {
    std::lock_guard<std::mutex> lk(subscription_mutex_);
    ++resubscribe_passes_;
    for (market::Symbol symbol : subscription_manager_->active_symbols()) {
        try {
            client_->subscribe_to_trades(symbol, token);
            spdlog::info("[TradeDataService] resubscribed to {}", market::to_string(symbol));
        } catch (const std::exception& e) {
            // The next drop/restore cycle retries.
            spdlog::warn("[TradeDataService] resubscribe to {} failed: {}",
                         market::to_string(symbol), e.what());
        }
    }
}

} // namespace tradecast::service
