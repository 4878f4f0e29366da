/**
 * @file trade_data_service.h
 * @brief Orchestrates the upstream feed, subscription refcounts, trade cache and reconnects
 *
 * Consumers attach to the public events. Trades are re-emitted at most once per trade id
 * (only when newly cached), on the upstream client's receive thread. Once stop() returns no
 * event is emitted and nothing more is cached, even if the client fires late.
 *
 * Symbols with downstream interest are resubscribed upstream whenever a connection comes
 * back, whether after a drop or after stop() and start().
 */

#pragma once

#include "cache/trade_cache.h"
#include "connector/trade_feed_client.h"
#include "core/event/event_source.h"
#include "core/sync/cancellation.h"
#include "market/trade.h"
#include "service/connection_manager.h"
#include "service/subscription_manager.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <vector>

namespace tradecast::service {

class TradeDataService {
public:
    /**
     * @throws std::invalid_argument if any collaborator is null
     */
    TradeDataService(std::shared_ptr<connector::TradeFeedClient> client,
                     std::unique_ptr<ConnectionManager> connection_manager,
                     std::unique_ptr<SubscriptionManager> subscription_manager,
                     std::unique_ptr<cache::TradeCache> trade_cache);
    ~TradeDataService();

    TradeDataService(const TradeDataService&) = delete;
    TradeDataService& operator=(const TradeDataService&) = delete;

    /**
     * @brief Attach to the client and connect (blocks until connected or stop())
     */
    void start();

    /**
     * @brief Detach from the client, cancel connecting/reconnecting, disconnect
     */
    void stop();

    bool is_connected() const;
    bool is_running() const { return running_.load(); }

    /**
     * @brief Register downstream interest; subscribes upstream on the first one only
     * @throws ConnectionError if the upstream request fails (the interest is not kept)
     */
    void subscribe_to_trades(market::Symbol symbol);

    /**
     * @brief Drop downstream interest; unsubscribes upstream when the last one leaves
     * @throws ConnectionError if the upstream request fails
     */
    void unsubscribe_from_trades(market::Symbol symbol);

    std::vector<market::Trade> get_recent_trades(market::Symbol symbol, int count) const;
    std::vector<market::Trade> get_recent_trades(market::Symbol symbol, int count,
                                                 market::Timestamp before) const;
    std::vector<market::Trade> get_trades_since(market::Symbol symbol, int count,
                                                market::Timestamp after) const;
    void clear_trades(market::Symbol symbol);

    const SubscriptionManager& subscriptions() const { return *subscription_manager_; }

    event::EventSource<const market::Trade&> trade_received;
    event::EventSource<const market::SubscriptionResponse&> subscription_confirmed;
    event::EventSource<> connection_lost;
    event::EventSource<> connection_restored;

private:
    void on_trade(const market::Trade& trade);
    void on_subscription_confirmed(const market::SubscriptionResponse& response);
    void on_connection_lost();
    void on_connection_restored();

    /// Re-issue upstream subscriptions for every symbol with downstream interest
    void resubscribe_active(const sync::CancellationToken& token);

    void attach_handlers();
    void detach_handlers();
    sync::CancellationToken lifetime_token() const;

    std::shared_ptr<connector::TradeFeedClient> client_;
    std::unique_ptr<ConnectionManager> connection_manager_;
    std::unique_ptr<SubscriptionManager> subscription_manager_;
    std::unique_ptr<cache::TradeCache> trade_cache_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};

    mutable std::mutex lifetime_mutex_;
    std::shared_ptr<sync::CancellationSource> lifetime_;

    // Handlers hold the gate shared; stop() takes it exclusively to wait them out.
    std::shared_mutex dispatch_gate_;
    bool accepting_{false};

    // Serializes refcount changes with their upstream request.
    std::mutex subscription_mutex_;
    std::atomic<uint64_t> resubscribe_passes_{0};

    event::HandlerToken trade_token_;
    event::HandlerToken confirmed_token_;
    event::HandlerToken lost_token_;
    event::HandlerToken restored_token_;
};

} // namespace tradecast::service
