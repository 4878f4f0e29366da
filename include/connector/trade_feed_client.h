/**
 * @file trade_feed_client.h
 * @brief Upstream trades feed contract consumed by TradeDataService
 *
 * Events fire on the client's receive thread. Implementations must fire connection_lost once
 * per unintended drop, and connection_restored on the first successful connect after it.
 */

#pragma once

#include "connector/connectable.h"
#include "core/event/event_source.h"
#include "core/sync/cancellation.h"
#include "market/trade.h"

namespace tradecast::connector {

class TradeFeedClient : public Connectable {
public:
    ~TradeFeedClient() override = default;

    /// @throws ConnectionError if the request cannot be sent
    virtual void subscribe_to_trades(market::Symbol symbol, const sync::CancellationToken& token) = 0;

    /// @throws ConnectionError if the request cannot be sent
    virtual void unsubscribe_from_trades(market::Symbol symbol, const sync::CancellationToken& token) = 0;

    event::EventSource<const market::Trade&> trade_received;
    event::EventSource<const market::SubscriptionResponse&> subscription_confirmed;
    event::EventSource<> connection_lost;
    event::EventSource<> connection_restored;
};

} // namespace tradecast::connector
