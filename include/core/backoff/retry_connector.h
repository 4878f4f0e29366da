/**
 * @file retry_connector.h
 * @brief Runs a connect action until it succeeds or the token is cancelled.
 *
 * There is no attempt limit: giving up is the caller's decision, expressed by cancelling.
 */

#pragma once

#include "core/backoff/backoff_strategy.h"
#include "core/backoff/delay_provider.h"
#include "core/sync/cancellation.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace tradecast::backoff {

class RetryConnector {
public:
    using Action = std::function<void()>;
    /// Called after a failed attempt, before sleeping: (attempt number, upcoming delay, error text)
    using RetryObserver = std::function<void(int, std::chrono::milliseconds, const std::string&)>;

    RetryConnector(std::shared_ptr<BackoffStrategy> strategy,
                   std::shared_ptr<DelayProvider> delay_provider);

    /**
     * @brief Invoke @p action until it returns without throwing
     * @throws OperationCancelled once @p token is cancelled (never swallowed, never retried)
     */
    void execute_with_retry(const Action& action,
                            const sync::CancellationToken& token,
                            const RetryObserver& on_retry = {}) const;

    const BackoffStrategy& strategy() const { return *strategy_; }

private:
    std::shared_ptr<BackoffStrategy> strategy_;
    std::shared_ptr<DelayProvider> delay_provider_;
};

} // namespace tradecast::backoff
