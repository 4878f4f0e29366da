/**
 * @file delay_provider.h
 * @brief Cancellable sleep used between reconnect attempts.
 */

#pragma once

#include "core/sync/cancellation.h"

#include <chrono>

namespace tradecast::backoff {

class DelayProvider {
public:
    virtual ~DelayProvider() = default;

    /**
     * @brief Sleep for @p delay
     * @throws OperationCancelled if @p token is cancelled before or during the sleep
     */
    virtual void delay(std::chrono::milliseconds delay, const sync::CancellationToken& token) = 0;
};

/// Real wall-clock sleep that wakes as soon as the token is cancelled.
class SleepDelayProvider : public DelayProvider {
public:
    void delay(std::chrono::milliseconds delay, const sync::CancellationToken& token) override;
};

} // namespace tradecast::backoff
