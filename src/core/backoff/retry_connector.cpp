/**
 * @file retry_connector.cpp
 */

#include "core/backoff/retry_connector.h"
#include "core/errors.h"

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace tradecast::backoff {

RetryConnector::RetryConnector(std::shared_ptr<BackoffStrategy> strategy,
                               std::shared_ptr<DelayProvider> delay_provider)
    : strategy_(std::move(strategy)), delay_provider_(std::move(delay_provider)) {
    if (!strategy_) {
        throw std::invalid_argument("RetryConnector requires a backoff strategy");
    }
    if (!delay_provider_) {
        throw std::invalid_argument("RetryConnector requires a delay provider");
    }
}

void RetryConnector::execute_with_retry(const Action& action,
                                        const sync::CancellationToken& token,
                                        const RetryObserver& on_retry) const {
    int attempt_number = 0;

    while (!token.is_cancelled()) {
        std::string error;
        try {
            action();
            return;
        } catch (const OperationCancelled&) {
            if (token.is_cancelled()) {
                throw;
            }
            // Cancelled by something other than our caller: an ordinary failure.
            error = "operation cancelled by transport";
        } catch (const std::exception& e) {
            error = e.what();
        }

        ++attempt_number;
        const auto delay = strategy_->get_delay(attempt_number);
        if (on_retry) {
            on_retry(attempt_number, delay, error);
        } else {
            spdlog::warn("[RetryConnector] attempt #{} failed: {}; retrying in {} ms",
                         attempt_number, error, delay.count());
        }
        delay_provider_->delay(delay, token);
    }

    throw OperationCancelled();
}

} // namespace tradecast::backoff
