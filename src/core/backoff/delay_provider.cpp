/**
 * @file delay_provider.cpp
 */

#include "core/backoff/delay_provider.h"
#include "core/errors.h"

namespace tradecast::backoff {

void SleepDelayProvider::delay(std::chrono::milliseconds delay, const sync::CancellationToken& token) {
    token.throw_if_cancelled();
    if (token.wait_for(delay)) {
        throw OperationCancelled("backoff sleep cancelled");
    }
}

} // namespace tradecast::backoff
