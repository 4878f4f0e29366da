/**
 * @file connectable.h
 * @brief Anything ConnectionManager can drive: an upstream link with connect/disconnect
 */

#pragma once

#include "core/sync/cancellation.h"

namespace tradecast::connector {

class Connectable {
public:
    virtual ~Connectable() = default;

    /// Live link state
    virtual bool is_connected() const = 0;

    /**
     * @brief Establish the link
     * @throws ConnectionError (or any std::exception) on failure, OperationCancelled on cancel
     */
    virtual void connect(const sync::CancellationToken& token) = 0;

    /// Tear down the link; must not throw for an already closed link
    virtual void disconnect(const sync::CancellationToken& token) = 0;
};

} // namespace tradecast::connector
