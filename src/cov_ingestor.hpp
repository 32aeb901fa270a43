#pragma once

#include "device_registry.hpp"
#include "protocol_stack.hpp"
#include "request_dispatcher.hpp"

/**
 * Merges COV notifications into the registry and answers the confirmed ones.
 *
 * The answer to a confirmed notification is the same for every notification;
 * it acknowledges unless configured otherwise.
 */
class cov_ingestor {
public:
    cov_ingestor(protocol_stack& stack, device_registry& registry, request_dispatcher& dispatcher);

    /* registers with the stack for both confirmed and unconfirmed notifications */
    void attach();
    void on_notification(const cov_notification& notification);

    void set_disposition(const cov_disposition& disposition) { _disposition = disposition; }
    const cov_disposition& disposition() const { return _disposition; }

private:
    protocol_stack& _stack;
    device_registry& _registry;
    request_dispatcher& _dispatcher;
    cov_disposition _disposition;
};
