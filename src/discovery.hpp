#pragma once

#include "device_registry.hpp"
#include "property_lists.hpp"
#include "protocol_stack.hpp"
#include "request_dispatcher.hpp"
#include <cstddef>

/**
 * Announce, solicit, and load every device that answers.
 *
 * A new I-Am registers the device and reads its device object. The rest of a
 * device's synchronisation (object reads, subscriptions) follows from the
 * completions handled by the dispatcher. refresh_all() and renew_subscriptions()
 * are called from the main loop timers.
 */
class discovery {
public:
    discovery(protocol_stack& stack, device_registry& registry, request_dispatcher& dispatcher, const property_lists& lists);

    /* registers for I-Am, then sends I-Am and a global Who-Is */
    void start();
    void solicit();
    void on_i_am(const i_am_announcement& announcement);

    /* returns the number of read requests sent */
    std::size_t refresh(const object_id& device);
    std::size_t refresh_all();
    /* renews every subscription due within the margin, returns the number renewed */
    std::size_t renew_subscriptions(request_dispatcher::clock::time_point now);

private:
    protocol_stack& _stack;
    device_registry& _registry;
    request_dispatcher& _dispatcher;
    const property_lists& _lists;
};
