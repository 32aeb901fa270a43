#pragma once

#include "bacnet_types.hpp"
#include "device_registry.hpp"
#include "id_allocator.hpp"
#include "property_lists.hpp"
#include "protocol_stack.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

/**
 * Issues read, write and subscribe requests and handles their completions.
 *
 * Completions merge what was read into the registry and drive the next step:
 * a device read the first time seeds the object reads, an object read seeds its
 * COV subscription, a refused read is retried once with a narrower property list.
 * All calls and completions happen on the main loop thread.
 */
class request_dispatcher {
public:
    using clock = std::chrono::system_clock;

    request_dispatcher(protocol_stack& stack, device_registry& registry, id_allocator& ids, const property_lists& lists);

    submit_result read_one(const object_id& object, property_id property, const bacnet_address& address);
    submit_result read_many(
        const std::vector<object_id>& objects,
        const std::vector<property_id>& properties,
        const bacnet_address& address
    );
    submit_result write(const object_id& object, property_id property, const app_value& value, const bacnet_address& address);
    submit_result subscribe(
        const object_id& object,
        bool confirmed,
        const bacnet_address& address,
        std::optional<uint32_t> lifetime_seconds
    );
    /* a subscription with a lifetime of one second, the id is released once it completes */
    submit_result unsubscribe(const object_id& object, bool confirmed, const bacnet_address& address);

    /* read_many in batches of at most max_objects_per_read objects, returns the number of requests sent */
    std::size_t read_objects(
        const std::vector<object_id>& objects,
        const std::vector<property_id>& properties,
        const bacnet_address& address
    );

    /* subscriptions with a finite lifetime that end within the renewal margin */
    std::vector<subscription_key> subscriptions_due(clock::time_point now) const;
    submit_result renew(const subscription_key& key);
    void note_time_remaining(const subscription_key& key, uint32_t seconds);

    /* lifetime of the subscriptions made after an object read, empty for indefinite */
    void set_default_lifetime(std::optional<uint32_t> seconds) { _default_lifetime = seconds; }
    /* 0 puts all objects in one request */
    void set_max_objects_per_read(std::size_t count) { _max_objects_per_read = count; }

private:
    enum class read_stage {
        initial,
        device_fallback,
        reduced_fallback,
    };

    struct read_many_context {
        std::vector<object_id> objects;
        std::vector<property_id> properties;
        bacnet_address address;
        read_stage stage;
    };

    struct read_one_context {
        object_id object;
        property_id property;
        bacnet_address address;
    };

    struct subscription_entry {
        bacnet_address address;
        bool confirmed;
        uint32_t lifetime;
        clock::time_point expires;
        bool renewing = false;
    };

    submit_result send_read_many(read_many_context context);
    void on_read_many(const read_many_context& context, const completion<read_multiple_ack>& outcome);
    void retry_read_many(const read_many_context& context, const request_error& error);
    void on_read_one(const read_one_context& context, const completion<read_property_ack>& outcome);
    void on_subscribed(
        const subscription_key& key,
        bool confirmed,
        const bacnet_address& address,
        std::optional<uint32_t> lifetime,
        const completion<simple_ack>& outcome
    );

    void store(const object_id& device, const object_id& object, const property_map& properties, const bacnet_address& address);
    void load_objects(const object_id& device, const bacnet_address& address, bool first_load);
    void subscribe_if_needed(const object_id& device, const object_id& object, const bacnet_address& address);

    protocol_stack& _stack;
    device_registry& _registry;
    id_allocator& _ids;
    const property_lists& _lists;
    std::optional<uint32_t> _default_lifetime;
    std::size_t _max_objects_per_read = 16;
    /* devices whose object list has already been turned into object reads */
    std::unordered_set<object_id> _objects_requested;
    std::unordered_map<subscription_key, subscription_entry> _subscriptions;
};
