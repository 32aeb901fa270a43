#include "request_dispatcher.hpp"
#include "debug.hpp"
#include "property_decoder.hpp"
#include <algorithm>
#include <cstdio>
#include <unordered_set>

/* renew this long before a subscription would run out */
static constexpr std::chrono::seconds Renewal_Margin{60};

static std::string describe(const request_error& error) {
    std::string text = error_kind_name(error.kind);
    if (error.kind == error_kind::error) {
        text += " (class " + std::to_string(error.error_class) + ", code " + std::to_string(error.code) + ")";
    } else if (error.kind == error_kind::reject or error.kind == error_kind::abort) {
        text += " (reason " + std::to_string(error.code) + ")";
    }
    return text;
}

request_dispatcher::request_dispatcher(
    protocol_stack& stack,
    device_registry& registry,
    id_allocator& ids,
    const property_lists& lists
)
    : _stack(stack)
    , _registry(registry)
    , _ids(ids)
    , _lists(lists)
{
}

submit_result request_dispatcher::read_one(const object_id& object, property_id property, const bacnet_address& address) {
    read_one_context context = {.object = object, .property = property, .address = address};
    auto result = _stack.read_property(object, property, address,
        [this, context](const completion<read_property_ack>& outcome) {
            on_read_one(context, outcome);
        });
    if (not result.ok()) {
        fprintf(stderr, "Failed to send ReadProperty to %s for %s: %s\n",
            to_string(address).c_str(), to_string(object).c_str(), submit_error_name(*result.error));
    }
    return result;
}

submit_result request_dispatcher::read_many(
    const std::vector<object_id>& objects,
    const std::vector<property_id>& properties,
    const bacnet_address& address
)
{
    return send_read_many({
        .objects = objects,
        .properties = properties,
        .address = address,
        .stage = read_stage::initial
    });
}

std::size_t request_dispatcher::read_objects(
    const std::vector<object_id>& objects,
    const std::vector<property_id>& properties,
    const bacnet_address& address
)
{
    std::size_t batch = _max_objects_per_read ? _max_objects_per_read : objects.size();
    std::size_t sent = 0;
    for (std::size_t first = 0; first < objects.size(); first += batch) {
        auto last = objects.begin() + std::min(first + batch, objects.size());
        std::vector<object_id> chunk(objects.begin() + first, last);
        if (read_many(chunk, properties, address).ok()) {
            ++sent;
        }
    }
    return sent;
}

submit_result request_dispatcher::send_read_many(read_many_context context) {
    if (context.objects.empty() or context.properties.empty()) {
        fprintf(stderr, "Not sending an empty ReadPropertyMultiple to %s\n", to_string(context.address).c_str());
        return submit_result::failed(submit_error::empty_request);
    }
    std::vector<read_access_spec> specs;
    specs.reserve(context.objects.size());
    for (const auto& object: context.objects) {
        specs.push_back({.object = object, .properties = context.properties});
    }
    auto address = context.address;
    auto result = _stack.read_property_multiple(specs, address,
        [this, context = std::move(context)](const completion<read_multiple_ack>& outcome) {
            on_read_many(context, outcome);
        });
    if (not result.ok()) {
        fprintf(stderr, "Failed to send ReadPropertyMultiple to %s: %s\n",
            to_string(address).c_str(), submit_error_name(*result.error));
    } else if (bacnet_debug_enabled) {
        fprintf(stderr, "Sent ReadPropertyMultiple for %zu objects to %s (invoke id %u)\n",
            specs.size(), to_string(address).c_str(), result.invoke_id);
    }
    return result;
}

void request_dispatcher::on_read_many(const read_many_context& context, const completion<read_multiple_ack>& outcome) {
    if (const auto *error = std::get_if<request_error>(&outcome)) {
        retry_read_many(context, *error);
        return;
    }
    const auto& ack = std::get<read_multiple_ack>(outcome);
    auto device = _registry.lookup_device_id(context.address);
    if (not device) {
        fprintf(stderr, "ReadPropertyMultiple ack from unknown device at %s\n", to_string(context.address).c_str());
        return;
    }
    if (bacnet_debug_enabled) {
        fprintf(stderr, "Multi read response from %s\n", to_string(ack.source).c_str());
    }
    for (const auto& result: ack.objects) {
        property_map properties;
        for (const auto& entry: result.results) {
            if (not entry.value) {
                if (bacnet_debug_enabled) {
                    fprintf(stderr, "Property %u of %s not readable\n",
                        static_cast<unsigned>(entry.property), to_string(result.object).c_str());
                }
                continue;
            }
            auto value = decode_property(_stack, result.object, entry.property, *entry.value, entry.array_index);
            if (value) {
                properties.insert_or_assign(entry.property, std::move(*value));
            }
        }
        store(*device, result.object, properties, context.address);
    }
}

void request_dispatcher::retry_read_many(const read_many_context& context, const request_error& error) {
    fprintf(stderr, "ReadPropertyMultiple of %zu objects from %s failed: %s\n",
        context.objects.size(), to_string(context.address).c_str(), describe(error).c_str());
    if (context.stage != read_stage::initial) {
        fprintf(stderr, "Giving up on ReadPropertyMultiple of %s from %s\n",
            to_string(context.objects.front()).c_str(), to_string(context.address).c_str());
        return;
    }
    read_many_context retry = context;
    if (context.objects.size() == 1 and is_device(context.objects.front())) {
        retry.stage = read_stage::device_fallback;
        /* the retry asks for the basic device list, not the full one */
        retry.properties = _lists.basic_device_properties;
    } else {
        retry.stage = read_stage::reduced_fallback;
        retry.properties = _lists.reduced_object_properties;
    }
    send_read_many(std::move(retry));
}

void request_dispatcher::on_read_one(const read_one_context& context, const completion<read_property_ack>& outcome) {
    if (const auto *error = std::get_if<request_error>(&outcome)) {
        fprintf(stderr, "ReadProperty %u of %s from %s failed: %s\n",
            static_cast<unsigned>(context.property), to_string(context.object).c_str(),
            to_string(context.address).c_str(), describe(*error).c_str());
        /* the object list is all a device has to give to be explored */
        if (is_device(context.object) and context.property != property_id::object_list) {
            read_one(context.object, property_id::object_list, context.address);
        }
        return;
    }
    const auto& ack = std::get<read_property_ack>(outcome);
    auto device = _registry.lookup_device_id(context.address);
    if (not device) {
        fprintf(stderr, "ReadProperty ack from unknown device at %s\n", to_string(context.address).c_str());
        return;
    }
    auto value = decode_property(_stack, ack.object, ack.property, ack.value, ack.array_index);
    if (not value) {
        return;
    }
    store(*device, ack.object, {{ack.property, std::move(*value)}}, context.address);
}

void request_dispatcher::store(
    const object_id& device,
    const object_id& object,
    const property_map& properties,
    const bacnet_address& address
)
{
    bool first_load = is_device(object) and not _registry.has_object(device, object);
    if (not _registry.merge(device, object, properties)) {
        fprintf(stderr, "Dropping properties of %s: device %s is unknown\n",
            to_string(object).c_str(), to_string(device).c_str());
        return;
    }
    if (is_device(object)) {
        load_objects(device, address, first_load);
    } else {
        subscribe_if_needed(device, object, address);
    }
}

void request_dispatcher::load_objects(const object_id& device, const bacnet_address& address, bool first_load) {
    if (_objects_requested.count(device)) {
        return;
    }
    auto object_list = _registry.property(device, device, property_id::object_list);
    if (not object_list) {
        if (first_load) {
            read_one(device, property_id::object_list, address);
        }
        return;
    }
    _objects_requested.insert(device);

    std::vector<object_id> objects;
    auto collect = [this, &objects](const app_value& element) {
        const auto *object = std::get_if<object_id>(&element.data);
        if (object and _lists.is_subscribable(object->type)) {
            objects.push_back(*object);
        }
    };
    if (const auto *elements = std::get_if<value_list>(&*object_list)) {
        std::for_each(elements->begin(), elements->end(), collect);
    } else {
        collect(std::get<app_value>(*object_list));
    }
    if (bacnet_debug_enabled) {
        fprintf(stderr, "Reading %zu objects of device %s\n", objects.size(), to_string(device).c_str());
    }
    if (not objects.empty()) {
        read_objects(objects, _lists.once_object_properties, address);
    }
}

void request_dispatcher::subscribe_if_needed(const object_id& device, const object_id& object, const bacnet_address& address) {
    if (not _lists.is_subscribable(object.type) or _ids.contains({.object = object, .device = device})) {
        return;
    }
    subscribe(object, true, address, _default_lifetime);
}

submit_result request_dispatcher::write(
    const object_id& object,
    property_id property,
    const app_value& value,
    const bacnet_address& address
)
{
    auto result = _stack.write_property(object, property, value, address,
        [this, object, property, address](const completion<simple_ack>& outcome) {
            if (const auto *error = std::get_if<request_error>(&outcome)) {
                fprintf(stderr, "WriteProperty %u of %s at %s failed: %s\n",
                    static_cast<unsigned>(property), to_string(object).c_str(),
                    to_string(address).c_str(), describe(*error).c_str());
                return;
            }
            /* read back what the device accepted */
            read_one(object, property, address);
        });
    if (not result.ok()) {
        fprintf(stderr, "Failed to send WriteProperty to %s for %s: %s\n",
            to_string(address).c_str(), to_string(object).c_str(), submit_error_name(*result.error));
    }
    return result;
}

submit_result request_dispatcher::subscribe(
    const object_id& object,
    bool confirmed,
    const bacnet_address& address,
    std::optional<uint32_t> lifetime_seconds
)
{
    auto device = _registry.lookup_device_id(address);
    if (not device) {
        fprintf(stderr, "Not subscribing to %s: no device at %s\n", to_string(object).c_str(), to_string(address).c_str());
        return submit_result::failed(submit_error::unknown_device);
    }
    subscription_key key = {.object = object, .device = *device};
    subscribe_cov_request request = {
        .subscriber_process_id = _ids.assign(key),
        .monitored_object = object,
        .confirmed = confirmed,
        .lifetime = lifetime_seconds
    };
    if (bacnet_debug_enabled) {
        fprintf(stderr, "Sending COV subscribe to: %s, object: %s, process id: %u\n",
            to_string(*device).c_str(), to_string(object).c_str(), request.subscriber_process_id);
    }
    auto result = _stack.subscribe_cov(request, address,
        [this, key, confirmed, address, lifetime_seconds](const completion<simple_ack>& outcome) {
            on_subscribed(key, confirmed, address, lifetime_seconds, outcome);
        });
    if (not result.ok()) {
        fprintf(stderr, "Failed to send SubscribeCOV for %s: %s\n",
            to_string(object).c_str(), submit_error_name(*result.error));
        _ids.unassign(key);
        _subscriptions.erase(key);
    }
    return result;
}

void request_dispatcher::on_subscribed(
    const subscription_key& key,
    bool confirmed,
    const bacnet_address& address,
    std::optional<uint32_t> lifetime,
    const completion<simple_ack>& outcome
)
{
    if (const auto *error = std::get_if<request_error>(&outcome)) {
        fprintf(stderr, "SubscribeCOV for %s of %s failed: %s\n",
            to_string(key.object).c_str(), to_string(key.device).c_str(), describe(*error).c_str());
        /* the peer refused this id, the next attempt gets a fresh one */
        _ids.unassign(key);
        _subscriptions.erase(key);
        return;
    }
    if (bacnet_debug_enabled) {
        fprintf(stderr, "SubscribeCOV acknowledged for %s of %s\n",
            to_string(key.object).c_str(), to_string(key.device).c_str());
    }
    if (lifetime and *lifetime > 0) {
        _subscriptions.insert_or_assign(key, subscription_entry{
            .address = address,
            .confirmed = confirmed,
            .lifetime = *lifetime,
            .expires = clock::now() + std::chrono::seconds(*lifetime)
        });
    } else {
        _subscriptions.erase(key);
    }
}

submit_result request_dispatcher::unsubscribe(const object_id& object, bool confirmed, const bacnet_address& address) {
    auto device = _registry.lookup_device_id(address);
    if (not device) {
        fprintf(stderr, "Not unsubscribing from %s: no device at %s\n", to_string(object).c_str(), to_string(address).c_str());
        return submit_result::failed(submit_error::unknown_device);
    }
    subscription_key key = {.object = object, .device = *device};
    _subscriptions.erase(key);
    subscribe_cov_request request = {
        .subscriber_process_id = _ids.assign(key),
        .monitored_object = object,
        .confirmed = confirmed,
        .lifetime = 1
    };
    auto result = _stack.subscribe_cov(request, address,
        [this, key](const completion<simple_ack>& outcome) {
            if (const auto *error = std::get_if<request_error>(&outcome)) {
                fprintf(stderr, "Unsubscribe from %s failed: %s\n", to_string(key.object).c_str(), describe(*error).c_str());
            }
            _ids.unassign(key);
        });
    if (not result.ok()) {
        fprintf(stderr, "Failed to send unsubscribe for %s: %s\n",
            to_string(object).c_str(), submit_error_name(*result.error));
        _ids.unassign(key);
    }
    return result;
}

std::vector<subscription_key> request_dispatcher::subscriptions_due(clock::time_point now) const {
    std::vector<subscription_key> due;
    for (const auto& [key, entry]: _subscriptions) {
        auto margin = std::min<std::chrono::seconds>(Renewal_Margin, std::chrono::seconds(entry.lifetime / 2));
        if (not entry.renewing and entry.expires - margin <= now) {
            due.push_back(key);
        }
    }
    return due;
}

submit_result request_dispatcher::renew(const subscription_key& key) {
    auto it = _subscriptions.find(key);
    if (it == _subscriptions.end()) {
        return submit_result::failed(submit_error::unknown_device);
    }
    it->second.renewing = true;
    auto entry = it->second;
    return subscribe(key.object, entry.confirmed, entry.address, entry.lifetime);
}

void request_dispatcher::note_time_remaining(const subscription_key& key, uint32_t seconds) {
    auto it = _subscriptions.find(key);
    if (it == _subscriptions.end() or seconds == 0) {
        return;
    }
    it->second.expires = clock::now() + std::chrono::seconds(seconds);
}
