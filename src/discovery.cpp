#include "discovery.hpp"
#include "debug.hpp"
#include <cstdio>
#include <vector>

discovery::discovery(protocol_stack& stack, device_registry& registry, request_dispatcher& dispatcher, const property_lists& lists)
    : _stack(stack)
    , _registry(registry)
    , _dispatcher(dispatcher)
    , _lists(lists)
{
}

void discovery::start() {
    _stack.set_i_am_handler([this](const i_am_announcement& announcement) {
        on_i_am(announcement);
    });
    _stack.send_i_am();
    solicit();
}

void discovery::solicit() {
    if (bacnet_debug_enabled) {
        fprintf(stderr, "Sending Who-Is Request\n");
    }
    _stack.send_who_is();
}

void discovery::on_i_am(const i_am_announcement& announcement) {
    // TODO: refresh the stored address when a known device announces itself from a new one
    if (not _registry.upsert(announcement.device, announcement.source)) {
        return;
    }
    if (bacnet_debug_enabled) {
        fprintf(stderr, "Adding new device entry for device %s at %s\n",
            to_string(announcement.device).c_str(), to_string(announcement.source).c_str());
    }
    _dispatcher.read_many({announcement.device}, _lists.device_properties, announcement.source);
}

std::size_t discovery::refresh(const object_id& device) {
    auto address = _registry.lookup_address(device);
    if (not address) {
        return 0;
    }
    std::vector<object_id> objects;
    for (const auto& object: _registry.objects(device)) {
        if (_lists.is_subscribable(object.type)) {
            objects.push_back(object);
        }
    }
    if (objects.empty()) {
        return 0;
    }
    return _dispatcher.read_objects(objects, _lists.periodic_object_properties, *address);
}

std::size_t discovery::refresh_all() {
    std::size_t sent = 0;
    for (const auto& device: _registry.devices()) {
        sent += refresh(device);
    }
    return sent;
}

std::size_t discovery::renew_subscriptions(request_dispatcher::clock::time_point now) {
    std::size_t renewed = 0;
    for (const auto& key: _dispatcher.subscriptions_due(now)) {
        if (_dispatcher.renew(key).ok()) {
            ++renewed;
        }
    }
    return renewed;
}
