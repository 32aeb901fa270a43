#include "cov_ingestor.hpp"
#include "debug.hpp"
#include "property_decoder.hpp"
#include <cstdio>

cov_ingestor::cov_ingestor(protocol_stack& stack, device_registry& registry, request_dispatcher& dispatcher)
    : _stack(stack)
    , _registry(registry)
    , _dispatcher(dispatcher)
{
}

void cov_ingestor::attach() {
    _stack.set_cov_handler([this](const cov_notification& notification) {
        on_notification(notification);
    });
}

void cov_ingestor::on_notification(const cov_notification& notification) {
    if (bacnet_debug_enabled) {
        fprintf(stderr, "%s COV notification from %s for %s, %zu values\n",
            notification.confirmed ? "Confirmed" : "Unconfirmed",
            to_string(notification.initiating_device).c_str(),
            to_string(notification.monitored_object).c_str(),
            notification.values.size());
    }
    property_map properties;
    for (const auto& entry: notification.values) {
        auto value = decode_property(_stack, notification.monitored_object, entry.property, entry.value, entry.array_index);
        if (value) {
            properties.insert_or_assign(entry.property, std::move(*value));
        }
    }
    if (not _registry.merge(notification.initiating_device, notification.monitored_object, properties)) {
        fprintf(stderr, "COV notification from unknown device %s\n", to_string(notification.initiating_device).c_str());
    }
    _dispatcher.note_time_remaining(
        {.object = notification.monitored_object, .device = notification.initiating_device},
        notification.time_remaining
    );

    if (notification.confirmed) {
        _stack.respond_cov(*notification.confirmed, _disposition);
    }
}
