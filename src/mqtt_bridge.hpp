#pragma once

#include "bacnet_types.hpp"
#include "device_registry.hpp"
#include "protocol_stack.hpp"
#include "request_dispatcher.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

/* bacnet-in/<device>/<object type>/<instance>[/<property>] */
struct write_command {
    object_id device;
    object_id object;
    property_id property;
};

std::vector<std::string> split_string(const std::string& str, char delimiter);

/* bacnet-out/<device>/<object type>/<instance>/<property> */
std::string value_topic(const object_id& device, const object_id& object, property_id property);
std::optional<write_command> parse_write_topic(const std::string& topic);

/* parses the payload with the property's datatype and sends the write; false if nothing was sent */
bool execute_write(
    const write_command& command,
    const std::string& payload,
    const device_registry& registry,
    request_dispatcher& dispatcher,
    const protocol_stack& stack
);

/* publishes every property value that changed since it was last published */
class registry_publisher {
public:
    using publish_function = std::function<int(const std::string&, const std::string&)>;

    registry_publisher(device_registry& registry, publish_function publish);

    /* returns the number of values published */
    std::size_t publish_changes();
    /* waits on the registry change signal until running turns false */
    void run(const std::atomic<bool>& running);

private:
    device_registry& _registry;
    publish_function _publish;
    std::unordered_map<std::string, std::string> _published;
};
