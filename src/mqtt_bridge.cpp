#include "mqtt_bridge.hpp"
#include "debug.hpp"
#include <chrono>
#include <cstdio>
#include <exception>

std::vector<std::string> split_string(const std::string& str, char delimiter) {
    std::vector<std::string> result;

    size_t start = 0;
    size_t end = str.find(delimiter);

    while (end != std::string::npos) {
        result.push_back(str.substr(start, end - start));
        start = end + 1;
        end = str.find(delimiter, start);
    }

    result.push_back(str.substr(start));

    return result;
}

std::string value_topic(const object_id& device, const object_id& object, property_id property) {
    const char *type = object_type_name(object.type);
    const char *name = property_name(property);
    return "bacnet-out/" + std::to_string(device.instance)
        + "/" + (type ? std::string(type) : std::to_string(static_cast<unsigned>(object.type)))
        + "/" + std::to_string(object.instance)
        + "/" + (name ? std::string(name) : std::to_string(static_cast<unsigned>(property)));
}

std::optional<write_command> parse_write_topic(const std::string& topic) {
    auto elements = split_string(topic, '/');
    if ((elements.size() != 4 and elements.size() != 5) or elements[0] != "bacnet-in") {
        return std::nullopt;
    }
    unsigned long device;
    unsigned long instance;
    try {
        device = std::stoul(elements[1]);
        instance = std::stoul(elements[3]);
    } catch (const std::exception& e) {
        fprintf(stderr, "Invalid instance in topic %s: %s\n", topic.c_str(), e.what());
        return std::nullopt;
    }
    if (device > 4194303 or instance > 4194303) {
        return std::nullopt;
    }
    auto type = parse_object_type(elements[2]);
    if (not type) {
        fprintf(stderr, "Unknown type in topic %s\n", topic.c_str());
        return std::nullopt;
    }
    auto property = property_id::present_value;
    if (elements.size() == 5) {
        auto parsed = parse_property_id(elements[4]);
        if (not parsed) {
            fprintf(stderr, "Unknown property in topic %s\n", topic.c_str());
            return std::nullopt;
        }
        property = *parsed;
    }
    return write_command{
        .device = device_object(static_cast<uint32_t>(device)),
        .object = {.type = *type, .instance = static_cast<uint32_t>(instance)},
        .property = property
    };
}

bool execute_write(
    const write_command& command,
    const std::string& payload,
    const device_registry& registry,
    request_dispatcher& dispatcher,
    const protocol_stack& stack
)
{
    auto address = registry.lookup_address(command.device);
    if (not address) {
        fprintf(stderr, "Unknown device for write: %s\n", to_string(command.device).c_str());
        return false;
    }
    std::optional<app_tag> tag;
    if (auto type = stack.datatype_of(command.object.type, command.property)) {
        tag = type->element;
    }
    if (not tag) {
        /* fall back to whatever the device reported last */
        auto current = registry.property(command.device, command.object, command.property);
        if (current and std::holds_alternative<app_value>(*current)) {
            tag = std::get<app_value>(*current).tag();
        }
    }
    if (not tag) {
        fprintf(stderr, "Unknown datatype for write to %s of %s\n",
            to_string(command.object).c_str(), to_string(command.device).c_str());
        return false;
    }
    auto value = parse_app_value(*tag, payload);
    if (not value) {
        fprintf(stderr, "Error: unable to parse the value %s, for %s of %s\n",
            payload.c_str(), to_string(command.object).c_str(), to_string(command.device).c_str());
        return false;
    }
    return dispatcher.write(command.object, command.property, *value, *address).ok();
}

registry_publisher::registry_publisher(device_registry& registry, publish_function publish)
    : _registry(registry)
    , _publish(std::move(publish))
{
}

std::size_t registry_publisher::publish_changes() {
    std::size_t published = 0;
    for (const auto& [device, entry]: _registry.snapshot()) {
        for (const auto& [object, properties]: entry.objects) {
            for (const auto& [property, value]: properties) {
                auto topic = value_topic(device, object, property);
                auto text = to_string(value);
                auto it = _published.find(topic);
                if (it != _published.end() and it->second == text) {
                    continue;
                }
                if (_publish(topic, text) != 0) {
                    continue;
                }
                _published[topic] = std::move(text);
                ++published;
            }
        }
    }
    if (bacnet_debug_enabled and published) {
        fprintf(stderr, "Published %zu values\n", published);
    }
    return published;
}

void registry_publisher::run(const std::atomic<bool>& running) {
    while (running) {
        if (_registry.changes().wait_for(std::chrono::milliseconds(500))) {
            _registry.changes().clear();
            publish_changes();
        }
    }
}
