#include "device_registry.hpp"

bool device_registry::upsert(const object_id& device, const bacnet_address& address) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_devices.count(device)) {
            return false;
        }
        _devices[device] = {.address = address};
    }
    _changes.set();
    return true;
}

bool device_registry::merge(const object_id& device, const object_id& object, const property_map& properties) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto device_it = _devices.find(device);
        if (device_it == _devices.end()) {
            return false;
        }
        auto& stored = device_it->second.objects[object];
        for (const auto& [property, value]: properties) {
            stored.insert_or_assign(property, value);
        }
    }
    _changes.set();
    return true;
}

std::optional<bacnet_address> device_registry::lookup_address(const object_id& device) const {
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto& [id, entry]: _devices) {
        if (id == device) {
            return entry.address;
        }
    }
    return std::nullopt;
}

std::optional<object_id> device_registry::lookup_device_id(const bacnet_address& address) const {
    std::lock_guard<std::mutex> lock(_mutex);
    for (const auto& [id, entry]: _devices) {
        if (entry.address == address) {
            return id;
        }
    }
    return std::nullopt;
}

bool device_registry::has_device(const object_id& device) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices.count(device) != 0;
}

bool device_registry::has_object(const object_id& device, const object_id& object) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto device_it = _devices.find(device);
    return device_it != _devices.end() and device_it->second.objects.count(object) != 0;
}

std::vector<object_id> device_registry::devices() const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<object_id> result;
    result.reserve(_devices.size());
    for (const auto& [id, entry]: _devices) {
        result.push_back(id);
    }
    return result;
}

std::vector<object_id> device_registry::objects(const object_id& device) const {
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<object_id> result;
    auto device_it = _devices.find(device);
    if (device_it == _devices.end()) {
        return result;
    }
    for (const auto& [object, properties]: device_it->second.objects) {
        result.push_back(object);
    }
    return result;
}

std::optional<property_map> device_registry::properties(const object_id& device, const object_id& object) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto device_it = _devices.find(device);
    if (device_it == _devices.end()) {
        return std::nullopt;
    }
    auto object_it = device_it->second.objects.find(object);
    if (object_it == device_it->second.objects.end()) {
        return std::nullopt;
    }
    return object_it->second;
}

std::optional<property_value> device_registry::property(
    const object_id& device,
    const object_id& object,
    property_id property
) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto device_it = _devices.find(device);
    if (device_it == _devices.end()) {
        return std::nullopt;
    }
    auto object_it = device_it->second.objects.find(object);
    if (object_it == device_it->second.objects.end()) {
        return std::nullopt;
    }
    auto property_it = object_it->second.find(property);
    if (property_it == object_it->second.end()) {
        return std::nullopt;
    }
    return property_it->second;
}

device_map device_registry::snapshot() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _devices;
}
