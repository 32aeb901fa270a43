#pragma once

#include "bacnet_types.hpp"
#include "change_signal.hpp"
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

struct device_entry {
    bacnet_address address;
    std::unordered_map<object_id, property_map> objects;
};

using device_map = std::unordered_map<object_id, device_entry>;

/**
 * In-memory model of every discovered device, its objects and their property values.
 *
 * Devices are never removed. Property maps are merged, an update only overwrites
 * the properties it carries. Every operation takes the registry lock, so readers on
 * other threads always see a consistent state.
 */
class device_registry {
public:
    /* returns true if the device was not known before */
    bool upsert(const object_id& device, const bacnet_address& address);
    /* returns false if the device is unknown, nothing is stored then */
    bool merge(const object_id& device, const object_id& object, const property_map& properties);

    std::optional<bacnet_address> lookup_address(const object_id& device) const;
    std::optional<object_id> lookup_device_id(const bacnet_address& address) const;

    bool has_device(const object_id& device) const;
    bool has_object(const object_id& device, const object_id& object) const;
    std::vector<object_id> devices() const;
    std::vector<object_id> objects(const object_id& device) const;
    std::optional<property_map> properties(const object_id& device, const object_id& object) const;
    std::optional<property_value> property(const object_id& device, const object_id& object, property_id property) const;
    device_map snapshot() const;

    change_signal& changes() { return _changes; }

private:
    mutable std::mutex _mutex;
    device_map _devices;
    change_signal _changes;
};
