#pragma once

#include "bacnet_types.hpp"
#include <vector>

/* which properties are read at each stage, and which objects are worth subscribing to */
struct property_lists {
    /* first read of a newly announced device */
    std::vector<property_id> device_properties;
    /* retry of a device read the peer refused */
    std::vector<property_id> basic_device_properties;
    /* retry of an object read the peer refused, widely supported by all devices */
    std::vector<property_id> reduced_object_properties;
    /* read once per object after its device has been loaded */
    std::vector<property_id> once_object_properties;
    /* read on every refresh */
    std::vector<property_id> periodic_object_properties;
    std::vector<object_type> subscribable_types;

    bool is_subscribable(object_type type) const;

    static property_lists defaults();
};
