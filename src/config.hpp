#pragma once

#include "property_lists.hpp"
#include "protocol_stack.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

struct collector_config {
    std::string mqtt_host = "localhost";
    int mqtt_port = 1883;
    bool debug = false;
    /* own device instance, BACNET_MAX_INSTANCE */
    uint32_t device_instance = 4194303;
    /* empty subscribes indefinitely */
    std::optional<uint32_t> cov_lifetime;
    cov_disposition disposition;
    /* 0 disables the timer */
    unsigned refresh_seconds = 60;
    unsigned who_is_seconds = 300;
    std::size_t max_objects_per_read = 16;
    property_lists lists = property_lists::defaults();
};

using environment_lookup = std::function<const char *(const char *)>;

/* reads the process environment; invalid values are reported and the default is kept */
collector_config load_config();
collector_config load_config(const environment_lookup& getenv);
