#include "config.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

static std::optional<unsigned long> parse_unsigned(const char *name, const char *text, unsigned long max) {
    char *end = nullptr;
    errno = 0;
    auto value = std::strtoul(text, &end, 10);
    if (*text == '\0' or *text == '-' or errno != 0 or *end != '\0' or value > max) {
        fprintf(stderr, "Ignoring %s=%s: not a number up to %lu\n", name, text, max);
        return std::nullopt;
    }
    return value;
}

static std::optional<std::vector<property_id>> parse_property_list(const char *name, const char *text) {
    std::vector<property_id> properties;
    std::istringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ',')) {
        auto property = parse_property_id(item);
        if (not property) {
            fprintf(stderr, "Ignoring %s=%s: unknown property %s\n", name, text, item.c_str());
            return std::nullopt;
        }
        properties.push_back(*property);
    }
    if (properties.empty()) {
        return std::nullopt;
    }
    return properties;
}

static std::optional<cov_disposition> parse_disposition(const char *text) {
    std::string value = text;
    auto colon = value.find(':');
    std::string action = value.substr(0, colon);
    cov_disposition disposition;
    if (action == "ack") {
        disposition.response = cov_disposition::action::acknowledge;
    } else if (action == "reject") {
        disposition.response = cov_disposition::action::reject;
    } else if (action == "abort") {
        disposition.response = cov_disposition::action::abort;
    } else {
        return std::nullopt;
    }
    if (colon != std::string::npos) {
        auto reason = parse_unsigned("BACNET_COV_DISPOSITION", value.c_str() + colon + 1, 255);
        if (not reason) {
            return std::nullopt;
        }
        disposition.reason = static_cast<uint8_t>(*reason);
    }
    return disposition;
}

collector_config load_config() {
    return load_config([](const char *name) { return std::getenv(name); });
}

collector_config load_config(const environment_lookup& getenv) {
    collector_config config;
    if (const char *host = getenv("MQTT_HOST")) {
        config.mqtt_host = host;
    }
    if (const char *port = getenv("MQTT_PORT")) {
        if (auto value = parse_unsigned("MQTT_PORT", port, 65535)) {
            config.mqtt_port = static_cast<int>(*value);
        }
    }
    if (getenv("BACNET_DEBUG")) {
        config.debug = true;
    }
    if (const char *instance = getenv("BACNET_DEVICE_INSTANCE")) {
        if (auto value = parse_unsigned("BACNET_DEVICE_INSTANCE", instance, 4194303)) {
            config.device_instance = static_cast<uint32_t>(*value);
        }
    }
    if (const char *lifetime = getenv("BACNET_COV_LIFETIME")) {
        if (auto value = parse_unsigned("BACNET_COV_LIFETIME", lifetime, UINT32_MAX)) {
            config.cov_lifetime = *value ? std::optional<uint32_t>(static_cast<uint32_t>(*value)) : std::nullopt;
        }
    }
    if (const char *disposition = getenv("BACNET_COV_DISPOSITION")) {
        if (auto value = parse_disposition(disposition)) {
            config.disposition = *value;
        } else {
            fprintf(stderr, "Ignoring BACNET_COV_DISPOSITION=%s: expected ack, reject[:reason] or abort[:reason]\n", disposition);
        }
    }
    if (const char *seconds = getenv("BACNET_REFRESH_SECONDS")) {
        if (auto value = parse_unsigned("BACNET_REFRESH_SECONDS", seconds, 86400)) {
            config.refresh_seconds = static_cast<unsigned>(*value);
        }
    }
    if (const char *seconds = getenv("BACNET_WHO_IS_SECONDS")) {
        if (auto value = parse_unsigned("BACNET_WHO_IS_SECONDS", seconds, 86400)) {
            config.who_is_seconds = static_cast<unsigned>(*value);
        }
    }
    if (const char *count = getenv("BACNET_MAX_OBJECTS_PER_READ")) {
        if (auto value = parse_unsigned("BACNET_MAX_OBJECTS_PER_READ", count, 1024)) {
            config.max_objects_per_read = *value;
        }
    }
    if (const char *list = getenv("BACNET_ONCE_PROPERTIES")) {
        if (auto properties = parse_property_list("BACNET_ONCE_PROPERTIES", list)) {
            config.lists.once_object_properties = std::move(*properties);
        }
    }
    if (const char *list = getenv("BACNET_PERIODIC_PROPERTIES")) {
        if (auto properties = parse_property_list("BACNET_PERIODIC_PROPERTIES", list)) {
            config.lists.periodic_object_properties = std::move(*properties);
        }
    }
    return config;
}
