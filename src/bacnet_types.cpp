#include "bacnet_types.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iterator>

struct object_type_text {
    object_type type;
    const char *name;
};

static const object_type_text Object_Type_Names[] = {
    {object_type::analog_input, "analog-input"},
    {object_type::analog_output, "analog-output"},
    {object_type::analog_value, "analog-value"},
    {object_type::binary_input, "binary-input"},
    {object_type::binary_output, "binary-output"},
    {object_type::binary_value, "binary-value"},
    {object_type::calendar, "calendar"},
    {object_type::command, "command"},
    {object_type::device, "device"},
    {object_type::event_enrollment, "event-enrollment"},
    {object_type::file, "file"},
    {object_type::group, "group"},
    {object_type::loop, "loop"},
    {object_type::multi_state_input, "multi-state-input"},
    {object_type::multi_state_output, "multi-state-output"},
    {object_type::notification_class, "notification-class"},
    {object_type::program, "program"},
    {object_type::schedule, "schedule"},
    {object_type::averaging, "averaging"},
    {object_type::multi_state_value, "multi-state-value"},
    {object_type::trend_log, "trend-log"},
    {object_type::accumulator, "accumulator"},
    {object_type::pulse_converter, "pulse-converter"},
    {object_type::integer_value, "integer-value"},
    {object_type::large_analog_value, "large-analog-value"},
    {object_type::positive_integer_value, "positive-integer-value"},
    {object_type::lighting_output, "lighting-output"},
};

struct property_text {
    property_id property;
    const char *name;
};

static const property_text Property_Names[] = {
    {property_id::active_text, "active-text"},
    {property_id::apdu_timeout, "apdu-timeout"},
    {property_id::application_software_version, "application-software-version"},
    {property_id::notification_class, "notification-class"},
    {property_id::cov_increment, "cov-increment"},
    {property_id::description, "description"},
    {property_id::event_state, "event-state"},
    {property_id::firmware_revision, "firmware-revision"},
    {property_id::inactive_text, "inactive-text"},
    {property_id::max_apdu_length_accepted, "max-apdu-length-accepted"},
    {property_id::max_pres_value, "max-pres-value"},
    {property_id::min_pres_value, "min-pres-value"},
    {property_id::model_name, "model-name"},
    {property_id::number_of_apdu_retries, "number-of-apdu-retries"},
    {property_id::number_of_states, "number-of-states"},
    {property_id::object_identifier, "object-identifier"},
    {property_id::object_list, "object-list"},
    {property_id::object_name, "object-name"},
    {property_id::object_type, "object-type"},
    {property_id::out_of_service, "out-of-service"},
    {property_id::polarity, "polarity"},
    {property_id::present_value, "present-value"},
    {property_id::priority_array, "priority-array"},
    {property_id::protocol_object_types_supported, "protocol-object-types-supported"},
    {property_id::protocol_services_supported, "protocol-services-supported"},
    {property_id::protocol_version, "protocol-version"},
    {property_id::reliability, "reliability"},
    {property_id::relinquish_default, "relinquish-default"},
    {property_id::resolution, "resolution"},
    {property_id::segmentation_supported, "segmentation-supported"},
    {property_id::state_text, "state-text"},
    {property_id::status_flags, "status-flags"},
    {property_id::system_status, "system-status"},
    {property_id::units, "units"},
    {property_id::vendor_identifier, "vendor-identifier"},
    {property_id::vendor_name, "vendor-name"},
    {property_id::protocol_revision, "protocol-revision"},
    {property_id::database_revision, "database-revision"},
    {property_id::max_segments_accepted, "max-segments-accepted"},
    {property_id::serial_number, "serial-number"},
};

/* digits only, so that topics can carry types this table does not name */
static std::optional<uint32_t> parse_number(const std::string& text) {
    if (text.empty() or not std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' and c <= '9'; })) {
        return std::nullopt;
    }
    errno = 0;
    auto number = std::strtoul(text.c_str(), nullptr, 10);
    if (errno != 0 or number > UINT32_MAX) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(number);
}

const char *object_type_name(object_type type) {
    auto it = std::find_if(std::begin(Object_Type_Names), std::end(Object_Type_Names),
        [type](const object_type_text& entry) { return entry.type == type; });
    return it == std::end(Object_Type_Names) ? nullptr : it->name;
}

const char *property_name(property_id property) {
    auto it = std::find_if(std::begin(Property_Names), std::end(Property_Names),
        [property](const property_text& entry) { return entry.property == property; });
    return it == std::end(Property_Names) ? nullptr : it->name;
}

std::optional<object_type> parse_object_type(const std::string& name) {
    for (const auto& entry: Object_Type_Names) {
        if (name == entry.name) {
            return entry.type;
        }
    }
    auto number = parse_number(name);
    if (not number or *number > 1023) {
        return std::nullopt;
    }
    return static_cast<object_type>(*number);
}

std::optional<property_id> parse_property_id(const std::string& name) {
    for (const auto& entry: Property_Names) {
        if (name == entry.name) {
            return entry.property;
        }
    }
    auto number = parse_number(name);
    if (not number or *number > 4194303) {
        return std::nullopt;
    }
    return static_cast<property_id>(*number);
}

std::string to_string(const object_id& object) {
    const char *name = object_type_name(object.type);
    std::string type = name ? name : std::to_string(static_cast<unsigned>(object.type));
    return type + ":" + std::to_string(object.instance);
}

std::string to_string(const bacnet_address& address) {
    char buffer[32];
    /* B/IP: 4 octets of address followed by the port */
    if (address.mac.size() == 6 and address.net == 0) {
        snprintf(buffer, sizeof(buffer), "%u.%u.%u.%u:%u",
            address.mac[0], address.mac[1], address.mac[2], address.mac[3],
            static_cast<unsigned>(address.mac[4] << 8 | address.mac[5]));
        return buffer;
    }
    std::string text;
    for (auto octet: address.mac) {
        snprintf(buffer, sizeof(buffer), "%02X", octet);
        text += buffer;
    }
    if (address.net != 0) {
        text += "@" + std::to_string(address.net) + ":";
        for (auto octet: address.adr) {
            snprintf(buffer, sizeof(buffer), "%02X", octet);
            text += buffer;
        }
    }
    return text;
}

std::string to_string(const app_value& value) {
    char buffer[64];
    switch (value.tag()) {
        case app_tag::null:
            return "null";
        case app_tag::boolean:
            return std::to_string(std::get<bool>(value.data));
        case app_tag::unsigned_int:
            return std::to_string(std::get<uint64_t>(value.data));
        case app_tag::signed_int:
            return std::to_string(std::get<int64_t>(value.data));
        case app_tag::real:
            return std::to_string(std::get<float>(value.data));
        case app_tag::double_real:
            return std::to_string(std::get<double>(value.data));
        case app_tag::octet_string: {
            std::string text;
            for (auto octet: std::get<octet_string>(value.data)) {
                snprintf(buffer, sizeof(buffer), "%02X", octet);
                text += buffer;
            }
            return text;
        }
        case app_tag::character_string:
            return std::get<std::string>(value.data);
        case app_tag::bit_string: {
            std::string text;
            for (bool bit: std::get<bit_string>(value.data).bits) {
                text += bit ? '1' : '0';
            }
            return text;
        }
        case app_tag::enumerated:
            return std::to_string(std::get<enumerated_value>(value.data).value);
        case app_tag::date: {
            const auto& date = std::get<date_value>(value.data);
            snprintf(buffer, sizeof(buffer), "%04u-%02u-%02u", date.year, date.month, date.day);
            return buffer;
        }
        case app_tag::time: {
            const auto& time = std::get<time_value>(value.data);
            snprintf(buffer, sizeof(buffer), "%02u:%02u:%02u.%02u", time.hour, time.minute, time.second, time.hundredths);
            return buffer;
        }
        case app_tag::object_id:
            return to_string(std::get<object_id>(value.data));
    }
    return "";
}

std::string to_string(const property_value& value) {
    if (const auto *scalar = std::get_if<app_value>(&value)) {
        return to_string(*scalar);
    }
    std::string text = "[";
    for (const auto& element: std::get<value_list>(value)) {
        if (text.size() > 1) {
            text += ",";
        }
        text += to_string(element);
    }
    return text + "]";
}

std::optional<app_value> parse_app_value(app_tag tag, const std::string& text) {
    char *end = nullptr;
    errno = 0;
    switch (tag) {
        case app_tag::null:
            if (text == "null" or text.empty()) {
                return app_value{std::monostate{}};
            }
            return std::nullopt;
        case app_tag::boolean:
            if (text == "1" or text == "true" or text == "active") {
                return app_value{true};
            }
            if (text == "0" or text == "false" or text == "inactive") {
                return app_value{false};
            }
            return std::nullopt;
        case app_tag::unsigned_int: {
            if (text.empty() or text[0] == '-') {
                return std::nullopt;
            }
            auto number = std::strtoull(text.c_str(), &end, 10);
            if (errno != 0 or *end != '\0') {
                return std::nullopt;
            }
            return app_value{static_cast<uint64_t>(number)};
        }
        case app_tag::signed_int: {
            auto number = std::strtoll(text.c_str(), &end, 10);
            if (text.empty() or errno != 0 or *end != '\0') {
                return std::nullopt;
            }
            return app_value{static_cast<int64_t>(number)};
        }
        case app_tag::real: {
            auto number = std::strtof(text.c_str(), &end);
            if (text.empty() or errno != 0 or *end != '\0') {
                return std::nullopt;
            }
            return app_value{number};
        }
        case app_tag::double_real: {
            auto number = std::strtod(text.c_str(), &end);
            if (text.empty() or errno != 0 or *end != '\0') {
                return std::nullopt;
            }
            return app_value{number};
        }
        case app_tag::character_string:
            return app_value{text};
        case app_tag::enumerated: {
            auto number = parse_number(text);
            if (not number) {
                return std::nullopt;
            }
            return app_value{enumerated_value{*number}};
        }
        default:
            /* octet/bit strings, dates, times and object ids are not writable from text */
            return std::nullopt;
    }
}
