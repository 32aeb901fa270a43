#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

/* numeric values are the BACnet object type enumeration */
enum class object_type : uint16_t {
    analog_input = 0,
    analog_output = 1,
    analog_value = 2,
    binary_input = 3,
    binary_output = 4,
    binary_value = 5,
    calendar = 6,
    command = 7,
    device = 8,
    event_enrollment = 9,
    file = 10,
    group = 11,
    loop = 12,
    multi_state_input = 13,
    multi_state_output = 14,
    notification_class = 15,
    program = 16,
    schedule = 17,
    averaging = 18,
    multi_state_value = 19,
    trend_log = 20,
    accumulator = 23,
    pulse_converter = 24,
    integer_value = 45,
    large_analog_value = 46,
    positive_integer_value = 48,
    lighting_output = 54,
};

/* numeric values are the BACnet property identifier enumeration */
enum class property_id : uint32_t {
    active_text = 4,
    apdu_timeout = 11,
    application_software_version = 12,
    notification_class = 17,
    cov_increment = 22,
    description = 28,
    event_state = 36,
    firmware_revision = 44,
    inactive_text = 46,
    max_apdu_length_accepted = 62,
    max_pres_value = 65,
    min_pres_value = 69,
    model_name = 70,
    number_of_apdu_retries = 73,
    number_of_states = 74,
    object_identifier = 75,
    object_list = 76,
    object_name = 77,
    object_type = 79,
    out_of_service = 81,
    polarity = 84,
    present_value = 85,
    priority_array = 87,
    protocol_object_types_supported = 96,
    protocol_services_supported = 97,
    protocol_version = 98,
    reliability = 103,
    relinquish_default = 104,
    resolution = 106,
    segmentation_supported = 107,
    state_text = 110,
    status_flags = 111,
    system_status = 112,
    units = 117,
    vendor_identifier = 120,
    vendor_name = 121,
    protocol_revision = 139,
    database_revision = 155,
    max_segments_accepted = 167,
    serial_number = 372,
};

struct object_id {
    object_type type;
    uint32_t instance;
};

inline bool operator==(const object_id& lhs, const object_id& rhs) {
    return lhs.type == rhs.type and lhs.instance == rhs.instance;
}

inline bool operator!=(const object_id& lhs, const object_id& rhs) {
    return not (lhs == rhs);
}

inline bool is_device(const object_id& object) {
    return object.type == object_type::device;
}

inline object_id device_object(uint32_t instance) {
    return {.type = object_type::device, .instance = instance};
}

template <>
struct std::hash<object_id>
{
  std::size_t operator()(const object_id& k) const
  {
    return std::hash<uint32_t>()(static_cast<uint32_t>(k.type) << 22 | k.instance);
  }
};

/* transport address of a peer, opaque to everything but the stack adapter */
struct bacnet_address {
    std::vector<uint8_t> mac;
    uint16_t net = 0;
    std::vector<uint8_t> adr;
};

inline bool operator==(const bacnet_address& lhs, const bacnet_address& rhs) {
    return lhs.mac == rhs.mac and lhs.net == rhs.net and lhs.adr == rhs.adr;
}

inline bool operator!=(const bacnet_address& lhs, const bacnet_address& rhs) {
    return not (lhs == rhs);
}

template <>
struct std::hash<bacnet_address>
{
  std::size_t operator()(const bacnet_address& k) const
  {
    std::size_t seed = std::hash<uint16_t>()(k.net);
    for (auto octet: k.mac) {
        seed = seed * 31 + octet;
    }
    for (auto octet: k.adr) {
        seed = seed * 31 + octet;
    }
    return seed;
  }
};

/* application tags, in the order of the alternatives of app_value::storage */
enum class app_tag : uint8_t {
    null = 0,
    boolean = 1,
    unsigned_int = 2,
    signed_int = 3,
    real = 4,
    double_real = 5,
    octet_string = 6,
    character_string = 7,
    bit_string = 8,
    enumerated = 9,
    date = 10,
    time = 11,
    object_id = 12,
};

using octet_string = std::vector<uint8_t>;

struct bit_string {
    std::vector<bool> bits;
};

struct enumerated_value {
    uint32_t value;
};

struct date_value {
    uint16_t year;
    uint8_t month;
    uint8_t day;
    uint8_t weekday;
};

struct time_value {
    uint8_t hour;
    uint8_t minute;
    uint8_t second;
    uint8_t hundredths;
};

inline bool operator==(const bit_string& lhs, const bit_string& rhs) {
    return lhs.bits == rhs.bits;
}

inline bool operator==(const enumerated_value& lhs, const enumerated_value& rhs) {
    return lhs.value == rhs.value;
}

inline bool operator==(const date_value& lhs, const date_value& rhs) {
    return lhs.year == rhs.year and lhs.month == rhs.month and lhs.day == rhs.day and lhs.weekday == rhs.weekday;
}

inline bool operator==(const time_value& lhs, const time_value& rhs) {
    return lhs.hour == rhs.hour and lhs.minute == rhs.minute and lhs.second == rhs.second
        and lhs.hundredths == rhs.hundredths;
}

/* one application-tagged primitive as delivered by the protocol stack */
struct app_value {
    using storage = std::variant<
        std::monostate,
        bool,
        uint64_t,
        int64_t,
        float,
        double,
        octet_string,
        std::string,
        bit_string,
        enumerated_value,
        date_value,
        time_value,
        object_id
    >;
    storage data;

    app_tag tag() const { return static_cast<app_tag>(data.index()); }
};

inline bool operator==(const app_value& lhs, const app_value& rhs) {
    return lhs.data == rhs.data;
}

using value_list = std::vector<app_value>;

/* decoded property: a scalar, or the elements of an array/list property */
using property_value = std::variant<app_value, value_list>;

using property_map = std::unordered_map<property_id, property_value>;

enum class value_shape : uint8_t {
    scalar,
    array,
    list,
};

/* declared datatype of a property; no element tag means any tag is accepted */
struct datatype {
    value_shape shape = value_shape::scalar;
    std::optional<app_tag> element;
};

const char *object_type_name(object_type type);
const char *property_name(property_id property);
std::optional<object_type> parse_object_type(const std::string& name);
std::optional<property_id> parse_property_id(const std::string& name);

std::string to_string(const object_id& object);
std::string to_string(const bacnet_address& address);
std::string to_string(const app_value& value);
std::string to_string(const property_value& value);

std::optional<app_value> parse_app_value(app_tag tag, const std::string& text);
