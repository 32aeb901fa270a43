#include "property_decoder.hpp"
#include "debug.hpp"
#include "protocol_stack.hpp"
#include <cstdio>
#include <algorithm>

static bool matches(const std::optional<app_tag>& expected, const app_value& value) {
    return not expected or value.tag() == *expected;
}

static std::optional<property_value> decode_single(const std::optional<app_tag>& expected, const value_list& raw) {
    if (raw.size() != 1 or not matches(expected, raw.front())) {
        return std::nullopt;
    }
    return property_value{raw.front()};
}

std::optional<property_value> decode_property(
    const datatype& type,
    const value_list& raw,
    std::optional<uint32_t> array_index
)
{
    if (type.shape == value_shape::array and array_index) {
        if (*array_index == 0) {
            return decode_single(app_tag::unsigned_int, raw);
        }
        return decode_single(type.element, raw);
    }
    if (type.shape != value_shape::scalar) {
        auto element_fits = [&type](const app_value& value) { return matches(type.element, value); };
        if (not std::all_of(raw.begin(), raw.end(), element_fits)) {
            return std::nullopt;
        }
        return property_value{raw};
    }
    /* constructed values of a property without a known tag are kept as they came */
    if (not type.element and raw.size() != 1) {
        return property_value{raw};
    }
    return decode_single(type.element, raw);
}

std::optional<property_value> decode_property(
    const protocol_stack& stack,
    const object_id& object,
    property_id property,
    const value_list& raw,
    std::optional<uint32_t> array_index
)
{
    auto type = stack.datatype_of(object.type, property);
    if (not type) {
        if (bacnet_debug_enabled) {
            fprintf(stderr, "Skipping property %u of %s: unknown datatype\n",
                static_cast<unsigned>(property), to_string(object).c_str());
        }
        return std::nullopt;
    }
    auto value = decode_property(*type, raw, array_index);
    if (not value) {
        const char *name = property_name(property);
        fprintf(stderr, "Unable to decode %s of %s!\n",
            name ? name : std::to_string(static_cast<unsigned>(property)).c_str(),
            to_string(object).c_str());
    }
    return value;
}
