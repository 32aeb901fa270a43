#pragma once

#include "bacnet_types.hpp"
#include <cstdint>
#include <optional>

/**
 * Casts the raw application values of one property to its declared datatype.
 *
 * For an array property read with an index, index 0 is the element count and
 * always decodes as an unsigned integer; any other index decodes as one element.
 * Without an index an array or list property decodes to all of its elements.
 * Returns nothing when the values do not fit the datatype.
 */
std::optional<property_value> decode_property(
    const datatype& type,
    const value_list& raw,
    std::optional<uint32_t> array_index
);

class protocol_stack;

/**
 * Same as above with the datatype looked up through the stack. Unknown
 * datatypes and values that do not fit are reported and skipped.
 */
std::optional<property_value> decode_property(
    const protocol_stack& stack,
    const object_id& object,
    property_id property,
    const value_list& raw,
    std::optional<uint32_t> array_index
);
