#pragma once

#include "protocol_stack.hpp"
#include <gmock/gmock.h>

class protocol_stack_mock : public protocol_stack
{
public:
    MOCK_METHOD(submit_result,
                read_property,
                (const object_id& object, property_id property, const bacnet_address& destination, read_property_handler handler),
                (override));
    MOCK_METHOD(submit_result,
                read_property_multiple,
                (const std::vector<read_access_spec>& specs, const bacnet_address& destination, read_multiple_handler handler),
                (override));
    MOCK_METHOD(submit_result,
                write_property,
                (const object_id& object,
                 property_id property,
                 const app_value& value,
                 const bacnet_address& destination,
                 simple_ack_handler handler),
                (override));
    MOCK_METHOD(submit_result,
                subscribe_cov,
                (const subscribe_cov_request& request, const bacnet_address& destination, simple_ack_handler handler),
                (override));
    MOCK_METHOD(void, send_i_am, (), (override));
    MOCK_METHOD(void, send_who_is, (), (override));
    MOCK_METHOD(void, respond_cov, (const confirmed_context& context, const cov_disposition& disposition), (override));
    MOCK_METHOD(std::optional<datatype>, datatype_of, (object_type type, property_id property), (const, override));
    MOCK_METHOD(void, set_i_am_handler, (i_am_handler handler), (override));
    MOCK_METHOD(void, set_cov_handler, (cov_handler handler), (override));
};

inline bacnet_address bip_address(uint8_t last_octet)
{
    return {.mac = {192, 168, 1, last_octet, 0xBA, 0xC0}};
}
