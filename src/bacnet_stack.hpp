#pragma once

#include <bacnet/bactext.h>
#include <bacnet/iam.h>
#include <bacnet/basic/binding/address.h>
#include <bacnet/config.h>
#include <bacnet/bacdef.h>
#include <bacnet/bacapp.h>
#include <bacnet/npdu.h>
#include <bacnet/apdu.h>
#include <bacnet/basic/object/device.h>
#include <bacnet/datalink/datalink.h>
#include <bacnet/version.h>
#include <bacnet/basic/sys/mstimer.h>
#include <bacnet/basic/services.h>
#include <bacnet/basic/tsm/tsm.h>
#include <bacnet/datalink/dlenv.h>
#include "protocol_stack.hpp"
#include <cstdint>
#include <optional>
#include <unordered_map>

/**
 * protocol_stack on top of the bacnet-stack library, BACnet/IP datalink.
 *
 * bacnet-stack keeps its state in globals and calls plain function handlers,
 * so only one instance may exist at a time. Confirmed requests are correlated
 * with their completion by invoke id.
 */
class bacnet_stack : public protocol_stack {
public:
    explicit bacnet_stack(uint32_t device_instance);
    ~bacnet_stack() override;

    bacnet_stack(const bacnet_stack&) = delete;
    bacnet_stack& operator=(const bacnet_stack&) = delete;

    /* receives and handles at most one PDU and runs the stack timers */
    void task();

    submit_result read_property(
        const object_id& object,
        property_id property,
        const bacnet_address& destination,
        read_property_handler handler
    ) override;
    submit_result read_property_multiple(
        const std::vector<read_access_spec>& specs,
        const bacnet_address& destination,
        read_multiple_handler handler
    ) override;
    submit_result write_property(
        const object_id& object,
        property_id property,
        const app_value& value,
        const bacnet_address& destination,
        simple_ack_handler handler
    ) override;
    submit_result subscribe_cov(
        const subscribe_cov_request& request,
        const bacnet_address& destination,
        simple_ack_handler handler
    ) override;

    void send_i_am() override;
    void send_who_is() override;
    void respond_cov(const confirmed_context& context, const cov_disposition& disposition) override;

    std::optional<datatype> datatype_of(object_type type, property_id property) const override;

    void set_i_am_handler(i_am_handler handler) override { _i_am_handler = std::move(handler); }
    void set_cov_handler(cov_handler handler) override { _cov_handler = std::move(handler); }

private:
    struct pending_request {
        read_property_handler read_handler;
        read_multiple_handler read_multiple_handler;
        simple_ack_handler ack_handler;
    };

    std::optional<submit_error> resolve(const bacnet_address& destination, uint32_t *device_id) const;
    submit_result track(uint8_t invoke_id, pending_request request);
    std::optional<pending_request> take(uint8_t invoke_id);
    void fail(uint8_t invoke_id, const request_error& error);
    void deliver_notification(cov_notification notification);

    static void init_service_handlers();
    static void i_am_handler_cb(uint8_t *service_request, uint16_t service_len, BACNET_ADDRESS *src);
    static void confirmed_cov_handler_cb(
        uint8_t *service_request,
        uint16_t service_len,
        BACNET_ADDRESS *src,
        BACNET_CONFIRMED_SERVICE_DATA *service_data
    );
    static void unconfirmed_cov_handler_cb(uint8_t *service_request, uint16_t service_len, BACNET_ADDRESS *src);
    static void read_property_ack_cb(
        uint8_t *service_request,
        uint16_t service_len,
        BACNET_ADDRESS *src,
        BACNET_CONFIRMED_SERVICE_ACK_DATA *service_data
    );
    static void read_property_multiple_ack_cb(
        uint8_t *service_request,
        uint16_t service_len,
        BACNET_ADDRESS *src,
        BACNET_CONFIRMED_SERVICE_ACK_DATA *service_data
    );
    static void simple_ack_cb(BACNET_ADDRESS *src, uint8_t invoke_id);
    static void error_cb(
        BACNET_ADDRESS *src,
        uint8_t invoke_id,
        BACNET_ERROR_CLASS error_class,
        BACNET_ERROR_CODE error_code
    );
    static void abort_cb(BACNET_ADDRESS *src, uint8_t invoke_id, uint8_t abort_reason, bool server);
    static void reject_cb(BACNET_ADDRESS *src, uint8_t invoke_id, uint8_t reject_reason);
    static void timeout_cb(uint8_t invoke_id);

    std::unordered_map<uint8_t, pending_request> _pending;
    i_am_handler _i_am_handler;
    cov_handler _cov_handler;
    struct mstimer _datalink_timer = { 0 };
    struct mstimer _tsm_timer = { 0 };
};
