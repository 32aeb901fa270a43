#pragma once

#include "bacnet_types.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <variant>
#include <vector>

enum class error_kind : uint8_t {
    error,
    reject,
    abort,
    timeout,
    malformed_response,
};

/* failure of a confirmed request as reported by the peer or the TSM */
struct request_error {
    error_kind kind;
    /* error class, only meaningful for error_kind::error */
    uint32_t error_class = 0;
    /* error code, or the reject/abort reason */
    uint32_t code = 0;
};

const char *error_kind_name(error_kind kind);

struct read_access_spec {
    object_id object;
    std::vector<property_id> properties;
};

struct property_result {
    property_id property;
    std::optional<uint32_t> array_index;
    /* empty when the peer returned a property access error */
    std::optional<value_list> value;
};

struct object_result {
    object_id object;
    std::vector<property_result> results;
};

struct read_property_ack {
    bacnet_address source;
    object_id object;
    property_id property;
    std::optional<uint32_t> array_index;
    value_list value;
};

struct read_multiple_ack {
    bacnet_address source;
    std::vector<object_result> objects;
};

struct simple_ack {
    bacnet_address source;
};

template <typename T>
using completion = std::variant<T, request_error>;

using read_property_handler = std::function<void(const completion<read_property_ack>&)>;
using read_multiple_handler = std::function<void(const completion<read_multiple_ack>&)>;
using simple_ack_handler = std::function<void(const completion<simple_ack>&)>;

enum class submit_error : uint8_t {
    empty_request,
    unknown_device,
    unbound_address,
    no_free_invoke_id,
    encode_failed,
};

const char *submit_error_name(submit_error error);

/* outcome of handing a request to the stack: the invoke id, or why nothing was sent */
struct submit_result {
    uint8_t invoke_id = 0;
    std::optional<submit_error> error;

    bool ok() const { return not error; }

    static submit_result sent(uint8_t invoke_id) { return {.invoke_id = invoke_id}; }
    static submit_result failed(submit_error error) { return {.error = error}; }
};

struct subscribe_cov_request {
    uint32_t subscriber_process_id;
    object_id monitored_object;
    bool confirmed;
    /* empty for an indefinite subscription */
    std::optional<uint32_t> lifetime;
};

struct i_am_announcement {
    object_id device;
    bacnet_address source;
};

struct cov_property_value {
    property_id property;
    std::optional<uint32_t> array_index;
    value_list value;
};

/* what is needed to answer a confirmed request after it has been handled */
struct confirmed_context {
    uint8_t invoke_id;
    bacnet_address source;
};

struct cov_notification {
    uint32_t subscriber_process_id;
    object_id initiating_device;
    object_id monitored_object;
    uint32_t time_remaining;
    std::vector<cov_property_value> values;
    /* set for ConfirmedCOVNotification */
    std::optional<confirmed_context> confirmed;
};

struct cov_disposition {
    enum class action : uint8_t {
        acknowledge,
        reject,
        abort,
    };
    action response = action::acknowledge;
    /* reject or abort reason */
    uint8_t reason = 0;
};

/**
 * The BACnet protocol collaborator: encodes requests, correlates their
 * completions and delivers inbound services as parsed structures.
 *
 * Every handler is invoked from the thread that runs the stack, one at a time.
 */
class protocol_stack {
public:
    using i_am_handler = std::function<void(const i_am_announcement&)>;
    using cov_handler = std::function<void(const cov_notification&)>;

    virtual ~protocol_stack() = default;

    virtual submit_result read_property(
        const object_id& object,
        property_id property,
        const bacnet_address& destination,
        read_property_handler handler
    ) = 0;
    virtual submit_result read_property_multiple(
        const std::vector<read_access_spec>& specs,
        const bacnet_address& destination,
        read_multiple_handler handler
    ) = 0;
    virtual submit_result write_property(
        const object_id& object,
        property_id property,
        const app_value& value,
        const bacnet_address& destination,
        simple_ack_handler handler
    ) = 0;
    virtual submit_result subscribe_cov(
        const subscribe_cov_request& request,
        const bacnet_address& destination,
        simple_ack_handler handler
    ) = 0;

    virtual void send_i_am() = 0;
    virtual void send_who_is() = 0;
    virtual void respond_cov(const confirmed_context& context, const cov_disposition& disposition) = 0;

    /* empty for proprietary or otherwise unknown properties */
    virtual std::optional<datatype> datatype_of(object_type type, property_id property) const = 0;

    virtual void set_i_am_handler(i_am_handler handler) = 0;
    virtual void set_cov_handler(cov_handler handler) = 0;
};
