#include "bacnet_stack.hpp"
#include "debug.hpp"
#include <bacnet/abort.h>
#include <bacnet/bacdcode.h>
#include <bacnet/cov.h>
#include <bacnet/property.h>
#include <bacnet/reject.h>
#include <bacnet/rp.h>
#include <bacnet/rpm.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>

/* buffer used for receive */
static uint8_t Rx_Buf[MAX_MPDU] = { 0 };
/* buffer used for the requests this adapter encodes itself */
static uint8_t Tx_Buf[MAX_PDU] = { 0 };

/* the stack calls plain functions, this routes them to the live instance */
static bacnet_stack *Active_Stack = nullptr;

/* an encoded property value takes at least 4 octets, so any unsegmented
   COV notification fits */
static constexpr size_t Max_Cov_Values = MAX_APDU / 4;
/* storage the COV decoder links the list of values into */
static BACNET_PROPERTY_VALUE Cov_Values[Max_Cov_Values];
/* first proprietary object type and property identifier */
static constexpr unsigned Proprietary_Object_Type_Min = 128;
static constexpr unsigned Proprietary_Property_Min = 512;

static BACNET_ADDRESS to_bacnet_address(const bacnet_address& address)
{
    BACNET_ADDRESS dest = { 0 };
    dest.mac_len = static_cast<uint8_t>(std::min<size_t>(address.mac.size(), MAX_MAC_LEN));
    std::copy_n(address.mac.begin(), dest.mac_len, dest.mac);
    dest.net = address.net;
    dest.len = static_cast<uint8_t>(std::min<size_t>(address.adr.size(), MAX_MAC_LEN));
    std::copy_n(address.adr.begin(), dest.len, dest.adr);
    return dest;
}

static bacnet_address from_bacnet_address(const BACNET_ADDRESS& src)
{
    return {
        .mac = std::vector<uint8_t>(src.mac, src.mac + src.mac_len),
        .net = src.net,
        .adr = std::vector<uint8_t>(src.adr, src.adr + src.len)
    };
}

static object_id from_bacnet_object(BACNET_OBJECT_TYPE type, uint32_t instance)
{
    return {.type = static_cast<object_type>(type), .instance = instance};
}

static std::optional<uint32_t> from_array_index(BACNET_ARRAY_INDEX index)
{
    if (index == BACNET_ARRAY_ALL) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(index);
}

static app_value to_app_value(const BACNET_APPLICATION_DATA_VALUE& value)
{
    switch (value.tag) {
        case BACNET_APPLICATION_TAG_BOOLEAN:
            return app_value{static_cast<bool>(value.type.Boolean)};
        case BACNET_APPLICATION_TAG_UNSIGNED_INT:
            return app_value{static_cast<uint64_t>(value.type.Unsigned_Int)};
        case BACNET_APPLICATION_TAG_SIGNED_INT:
            return app_value{static_cast<int64_t>(value.type.Signed_Int)};
        case BACNET_APPLICATION_TAG_REAL:
            return app_value{value.type.Real};
        case BACNET_APPLICATION_TAG_DOUBLE:
            return app_value{value.type.Double};
        case BACNET_APPLICATION_TAG_OCTET_STRING:
            return app_value{octet_string(
                value.type.Octet_String.value,
                value.type.Octet_String.value + value.type.Octet_String.length
            )};
        case BACNET_APPLICATION_TAG_CHARACTER_STRING:
            return app_value{std::string(value.type.Character_String.value, value.type.Character_String.length)};
        case BACNET_APPLICATION_TAG_BIT_STRING: {
            bit_string bits;
            auto *bacnet_bits = const_cast<BACNET_BIT_STRING *>(&value.type.Bit_String);
            for (uint8_t bit = 0; bit < value.type.Bit_String.bits_used; bit++) {
                bits.bits.push_back(bitstring_bit(bacnet_bits, bit));
            }
            return app_value{bits};
        }
        case BACNET_APPLICATION_TAG_ENUMERATED:
            return app_value{enumerated_value{value.type.Enumerated}};
        case BACNET_APPLICATION_TAG_DATE:
            return app_value{date_value{
                .year = value.type.Date.year,
                .month = value.type.Date.month,
                .day = value.type.Date.day,
                .weekday = value.type.Date.wday
            }};
        case BACNET_APPLICATION_TAG_TIME:
            return app_value{time_value{
                .hour = value.type.Time.hour,
                .minute = value.type.Time.min,
                .second = value.type.Time.sec,
                .hundredths = value.type.Time.hundredths
            }};
        case BACNET_APPLICATION_TAG_OBJECT_ID:
            return app_value{from_bacnet_object(value.type.Object_Id.type, value.type.Object_Id.instance)};
        default:
            return app_value{std::monostate{}};
    }
}

/* walks the value chain the stack decodes constructed values into */
static value_list to_value_list(const BACNET_APPLICATION_DATA_VALUE *value)
{
    value_list values;
    for (; value != nullptr; value = value->next) {
        values.push_back(to_app_value(*value));
    }
    return values;
}

static bool to_bacnet_value(const app_value& value, BACNET_APPLICATION_DATA_VALUE *out)
{
    std::memset(out, 0, sizeof(*out));
    out->tag = static_cast<uint8_t>(value.tag());
    switch (value.tag()) {
        case app_tag::null:
            return true;
        case app_tag::boolean:
            out->type.Boolean = std::get<bool>(value.data);
            return true;
        case app_tag::unsigned_int:
            out->type.Unsigned_Int = std::get<uint64_t>(value.data);
            return true;
        case app_tag::signed_int: {
            auto number = std::get<int64_t>(value.data);
            if (number < INT32_MIN or number > INT32_MAX) {
                return false;
            }
            out->type.Signed_Int = static_cast<int32_t>(number);
            return true;
        }
        case app_tag::real:
            out->type.Real = std::get<float>(value.data);
            return true;
        case app_tag::double_real:
            out->type.Double = std::get<double>(value.data);
            return true;
        case app_tag::octet_string: {
            auto octets = std::get<octet_string>(value.data);
            return octetstring_init(&out->type.Octet_String, octets.data(), octets.size());
        }
        case app_tag::character_string: {
            const auto& text = std::get<std::string>(value.data);
            return characterstring_init(&out->type.Character_String, CHARACTER_UTF8, text.c_str(), text.size());
        }
        case app_tag::bit_string: {
            const auto& bits = std::get<bit_string>(value.data).bits;
            if (bits.size() > MAX_BITSTRING_BYTES * 8) {
                return false;
            }
            bitstring_init(&out->type.Bit_String);
            for (size_t bit = 0; bit < bits.size(); bit++) {
                bitstring_set_bit(&out->type.Bit_String, static_cast<uint8_t>(bit), bits[bit]);
            }
            return true;
        }
        case app_tag::enumerated:
            out->type.Enumerated = std::get<enumerated_value>(value.data).value;
            return true;
        case app_tag::date: {
            const auto& date = std::get<date_value>(value.data);
            out->type.Date.year = date.year;
            out->type.Date.month = date.month;
            out->type.Date.day = date.day;
            out->type.Date.wday = date.weekday;
            return true;
        }
        case app_tag::time: {
            const auto& time = std::get<time_value>(value.data);
            out->type.Time.hour = time.hour;
            out->type.Time.min = time.minute;
            out->type.Time.sec = time.second;
            out->type.Time.hundredths = time.hundredths;
            return true;
        }
        case app_tag::object_id: {
            const auto& object = std::get<object_id>(value.data);
            out->type.Object_Id.type = static_cast<BACNET_OBJECT_TYPE>(object.type);
            out->type.Object_Id.instance = object.instance;
            return true;
        }
    }
    return false;
}

bacnet_stack::bacnet_stack(uint32_t device_instance)
{
    Active_Stack = this;
    Device_Set_Object_Instance_Number(device_instance);
    init_service_handlers();
    address_init();
    dlenv_init();
    atexit(datalink_cleanup);
    mstimer_set(&_datalink_timer, 1000);
    mstimer_set(&_tsm_timer, 100);
}

bacnet_stack::~bacnet_stack()
{
    if (Active_Stack == this) {
        Active_Stack = nullptr;
    }
}

void bacnet_stack::init_service_handlers()
{
    Device_Init(NULL);
    /* set the handler for all the services we don't implement
       It is required to send the proper reject message... */
    apdu_set_unrecognized_service_handler_handler(handler_unrecognized_service);
    /* we must implement read property - it's required! */
    apdu_set_confirmed_handler(SERVICE_CONFIRMED_READ_PROPERTY, handler_read_property);
    apdu_set_unconfirmed_handler(SERVICE_UNCONFIRMED_I_AM, i_am_handler_cb);
    apdu_set_confirmed_handler(SERVICE_CONFIRMED_COV_NOTIFICATION, confirmed_cov_handler_cb);
    apdu_set_unconfirmed_handler(SERVICE_UNCONFIRMED_COV_NOTIFICATION, unconfirmed_cov_handler_cb);
    /* handle the data coming back from confirmed requests */
    apdu_set_confirmed_ack_handler(SERVICE_CONFIRMED_READ_PROPERTY, read_property_ack_cb);
    apdu_set_confirmed_ack_handler(SERVICE_CONFIRMED_READ_PROP_MULTIPLE, read_property_multiple_ack_cb);
    apdu_set_confirmed_simple_ack_handler(SERVICE_CONFIRMED_WRITE_PROPERTY, simple_ack_cb);
    apdu_set_confirmed_simple_ack_handler(SERVICE_CONFIRMED_SUBSCRIBE_COV, simple_ack_cb);
    /* handle any errors coming back */
    apdu_set_error_handler(SERVICE_CONFIRMED_READ_PROPERTY, error_cb);
    apdu_set_error_handler(SERVICE_CONFIRMED_READ_PROP_MULTIPLE, error_cb);
    apdu_set_error_handler(SERVICE_CONFIRMED_WRITE_PROPERTY, error_cb);
    apdu_set_error_handler(SERVICE_CONFIRMED_SUBSCRIBE_COV, error_cb);
    apdu_set_abort_handler(abort_cb);
    apdu_set_reject_handler(reject_cb);
    tsm_set_timeout_handler(timeout_cb);
}

void bacnet_stack::task()
{
    BACNET_ADDRESS src = { 0 };
    unsigned delay_milliseconds = 100;

    /* returns 0 bytes on timeout */
    uint16_t pdu_len = datalink_receive(&src, &Rx_Buf[0], MAX_MPDU, delay_milliseconds);
    /* process */
    if (pdu_len) {
        npdu_handler(&src, &Rx_Buf[0], pdu_len);
    }
    if (mstimer_expired(&_tsm_timer)) {
        tsm_timer_milliseconds(mstimer_interval(&_tsm_timer));
        mstimer_reset(&_tsm_timer);
    }
    if (mstimer_expired(&_datalink_timer)) {
        datalink_maintenance_timer(mstimer_interval(&_datalink_timer) / 1000);
        mstimer_reset(&_datalink_timer);
    }
}

std::optional<submit_error> bacnet_stack::resolve(const bacnet_address& destination, uint32_t *device_id) const
{
    BACNET_ADDRESS dest = to_bacnet_address(destination);
    if (not address_get_device_id(&dest, device_id)) {
        return submit_error::unbound_address;
    }
    if (not tsm_transaction_available()) {
        return submit_error::no_free_invoke_id;
    }
    return std::nullopt;
}

submit_result bacnet_stack::track(uint8_t invoke_id, pending_request request)
{
    if (invoke_id == 0) {
        return submit_result::failed(submit_error::encode_failed);
    }
    _pending[invoke_id] = std::move(request);
    return submit_result::sent(invoke_id);
}

std::optional<bacnet_stack::pending_request> bacnet_stack::take(uint8_t invoke_id)
{
    auto it = _pending.find(invoke_id);
    if (it == _pending.end()) {
        return std::nullopt;
    }
    auto request = std::move(it->second);
    _pending.erase(it);
    return request;
}

void bacnet_stack::fail(uint8_t invoke_id, const request_error& error)
{
    auto request = take(invoke_id);
    if (not request) {
        return;
    }
    if (request->read_handler) {
        request->read_handler(error);
    } else if (request->read_multiple_handler) {
        request->read_multiple_handler(error);
    } else if (request->ack_handler) {
        request->ack_handler(error);
    }
}

submit_result bacnet_stack::read_property(
    const object_id& object,
    property_id property,
    const bacnet_address& destination,
    read_property_handler handler
)
{
    uint32_t device_id;
    if (auto error = resolve(destination, &device_id)) {
        return submit_result::failed(*error);
    }
    auto invoke_id = Send_Read_Property_Request(
        device_id,
        static_cast<BACNET_OBJECT_TYPE>(object.type),
        object.instance,
        static_cast<BACNET_PROPERTY_ID>(property),
        BACNET_ARRAY_ALL
    );
    return track(invoke_id, {.read_handler = std::move(handler)});
}

submit_result bacnet_stack::read_property_multiple(
    const std::vector<read_access_spec>& specs,
    const bacnet_address& destination,
    read_multiple_handler handler
)
{
    if (specs.empty()) {
        return submit_result::failed(submit_error::empty_request);
    }
    uint32_t device_id;
    if (auto error = resolve(destination, &device_id)) {
        return submit_result::failed(*error);
    }

    /* the encoder takes a linked list, the vectors own its nodes */
    std::vector<BACNET_READ_ACCESS_DATA> access(specs.size());
    std::vector<std::vector<BACNET_PROPERTY_REFERENCE>> references(specs.size());
    for (size_t i = 0; i < specs.size(); i++) {
        const auto& properties = specs[i].properties;
        references[i].resize(properties.size());
        for (size_t j = 0; j < properties.size(); j++) {
            auto& reference = references[i][j];
            reference.propertyIdentifier = static_cast<BACNET_PROPERTY_ID>(properties[j]);
            reference.propertyArrayIndex = BACNET_ARRAY_ALL;
            reference.next = j + 1 < properties.size() ? &references[i][j + 1] : nullptr;
        }
        access[i].object_type = static_cast<BACNET_OBJECT_TYPE>(specs[i].object.type);
        access[i].object_instance = specs[i].object.instance;
        access[i].listOfProperties = references[i].empty() ? nullptr : &references[i][0];
        access[i].next = i + 1 < specs.size() ? &access[i + 1] : nullptr;
    }
    auto invoke_id = Send_Read_Property_Multiple_Request(&Tx_Buf[0], sizeof(Tx_Buf), device_id, &access[0]);
    return track(invoke_id, {.read_multiple_handler = std::move(handler)});
}

submit_result bacnet_stack::write_property(
    const object_id& object,
    property_id property,
    const app_value& value,
    const bacnet_address& destination,
    simple_ack_handler handler
)
{
    BACNET_APPLICATION_DATA_VALUE data_value;
    if (not to_bacnet_value(value, &data_value)) {
        return submit_result::failed(submit_error::encode_failed);
    }
    uint32_t device_id;
    if (auto error = resolve(destination, &device_id)) {
        return submit_result::failed(*error);
    }
    auto invoke_id = Send_Write_Property_Request(
        device_id,
        static_cast<BACNET_OBJECT_TYPE>(object.type),
        object.instance,
        static_cast<BACNET_PROPERTY_ID>(property),
        &data_value,
        0,
        BACNET_ARRAY_ALL
    );
    return track(invoke_id, {.ack_handler = std::move(handler)});
}

submit_result bacnet_stack::subscribe_cov(
    const subscribe_cov_request& request,
    const bacnet_address& destination,
    simple_ack_handler handler
)
{
    uint32_t device_id;
    if (auto error = resolve(destination, &device_id)) {
        return submit_result::failed(*error);
    }
    BACNET_SUBSCRIBE_COV_DATA cov_data = {
        .subscriberProcessIdentifier = request.subscriber_process_id,
        .monitoredObjectIdentifier = {
            .type = static_cast<BACNET_OBJECT_TYPE>(request.monitored_object.type),
            .instance = request.monitored_object.instance
        },
        .cancellationRequest = false,
        .issueConfirmedNotifications = request.confirmed,
        .lifetime = request.lifetime.value_or(0)
    };
    auto invoke_id = Send_COV_Subscribe(device_id, &cov_data);
    return track(invoke_id, {.ack_handler = std::move(handler)});
}

void bacnet_stack::send_i_am()
{
    Send_I_Am(&Tx_Buf[0]);
}

void bacnet_stack::send_who_is()
{
    BACNET_ADDRESS dest = {
        .mac_len = 0,
        .net = BACNET_BROADCAST_NETWORK,
        .len = 0
    };
    Send_WhoIs_To_Network(&dest, -1, -1);
}

void bacnet_stack::respond_cov(const confirmed_context& context, const cov_disposition& disposition)
{
    BACNET_ADDRESS dest = to_bacnet_address(context.source);
    BACNET_ADDRESS my_address;
    BACNET_NPDU_DATA npdu_data;
    datalink_get_my_address(&my_address);
    npdu_encode_npdu_data(&npdu_data, false, MESSAGE_PRIORITY_NORMAL);
    int pdu_len = npdu_encode_pdu(&Tx_Buf[0], &dest, &my_address, &npdu_data);

    switch (disposition.response) {
        case cov_disposition::action::acknowledge:
            pdu_len += encode_simple_ack(&Tx_Buf[pdu_len], context.invoke_id, SERVICE_CONFIRMED_COV_NOTIFICATION);
            break;
        case cov_disposition::action::reject:
            pdu_len += reject_encode_apdu(&Tx_Buf[pdu_len], context.invoke_id, disposition.reason);
            break;
        case cov_disposition::action::abort:
            pdu_len += abort_encode_apdu(&Tx_Buf[pdu_len], context.invoke_id, disposition.reason, true);
            break;
    }
    int bytes_sent = datalink_send_pdu(&dest, &npdu_data, &Tx_Buf[0], pdu_len);
    if (bytes_sent <= 0) {
        fprintf(stderr, "Failed to send COV notification response to %s\n", to_string(context.source).c_str());
    }
}

std::optional<datatype> bacnet_stack::datatype_of(object_type type, property_id property) const
{
    auto bacnet_type = static_cast<unsigned>(type);
    auto bacnet_property = static_cast<unsigned>(property);
    if (bacnet_type >= Proprietary_Object_Type_Min or bacnet_property >= Proprietary_Property_Min) {
        return std::nullopt;
    }
    datatype result;
    if (property_list_bacnet_array_member(static_cast<BACNET_OBJECT_TYPE>(type), static_cast<BACNET_PROPERTY_ID>(property))) {
        result.shape = value_shape::array;
    } else if (property_list_bacnet_list_member(static_cast<BACNET_OBJECT_TYPE>(type), static_cast<BACNET_PROPERTY_ID>(property))) {
        result.shape = value_shape::list;
    } else {
        result.shape = value_shape::scalar;
    }
    int tag = bacapp_known_property_tag(static_cast<BACNET_OBJECT_TYPE>(type), static_cast<BACNET_PROPERTY_ID>(property));
    if (tag >= BACNET_APPLICATION_TAG_NULL and tag <= BACNET_APPLICATION_TAG_OBJECT_ID) {
        result.element = static_cast<app_tag>(tag);
    }
    return result;
}

void bacnet_stack::i_am_handler_cb(uint8_t *service_request, uint16_t service_len, BACNET_ADDRESS *src)
{
    handler_i_am_add(service_request, service_len, src);
    uint32_t device_id;
    bool found = address_get_device_id(src, &device_id);
    if (not found or not Active_Stack or not Active_Stack->_i_am_handler) {
        return;
    }
    Active_Stack->_i_am_handler({.device = device_object(device_id), .source = from_bacnet_address(*src)});
}

/* decodes a (Un)confirmedCOVNotification, empty if it does not parse */
static std::optional<cov_notification> decode_cov_notification(uint8_t *service_request, uint16_t service_len)
{
    BACNET_COV_DATA cov_data = { 0 };
    for (auto& property_value: Cov_Values) {
        property_value = {};
        property_value.propertyIdentifier = MAX_BACNET_PROPERTY_ID;
    }
    cov_data_value_list_link(&cov_data, &Cov_Values[0], Max_Cov_Values);
    int len = cov_notify_decode_service_request(service_request, service_len, &cov_data);
    if (len <= 0) {
        return std::nullopt;
    }
    cov_notification notification = {
        .subscriber_process_id = cov_data.subscriberProcessIdentifier,
        .initiating_device = device_object(cov_data.initiatingDeviceIdentifier),
        .monitored_object = from_bacnet_object(
            cov_data.monitoredObjectIdentifier.type,
            cov_data.monitoredObjectIdentifier.instance
        ),
        .time_remaining = cov_data.timeRemaining
    };
    for (auto *property_value = cov_data.listOfValues; property_value != nullptr; property_value = property_value->next) {
        /* unused entries of the linked storage are left with an invalid identifier */
        if (property_value->propertyIdentifier == MAX_BACNET_PROPERTY_ID) {
            break;
        }
        notification.values.push_back({
            .property = static_cast<property_id>(property_value->propertyIdentifier),
            .array_index = from_array_index(property_value->propertyArrayIndex),
            .value = to_value_list(&property_value->value)
        });
    }
    return notification;
}

void bacnet_stack::deliver_notification(cov_notification notification)
{
    if (_cov_handler) {
        _cov_handler(notification);
    } else if (notification.confirmed) {
        respond_cov(*notification.confirmed, {});
    }
}

void bacnet_stack::confirmed_cov_handler_cb(
    uint8_t *service_request,
    uint16_t service_len,
    BACNET_ADDRESS *src,
    BACNET_CONFIRMED_SERVICE_DATA *service_data
)
{
    if (not Active_Stack) {
        return;
    }
    confirmed_context context = {.invoke_id = service_data->invoke_id, .source = from_bacnet_address(*src)};
    if (service_data->segmented_message) {
        Active_Stack->respond_cov(context, {
            .response = cov_disposition::action::abort,
            .reason = ABORT_REASON_SEGMENTATION_NOT_SUPPORTED
        });
        return;
    }
    auto notification = decode_cov_notification(service_request, service_len);
    if (not notification) {
        fprintf(stderr, "COV notification decode failed!\n");
        Active_Stack->respond_cov(context, {
            .response = cov_disposition::action::reject,
            .reason = REJECT_REASON_MISSING_REQUIRED_PARAMETER
        });
        return;
    }
    notification->confirmed = context;
    Active_Stack->deliver_notification(std::move(*notification));
}

void bacnet_stack::unconfirmed_cov_handler_cb(uint8_t *service_request, uint16_t service_len, BACNET_ADDRESS *src)
{
    (void)src;
    if (not Active_Stack) {
        return;
    }
    auto notification = decode_cov_notification(service_request, service_len);
    if (not notification) {
        fprintf(stderr, "COV notification decode failed!\n");
        return;
    }
    Active_Stack->deliver_notification(std::move(*notification));
}

void bacnet_stack::read_property_ack_cb(
    uint8_t *service_request,
    uint16_t service_len,
    BACNET_ADDRESS *src,
    BACNET_CONFIRMED_SERVICE_ACK_DATA *service_data
)
{
    if (not Active_Stack) {
        return;
    }
    auto request = Active_Stack->take(service_data->invoke_id);
    if (not request or not request->read_handler) {
        return;
    }

    BACNET_READ_PROPERTY_DATA data;
    int len = rp_ack_decode_service_request(service_request, service_len, &data);
    if (len < 0) {
        fprintf(stderr, "Read property response decode failed!\n");
        request->read_handler(request_error{.kind = error_kind::malformed_response});
        return;
    }

    read_property_ack ack = {
        .source = from_bacnet_address(*src),
        .object = from_bacnet_object(data.object_type, data.object_instance),
        .property = static_cast<property_id>(data.object_property),
        .array_index = from_array_index(data.array_index)
    };
    uint8_t *application_data = data.application_data;
    int application_data_len = data.application_data_len;
    while (application_data_len > 0) {
        BACNET_APPLICATION_DATA_VALUE value;
        len = bacapp_decode_known_property(
            application_data,
            application_data_len,
            &value,
            data.object_type,
            data.object_property
        );
        if (len <= 0) {
            fprintf(stderr, "RP Ack: unable to decode! %s:%s\n",
                bactext_object_type_name(data.object_type),
                bactext_property_name(data.object_property)
            );
            request->read_handler(request_error{.kind = error_kind::malformed_response});
            return;
        }
        ack.value.push_back(to_app_value(value));
        application_data += len;
        application_data_len -= len;
    }
    request->read_handler(ack);
}

void bacnet_stack::read_property_multiple_ack_cb(
    uint8_t *service_request,
    uint16_t service_len,
    BACNET_ADDRESS *src,
    BACNET_CONFIRMED_SERVICE_ACK_DATA *service_data
)
{
    if (not Active_Stack) {
        return;
    }
    auto request = Active_Stack->take(service_data->invoke_id);
    if (not request or not request->read_multiple_handler) {
        return;
    }

    auto *rpm_data = static_cast<BACNET_READ_ACCESS_DATA *>(calloc(1, sizeof(BACNET_READ_ACCESS_DATA)));
    if (not rpm_data) {
        request->read_multiple_handler(request_error{.kind = error_kind::malformed_response});
        return;
    }
    int len = rpm_ack_decode_service_request(service_request, service_len, rpm_data);
    if (len <= 0) {
        fprintf(stderr, "Read property multiple response decode failed!\n");
        while (rpm_data) {
            rpm_data = rpm_data_free(rpm_data);
        }
        request->read_multiple_handler(request_error{.kind = error_kind::malformed_response});
        return;
    }

    read_multiple_ack ack = {.source = from_bacnet_address(*src)};
    for (auto *object = rpm_data; object != nullptr; object = object->next) {
        object_result result = {.object = from_bacnet_object(object->object_type, object->object_instance)};
        for (auto *property = object->listOfProperties; property != nullptr; property = property->next) {
            property_result entry = {
                .property = static_cast<property_id>(property->propertyIdentifier),
                .array_index = from_array_index(property->propertyArrayIndex)
            };
            /* a property access error leaves the value empty */
            if (property->value) {
                entry.value = to_value_list(property->value);
            }
            result.results.push_back(std::move(entry));
        }
        ack.objects.push_back(std::move(result));
    }
    while (rpm_data) {
        rpm_data = rpm_data_free(rpm_data);
    }
    request->read_multiple_handler(ack);
}

void bacnet_stack::simple_ack_cb(BACNET_ADDRESS *src, uint8_t invoke_id)
{
    if (not Active_Stack) {
        return;
    }
    auto request = Active_Stack->take(invoke_id);
    if (request and request->ack_handler) {
        request->ack_handler(simple_ack{.source = from_bacnet_address(*src)});
    }
}

void bacnet_stack::error_cb(
    BACNET_ADDRESS *src,
    uint8_t invoke_id,
    BACNET_ERROR_CLASS error_class,
    BACNET_ERROR_CODE error_code
)
{
    (void)src;
    if (bacnet_debug_enabled) {
        fprintf(
            stderr,
            "BACnet Error (invoke id %d): %s: %s\n",
            invoke_id,
            bactext_error_class_name(static_cast<int>(error_class)),
            bactext_error_code_name(static_cast<int>(error_code))
        );
    }
    if (Active_Stack) {
        Active_Stack->fail(invoke_id, {
            .kind = error_kind::error,
            .error_class = static_cast<uint32_t>(error_class),
            .code = static_cast<uint32_t>(error_code)
        });
    }
}

void bacnet_stack::abort_cb(BACNET_ADDRESS *src, uint8_t invoke_id, uint8_t abort_reason, bool server)
{
    (void)src;
    (void)server;
    fprintf(stderr, "BACnet Abort (invoke id %d): %s\n", invoke_id, bactext_abort_reason_name(abort_reason));
    if (Active_Stack) {
        Active_Stack->fail(invoke_id, {.kind = error_kind::abort, .code = abort_reason});
    }
}

void bacnet_stack::reject_cb(BACNET_ADDRESS *src, uint8_t invoke_id, uint8_t reject_reason)
{
    (void)src;
    fprintf(stderr, "BACnet Reject (invoke id %d): %s\n", invoke_id, bactext_reject_reason_name(reject_reason));
    if (Active_Stack) {
        Active_Stack->fail(invoke_id, {.kind = error_kind::reject, .code = reject_reason});
    }
}

void bacnet_stack::timeout_cb(uint8_t invoke_id)
{
    fprintf(stderr, "BACnet Timeout: %d\n", invoke_id);
    /* the TSM leaves a timed out transaction idle but still holding its invoke id */
    tsm_free_invoke_id(invoke_id);
    if (Active_Stack) {
        Active_Stack->fail(invoke_id, {.kind = error_kind::timeout});
    }
}
