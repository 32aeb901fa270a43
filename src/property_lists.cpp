#include "property_lists.hpp"
#include <algorithm>

bool property_lists::is_subscribable(object_type type) const {
    return std::find(subscribable_types.begin(), subscribable_types.end(), type) != subscribable_types.end();
}

property_lists property_lists::defaults() {
    // property 'all' is not supported by every device, the lists are spelled out
    return {
        .device_properties = {
            property_id::object_identifier,
            property_id::object_type,
            property_id::object_name,
            property_id::system_status,
            property_id::vendor_name,
            property_id::vendor_identifier,
            property_id::description,
            property_id::model_name,
            property_id::firmware_revision,
            property_id::application_software_version,
            property_id::protocol_version,
            property_id::protocol_revision,
            property_id::protocol_services_supported,
            property_id::protocol_object_types_supported,
            property_id::segmentation_supported,
            property_id::apdu_timeout,
            property_id::number_of_apdu_retries,
            property_id::database_revision,
            property_id::max_apdu_length_accepted,
            property_id::max_segments_accepted,
            property_id::object_list,
            property_id::serial_number,
        },
        .basic_device_properties = {
            property_id::object_identifier,
            property_id::object_type,
            property_id::object_name,
            property_id::system_status,
            property_id::vendor_name,
            property_id::vendor_identifier,
            property_id::object_list,
            property_id::description,
            property_id::model_name,
        },
        .reduced_object_properties = {
            property_id::object_identifier,
            property_id::object_name,
            property_id::description,
            property_id::present_value,
            property_id::status_flags,
            property_id::out_of_service,
            property_id::units,
            property_id::reliability,
        },
        .once_object_properties = {
            property_id::object_identifier,
            property_id::object_type,
            property_id::object_name,
            property_id::description,
            property_id::present_value,
            property_id::status_flags,
            property_id::out_of_service,
            property_id::units,
            property_id::event_state,
            property_id::reliability,
            property_id::cov_increment,
            property_id::state_text,
            property_id::number_of_states,
            property_id::notification_class,
            property_id::min_pres_value,
            property_id::max_pres_value,
            property_id::active_text,
            property_id::inactive_text,
            property_id::polarity,
            property_id::relinquish_default,
            property_id::resolution,
        },
        .periodic_object_properties = {
            property_id::present_value,
            property_id::status_flags,
            property_id::out_of_service,
            property_id::event_state,
            property_id::reliability,
            property_id::cov_increment,
        },
        .subscribable_types = {
            object_type::accumulator,
            object_type::analog_value,
            object_type::analog_input,
            object_type::analog_output,
            object_type::binary_value,
            object_type::binary_input,
            object_type::binary_output,
            object_type::multi_state_value,
            object_type::multi_state_input,
            object_type::multi_state_output,
            object_type::integer_value,
            object_type::pulse_converter,
            object_type::large_analog_value,
            object_type::positive_integer_value,
            object_type::lighting_output,
        },
    };
}
