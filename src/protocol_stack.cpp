#include "protocol_stack.hpp"

const char *error_kind_name(error_kind kind) {
    switch (kind) {
        case error_kind::error:
            return "error";
        case error_kind::reject:
            return "reject";
        case error_kind::abort:
            return "abort";
        case error_kind::timeout:
            return "timeout";
        case error_kind::malformed_response:
            return "malformed response";
    }
    return "unknown";
}

const char *submit_error_name(submit_error error) {
    switch (error) {
        case submit_error::empty_request:
            return "empty request";
        case submit_error::unknown_device:
            return "unknown device";
        case submit_error::unbound_address:
            return "no device bound to address";
        case submit_error::no_free_invoke_id:
            return "no free invoke id";
        case submit_error::encode_failed:
            return "encoding failed";
    }
    return "unknown";
}
