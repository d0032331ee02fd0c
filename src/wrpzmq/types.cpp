#include "types.hpp"

namespace wrpzmq {

const char* to_string(MessageType type) {
    switch (type) {
    case MessageType::invalid0:                return "Invalid0";
    case MessageType::invalid1:                return "Invalid1";
    case MessageType::authorization:           return "Auth";
    case MessageType::simple_request_response: return "SimpleRequestResponse";
    case MessageType::simple_event:            return "SimpleEvent";
    case MessageType::create:                  return "Create";
    case MessageType::retrieve:                return "Retrieve";
    case MessageType::update:                  return "Update";
    case MessageType::delete_:                 return "Delete";
    case MessageType::service_registration:    return "ServiceRegistration";
    case MessageType::service_alive:           return "ServiceAlive";
    case MessageType::unknown:                 return "Unknown";
    case MessageType::last:                    break;
    }
    return "Invalid";
}

bool operator==(const Message& lhs, const Message& rhs) {
    return lhs.type == rhs.type
        && lhs.source == rhs.source
        && lhs.destination == rhs.destination
        && lhs.transaction_uuid == rhs.transaction_uuid
        && lhs.content_type == rhs.content_type
        && lhs.accept == rhs.accept
        && lhs.status == rhs.status
        && lhs.request_delivery_response == rhs.request_delivery_response
        && lhs.headers == rhs.headers
        && lhs.metadata == rhs.metadata
        && lhs.path == rhs.path
        && lhs.payload == rhs.payload
        && lhs.service_name == rhs.service_name
        && lhs.url == rhs.url
        && lhs.partner_ids == rhs.partner_ids
        && lhs.session_id == rhs.session_id
        && lhs.quality_of_service == rhs.quality_of_service;
}

bool operator!=(const Message& lhs, const Message& rhs) {
    return !(lhs == rhs);
}

} // namespace wrpzmq
