#include "filters.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <string>

namespace wrpzmq {
namespace filters {

bool is_supported(MessageType type) {
    auto value = static_cast<int64_t>(type);
    return value >= 0
        && value < static_cast<int64_t>(MessageType::last)
        && type != MessageType::invalid0
        && type != MessageType::invalid1;
}

bool is_local(MessageType type) {
    switch (type) {
    case MessageType::authorization:
    case MessageType::service_registration:
    case MessageType::service_alive:
        return true;
    default:
        return false;
    }
}

Processor error_on_unsupported_types() {
    return [](const Context&, const Message& msg) -> std::error_code {
        if (!is_supported(msg.type)) {
            log_debug("invalid message type: " +
                      std::to_string(static_cast<int64_t>(msg.type)));
            return errc::unsupported_type;
        }
        return errc::not_handled;
    };
}

Processor error_on_local_types() {
    return [](const Context&, const Message& msg) -> std::error_code {
        if (is_local(msg.type)) {
            return errc::local_disallowed;
        }
        return errc::not_handled;
    };
}

} // namespace filters
} // namespace wrpzmq
