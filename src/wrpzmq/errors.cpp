#include "errors.hpp"
#include <zmq.h>
#include <string>

namespace wrpzmq {

namespace {

class BridgeCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "wrpzmq"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
        case errc::not_handled:       return "not handled";
        case errc::unsupported_type:  return "unsupported message type";
        case errc::local_disallowed:  return "local message types are not allowed";
        case errc::invalid_message:   return "invalid message";
        case errc::invalid_locator:   return "invalid locator";
        case errc::connection_closed: return "connection closed";
        case errc::send_failed:       return "failed to send message";
        case errc::timeout:           return "operation timed out";
        case errc::canceled:          return "context canceled";
        case errc::deadline_exceeded: return "context deadline exceeded";
        case errc::decode_failed:     return "failed to decode message";
        case errc::encode_failed:     return "failed to encode message";
        case errc::invalid_config:    return "invalid configuration";
        }
        return "unknown error " + std::to_string(ev);
    }
};

class ZmqCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "zmq"; }

    std::string message(int ev) const override {
        return zmq_strerror(ev);
    }
};

} // namespace

const std::error_category& bridge_category() noexcept {
    static const BridgeCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), bridge_category()};
}

const std::error_category& zmq_category() noexcept {
    static const ZmqCategory category;
    return category;
}

std::error_code make_zmq_error(int num) noexcept {
    return {num, zmq_category()};
}

} // namespace wrpzmq
