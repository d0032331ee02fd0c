#pragma once

#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <functional>
#include <optional>
#include <system_error>

namespace wrpzmq {

class Context;

/**
 * WRP message types, numbered as on the wire.
 */
enum class MessageType : int64_t {
    invalid0 = 0,
    invalid1 = 1,
    authorization = 2,
    simple_request_response = 3,
    simple_event = 4,
    create = 5,
    retrieve = 6,
    update = 7,
    delete_ = 8,
    service_registration = 9,
    service_alive = 10,
    unknown = 11,
    last = 12
};

const char* to_string(MessageType type);

struct Message {
    MessageType type = MessageType::invalid0;
    std::string source;
    std::string destination;
    std::string transaction_uuid;
    std::string content_type;
    std::string accept;
    std::optional<int64_t> status;
    std::optional<int64_t> request_delivery_response;
    std::vector<std::string> headers;
    std::map<std::string, std::string> metadata;
    std::string path;
    std::string payload;
    std::string service_name;
    std::string url;
    std::vector<std::string> partner_ids;
    std::string session_id;
    int quality_of_service = 0;

    Message() = default;

    explicit Message(MessageType type)
        : type(type) {}

    const std::string& to() const { return destination; }
};

bool operator==(const Message& lhs, const Message& rhs);
bool operator!=(const Message& lhs, const Message& rhs);

// A handler returns errc::not_handled to pass the message on, anything else
// (success included) claims it.
using Processor = std::function<std::error_code(const Context&, const Message&)>;

using Observer = std::function<void(const Context&, const Message&)>;

using CloseListener = std::function<void(const std::error_code&)>;

} // namespace wrpzmq
