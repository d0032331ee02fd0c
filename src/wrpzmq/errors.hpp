#pragma once

#include <system_error>
#include <type_traits>

namespace wrpzmq {

enum class errc {
    not_handled = 1,
    unsupported_type,
    local_disallowed,
    invalid_message,
    invalid_locator,
    connection_closed,
    send_failed,
    timeout,
    canceled,
    deadline_exceeded,
    decode_failed,
    encode_failed,
    invalid_config
};

} // namespace wrpzmq

namespace std {
template <>
struct is_error_code_enum<wrpzmq::errc> : true_type {};
} // namespace std

namespace wrpzmq {

const std::error_category& bridge_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

/**
 * Category for errno values reported by libzmq (including its own ETERM,
 * EFSM, ...). Messages come from zmq_strerror.
 */
const std::error_category& zmq_category() noexcept;

std::error_code make_zmq_error(int num) noexcept;

// Cancellation and deadline expiry, as opposed to a broken link.
inline bool is_context_error(const std::error_code& ec) noexcept {
    return ec == errc::canceled || ec == errc::deadline_exceeded;
}

} // namespace wrpzmq
