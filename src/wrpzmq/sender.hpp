#pragma once

#include "types.hpp"
#include <functional>
#include <system_error>

namespace wrpzmq {

/**
 * Outbound link to one named service, as seen by the Router.
 */
class Sender {
public:
    virtual ~Sender() = default;

    // Idempotent while connected.
    virtual std::error_code dial() = 0;

    virtual std::error_code send(const Context& ctx, const Message& msg) = 0;

    // Idempotent. Close listeners fire once per link, with an empty error when
    // the close was requested rather than caused by a failure.
    virtual std::error_code close() = 0;

    virtual std::function<void()> add_close_listener(CloseListener listener) = 0;
};

} // namespace wrpzmq
