#pragma once

#include "subscribers.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <system_error>

namespace wrpzmq {

/**
 * Cancellation scope handed to processors and sends.
 *
 * A default constructed Context is never done. Copies share state, so
 * cancelling any copy cancels all of them. A deadline makes the context done
 * once it passes; on_cancel() callbacks fire only on an explicit cancel(),
 * waiters that care about the deadline must wait until deadline().
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;

    Context() = default;

    static Context with_cancel();

    static Context with_timeout(Clock::duration timeout);

    void cancel() const;

    bool done() const;

    // errc::canceled, errc::deadline_exceeded or empty.
    std::error_code err() const;

    std::optional<Clock::time_point> deadline() const;

    // Blocks for at most `duration`. Returns true if the context is done.
    bool wait_for(Clock::duration duration) const;

    // Calls f once when the context is cancelled (immediately if it already
    // is). Returns a function that unregisters f.
    std::function<void()> on_cancel(std::function<void()> f) const;

private:
    struct State;

    std::shared_ptr<State> state_;
};

} // namespace wrpzmq
