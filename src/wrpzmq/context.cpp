#include "context.hpp"
#include "errors.hpp"
#include <condition_variable>
#include <mutex>
#include <thread>

namespace wrpzmq {

struct Context::State {
    std::mutex mutex;
    std::condition_variable cv;
    bool canceled = false;
    std::optional<Clock::time_point> deadline;
    Subscribers<std::function<void()>> listeners;

    bool done_locked() const {
        return canceled || (deadline && Clock::now() >= *deadline);
    }
};

Context Context::with_cancel() {
    Context ctx;
    ctx.state_ = std::make_shared<State>();
    return ctx;
}

Context Context::with_timeout(Clock::duration timeout) {
    Context ctx = with_cancel();
    ctx.state_->deadline = Clock::now() + timeout;
    return ctx;
}

void Context::cancel() const {
    if (!state_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->canceled) {
            return;
        }
        state_->canceled = true;
    }
    state_->cv.notify_all();
    state_->listeners.visit([](const std::function<void()>& f) { f(); });
}

bool Context::done() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->done_locked();
}

std::error_code Context::err() const {
    if (!state_) {
        return {};
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->canceled) {
        return errc::canceled;
    }
    if (state_->deadline && Clock::now() >= *state_->deadline) {
        return errc::deadline_exceeded;
    }
    return {};
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    if (!state_) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->deadline;
}

bool Context::wait_for(Clock::duration duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    auto until = Clock::now() + duration;
    if (state_->deadline && *state_->deadline < until) {
        until = *state_->deadline;
    }
    state_->cv.wait_until(lock, until, [this] { return state_->canceled; });
    return state_->done_locked();
}

std::function<void()> Context::on_cancel(std::function<void()> f) const {
    if (!state_ || !f) {
        return [] {};
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->canceled) {
        lock.unlock();
        f();
        return [] {};
    }
    return state_->listeners.add(std::move(f));
}

} // namespace wrpzmq
