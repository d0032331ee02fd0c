#include "processors.hpp"
#include "context.hpp"
#include "errors.hpp"

namespace wrpzmq {

Processors::Processors(std::initializer_list<Processor> handlers)
    : handlers_(handlers) {
}

Processors::Processors(std::vector<Processor> handlers)
    : handlers_(std::move(handlers)) {
}

std::error_code Processors::process(const Context& ctx, const Message& msg) const {
    for (const auto& handler : handlers_) {
        if (auto err = ctx.err()) {
            return err;
        }
        if (!handler) {
            continue;
        }
        auto ec = handler(ctx, msg);
        if (ec == errc::not_handled) {
            continue;
        }
        return ec;
    }
    return errc::not_handled;
}

Processor observers_as_processor(std::vector<Observer> observers) {
    return [observers = std::move(observers)](const Context& ctx, const Message& msg) {
        for (const auto& observer : observers) {
            if (observer) {
                observer(ctx, msg);
            }
        }
        return std::error_code(errc::not_handled);
    };
}

} // namespace wrpzmq
