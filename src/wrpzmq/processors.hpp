#pragma once

#include "types.hpp"
#include <initializer_list>
#include <vector>

namespace wrpzmq {

/**
 * Processors is an ordered, first-match-wins chain of handlers.
 *
 * Each handler is called in turn until one returns something other than
 * errc::not_handled; that value (success included) is the result of the
 * chain. Empty handlers are skipped. If the context is done before a handler
 * runs, the context error is returned and no further handlers are called.
 * If nothing claims the message the chain returns errc::not_handled.
 */
class Processors {
public:
    Processors() = default;

    Processors(std::initializer_list<Processor> handlers);

    explicit Processors(std::vector<Processor> handlers);

    std::error_code process(const Context& ctx, const Message& msg) const;

    size_t size() const { return handlers_.size(); }

private:
    std::vector<Processor> handlers_;
};

// Calls every observer in order, then lets the message continue.
Processor observers_as_processor(std::vector<Observer> observers);

} // namespace wrpzmq
