#include "bridge.hpp"
#include "errors.hpp"
#include "filters.hpp"
#include "logging.hpp"

namespace wrpzmq {

BridgeConfig Bridge::validated(BridgeConfig config) {
    if (auto ec = config.validate()) {
        throw std::system_error(ec, "bridge");
    }
    return config;
}

Bridge::Bridge(BridgeConfig config)
    : config_(validated(std::move(config)))
    , rx_chain_{
          observers_as_processor(config_.rx_observers),
          filters::error_on_unsupported_types(),
          [this](const Context& ctx, const Message& msg) { return handle_registration(ctx, msg); },
          filters::error_on_local_types(),
          [this](const Context& ctx, const Message& msg) { return egress(ctx, msg); },
      }
    , tx_chain_{
          filters::error_on_unsupported_types(),
          filters::error_on_local_types(),
          observers_as_processor(config_.tx_observers),
          [this](const Context& ctx, const Message& msg) { return router_.process(ctx, msg); },
      }
    , listener_(config_.listener_config()) {
    for (const auto& processor : config_.egress) {
        egress_.add(processor);
    }
    listener_.add_processor([this](const Context& ctx, const Message& msg) {
        return ingest(ctx, msg);
    });
}

Bridge::~Bridge() {
    if (auto ec = stop()) {
        log_warn("bridge stopped with: " + ec.message());
    }
}

std::error_code Bridge::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (heartbeat_ctx_) {
        return {};
    }

    auto ctx = Context::with_cancel();
    heartbeat_ctx_ = ctx;
    heartbeat_ = std::thread(&Bridge::send_heartbeats, this, ctx);

    return listener_.listen();
}

std::error_code Bridge::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!heartbeat_ctx_) {
        return {};
    }
    heartbeat_ctx_->cancel();
    heartbeat_ctx_.reset();

    auto listener_err = listener_.close();
    auto router_err = router_.close();

    if (heartbeat_.joinable()) {
        heartbeat_.join();
    }

    if (listener_err) {
        return listener_err;
    }
    return router_err;
}

std::error_code Bridge::process(const Context& ctx, const Message& msg) {
    return tx_chain_.process(ctx, msg);
}

std::error_code Bridge::ingest(const Context& ctx, const Message& msg) {
    return rx_chain_.process(ctx, msg);
}

std::function<void()> Bridge::add_egress(Processor processor) {
    return egress_.add(std::move(processor));
}

bool Bridge::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return heartbeat_ctx_.has_value();
}

std::error_code Bridge::handle_registration(const Context&, const Message& msg) {
    if (msg.type != MessageType::service_registration) {
        return errc::not_handled;
    }
    if (msg.service_name.empty() || msg.url.empty()) {
        log_warn("registration without service name or url ignored");
        return errc::invalid_message;
    }

    ConnectionConfig config;
    config.url = msg.url;
    config.send_timeout = config_.send_timeout;
    return router_.upsert(msg.service_name, config);
}

std::error_code Bridge::egress(const Context& ctx, const Message& msg) {
    egress_.visit([&](const Processor& processor) {
        auto ec = processor(ctx, msg);
        if (ec && ec != errc::not_handled) {
            log_debug("egress processor returned: " + ec.message());
        }
    });
    return {};
}

void Bridge::send_heartbeats(Context ctx) {
    Message msg(MessageType::service_alive);
    while (!ctx.wait_for(config_.heartbeat_interval)) {
        for (const auto& observer : config_.tx_observers) {
            if (observer) {
                observer(ctx, msg);
            }
        }
        if (auto ec = router_.process(ctx, msg)) {
            log_debug("heartbeat broadcast failed: " + ec.message());
        }
    }
}

} // namespace wrpzmq
