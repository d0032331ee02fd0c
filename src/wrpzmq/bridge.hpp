#pragma once

#include "config.hpp"
#include "context.hpp"
#include "listener.hpp"
#include "processors.hpp"
#include "router.hpp"
#include "subscribers.hpp"
#include <mutex>
#include <optional>
#include <thread>

namespace wrpzmq {

/**
 * Bridge joins one Listener and a Router of per-service Connections.
 *
 * rx (network -> bridge), run for every frame the Listener decodes:
 *   rx observers -> unsupported types -> registration -> local types -> egress
 * tx (bridge -> network), run by process():
 *   unsupported types -> local types -> tx observers -> Router
 *
 * A service registration message dials the service's URL and routes
 * messages whose destination names that service to it. While running, a
 * service-alive message is broadcast to every registered service each
 * heartbeat interval.
 */
class Bridge {
public:
    // Throws std::system_error(errc::invalid_config) if the config is invalid.
    explicit Bridge(BridgeConfig config);
    ~Bridge();

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    // Idempotent. The heartbeat runs even if the listener fails to start;
    // that error is returned.
    std::error_code start();

    // Idempotent.
    std::error_code stop();

    // Sends a message towards the network.
    std::error_code process(const Context& ctx, const Message& msg);

    // Runs the rx chain on a message as if it had been received.
    std::error_code ingest(const Context& ctx, const Message& msg);

    std::function<void()> add_egress(Processor processor);

    bool is_running() const;

    std::string endpoint() const { return listener_.endpoint(); }

    std::vector<std::string> services() const { return router_.services(); }

    Metrics::Stats get_metrics() { return listener_.get_metrics(); }

private:
    static BridgeConfig validated(BridgeConfig config);

    std::error_code handle_registration(const Context& ctx, const Message& msg);

    std::error_code egress(const Context& ctx, const Message& msg);

    void send_heartbeats(Context ctx);

    BridgeConfig config_;
    Router router_;
    Subscribers<Processor> egress_;
    Processors rx_chain_;
    Processors tx_chain_;
    Listener listener_;

    mutable std::mutex mutex_;
    std::optional<Context> heartbeat_ctx_;
    std::thread heartbeat_;
};

} // namespace wrpzmq
