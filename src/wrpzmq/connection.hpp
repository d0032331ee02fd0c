#pragma once

#include "config.hpp"
#include "sender.hpp"
#include "subscribers.hpp"
#include <zmq.hpp>
#include <atomic>
#include <memory>
#include <mutex>

namespace wrpzmq {

/**
 * Connection is a PUSH socket dialed to a single service.
 *
 * - dial() connects with a send queue of one frame, so a dead peer surfaces
 *   as a send error instead of silently buffering.
 * - send() hands the encoded frame to a detached thread that owns the socket
 *   lock for the duration of the transfer. The caller stops waiting as soon
 *   as its context is done, but the transfer still completes and still
 *   decides whether the connection survives.
 * - A transport error closes the connection for good and reports
 *   errc::send_failed to the close listeners. A send timeout does not.
 * - close() interrupts a transfer in progress by shutting down the
 *   connection's own ZeroMQ context. With a shared context
 *   (ConnectionConfig::context) it waits for the transfer instead, at most
 *   send_timeout.
 *
 * Always owned through std::shared_ptr; use create().
 */
class Connection : public Sender, public std::enable_shared_from_this<Connection> {
public:
    // Throws std::system_error(errc::invalid_config) if the config is invalid.
    static std::shared_ptr<Connection> create(ConnectionConfig config);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    std::error_code dial() override;

    std::error_code send(const Context& ctx, const Message& msg) override;

    std::error_code close() override;

    std::function<void()> add_close_listener(CloseListener listener) override;

    bool is_connected() const { return connected_.load(); }

    const std::string& url() const { return config_.url; }

private:
    explicit Connection(ConnectionConfig config);

    std::error_code transmit(const std::string& frame, const Context& ctx);

    void notify_closed(const std::error_code& reason);

    ConnectionConfig config_;
    Subscribers<CloseListener> on_close_;

    std::shared_ptr<zmq::context_t> context_;
    bool owns_context_;

    std::mutex mutex_;
    std::unique_ptr<zmq::socket_t> socket_;
    bool closed_ = false;
    std::atomic<bool> connected_{false};
    std::atomic<bool> closing_{false};
};

} // namespace wrpzmq
