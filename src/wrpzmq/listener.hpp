#pragma once

#include "config.hpp"
#include "context.hpp"
#include "metrics.hpp"
#include "subscribers.hpp"
#include <zmq.hpp>
#include <boost/asio.hpp>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace wrpzmq {

/**
 * Listener owns the inbound PULL socket.
 *
 * Architecture:
 * - Receive thread: blocks on the socket (bounded by recv_timeout), decodes
 *   frames and queues them. Undecodable frames are counted and dropped.
 * - Worker pool: Boost.Asio thread_pool that hands each message to every
 *   registered processor. At most max_queue messages wait for or sit in the
 *   pool; beyond that the receive thread stops reading.
 * - close() cancels the receive thread by shutting down the socket's ZeroMQ
 *   context, then drains the pool before returning.
 *
 * Processors and close listeners must not call close() themselves.
 */
class Listener {
public:
    // Throws std::system_error(errc::invalid_config) if the config is invalid.
    explicit Listener(ListenerConfig config);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    // Binds and starts receiving. A no-op while already running.
    std::error_code listen();

    // Returns the error that stopped the receive loop, or success if it was
    // stopped by this call. A no-op when not running.
    std::error_code close();

    // Processor results are logged and otherwise ignored.
    std::function<void()> add_processor(Processor processor);

    // Called from the receive thread when the loop ends; the error is empty
    // when the loop was cancelled.
    std::function<void()> add_close_listener(CloseListener listener);

    bool is_running() const;

    // Address actually bound, e.g. with the port chosen for "tcp://host:*".
    std::string endpoint() const;

    Metrics::Stats get_metrics() { return metrics_.get_stats(); }

private:
    struct Session {
        Context lifecycle = Context::with_cancel();
        std::unique_ptr<zmq::context_t> zmq_context;
        std::unique_ptr<zmq::socket_t> socket;
        std::unique_ptr<boost::asio::thread_pool> workers;
        std::thread loop;
        std::atomic<bool> active{true};

        std::mutex queue_mutex;
        std::condition_variable queue_cv;
        size_t queued = 0;

        // Written by the receive thread before it exits.
        std::error_code terminal_error;
    };

    void run(Session* session);

    std::error_code receive(Session& session);

    bool enqueue(Session& session, Message msg, std::chrono::steady_clock::time_point received);

    void deliver(const Message& msg);

    std::error_code finish(std::unique_ptr<Session> session);

    ListenerConfig config_;
    Subscribers<Processor> on_msg_;
    Subscribers<CloseListener> on_close_;
    Metrics metrics_;

    mutable std::mutex mutex_;
    std::unique_ptr<Session> session_;
    std::string endpoint_;
};

} // namespace wrpzmq
