#include "connection.hpp"
#include "codec.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cerrno>
#include <condition_variable>
#include <optional>
#include <thread>

namespace wrpzmq {

namespace {

// Single-slot hand-off between the transfer thread and the waiting caller.
struct PendingSend {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<std::error_code> result;
    bool abandoned = false;

    void complete(std::error_code ec) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            result = ec;
        }
        cv.notify_all();
    }

    void abandon() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            abandoned = true;
        }
        cv.notify_all();
    }

    std::optional<std::error_code> wait(const std::optional<Context::Clock::time_point>& deadline) {
        std::unique_lock<std::mutex> lock(mutex);
        auto ready = [this] { return result.has_value() || abandoned; };
        if (deadline) {
            cv.wait_until(lock, *deadline, ready);
        } else {
            cv.wait(lock, ready);
        }
        return result;
    }
};

} // namespace

std::shared_ptr<Connection> Connection::create(ConnectionConfig config) {
    if (auto ec = config.validate()) {
        throw std::system_error(ec, "connection");
    }
    return std::shared_ptr<Connection>(new Connection(std::move(config)));
}

Connection::Connection(ConnectionConfig config)
    : config_(std::move(config))
    , context_(config_.context ? config_.context : std::make_shared<zmq::context_t>(1))
    , owns_context_(!config_.context) {
    for (auto& listener : config_.close_listeners) {
        on_close_.add(listener);
    }
}

std::error_code Connection::dial() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (socket_) {
        return {};
    }
    if (closed_) {
        return errc::connection_closed;
    }

    try {
        std::unique_ptr<zmq::socket_t> socket(new zmq::socket_t(*context_, zmq::socket_type::push));
        socket->set(zmq::sockopt::sndhwm, 1);
        socket->set(zmq::sockopt::sndtimeo, static_cast<int>(config_.send_timeout.count()));
        socket->set(zmq::sockopt::linger, 0);
        socket->connect(config_.url);
        socket_ = std::move(socket);
    } catch (const zmq::error_t& e) {
        log_warn("dial " + config_.url + " failed: " + e.what());
        return make_zmq_error(e.num());
    }

    connected_.store(true);
    log_debug("dialed " + config_.url);
    return {};
}

std::error_code Connection::send(const Context& ctx, const Message& msg) {
    std::string frame;
    try {
        frame = encode(msg);
    } catch (const std::exception& e) {
        log_error(std::string("encode failed: ") + e.what());
        return errc::encode_failed;
    }

    if (!connected_.load()) {
        return errc::connection_closed;
    }

    auto pending = std::make_shared<PendingSend>();
    auto self = shared_from_this();
    try {
        std::thread([self, pending, frame = std::move(frame), ctx]() {
            pending->complete(self->transmit(frame, ctx));
        }).detach();
    } catch (const std::system_error& e) {
        log_error(std::string("cannot start send: ") + e.what());
        return e.code();
    }

    auto unregister = ctx.on_cancel([pending] { pending->abandon(); });
    auto result = pending->wait(ctx.deadline());
    unregister();

    if (result) {
        return *result;
    }
    return ctx.err();
}

std::error_code Connection::transmit(const std::string& frame, const Context& ctx) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!socket_) {
        return errc::connection_closed;
    }

    zmq::send_result_t sent;
    while (true) {
        try {
            sent = socket_->send(zmq::buffer(frame), zmq::send_flags::none);
            break;
        } catch (const zmq::error_t& e) {
            if (e.num() == EINTR) {
                continue;
            }
            // Interrupted by close(), which tears down and notifies.
            if (e.num() == ETERM && closing_.load()) {
                return errc::connection_closed;
            }
            // Not recoverable; the connection is done.
            log_warn("send to " + config_.url + " failed: " + e.what());
            socket_->close();
            socket_.reset();
            closed_ = true;
            connected_.store(false);
            lock.unlock();
            notify_closed(errc::send_failed);
            return errc::send_failed;
        }
    }
    lock.unlock();

    if (!sent) {
        return errc::timeout;
    }
    // The link is fine even if the caller gave up in the meantime.
    if (auto err = ctx.err()) {
        return err;
    }
    return {};
}

std::error_code Connection::close() {
    closing_.store(true);
    if (owns_context_) {
        // A send blocked in transmit() fails with ETERM and drops the lock.
        context_->shutdown();
    }

    bool trigger = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        if (socket_) {
            socket_->close();
            socket_.reset();
            connected_.store(false);
            trigger = true;
        }
    }
    if (trigger) {
        log_debug("closed " + config_.url);
        notify_closed({});
    }
    return {};
}

std::function<void()> Connection::add_close_listener(CloseListener listener) {
    return on_close_.add(std::move(listener));
}

void Connection::notify_closed(const std::error_code& reason) {
    on_close_.visit([&reason](const CloseListener& listener) {
        listener(reason);
    });
}

} // namespace wrpzmq
