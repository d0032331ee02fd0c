#include "listener.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cerrno>

namespace wrpzmq {

Listener::Listener(ListenerConfig config)
    : config_(std::move(config))
    , metrics_(config_.metrics_period) {
    if (auto ec = config_.validate()) {
        throw std::system_error(ec, "listener");
    }
}

Listener::~Listener() {
    if (auto ec = close()) {
        log_debug("listener closed with: " + ec.message());
    }
}

std::error_code Listener::listen() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (session_) {
        if (session_->active.load()) {
            return {};
        }
        // The previous loop died on its own; reap it before starting over.
        std::unique_ptr<Session> finished = std::move(session_);
        lock.unlock();
        if (auto ec = finish(std::move(finished))) {
            log_debug("previous listener session ended with: " + ec.message());
        }
        lock.lock();
        if (session_) {
            return {};
        }
    }

    std::unique_ptr<Session> session(new Session);
    session->zmq_context.reset(new zmq::context_t(1));

    int timeout_ms = config_.recv_timeout.count() > 0
        ? static_cast<int>(config_.recv_timeout.count())
        : -1;
    try {
        session->socket.reset(new zmq::socket_t(*session->zmq_context, zmq::socket_type::pull));
        session->socket->set(zmq::sockopt::rcvtimeo, timeout_ms);
        session->socket->set(zmq::sockopt::rcvhwm, config_.hwm);
        session->socket->set(zmq::sockopt::maxmsgsize, config_.max_frame_size);
        session->socket->set(zmq::sockopt::linger, 0);
        session->socket->bind(config_.url);
        endpoint_ = session->socket->get(zmq::sockopt::last_endpoint);
    } catch (const zmq::error_t& e) {
        log_warn("listen on " + config_.url + " failed: " + e.what());
        return make_zmq_error(e.num());
    }

    session->workers.reset(new boost::asio::thread_pool(config_.worker_threads));
    session->loop = std::thread(&Listener::run, this, session.get());
    session_ = std::move(session);

    log_info("listening on " + endpoint_);
    return {};
}

std::error_code Listener::close() {
    std::unique_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_) {
            return {};
        }
        session = std::move(session_);
    }
    return finish(std::move(session));
}

std::error_code Listener::finish(std::unique_ptr<Session> session) {
    session->lifecycle.cancel();
    // Unblocks a recv in progress with ETERM.
    session->zmq_context->shutdown();
    {
        std::lock_guard<std::mutex> lock(session->queue_mutex);
    }
    session->queue_cv.notify_all();

    if (session->loop.joinable()) {
        session->loop.join();
    }
    // Without stop(), join() waits for every queued dispatch.
    session->workers->join();
    metrics_.update_queue_depth(0);

    return session->terminal_error;
}

std::function<void()> Listener::add_processor(Processor processor) {
    return on_msg_.add(std::move(processor));
}

std::function<void()> Listener::add_close_listener(CloseListener listener) {
    return on_close_.add(std::move(listener));
}

bool Listener::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ && session_->active.load();
}

std::string Listener::endpoint() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoint_;
}

void Listener::run(Session* session) {
    auto err = receive(*session);
    session->socket->close();

    if (is_context_error(err)) {
        err.clear();
    }
    session->terminal_error = err;
    session->active.store(false);

    if (err) {
        log_warn("listener on " + config_.url + " stopped: " + err.message());
    } else {
        log_info("listener on " + config_.url + " stopped");
    }

    on_close_.visit([&err](const CloseListener& listener) {
        listener(err);
    });
}

std::error_code Listener::receive(Session& session) {
    auto& socket = *session.socket;
    while (true) {
        if (auto err = session.lifecycle.err()) {
            return err;
        }

        zmq::message_t frame;
        zmq::recv_result_t got;
        try {
            got = socket.recv(frame, zmq::recv_flags::none);
        } catch (const zmq::error_t& e) {
            if (e.num() == ETERM) {
                return errc::canceled;
            }
            if (e.num() == EINTR) {
                continue;
            }
            return make_zmq_error(e.num());
        }

        // Timeouts are normal; go around again.
        if (!got) {
            continue;
        }

        auto received = std::chrono::steady_clock::now();
        metrics_.record_frame_received();

        Message msg;
        if (auto ec = decode(frame.data(), frame.size(), msg)) {
            metrics_.record_frame_dropped();
            log_debug("dropping frame of " + std::to_string(frame.size()) + " bytes: " + ec.message());
            continue;
        }

        if (!enqueue(session, std::move(msg), received)) {
            return session.lifecycle.err();
        }
    }
}

bool Listener::enqueue(Session& session, Message msg, std::chrono::steady_clock::time_point received) {
    {
        std::unique_lock<std::mutex> lock(session.queue_mutex);
        session.queue_cv.wait(lock, [&] {
            return session.queued < config_.max_queue || session.lifecycle.done();
        });
        if (session.lifecycle.done()) {
            return false;
        }
        ++session.queued;
        metrics_.update_queue_depth(session.queued);
    }

    Session* s = &session;
    boost::asio::post(*session.workers, [this, s, msg = std::move(msg), received]() {
        deliver(msg);
        metrics_.record_message_dispatched();
        metrics_.record_latency(std::chrono::steady_clock::now() - received);
        {
            std::lock_guard<std::mutex> lock(s->queue_mutex);
            --s->queued;
            metrics_.update_queue_depth(s->queued);
        }
        s->queue_cv.notify_all();
    });
    return true;
}

void Listener::deliver(const Message& msg) {
    // Processors get a context of their own, unrelated to the listener's.
    Context ctx;
    on_msg_.visit([&](const Processor& processor) {
        std::error_code ec;
        try {
            ec = processor(ctx, msg);
        } catch (const std::exception& e) {
            log_error(std::string("processor threw: ") + e.what());
            return;
        }
        if (ec && ec != errc::not_handled) {
            log_debug(std::string("processor rejected ") + to_string(msg.type) + " message: " + ec.message());
        }
    });
}

} // namespace wrpzmq
