#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace wrpzmq {

std::error_code ListenerConfig::validate() {
    recv_timeout = std::clamp(recv_timeout, std::chrono::milliseconds(0), kMaxTimeout);
    if (url.empty()) {
        log_error("listener: url is required");
        return errc::invalid_config;
    }
    if (worker_threads < 1 || max_queue < 1 || hwm < 0) {
        log_error("listener: worker_threads and max_queue must be positive");
        return errc::invalid_config;
    }
    if (max_frame_size < 1) {
        log_error("listener: max_frame_size must be positive");
        return errc::invalid_config;
    }
    return {};
}

std::error_code ConnectionConfig::validate() {
    if (send_timeout.count() <= 0) {
        send_timeout = kDefaultSendTimeout;
    }
    send_timeout = std::min(send_timeout, kMaxTimeout);
    if (url.empty()) {
        log_error("connection: url is required");
        return errc::invalid_config;
    }
    return {};
}

std::error_code BridgeConfig::validate() {
    recv_timeout = std::clamp(recv_timeout, std::chrono::milliseconds(0), kMaxTimeout);
    if (send_timeout.count() <= 0) {
        send_timeout = kDefaultSendTimeout;
    }
    send_timeout = std::min(send_timeout, kMaxTimeout);
    if (heartbeat_interval.count() <= 0) {
        log_error("bridge: heartbeat interval must be positive");
        return errc::invalid_config;
    }
    return listener_config().validate();
}

ListenerConfig BridgeConfig::listener_config() const {
    ListenerConfig config;
    config.url = listen_url;
    config.recv_timeout = recv_timeout;
    config.worker_threads = worker_threads;
    config.max_queue = max_queue;
    config.hwm = hwm;
    config.max_frame_size = max_frame_size;
    return config;
}

} // namespace wrpzmq
