#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace zmq {
class context_t;
}

namespace wrpzmq {

constexpr std::chrono::milliseconds kDefaultSendTimeout{5000};
constexpr std::chrono::milliseconds kDefaultHeartbeatInterval{30000};
constexpr int64_t kDefaultMaxFrameSize = 4 * 1024 * 1024;

// ZeroMQ takes timeouts as int milliseconds; longer values are clamped.
constexpr std::chrono::milliseconds kMaxTimeout{std::numeric_limits<int>::max()};

struct ListenerConfig {
    std::string url;

    // Receive deadline per attempt. Zero blocks until the listener is closed.
    std::chrono::milliseconds recv_timeout{0};

    int worker_threads = 4;

    // Frames waiting for, or in, dispatch before the receive loop stalls.
    size_t max_queue = 10000;

    int hwm = 1000;

    // Larger frames are refused by the socket before they are read.
    int64_t max_frame_size = kDefaultMaxFrameSize;

    std::chrono::milliseconds metrics_period{1000};

    // Clamps recv_timeout into [0, kMaxTimeout], then checks the rest.
    std::error_code validate();
};

struct ConnectionConfig {
    std::string url;

    // Non-positive values fall back to kDefaultSendTimeout; values above
    // kMaxTimeout are clamped.
    std::chrono::milliseconds send_timeout = kDefaultSendTimeout;

    std::vector<CloseListener> close_listeners;

    // ZeroMQ context for the socket. Empty gives the Connection one of its own.
    std::shared_ptr<zmq::context_t> context;

    std::error_code validate();
};

struct BridgeConfig {
    std::string listen_url;
    std::chrono::milliseconds recv_timeout{0};
    std::chrono::milliseconds send_timeout = kDefaultSendTimeout;
    std::chrono::milliseconds heartbeat_interval = kDefaultHeartbeatInterval;

    int worker_threads = 4;
    size_t max_queue = 10000;
    int hwm = 1000;
    int64_t max_frame_size = kDefaultMaxFrameSize;

    // Messages received from the network, before any filtering.
    std::vector<Observer> rx_observers;

    // Messages about to be sent to the network, heartbeats included.
    std::vector<Observer> tx_observers;

    // Messages leaving the bridge towards the embedding application. Return
    // values are ignored.
    std::vector<Processor> egress;

    std::error_code validate();

    ListenerConfig listener_config() const;
};

} // namespace wrpzmq
