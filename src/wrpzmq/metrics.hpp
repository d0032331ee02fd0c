#pragma once

#include <vector>
#include <chrono>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace wrpzmq {

/**
 * Thread-safe counters and dispatch latency samples for one Listener.
 */
class Metrics {
public:
    struct Stats {
        double p50 = 0.0;
        double p90 = 0.0;
        double p99 = 0.0;
        uint64_t frames_received = 0;
        uint64_t frames_dropped = 0;
        uint64_t messages_dispatched = 0;
        double messages_per_second = 0.0;
        size_t queue_depth = 0;
    };

    explicit Metrics(std::chrono::milliseconds window_size = std::chrono::milliseconds(1000));

    // Time from a frame leaving the socket to its processors returning.
    void record_latency(std::chrono::nanoseconds latency);

    void record_frame_received();

    // Frames that could not be decoded.
    void record_frame_dropped();

    void record_message_dispatched();

    void update_queue_depth(size_t depth);

    Stats get_stats();

    void reset();

private:
    void trim_samples_locked(std::chrono::steady_clock::time_point now);

    // Fills p50/p90/p99 from the current sample window.
    void fill_percentiles(Stats& stats);

    double take_rate(uint64_t dispatched, std::chrono::steady_clock::time_point now);

    static constexpr size_t kMaxSamples = 1000;

    std::chrono::milliseconds window_size_;
    std::chrono::steady_clock::time_point window_start_;

    std::vector<double> latency_samples_;
    std::mutex samples_mutex_;

    std::atomic<uint64_t> frames_received_{0};
    std::atomic<uint64_t> frames_dropped_{0};
    std::atomic<uint64_t> messages_dispatched_{0};
    std::atomic<size_t> queue_depth_{0};

    std::mutex rate_mutex_;
    std::chrono::steady_clock::time_point last_rate_calc_;
    uint64_t last_message_count_{0};
};

namespace metrics_utils {

std::string format_stats(const Metrics::Stats& stats);

// Largest unit that keeps the value at or above one, two decimals: "1.25ms".
std::string format_duration(std::chrono::nanoseconds duration);

} // namespace metrics_utils

} // namespace wrpzmq
