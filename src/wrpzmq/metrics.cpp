#include "metrics.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdio>
#include <sstream>
#include <iomanip>

namespace wrpzmq {

namespace {

using Clock = std::chrono::steady_clock;

// Linear interpolation between the two closest ranks.
double interpolate(const std::vector<double>& sorted, double fraction) {
    double pos = fraction * static_cast<double>(sorted.size() - 1);
    auto below = static_cast<size_t>(pos);
    if (below + 1 >= sorted.size()) {
        return sorted.back();
    }
    double t = pos - static_cast<double>(below);
    return sorted[below] + (sorted[below + 1] - sorted[below]) * t;
}

} // namespace

Metrics::Metrics(std::chrono::milliseconds window_size)
    : window_size_(window_size)
    , window_start_(Clock::now())
    , last_rate_calc_(Clock::now()) {
}

void Metrics::record_latency(std::chrono::nanoseconds latency) {
    std::lock_guard<std::mutex> lock(samples_mutex_);
    latency_samples_.push_back(static_cast<double>(latency.count()));
    trim_samples_locked(Clock::now());
}

void Metrics::record_frame_received() {
    ++frames_received_;
}

void Metrics::record_frame_dropped() {
    ++frames_dropped_;
}

void Metrics::record_message_dispatched() {
    ++messages_dispatched_;
}

void Metrics::update_queue_depth(size_t depth) {
    queue_depth_.store(depth);
}

Metrics::Stats Metrics::get_stats() {
    Stats stats;
    stats.frames_received = frames_received_.load();
    stats.frames_dropped = frames_dropped_.load();
    stats.messages_dispatched = messages_dispatched_.load();
    stats.queue_depth = queue_depth_.load();
    stats.messages_per_second = take_rate(stats.messages_dispatched, Clock::now());
    fill_percentiles(stats);
    return stats;
}

void Metrics::reset() {
    auto now = Clock::now();
    {
        std::lock_guard<std::mutex> lock(samples_mutex_);
        latency_samples_.clear();
        window_start_ = now;
    }
    {
        std::lock_guard<std::mutex> lock(rate_mutex_);
        last_rate_calc_ = now;
        last_message_count_ = 0;
    }
    frames_received_ = 0;
    frames_dropped_ = 0;
    messages_dispatched_ = 0;
    queue_depth_ = 0;
}

void Metrics::trim_samples_locked(Clock::time_point now) {
    if (now - window_start_ < window_size_) {
        return;
    }
    window_start_ = now;
    if (latency_samples_.size() > kMaxSamples) {
        auto excess = static_cast<std::ptrdiff_t>(latency_samples_.size() - kMaxSamples);
        latency_samples_.erase(latency_samples_.begin(), latency_samples_.begin() + excess);
    }
}

void Metrics::fill_percentiles(Stats& stats) {
    std::vector<double> sorted;
    {
        std::lock_guard<std::mutex> lock(samples_mutex_);
        sorted = latency_samples_;
    }
    if (sorted.empty()) {
        return;
    }
    std::sort(sorted.begin(), sorted.end());
    stats.p50 = interpolate(sorted, 0.50);
    stats.p90 = interpolate(sorted, 0.90);
    stats.p99 = interpolate(sorted, 0.99);
}

// Dispatch rate since the previous call.
double Metrics::take_rate(uint64_t dispatched, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(rate_mutex_);
    std::chrono::duration<double> elapsed = now - last_rate_calc_;
    if (elapsed.count() <= 0.0) {
        return 0.0;
    }
    double rate = static_cast<double>(dispatched - last_message_count_) / elapsed.count();
    last_message_count_ = dispatched;
    last_rate_calc_ = now;
    return rate;
}

namespace metrics_utils {

std::string format_stats(const Metrics::Stats& stats) {
    auto as_ns = [](double v) { return std::chrono::nanoseconds(static_cast<int64_t>(v)); };

    std::ostringstream oss;
    oss << "latency p50/p90/p99=" << format_duration(as_ns(stats.p50))
        << "/" << format_duration(as_ns(stats.p90))
        << "/" << format_duration(as_ns(stats.p99))
        << " rate=" << std::fixed << std::setprecision(1) << stats.messages_per_second << "/s"
        << " received=" << stats.frames_received
        << " dispatched=" << stats.messages_dispatched
        << " dropped=" << stats.frames_dropped
        << " queued=" << stats.queue_depth;
    return oss.str();
}

std::string format_duration(std::chrono::nanoseconds duration) {
    struct Unit {
        int64_t scale;
        const char* suffix;
    };
    static const std::array<Unit, 4> units = {{
        {1000000000, "s"}, {1000000, "ms"}, {1000, "us"}, {1, "ns"}
    }};

    auto ns = duration.count();
    for (const auto& unit : units) {
        if (ns >= unit.scale || unit.scale == 1) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.2f%s",
                          static_cast<double>(ns) / static_cast<double>(unit.scale), unit.suffix);
            return buf;
        }
    }
    return std::to_string(ns) + "ns";
}

} // namespace metrics_utils
} // namespace wrpzmq
