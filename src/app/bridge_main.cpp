#include "wrpzmq/bridge.hpp"
#include "wrpzmq/context.hpp"
#include "wrpzmq/logging.hpp"
#include "wrpzmq/metrics.hpp"
#include "wrpzmq/types.hpp"
#include <iostream>
#include <thread>
#include <chrono>
#include <atomic>
#include <cstdlib>
#include <signal.h>

using namespace wrpzmq;

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

std::error_code print_message(const Context&, const Message& msg) {
    std::cout << "received " << to_string(msg.type)
              << " source=" << msg.source
              << " dest=" << msg.destination
              << " payload=" << msg.payload.size() << " bytes"
              << std::endl;
    return {};
}

void metrics_thread(Bridge& bridge, std::chrono::milliseconds period) {
    while (g_running.load()) {
        std::this_thread::sleep_for(period);

        auto stats = bridge.get_metrics();
        std::cout << "METRICS: " << metrics_utils::format_stats(stats) << std::endl;
    }
}

int main(int argc, char* argv[]) {
    BridgeConfig config;
    config.listen_url = "tcp://127.0.0.1:6666";
    config.recv_timeout = std::chrono::milliseconds(10000);
    std::chrono::milliseconds metrics_period(5000);

    for (int i = 1; i < argc; i += 2) {
        if (i + 1 >= argc) break;

        std::string arg = argv[i];
        std::string value = argv[i + 1];
        if (arg == "--listen") {
            config.listen_url = value;
        } else if (arg == "--recv-timeout") {
            config.recv_timeout = std::chrono::milliseconds(std::atoi(value.c_str()));
        } else if (arg == "--send-timeout") {
            config.send_timeout = std::chrono::milliseconds(std::atoi(value.c_str()));
        } else if (arg == "--heartbeat") {
            config.heartbeat_interval = std::chrono::milliseconds(std::atoi(value.c_str()));
        } else if (arg == "--workers") {
            config.worker_threads = std::atoi(value.c_str());
        } else if (arg == "--queue") {
            config.max_queue = static_cast<size_t>(std::atol(value.c_str()));
        } else if (arg == "--max-frame") {
            config.max_frame_size = std::atoll(value.c_str());
        } else if (arg == "--metrics") {
            metrics_period = std::chrono::milliseconds(std::atoi(value.c_str()));
        } else if (arg == "--log-level") {
            LogLevel level;
            if (!parse_log_level(value, level)) {
                std::cerr << "Unknown log level: " << value << std::endl;
                return 1;
            }
            set_log_level(level);
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return 1;
        }
    }

    config.egress.push_back(print_message);

    std::cout << "Starting bridge:" << std::endl;
    std::cout << "  Listen address: " << config.listen_url << std::endl;
    std::cout << "  Receive timeout: " << config.recv_timeout.count() << " ms" << std::endl;
    std::cout << "  Send timeout: " << config.send_timeout.count() << " ms" << std::endl;
    std::cout << "  Heartbeat interval: " << config.heartbeat_interval.count() << " ms" << std::endl;
    std::cout << "  Worker threads: " << config.worker_threads << std::endl;
    std::cout << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        Bridge bridge(config);
        if (auto ec = bridge.start()) {
            std::cerr << "Error: " << ec.message() << std::endl;
            return 1;
        }

        std::cout << "Bridge listening on " << bridge.endpoint() << std::endl;
        std::cout << "Press Ctrl+C to stop." << std::endl << std::endl;

        std::thread metrics_worker(metrics_thread, std::ref(bridge), metrics_period);

        while (g_running.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << std::endl << "Shutting down..." << std::endl;

        metrics_worker.join();

        if (auto ec = bridge.stop()) {
            std::cerr << "Stop: " << ec.message() << std::endl;
        }

        std::cout << "FINAL METRICS: " << metrics_utils::format_stats(bridge.get_metrics()) << std::endl;
        std::cout << "Bridge stopped." << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
