#include "wrpzmq/codec.hpp"
#include "wrpzmq/types.hpp"
#include <zmq.hpp>
#include <iostream>
#include <memory>
#include <thread>
#include <chrono>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <signal.h>

using namespace wrpzmq;

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

// Prints whatever the bridge delivers to our registered address.
void inbox_thread(zmq::socket_t& inbox) {
    while (g_running.load()) {
        zmq::message_t frame;
        zmq::recv_result_t result;
        try {
            result = inbox.recv(frame, zmq::recv_flags::none);
        } catch (const zmq::error_t& e) {
            if (e.num() == EINTR) {
                continue;
            }
            std::cerr << "inbox: " << e.what() << std::endl;
            return;
        }
        if (!result.has_value()) {
            continue;
        }

        Message msg;
        if (auto ec = decode(frame.data(), frame.size(), msg)) {
            std::cout << "inbox: undecodable frame (" << ec.message() << ")" << std::endl;
            continue;
        }
        std::cout << "inbox: " << to_string(msg.type)
                  << " dest=" << msg.destination
                  << " payload=" << msg.payload;
        if (msg.status) {
            std::cout << " status=" << *msg.status;
        }
        std::cout << std::endl;
    }
}

void send_message(zmq::socket_t& socket, const Message& msg) {
    std::string frame = encode(msg);
    auto sent = socket.send(zmq::buffer(frame), zmq::send_flags::none);
    if (!sent.has_value()) {
        std::cerr << "send timed out" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::string bridge_addr = "tcp://127.0.0.1:6666";
    std::string dest = "mac:112233445566/echo";
    std::string service_name;
    std::string bind_addr = "tcp://127.0.0.1:6667";
    int messages = 10;

    for (int i = 1; i < argc; i += 2) {
        if (i + 1 >= argc) break;

        std::string arg = argv[i];
        if (arg == "--bridge") {
            bridge_addr = argv[i + 1];
        } else if (arg == "--messages") {
            messages = std::atoi(argv[i + 1]);
        } else if (arg == "--dest") {
            dest = argv[i + 1];
        } else if (arg == "--register") {
            service_name = argv[i + 1];
        } else if (arg == "--bind") {
            bind_addr = argv[i + 1];
        }
    }

    std::cout << "Starting push tool:" << std::endl;
    std::cout << "  Bridge address: " << bridge_addr << std::endl;
    std::cout << "  Messages: " << messages << std::endl;
    std::cout << "  Destination: " << dest << std::endl;
    if (!service_name.empty()) {
        std::cout << "  Registering as: " << service_name << " at " << bind_addr << std::endl;
    }
    std::cout << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        zmq::context_t context(1);

        zmq::socket_t push(context, zmq::socket_type::push);
        push.set(zmq::sockopt::sndtimeo, 5000);
        push.set(zmq::sockopt::linger, 1000);
        push.connect(bridge_addr);

        std::unique_ptr<zmq::socket_t> inbox;
        std::thread inbox_worker;
        if (!service_name.empty()) {
            inbox.reset(new zmq::socket_t(context, zmq::socket_type::pull));
            inbox->set(zmq::sockopt::rcvtimeo, 100);
            inbox->bind(bind_addr);

            Message registration(MessageType::service_registration);
            registration.service_name = service_name;
            registration.url = bind_addr;
            send_message(push, registration);

            inbox_worker = std::thread(inbox_thread, std::ref(*inbox));
        }

        try {
            auto start_time = std::chrono::steady_clock::now();
            for (int i = 0; i < messages && g_running.load(); ++i) {
                Message msg(MessageType::simple_event);
                msg.source = "mac:000000000000/push_tool";
                msg.destination = dest;
                msg.content_type = "text/plain";
                msg.payload = "Message " + std::to_string(i);
                send_message(push, msg);
            }
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time);
            std::cout << "Sent " << messages << " messages in " << duration.count() << " ms" << std::endl;
        } catch (const std::exception&) {
            // The inbox thread must not outlive its socket.
            g_running.store(false);
            if (inbox_worker.joinable()) {
                inbox_worker.join();
            }
            throw;
        }

        if (inbox_worker.joinable()) {
            std::cout << "Waiting for deliveries, press Ctrl+C to stop." << std::endl;
            while (g_running.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            inbox_worker.join();
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Push tool stopped" << std::endl;
    return 0;
}
