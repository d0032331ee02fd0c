/**
 * @file test_bridge.cpp
 * @brief Tests for the Bridge: chains, registration, heartbeats, end to end.
 */
#include <gtest/gtest.h>
#include <zmq.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

#include "wrpzmq/bridge.hpp"
#include "wrpzmq/codec.hpp"
#include "wrpzmq/errors.hpp"

using namespace std::chrono_literals;
using wrpzmq::Bridge;
using wrpzmq::BridgeConfig;
using wrpzmq::Context;
using wrpzmq::Message;
using wrpzmq::MessageType;
using wrpzmq::errc;

namespace {

BridgeConfig loopback() {
  BridgeConfig config;
  config.listen_url = "tcp://127.0.0.1:*";
  config.send_timeout = 2000ms;
  config.worker_threads = 2;
  return config;
}

struct Collected {
  std::mutex mutex;
  std::vector<Message> messages;

  void add(const Message& msg) {
    std::lock_guard<std::mutex> lock(mutex);
    messages.push_back(msg);
  }

  size_t size() {
    std::lock_guard<std::mutex> lock(mutex);
    return messages.size();
  }
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
  auto until = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) return true;
    std::this_thread::sleep_for(10ms);
  }
  return pred();
}

bool has_service(const Bridge& bridge, const std::string& name) {
  auto names = bridge.services();
  return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

TEST(Bridge, Config_Validated) {
  BridgeConfig no_url;
  EXPECT_THROW({ Bridge b(no_url); }, std::system_error);

  BridgeConfig no_heartbeat = loopback();
  no_heartbeat.heartbeat_interval = 0ms;
  EXPECT_THROW({ Bridge b(no_heartbeat); }, std::system_error);
}

TEST(Bridge, Ingest_EgressSeesRoutableTypesOnly) {
  Collected rx, egress;
  auto config = loopback();
  config.rx_observers.push_back([&rx](const Context&, const Message& m) { rx.add(m); });
  Bridge bridge(config);
  bridge.add_egress([&egress](const Context&, const Message& m) -> std::error_code {
    egress.add(m);
    return {};
  });

  EXPECT_FALSE(bridge.ingest(Context(), Message(MessageType::simple_event)));
  EXPECT_EQ(bridge.ingest(Context(), Message(MessageType::service_alive)), errc::local_disallowed);
  EXPECT_EQ(bridge.ingest(Context(), Message(MessageType::authorization)), errc::local_disallowed);
  EXPECT_EQ(bridge.ingest(Context(), Message(MessageType::invalid1)), errc::unsupported_type);

  EXPECT_EQ(rx.size(), 4u);
  ASSERT_EQ(egress.size(), 1u);
  EXPECT_EQ(egress.messages[0].type, MessageType::simple_event);
}

TEST(Bridge, EgressCancel_StopsDelivery) {
  Collected egress;
  Bridge bridge(loopback());
  auto cancel = bridge.add_egress([&egress](const Context&, const Message& m) -> std::error_code {
    egress.add(m);
    return {};
  });
  EXPECT_FALSE(bridge.ingest(Context(), Message(MessageType::create)));
  cancel();
  EXPECT_FALSE(bridge.ingest(Context(), Message(MessageType::create)));
  EXPECT_EQ(egress.size(), 1u);
}

TEST(Bridge, Registration_RequiresNameAndUrl) {
  Bridge bridge(loopback());

  Message no_url(MessageType::service_registration);
  no_url.service_name = "config";
  EXPECT_EQ(bridge.ingest(Context(), no_url), errc::invalid_message);

  Message no_name(MessageType::service_registration);
  no_name.url = "tcp://127.0.0.1:1";
  EXPECT_EQ(bridge.ingest(Context(), no_name), errc::invalid_message);

  EXPECT_TRUE(bridge.services().empty());
}

TEST(Bridge, Process_FiltersBeforeRouting) {
  Collected tx;
  auto config = loopback();
  config.tx_observers.push_back([&tx](const Context&, const Message& m) { tx.add(m); });
  Bridge bridge(config);

  EXPECT_EQ(bridge.process(Context(), Message(MessageType::invalid0)), errc::unsupported_type);
  EXPECT_EQ(bridge.process(Context(), Message(MessageType::service_registration)),
            errc::local_disallowed);
  EXPECT_EQ(tx.size(), 0u);

  Message event(MessageType::simple_event);
  event.destination = "mac:112233445566/nobody";
  EXPECT_EQ(bridge.process(Context(), event), errc::not_handled);
  EXPECT_EQ(tx.size(), 1u);
}

TEST(Bridge, Heartbeat_PeriodicAndStartIdempotent) {
  std::atomic<int> beats{0};
  auto config = loopback();
  config.heartbeat_interval = 50ms;
  config.tx_observers.push_back([&beats](const Context&, const Message& m) {
    if (m.type == MessageType::service_alive) ++beats;
  });
  Bridge bridge(config);

  ASSERT_FALSE(bridge.start());
  ASSERT_FALSE(bridge.start());
  EXPECT_TRUE(bridge.is_running());
  std::this_thread::sleep_for(500ms);
  EXPECT_FALSE(bridge.stop());
  EXPECT_FALSE(bridge.is_running());

  int seen = beats.load();
  EXPECT_GE(seen, 4);
  EXPECT_LE(seen, 11);

  std::this_thread::sleep_for(150ms);
  EXPECT_EQ(beats.load(), seen);
  EXPECT_FALSE(bridge.stop());
}

TEST(Bridge, EndToEnd_RegisterThenRoute) {
  Bridge bridge(loopback());
  ASSERT_FALSE(bridge.start());

  zmq::context_t context(1);
  zmq::socket_t service(context, zmq::socket_type::pull);
  service.set(zmq::sockopt::rcvtimeo, 5000);
  service.set(zmq::sockopt::linger, 0);
  service.bind("tcp://127.0.0.1:*");
  std::string service_url = service.get(zmq::sockopt::last_endpoint);

  zmq::socket_t push(context, zmq::socket_type::push);
  push.set(zmq::sockopt::linger, 1000);
  push.connect(bridge.endpoint());

  Message registration(MessageType::service_registration);
  registration.service_name = "config";
  registration.url = service_url;
  std::string frame = wrpzmq::encode(registration);
  ASSERT_TRUE(push.send(zmq::buffer(frame), zmq::send_flags::none).has_value());

  ASSERT_TRUE(eventually([&] { return has_service(bridge, "config"); }));

  auto receive = [&service](Message& out) {
    zmq::message_t msg;
    if (!service.recv(msg, zmq::recv_flags::none)) return false;
    return !wrpzmq::decode(msg.data(), msg.size(), out);
  };

  Message auth;
  ASSERT_TRUE(receive(auth));
  EXPECT_EQ(auth.type, MessageType::authorization);
  ASSERT_TRUE(auth.status.has_value());
  EXPECT_EQ(*auth.status, 200);

  Message event(MessageType::simple_event);
  event.destination = "mac:112233445566/config/extra";
  event.payload = "routed";
  EXPECT_FALSE(bridge.process(Context::with_timeout(5s), event));

  Message got;
  ASSERT_TRUE(receive(got));
  EXPECT_EQ(got, event);

  EXPECT_FALSE(bridge.stop());
  EXPECT_TRUE(bridge.services().empty());
}
