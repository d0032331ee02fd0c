/**
 * @file test_listener.cpp
 * @brief Tests for the inbound Listener on an ephemeral loopback port.
 */
#include <gtest/gtest.h>
#include <zmq.hpp>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <thread>

#include "wrpzmq/codec.hpp"
#include "wrpzmq/context.hpp"
#include "wrpzmq/errors.hpp"
#include "wrpzmq/listener.hpp"

using namespace std::chrono_literals;
using wrpzmq::Context;
using wrpzmq::Listener;
using wrpzmq::ListenerConfig;
using wrpzmq::Message;
using wrpzmq::MessageType;

namespace {

ListenerConfig loopback(std::chrono::milliseconds recv_timeout = 0ms) {
  ListenerConfig config;
  config.url = "tcp://127.0.0.1:*";
  config.recv_timeout = recv_timeout;
  config.worker_threads = 2;
  return config;
}

// Collects payloads from processor threads.
struct Inbox {
  std::mutex mutex;
  std::condition_variable cv;
  std::multiset<std::string> payloads;

  wrpzmq::Processor processor() {
    return [this](const Context&, const Message& msg) -> std::error_code {
      {
        std::lock_guard<std::mutex> lock(mutex);
        payloads.insert(msg.payload);
      }
      cv.notify_all();
      return {};
    };
  }

  bool wait_for_count(size_t n, std::chrono::milliseconds timeout = 5000ms) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [&] { return payloads.size() >= n; });
  }
};

struct Pusher {
  zmq::context_t context{1};
  zmq::socket_t socket{context, zmq::socket_type::push};

  explicit Pusher(const std::string& url) {
    socket.set(zmq::sockopt::linger, 1000);
    socket.set(zmq::sockopt::sndtimeo, 2000);
    socket.connect(url);
  }

  void send_raw(const std::string& frame) {
    ASSERT_TRUE(socket.send(zmq::buffer(frame), zmq::send_flags::none).has_value());
  }

  void send(const std::string& payload) {
    Message msg(MessageType::simple_event);
    msg.payload = payload;
    send_raw(wrpzmq::encode(msg));
  }
};

} // namespace

TEST(Listener, Construct_RejectsEmptyUrl) {
  ListenerConfig config;
  EXPECT_THROW({ Listener l(config); }, std::system_error);
}

TEST(Listener, DeliversEveryFrame) {
  Listener listener(loopback(100ms));
  Inbox inbox;
  listener.add_processor(inbox.processor());
  ASSERT_FALSE(listener.listen());
  EXPECT_TRUE(listener.is_running());
  ASSERT_NE(listener.endpoint().find("tcp://127.0.0.1:"), std::string::npos);

  Pusher pusher(listener.endpoint());
  pusher.send("one");
  pusher.send("two");

  ASSERT_TRUE(inbox.wait_for_count(2));
  EXPECT_EQ(inbox.payloads, (std::multiset<std::string>{"one", "two"}));

  // close() drains the worker pool, so the counters are settled afterwards.
  EXPECT_FALSE(listener.close());
  EXPECT_FALSE(listener.is_running());

  auto stats = listener.get_metrics();
  EXPECT_EQ(stats.frames_received, 2u);
  EXPECT_EQ(stats.messages_dispatched, 2u);
  EXPECT_EQ(stats.queue_depth, 0u);
}

TEST(Listener, GarbageDroppedLoopContinues) {
  Listener listener(loopback(50ms));
  Inbox inbox;
  listener.add_processor(inbox.processor());
  ASSERT_FALSE(listener.listen());

  Pusher pusher(listener.endpoint());
  pusher.send_raw("definitely not a frame");
  pusher.send("after");

  ASSERT_TRUE(inbox.wait_for_count(1));
  EXPECT_EQ(inbox.payloads.count("after"), 1u);
  EXPECT_EQ(listener.get_metrics().frames_dropped, 1u);
  EXPECT_TRUE(listener.is_running());
}

TEST(Listener, OversizedFrameRefused) {
  auto config = loopback(50ms);
  config.max_frame_size = 256;
  Listener listener(config);
  Inbox inbox;
  listener.add_processor(inbox.processor());
  ASSERT_FALSE(listener.listen());

  Pusher big(listener.endpoint());
  big.send(std::string(1000, 'b'));
  Pusher small(listener.endpoint());
  small.send("small");

  ASSERT_TRUE(inbox.wait_for_count(1));
  std::this_thread::sleep_for(200ms);
  EXPECT_FALSE(listener.close());
  EXPECT_EQ(inbox.payloads, (std::multiset<std::string>{"small"}));
  EXPECT_EQ(listener.get_metrics().frames_received, 1u);
}

TEST(Listener, ProcessorErrorsDoNotStopLoop) {
  Listener listener(loopback());
  Inbox inbox;
  listener.add_processor([](const Context&, const Message&) -> std::error_code {
    throw std::runtime_error("boom");
  });
  listener.add_processor([](const Context&, const Message&) -> std::error_code {
    return wrpzmq::errc::invalid_message;
  });
  listener.add_processor(inbox.processor());
  ASSERT_FALSE(listener.listen());

  Pusher pusher(listener.endpoint());
  pusher.send("a");
  pusher.send("b");
  ASSERT_TRUE(inbox.wait_for_count(2));
}

TEST(Listener, CancelledProcessor_NotCalled) {
  Listener listener(loopback());
  Inbox inbox;
  auto cancel = listener.add_processor(inbox.processor());
  cancel();
  Inbox other;
  listener.add_processor(other.processor());
  ASSERT_FALSE(listener.listen());

  Pusher pusher(listener.endpoint());
  pusher.send("x");
  ASSERT_TRUE(other.wait_for_count(1));
  EXPECT_TRUE(inbox.payloads.empty());
}

TEST(Listener, CloseIdempotent_NotifiesOnceWithoutError) {
  Listener listener(loopback());
  std::mutex mutex;
  std::vector<std::error_code> reasons;
  listener.add_close_listener([&](const std::error_code& ec) {
    std::lock_guard<std::mutex> lock(mutex);
    reasons.push_back(ec);
  });

  EXPECT_FALSE(listener.close());
  ASSERT_FALSE(listener.listen());
  ASSERT_FALSE(listener.listen());

  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(listener.close());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  EXPECT_FALSE(listener.close());

  std::lock_guard<std::mutex> lock(mutex);
  ASSERT_EQ(reasons.size(), 1u);
  EXPECT_FALSE(reasons[0]);
}

TEST(Listener, RestartAfterClose) {
  Listener listener(loopback());
  Inbox inbox;
  listener.add_processor(inbox.processor());
  ASSERT_FALSE(listener.listen());
  EXPECT_FALSE(listener.close());

  ASSERT_FALSE(listener.listen());
  Pusher pusher(listener.endpoint());
  pusher.send("again");
  ASSERT_TRUE(inbox.wait_for_count(1));
}

TEST(Listener, BadUrl_ListenFails) {
  ListenerConfig config;
  config.url = "nope://x";
  Listener listener(config);
  EXPECT_TRUE(listener.listen());
  EXPECT_FALSE(listener.is_running());
}
