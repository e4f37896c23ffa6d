// =============================================================================
// telemetry_server_test.cpp
// =============================================================================
// Unit tests for dtwin::network::TelemetryServer over ipc:// endpoints.
//
// Validates:
//   - Disabled when both endpoints are empty; start() is then a no-op
//   - REP socket: each request is answered by the command handler
//   - PUB socket: pushed events arrive as JSON records
//   - stop() is idempotent and the destructor stops the thread
// =============================================================================

#include "dtwin/events/event_json.hpp"
#include "dtwin/network/telemetry_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <string>
#include <unistd.h>

using dtwin::network::TelemetryServer;

namespace {

std::string endpoint(const std::string& tag) {
  return "ipc:///tmp/dtwin-telemetry-test-" + std::to_string(::getpid()) +
         "-" + tag;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. No endpoints: nothing to start.
// -----------------------------------------------------------------------------
TEST(TelemetryServerTest, DisabledWithoutEndpoints) {
  TelemetryServer server([](const std::string&) { return std::string(); }, "",
                         "");
  EXPECT_FALSE(server.enabled());
  server.start();
  EXPECT_FALSE(server.running());
  server.stop();
}

// -----------------------------------------------------------------------------
// 2. Request/reply through the handler.
// -----------------------------------------------------------------------------
TEST(TelemetryServerTest, AnswersCommands) {
  const std::string cmd = endpoint("cmd");
  TelemetryServer server(
      [](const std::string& request) { return "echo:" + request; }, cmd, "");
  server.start();
  ASSERT_TRUE(server.running());

  zmq::context_t ctx(1);
  zmq::socket_t client(ctx, zmq::socket_type::req);
  client.set(zmq::sockopt::rcvtimeo, 2000);
  client.set(zmq::sockopt::linger, 0);
  client.connect(cmd);

  for (const std::string request : {"PING", "STATUS"}) {
    client.send(zmq::buffer(request), zmq::send_flags::none);
    zmq::message_t reply;
    auto received = client.recv(reply, zmq::recv_flags::none);
    ASSERT_TRUE(received.has_value()) << request;
    EXPECT_EQ(reply.to_string(), "echo:" + request);
  }

  server.stop();
  EXPECT_FALSE(server.running());
  server.stop();
}

// -----------------------------------------------------------------------------
// 3. Published events. PUB/SUB drops messages until the subscription has
//    propagated, so keep publishing until one arrives.
// -----------------------------------------------------------------------------
TEST(TelemetryServerTest, PublishesEventsAsJson) {
  const std::string pub = endpoint("pub");
  TelemetryServer server([](const std::string&) { return std::string(); }, "",
                         pub);
  server.start();

  zmq::context_t ctx(1);
  zmq::socket_t subscriber(ctx, zmq::socket_type::sub);
  subscriber.set(zmq::sockopt::subscribe, "");
  subscriber.set(zmq::sockopt::rcvtimeo, 100);
  subscriber.set(zmq::sockopt::linger, 0);
  subscriber.connect(pub);

  dtwin::OrderCreatedEvent created;
  created.header.sequence_id = 5;
  created.order_id = "ORD-000005";

  zmq::message_t msg;
  bool received = false;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!received && std::chrono::steady_clock::now() < deadline) {
    server.pushEvent(created);
    received = subscriber.recv(msg, zmq::recv_flags::none).has_value();
  }
  ASSERT_TRUE(received);

  auto record = nlohmann::json::parse(msg.to_string());
  EXPECT_EQ(record["event_type"], "ORDER_CREATED");
  EXPECT_EQ(record["data"]["order_id"], "ORD-000005");
}

// -----------------------------------------------------------------------------
// 4. Destructor stops a running server.
// -----------------------------------------------------------------------------
TEST(TelemetryServerTest, DestructorStops) {
  {
    TelemetryServer server(
        [](const std::string&) { return std::string("ok"); }, endpoint("dtor"),
        "");
    server.start();
    EXPECT_TRUE(server.running());
  }
  SUCCEED();
}
