// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Unit tests for pnlsync::IpcServer.
//
// Validates:
//   - Telemetry formatting for PnL snapshots and order results
//   - REQ/REP: a request reaches the handler and its reply comes back
//   - A throwing handler is answered with an error reply
//   - PUB: pushed telemetry is published with its "type" field
//
// Design: the socket tests bind loopback TCP ports in the 557xx range and use
// receive timeouts, so a broken server fails the test instead of hanging it.
// =============================================================================

#include "pnlsync/network/ipc_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using nlohmann::json;

// -----------------------------------------------------------------------------
// 1. Formatters.
// -----------------------------------------------------------------------------
TEST(IpcServerFormatTest, FormatsAccountPnL) {
  pnlsync::AccountPnLSnapshot pnl;
  pnl.account_id = 1;
  pnl.base_currency = "USD";
  pnl.realized_pnl = 98.0;
  pnl.unrealized_pnl = -12.5;
  pnl.daily_pnl = 40.0;
  pnl.total_pnl = 85.5;
  pnl.as_of_ms = 1'700'000'000'000;

  const json j = json::parse(pnlsync::IpcServer::formatTelemetry(pnl));
  EXPECT_EQ(j["type"], "pnl");
  EXPECT_EQ(j["account_id"], 1);
  EXPECT_DOUBLE_EQ(j["realized_pnl"].get<double>(), 98.0);
  EXPECT_DOUBLE_EQ(j["total_pnl"].get<double>(), 85.5);

  pnl.account_id.reset();
  EXPECT_TRUE(json::parse(pnlsync::IpcServer::formatAccountPnL(pnl))["account_id"]
                  .is_null());
}

TEST(IpcServerFormatTest, FormatsOrderResult) {
  pnlsync::domain::OrderResult failed =
      pnlsync::domain::OrderResult::failure("req-1", "order queue full");
  json j = json::parse(pnlsync::IpcServer::formatTelemetry(failed));
  EXPECT_EQ(j["type"], "order");
  EXPECT_EQ(j["outcome"], "failure");
  EXPECT_EQ(j["error"], "order queue full");
  EXPECT_FALSE(j.contains("order_id"));

  pnlsync::domain::OrderResult filled;
  filled.outcome = pnlsync::domain::OrderOutcome::Success;
  filled.request_id = "req-2";
  filled.fill = pnlsync::domain::OrderFill{17, "Filled", 10, 0, 101.25};
  j = json::parse(pnlsync::IpcServer::formatOrderResult(filled));
  EXPECT_EQ(j["outcome"], "success");
  EXPECT_EQ(j["order_id"], 17);
  EXPECT_EQ(j["status"], "Filled");
  EXPECT_FALSE(j.contains("error"));
}

// -----------------------------------------------------------------------------
// 2. Live sockets.
// -----------------------------------------------------------------------------
class IpcServerSocketTest : public ::testing::Test {
 protected:
  const std::string cmd_endpoint{"tcp://127.0.0.1:55761"};
  const std::string pub_endpoint{"tcp://127.0.0.1:55762"};

  zmq::context_t client_context{1};
};

TEST_F(IpcServerSocketTest, RequestReachesHandler) {
  pnlsync::IpcServer server(
      [](const std::string& cmd) { return std::string("echo:") + cmd; },
      cmd_endpoint, pub_endpoint);
  server.start();
  ASSERT_TRUE(server.isRunning());

  zmq::socket_t req(client_context, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  req.connect(cmd_endpoint);

  const std::string body = R"({"cmd":"PING"})";
  req.send(zmq::buffer(body), zmq::send_flags::none);

  zmq::message_t reply;
  auto received = req.recv(reply, zmq::recv_flags::none);
  ASSERT_TRUE(received.has_value());
  EXPECT_EQ(reply.to_string(), std::string("echo:") + body);

  server.stop();
  EXPECT_FALSE(server.isRunning());
}

// -----------------------------------------------------------------------------
// 3. PUB/SUB drops messages until the subscription is established, so the
//    test keeps pushing until one arrives or the deadline passes.
// -----------------------------------------------------------------------------
TEST_F(IpcServerSocketTest, PublishesTelemetry) {
  pnlsync::IpcServer server([](const std::string&) { return std::string("{}"); },
                            cmd_endpoint, pub_endpoint);
  server.start();

  zmq::socket_t sub(client_context, zmq::socket_type::sub);
  sub.set(zmq::sockopt::rcvtimeo, 100);
  sub.set(zmq::sockopt::linger, 0);
  sub.set(zmq::sockopt::subscribe, "");
  sub.connect(pub_endpoint);

  pnlsync::AccountPnLSnapshot pnl;
  pnl.base_currency = "USD";
  pnl.realized_pnl = 5.0;

  std::string payload;
  const auto deadline = std::chrono::steady_clock::now() + 3s;
  while (payload.empty() && std::chrono::steady_clock::now() < deadline) {
    server.pushTelemetry(pnl);
    zmq::message_t msg;
    if (sub.recv(msg, zmq::recv_flags::none).has_value()) {
      payload = msg.to_string();
    }
  }

  server.stop();
  ASSERT_FALSE(payload.empty());
  const json j = json::parse(payload);
  EXPECT_EQ(j["type"], "pnl");
  EXPECT_DOUBLE_EQ(j["realized_pnl"].get<double>(), 5.0);
}

// -----------------------------------------------------------------------------
// 4. A handler that throws still gets the client a reply.
// Why: A REP socket that skips a reply is wedged for every later client.
// -----------------------------------------------------------------------------
TEST_F(IpcServerSocketTest, ThrowingHandlerStillReplies) {
  pnlsync::IpcServer server(
      [](const std::string&) -> std::string {
        throw std::runtime_error("store unavailable");
      },
      cmd_endpoint, pub_endpoint);
  server.start();

  zmq::socket_t req(client_context, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  req.connect(cmd_endpoint);

  for (int i = 0; i < 2; ++i) {
    req.send(zmq::str_buffer("STATUS"), zmq::send_flags::none);
    zmq::message_t reply;
    ASSERT_TRUE(req.recv(reply, zmq::recv_flags::none).has_value());
    const json j = json::parse(reply.to_string());
    EXPECT_EQ(j["status"], "error");
    EXPECT_EQ(j["response"], "store unavailable");
  }
}
