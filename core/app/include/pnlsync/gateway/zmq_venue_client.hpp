#pragma once

#include "pnlsync/eventbus/event_bus.hpp"
#include "pnlsync/venue/i_venue_client.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace pnlsync {

struct VenueEndpoints {
  std::string command_endpoint{"tcp://127.0.0.1:7497"};
  std::string event_endpoint{"tcp://127.0.0.1:7498"};
  int request_timeout_ms{5000};
};

// -----------------------------------------------------------------------------
// ZmqVenueClient: IVenueClient over a ZeroMQ JSON bridge
// -----------------------------------------------------------------------------
//
// @brief  Talks to a brokerage bridge process: commands over REQ, streaming
//         events over SUB. Wire format in venue_codec.hpp.
//
// @details
// Sockets:
//   REQ  command_endpoint  one outstanding request at a time; every reply
//                          must arrive within request_timeout_ms.
//   SUB  event_endpoint    subscribed to everything; drained by pump().
//
// A REQ socket that missed a reply cannot send again, so a timeout marks
// the session lost and throws VenueError. connect() always builds fresh
// sockets; SyncEngine reconnects through it after the teardown.
//
// Errors:
//   zmq::error_t and malformed replies are rethrown as VenueError. A reply
//   of {"ok": false} throws VenueError carrying the bridge's message.
//   Malformed streaming messages are dropped by the codec.
//
// Thread model:
//   Single caller (the sync worker). Not thread-safe.
//
// Ownership:
//   Owns the zmq context and both sockets. Holds a reference to the
//   EventBus events are published on.
// -----------------------------------------------------------------------------
class ZmqVenueClient final : public IVenueClient {
 public:
  ZmqVenueClient(EventBus& bus, VenueEndpoints endpoints);
  ~ZmqVenueClient() override;

  ZmqVenueClient(const ZmqVenueClient&) = delete;
  ZmqVenueClient& operator=(const ZmqVenueClient&) = delete;
  ZmqVenueClient(ZmqVenueClient&&) = delete;
  ZmqVenueClient& operator=(ZmqVenueClient&&) = delete;

  void connect() override;
  void disconnect() override;
  bool isConnected() const override;
  std::vector<std::string> managedAccounts() override;
  std::vector<PositionSnapshotEvent> requestPositions() override;
  std::vector<ExecutionFill> requestExecutions() override;
  void subscribeAccountPnL(const std::string& account) override;
  void requestAccountSummary(const std::vector<std::string>& tags) override;
  std::int64_t subscribePositionPnL(const std::string& account,
                                    std::int64_t con_id) override;
  void cancelPositionPnL(std::int64_t request_id) override;
  std::optional<QualifiedContract> qualifyContract(
      const ContractSpec& spec) override;
  domain::OrderId placeOrder(const QualifiedContract& contract,
                             const VenueOrder& order) override;
  std::int64_t requestCurrentTime() override;
  std::size_t pump(std::chrono::milliseconds max_wait) override;

 private:
  // Sends one command and returns the reply's "result" member.
  nlohmann::json request(const std::string& command,
                         nlohmann::json args = nlohmann::json::object());
  void closeSockets();

  EventBus& bus_;
  VenueEndpoints endpoints_;

  zmq::context_t context_{1};
  std::unique_ptr<zmq::socket_t> command_socket_;
  std::unique_ptr<zmq::socket_t> event_socket_;

  std::atomic<bool> connected_{false};
};

}  // namespace pnlsync
