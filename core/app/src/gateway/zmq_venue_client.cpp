#include "pnlsync/gateway/zmq_venue_client.hpp"
#include "pnlsync/gateway/venue_codec.hpp"

#include <iostream>
#include <utility>

namespace pnlsync {

using nlohmann::json;

ZmqVenueClient::ZmqVenueClient(EventBus& bus, VenueEndpoints endpoints)
    : bus_(bus), endpoints_(std::move(endpoints)) {}

ZmqVenueClient::~ZmqVenueClient() { closeSockets(); }

// -----------------------------------------------------------------------------
// connect(): fresh sockets + handshake
// -----------------------------------------------------------------------------
void ZmqVenueClient::connect() {
  closeSockets();
  try {
    command_socket_ =
        std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
    command_socket_->set(zmq::sockopt::rcvtimeo, endpoints_.request_timeout_ms);
    command_socket_->set(zmq::sockopt::sndtimeo, endpoints_.request_timeout_ms);
    command_socket_->set(zmq::sockopt::linger, 0);
    command_socket_->connect(endpoints_.command_endpoint);

    event_socket_ =
        std::make_unique<zmq::socket_t>(context_, zmq::socket_type::sub);
    event_socket_->set(zmq::sockopt::subscribe, "");
    event_socket_->set(zmq::sockopt::linger, 0);
    event_socket_->connect(endpoints_.event_endpoint);
  } catch (const zmq::error_t& e) {
    closeSockets();
    throw VenueError(std::string("bridge socket setup failed: ") + e.what());
  }

  // The bridge answers "hello" only once its brokerage session is up.
  connected_ = true;
  try {
    json result = request("hello");
    const std::string version =
        result.is_object() ? result.value("server_version", std::string("?"))
                           : std::string("?");
    std::cout << "[ZmqVenueClient] Connected to bridge at "
              << endpoints_.command_endpoint << " server_version=" << version
              << "\n";
  } catch (const VenueError&) {
    connected_ = false;
    closeSockets();
    throw;
  }
}

void ZmqVenueClient::disconnect() {
  if (connected_.exchange(false)) {
    std::cout << "[ZmqVenueClient] Disconnected\n";
  }
  closeSockets();
}

bool ZmqVenueClient::isConnected() const { return connected_; }

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::vector<std::string> ZmqVenueClient::managedAccounts() {
  json result = request("managed_accounts");
  try {
    return result.get<std::vector<std::string>>();
  } catch (const nlohmann::json::exception& e) {
    throw VenueError(std::string("bad managed_accounts reply: ") + e.what());
  }
}

std::vector<PositionSnapshotEvent> ZmqVenueClient::requestPositions() {
  json result = request("positions");
  std::vector<PositionSnapshotEvent> positions;
  try {
    for (const auto& item : result) {
      positions.push_back(decodePositionSnapshot(item));
    }
  } catch (const nlohmann::json::exception& e) {
    throw VenueError(std::string("bad positions reply: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw VenueError(std::string("bad positions reply: ") + e.what());
  }
  return positions;
}

std::vector<ExecutionFill> ZmqVenueClient::requestExecutions() {
  json result = request("executions");
  std::vector<ExecutionFill> fills;
  try {
    for (const auto& item : result) {
      fills.push_back(decodeExecutionFill(item));
    }
  } catch (const nlohmann::json::exception& e) {
    throw VenueError(std::string("bad executions reply: ") + e.what());
  } catch (const std::invalid_argument& e) {
    throw VenueError(std::string("bad executions reply: ") + e.what());
  }
  return fills;
}

// -----------------------------------------------------------------------------
// Subscriptions
// -----------------------------------------------------------------------------
void ZmqVenueClient::subscribeAccountPnL(const std::string& account) {
  request("subscribe_account_pnl", json{{"account", account}});
}

void ZmqVenueClient::requestAccountSummary(
    const std::vector<std::string>& tags) {
  request("account_summary", json{{"group", "All"}, {"tags", tags}});
}

std::int64_t ZmqVenueClient::subscribePositionPnL(const std::string& account,
                                                  std::int64_t con_id) {
  json result = request("subscribe_position_pnl",
                        json{{"account", account}, {"con_id", con_id}});
  try {
    return result.at("request_id").get<std::int64_t>();
  } catch (const nlohmann::json::exception& e) {
    throw VenueError(std::string("bad subscribe_position_pnl reply: ") +
                     e.what());
  }
}

void ZmqVenueClient::cancelPositionPnL(std::int64_t request_id) {
  request("cancel_position_pnl", json{{"request_id", request_id}});
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
std::optional<QualifiedContract> ZmqVenueClient::qualifyContract(
    const ContractSpec& spec) {
  json result = request("qualify_contract", encodeContractSpec(spec));
  if (result.is_null()) {
    return std::nullopt;
  }
  try {
    return decodeQualifiedContract(result);
  } catch (const nlohmann::json::exception& e) {
    throw VenueError(std::string("bad qualify_contract reply: ") + e.what());
  }
}

domain::OrderId ZmqVenueClient::placeOrder(const QualifiedContract& contract,
                                           const VenueOrder& order) {
  json result = request("place_order", encodeVenueOrder(contract, order));
  try {
    return result.at("order_id").get<domain::OrderId>();
  } catch (const nlohmann::json::exception& e) {
    throw VenueError(std::string("bad place_order reply: ") + e.what());
  }
}

std::int64_t ZmqVenueClient::requestCurrentTime() {
  json result = request("current_time");
  try {
    return result.get<std::int64_t>();
  } catch (const nlohmann::json::exception& e) {
    throw VenueError(std::string("bad current_time reply: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// pump(): block for the first message, then drain without waiting
// -----------------------------------------------------------------------------
std::size_t ZmqVenueClient::pump(std::chrono::milliseconds max_wait) {
  if (!connected_ || !event_socket_) {
    throw VenueError("venue bridge not connected");
  }

  std::size_t dispatched = 0;
  try {
    event_socket_->set(zmq::sockopt::rcvtimeo,
                       static_cast<int>(max_wait.count()));
    zmq::recv_flags flags = zmq::recv_flags::none;
    while (true) {
      zmq::message_t msg;
      auto received = event_socket_->recv(msg, flags);
      if (!received.has_value()) {
        break;
      }
      flags = zmq::recv_flags::dontwait;

      auto event = decodeVenueEvent(msg.to_string());
      if (event.has_value()) {
        bus_.publish(*event);
        ++dispatched;
      }
    }
  } catch (const zmq::error_t& e) {
    connected_ = false;
    throw VenueError(std::string("event socket failure: ") + e.what());
  }
  return dispatched;
}

// -----------------------------------------------------------------------------
// request(): one REQ/REP round trip
// -----------------------------------------------------------------------------
json ZmqVenueClient::request(const std::string& command, json args) {
  if (!connected_ || !command_socket_) {
    throw VenueError("venue bridge not connected");
  }

  const std::string payload = encodeVenueRequest(command, std::move(args)).dump();
  zmq::message_t reply;
  try {
    auto sent = command_socket_->send(zmq::buffer(payload),
                                      zmq::send_flags::none);
    if (!sent.has_value()) {
      connected_ = false;
      throw VenueError("send timed out for command " + command);
    }
    auto received = command_socket_->recv(reply, zmq::recv_flags::none);
    if (!received.has_value()) {
      connected_ = false;
      throw VenueError("no reply within " +
                       std::to_string(endpoints_.request_timeout_ms) +
                       " ms for command " + command);
    }
  } catch (const zmq::error_t& e) {
    connected_ = false;
    throw VenueError(std::string("command socket failure: ") + e.what());
  }

  try {
    json j = json::parse(reply.to_string());
    if (!j.value("ok", false)) {
      throw VenueError(command + " failed: " +
                       j.value("error", std::string("unknown error")));
    }
    auto result = j.find("result");
    return result == j.end() ? json(nullptr) : *result;
  } catch (const nlohmann::json::exception& e) {
    throw VenueError("malformed reply to " + command + ": " + e.what());
  }
}

void ZmqVenueClient::closeSockets() {
  if (command_socket_) {
    command_socket_->close();
    command_socket_.reset();
  }
  if (event_socket_) {
    event_socket_->close();
    event_socket_.reset();
  }
}

}  // namespace pnlsync
