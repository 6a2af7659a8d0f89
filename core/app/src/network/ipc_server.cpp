#include "pnlsync/network/ipc_server.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace pnlsync {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind sockets and spawn the worker
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  const bool was_running = running_.exchange(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!was_running) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Telemetry telemetry) {
  telemetry_queue_.push(std::move(telemetry));
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto telemetry = telemetry_queue_.try_pop()) {
    const std::string payload = formatTelemetry(*telemetry);
    zmq::message_t msg(payload.data(), payload.size());
    pub_socket_->send(msg, zmq::send_flags::dontwait);
  }
}

// -----------------------------------------------------------------------------
// processCommands(): one request per call, bounded by kPollTimeoutMs
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  // A REP socket must answer every request, so a throwing handler still
  // produces a reply.
  std::string response;
  try {
    response = command_handler_(request.to_string());
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] Command failed: " << e.what() << "\n";
    response = nlohmann::json{{"status", "error"}, {"response", e.what()}}.dump();
  }
  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// Telemetry formatters
// -----------------------------------------------------------------------------
std::string IpcServer::formatTelemetry(const Telemetry& telemetry) {
  if (const auto* pnl = std::get_if<AccountPnLSnapshot>(&telemetry)) {
    return formatAccountPnL(*pnl);
  }
  return formatOrderResult(std::get<domain::OrderResult>(telemetry));
}

std::string IpcServer::formatAccountPnL(const AccountPnLSnapshot& pnl) {
  nlohmann::json j;
  j["type"] = "pnl";
  if (pnl.account_id.has_value()) {
    j["account_id"] = *pnl.account_id;
  } else {
    j["account_id"] = nullptr;
  }
  j["base_currency"] = pnl.base_currency;
  j["realized_pnl"] = pnl.realized_pnl;
  j["unrealized_pnl"] = pnl.unrealized_pnl;
  j["daily_pnl"] = pnl.daily_pnl;
  j["total_pnl"] = pnl.total_pnl;
  j["as_of_ms"] = pnl.as_of_ms;
  return j.dump();
}

std::string IpcServer::formatOrderResult(const domain::OrderResult& result) {
  nlohmann::json j;
  j["type"] = "order";
  j["request_id"] = result.request_id;
  j["outcome"] = domain::orderOutcomeToString(result.outcome);
  if (!result.error.empty()) {
    j["error"] = result.error;
  }
  if (result.fill.has_value()) {
    j["order_id"] = result.fill->order_id;
    j["status"] = result.fill->status;
    j["filled"] = result.fill->filled;
    j["remaining"] = result.fill->remaining;
    j["avg_fill_price"] = result.fill->avg_fill_price;
  }
  return j.dump();
}

}  // namespace pnlsync
