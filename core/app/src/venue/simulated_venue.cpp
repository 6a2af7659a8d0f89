#include "pnlsync/venue/simulated_venue.hpp"

#include <iostream>
#include <utility>

namespace pnlsync {

SimulatedVenue::SimulatedVenue(EventBus& bus, const ITimeProvider& clock)
    : bus_(bus), clock_(clock) {}

// -----------------------------------------------------------------------------
// Session
// -----------------------------------------------------------------------------
void SimulatedVenue::connect() {
  {
    std::lock_guard lock(mutex_);
    ++connect_attempts_;
    if (connect_failures_ > 0) {
      --connect_failures_;
      throw VenueError("simulated connect refused");
    }
  }
  dropped_ = false;
  connected_ = true;
  std::cout << "[SimulatedVenue] Connected\n";
}

void SimulatedVenue::disconnect() {
  if (connected_.exchange(false)) {
    std::cout << "[SimulatedVenue] Disconnected\n";
  }
  std::lock_guard lock(mutex_);
  pnl_by_contract_.clear();
}

bool SimulatedVenue::isConnected() const {
  return connected_ && !dropped_;
}

std::vector<std::string> SimulatedVenue::managedAccounts() {
  requireConnected();
  std::lock_guard lock(mutex_);
  return accounts_;
}

// -----------------------------------------------------------------------------
// Snapshot queries
// -----------------------------------------------------------------------------
std::vector<PositionSnapshotEvent> SimulatedVenue::requestPositions() {
  requireConnected();
  std::lock_guard lock(mutex_);
  return positions_;
}

std::vector<ExecutionFill> SimulatedVenue::requestExecutions() {
  requireConnected();
  std::lock_guard lock(mutex_);
  return executions_;
}

// -----------------------------------------------------------------------------
// Subscriptions
// -----------------------------------------------------------------------------
void SimulatedVenue::subscribeAccountPnL(const std::string& /*account*/) {
  requireConnected();
  std::lock_guard lock(mutex_);
  ++account_pnl_subscriptions_;
}

void SimulatedVenue::requestAccountSummary(
    const std::vector<std::string>& /*tags*/) {
  requireConnected();
  std::lock_guard lock(mutex_);
  ++account_summary_requests_;
}

std::int64_t SimulatedVenue::subscribePositionPnL(
    const std::string& /*account*/, std::int64_t con_id) {
  requireConnected();
  std::lock_guard lock(mutex_);
  const std::int64_t request_id = next_request_id_++;
  pnl_by_contract_[con_id] = request_id;
  return request_id;
}

void SimulatedVenue::cancelPositionPnL(std::int64_t request_id) {
  requireConnected();
  std::lock_guard lock(mutex_);
  for (auto it = pnl_by_contract_.begin(); it != pnl_by_contract_.end(); ++it) {
    if (it->second == request_id) {
      pnl_by_contract_.erase(it);
      return;
    }
  }
}

// -----------------------------------------------------------------------------
// Orders
// -----------------------------------------------------------------------------
std::optional<QualifiedContract> SimulatedVenue::qualifyContract(
    const ContractSpec& spec) {
  requireConnected();
  std::lock_guard lock(mutex_);
  if (unqualifiable_.count(spec.symbol) != 0) {
    return std::nullopt;
  }
  auto it = contracts_.find(spec.symbol);
  if (it != contracts_.end()) {
    return it->second;
  }
  QualifiedContract contract;
  contract.con_id = next_con_id_++;
  contract.symbol = spec.symbol;
  contract.exchange = spec.exchange;
  contract.currency = spec.currency;
  contracts_[spec.symbol] = contract;
  return contract;
}

domain::OrderId SimulatedVenue::placeOrder(const QualifiedContract& contract,
                                           const VenueOrder& order) {
  requireConnected();
  OrderStatusEvent status;
  {
    std::lock_guard lock(mutex_);
    const domain::OrderId id = next_order_id_++;
    placed_.push_back(PlacedOrder{id, contract, order});

    status.order_id = id;
    if (fill_orders_) {
      status.status = "Filled";
      status.filled = order.quantity;
      status.remaining = 0.0;
      status.avg_fill_price = order.limit_price.value_or(fill_price_);
    } else {
      status.status = "Submitted";
      status.remaining = order.quantity;
    }
  }
  pending_.push(status);
  return status.order_id;
}

std::int64_t SimulatedVenue::requestCurrentTime() {
  requireConnected();
  {
    std::lock_guard lock(mutex_);
    ++current_time_requests_;
  }
  return clock_.now_ms() / 1000;
}

// -----------------------------------------------------------------------------
// pump(): first event may wait, the rest are already queued
// -----------------------------------------------------------------------------
std::size_t SimulatedVenue::pump(std::chrono::milliseconds max_wait) {
  requireConnected();

  std::size_t dispatched = 0;
  auto first = pending_.pop_for(max_wait);
  if (!first.has_value()) {
    return dispatched;
  }
  bus_.publish(*first);
  ++dispatched;

  for (auto& event : pending_.drain()) {
    bus_.publish(event);
    ++dispatched;
  }
  return dispatched;
}

// -----------------------------------------------------------------------------
// Scripting
// -----------------------------------------------------------------------------
void SimulatedVenue::setManagedAccounts(std::vector<std::string> accounts) {
  std::lock_guard lock(mutex_);
  accounts_ = std::move(accounts);
}

void SimulatedVenue::setPositions(std::vector<PositionSnapshotEvent> positions) {
  std::lock_guard lock(mutex_);
  positions_ = std::move(positions);
}

void SimulatedVenue::setExecutions(std::vector<ExecutionFill> executions) {
  std::lock_guard lock(mutex_);
  executions_ = std::move(executions);
}

void SimulatedVenue::registerContract(const QualifiedContract& contract) {
  std::lock_guard lock(mutex_);
  contracts_[contract.symbol] = contract;
  unqualifiable_.erase(contract.symbol);
}

void SimulatedVenue::markUnqualifiable(const std::string& symbol) {
  std::lock_guard lock(mutex_);
  unqualifiable_.insert(symbol);
  contracts_.erase(symbol);
}

void SimulatedVenue::setFillOrders(bool fill, double fill_price) {
  std::lock_guard lock(mutex_);
  fill_orders_ = fill;
  fill_price_ = fill_price;
}

void SimulatedVenue::failNextConnects(int count) {
  std::lock_guard lock(mutex_);
  connect_failures_ = count;
}

void SimulatedVenue::dropConnection() {
  dropped_ = true;
  std::cout << "[SimulatedVenue] Connection dropped\n";
}

void SimulatedVenue::injectEvent(VenueEvent event) {
  pending_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// Inspection
// -----------------------------------------------------------------------------
std::vector<SimulatedVenue::PlacedOrder> SimulatedVenue::placedOrders() const {
  std::lock_guard lock(mutex_);
  return placed_;
}

std::map<std::int64_t, std::int64_t> SimulatedVenue::positionPnLSubscriptions()
    const {
  std::lock_guard lock(mutex_);
  return pnl_by_contract_;
}

int SimulatedVenue::connectAttempts() const {
  std::lock_guard lock(mutex_);
  return connect_attempts_;
}

int SimulatedVenue::accountPnLSubscriptions() const {
  std::lock_guard lock(mutex_);
  return account_pnl_subscriptions_;
}

int SimulatedVenue::accountSummaryRequests() const {
  std::lock_guard lock(mutex_);
  return account_summary_requests_;
}

int SimulatedVenue::currentTimeRequests() const {
  std::lock_guard lock(mutex_);
  return current_time_requests_;
}

void SimulatedVenue::requireConnected() const {
  if (!connected_) {
    throw VenueError("simulated venue not connected");
  }
  if (dropped_) {
    throw VenueError("simulated venue connection lost");
  }
}

}  // namespace pnlsync
