#pragma once

#include "pnlsync/domain/order.hpp"
#include "pnlsync/events/venue_events.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pnlsync {

// -----------------------------------------------------------------------------
// VenueError
// -----------------------------------------------------------------------------
// Thrown by any IVenueClient call when the session is unusable: connect
// refused, request timed out, bridge disconnected. SyncEngine treats it as
// "tear down and reconnect".
// -----------------------------------------------------------------------------
class VenueError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Contract as requested by an order (exchange / currency may be defaults).
struct ContractSpec {
  std::string symbol;
  std::string exchange{"SMART"};
  std::string currency;
  std::string sec_type{"STK"};
};

// Contract as resolved by the venue.
struct QualifiedContract {
  std::int64_t con_id{0};
  std::string symbol;
  std::string exchange;
  std::string primary_exchange;
  std::string currency;
};

// Order ticket as the venue sees it. action is "BUY" or "SELL".
struct VenueOrder {
  std::string account;
  std::string action;
  double quantity{0.0};
  domain::OrderType type{domain::OrderType::Market};
  std::optional<double> limit_price;
  std::string time_in_force{"DAY"};
};

// An execution from the replay query, with its commission report when the
// venue already has one.
struct ExecutionFill {
  ExecutionEvent execution;
  std::optional<CommissionReportEvent> commission;
};

// -----------------------------------------------------------------------------
// IVenueClient: brokerage session abstraction
// -----------------------------------------------------------------------------
//
// @brief  Everything the sync service needs from the brokerage: session
//         control, snapshot queries, streaming subscriptions and order entry.
//
// @details
// Two kinds of traffic:
//   - Request/response calls (requestPositions, qualifyContract, ...)
//     return their answer directly.
//   - Streaming data (executions, commission reports, valuations, order
//     status, connectivity notices) is queued by the implementation and
//     published to the EventBus given at construction, but ONLY from
//     inside pump(). Handlers therefore always run on the thread that
//     pumps, which is the sync worker.
//
// Errors:
//   Every call except disconnect() and isConnected() may throw VenueError.
//
// Implementations:
//   - SimulatedVenue  → in-process, scriptable; tests and offline runs.
//   - ZmqVenueClient  → JSON bridge over ZeroMQ REQ + SUB sockets.
//
// Thread model:
//   Single caller (the sync worker). SimulatedVenue additionally accepts
//   injected events from other threads.
// -----------------------------------------------------------------------------
class IVenueClient {
 public:
  virtual ~IVenueClient() = default;

  virtual void connect() = 0;
  // Idempotent; never throws.
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  // Accounts this session may act on. The first is the default.
  virtual std::vector<std::string> managedAccounts() = 0;

  // --- Snapshot queries ---------------------------------------------------------
  virtual std::vector<PositionSnapshotEvent> requestPositions() = 0;
  virtual std::vector<ExecutionFill> requestExecutions() = 0;

  // --- Subscriptions --------------------------------------------------------------
  virtual void subscribeAccountPnL(const std::string& account) = 0;
  virtual void requestAccountSummary(const std::vector<std::string>& tags) = 0;
  // Returns the venue request id used to cancel the subscription.
  virtual std::int64_t subscribePositionPnL(const std::string& account,
                                            std::int64_t con_id) = 0;
  virtual void cancelPositionPnL(std::int64_t request_id) = 0;

  // --- Orders ---------------------------------------------------------------------
  // std::nullopt when the venue cannot resolve the contract.
  virtual std::optional<QualifiedContract> qualifyContract(
      const ContractSpec& spec) = 0;
  virtual domain::OrderId placeOrder(const QualifiedContract& contract,
                                     const VenueOrder& order) = 0;

  // Liveness probe. Returns venue time in epoch seconds.
  virtual std::int64_t requestCurrentTime() = 0;

  // -------------------------------------------------------------------------
  // pump(max_wait)
  // -------------------------------------------------------------------------
  // @brief  Publishes queued streaming events to the EventBus on the
  //         calling thread.
  //
  // @details
  // Waits up to max_wait for the first event, then dispatches everything
  // already queued without waiting further.
  //
  // @return Number of events dispatched.
  // -------------------------------------------------------------------------
  virtual std::size_t pump(std::chrono::milliseconds max_wait) = 0;
};

}  // namespace pnlsync
