#pragma once

#include "pnlsync/concurrent/thread_safe_queue.hpp"
#include "pnlsync/eventbus/event_bus.hpp"
#include "pnlsync/events/event.hpp"
#include "pnlsync/time/i_time_provider.hpp"
#include "pnlsync/venue/i_venue_client.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace pnlsync {

// -----------------------------------------------------------------------------
// SimulatedVenue: scriptable in-process brokerage
// -----------------------------------------------------------------------------
//
// @brief  IVenueClient with no network. Tests (and venue.mode = "simulated")
//         script its answers up front and inject streaming events at will.
//
// @details
// Request/response calls answer from scripted state:
//   managedAccounts()    → setManagedAccounts()
//   requestPositions()   → setPositions()
//   requestExecutions()  → setExecutions()
//   qualifyContract()    → registerContract(), or an auto-assigned contract
//                          id unless the symbol was marked unqualifiable
//
// placeOrder() records the ticket and queues an OrderStatusEvent for it:
// "Submitted" by default, or "Filled" at the configured fill price after
// setFillOrders(true).
//
// Fault injection:
//   failNextConnects(n)  → the next n connect() calls throw VenueError.
//   dropConnection()     → marks the session lost; the next pump() throws.
//
// Streaming: injectEvent() is safe from any thread. Events are published
// to the bus only from pump(), on the pumping thread.
//
// Thread model:
//   Scripting and inspection methods lock mutex_ and may be called from a
//   test thread while the sync worker drives the IVenueClient methods.
//
// Ownership:
//   Holds references to the EventBus and the ITimeProvider; neither is
//   owned.
// -----------------------------------------------------------------------------
class SimulatedVenue final : public IVenueClient {
 public:
  SimulatedVenue(EventBus& bus, const ITimeProvider& clock);
  ~SimulatedVenue() override = default;

  SimulatedVenue(const SimulatedVenue&) = delete;
  SimulatedVenue& operator=(const SimulatedVenue&) = delete;

  // --- IVenueClient ---------------------------------------------------------------
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

  // --- Scripting -------------------------------------------------------------------
  void setManagedAccounts(std::vector<std::string> accounts);
  void setPositions(std::vector<PositionSnapshotEvent> positions);
  void setExecutions(std::vector<ExecutionFill> executions);
  void registerContract(const QualifiedContract& contract);
  void markUnqualifiable(const std::string& symbol);
  void setFillOrders(bool fill, double fill_price = 0.0);
  void failNextConnects(int count);
  void dropConnection();
  void injectEvent(VenueEvent event);

  // --- Inspection ------------------------------------------------------------------
  struct PlacedOrder {
    domain::OrderId order_id{0};
    QualifiedContract contract;
    VenueOrder order;
  };

  std::vector<PlacedOrder> placedOrders() const;
  // con_id → request id of every live per-position subscription.
  std::map<std::int64_t, std::int64_t> positionPnLSubscriptions() const;
  int connectAttempts() const;
  int accountPnLSubscriptions() const;
  int accountSummaryRequests() const;
  int currentTimeRequests() const;

 private:
  void requireConnected() const;

  EventBus& bus_;
  const ITimeProvider& clock_;

  ThreadSafeQueue<VenueEvent> pending_;
  std::atomic<bool> connected_{false};
  std::atomic<bool> dropped_{false};

  mutable std::mutex mutex_;
  std::vector<std::string> accounts_{"SIM0001"};
  std::vector<PositionSnapshotEvent> positions_;
  std::vector<ExecutionFill> executions_;
  std::map<std::string, QualifiedContract> contracts_;
  std::set<std::string> unqualifiable_;
  std::vector<PlacedOrder> placed_;
  std::map<std::int64_t, std::int64_t> pnl_by_contract_;
  bool fill_orders_{false};
  double fill_price_{0.0};
  int connect_failures_{0};
  int connect_attempts_{0};
  int account_pnl_subscriptions_{0};
  int account_summary_requests_{0};
  int current_time_requests_{0};
  std::int64_t next_request_id_{1000};
  std::int64_t next_con_id_{900001};
  domain::OrderId next_order_id_{1};
};

}  // namespace pnlsync
