#pragma once

#include "pnlsync/concurrent/request_id_generator.hpp"
#include "pnlsync/concurrent/thread_safe_queue.hpp"
#include "pnlsync/domain/order.hpp"
#include "pnlsync/eventbus/event_bus.hpp"
#include "pnlsync/events/venue_events.hpp"
#include "pnlsync/time/i_time_provider.hpp"
#include "pnlsync/venue/i_venue_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pnlsync {

struct OrderRouterConfig {
  std::size_t queue_max{50};
  bool readonly{false};
  std::string base_currency{"USD"};
  std::chrono::milliseconds status_wait{1000};
};

// -----------------------------------------------------------------------------
// OrderRouter: bounded hand-off of order requests to the sync worker
// -----------------------------------------------------------------------------
//
// @brief  Callers on any thread submit orders and wait for the outcome; the
//         sync worker places them against the venue between ticks.
//
// @details
// submit() checks, in order:
//   1. validateOrder()           → Failure with the validation message
//   2. read-only mode            → Failure "read-only mode enabled"
//   3. venue not connected       → Failure "disconnected"
//   4. idempotency key seen      → the recorded response (or Pending)
//   5. queue at capacity         → Failure "order queue full"
// then blocks until the worker resolves the request or the timeout lapses.
// A lapsed wait returns Pending "still queued"; the request stays queued and
// its result is recorded under its request id when it completes.
//
// Idempotency keys double as request ids and are remembered for one hour.
// A failed keyed request is forgotten so the caller may retry it.
//
// processPending() (worker thread only):
//   qualify the contract (exchange "SMART", base currency by default),
//   build a MKT or LMT order, place it, pump the venue for up to
//   status_wait, then resolve with the latest OrderStatusEvent seen.
//
// Thread model:
//   submit(), completed() and queueDepth() from any thread.
//   processPending(), failAll() and setConnected() from the sync worker.
//   Waiters, records and the connected flag's transitions are guarded by
//   mutex_; the queue is internally synchronized. OrderStatusEvents are
//   kept only while place() waits for one, then discarded.
// -----------------------------------------------------------------------------
class OrderRouter {
 public:
  using ResultListener = std::function<void(const domain::OrderResult&)>;

  static constexpr std::int64_t kIdempotencyTtlMs = 3600 * 1000;

  OrderRouter(EventBus& bus, const ITimeProvider& clock,
              OrderRouterConfig config);
  ~OrderRouter();

  OrderRouter(const OrderRouter&) = delete;
  OrderRouter& operator=(const OrderRouter&) = delete;
  OrderRouter(OrderRouter&&) = delete;
  OrderRouter& operator=(OrderRouter&&) = delete;

  domain::OrderResult submit(const domain::OrderRequest& request,
                             const std::optional<std::string>& idempotency_key,
                             std::chrono::milliseconds timeout);

  // -------------------------------------------------------------------------
  // processPending(venue)
  // -------------------------------------------------------------------------
  // @brief  Places every queued request. Returns how many were resolved.
  //
  // @details
  // A VenueError while placing fails that request with the error text. If
  // the venue is no longer connected afterwards the error is rethrown so
  // the engine tears the session down; the remaining requests stay queued
  // for failAll().
  // -------------------------------------------------------------------------
  std::size_t processPending(IVenueClient& venue);

  // Resolves every queued request with Failure(reason).
  void failAll(const std::string& reason);

  // Takes mutex_, as does the connection check in submit(). Teardown calls
  // setConnected(false) and then failAll(), so no request can slip into
  // the queue after the drain.
  void setConnected(bool connected);
  bool isConnected() const { return connected_; }

  // Invoked on the resolving thread for every Success / Failure.
  void setResultListener(ResultListener listener);

  // Final result of a request whose caller stopped waiting.
  std::optional<domain::OrderResult> completed(const std::string& request_id) const;

  std::size_t queueDepth() const { return queue_.size(); }
  std::size_t queueCapacity() const { return queue_.capacity(); }

  // Order statuses held for an in-flight placement (0 between placements).
  std::size_t trackedStatusCount() const;

 private:
  struct Job {
    std::string request_id;
    domain::OrderRequest request;
  };

  struct Waiter {
    bool done{false};
    bool abandoned{false};
    bool keyed{false};
    domain::OrderResult result;
  };

  struct Record {
    std::optional<domain::OrderResult> result;  // nullopt while pending
    std::int64_t recorded_ms{0};
  };

  domain::OrderResult place(IVenueClient& venue, const Job& job);
  void resolve(const std::string& request_id, domain::OrderResult result);
  void pruneRecordsLocked(std::int64_t now_ms);
  static domain::OrderResult pending(const std::string& request_id);

  EventBus& bus_;
  const ITimeProvider& clock_;
  const OrderRouterConfig config_;

  ThreadSafeQueue<Job> queue_;
  RequestIdGenerator ids_;
  std::atomic<bool> connected_{false};
  EventBus::SubscriptionId status_subscription_{0};

  mutable std::mutex mutex_;
  std::condition_variable resolved_;
  std::unordered_map<std::string, Waiter> waiters_;
  std::unordered_map<std::string, Record> records_;
  std::map<domain::OrderId, OrderStatusEvent> statuses_;
  bool collecting_statuses_{false};
  ResultListener listener_;
};

}  // namespace pnlsync
