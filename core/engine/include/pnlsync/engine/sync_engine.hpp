#pragma once

#include "pnlsync/cache/position_cache.hpp"
#include "pnlsync/concurrent/request_id_generator.hpp"
#include "pnlsync/concurrent/thread_safe_queue.hpp"
#include "pnlsync/config/sync_config.hpp"
#include "pnlsync/domain/order.hpp"
#include "pnlsync/eventbus/event_bus.hpp"
#include "pnlsync/ledger/trade_booker.hpp"
#include "pnlsync/network/ipc_server.hpp"
#include "pnlsync/storage/i_ledger_store.hpp"
#include "pnlsync/sync/event_reconciler.hpp"
#include "pnlsync/sync/order_router.hpp"
#include "pnlsync/time/i_time_provider.hpp"
#include "pnlsync/venue/i_venue_client.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pnlsync {

enum class SyncState {
  Disconnected,
  Connecting,
  Connected,
  Stopped,
};

const char* syncStateToString(SyncState state);

// -----------------------------------------------------------------------------
// SyncStatus: point-in-time copy of the engine's health
// -----------------------------------------------------------------------------
struct SyncStatus {
  SyncState state{SyncState::Stopped};
  bool connected{false};
  bool venue_reachable{false};
  bool degraded{false};
  std::string venue_account;
  std::optional<std::int64_t> account_id;
  std::int64_t last_connect_ms{0};
  std::int64_t last_disconnect_ms{0};
  std::int64_t last_event_ms{0};
  std::string last_error;
  std::size_t order_queue_depth{0};
  bool cache_ready{false};
  int connect_attempts{0};
  std::int64_t reconnect_delay_ms{0};
};

// -----------------------------------------------------------------------------
// SyncEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns the sync worker: connects to the venue, replays its state
//         into the ledger and cache, then ticks until the session fails or
//         the engine stops.
//
// @details
// Session (sync worker):
//   connect → managedAccounts → upsertAccount → cache.setAccount
//   → hydrate from store (first session only)
//   → replay positions + reconcilePositions → replay executions
//   → subscribe account PnL + account summary tags → Connected
//
// Tick (every tick_ms, the venue pump doubles as the sleep):
//   pump events → keepalive probe every keepalive_sec → flush every
//   cache_flush_sec → queue depth log every 5 s → drain manual bookings
//   → drain orders → publish PnL telemetry if the cache moved
//
// Any exception in a session is recorded as last_error, then teardown:
// venue disconnect, every order waiter failed with "disconnected",
// valuation subscriptions forgotten. The worker then sleeps the backoff
// (reconnect_min_sec doubling to reconnect_max_sec, reset on every
// successful connect) and retries. stop() wakes the sleep early.
//
// Connectivity notices from the venue:
//   1100        → venue_reachable = false
//   1101, 1102  → venue_reachable = true, degraded cleared
//   2110        → degraded = true
//
// Thread layout:
//   sync worker   → the session, every store write, every cache write
//   IPC thread    → executeCommand(); reads the cache, enqueues work
//   caller thread → start(), stop(), status(), enqueueOrder(), bookTrade()
//
// Ownership:
//   SyncEngine
//    ├── cache_        (PositionCache, value member)
//    ├── reconciler_   (unique_ptr<EventReconciler>)
//    ├── router_       (unique_ptr<OrderRouter>)
//    ├── ipc_server_   (unique_ptr<IpcServer>, only while started)
//    └── worker_       (std::thread)
//   venue, store, bus and clock are non-owning references and must outlive
//   the engine.
// -----------------------------------------------------------------------------
class SyncEngine {
 public:
  static constexpr std::int64_t kQueueLogIntervalMs = 5000;

  SyncEngine(SyncConfig config, IVenueClient& venue, ILedgerStore& store,
             EventBus& bus, const ITimeProvider& clock);
  ~SyncEngine();

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;
  SyncEngine(SyncEngine&&) = delete;
  SyncEngine& operator=(SyncEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Starts the IPC server (when both endpoints are configured) and
  //         spawns the sync worker. No-op if already running.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Signals the worker, wakes any backoff sleep and joins. The
  //         worker flushes dirty cache state if a session is up. Then the
  //         IPC server is stopped. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  SyncStatus status() const;

  // Submits through the order router. timeout defaults to order_timeout_sec.
  domain::OrderResult enqueueOrder(
      const domain::OrderRequest& request,
      const std::optional<std::string>& idempotency_key = std::nullopt,
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // -------------------------------------------------------------------------
  // bookTrade(request, timeout)
  // -------------------------------------------------------------------------
  // @brief  Manual trade entry. Runs TradeBooker::book() on the sync worker
  //         so it never interleaves with venue events.
  //
  // @throws std::runtime_error "disconnected" when no session is up or the
  //         session ends first, "booking still queued" on timeout, and
  //         whatever TradeBooker::book() throws (std::invalid_argument for
  //         bad input).
  // -------------------------------------------------------------------------
  BookingResult bookTrade(BookingRequest request,
                          std::chrono::milliseconds timeout);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  IPC command handler. cmd is {"cmd": NAME, ...} or a bare NAME.
  //
  // @details
  //   PING      → {"status":"ok","response":"PONG"}
  //   STATUS    → SyncStatus fields
  //   POSITIONS → open positions
  //   HISTORY   → closed positions, newest first ("limit" optional)
  //   PNL       → account PnL rollup
  //   SUMMARY   → account valuation fields (null until reported)
  //   DAILY     → daily PnL series
  //   TRADES    → trade log, newest first ("symbol", "currency", "from_ms",
  //               "to_ms", "limit" optional)
  //   POSITION_TRADES → {"id": N}: trades of an open or archived position
  //               within its open/close window, oldest first ([] if unknown)
  //   ORDER     → {"order":{...}, "idempotency_key"?, "timeout_sec"?}
  //   BOOK      → {"trade":{...}}
  //   other     → {"status":"error","response":"Unknown command: ..."}
  //
  // Thread-safety: Safe to call from any thread.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  PositionCache& cache() { return cache_; }
  const PositionCache& cache() const { return cache_; }
  EventReconciler& reconciler() { return *reconciler_; }
  OrderRouter& router() { return *router_; }

  // min(current * 2, max); the first retry waits reconnect_min_sec.
  static std::chrono::milliseconds nextBackoff(std::chrono::milliseconds current,
                                               std::chrono::milliseconds max);

 private:
  struct BookingJob {
    BookingRequest request;
    std::shared_ptr<std::promise<BookingResult>> result;
  };

  void run();
  void connectSession();
  void runSession();
  void teardown(const std::string& reason);
  void tick(std::int64_t& last_keepalive_ms, std::int64_t& last_flush_ms,
            std::int64_t& last_queue_log_ms);
  void processBookings();
  void publishPnlIfChanged();
  bool sleepBackoff(std::chrono::milliseconds delay);

  void onConnectivityError(const ConnectivityErrorEvent& event);
  void setState(SyncState state);
  void recordError(const std::string& message);

  nlohmann::json handleOrderCommand(const nlohmann::json& request);
  nlohmann::json handleBookCommand(const nlohmann::json& request);
  nlohmann::json handleTradesCommand(const nlohmann::json& request);
  nlohmann::json handlePositionTradesCommand(const nlohmann::json& request);
  nlohmann::json statusJson() const;

  const SyncConfig config_;
  IVenueClient& venue_;
  ILedgerStore& store_;
  EventBus& bus_;
  const ITimeProvider& clock_;

  PositionCache cache_;
  std::unique_ptr<EventReconciler> reconciler_;
  std::unique_ptr<OrderRouter> router_;
  std::unique_ptr<IpcServer> ipc_server_;

  ThreadSafeQueue<BookingJob> bookings_;
  RequestIdGenerator manual_exec_ids_{"manual-"};
  std::vector<EventBus::SubscriptionId> subscriptions_;

  mutable std::mutex status_mutex_;
  SyncStatus status_;

  std::mutex wake_mutex_;
  std::condition_variable wake_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> running_{false};
  std::int64_t last_published_update_ms_{-1};
  std::thread worker_;
};

}  // namespace pnlsync
