// -----------------------------------------------------------------------------
// pnl_sync: single executable entry point.
//
//   pnl_sync [config.json]
//
//   1) Load SyncConfig from the given file (defaults when omitted), then
//      apply PNLSYNC_* environment overrides.
//   2) Build the collaborators: live clock, event bus, ledger store (JSON
//      file when store_path is set, in-memory otherwise) and the venue
//      client (ZeroMQ bridge, or the simulated venue for dry runs).
//   3) Start the SyncEngine: sync worker plus IPC server.
//   4) Wait on the main thread until SIGINT/SIGTERM, then stop cleanly.
//
// Thread layout:
//   main thread   → waits for shutdown
//   sync worker   → venue session, reconciliation, order placement
//   IPC thread    → REP commands and PUB telemetry
//
// No global state apart from the shutdown flag the signal handler sets.
// -----------------------------------------------------------------------------

#include "pnlsync/config/sync_config.hpp"
#include "pnlsync/engine/sync_engine.hpp"
#include "pnlsync/eventbus/event_bus.hpp"
#include "pnlsync/gateway/zmq_venue_client.hpp"
#include "pnlsync/storage/file_ledger_store.hpp"
#include "pnlsync/storage/memory_ledger_store.hpp"
#include "pnlsync/time/live_time_provider.hpp"
#include "pnlsync/venue/simulated_venue.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

// Set from the signal handler, polled by main(). sig_atomic_t keeps the
// write async-signal-safe.
static volatile std::sig_atomic_t g_shutdown = 0;

static void shutdown_handler(int /*signum*/) { g_shutdown = 1; }

int main(int argc, char** argv) {
  // -------------------------------------------------------------------------
  // 1) Configuration.
  // -------------------------------------------------------------------------
  pnlsync::SyncConfig config;
  try {
    if (argc > 1) {
      config = pnlsync::loadSyncConfig(argv[1]);
    }
    pnlsync::applyEnvOverrides(config);
  } catch (const pnlsync::ConfigError& e) {
    std::cerr << "[main] Configuration error: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 2) Collaborators. All stack-local; the engine holds references.
  // -------------------------------------------------------------------------
  pnlsync::LiveTimeProvider clock;
  pnlsync::EventBus bus;

  std::unique_ptr<pnlsync::ILedgerStore> store;
  try {
    if (config.store_path.empty()) {
      store = std::make_unique<pnlsync::MemoryLedgerStore>();
      std::cout << "[main] Using in-memory ledger store\n";
    } else {
      store = std::make_unique<pnlsync::FileLedgerStore>(config.store_path);
      std::cout << "[main] Using ledger file " << config.store_path << "\n";
    }
  } catch (const pnlsync::StoreError& e) {
    std::cerr << "[main] Cannot open ledger store: " << e.what() << "\n";
    return 1;
  }

  std::unique_ptr<pnlsync::IVenueClient> venue;
  if (config.venue.mode == "simulated") {
    venue = std::make_unique<pnlsync::SimulatedVenue>(bus, clock);
    std::cout << "[main] Venue: simulated\n";
  } else {
    pnlsync::VenueEndpoints endpoints;
    endpoints.command_endpoint = config.venue.command_endpoint;
    endpoints.event_endpoint = config.venue.event_endpoint;
    endpoints.request_timeout_ms = config.venue.request_timeout_ms;
    venue = std::make_unique<pnlsync::ZmqVenueClient>(bus, endpoints);
    std::cout << "[main] Venue: bridge at " << endpoints.command_endpoint
              << "\n";
  }

  // -------------------------------------------------------------------------
  // 3) Engine.
  // -------------------------------------------------------------------------
  pnlsync::SyncEngine engine(config, *venue, *store, bus, clock);

  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Cannot start IPC server: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Wait for shutdown.
  // -------------------------------------------------------------------------
  while (g_shutdown == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "\n[main] Shutdown requested.\n";
  engine.stop();

  const auto status = engine.status();
  std::cout << "[main] Final state: " << pnlsync::syncStateToString(status.state)
            << ", open positions: " << engine.cache().snapshotPositions().size()
            << "\n";
  return 0;
}
