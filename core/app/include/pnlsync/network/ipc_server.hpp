#pragma once

#include "pnlsync/cache/position_cache.hpp"
#include "pnlsync/concurrent/thread_safe_queue.hpp"
#include "pnlsync/domain/order.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <variant>

namespace pnlsync {

// What the PUB socket broadcasts: the account PnL whenever the cache moves,
// and every resolved order.
using Telemetry = std::variant<AccountPnLSnapshot, domain::OrderResult>;

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and telemetry surface
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that answers JSON commands on a REP socket
//         and broadcasts JSON telemetry on a PUB socket.
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (port 5556 by default):
//      Each request is handed to command_handler_ (bound to
//      SyncEngine::executeCommand()) and its JSON reply is sent back.
//      A handler that throws is answered with {"status":"error"}.
//      ZMQ_RCVTIMEO keeps the loop from blocking on an idle socket.
//
//   2. PUB socket (port 5557 by default):
//      Publishes one JSON message per Telemetry value:
//        {"type":"pnl",   "realized_pnl":..., "unrealized_pnl":..., ...}
//        {"type":"order", "request_id":..., "outcome":..., ...}
//      Values arrive through a ThreadSafeQueue so the sync worker never
//      waits on JSON encoding or socket I/O.
//
// Thread model:
//   start() and stop() from the owning thread (SyncEngine). pushTelemetry()
//   from any thread. command_handler_ runs on the IPC thread and must only
//   use thread-safe engine accessors.
//
// Ownership:
//   Owned by SyncEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Binds both sockets and spawns the worker. No-op if running.
  //
  // @throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // Signals the worker, joins it, publishes what is left and closes the
  // sockets. Idempotent.
  void stop();

  bool isRunning() const { return running_.load(); }

  void pushTelemetry(Telemetry telemetry);

  // JSON encodings of the PUB messages.
  static std::string formatTelemetry(const Telemetry& telemetry);
  static std::string formatAccountPnL(const AccountPnLSnapshot& pnl);
  static std::string formatOrderResult(const domain::OrderResult& result);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Telemetry> telemetry_queue_;

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace pnlsync
