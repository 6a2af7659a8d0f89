#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace pnlsync {

// Thrown by the loader for unreadable files, malformed JSON and values that
// fail validation.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// SyncConfig: every tunable of the service
// -----------------------------------------------------------------------------
//
// @brief  Plain value type. Defaults are the production defaults; a config
//         file only needs the keys it changes.
//
// @details
// JSON layout (all keys optional):
//
//   {
//     "account": "",                  // "" → first managed account
//     "base_currency": "USD",
//     "readonly": false,
//     "venue": {
//       "mode": "zmq",                // "zmq" | "simulated"
//       "command_endpoint": "tcp://127.0.0.1:7497",
//       "event_endpoint": "tcp://127.0.0.1:7498",
//       "request_timeout_ms": 5000
//     },
//     "order_queue_max": 50,
//     "order_timeout_sec": 8,
//     "order_status_wait_ms": 1000,
//     "reconnect_min_sec": 3,
//     "reconnect_max_sec": 60,
//     "keepalive_sec": 15,
//     "cache_flush_sec": 30,
//     "tick_ms": 1000,
//     "store_path": "",               // "" → in-memory store
//     "ipc": {
//       "command_endpoint": "tcp://127.0.0.1:5556",
//       "pub_endpoint": "tcp://127.0.0.1:5557"
//     }
//   }
//
// Empty ipc endpoints disable the IPC server.
// -----------------------------------------------------------------------------
struct VenueSettings {
  std::string mode{"zmq"};
  std::string command_endpoint{"tcp://127.0.0.1:7497"};
  std::string event_endpoint{"tcp://127.0.0.1:7498"};
  int request_timeout_ms{5000};
};

struct IpcSettings {
  std::string command_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
};

struct SyncConfig {
  std::string account;
  std::string base_currency{"USD"};
  bool readonly{false};
  VenueSettings venue;
  std::size_t order_queue_max{50};
  int order_timeout_sec{8};
  int order_status_wait_ms{1000};
  int reconnect_min_sec{3};
  int reconnect_max_sec{60};
  int keepalive_sec{15};
  int cache_flush_sec{30};
  int tick_ms{1000};
  std::string store_path;
  IpcSettings ipc;
};

// -----------------------------------------------------------------------------
// parseSyncConfig(j) / loadSyncConfig(path)
// -----------------------------------------------------------------------------
// @brief  Builds a SyncConfig from a JSON object, starting from defaults.
//
// @throws ConfigError on a missing or unreadable file, malformed JSON, a
//         key of the wrong type, or a value rejected by validateSyncConfig().
// -----------------------------------------------------------------------------
SyncConfig parseSyncConfig(const nlohmann::json& j);
SyncConfig loadSyncConfig(const std::string& path);

// -----------------------------------------------------------------------------
// applyEnvOverrides(config, lookup)
// -----------------------------------------------------------------------------
// @brief  Overrides from the environment, applied after the file:
//
//   PNLSYNC_ACCOUNT        account
//   PNLSYNC_BASE_CURRENCY  base_currency
//   PNLSYNC_READONLY       readonly ("1", "true", "yes" are true)
//   PNLSYNC_STORE_PATH     store_path
//   PNLSYNC_VENUE_MODE     venue.mode
//
// lookup defaults to std::getenv; tests pass their own table.
// Revalidates afterwards; throws ConfigError.
// -----------------------------------------------------------------------------
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

void applyEnvOverrides(SyncConfig& config);
void applyEnvOverrides(SyncConfig& config, const EnvLookup& lookup);

// Range checks shared by the loader and the env overrides.
void validateSyncConfig(const SyncConfig& config);

}  // namespace pnlsync
