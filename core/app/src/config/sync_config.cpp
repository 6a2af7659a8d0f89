#include "pnlsync/config/sync_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>

namespace pnlsync {

namespace {

using nlohmann::json;

template <typename T>
void readOptional(const json& j, const char* name, T& target) {
  auto it = j.find(name);
  if (it != j.end() && !it->is_null()) {
    target = it->get<T>();
  }
}

bool parseBool(std::string raw) {
  std::transform(raw.begin(), raw.end(), raw.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return raw == "1" || raw == "true" || raw == "yes";
}

}  // namespace

// -----------------------------------------------------------------------------
// parseSyncConfig()
// -----------------------------------------------------------------------------
SyncConfig parseSyncConfig(const json& j) {
  if (!j.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  SyncConfig config;
  try {
    readOptional(j, "account", config.account);
    readOptional(j, "base_currency", config.base_currency);
    readOptional(j, "readonly", config.readonly);

    if (auto venue = j.find("venue"); venue != j.end() && venue->is_object()) {
      readOptional(*venue, "mode", config.venue.mode);
      readOptional(*venue, "command_endpoint", config.venue.command_endpoint);
      readOptional(*venue, "event_endpoint", config.venue.event_endpoint);
      readOptional(*venue, "request_timeout_ms", config.venue.request_timeout_ms);
    }

    readOptional(j, "order_queue_max", config.order_queue_max);
    readOptional(j, "order_timeout_sec", config.order_timeout_sec);
    readOptional(j, "order_status_wait_ms", config.order_status_wait_ms);
    readOptional(j, "reconnect_min_sec", config.reconnect_min_sec);
    readOptional(j, "reconnect_max_sec", config.reconnect_max_sec);
    readOptional(j, "keepalive_sec", config.keepalive_sec);
    readOptional(j, "cache_flush_sec", config.cache_flush_sec);
    readOptional(j, "tick_ms", config.tick_ms);
    readOptional(j, "store_path", config.store_path);

    if (auto ipc = j.find("ipc"); ipc != j.end() && ipc->is_object()) {
      readOptional(*ipc, "command_endpoint", config.ipc.command_endpoint);
      readOptional(*ipc, "pub_endpoint", config.ipc.pub_endpoint);
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("invalid config value: ") + e.what());
  }

  validateSyncConfig(config);
  return config;
}

// -----------------------------------------------------------------------------
// loadSyncConfig()
// -----------------------------------------------------------------------------
SyncConfig loadSyncConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }
  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw ConfigError("malformed config " + path + ": " + e.what());
  }
  SyncConfig config = parseSyncConfig(j);
  std::cout << "[SyncConfig] Loaded " << path << "\n";
  return config;
}

// -----------------------------------------------------------------------------
// applyEnvOverrides()
// -----------------------------------------------------------------------------
void applyEnvOverrides(SyncConfig& config) {
  applyEnvOverrides(config, [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  });
}

void applyEnvOverrides(SyncConfig& config, const EnvLookup& lookup) {
  if (auto v = lookup("PNLSYNC_ACCOUNT")) {
    config.account = *v;
  }
  if (auto v = lookup("PNLSYNC_BASE_CURRENCY")) {
    config.base_currency = *v;
  }
  if (auto v = lookup("PNLSYNC_READONLY")) {
    config.readonly = parseBool(*v);
  }
  if (auto v = lookup("PNLSYNC_STORE_PATH")) {
    config.store_path = *v;
  }
  if (auto v = lookup("PNLSYNC_VENUE_MODE")) {
    config.venue.mode = *v;
  }
  validateSyncConfig(config);
}

// -----------------------------------------------------------------------------
// validateSyncConfig()
// -----------------------------------------------------------------------------
void validateSyncConfig(const SyncConfig& config) {
  if (config.base_currency.empty()) {
    throw ConfigError("base_currency must not be empty");
  }
  if (config.venue.mode != "zmq" && config.venue.mode != "simulated") {
    throw ConfigError("venue.mode must be \"zmq\" or \"simulated\", got \"" +
                      config.venue.mode + "\"");
  }
  if (config.venue.mode == "zmq" && (config.venue.command_endpoint.empty() ||
                                     config.venue.event_endpoint.empty())) {
    throw ConfigError("venue endpoints are required in zmq mode");
  }
  if (config.venue.request_timeout_ms <= 0) {
    throw ConfigError("venue.request_timeout_ms must be positive");
  }
  if (config.order_queue_max == 0) {
    throw ConfigError("order_queue_max must be positive");
  }
  if (config.order_timeout_sec <= 0 || config.order_status_wait_ms < 0) {
    throw ConfigError("order timeouts must be positive");
  }
  if (config.reconnect_min_sec <= 0 ||
      config.reconnect_max_sec < config.reconnect_min_sec) {
    throw ConfigError("reconnect_min_sec must be positive and not above "
                      "reconnect_max_sec");
  }
  if (config.keepalive_sec <= 0 || config.cache_flush_sec <= 0 ||
      config.tick_ms <= 0) {
    throw ConfigError("keepalive_sec, cache_flush_sec and tick_ms must be "
                      "positive");
  }
  if (config.ipc.command_endpoint.empty() != config.ipc.pub_endpoint.empty()) {
    throw ConfigError("ipc endpoints must both be set or both be empty");
  }
}

}  // namespace pnlsync
