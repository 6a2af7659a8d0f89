#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <tuple>

namespace pnlsync {
namespace domain {

// -----------------------------------------------------------------------------
// PositionKey: identity of an open position
// -----------------------------------------------------------------------------
//
// @brief  (symbol, exchange, currency) triple. At most one open position
//         exists per key at any point in time.
//
// @details
// exchange may be empty, meaning "unspecified / primary listing". Two keys
// that differ only in exchange are distinct positions: a holding routed via
// an alternative venue is reported under its own label until the
// reconciler resolves it to the primary one.
//
// Value type; cheap enough to copy into events and snapshots.
// -----------------------------------------------------------------------------
struct PositionKey {
  std::string symbol;
  std::string exchange;
  std::string currency;

  bool operator==(const PositionKey& other) const {
    return symbol == other.symbol && exchange == other.exchange &&
           currency == other.currency;
  }

  bool operator!=(const PositionKey& other) const { return !(*this == other); }

  // Lexicographic (symbol, exchange, currency). Snapshot ordering relies on
  // symbol being compared first.
  bool operator<(const PositionKey& other) const {
    return std::tie(symbol, exchange, currency) <
           std::tie(other.symbol, other.exchange, other.currency);
  }

  // "AAPL@NASDAQ/USD", or "AAPL/USD" when exchange is empty. Logging only.
  std::string toString() const {
    std::string out = symbol;
    if (!exchange.empty()) {
      out += "@" + exchange;
    }
    out += "/" + currency;
    return out;
  }
};

// Hash functor so PositionKey can key std::unordered_map.
struct PositionKeyHash {
  std::size_t operator()(const PositionKey& key) const {
    std::size_t h = std::hash<std::string>{}(key.symbol);
    h ^= std::hash<std::string>{}(key.exchange) + 0x9e3779b97f4a7c15ULL +
         (h << 6) + (h >> 2);
    h ^= std::hash<std::string>{}(key.currency) + 0x9e3779b97f4a7c15ULL +
         (h << 6) + (h >> 2);
    return h;
  }
};

}  // namespace domain
}  // namespace pnlsync
