#pragma once

#include "pnlsync/domain/position_key.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

namespace pnlsync {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Direction of a trade or order. The venue spells these several ways
// (BOT/SLD on executions, BUY/SELL on orders); parseSide() folds them.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

inline const char* sideToString(Side s) {
  switch (s) {
    case Side::Buy:  return "buy";
    case Side::Sell: return "sell";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// parseSide(raw)
// -----------------------------------------------------------------------------
// @brief  Case-insensitive mapping of venue side spellings.
//
// @return Side::Buy for "BOT", "BUY", "B"; Side::Sell for "SLD", "SELL",
//         "S"; std::nullopt for anything else.
// -----------------------------------------------------------------------------
inline std::optional<Side> parseSide(std::string raw) {
  std::transform(raw.begin(), raw.end(), raw.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  if (raw == "BOT" || raw == "BUY" || raw == "B") {
    return Side::Buy;
  }
  if (raw == "SLD" || raw == "SELL" || raw == "S") {
    return Side::Sell;
  }
  return std::nullopt;
}

// Signed trade quantity: positive for buys, negative for sells.
inline double signedQuantity(Side side, double quantity) {
  return side == Side::Buy ? quantity : -quantity;
}

// -----------------------------------------------------------------------------
// TradeRecord: one row of the append-only trade log
// -----------------------------------------------------------------------------
//
// @brief  One execution (or one leg of a flip) as written to the ledger
//         store.
//
// @details
// exec_id is unique across the log; the store rejects a second insert with
// the same value, which is what makes execution replay idempotent. Flip
// legs carry "<exec_id>-close" and "<exec_id>-open".
//
// quantity is unsigned; side carries the direction.
//
// commission and realized_pnl may be back-filled exactly once when the
// venue's commission report arrives after the row exists. Nothing else is
// ever mutated.
// -----------------------------------------------------------------------------
struct TradeRecord {
  std::int64_t id{0};           // Store-assigned row id (0 before insert)
  std::int64_t account_id{0};
  PositionKey key;
  Side side{Side::Buy};
  double quantity{0.0};
  double price{0.0};
  double commission{0.0};
  double realized_pnl{0.0};
  std::int64_t trade_time_ms{0};
  std::string exec_id;
  std::optional<std::int64_t> perm_id;
};

}  // namespace domain
}  // namespace pnlsync
