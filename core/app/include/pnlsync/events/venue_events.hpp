#pragma once

#include "pnlsync/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace pnlsync {

// -----------------------------------------------------------------------------
// Venue event payloads
// -----------------------------------------------------------------------------
//
// @brief  One plain struct per kind of callback the trading venue produces.
//
// @details
// Venue bindings deliver the same logical event in several shapes (a single
// object, or a positional argument list). Whatever binding is in use, it
// normalizes at the boundary into exactly one of these structs before the
// event reaches the reconciler. Nothing downstream knows how the event was
// decoded.
//
// Numeric fields that the venue may leave unset or fill with garbage are
// std::optional<double>; the reconciler drops events whose required values
// are missing or non-finite. Account valuation values arrive as text on the
// wire and are kept as text here for the same reason.
//
// Timestamps are epoch milliseconds (UTC).
// -----------------------------------------------------------------------------

// A fill. side is the raw venue spelling ("BOT", "SLD", ...).
struct ExecutionEvent {
  std::string exec_id;
  std::string account;
  std::string symbol;
  std::string exchange;
  std::string currency;
  std::string side;
  double shares{0.0};
  double price{0.0};
  std::int64_t time_ms{0};
  std::optional<std::int64_t> perm_id;
  std::optional<std::int64_t> con_id;
};

// Commission and venue-computed realized PnL for one execution. May arrive
// before or after the execution it refers to.
struct CommissionReportEvent {
  std::string exec_id;
  std::optional<double> commission;
  std::optional<double> realized_pnl;
  std::string currency;
};

// Venue-authoritative quantity / average cost for one contract. quantity 0
// means the position is closed.
struct PositionSnapshotEvent {
  std::string account;
  std::string symbol;
  std::string exchange;
  std::string currency;
  double quantity{0.0};
  double avg_cost{0.0};
  std::optional<std::int64_t> con_id;
};

// One account summary tag ("NetLiquidation" = "123456.78", currency "USD").
struct AccountValuationEvent {
  std::string account;
  std::string tag;
  std::string value;
  std::string currency;
};

// Account-level live PnL.
struct AccountPnLEvent {
  std::string account;
  std::optional<double> daily_pnl;
  std::optional<double> unrealized_pnl;
  std::optional<double> realized_pnl;
};

// Per-position live PnL, keyed by the contract id the subscription was made
// for.
struct PositionPnLEvent {
  std::int64_t con_id{0};
  std::optional<double> daily_pnl;
  std::optional<double> unrealized_pnl;
  std::optional<double> realized_pnl;
};

// Venue-side error or connectivity notice. code 1100 = connectivity lost,
// 1101/1102 = restored, 2110 = venue-to-server connectivity degraded.
struct ConnectivityErrorEvent {
  std::int64_t request_id{-1};
  int code{0};
  std::string message;
};

// Status update for a placed order.
struct OrderStatusEvent {
  domain::OrderId order_id{0};
  std::string status;
  double filled{0.0};
  double remaining{0.0};
  double avg_fill_price{0.0};
};

}  // namespace pnlsync
