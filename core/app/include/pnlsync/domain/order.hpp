#pragma once

#include "pnlsync/domain/trade_record.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace pnlsync {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Venue-assigned order identifier, reported back once the order is placed.
// A strong alias keeps signatures self-documenting.
// -----------------------------------------------------------------------------
using OrderId = std::int64_t;

// -----------------------------------------------------------------------------
// OrderType
// -----------------------------------------------------------------------------
// Only the two order types the router knows how to build. Anything else is
// rejected before it reaches the queue.
// -----------------------------------------------------------------------------
enum class OrderType {
  Market,
  Limit,
};

inline const char* orderTypeToString(OrderType t) {
  switch (t) {
    case OrderType::Market: return "MKT";
    case OrderType::Limit:  return "LMT";
  }
  return "UNKNOWN";
}

// "MKT"/"MARKET" → Market, "LMT"/"LIMIT" → Limit (case-insensitive).
inline std::optional<OrderType> parseOrderType(std::string raw) {
  for (auto& c : raw) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  if (raw == "MKT" || raw == "MARKET") {
    return OrderType::Market;
  }
  if (raw == "LMT" || raw == "LIMIT") {
    return OrderType::Limit;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// OrderRequest
// -----------------------------------------------------------------------------
//
// @brief  A caller's intent to trade, as accepted by the order router.
//
// @details
// exchange and currency may be left empty; the router fills in "SMART" and
// the account's base currency when it qualifies the contract.
//
// Value type. Copied into the bounded order queue; the caller's copy is
// never touched again.
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string symbol;
  Side side{Side::Buy};
  double quantity{0.0};
  OrderType type{OrderType::Market};
  std::optional<double> limit_price;
  std::string exchange;
  std::string currency;
  std::string time_in_force{"DAY"};
  std::string account;
};

// -----------------------------------------------------------------------------
// validateOrder(request)
// -----------------------------------------------------------------------------
// @brief  Price/quantity checks applied before an order is queued.
//
// @return std::nullopt if the request is acceptable, otherwise a
//         human-readable reason.
// -----------------------------------------------------------------------------
inline std::optional<std::string> validateOrder(const OrderRequest& request) {
  if (request.symbol.empty()) {
    return std::string("symbol is required");
  }
  if (!std::isfinite(request.quantity) || request.quantity <= 0.0) {
    return std::string("quantity must be positive");
  }
  if (request.limit_price.has_value() &&
      (!std::isfinite(*request.limit_price) || *request.limit_price <= 0.0)) {
    return std::string("price must be positive");
  }
  if (request.type == OrderType::Limit && !request.limit_price.has_value()) {
    return std::string("limit order requires price");
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// OrderFill: initial status reported by the venue after placement
// -----------------------------------------------------------------------------
struct OrderFill {
  OrderId order_id{0};
  std::string status;           // Venue status string, e.g. "Submitted"
  double filled{0.0};
  double remaining{0.0};
  double avg_fill_price{0.0};
};

// -----------------------------------------------------------------------------
// OrderOutcome / OrderResult
// -----------------------------------------------------------------------------
//
// @brief  What enqueueOrder() hands back to the caller.
//
// @details
//   Success  → the venue accepted the order; fill holds its initial status.
//   Pending  → the caller's wait timed out while the request was still in
//              the queue. The request is NOT abandoned; it will be
//              processed and its final result recorded under request_id.
//   Failure  → rejected (validation, read-only, disconnected, queue full,
//              unqualifiable contract, venue error). error says why.
// -----------------------------------------------------------------------------
enum class OrderOutcome {
  Success,
  Pending,
  Failure,
};

inline const char* orderOutcomeToString(OrderOutcome o) {
  switch (o) {
    case OrderOutcome::Success: return "success";
    case OrderOutcome::Pending: return "pending";
    case OrderOutcome::Failure: return "failure";
  }
  return "unknown";
}

struct OrderResult {
  OrderOutcome outcome{OrderOutcome::Failure};
  std::string request_id;
  std::string error;
  std::optional<OrderFill> fill;

  static OrderResult failure(std::string request_id, std::string error) {
    OrderResult r;
    r.outcome = OrderOutcome::Failure;
    r.request_id = std::move(request_id);
    r.error = std::move(error);
    return r;
  }
};

}  // namespace domain
}  // namespace pnlsync
