#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace pnlsync {
namespace domain {

// -----------------------------------------------------------------------------
// AccountField: the fixed set of account valuation fields
// -----------------------------------------------------------------------------
//
// @brief  Slots of the account summary. Enum values index
//         AccountSummary::values directly.
//
// @details
// Venue tag → field:
//   NetLiquidation      → NetLiquidation
//   TotalCashValue      → TotalCashValue
//   AvailableFunds      → AvailableFunds
//   ExcessLiquidity     → ExcessLiquidity
//   InitMarginReq       → InitMarginReq
//   MaintMarginReq      → MaintMarginReq
//   GrossPositionValue  → GrossPositionValue
//   ShortMarketValue    → ShortMarketValue
//
// accountFieldName() gives the snake_case column / JSON name.
// -----------------------------------------------------------------------------
enum class AccountField : std::size_t {
  NetLiquidation = 0,
  TotalCashValue,
  AvailableFunds,
  ExcessLiquidity,
  InitMarginReq,
  MaintMarginReq,
  GrossPositionValue,
  ShortMarketValue,
};

constexpr std::size_t kAccountFieldCount = 8;

constexpr std::array<AccountField, kAccountFieldCount> kAllAccountFields = {
    AccountField::NetLiquidation,  AccountField::TotalCashValue,
    AccountField::AvailableFunds,  AccountField::ExcessLiquidity,
    AccountField::InitMarginReq,   AccountField::MaintMarginReq,
    AccountField::GrossPositionValue, AccountField::ShortMarketValue,
};

inline const char* accountFieldName(AccountField f) {
  switch (f) {
    case AccountField::NetLiquidation:     return "net_liquidation";
    case AccountField::TotalCashValue:     return "total_cash_value";
    case AccountField::AvailableFunds:     return "available_funds";
    case AccountField::ExcessLiquidity:    return "excess_liquidity";
    case AccountField::InitMarginReq:      return "init_margin_req";
    case AccountField::MaintMarginReq:     return "maint_margin_req";
    case AccountField::GrossPositionValue: return "gross_position_value";
    case AccountField::ShortMarketValue:   return "short_market_value";
  }
  return "unknown";
}

// Venue tag (e.g. "NetLiquidation") → field. Unknown tags yield nullopt.
inline std::optional<AccountField> accountFieldFromVenueTag(
    const std::string& tag) {
  if (tag == "NetLiquidation")     return AccountField::NetLiquidation;
  if (tag == "TotalCashValue")     return AccountField::TotalCashValue;
  if (tag == "AvailableFunds")     return AccountField::AvailableFunds;
  if (tag == "ExcessLiquidity")    return AccountField::ExcessLiquidity;
  if (tag == "InitMarginReq")      return AccountField::InitMarginReq;
  if (tag == "MaintMarginReq")     return AccountField::MaintMarginReq;
  if (tag == "GrossPositionValue") return AccountField::GrossPositionValue;
  if (tag == "ShortMarketValue")   return AccountField::ShortMarketValue;
  return std::nullopt;
}

// The venue tags the summary subscription asks for, in field order.
inline const char* accountFieldVenueTag(AccountField f) {
  switch (f) {
    case AccountField::NetLiquidation:     return "NetLiquidation";
    case AccountField::TotalCashValue:     return "TotalCashValue";
    case AccountField::AvailableFunds:     return "AvailableFunds";
    case AccountField::ExcessLiquidity:    return "ExcessLiquidity";
    case AccountField::InitMarginReq:      return "InitMarginReq";
    case AccountField::MaintMarginReq:     return "MaintMarginReq";
    case AccountField::GrossPositionValue: return "GrossPositionValue";
    case AccountField::ShortMarketValue:   return "ShortMarketValue";
  }
  return "";
}

// -----------------------------------------------------------------------------
// AccountSummary
// -----------------------------------------------------------------------------
// Field-by-field account valuation. A slot stays std::nullopt until the
// venue reports it. as_of_ms is the time of the most recent field update.
// -----------------------------------------------------------------------------
struct AccountSummary {
  std::array<std::optional<double>, kAccountFieldCount> values{};
  std::int64_t as_of_ms{0};

  std::optional<double>& operator[](AccountField f) {
    return values[static_cast<std::size_t>(f)];
  }
  const std::optional<double>& operator[](AccountField f) const {
    return values[static_cast<std::size_t>(f)];
  }
};

}  // namespace domain
}  // namespace pnlsync
