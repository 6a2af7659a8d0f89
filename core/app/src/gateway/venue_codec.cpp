#include "pnlsync/gateway/venue_codec.hpp"

#include <iostream>
#include <limits>
#include <stdexcept>

namespace pnlsync {

namespace {

using nlohmann::json;

// Missing, null, unparseable or DBL_MAX → std::nullopt.
std::optional<double> optionalNumber(const json& j, const char* name) {
  auto it = j.find(name);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  double value = 0.0;
  if (it->is_number()) {
    value = it->get<double>();
  } else if (it->is_string()) {
    try {
      value = std::stod(it->get<std::string>());
    } catch (const std::invalid_argument&) {
      return std::nullopt;
    } catch (const std::out_of_range&) {
      return std::nullopt;
    }
  } else {
    return std::nullopt;
  }
  if (value == std::numeric_limits<double>::max()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::int64_t> optionalInteger(const json& j, const char* name) {
  auto it = j.find(name);
  if (it == j.end() || it->is_null()) {
    return std::nullopt;
  }
  if (it->is_number_integer()) {
    return it->get<std::int64_t>();
  }
  if (it->is_string()) {
    try {
      return std::stoll(it->get<std::string>());
    } catch (const std::invalid_argument&) {
      return std::nullopt;
    } catch (const std::out_of_range&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

double requiredNumber(const json& j, const char* name) {
  auto value = optionalNumber(j, name);
  if (!value.has_value()) {
    throw std::invalid_argument(std::string("missing numeric field '") + name +
                                "'");
  }
  return *value;
}

std::string stringOr(const json& j, const char* name,
                     const std::string& fallback = "") {
  auto it = j.find(name);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  return it->get<std::string>();
}

AccountValuationEvent decodeAccountValuation(const json& j) {
  AccountValuationEvent e;
  e.account = stringOr(j, "account");
  e.tag = j.at("tag").get<std::string>();
  const json& value = j.at("value");
  e.value = value.is_string() ? value.get<std::string>() : value.dump();
  e.currency = stringOr(j, "currency");
  return e;
}

AccountPnLEvent decodeAccountPnL(const json& j) {
  AccountPnLEvent e;
  e.account = stringOr(j, "account");
  e.daily_pnl = optionalNumber(j, "daily_pnl");
  e.unrealized_pnl = optionalNumber(j, "unrealized_pnl");
  e.realized_pnl = optionalNumber(j, "realized_pnl");
  return e;
}

PositionPnLEvent decodePositionPnL(const json& j) {
  PositionPnLEvent e;
  e.con_id = j.at("con_id").get<std::int64_t>();
  e.daily_pnl = optionalNumber(j, "daily_pnl");
  e.unrealized_pnl = optionalNumber(j, "unrealized_pnl");
  e.realized_pnl = optionalNumber(j, "realized_pnl");
  return e;
}

ConnectivityErrorEvent decodeConnectivityError(const json& j) {
  ConnectivityErrorEvent e;
  e.request_id = optionalInteger(j, "request_id").value_or(-1);
  e.code = j.at("code").get<int>();
  e.message = stringOr(j, "message");
  return e;
}

OrderStatusEvent decodeOrderStatus(const json& j) {
  OrderStatusEvent e;
  e.order_id = j.at("order_id").get<domain::OrderId>();
  e.status = j.at("status").get<std::string>();
  e.filled = optionalNumber(j, "filled").value_or(0.0);
  e.remaining = optionalNumber(j, "remaining").value_or(0.0);
  e.avg_fill_price = optionalNumber(j, "avg_fill_price").value_or(0.0);
  return e;
}

}  // namespace

// -----------------------------------------------------------------------------
// Struct decoders
// -----------------------------------------------------------------------------
ExecutionEvent decodeExecution(const json& j) {
  ExecutionEvent e;
  e.exec_id = j.at("exec_id").get<std::string>();
  e.account = stringOr(j, "account");
  e.symbol = j.at("symbol").get<std::string>();
  e.exchange = stringOr(j, "exchange");
  e.currency = j.at("currency").get<std::string>();
  e.side = j.at("side").get<std::string>();
  e.shares = requiredNumber(j, "shares");
  e.price = requiredNumber(j, "price");
  e.time_ms = j.at("time_ms").get<std::int64_t>();
  e.perm_id = optionalInteger(j, "perm_id");
  e.con_id = optionalInteger(j, "con_id");
  return e;
}

CommissionReportEvent decodeCommissionReport(const json& j) {
  CommissionReportEvent e;
  e.exec_id = j.at("exec_id").get<std::string>();
  e.commission = optionalNumber(j, "commission");
  e.realized_pnl = optionalNumber(j, "realized_pnl");
  e.currency = stringOr(j, "currency");
  return e;
}

PositionSnapshotEvent decodePositionSnapshot(const json& j) {
  PositionSnapshotEvent e;
  e.account = stringOr(j, "account");
  e.symbol = j.at("symbol").get<std::string>();
  e.exchange = stringOr(j, "exchange");
  e.currency = j.at("currency").get<std::string>();
  e.quantity = requiredNumber(j, "quantity");
  e.avg_cost = optionalNumber(j, "avg_cost").value_or(0.0);
  e.con_id = optionalInteger(j, "con_id");
  return e;
}

ExecutionFill decodeExecutionFill(const json& j) {
  ExecutionFill fill;
  fill.execution = decodeExecution(j.at("execution"));
  auto report = j.find("commission_report");
  if (report != j.end() && !report->is_null()) {
    fill.commission = decodeCommissionReport(*report);
  }
  return fill;
}

QualifiedContract decodeQualifiedContract(const json& j) {
  QualifiedContract c;
  c.con_id = j.at("con_id").get<std::int64_t>();
  c.symbol = j.at("symbol").get<std::string>();
  c.exchange = stringOr(j, "exchange");
  c.primary_exchange = stringOr(j, "primary_exchange");
  c.currency = j.at("currency").get<std::string>();
  return c;
}

// -----------------------------------------------------------------------------
// decodeVenueEvent(): the streaming entry point
// -----------------------------------------------------------------------------
std::optional<VenueEvent> decodeVenueEvent(const std::string& payload) {
  try {
    const json j = json::parse(payload);
    const std::string type = j.at("type").get<std::string>();

    if (type == "execution")         return VenueEvent{decodeExecution(j)};
    if (type == "commission_report") return VenueEvent{decodeCommissionReport(j)};
    if (type == "position")          return VenueEvent{decodePositionSnapshot(j)};
    if (type == "account_value")     return VenueEvent{decodeAccountValuation(j)};
    if (type == "account_pnl")       return VenueEvent{decodeAccountPnL(j)};
    if (type == "position_pnl")      return VenueEvent{decodePositionPnL(j)};
    if (type == "error")             return VenueEvent{decodeConnectivityError(j)};
    if (type == "order_status")      return VenueEvent{decodeOrderStatus(j)};

    std::cerr << "[VenueCodec] Unknown message type '" << type
              << "', dropped\n";
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[VenueCodec] Malformed message: " << e.what()
              << " payload: " << payload << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[VenueCodec] Malformed message: " << e.what()
              << " payload: " << payload << "\n";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Encoders
// -----------------------------------------------------------------------------
json encodeVenueRequest(const std::string& command, json args) {
  return json{{"cmd", command}, {"args", std::move(args)}};
}

json encodeContractSpec(const ContractSpec& spec) {
  return json{{"symbol", spec.symbol},
              {"exchange", spec.exchange},
              {"currency", spec.currency},
              {"sec_type", spec.sec_type}};
}

json encodeVenueOrder(const QualifiedContract& contract,
                      const VenueOrder& order) {
  json j;
  j["contract"] = json{{"con_id", contract.con_id},
                       {"symbol", contract.symbol},
                       {"exchange", contract.exchange},
                       {"currency", contract.currency}};
  j["action"] = order.action;
  j["quantity"] = order.quantity;
  j["order_type"] = domain::orderTypeToString(order.type);
  if (order.limit_price.has_value()) {
    j["limit_price"] = *order.limit_price;
  } else {
    j["limit_price"] = nullptr;
  }
  j["tif"] = order.time_in_force;
  if (!order.account.empty()) {
    j["account"] = order.account;
  }
  return j;
}

}  // namespace pnlsync
