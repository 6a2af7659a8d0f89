#pragma once

#include "pnlsync/events/event.hpp"
#include "pnlsync/venue/i_venue_client.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace pnlsync {

// -----------------------------------------------------------------------------
// venue_codec: JSON wire format of the venue bridge
// -----------------------------------------------------------------------------
//
// @brief  Free functions translating between bridge JSON messages and the
//         typed venue structs.
//
// @details
// Streaming messages (SUB socket) carry a "type" discriminator matching
// venueEventName():
//
//   {"type": "execution", "exec_id": "0001f4e8.65a1.01.01", "account": "U123",
//    "symbol": "AAPL", "exchange": "NASDAQ", "currency": "USD",
//    "side": "BOT", "shares": 100, "price": 187.5, "time_ms": 1700000000000,
//    "perm_id": 12345, "con_id": 265598}
//
// Numeric fields may arrive as JSON numbers, numeric strings or null. The
// bridge forwards the venue's "unset" sentinel (DBL_MAX) unchanged; it
// decodes to std::nullopt like null does.
//
// Commands (REQ socket) are {"cmd": "<name>", "args": {...}}; replies are
// {"ok": true, "result": ...} or {"ok": false, "error": "..."}.
//
// Error model:
//   decodeVenueEvent() never throws: malformed payloads and unknown types
//   are logged to std::cerr and yield std::nullopt. The struct decoders
//   throw nlohmann::json::exception on a missing or mistyped field, for the
//   caller to map onto its own error.
// -----------------------------------------------------------------------------

std::optional<VenueEvent> decodeVenueEvent(const std::string& payload);

nlohmann::json encodeVenueRequest(const std::string& command,
                                  nlohmann::json args = nlohmann::json::object());

nlohmann::json encodeContractSpec(const ContractSpec& spec);
QualifiedContract decodeQualifiedContract(const nlohmann::json& j);

nlohmann::json encodeVenueOrder(const QualifiedContract& contract,
                                const VenueOrder& order);

ExecutionEvent decodeExecution(const nlohmann::json& j);
CommissionReportEvent decodeCommissionReport(const nlohmann::json& j);
PositionSnapshotEvent decodePositionSnapshot(const nlohmann::json& j);
ExecutionFill decodeExecutionFill(const nlohmann::json& j);

}  // namespace pnlsync
