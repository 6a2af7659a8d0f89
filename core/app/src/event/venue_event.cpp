#include "pnlsync/events/event.hpp"

#include <type_traits>

namespace pnlsync {

// -----------------------------------------------------------------------------
// venueEventName(): variant alternative → log label
// -----------------------------------------------------------------------------
const char* venueEventName(const VenueEvent& event) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ExecutionEvent>) {
          return "execution";
        } else if constexpr (std::is_same_v<T, CommissionReportEvent>) {
          return "commission_report";
        } else if constexpr (std::is_same_v<T, PositionSnapshotEvent>) {
          return "position";
        } else if constexpr (std::is_same_v<T, AccountValuationEvent>) {
          return "account_value";
        } else if constexpr (std::is_same_v<T, AccountPnLEvent>) {
          return "account_pnl";
        } else if constexpr (std::is_same_v<T, PositionPnLEvent>) {
          return "position_pnl";
        } else if constexpr (std::is_same_v<T, ConnectivityErrorEvent>) {
          return "error";
        } else {
          return "order_status";
        }
      },
      event);
}

}  // namespace pnlsync
