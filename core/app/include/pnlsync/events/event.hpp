#pragma once

#include "pnlsync/events/venue_events.hpp"

#include <variant>

namespace pnlsync {

// -----------------------------------------------------------------------------
// VenueEvent (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single internal envelope for everything the venue
// reports. Every venue binding (simulated, ZeroMQ bridge) produces these and
// nothing else, which keeps the reconciler binding-agnostic.
//
// Why std::variant:
// - Value semantics: events are copied into queues and across threads
//   without heap ownership questions.
// - Type-safe dispatch: EventBus::subscribe<T>() wraps std::get_if so each
//   handler receives its concrete type.
// - Adding a kind means adding it here; every std::visit site then fails to
//   compile until it handles the new kind.
// -----------------------------------------------------------------------------
using VenueEvent = std::variant<
    ExecutionEvent,
    CommissionReportEvent,
    PositionSnapshotEvent,
    AccountValuationEvent,
    AccountPnLEvent,
    PositionPnLEvent,
    ConnectivityErrorEvent,
    OrderStatusEvent>;

// Short name of the alternative held, for logging ("execution", ...).
const char* venueEventName(const VenueEvent& event);

}  // namespace pnlsync
