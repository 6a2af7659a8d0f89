#include "pnlsync/sync/order_router.hpp"

#include <cctype>
#include <iostream>
#include <utility>
#include <vector>

namespace pnlsync {

using domain::OrderOutcome;
using domain::OrderResult;

OrderRouter::OrderRouter(EventBus& bus, const ITimeProvider& clock,
                         OrderRouterConfig config)
    : bus_(bus),
      clock_(clock),
      config_(std::move(config)),
      queue_(config_.queue_max) {
  status_subscription_ = bus_.subscribe<OrderStatusEvent>(
      [this](const OrderStatusEvent& e) {
        std::lock_guard lock(mutex_);
        if (collecting_statuses_) {
          statuses_[e.order_id] = e;
        }
      });
}

OrderRouter::~OrderRouter() { bus_.unsubscribe(status_subscription_); }

void OrderRouter::setResultListener(ResultListener listener) {
  std::lock_guard lock(mutex_);
  listener_ = std::move(listener);
}

// -----------------------------------------------------------------------------
// submit(): caller thread
// -----------------------------------------------------------------------------
OrderResult OrderRouter::submit(const domain::OrderRequest& request,
                                const std::optional<std::string>& idempotency_key,
                                std::chrono::milliseconds timeout) {
  const bool keyed = idempotency_key.has_value() && !idempotency_key->empty();
  const std::string request_id = keyed ? *idempotency_key : ids_.next();

  if (auto error = domain::validateOrder(request)) {
    return OrderResult::failure(request_id, *error);
  }
  if (config_.readonly) {
    return OrderResult::failure(request_id, "read-only mode enabled");
  }
  {
    // The connection check and the push share mutex_ with teardown, so a
    // request is either refused here or drained by failAll().
    std::lock_guard lock(mutex_);
    if (!connected_) {
      return OrderResult::failure(request_id, "disconnected");
    }
    if (keyed) {
      pruneRecordsLocked(clock_.now_ms());
      auto it = records_.find(request_id);
      if (it != records_.end()) {
        return it->second.result.has_value() ? *it->second.result
                                             : pending(request_id);
      }
    }
    if (!queue_.try_push(Job{request_id, request})) {
      std::cerr << "[OrderRouter] Queue full (" << queue_.capacity()
                << "), rejected " << request_id << "\n";
      return OrderResult::failure(request_id, "order queue full");
    }
    if (keyed) {
      records_[request_id] = Record{std::nullopt, clock_.now_ms()};
    }
    Waiter waiter;
    waiter.keyed = keyed;
    waiters_[request_id] = waiter;
  }
  std::cout << "[OrderRouter] Queued " << request_id << " "
            << domain::sideToString(request.side) << " " << request.quantity
            << " " << request.symbol << " "
            << domain::orderTypeToString(request.type) << "\n";

  std::unique_lock lock(mutex_);
  const bool done = resolved_.wait_for(lock, timeout, [&] {
    auto it = waiters_.find(request_id);
    return it == waiters_.end() || it->second.done;
  });
  auto it = waiters_.find(request_id);
  if (!done || it == waiters_.end()) {
    if (it != waiters_.end()) {
      it->second.abandoned = true;
    }
    return pending(request_id);
  }
  OrderResult result = std::move(it->second.result);
  waiters_.erase(it);
  return result;
}

// -----------------------------------------------------------------------------
// processPending(): sync worker
// -----------------------------------------------------------------------------
std::size_t OrderRouter::processPending(IVenueClient& venue) {
  std::size_t processed = 0;
  while (auto job = queue_.try_pop()) {
    OrderResult result;
    try {
      result = place(venue, *job);
    } catch (const VenueError& e) {
      std::cerr << "[OrderRouter] Order " << job->request_id
                << " failed: " << e.what() << "\n";
      resolve(job->request_id, OrderResult::failure(job->request_id, e.what()));
      ++processed;
      if (!venue.isConnected()) {
        throw;
      }
      continue;
    }
    resolve(job->request_id, std::move(result));
    ++processed;
  }
  return processed;
}

OrderResult OrderRouter::place(IVenueClient& venue, const Job& job) {
  const domain::OrderRequest& req = job.request;

  ContractSpec spec;
  spec.symbol = req.symbol;
  for (auto& c : spec.symbol) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  spec.exchange = req.exchange.empty() ? "SMART" : req.exchange;
  spec.currency = req.currency.empty() ? config_.base_currency : req.currency;

  const auto contract = venue.qualifyContract(spec);
  if (!contract.has_value()) {
    std::cerr << "[OrderRouter] Unable to qualify " << spec.symbol << " on "
              << spec.exchange << "/" << spec.currency << " for "
              << job.request_id << "\n";
    return OrderResult::failure(job.request_id, "Unable to qualify contract");
  }
  if (req.type == domain::OrderType::Limit && !req.limit_price.has_value()) {
    return OrderResult::failure(job.request_id, "Limit price required");
  }

  VenueOrder order;
  order.account = req.account;
  order.action = req.side == domain::Side::Buy ? "BUY" : "SELL";
  order.quantity = req.quantity;
  order.type = req.type;
  if (req.type == domain::OrderType::Limit) {
    order.limit_price = req.limit_price;
  }
  if (!req.time_in_force.empty()) {
    order.time_in_force = req.time_in_force;
  }

  // Statuses are only collected while this placement waits for its own.
  struct StatusWindow {
    OrderRouter& router;
    explicit StatusWindow(OrderRouter& r) : router(r) {
      std::lock_guard lock(router.mutex_);
      router.statuses_.clear();
      router.collecting_statuses_ = true;
    }
    ~StatusWindow() {
      std::lock_guard lock(router.mutex_);
      router.collecting_statuses_ = false;
      router.statuses_.clear();
    }
  };

  domain::OrderFill fill;
  fill.status = "PendingSubmit";
  fill.remaining = req.quantity;
  {
    StatusWindow window(*this);
    const domain::OrderId order_id = venue.placeOrder(*contract, order);
    venue.pump(config_.status_wait);

    fill.order_id = order_id;
    std::lock_guard lock(mutex_);
    auto it = statuses_.find(order_id);
    if (it != statuses_.end()) {
      fill.status = it->second.status;
      fill.filled = it->second.filled;
      fill.remaining = it->second.remaining;
      fill.avg_fill_price = it->second.avg_fill_price;
    }
  }

  std::cout << "[OrderRouter] Placed " << job.request_id
            << " order_id=" << fill.order_id << " status=" << fill.status
            << " filled=" << fill.filled << " remaining=" << fill.remaining
            << " avg_fill=" << fill.avg_fill_price << "\n";

  OrderResult result;
  result.outcome = OrderOutcome::Success;
  result.request_id = job.request_id;
  result.fill = fill;
  return result;
}

// -----------------------------------------------------------------------------
// failAll(): teardown
// -----------------------------------------------------------------------------
void OrderRouter::setConnected(bool connected) {
  std::lock_guard lock(mutex_);
  connected_ = connected;
}

std::size_t OrderRouter::trackedStatusCount() const {
  std::lock_guard lock(mutex_);
  return statuses_.size();
}

void OrderRouter::failAll(const std::string& reason) {
  std::vector<Job> jobs;
  {
    std::lock_guard lock(mutex_);
    jobs = queue_.drain();
  }
  for (const auto& job : jobs) {
    resolve(job.request_id, OrderResult::failure(job.request_id, reason));
  }
  if (!jobs.empty()) {
    std::cerr << "[OrderRouter] Failed " << jobs.size()
              << " queued order(s): " << reason << "\n";
  }
}

std::optional<OrderResult> OrderRouter::completed(
    const std::string& request_id) const {
  std::lock_guard lock(mutex_);
  auto it = records_.find(request_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second.result;
}

// -----------------------------------------------------------------------------
// resolve(): wake the waiter or record the result for a later lookup
// -----------------------------------------------------------------------------
void OrderRouter::resolve(const std::string& request_id, OrderResult result) {
  ResultListener listener;
  {
    std::lock_guard lock(mutex_);
    auto it = waiters_.find(request_id);
    const bool keyed = it != waiters_.end() && it->second.keyed;
    const bool abandoned = it != waiters_.end() && it->second.abandoned;

    if (keyed && result.outcome == OrderOutcome::Failure) {
      records_.erase(request_id);
    } else if (keyed || abandoned) {
      records_[request_id] = Record{result, clock_.now_ms()};
    }

    if (it != waiters_.end()) {
      if (abandoned) {
        waiters_.erase(it);
      } else {
        it->second.done = true;
        it->second.result = result;
      }
    }
    listener = listener_;
  }
  resolved_.notify_all();
  if (listener) {
    listener(result);
  }
}

void OrderRouter::pruneRecordsLocked(std::int64_t now_ms) {
  for (auto it = records_.begin(); it != records_.end();) {
    if (now_ms - it->second.recorded_ms > kIdempotencyTtlMs) {
      it = records_.erase(it);
    } else {
      ++it;
    }
  }
}

OrderResult OrderRouter::pending(const std::string& request_id) {
  OrderResult r;
  r.outcome = OrderOutcome::Pending;
  r.request_id = request_id;
  r.error = "still queued";
  return r;
}

}  // namespace pnlsync
