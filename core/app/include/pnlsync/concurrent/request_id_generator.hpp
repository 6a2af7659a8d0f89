#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <utility>

namespace pnlsync {

// -----------------------------------------------------------------------------
// RequestIdGenerator: thread-safe source of order request ids
// -----------------------------------------------------------------------------
//
// @brief  Produces unique request ids ("ord-1", "ord-2", ...) for orders
//         submitted without a caller-supplied idempotency key.
//
// @details
// The counter starts at 1 and is incremented with fetch_add(relaxed); the
// only requirement is uniqueness, not ordering relative to other memory.
//
// prefix lets two routers in one process (tests) stay distinguishable.
//
// Thread model: next() is safe to call concurrently from any thread; order
// submission happens on arbitrary caller threads.
//
// Ownership: value member of OrderRouter.
// -----------------------------------------------------------------------------
class RequestIdGenerator {
 public:
  explicit RequestIdGenerator(std::string prefix = "ord-")
      : prefix_(std::move(prefix)) {}

  RequestIdGenerator(const RequestIdGenerator&) = delete;
  RequestIdGenerator& operator=(const RequestIdGenerator&) = delete;
  RequestIdGenerator(RequestIdGenerator&&) = delete;
  RequestIdGenerator& operator=(RequestIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  std::string next() { return prefix_ + std::to_string(next_id()); }

 private:
  const std::string prefix_;
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace pnlsync
