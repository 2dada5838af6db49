#pragma once

#include <atomic>
#include <cstdint>

namespace amico {

// -----------------------------------------------------------------------------
// SequenceGenerator: thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Produces unique, strictly increasing 64-bit ids via an atomic
//         counter.
//
// @details
// Starts at 1; 0 is reserved as the "unset" sentinel for ids embedded in
// value types (AgentEvent::id, SystemContext::execution_id). Ids are never
// handed out twice for the lifetime of the generator, which is what makes
// execution ids safe to look up after their history record was evicted.
//
// Thread model:
//   next_id() may be called concurrently from any thread.
//
// Ownership:
//   Held as a value member by the component that issues the ids
//   (SystemExecutor for execution ids, Agent for event ids, HandlerRegistry
//   for handler ids).
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  // Non-copyable, non-movable: two copies would hand out duplicate ids.
  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  // Returns the next id. Relaxed ordering is enough: only uniqueness and
  // per-generator monotonicity are required.
  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // The id the next call to next_id() would return. Diagnostics only.
  std::uint64_t peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace amico
