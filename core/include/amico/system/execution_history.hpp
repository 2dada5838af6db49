#pragma once

#include "amico/system/system_status.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace amico {

// -----------------------------------------------------------------------------
// ExecutionHistory
// -----------------------------------------------------------------------------
//
// @brief  Bounded store of SystemContext records plus cumulative metrics.
//
// @details
// Records are kept in submission order. Once more than `capacity` records
// exist the oldest is evicted, whatever its state; lookups of an evicted id
// return std::nullopt. Ids are issued by the executor and never reused, so a
// stale id can never resolve to another invocation's record.
//
// Status changes go through a transition check (see is_legal_transition);
// an illegal edge is logged and ignored.
//
// Cancellation: cancel() marks a non-terminal record Failed("cancelled")
// immediately. The worker then skips a body that has not started
// (mark_running() returns false); a running body finishes, but its outcome
// no longer changes the record and the mark_* call reports it as cancelled.
//
// Thread model: All methods are safe from any thread. wait_terminal() and
// wait_idle() block on an internal condition variable signalled on every
// state change.
// -----------------------------------------------------------------------------
class ExecutionHistory {
 public:
  explicit ExecutionHistory(std::size_t capacity);

  ExecutionHistory(const ExecutionHistory&) = delete;
  ExecutionHistory& operator=(const ExecutionHistory&) = delete;

  void record_pending(ExecutionId id, const std::string& system_name,
                      int priority);

  // Moves the record to Running. Returns false when the invocation was
  // cancelled and its body must not start.
  bool mark_running(ExecutionId id);

  // Terminal updates. Each returns a snapshot of the record afterwards (a
  // synthesized one when the record was already evicted). When
  // `was_cancelled` is given it is set to whether cancel() got there first,
  // in which case the outcome was discarded.
  SystemContext mark_completed(ExecutionId id, const std::string& system_name,
                               std::chrono::nanoseconds duration,
                               bool* was_cancelled = nullptr);
  SystemContext mark_failed(ExecutionId id, const std::string& system_name,
                            const std::string& reason,
                            bool* was_cancelled = nullptr);

  // Marks a Pending/Running record Failed("cancelled"). Returns false when
  // the record is unknown, evicted or already terminal.
  bool cancel(ExecutionId id);

  std::optional<SystemContext> find(ExecutionId id) const;
  SystemMetrics metrics() const;

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }

  // Drops every record. Metrics and in-flight accounting are untouched.
  void clear();

  // Blocks until the record is terminal or no longer tracked. Returns false
  // on timeout.
  bool wait_terminal(ExecutionId id, std::chrono::milliseconds timeout) const;

  // Blocks until no invocation is queued or running. Returns false on
  // timeout.
  bool wait_idle(std::chrono::milliseconds timeout) const;

 private:
  // Caller holds mutex_.
  bool transition(SystemContext& ctx, SystemStatus next);
  SystemContext settle(ExecutionId id, const std::string& system_name,
                       SystemStatus next, bool* was_cancelled);
  void evict_excess();

  const std::size_t capacity_;

  mutable std::mutex mutex_;
  mutable std::condition_variable changed_;

  std::deque<ExecutionId> order_;
  std::unordered_map<ExecutionId, SystemContext> records_;
  std::unordered_set<ExecutionId> cancelled_;

  SystemMetrics metrics_;
};

}  // namespace amico
