#pragma once

#include "amico/time/time_utils.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace amico {

using ExecutionId = std::uint64_t;

enum class SystemState {
  Pending,    // queued; body not started
  Running,    // body executing on a worker thread
  Completed,  // body returned a value
  Failed,     // body returned an error, threw, or the invocation was cancelled
};

const char* to_string(SystemState state);

// Legal lifecycle edges:
//   Pending -> Running | Failed (cancel before start)
//   Running -> Completed | Failed
// Completed and Failed are terminal.
bool is_legal_transition(SystemState from, SystemState to);

// -----------------------------------------------------------------------------
// SystemStatus
// -----------------------------------------------------------------------------
// State of one invocation plus the data attached to its terminal states:
// `duration` for Completed (body wall time), `reason` for Failed.
// -----------------------------------------------------------------------------
struct SystemStatus {
  SystemState state{SystemState::Pending};
  std::chrono::nanoseconds duration{0};
  std::string reason;

  static SystemStatus pending() { return SystemStatus{}; }
  static SystemStatus running() {
    return SystemStatus{SystemState::Running, {}, {}};
  }
  static SystemStatus completed(std::chrono::nanoseconds d) {
    return SystemStatus{SystemState::Completed, d, {}};
  }
  static SystemStatus failed(std::string why) {
    return SystemStatus{SystemState::Failed, {}, std::move(why)};
  }

  bool is_terminal() const {
    return state == SystemState::Completed || state == SystemState::Failed;
  }
};

// -----------------------------------------------------------------------------
// SystemContext
// -----------------------------------------------------------------------------
// Record of one invocation, created by SystemExecutor::execute() and kept in
// the bounded ExecutionHistory. `transitions` lists every state entered, in
// order, starting with Pending.
// -----------------------------------------------------------------------------
struct SystemContext {
  std::string system_name;
  ExecutionId execution_id{0};
  Timestamp started_at{};
  int priority{0};
  SystemStatus status;
  std::vector<SystemState> transitions;
};

struct PerSystemMetrics {
  std::uint64_t executions{0};
  std::uint64_t completed{0};
  std::uint64_t failed{0};
  std::uint64_t cancelled{0};
  std::chrono::nanoseconds total_duration{0};
  std::chrono::nanoseconds max_duration{0};

  double average_ms() const {
    return completed == 0 ? 0.0 : to_millis(total_duration) / completed;
  }
};

// -----------------------------------------------------------------------------
// SystemMetrics
// -----------------------------------------------------------------------------
// Cumulative counters for one executor. Eviction and clear_history() do not
// reset them. Cancelled invocations count under `cancelled`, not `failed`.
// -----------------------------------------------------------------------------
struct SystemMetrics {
  std::uint64_t total_executions{0};
  std::uint64_t completed{0};
  std::uint64_t failed{0};
  std::uint64_t cancelled{0};
  std::uint64_t in_flight{0};
  std::size_t history_size{0};
  std::map<std::string, PerSystemMetrics> per_system;
};

}  // namespace amico
