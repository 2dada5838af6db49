#include "amico/system/execution_history.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace amico {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ExecutionHistory::ExecutionHistory(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

// -----------------------------------------------------------------------------
// record_pending(): new record + submission counters
// -----------------------------------------------------------------------------
void ExecutionHistory::record_pending(ExecutionId id,
                                      const std::string& system_name,
                                      int priority) {
  {
    std::lock_guard lock(mutex_);

    SystemContext ctx;
    ctx.system_name = system_name;
    ctx.execution_id = id;
    ctx.started_at = std::chrono::system_clock::now();
    ctx.priority = priority;
    ctx.status = SystemStatus::pending();
    ctx.transitions.push_back(SystemState::Pending);

    records_.emplace(id, std::move(ctx));
    order_.push_back(id);

    ++metrics_.total_executions;
    ++metrics_.in_flight;
    ++metrics_.per_system[system_name].executions;

    evict_excess();
  }
  changed_.notify_all();
}

// -----------------------------------------------------------------------------
// mark_running()
// -----------------------------------------------------------------------------
bool ExecutionHistory::mark_running(ExecutionId id) {
  bool may_run = true;
  {
    std::lock_guard lock(mutex_);
    if (cancelled_.count(id) != 0) {
      may_run = false;
    } else if (auto it = records_.find(id); it != records_.end()) {
      transition(it->second, SystemStatus::running());
    }
  }
  changed_.notify_all();
  return may_run;
}

// -----------------------------------------------------------------------------
// mark_completed() / mark_failed()
// -----------------------------------------------------------------------------
SystemContext ExecutionHistory::mark_completed(ExecutionId id,
                                               const std::string& system_name,
                                               std::chrono::nanoseconds duration,
                                               bool* was_cancelled) {
  SystemContext snapshot = settle(
      id, system_name, SystemStatus::completed(duration), was_cancelled);
  changed_.notify_all();
  return snapshot;
}

SystemContext ExecutionHistory::mark_failed(ExecutionId id,
                                            const std::string& system_name,
                                            const std::string& reason,
                                            bool* was_cancelled) {
  SystemContext snapshot =
      settle(id, system_name, SystemStatus::failed(reason), was_cancelled);
  changed_.notify_all();
  return snapshot;
}

// -----------------------------------------------------------------------------
// settle(): common terminal path. A cancelled invocation keeps its
// Failed("cancelled") record; only the in-flight count moves.
// -----------------------------------------------------------------------------
SystemContext ExecutionHistory::settle(ExecutionId id,
                                       const std::string& system_name,
                                       SystemStatus next,
                                       bool* was_cancelled) {
  std::lock_guard lock(mutex_);

  if (metrics_.in_flight > 0) {
    --metrics_.in_flight;
  }

  const bool cancelled = cancelled_.erase(id) != 0;
  if (was_cancelled != nullptr) {
    *was_cancelled = cancelled;
  }
  auto it = records_.find(id);

  if (!cancelled) {
    auto& per = metrics_.per_system[system_name];
    if (next.state == SystemState::Completed) {
      ++metrics_.completed;
      ++per.completed;
      per.total_duration += next.duration;
      per.max_duration = std::max(per.max_duration, next.duration);
    } else {
      ++metrics_.failed;
      ++per.failed;
    }
    if (it != records_.end()) {
      transition(it->second, next);
    }
  }

  if (it != records_.end()) {
    return it->second;
  }

  SystemContext evicted;
  evicted.system_name = system_name;
  evicted.execution_id = id;
  evicted.status = cancelled ? SystemStatus::failed("cancelled") : next;
  return evicted;
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
bool ExecutionHistory::cancel(ExecutionId id) {
  {
    std::lock_guard lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end() || it->second.status.is_terminal()) {
      return false;
    }
    if (!transition(it->second, SystemStatus::failed("cancelled"))) {
      return false;
    }
    cancelled_.insert(id);
    ++metrics_.cancelled;
    ++metrics_.per_system[it->second.system_name].cancelled;
  }
  changed_.notify_all();
  return true;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<SystemContext> ExecutionHistory::find(ExecutionId id) const {
  std::lock_guard lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

SystemMetrics ExecutionHistory::metrics() const {
  std::lock_guard lock(mutex_);
  SystemMetrics copy = metrics_;
  copy.history_size = records_.size();
  return copy;
}

std::size_t ExecutionHistory::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

void ExecutionHistory::clear() {
  {
    std::lock_guard lock(mutex_);
    records_.clear();
    order_.clear();
  }
  changed_.notify_all();
}

// -----------------------------------------------------------------------------
// Blocking waits
// -----------------------------------------------------------------------------
bool ExecutionHistory::wait_terminal(ExecutionId id,
                                     std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return changed_.wait_for(lock, timeout, [this, id] {
    auto it = records_.find(id);
    return it == records_.end() || it->second.status.is_terminal();
  });
}

bool ExecutionHistory::wait_idle(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return changed_.wait_for(lock, timeout,
                           [this] { return metrics_.in_flight == 0; });
}

// -----------------------------------------------------------------------------
// transition(): validated state change (caller holds mutex_)
// -----------------------------------------------------------------------------
bool ExecutionHistory::transition(SystemContext& ctx, SystemStatus next) {
  if (!is_legal_transition(ctx.status.state, next.state)) {
    std::cerr << "[ExecutionHistory] WARNING: illegal transition for "
              << ctx.system_name << "#" << ctx.execution_id << " from "
              << to_string(ctx.status.state) << " to "
              << to_string(next.state) << ". Skipping.\n";
    return false;
  }
  ctx.transitions.push_back(next.state);
  ctx.status = std::move(next);
  return true;
}

// -----------------------------------------------------------------------------
// evict_excess(): oldest-first (caller holds mutex_)
// -----------------------------------------------------------------------------
void ExecutionHistory::evict_excess() {
  while (records_.size() > capacity_ && !order_.empty()) {
    records_.erase(order_.front());
    order_.pop_front();
  }
}

}  // namespace amico
