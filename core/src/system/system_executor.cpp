#include "amico/system/system_executor.hpp"

#include <algorithm>

namespace amico {

// -----------------------------------------------------------------------------
// Constructor / destructor
// -----------------------------------------------------------------------------
SystemExecutor::SystemExecutor(std::size_t workers, std::size_t max_history)
    : worker_count_(std::max<std::size_t>(workers, 1)),
      history_(max_history) {}

SystemExecutor::~SystemExecutor() { stop(); }

// -----------------------------------------------------------------------------
// start(): spawn the worker pool
// -----------------------------------------------------------------------------
void SystemExecutor::start() {
  if (!workers_.empty()) {
    return;
  }

  running_.store(true);
  workers_.reserve(worker_count_);
  for (std::size_t i = 0; i < worker_count_; ++i) {
    workers_.emplace_back([this] { run_worker(); });
  }

  std::cout << "[SystemExecutor] started " << worker_count_
            << " worker(s), history capacity " << history_.capacity()
            << ".\n";
}

// -----------------------------------------------------------------------------
// stop(): finish queued work, join, then resolve anything never picked up
// -----------------------------------------------------------------------------
void SystemExecutor::stop() {
  if (!workers_.empty()) {
    running_.store(false);
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
    workers_.clear();
    std::cout << "[SystemExecutor] stopped. All workers joined.\n";
  }

  // Only non-empty when stop() runs on an executor that was never started:
  // nothing will ever run these, so their handles resolve as failed.
  std::vector<Task> orphaned;
  {
    std::lock_guard lock(queue_mutex_);
    orphaned.swap(queue_);
  }
  for (auto& task : orphaned) {
    const SystemError error =
        SystemError::executionFailed("executor stopped before start");
    history_.mark_failed(task.id, task.system_name, error.message);
    task.abandon(error);
  }
}

// -----------------------------------------------------------------------------
// Registry queries
// -----------------------------------------------------------------------------
std::vector<std::string> SystemExecutor::registered_systems() const {
  std::lock_guard lock(bindings_mutex_);
  std::vector<std::string> names;
  names.reserve(bindings_.size());
  for (const auto& [type, binding] : bindings_) {
    names.push_back(binding->name);
  }
  return names;
}

// -----------------------------------------------------------------------------
// Status queries and cancellation (delegate to the history)
// -----------------------------------------------------------------------------
bool SystemExecutor::cancel(ExecutionId id) {
  const bool cancelled = history_.cancel(id);
  if (cancelled) {
    std::cout << "[SystemExecutor] execution #" << id << " cancelled.\n";
  }
  return cancelled;
}

std::optional<SystemStatus> SystemExecutor::get_execution_status(
    ExecutionId id) const {
  auto ctx = history_.find(id);
  if (!ctx) {
    return std::nullopt;
  }
  return ctx->status;
}

std::optional<SystemContext> SystemExecutor::get_execution_context(
    ExecutionId id) const {
  return history_.find(id);
}

SystemMetrics SystemExecutor::get_system_metrics() const {
  return history_.metrics();
}

void SystemExecutor::clear_history() { history_.clear(); }

bool SystemExecutor::wait_for_execution(
    ExecutionId id, std::chrono::milliseconds timeout) const {
  return history_.wait_terminal(id, timeout);
}

bool SystemExecutor::drain(std::chrono::milliseconds timeout) const {
  return history_.wait_idle(timeout);
}

void SystemExecutor::set_completion_listener(CompletionListener listener) {
  std::lock_guard lock(listener_mutex_);
  listener_ = std::move(listener);
}

// -----------------------------------------------------------------------------
// enqueue(): push onto the priority heap and wake one worker
// -----------------------------------------------------------------------------
void SystemExecutor::enqueue(Task task) {
  {
    std::lock_guard lock(queue_mutex_);
    task.sequence = next_sequence_++;
    queue_.push_back(std::move(task));
    std::push_heap(queue_.begin(), queue_.end(), TaskOrder{});
  }
  queue_cv_.notify_one();
}

// -----------------------------------------------------------------------------
// run_worker(): worker thread loop. Exits only once stop() was requested and
// the queue is empty, so queued work always completes.
// -----------------------------------------------------------------------------
void SystemExecutor::run_worker() {
  while (true) {
    Task task;
    {
      std::unique_lock lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !queue_.empty() || !running_.load(); });
      if (queue_.empty()) {
        return;
      }
      std::pop_heap(queue_.begin(), queue_.end(), TaskOrder{});
      task = std::move(queue_.back());
      queue_.pop_back();
    }
    execute_task(task);
  }
}

// -----------------------------------------------------------------------------
// execute_task(): Running -> body -> terminal status -> resolve handle
// -----------------------------------------------------------------------------
void SystemExecutor::execute_task(Task& task) {
  if (!history_.mark_running(task.id)) {
    SystemContext ctx =
        history_.mark_failed(task.id, task.system_name, "cancelled");
    task.abandon(SystemError::executionFailed("cancelled"));
    notify_listener(ctx);
    return;
  }

  const auto begin = std::chrono::steady_clock::now();
  std::optional<std::string> failure = task.run();
  const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::steady_clock::now() - begin);

  SystemContext ctx;
  bool cancelled = false;
  if (failure) {
    std::cerr << "[SystemExecutor] " << task.system_name << "#" << task.id
              << " failed: " << *failure << "\n";
    ctx = history_.mark_failed(task.id, task.system_name, *failure,
                               &cancelled);
  } else {
    ctx = history_.mark_completed(task.id, task.system_name, elapsed,
                                  &cancelled);
  }

  // Cancelled while running: the record already says Failed("cancelled"),
  // so the handle must not hand out the body's outcome.
  if (cancelled) {
    task.abandon(SystemError::executionFailed("cancelled"));
  } else {
    task.resolve();
  }
  notify_listener(ctx);
}

void SystemExecutor::notify_listener(const SystemContext& ctx) {
  CompletionListener listener;
  {
    std::lock_guard lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(ctx);
  }
}

}  // namespace amico
