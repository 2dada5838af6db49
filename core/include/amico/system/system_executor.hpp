#pragma once

#include "amico/common/errors.hpp"
#include "amico/common/result.hpp"
#include "amico/concurrent/sequence_generator.hpp"
#include "amico/system/execution_history.hpp"
#include "amico/system/handle.hpp"
#include "amico/system/system.hpp"
#include "amico/system/system_status.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace amico {

// -----------------------------------------------------------------------------
// SystemExecutor
// -----------------------------------------------------------------------------
//
// @brief  Registry of systems plus a worker pool that runs their invocations
//         and tracks each one's status.
//
// @details
// Registration binds one system per (Input, Output) type pair; binding a
// second system for the same pair replaces the first. execute<S>(input)
// resolves the pair from S, records a Pending SystemContext and queues the
// invocation; it never waits for the body.
//
// Worker threads take queued invocations highest priority first (FIFO among
// equal priorities), mark them Running, run the body, record
// Completed(duration) or Failed(reason), and only then resolve the Handle.
//
// Lifecycle mirrors the rest of the engine: start() spawns the workers,
// stop() lets them finish everything already queued and joins them. Both are
// idempotent. Invocations submitted before start() wait in the queue.
//
// Thread model:
//   register_system(), execute(), cancel() and every query are safe from any
//   thread. System bodies and the completion listener run on worker threads.
//
// Ownership:
//   Owned by the Agent (or a test) via std::unique_ptr or as a value member.
//   Holds shared ownership of every bound system.
// -----------------------------------------------------------------------------
class SystemExecutor {
 public:
  using CompletionListener = std::function<void(const SystemContext&)>;

  static constexpr std::size_t kDefaultWorkers = 2;
  static constexpr std::size_t kDefaultHistory = 1024;

  explicit SystemExecutor(std::size_t workers = kDefaultWorkers,
                          std::size_t max_history = kDefaultHistory);

  // RAII: stop() joins the workers.
  ~SystemExecutor();

  SystemExecutor(const SystemExecutor&) = delete;
  SystemExecutor& operator=(const SystemExecutor&) = delete;
  SystemExecutor(SystemExecutor&&) = delete;
  SystemExecutor& operator=(SystemExecutor&&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // -------------------------------------------------------------------------
  // register_system<S>(system)
  // -------------------------------------------------------------------------
  //
  // @brief  Binds `system` to the pair (S::Input, S::Output).
  //
  // @details
  // Replaces (and logs) any previous binding for the pair. Invocations
  // already queued keep the binding they were submitted with.
  // -------------------------------------------------------------------------
  template <typename S>
  void register_system(std::shared_ptr<S> system) {
    using In = typename S::Input;
    using Out = typename S::Output;
    using Err = typename S::Error;

    auto binding = std::make_shared<Binding<In, Out>>();
    binding->name = system->name();
    binding->body = [system](const In& input) -> Result<Out, std::string> {
      Result<Out, Err> r = system->run(input);
      if (r.ok()) {
        return Result<Out, std::string>::success(std::move(*r.value));
      }
      if (r.failed()) {
        return Result<Out, std::string>::failure(describe_error(*r.error));
      }
      return Result<Out, std::string>::failure("system returned no result");
    };

    std::string replaced;
    {
      std::lock_guard lock(bindings_mutex_);
      auto& slot = bindings_[key<In, Out>()];
      if (slot) {
        replaced = slot->name;
      }
      slot = std::move(binding);
    }

    if (!replaced.empty()) {
      std::cout << "[SystemExecutor] replaced system '" << replaced
                << "' with '" << system->name() << "'.\n";
    }
  }

  template <typename S>
  void register_system(std::unique_ptr<S> system) {
    register_system(std::shared_ptr<S>(std::move(system)));
  }

  // True when a system is bound for S's (Input, Output) pair.
  template <typename S>
  bool has_system() const {
    std::lock_guard lock(bindings_mutex_);
    return bindings_.count(key<typename S::Input, typename S::Output>()) != 0;
  }

  // Names of the bound systems, in no particular order.
  std::vector<std::string> registered_systems() const;

  // -------------------------------------------------------------------------
  // execute<S>(input, priority)
  // -------------------------------------------------------------------------
  //
  // @brief  Starts one invocation of the system bound for S's type pair.
  //
  // @return A Handle to the invocation, or SystemError::NotFound when no
  //         system is bound for the pair.
  //
  // @details
  // Non-blocking: records a Pending SystemContext and queues the work.
  // -------------------------------------------------------------------------
  template <typename S>
  Result<Handle<typename S::Output>, SystemError> execute(
      typename S::Input input, int priority = 0) {
    using In = typename S::Input;
    using Out = typename S::Output;
    using Outcome = Result<Out, SystemError>;
    using Submitted = Result<Handle<Out>, SystemError>;

    std::shared_ptr<Binding<In, Out>> binding;
    {
      std::lock_guard lock(bindings_mutex_);
      auto it = bindings_.find(key<In, Out>());
      if (it != bindings_.end()) {
        binding = std::static_pointer_cast<Binding<In, Out>>(it->second);
      }
    }
    if (!binding) {
      return Submitted::failure(SystemError::notFound(
          "system for " + std::string(typeid(S).name())));
    }

    struct State {
      std::promise<Outcome> promise;
      std::optional<Outcome> outcome;
    };
    auto state = std::make_shared<State>();
    std::shared_future<Outcome> future = state->promise.get_future().share();

    Task task;
    task.id = execution_ids_.next_id();
    task.priority = priority;
    task.system_name = binding->name;

    task.run = [state, binding,
                input = std::move(input)]() -> std::optional<std::string> {
      try {
        Result<Out, std::string> r = binding->body(input);
        if (r.ok()) {
          state->outcome = Outcome::success(std::move(*r.value));
          return std::nullopt;
        }
        const std::string reason = r.error.value_or("system failed");
        state->outcome = Outcome::failure(SystemError::executionFailed(reason));
        return reason;
      } catch (const std::exception& e) {
        state->outcome =
            Outcome::failure(SystemError::executionFailed(e.what()));
        return std::string(e.what());
      } catch (...) {
        state->outcome =
            Outcome::failure(SystemError::executionFailed("unknown exception"));
        return std::string("unknown exception");
      }
    };
    task.resolve = [state] {
      state->promise.set_value(std::move(*state->outcome));
    };
    task.abandon = [state](const SystemError& error) {
      state->promise.set_value(Outcome::failure(error));
    };

    const ExecutionId id = task.id;
    history_.record_pending(id, task.system_name, priority);
    enqueue(std::move(task));
    return Submitted::success(Handle<Out>(id, std::move(future)));
  }

  // -------------------------------------------------------------------------
  // cancel(id) / cancel(handle)
  // -------------------------------------------------------------------------
  // Marks the invocation Failed("cancelled"). A body that has not started is
  // skipped and its Handle resolves with ExecutionFailed("cancelled"); a body
  // already running is not interrupted, but its result is discarded and the
  // Handle resolves the same way. Returns false for unknown, evicted or
  // finished invocations.
  // -------------------------------------------------------------------------
  bool cancel(ExecutionId id);

  template <typename Out>
  bool cancel(const Handle<Out>& handle) {
    return cancel(handle.id());
  }

  // Point-in-time snapshots; std::nullopt once the record has been evicted.
  std::optional<SystemStatus> get_execution_status(ExecutionId id) const;
  std::optional<SystemContext> get_execution_context(ExecutionId id) const;
  SystemMetrics get_system_metrics() const;

  void clear_history();
  std::size_t history_capacity() const { return history_.capacity(); }

  // Waits until the invocation is terminal (or evicted). False on timeout.
  bool wait_for_execution(ExecutionId id,
                          std::chrono::milliseconds timeout) const;

  // Waits until nothing is queued or running. False on timeout.
  bool drain(std::chrono::milliseconds timeout) const;

  // Called on the worker thread after every invocation settles.
  void set_completion_listener(CompletionListener listener);

 private:
  struct BindingBase {
    virtual ~BindingBase() = default;
    std::string name;
  };

  template <typename In, typename Out>
  struct Binding final : BindingBase {
    std::function<Result<Out, std::string>(const In&)> body;
  };

  template <typename In, typename Out>
  struct PairKey {};

  template <typename In, typename Out>
  static std::type_index key() {
    return std::type_index(typeid(PairKey<In, Out>));
  }

  // One queued invocation. `run` executes the body and keeps the outcome,
  // returning the failure reason if any; `resolve` hands the kept outcome to
  // the Handle; `abandon` resolves the Handle with an error instead.
  struct Task {
    ExecutionId id{0};
    int priority{0};
    std::uint64_t sequence{0};
    std::string system_name;
    std::function<std::optional<std::string>()> run;
    std::function<void()> resolve;
    std::function<void(const SystemError&)> abandon;
  };

  // Heap order: higher priority first, then lower sequence (FIFO).
  struct TaskOrder {
    bool operator()(const Task& a, const Task& b) const {
      if (a.priority != b.priority) {
        return a.priority < b.priority;
      }
      return a.sequence > b.sequence;
    }
  };

  void enqueue(Task task);
  void run_worker();
  void execute_task(Task& task);
  void notify_listener(const SystemContext& ctx);

  const std::size_t worker_count_;

  mutable std::mutex bindings_mutex_;
  std::unordered_map<std::type_index, std::shared_ptr<BindingBase>> bindings_;

  SequenceGenerator execution_ids_;
  ExecutionHistory history_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::vector<Task> queue_;  // binary heap ordered by TaskOrder
  std::uint64_t next_sequence_{0};

  std::mutex listener_mutex_;
  CompletionListener listener_;

  std::atomic<bool> running_{false};
  std::vector<std::thread> workers_;
};

}  // namespace amico
