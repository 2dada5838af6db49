#pragma once

#include "amico/common/errors.hpp"
#include "amico/common/result.hpp"
#include "amico/concurrent/sequence_generator.hpp"
#include "amico/concurrent/thread_safe_queue.hpp"
#include "amico/config/agent_config.hpp"
#include "amico/eventbus/event_bus.hpp"
#include "amico/events/agent_event.hpp"
#include "amico/events/entity_id.hpp"
#include "amico/events/lifecycle_events.hpp"
#include "amico/source/event_source.hpp"
#include "amico/source/source_thread.hpp"
#include "amico/strategy/strategy.hpp"
#include "amico/system/system_executor.hpp"
#include "amico/time/i_time_provider.hpp"
#include "amico/time/live_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace amico {

// Why the loop left the Running state.
enum class StopReason {
  ShutdownRequested,     // shutdown() was called
  TerminateInstruction,  // an AgentEvent carried AgentInstruction::Terminate
  StrategyFinished,      // the Strategy returned should_continue == false
  StrategyFatal,         // the Strategy failed with StrategyError::Fatal
  SourceFailure,         // an event source threw
};

const char* to_string(StopReason reason);

// Outcome of a completed agent run, returned by run() and wait().
struct RunReport {
  AgentState final_state{AgentState::Stopped};
  StopReason reason{StopReason::ShutdownRequested};
  std::optional<StrategyError> fatal_error;
  std::uint64_t events_processed{0};
  std::size_t events_dropped{0};  // still queued when draining began
};

// Point-in-time copy of the agent's cumulative counters.
struct AgentMetrics {
  std::uint64_t events_received{0};
  std::uint64_t events_expired{0};
  std::uint64_t events_processed{0};
  std::uint64_t strategy_errors{0};
  std::uint64_t actions_applied{0};
  std::uint64_t systems_executed{0};
  std::uint64_t system_successes{0};
  std::uint64_t system_failures{0};
  std::uint64_t events_sent{0};
  std::uint64_t event_send_failures{0};
  std::uint64_t responses{0};
};

void to_json(nlohmann::json& j, const AgentMetrics& metrics);

// -----------------------------------------------------------------------------
// Agent
// -----------------------------------------------------------------------------
//
// @brief  Owns an EventBus, a SystemExecutor, a Strategy, a Context and a set
//         of event sources, and runs the perceive/decide/act loop over them.
//
// @details
// Lifecycle:
//
//   Idle --start()/run()--> Running --+--> Draining --> Stopped
//                                     +--> Failed (event source threw)
//
// Registration (handlers, systems, sources) is only accepted while Idle.
// start() spawns every source on its own SourceThread plus one loop thread
// and returns; run() does the same but loops on the calling thread. wait()
// blocks until a started agent has finished.
//
// Per event pulled from the merged queue:
//   1. count it as received (id and default expiry were stamped on entry);
//   2. drop it if expired;
//   3. Terminate instruction -> Draining;
//   4. call the Strategy, then apply its actions in order
//      (ExecuteSystem / SendEvent / UpdateContext);
//   5. publish AgentResponse for a response text;
//   6. should_continue == false -> Draining.
//
// A Recoverable strategy error skips the event; a Fatal one (or an exception
// escaping the Strategy) drains and stops. Draining stops the sources, waits
// up to `drain_timeout` for in-flight system executions and discards events
// still queued. Each state change is published on the bus as
// AgentStateChanged.
//
// Thread model:
//   shutdown(), post(), every query and executeCommand() are safe from any
//   thread. Registration and start()/run() are meant for the owning thread.
//   The Strategy, SendEvent handlers and AgentResponse handlers run on the
//   loop thread; system bodies run on executor workers.
//
// Ownership:
//   Agent
//    ├── bus_             (unique_ptr<EventBus>)
//    ├── executor_        (unique_ptr<SystemExecutor>)
//    ├── strategy_        (unique_ptr<Strategy>)
//    ├── context_         (Context, value member)
//    ├── sources_         (unique_ptr<SourceThread> each, owning the source)
//    └── clock_           (ITimeProvider*, non-owning; defaults to live_clock_)
// -----------------------------------------------------------------------------
class Agent {
 public:
  explicit Agent(std::unique_ptr<Strategy> strategy, AgentConfig config = {});

  // Injection form. Null bus/executor are replaced by defaults built from
  // `config`; a null clock means wall-clock time. `clock` must outlive the
  // agent.
  Agent(std::unique_ptr<Strategy> strategy, std::unique_ptr<EventBus> bus,
        std::unique_ptr<SystemExecutor> executor, AgentConfig config,
        const ITimeProvider* clock = nullptr);

  // RAII: requests shutdown and joins every thread.
  ~Agent();

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;
  Agent(Agent&&) = delete;
  Agent& operator=(Agent&&) = delete;

  // --- Registration (Idle only) ----------------------------------------------

  template <typename E, typename F>
  Result<HandlerId, AgentError> register_handler(F&& handler) {
    if (auto rejected = reject_unless_idle("register_handler")) {
      return Result<HandlerId, AgentError>::failure(*rejected);
    }
    return to_agent_result(bus_->register_handler<E>(std::forward<F>(handler)));
  }

  template <typename E, typename F>
  Result<HandlerId, AgentError> register_handler(EntityId entity, F&& handler) {
    if (auto rejected = reject_unless_idle("register_handler")) {
      return Result<HandlerId, AgentError>::failure(*rejected);
    }
    return to_agent_result(
        bus_->register_handler<E>(entity, std::forward<F>(handler)));
  }

  template <typename E, typename F>
  Result<HandlerId, AgentError> register_suspending_handler(F&& handler) {
    if (auto rejected = reject_unless_idle("register_suspending_handler")) {
      return Result<HandlerId, AgentError>::failure(*rejected);
    }
    return to_agent_result(
        bus_->register_suspending_handler<E>(std::forward<F>(handler)));
  }

  template <typename E, typename F>
  Result<HandlerId, AgentError> register_suspending_handler(EntityId entity,
                                                            F&& handler) {
    if (auto rejected = reject_unless_idle("register_suspending_handler")) {
      return Result<HandlerId, AgentError>::failure(*rejected);
    }
    return to_agent_result(bus_->register_suspending_handler<E>(
        entity, std::forward<F>(handler)));
  }

  template <typename S>
  Result<Unit, AgentError> register_system(std::shared_ptr<S> system) {
    if (auto rejected = reject_unless_idle("register_system")) {
      return Result<Unit, AgentError>::failure(*rejected);
    }
    executor_->register_system(std::move(system));
    return Result<Unit, AgentError>::success(Unit{});
  }

  Result<Unit, AgentError> add_event_source(
      std::unique_ptr<EventSource> source,
      OnFinish on_finish = OnFinish::Continue);

  EntityId create_entity() { return bus_->create_entity(); }

  // Enqueues an event on the merged stream, stamping its id and, when
  // configured, its default expiry. False once the agent is Stopped/Failed.
  bool post(AgentEvent event);

  // --- Lifecycle ---------------------------------------------------------------

  // Idle -> Running; spawns sources and the loop thread. Fails with
  // BuildError(AlreadyRunning) outside Idle, BuildError(MissingStrategy)
  // without a strategy and BuildError(InvalidConfig) when the config does
  // not validate.
  Result<Unit, AgentError> start();

  // Blocks until a started agent has stopped or failed. BuildError(NotStarted)
  // for an agent still Idle.
  Result<RunReport, AgentError> wait();

  // start() followed by the loop on the calling thread.
  Result<RunReport, AgentError> run();

  // Idempotent; returns immediately. Idle goes straight to Stopped.
  void shutdown();

  // --- Queries -----------------------------------------------------------------

  AgentState state() const { return state_.load(); }
  const AgentConfig& config() const { return config_; }
  AgentMetrics get_metrics() const;
  std::optional<SystemStatus> get_system_status(ExecutionId id) const;
  SystemMetrics get_system_metrics() const;
  nlohmann::json context_snapshot() const;

  EventBus& eventBus() { return *bus_; }
  const SystemExecutor& executor() const { return *executor_; }

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Answers one control command with a JSON document.
  //
  // @details
  // Supported commands:
  //   "PING"            {"status":"ok","response":"PONG"}
  //   "STATUS"          {"status":"ok","agent":..,"state":..,"metrics":{..}}
  //   "SYSTEMS"         {"status":"ok","systems":{..}}
  //   "EXECUTION <id>"  {"status":"ok","execution":{..}} or an error
  //   "CONTEXT"         {"status":"ok","context":{..}}
  //   "SHUTDOWN"        {"status":"ok","response":"Shutdown requested"}
  //   other             {"status":"error","response":"Unknown command: .."}
  //
  // Thread-safety: Safe from any thread (ControlServer calls it from its
  // own).
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

 private:
  struct Counters {
    std::atomic<std::uint64_t> events_received{0};
    std::atomic<std::uint64_t> events_expired{0};
    std::atomic<std::uint64_t> events_processed{0};
    std::atomic<std::uint64_t> strategy_errors{0};
    std::atomic<std::uint64_t> actions_applied{0};
    std::atomic<std::uint64_t> systems_executed{0};
    std::atomic<std::uint64_t> system_successes{0};
    std::atomic<std::uint64_t> system_failures{0};
    std::atomic<std::uint64_t> events_sent{0};
    std::atomic<std::uint64_t> event_send_failures{0};
    std::atomic<std::uint64_t> responses{0};
  };

  struct PendingSource {
    std::unique_ptr<EventSource> source;
    OnFinish on_finish{OnFinish::Continue};
  };

  // Result of handling one event: keep looping, or leave Running.
  struct Step {
    bool stop{false};
    StopReason reason{StopReason::ShutdownRequested};
    std::optional<StrategyError> fatal_error;
  };

  std::optional<AgentError> reject_unless_idle(const char* operation) const;

  template <typename T>
  static Result<T, AgentError> to_agent_result(Result<T, EventError> r) {
    if (r.ok()) {
      return Result<T, AgentError>::success(std::move(*r.value));
    }
    return Result<T, AgentError>::failure(AgentError::buildError(
        AgentError::BuildKind::DuplicateBinding,
        r.error ? r.error->message : "registration failed"));
  }

  Result<Unit, AgentError> launch();
  Result<RunReport, AgentError> loop();
  Step process(AgentEvent event);
  void apply(ExecuteSystem& action);
  void apply(SendEvent& action);
  void apply(UpdateContext& action);
  void publish_response(const AgentEvent& event, const std::string& text);

  // Moves state_ from `from` to `to` if it currently equals `from`, then
  // publishes AgentStateChanged. False if the state was something else.
  bool transition(AgentState from, AgentState to);

  void stop_sources();
  bool settle_executor();
  void on_source_failure(const std::string& source, const std::string& reason);
  void finish(Result<RunReport, AgentError> outcome);

  AgentConfig config_;
  std::optional<std::string> config_problem_;

  // Counters come before the executor: its completion listener writes them
  // until the executor is stopped.
  Counters counters_;

  LiveTimeProvider live_clock_;
  const ITimeProvider* clock_;

  std::unique_ptr<EventBus> bus_;
  std::unique_ptr<SystemExecutor> executor_;
  std::unique_ptr<Strategy> strategy_;

  mutable std::mutex context_mutex_;
  Context context_;

  SequenceGenerator event_ids_;
  ThreadSafeQueue<AgentEvent> queue_;

  std::vector<PendingSource> pending_sources_;
  std::vector<std::unique_ptr<SourceThread>> sources_;

  mutable std::mutex state_mutex_;
  std::atomic<AgentState> state_{AgentState::Idle};
  std::atomic<bool> shutdown_requested_{false};

  std::atomic<bool> source_failed_{false};
  std::string failure_source_;  // guarded by state_mutex_
  std::string failure_reason_;  // guarded by state_mutex_

  std::mutex outcome_mutex_;
  std::condition_variable outcome_cv_;
  std::optional<Result<RunReport, AgentError>> outcome_;

  std::mutex join_mutex_;
  std::thread loop_thread_;
};

}  // namespace amico
