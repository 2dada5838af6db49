#include "amico/engine/agent.hpp"

#include "amico/time/time_utils.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <variant>

namespace amico {

namespace {

nlohmann::json context_to_json(const SystemContext& ctx) {
  nlohmann::json transitions = nlohmann::json::array();
  for (SystemState s : ctx.transitions) {
    transitions.push_back(to_string(s));
  }
  nlohmann::json j;
  j["id"] = ctx.execution_id;
  j["system"] = ctx.system_name;
  j["priority"] = ctx.priority;
  j["state"] = to_string(ctx.status.state);
  j["started_at_ms"] = timestamp_to_ms(ctx.started_at);
  j["duration_ms"] = to_millis(ctx.status.duration);
  j["reason"] = ctx.status.reason;
  j["transitions"] = std::move(transitions);
  return j;
}

nlohmann::json metrics_to_json(const SystemMetrics& m) {
  nlohmann::json per_system = nlohmann::json::object();
  for (const auto& [name, s] : m.per_system) {
    per_system[name] = {
        {"executions", s.executions},
        {"completed", s.completed},
        {"failed", s.failed},
        {"cancelled", s.cancelled},
        {"average_ms", s.average_ms()},
        {"max_ms", to_millis(s.max_duration)},
    };
  }
  return nlohmann::json{
      {"total_executions", m.total_executions},
      {"completed", m.completed},
      {"failed", m.failed},
      {"cancelled", m.cancelled},
      {"in_flight", m.in_flight},
      {"history_size", m.history_size},
      {"per_system", std::move(per_system)},
  };
}

}  // namespace

const char* to_string(StopReason reason) {
  switch (reason) {
    case StopReason::ShutdownRequested:    return "ShutdownRequested";
    case StopReason::TerminateInstruction: return "TerminateInstruction";
    case StopReason::StrategyFinished:     return "StrategyFinished";
    case StopReason::StrategyFatal:        return "StrategyFatal";
    case StopReason::SourceFailure:        return "SourceFailure";
  }
  return "Unknown";
}

void to_json(nlohmann::json& j, const AgentMetrics& m) {
  j = nlohmann::json{
      {"events_received", m.events_received},
      {"events_expired", m.events_expired},
      {"events_processed", m.events_processed},
      {"strategy_errors", m.strategy_errors},
      {"actions_applied", m.actions_applied},
      {"systems_executed", m.systems_executed},
      {"system_successes", m.system_successes},
      {"system_failures", m.system_failures},
      {"events_sent", m.events_sent},
      {"event_send_failures", m.event_send_failures},
      {"responses", m.responses},
  };
}

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------
Agent::Agent(std::unique_ptr<Strategy> strategy, AgentConfig config)
    : Agent(std::move(strategy), nullptr, nullptr, std::move(config)) {}

Agent::Agent(std::unique_ptr<Strategy> strategy, std::unique_ptr<EventBus> bus,
             std::unique_ptr<SystemExecutor> executor, AgentConfig config,
             const ITimeProvider* clock)
    : config_(std::move(config)),
      config_problem_(validate(config_)),
      clock_(clock != nullptr ? clock : &live_clock_),
      bus_(bus ? std::move(bus) : std::make_unique<EventBus>()),
      executor_(executor ? std::move(executor)
                         : std::make_unique<SystemExecutor>(
                               config_.executor_workers,
                               config_.max_execution_history)),
      strategy_(std::move(strategy)) {
  executor_->set_completion_listener([this](const SystemContext& ctx) {
    if (ctx.status.state == SystemState::Completed) {
      counters_.system_successes.fetch_add(1);
    } else {
      counters_.system_failures.fetch_add(1);
    }
  });
}

// -----------------------------------------------------------------------------
// Destructor: RAII shutdown
// -----------------------------------------------------------------------------
Agent::~Agent() {
  shutdown();
  {
    std::lock_guard lock(join_mutex_);
    if (loop_thread_.joinable()) {
      loop_thread_.join();
    }
  }
  stop_sources();
  executor_->stop();
}

// -----------------------------------------------------------------------------
// Registration
// -----------------------------------------------------------------------------
std::optional<AgentError> Agent::reject_unless_idle(
    const char* operation) const {
  const AgentState current = state_.load();
  if (current == AgentState::Idle) {
    return std::nullopt;
  }
  return AgentError::buildError(
      AgentError::BuildKind::AlreadyRunning,
      std::string(operation) + " requires an Idle agent (state is " +
          to_string(current) + ")");
}

Result<Unit, AgentError> Agent::add_event_source(
    std::unique_ptr<EventSource> source, OnFinish on_finish) {
  if (auto rejected = reject_unless_idle("add_event_source")) {
    return Result<Unit, AgentError>::failure(*rejected);
  }
  if (!source) {
    return Result<Unit, AgentError>::failure(AgentError::buildError(
        AgentError::BuildKind::None, "add_event_source: null source"));
  }
  pending_sources_.push_back(PendingSource{std::move(source), on_finish});
  return Result<Unit, AgentError>::success(Unit{});
}

bool Agent::post(AgentEvent event) {
  if (is_terminal(state_.load())) {
    return false;
  }
  event.id = event_ids_.next_id();
  if (!event.expiry_ms && config_.default_event_lifetime) {
    event.expiry_ms = clock_->now_ms() + config_.default_event_lifetime->count();
  }
  queue_.push(std::move(event));
  return true;
}

// -----------------------------------------------------------------------------
// start() / run() / wait()
// -----------------------------------------------------------------------------
Result<Unit, AgentError> Agent::start() {
  auto launched = launch();
  if (launched.failed()) {
    return launched;
  }
  std::lock_guard lock(join_mutex_);
  loop_thread_ = std::thread([this] { finish(loop()); });
  return launched;
}

Result<RunReport, AgentError> Agent::run() {
  auto launched = launch();
  if (launched.failed()) {
    return Result<RunReport, AgentError>::failure(*launched.error);
  }
  auto outcome = loop();
  finish(outcome);
  return outcome;
}

Result<RunReport, AgentError> Agent::wait() {
  {
    std::unique_lock lock(outcome_mutex_);
    if (!outcome_ && state_.load() == AgentState::Idle) {
      return Result<RunReport, AgentError>::failure(AgentError::buildError(
          AgentError::BuildKind::NotStarted, "wait() on an agent never started"));
    }
    outcome_cv_.wait(lock, [this] { return outcome_.has_value(); });
  }
  {
    std::lock_guard lock(join_mutex_);
    if (loop_thread_.joinable() &&
        loop_thread_.get_id() != std::this_thread::get_id()) {
      loop_thread_.join();
    }
  }
  std::lock_guard lock(outcome_mutex_);
  return *outcome_;
}

// -----------------------------------------------------------------------------
// shutdown(): idempotent, any thread
// -----------------------------------------------------------------------------
void Agent::shutdown() {
  if (shutdown_requested_.exchange(true) || is_terminal(state_.load())) {
    return;
  }

  if (transition(AgentState::Idle, AgentState::Stopped)) {
    RunReport report;
    report.final_state = AgentState::Stopped;
    report.reason = StopReason::ShutdownRequested;
    finish(Result<RunReport, AgentError>::success(report));
    return;
  }

  std::cout << "[Agent] '" << config_.name << "' shutdown requested.\n";
  queue_.wake();
}

// -----------------------------------------------------------------------------
// launch(): Idle -> Running, start executor and sources
// -----------------------------------------------------------------------------
Result<Unit, AgentError> Agent::launch() {
  using Out = Result<Unit, AgentError>;

  if (!strategy_) {
    return Out::failure(AgentError::buildError(
        AgentError::BuildKind::MissingStrategy, "agent has no strategy"));
  }
  if (config_problem_) {
    return Out::failure(AgentError::buildError(
        AgentError::BuildKind::InvalidConfig, *config_problem_));
  }
  if (!transition(AgentState::Idle, AgentState::Running)) {
    return Out::failure(*reject_unless_idle("start"));
  }

  executor_->start();

  for (auto& pending : pending_sources_) {
    sources_.push_back(std::make_unique<SourceThread>(
        std::move(pending.source), pending.on_finish,
        [this](AgentEvent event) { post(std::move(event)); },
        [this](const std::string& source, const std::string& reason) {
          on_source_failure(source, reason);
        }));
  }
  pending_sources_.clear();
  for (auto& source : sources_) {
    source->start();
  }

  std::cout << "[Agent] '" << config_.name << "' started with strategy '"
            << strategy_->name() << "', " << sources_.size()
            << " source(s), " << config_.executor_workers
            << " executor worker(s).\n";
  return Out::success(Unit{});
}

// -----------------------------------------------------------------------------
// loop(): the perceive/decide/act cycle
// -----------------------------------------------------------------------------
Result<RunReport, AgentError> Agent::loop() {
  Step step;
  for (;;) {
    if (source_failed_.load()) {
      std::string source;
      std::string reason;
      {
        std::lock_guard lock(state_mutex_);
        source = failure_source_;
        reason = failure_reason_;
      }
      transition(AgentState::Running, AgentState::Failed);
      stop_sources();
      settle_executor();
      queue_.clear();
      return Result<RunReport, AgentError>::failure(
          AgentError::sourceFailure(source, reason));
    }

    if (shutdown_requested_.load()) {
      step.stop = true;
      step.reason = StopReason::ShutdownRequested;
      break;
    }

    std::optional<AgentEvent> next = queue_.pop_for(config_.poll_interval);
    if (!next) {
      continue;
    }

    step = process(std::move(*next));
    if (step.stop) {
      break;
    }
  }

  // --- Draining ---------------------------------------------------------------
  transition(AgentState::Running, AgentState::Draining);
  stop_sources();
  settle_executor();

  RunReport report;
  report.reason = step.reason;
  report.fatal_error = step.fatal_error;
  report.events_dropped = queue_.clear();
  report.events_processed = counters_.events_processed.load();

  transition(AgentState::Draining, AgentState::Stopped);
  report.final_state = AgentState::Stopped;

  std::cout << "[Agent] '" << config_.name << "' stopped ("
            << to_string(report.reason) << "), " << report.events_processed
            << " event(s) processed, " << report.events_dropped
            << " dropped.\n";
  return Result<RunReport, AgentError>::success(std::move(report));
}

// -----------------------------------------------------------------------------
// process(event): one end-to-end event
// -----------------------------------------------------------------------------
Agent::Step Agent::process(AgentEvent event) {
  Step step;
  counters_.events_received.fetch_add(1);

  if (event.is_expired(clock_->now_ms())) {
    counters_.events_expired.fetch_add(1);
    std::cout << "[Agent] dropped expired event #" << event.id << " '"
              << event.name << "' from " << event.source << ".\n";
    return step;
  }

  if (event.is_terminate()) {
    std::cout << "[Agent] terminate instruction from " << event.source
              << ".\n";
    step.stop = true;
    step.reason = StopReason::TerminateInstruction;
    return step;
  }

  StrategyOutcome outcome;
  {
    std::lock_guard lock(context_mutex_);
    try {
      outcome = strategy_->process_event(event, context_, *executor_);
    } catch (const std::exception& e) {
      outcome = StrategyOutcome::failure(
          StrategyError::fatal(std::string("strategy threw: ") + e.what()));
    } catch (...) {
      outcome = StrategyOutcome::failure(
          StrategyError::fatal("strategy threw an unknown exception"));
    }
  }

  if (!outcome.ok()) {
    const StrategyError error = outcome.error.value_or(
        StrategyError::fatal("strategy returned an empty result"));
    counters_.strategy_errors.fetch_add(1);
    std::cerr << "[Agent] strategy '" << strategy_->name() << "' "
              << to_string(error.kind) << " error on event #" << event.id
              << " '" << event.name << "': " << error.message << "\n";
    if (error.kind == StrategyError::Kind::Fatal) {
      step.stop = true;
      step.reason = StopReason::StrategyFatal;
      step.fatal_error = error;
    }
    return step;
  }

  StrategyResult& result = *outcome.value;
  for (AgentAction& action : result.actions) {
    std::visit([this](auto& a) { apply(a); }, action);
    counters_.actions_applied.fetch_add(1);
  }

  if (result.response) {
    publish_response(event, *result.response);
  }
  counters_.events_processed.fetch_add(1);

  if (!result.should_continue) {
    step.stop = true;
    step.reason = StopReason::StrategyFinished;
  }
  return step;
}

// -----------------------------------------------------------------------------
// Actions
// -----------------------------------------------------------------------------
void Agent::apply(ExecuteSystem& action) {
  if (!action.dispatch) {
    counters_.system_failures.fetch_add(1);
    std::cerr << "[Agent] ExecuteSystem without a dispatcher ignored.\n";
    return;
  }

  auto ticket = action.dispatch(*executor_);
  if (ticket.failed()) {
    counters_.system_failures.fetch_add(1);
    std::cerr << "[Agent] execute failed: " << ticket.error->message << "\n";
    return;
  }
  counters_.systems_executed.fetch_add(1);

  if (!action.wait) {
    return;
  }

  auto output = ticket.value->await(config_.system_wait_timeout);
  if (output.failed()) {
    std::cerr << "[Agent] execution " << ticket.value->id << " "
              << to_string(output.error->kind) << ": "
              << output.error->message << "\n";
    return;
  }
  if (action.result_key) {
    std::lock_guard lock(context_mutex_);
    context_.set(*action.result_key, std::move(*output.value));
  }
}

void Agent::apply(SendEvent& action) {
  if (!action.dispatch) {
    counters_.event_send_failures.fetch_add(1);
    std::cerr << "[Agent] SendEvent without a dispatcher ignored.\n";
    return;
  }

  auto sent = action.dispatch(*bus_);
  if (sent.failed()) {
    counters_.event_send_failures.fetch_add(1);
    std::cerr << "[Agent] send of " << action.event_name << " failed ("
              << to_string(sent.error->kind) << "): " << sent.error->message
              << "\n";
    return;
  }
  counters_.events_sent.fetch_add(1);
}

void Agent::apply(UpdateContext& action) {
  std::lock_guard lock(context_mutex_);
  context_.set(action.key, std::move(action.value));
}

void Agent::publish_response(const AgentEvent& event, const std::string& text) {
  counters_.responses.fetch_add(1);
  std::cout << "[Agent] response to #" << event.id << " '" << event.name
            << "': " << text << "\n";

  auto sent = bus_->send(AgentResponse{config_.name, event.id, event.name, text});
  if (sent.failed()) {
    std::cerr << "[Agent] AgentResponse handlers failed: "
              << sent.error->message << "\n";
  }
}

// -----------------------------------------------------------------------------
// State transitions
// -----------------------------------------------------------------------------
bool Agent::transition(AgentState from, AgentState to) {
  {
    std::lock_guard lock(state_mutex_);
    if (state_.load() != from) {
      return false;
    }
    state_.store(to);
  }

  std::cout << "[Agent] '" << config_.name << "' " << to_string(from) << " -> "
            << to_string(to) << "\n";

  auto sent = bus_->send(AgentStateChanged{config_.name, from, to});
  if (sent.failed()) {
    std::cerr << "[Agent] AgentStateChanged handlers failed: "
              << sent.error->message << "\n";
  }
  return true;
}

void Agent::stop_sources() {
  for (auto& source : sources_) {
    source->stop();
  }
}

// Waits for in-flight executions, then joins the executor's workers so the
// completion listener has run for every finished invocation.
bool Agent::settle_executor() {
  if (executor_->drain(config_.drain_timeout)) {
    executor_->stop();
    return true;
  }
  std::cerr << "[Agent] drain timed out after " << config_.drain_timeout.count()
            << "ms; " << executor_->get_system_metrics().in_flight
            << " execution(s) still in flight.\n";
  return false;
}

void Agent::on_source_failure(const std::string& source,
                              const std::string& reason) {
  {
    std::lock_guard lock(state_mutex_);
    if (source_failed_.load()) {
      return;
    }
    failure_source_ = source;
    failure_reason_ = reason;
    source_failed_.store(true);
  }
  queue_.wake();
}

void Agent::finish(Result<RunReport, AgentError> outcome) {
  {
    std::lock_guard lock(outcome_mutex_);
    outcome_ = std::move(outcome);
  }
  outcome_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
AgentMetrics Agent::get_metrics() const {
  AgentMetrics m;
  m.events_received = counters_.events_received.load();
  m.events_expired = counters_.events_expired.load();
  m.events_processed = counters_.events_processed.load();
  m.strategy_errors = counters_.strategy_errors.load();
  m.actions_applied = counters_.actions_applied.load();
  m.systems_executed = counters_.systems_executed.load();
  m.system_successes = counters_.system_successes.load();
  m.system_failures = counters_.system_failures.load();
  m.events_sent = counters_.events_sent.load();
  m.event_send_failures = counters_.event_send_failures.load();
  m.responses = counters_.responses.load();
  return m;
}

std::optional<SystemStatus> Agent::get_system_status(ExecutionId id) const {
  return executor_->get_execution_status(id);
}

SystemMetrics Agent::get_system_metrics() const {
  return executor_->get_system_metrics();
}

nlohmann::json Agent::context_snapshot() const {
  std::lock_guard lock(context_mutex_);
  return context_.to_json();
}

// -----------------------------------------------------------------------------
// executeCommand(): control surface
// -----------------------------------------------------------------------------
std::string Agent::executeCommand(const std::string& cmd) {
  static const std::string kExecutionPrefix = "EXECUTION ";
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["agent"] = config_.name;
    response["state"] = to_string(state());
    response["queued_events"] = queue_.size();
    response["metrics"] = get_metrics();
  } else if (cmd == "SYSTEMS") {
    response["status"] = "ok";
    response["systems"] = metrics_to_json(get_system_metrics());
  } else if (cmd.compare(0, kExecutionPrefix.size(), kExecutionPrefix) == 0) {
    const std::string arg = cmd.substr(kExecutionPrefix.size());
    std::optional<ExecutionId> id;
    try {
      std::size_t used = 0;
      id = std::stoull(arg, &used);
      if (used != arg.size()) {
        id.reset();
      }
    } catch (const std::invalid_argument&) {
      id.reset();
    } catch (const std::out_of_range&) {
      id.reset();
    }

    if (!id) {
      response["status"] = "error";
      response["response"] = "Invalid execution id: " + arg;
    } else if (auto ctx = executor_->get_execution_context(*id)) {
      response["status"] = "ok";
      response["execution"] = context_to_json(*ctx);
    } else {
      response["status"] = "error";
      response["response"] = SystemError::notFound("execution " + arg).message;
    }
  } else if (cmd == "CONTEXT") {
    response["status"] = "ok";
    response["context"] = context_snapshot();
  } else if (cmd == "SHUTDOWN") {
    shutdown();
    response["status"] = "ok";
    response["response"] = "Shutdown requested";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace amico
