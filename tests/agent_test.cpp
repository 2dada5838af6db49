// =============================================================================
// agent_test.cpp
// =============================================================================
// Unit tests for amico::Agent, the perceive/decide/act loop.
//
// Validates:
//   - Lifecycle Idle -> Running -> Draining -> Stopped, published on the bus
//   - shutdown() is idempotent; shutdown of an Idle agent stops it directly
//   - Stop conditions: "terminate" event, Terminate instruction, Fatal
//     strategy error, thrown exception, failing event source
//   - Recoverable strategy errors skip only the offending event
//   - Registration outside Idle and bad construction are rejected
//   - Event expiry against an injected SimulationTimeProvider
//   - Actions: ExecuteSystem (awaited, result stored), SendEvent,
//     UpdateContext, and the AgentResponse broadcast
//   - The control command surface
//   - Non-std::exception throws from a strategy or a source stay typed
//   - Mistyped external content is a Recoverable error, not Fatal
//
// Most tests post their events before run(), so the loop sees a fixed,
// ordered stream and the test needs no sleeps.
// =============================================================================

#include "amico/engine/agent.hpp"
#include "amico/strategy/rule_strategy.hpp"
#include "amico/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using nlohmann::json;

namespace {

using amico::AgentEvent;
using amico::AgentState;
using amico::Context;
using amico::StrategyOutcome;
using amico::StrategyResult;
using amico::SystemExecutor;

class EchoSystem final : public amico::System<std::string, std::string> {
 public:
  std::string name() const override { return "Echo"; }
  amico::Result<std::string, std::string> run(
      const std::string& input) override {
    return amico::Result<std::string, std::string>::success(input);
  }
};

// Never registered with any agent.
class UnboundSystem final : public amico::System<int, int> {
 public:
  std::string name() const override { return "Unbound"; }
  amico::Result<int, std::string> run(const int& input) override {
    return amico::Result<int, std::string>::success(input);
  }
};

struct Note {
  static constexpr const char* kName = "Note";
  std::string text;
};

struct Poke : amico::TargetedEvent {
  static constexpr const char* kName = "Poke";
};

// Emits a fixed list of events, then returns.
class ScriptedSource final : public amico::EventSource {
 public:
  explicit ScriptedSource(std::vector<std::string> names)
      : names_(std::move(names)) {}

  std::string name() const override { return "script"; }

  void run(const Sink& sink) override {
    for (const auto& n : names_) {
      sink(AgentEvent::make(n, name()));
    }
  }

  void stop() override {}

 private:
  std::vector<std::string> names_;
};

class FailingSource final : public amico::EventSource {
 public:
  std::string name() const override { return "broken"; }
  void run(const Sink&) override {
    throw std::runtime_error("connection refused");
  }
  void stop() override {}
};

// Throws a value that is not a std::exception.
class IntThrowingSource final : public amico::EventSource {
 public:
  std::string name() const override { return "int-thrower"; }
  void run(const Sink&) override { throw 7; }
  void stop() override {}
};

StrategyOutcome ok_result() {
  return StrategyOutcome::success(StrategyResult::proceed());
}

// Rule that accepts the event and does nothing.
StrategyOutcome accept(const AgentEvent&, Context&, const SystemExecutor&) {
  return ok_result();
}

// Thread-safe recorder of AgentStateChanged notifications.
class StateLog {
 public:
  void attach(amico::Agent& agent) {
    auto r = agent.register_handler<amico::AgentStateChanged>(
        [this](const amico::AgentStateChanged& e) {
          std::lock_guard lock(mutex_);
          transitions_.emplace_back(e.from, e.to);
        });
    ASSERT_TRUE(r.ok());
  }

  std::vector<std::pair<AgentState, AgentState>> transitions() {
    std::lock_guard lock(mutex_);
    return transitions_;
  }

 private:
  std::mutex mutex_;
  std::vector<std::pair<AgentState, AgentState>> transitions_;
};

std::unique_ptr<amico::RuleStrategy> accepting(
    const std::vector<std::string>& names) {
  auto strategy = std::make_unique<amico::RuleStrategy>("test");
  for (const auto& n : names) {
    strategy->on(n, accept);
  }
  return strategy;
}

}  // namespace

// =============================================================================
// Test 1: run() with a finite source drives the full lifecycle
// =============================================================================
TEST(AgentTest, LifecycleWithFiniteSource) {
  amico::Agent agent(accepting({"a", "b"}));
  StateLog log;
  log.attach(agent);

  ASSERT_TRUE(agent
                  .add_event_source(std::make_unique<ScriptedSource>(
                                        std::vector<std::string>{"a", "b"}),
                                    amico::OnFinish::Stop)
                  .ok());

  auto outcome = agent.run();

  ASSERT_TRUE(outcome.ok()) << outcome.error->message;
  EXPECT_EQ(outcome.value->reason, amico::StopReason::TerminateInstruction);
  EXPECT_EQ(outcome.value->final_state, AgentState::Stopped);
  EXPECT_EQ(outcome.value->events_processed, 2u);
  EXPECT_EQ(agent.state(), AgentState::Stopped);

  using T = std::pair<AgentState, AgentState>;
  EXPECT_EQ(log.transitions(),
            (std::vector<T>{{AgentState::Idle, AgentState::Running},
                            {AgentState::Running, AgentState::Draining},
                            {AgentState::Draining, AgentState::Stopped}}));

  auto metrics = agent.get_metrics();
  EXPECT_EQ(metrics.events_received, 3u);  // a, b, terminate
  EXPECT_EQ(metrics.events_processed, 2u);
}

// =============================================================================
// Test 2: shutdown() from another thread is idempotent
// =============================================================================
TEST(AgentTest, ShutdownIsIdempotent) {
  amico::Agent agent(accepting({}));

  ASSERT_TRUE(agent.start().ok());
  EXPECT_EQ(agent.state(), AgentState::Running);

  agent.shutdown();
  agent.shutdown();

  auto outcome = agent.wait();
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value->reason, amico::StopReason::ShutdownRequested);
  EXPECT_EQ(agent.state(), AgentState::Stopped);

  agent.shutdown();
  auto again = agent.wait();
  ASSERT_TRUE(again.ok());
  EXPECT_EQ(again.value->reason, amico::StopReason::ShutdownRequested);
}

// =============================================================================
// Test 3: An Idle agent stops directly; it cannot be started afterwards
// =============================================================================
TEST(AgentTest, ShutdownWhileIdle) {
  amico::Agent agent(accepting({}));

  auto not_started = agent.wait();
  ASSERT_TRUE(not_started.failed());
  EXPECT_EQ(not_started.error->build, amico::AgentError::BuildKind::NotStarted);

  agent.shutdown();
  EXPECT_EQ(agent.state(), AgentState::Stopped);

  auto outcome = agent.wait();
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value->events_processed, 0u);

  auto restarted = agent.start();
  ASSERT_TRUE(restarted.failed());
  EXPECT_EQ(restarted.error->build, amico::AgentError::BuildKind::AlreadyRunning);
  EXPECT_FALSE(agent.post(AgentEvent::make("late", "test")));
}

// =============================================================================
// Test 4: A "terminate" event finishes the strategy; later events are dropped
// =============================================================================
TEST(AgentTest, TerminateEventStopsLoop) {
  auto strategy = std::make_unique<amico::RuleStrategy>("test");
  std::vector<std::string> seen;
  strategy->otherwise([&seen](const AgentEvent& e, Context&,
                              const SystemExecutor&) {
    seen.push_back(e.name);
    return ok_result();
  });

  amico::Agent agent(std::move(strategy));
  ASSERT_TRUE(agent.post(AgentEvent::make("a", "test")));
  ASSERT_TRUE(agent.post(AgentEvent::make("terminate", "test")));
  ASSERT_TRUE(agent.post(AgentEvent::make("b", "test")));

  auto outcome = agent.run();

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value->reason, amico::StopReason::StrategyFinished);
  EXPECT_EQ(outcome.value->events_processed, 2u);
  EXPECT_EQ(outcome.value->events_dropped, 1u);
  EXPECT_EQ(seen, (std::vector<std::string>{"a"}));
}

// =============================================================================
// Test 5: The Terminate instruction stops the loop without the strategy
// =============================================================================
TEST(AgentTest, TerminateInstructionStopsLoop) {
  amico::Agent agent(accepting({"a", "b"}));
  ASSERT_TRUE(agent.post(AgentEvent::make("a", "test")));
  ASSERT_TRUE(agent.post(AgentEvent::terminate("test")));
  ASSERT_TRUE(agent.post(AgentEvent::make("b", "test")));

  auto outcome = agent.run();

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value->reason, amico::StopReason::TerminateInstruction);
  EXPECT_EQ(outcome.value->events_processed, 1u);
  EXPECT_EQ(outcome.value->events_dropped, 1u);
}

// =============================================================================
// Test 6: Recoverable errors skip the event; Fatal errors stop the agent
// =============================================================================
TEST(AgentTest, RecoverableThenFatal) {
  auto strategy = accepting({"a"});
  strategy->on("oops", [](const AgentEvent&, Context&, const SystemExecutor&) {
    return StrategyOutcome::failure(
        amico::StrategyError::recoverable("try again"));
  });
  strategy->on("boom", [](const AgentEvent&, Context&, const SystemExecutor&) {
    return StrategyOutcome::failure(amico::StrategyError::fatal("broken"));
  });

  amico::Agent agent(std::move(strategy));
  for (const char* n : {"a", "oops", "unknown", "a", "boom", "a"}) {
    ASSERT_TRUE(agent.post(AgentEvent::make(n, "test")));
  }

  auto outcome = agent.run();

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value->reason, amico::StopReason::StrategyFatal);
  ASSERT_TRUE(outcome.value->fatal_error.has_value());
  EXPECT_EQ(outcome.value->fatal_error->message, "broken");
  EXPECT_EQ(outcome.value->final_state, AgentState::Stopped);
  EXPECT_EQ(outcome.value->events_processed, 2u);
  EXPECT_EQ(outcome.value->events_dropped, 1u);

  // "oops", "unknown" (no rule) and "boom".
  EXPECT_EQ(agent.get_metrics().strategy_errors, 3u);
}

// =============================================================================
// Test 7: An exception escaping the strategy is treated as Fatal
// =============================================================================
TEST(AgentTest, StrategyExceptionIsFatal) {
  auto strategy = std::make_unique<amico::RuleStrategy>("test");
  strategy->on("throw", [](const AgentEvent&, Context&,
                           const SystemExecutor&) -> StrategyOutcome {
    throw std::logic_error("unexpected input");
  });

  amico::Agent agent(std::move(strategy));
  ASSERT_TRUE(agent.post(AgentEvent::make("throw", "test")));

  auto outcome = agent.run();

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value->reason, amico::StopReason::StrategyFatal);
  ASSERT_TRUE(outcome.value->fatal_error.has_value());
  EXPECT_EQ(outcome.value->fatal_error->kind, amico::StrategyError::Kind::Fatal);
  EXPECT_NE(outcome.value->fatal_error->message.find("unexpected input"),
            std::string::npos);
}

// =============================================================================
// Test 8: A source that throws fails the agent with SourceFailure
// =============================================================================
TEST(AgentTest, FailingSourceFailsAgent) {
  amico::Agent agent(accepting({}));
  StateLog log;
  log.attach(agent);
  ASSERT_TRUE(agent.add_event_source(std::make_unique<FailingSource>()).ok());

  auto outcome = agent.run();

  ASSERT_TRUE(outcome.failed());
  EXPECT_EQ(outcome.error->kind, amico::AgentError::Kind::SourceFailure);
  EXPECT_NE(outcome.error->message.find("broken"), std::string::npos);
  EXPECT_NE(outcome.error->message.find("connection refused"),
            std::string::npos);
  EXPECT_EQ(agent.state(), AgentState::Failed);

  auto transitions = log.transitions();
  ASSERT_FALSE(transitions.empty());
  EXPECT_EQ(transitions.back().second, AgentState::Failed);

  auto waited = agent.wait();
  ASSERT_TRUE(waited.failed());
  EXPECT_EQ(waited.error->kind, amico::AgentError::Kind::SourceFailure);
}

// =============================================================================
// Test 9: Registration is rejected once the agent has started
// =============================================================================
TEST(AgentTest, RegistrationRequiresIdle) {
  amico::Agent agent(accepting({}));
  ASSERT_TRUE(agent.start().ok());

  auto system = agent.register_system(std::make_shared<EchoSystem>());
  ASSERT_TRUE(system.failed());
  EXPECT_EQ(system.error->build, amico::AgentError::BuildKind::AlreadyRunning);

  auto handler = agent.register_handler<Note>([](const Note&) {});
  ASSERT_TRUE(handler.failed());
  EXPECT_EQ(handler.error->build, amico::AgentError::BuildKind::AlreadyRunning);

  auto source = agent.add_event_source(
      std::make_unique<ScriptedSource>(std::vector<std::string>{}));
  ASSERT_TRUE(source.failed());

  auto second = agent.start();
  ASSERT_TRUE(second.failed());
  EXPECT_EQ(second.error->build, amico::AgentError::BuildKind::AlreadyRunning);

  agent.shutdown();
  ASSERT_TRUE(agent.wait().ok());
}

// =============================================================================
// Test 10: Missing strategy, invalid config and duplicate bindings
// =============================================================================
TEST(AgentTest, BuildErrors) {
  amico::Agent no_strategy(nullptr);
  auto missing = no_strategy.start();
  ASSERT_TRUE(missing.failed());
  EXPECT_EQ(missing.error->build, amico::AgentError::BuildKind::MissingStrategy);
  EXPECT_EQ(no_strategy.state(), AgentState::Idle);

  amico::AgentConfig bad;
  bad.executor_workers = 0;
  amico::Agent misconfigured(accepting({}), bad);
  auto invalid = misconfigured.start();
  ASSERT_TRUE(invalid.failed());
  EXPECT_EQ(invalid.error->build, amico::AgentError::BuildKind::InvalidConfig);

  amico::Agent agent(accepting({}));
  const amico::EntityId target = agent.create_entity();
  ASSERT_TRUE(agent.register_handler<Poke>(target, [](const Poke&) {}).ok());
  auto duplicate = agent.register_handler<Poke>(target, [](const Poke&) {});
  ASSERT_TRUE(duplicate.failed());
  EXPECT_EQ(duplicate.error->build,
            amico::AgentError::BuildKind::DuplicateBinding);
}

// =============================================================================
// Test 11: Expired events are dropped before the strategy sees them
// =============================================================================
TEST(AgentTest, ExpiredEventsAreDropped) {
  amico::SimulationTimeProvider clock(1000);
  amico::AgentConfig config;
  config.default_event_lifetime = 100ms;

  auto strategy = std::make_unique<amico::RuleStrategy>("test");
  std::vector<std::string> seen;
  strategy->otherwise([&seen](const AgentEvent& e, Context&,
                              const SystemExecutor&) {
    seen.push_back(e.name);
    return ok_result();
  });

  amico::Agent agent(std::move(strategy), nullptr, nullptr, config, &clock);

  ASSERT_TRUE(agent.post(AgentEvent::make("old", "test")));  // expires 1100
  AgentEvent pinned = AgentEvent::make("pinned", "test");
  pinned.expiry_ms = 5000;
  ASSERT_TRUE(agent.post(pinned));

  clock.advance_time(2000);
  ASSERT_TRUE(agent.post(AgentEvent::make("new", "test")));  // expires 2100
  ASSERT_TRUE(agent.post(AgentEvent::terminate("test")));

  auto outcome = agent.run();

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(seen, (std::vector<std::string>{"pinned", "new"}));
  EXPECT_EQ(agent.get_metrics().events_expired, 1u);
  EXPECT_EQ(outcome.value->events_processed, 2u);
}

// =============================================================================
// Test 12: ExecuteSystem and UpdateContext actions run in order
// =============================================================================
TEST(AgentTest, SystemAndContextActions) {
  auto strategy = std::make_unique<amico::RuleStrategy>("test");
  strategy->on("ping", [](const AgentEvent&, Context&, const SystemExecutor&) {
    StrategyResult result;
    result.then(amico::UpdateContext{"step", 1})
        .then(amico::ExecuteSystem::of<EchoSystem>("pong").awaiting("echo"))
        .then(amico::UpdateContext{"step", 2});
    return StrategyOutcome::success(std::move(result));
  });
  strategy->on("unbound", [](const AgentEvent&, Context&,
                             const SystemExecutor&) {
    return StrategyOutcome::success(
        StrategyResult::proceed().then(
            amico::ExecuteSystem::of<UnboundSystem>(3)));
  });
  // The executor is visible read-only while deciding.
  strategy->on("count", [](const AgentEvent&, Context& ctx,
                           const SystemExecutor& executor) {
    ctx.set("completed", executor.get_system_metrics().completed);
    return ok_result();
  });

  amico::Agent agent(std::move(strategy));
  ASSERT_TRUE(agent.register_system(std::make_shared<EchoSystem>()).ok());

  for (const char* n : {"ping", "unbound", "count", "terminate"}) {
    ASSERT_TRUE(agent.post(AgentEvent::make(n, "test")));
  }

  auto outcome = agent.run();
  ASSERT_TRUE(outcome.ok());

  const json context = agent.context_snapshot();
  EXPECT_EQ(context.at("echo"), json("pong"));
  EXPECT_EQ(context.at("step"), json(2));
  EXPECT_EQ(context.at("completed"), json(1));

  auto metrics = agent.get_metrics();
  EXPECT_EQ(metrics.systems_executed, 1u);
  EXPECT_EQ(metrics.system_successes, 1u);
  EXPECT_EQ(metrics.system_failures, 1u);  // the unbound dispatch
  EXPECT_EQ(metrics.actions_applied, 4u);

  auto status = agent.get_system_status(1);
  ASSERT_TRUE(status.has_value());
  EXPECT_EQ(status->state, amico::SystemState::Completed);
}

// =============================================================================
// Test 13: SendEvent reaches bus handlers; responses are broadcast
// =============================================================================
TEST(AgentTest, SendEventAndResponses) {
  auto strategy = std::make_unique<amico::RuleStrategy>("test");
  strategy->on("note", [](const AgentEvent& e, Context&,
                          const SystemExecutor&) {
    auto text = e.content_as<std::string>().value_or("");
    StrategyResult result;
    result.then(amico::SendEvent::of(Note{text})).respond("noted " + text);
    return StrategyOutcome::success(std::move(result));
  });
  strategy->on("poke", [](const AgentEvent&, Context&, const SystemExecutor&) {
    // Nobody is bound to this entity.
    return StrategyOutcome::success(StrategyResult::proceed().then(
        amico::SendEvent::to(amico::EntityId::allocate(), Poke{})));
  });

  amico::Agent agent(std::move(strategy));

  std::vector<std::string> notes;
  std::vector<std::pair<std::uint64_t, std::string>> responses;
  ASSERT_TRUE(agent
                  .register_handler<Note>(
                      [&notes](const Note& n) { notes.push_back(n.text); })
                  .ok());
  ASSERT_TRUE(agent
                  .register_handler<amico::AgentResponse>(
                      [&responses](const amico::AgentResponse& r) {
                        responses.emplace_back(r.event_id, r.text);
                      })
                  .ok());

  AgentEvent first = AgentEvent::make("note", "test", json("one"));
  ASSERT_TRUE(agent.post(first));
  ASSERT_TRUE(agent.post(AgentEvent::make("poke", "test")));
  ASSERT_TRUE(agent.post(AgentEvent::make("note", "test", json("two"))));
  ASSERT_TRUE(agent.post(AgentEvent::terminate("test")));

  ASSERT_TRUE(agent.run().ok());

  EXPECT_EQ(notes, (std::vector<std::string>{"one", "two"}));
  ASSERT_EQ(responses.size(), 2u);
  EXPECT_EQ(responses[0].second, "noted one");
  EXPECT_EQ(responses[1].second, "noted two");
  EXPECT_LT(responses[0].first, responses[1].first);

  auto metrics = agent.get_metrics();
  EXPECT_EQ(metrics.events_sent, 2u);
  EXPECT_EQ(metrics.event_send_failures, 1u);
  EXPECT_EQ(metrics.responses, 2u);
}

// =============================================================================
// Test 14: Control commands
// =============================================================================
TEST(AgentTest, ExecuteCommand) {
  auto strategy = std::make_unique<amico::RuleStrategy>("test");
  strategy->on("echo", [](const AgentEvent&, Context&, const SystemExecutor&) {
    StrategyResult result;
    result.then(amico::ExecuteSystem::of<EchoSystem>("x").awaiting())
        .then(amico::UpdateContext{"k", "v"});
    return StrategyOutcome::success(std::move(result));
  });
  amico::Agent agent(std::move(strategy));
  ASSERT_TRUE(agent.register_system(std::make_shared<EchoSystem>()).ok());

  auto ping = json::parse(agent.executeCommand("PING"));
  EXPECT_EQ(ping.at("response"), "PONG");

  auto status = json::parse(agent.executeCommand("STATUS"));
  EXPECT_EQ(status.at("status"), "ok");
  EXPECT_EQ(status.at("state"), "Idle");
  EXPECT_EQ(status.at("agent"), "amico");
  EXPECT_TRUE(status.at("metrics").contains("events_processed"));

  ASSERT_TRUE(agent.post(AgentEvent::make("echo", "test")));
  ASSERT_TRUE(agent.post(AgentEvent::make("terminate", "test")));
  ASSERT_TRUE(agent.run().ok());

  auto execution = json::parse(agent.executeCommand("EXECUTION 1"));
  EXPECT_EQ(execution.at("status"), "ok");
  EXPECT_EQ(execution.at("execution").at("state"), "Completed");
  EXPECT_EQ(execution.at("execution").at("system"), "Echo");

  auto missing = json::parse(agent.executeCommand("EXECUTION 999"));
  EXPECT_EQ(missing.at("status"), "error");
  auto garbage = json::parse(agent.executeCommand("EXECUTION abc"));
  EXPECT_EQ(garbage.at("status"), "error");

  auto systems = json::parse(agent.executeCommand("SYSTEMS"));
  EXPECT_EQ(systems.at("systems").at("completed"), 1);

  auto context = json::parse(agent.executeCommand("CONTEXT"));
  EXPECT_EQ(context.at("context").at("k"), "v");

  auto unknown = json::parse(agent.executeCommand("FLY"));
  EXPECT_EQ(unknown.at("status"), "error");
  EXPECT_EQ(unknown.at("response"), "Unknown command: FLY");
}

// =============================================================================
// Test 15: SHUTDOWN command stops a running agent
// =============================================================================
TEST(AgentTest, ShutdownCommand) {
  amico::Agent agent(accepting({}));
  ASSERT_TRUE(agent.start().ok());

  auto reply = json::parse(agent.executeCommand("SHUTDOWN"));
  EXPECT_EQ(reply.at("status"), "ok");

  auto outcome = agent.wait();
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value->reason, amico::StopReason::ShutdownRequested);
  EXPECT_EQ(agent.state(), AgentState::Stopped);
}

// =============================================================================
// Test 16: A strategy throwing a non-std::exception value is Fatal
// =============================================================================
TEST(AgentTest, StrategyUnknownExceptionIsFatal) {
  auto strategy = std::make_unique<amico::RuleStrategy>("test");
  strategy->on("throw", [](const AgentEvent&, Context&,
                           const SystemExecutor&) -> StrategyOutcome {
    throw 42;
  });

  amico::Agent agent(std::move(strategy));
  ASSERT_TRUE(agent.post(AgentEvent::make("throw", "test")));

  auto outcome = agent.run();

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value->reason, amico::StopReason::StrategyFatal);
  ASSERT_TRUE(outcome.value->fatal_error.has_value());
  EXPECT_EQ(outcome.value->fatal_error->kind, amico::StrategyError::Kind::Fatal);
  EXPECT_NE(outcome.value->fatal_error->message.find("unknown exception"),
            std::string::npos);
  EXPECT_EQ(agent.state(), AgentState::Stopped);
}

// =============================================================================
// Test 17: A source throwing a non-std::exception value is a SourceFailure
// =============================================================================
TEST(AgentTest, SourceUnknownExceptionFailsAgent) {
  amico::Agent agent(accepting({}));
  ASSERT_TRUE(
      agent.add_event_source(std::make_unique<IntThrowingSource>()).ok());

  auto outcome = agent.run();

  ASSERT_TRUE(outcome.failed());
  EXPECT_EQ(outcome.error->kind, amico::AgentError::Kind::SourceFailure);
  EXPECT_NE(outcome.error->message.find("int-thrower"), std::string::npos);
  EXPECT_NE(outcome.error->message.find("unknown exception"),
            std::string::npos);
  EXPECT_EQ(agent.state(), AgentState::Failed);
}

// =============================================================================
// Test 18: Mistyped content fields are rejected as Recoverable
// =============================================================================
TEST(AgentTest, MistypedContentIsRecoverable) {
  auto strategy = std::make_unique<amico::RuleStrategy>("test");
  strategy->on("chat", [](const AgentEvent& event, Context& context,
                          const SystemExecutor&) {
    auto text = event.content_as<std::string>();
    if (!text) {
      text = event.content_field<std::string>("text");
    }
    if (!text) {
      return StrategyOutcome::failure(
          amico::StrategyError::recoverable("chat event without string text"));
    }
    const int seen = context.get_as<int>("chats").value_or(0);
    StrategyResult result;
    result.then(amico::UpdateContext{"chats", seen + 1})
        .then(amico::UpdateContext{"last", *text});
    return StrategyOutcome::success(std::move(result));
  });

  amico::Agent agent(std::move(strategy));
  ASSERT_TRUE(agent.post(AgentEvent::make("chat", "zmq", json{{"text", 5}})));
  ASSERT_TRUE(agent.post(AgentEvent::make("chat", "zmq", json::array())));
  ASSERT_TRUE(agent.post(AgentEvent::make("chat", "zmq", json{{"text", "hi"}})));
  ASSERT_TRUE(agent.post(AgentEvent::make("chat", "zmq", json("plain"))));
  ASSERT_TRUE(agent.post(AgentEvent::terminate("test")));

  auto outcome = agent.run();

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value->reason, amico::StopReason::TerminateInstruction);
  EXPECT_EQ(outcome.value->events_processed, 2u);
  EXPECT_EQ(agent.get_metrics().strategy_errors, 2u);

  const json context = agent.context_snapshot();
  EXPECT_EQ(context.at("chats").get<int>(), 2);
  EXPECT_EQ(context.at("last").get<std::string>(), "plain");
}
