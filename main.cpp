// -----------------------------------------------------------------------------
// amico_daemon: single executable hosting one Agent.
//
//   1) Read AgentConfig from the AMICO_CONFIG environment variable (JSON
//      text); defaults when unset.
//   2) Build the Agent with a RuleStrategy and an echo system.
//   3) Attach event sources: a heartbeat timer (heartbeat_interval_ms > 0)
//      and a ZeroMQ subscriber (event_endpoint set).
//   4) Start the ControlServer (control_endpoint and telemetry_endpoint set)
//      and forward agent telemetry to it.
//   5) Start the agent, wait for SIGINT, a "terminate" event or a SHUTDOWN
//      command, then shut down cleanly.
//
// Thread layout:
//   main thread        -> waits, then Agent::shutdown() / Agent::wait()
//   agent loop thread  -> RuleStrategy, bus handlers
//   executor workers   -> EchoSystem bodies
//   source threads     -> TimerEventSource, ZmqEventSource
//   control thread     -> ControlServer (REP + PUB)
// -----------------------------------------------------------------------------

#include "amico/config/agent_config.hpp"
#include "amico/engine/agent.hpp"
#include "amico/gateway/zmq_event_source.hpp"
#include "amico/network/control_server.hpp"
#include "amico/source/timer_event_source.hpp"
#include "amico/strategy/rule_strategy.hpp"
#include "amico/system/system.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

// Set by the SIGINT handler, polled by main(). The handler does nothing
// else: Agent::shutdown() takes locks and is not async-signal-safe.
volatile std::sig_atomic_t g_interrupted = 0;

void sigint_handler(int /*signum*/) { g_interrupted = 1; }

// Echoes its input back; the default system the daemon exposes.
class EchoSystem final : public amico::System<std::string, std::string> {
 public:
  std::string name() const override { return "echo"; }

  amico::Result<std::string, std::string> run(
      const std::string& input) override {
    return amico::Result<std::string, std::string>::success(input);
  }
};

std::unique_ptr<amico::RuleStrategy> make_strategy() {
  using amico::AgentEvent;
  using amico::Context;
  using amico::ExecuteSystem;
  using amico::StrategyOutcome;
  using amico::StrategyResult;
  using amico::SystemExecutor;
  using amico::UpdateContext;

  auto strategy = std::make_unique<amico::RuleStrategy>("daemon");

  // {"name":"chat","content":{"text":"hi"}} -> echo, remembered in context.
  strategy->on("chat", [](const AgentEvent& event, Context& context,
                          const SystemExecutor&) {
    auto text = event.content_as<std::string>();
    if (!text) {
      text = event.content_field<std::string>("text");
    }
    if (!text) {
      return StrategyOutcome::failure(amico::StrategyError::recoverable(
          "chat event without string text"));
    }

    const auto seen = context.get_as<std::uint64_t>("chats").value_or(0);
    StrategyResult result;
    result.then(ExecuteSystem::of<EchoSystem>(*text).awaiting("last_echo"))
        .then(UpdateContext{"chats", seen + 1})
        .respond("echo: " + *text);
    return StrategyOutcome::success(std::move(result));
  });

  strategy->on("heartbeat", [](const AgentEvent& event, Context&,
                               const SystemExecutor& executor) {
    StrategyResult result;
    result.then(UpdateContext{"last_heartbeat",
                              event.content.value_or(nullptr)});
    result.then(UpdateContext{
        "executions", executor.get_system_metrics().total_executions});
    return StrategyOutcome::success(std::move(result));
  });

  return strategy;
}

}  // namespace

int main() {
  // ---  1) Configuration ------------------------------------------------------
  amico::AgentConfig config;
  if (const char* text = std::getenv("AMICO_CONFIG")) {
    auto parsed = amico::parse_agent_config(text);
    if (parsed.failed()) {
      std::cerr << "[main] " << *parsed.error << "\n";
      return 2;
    }
    config = std::move(*parsed.value);
  }

  // ---  2) Agent ----------------------------------------------------------------
  amico::Agent agent(make_strategy(), config);

  if (auto r = agent.register_system(std::make_shared<EchoSystem>());
      r.failed()) {
    std::cerr << "[main] " << r.error->message << "\n";
    return 1;
  }

  // ---  3) Event sources --------------------------------------------------------
  if (config.heartbeat_interval.count() > 0) {
    auto r = agent.add_event_source(std::make_unique<amico::TimerEventSource>(
        "heartbeat", config.heartbeat_interval));
    if (r.failed()) {
      std::cerr << "[main] " << r.error->message << "\n";
      return 1;
    }
  }
  if (!config.event_endpoint.empty()) {
    auto r = agent.add_event_source(
        std::make_unique<amico::ZmqEventSource>(config.event_endpoint));
    if (r.failed()) {
      std::cerr << "[main] " << r.error->message << "\n";
      return 1;
    }
  }

  // ---  4) Control surface ------------------------------------------------------
  std::unique_ptr<amico::ControlServer> control;
  if (!config.control_endpoint.empty() && !config.telemetry_endpoint.empty()) {
    control = std::make_unique<amico::ControlServer>(
        [&agent](const std::string& cmd) { return agent.executeCommand(cmd); },
        config.control_endpoint, config.telemetry_endpoint);
    if (auto r = amico::bind_telemetry(agent, *control); r.failed()) {
      std::cerr << "[main] " << r.error->message << "\n";
      return 1;
    }
    try {
      control->start();
    } catch (const zmq::error_t& e) {
      std::cerr << "[main] control server failed to start: " << e.what()
                << "\n";
      return 1;
    }
  }

  // ---  5) Run --------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);

  if (auto started = agent.start(); started.failed()) {
    std::cerr << "[main] " << started.error->message << "\n";
    return 1;
  }
  std::cout << "[main] agent '" << config.name
            << "' running. Press Ctrl-C to shut down.\n";

  while (g_interrupted == 0 && !amico::is_terminal(agent.state())) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (g_interrupted != 0) {
    std::cout << "\n[main] SIGINT received. Shutting down...\n";
  }

  agent.shutdown();
  auto outcome = agent.wait();

  // The agent's final telemetry is queued by now; stop() publishes it.
  if (control) {
    control->stop();
  }

  if (outcome.failed()) {
    std::cerr << "[main] agent failed: " << outcome.error->message << "\n";
    return 1;
  }
  std::cout << "[main] agent stopped (" << amico::to_string(outcome.value->reason)
            << ").\n";
  return 0;
}
