#pragma once

#include "amico/common/errors.hpp"
#include "amico/common/result.hpp"
#include "amico/concurrent/thread_safe_queue.hpp"
#include "amico/events/lifecycle_events.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <variant>

namespace amico {

class Agent;

// -----------------------------------------------------------------------------
// ControlServer: ZeroMQ control and telemetry surface of an Agent
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread serving commands on a REP socket and
//         publishing telemetry on a PUB socket.
//
// @details
// Two sockets share one thread:
//
//   1. REP (control_endpoint): each request is a command string ("PING",
//      "STATUS", "SYSTEMS", "EXECUTION <id>", "CONTEXT", "SHUTDOWN") handed
//      to the CommandHandler, normally Agent::executeCommand(). The JSON it
//      returns is the reply. A handler that throws is answered with
//      {"status":"error","response":"Command failed: ..."}.
//
//   2. PUB (telemetry_endpoint): AgentResponse and AgentStateChanged events
//      queued through pushTelemetry() are formatted as JSON and published.
//      Producers (bus handlers on the agent loop thread) only enqueue.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   The command handler runs on the server thread.
//
// Ownership:
//   Owns the ZeroMQ context, both sockets, the telemetry queue and the
//   thread. Owned by the daemon (or a test) via std::unique_ptr.
// -----------------------------------------------------------------------------
class ControlServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;
  using Telemetry = std::variant<AgentResponse, AgentStateChanged>;

  ControlServer(CommandHandler command_handler, std::string control_endpoint,
                std::string telemetry_endpoint);

  // RAII: stop() joins the thread.
  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;
  ControlServer(ControlServer&&) = delete;
  ControlServer& operator=(ControlServer&&) = delete;

  // Binds both sockets and spawns the thread. Throws zmq::error_t when a
  // bind fails. Idempotent.
  void start();

  // Publishes the remaining telemetry, joins the thread and closes the
  // sockets. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  void pushTelemetry(Telemetry event);

  // One JSON document per telemetry event:
  //   {"type":"agent_response","agent":..,"event_id":..,"event":..,"text":..}
  //   {"type":"state_changed","agent":..,"from":..,"to":..}
  static std::string formatTelemetry(const Telemetry& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();
  static std::string errorReply(const std::string& command,
                                const std::string& reason);

  CommandHandler command_handler_;
  std::string control_endpoint_;
  std::string telemetry_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Telemetry> telemetry_queue_;

  std::atomic<bool> running_{false};
  std::thread thread_;
};

// Serves `agent` on `server`: registers AgentResponse and AgentStateChanged
// handlers that forward to pushTelemetry(). The agent must still be Idle;
// the server must outlive the agent's run.
Result<Unit, AgentError> bind_telemetry(Agent& agent, ControlServer& server);

}  // namespace amico
