#include "amico/network/control_server.hpp"

#include "amico/engine/agent.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace amico {

ControlServer::ControlServer(CommandHandler command_handler,
                             std::string control_endpoint,
                             std::string telemetry_endpoint)
    : command_handler_(std::move(command_handler)),
      control_endpoint_(std::move(control_endpoint)),
      telemetry_endpoint_(std::move(telemetry_endpoint)) {}

ControlServer::~ControlServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): bind both sockets, then spawn the server thread
// -----------------------------------------------------------------------------
void ControlServer::start() {
  if (running_.load()) {
    return;
  }

  // Bind into locals first: a failed bind throws and leaves the server
  // stopped with no half-open sockets.
  auto context = std::make_unique<zmq::context_t>(1);
  auto commands =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::rep);
  auto telemetry =
      std::make_unique<zmq::socket_t>(*context, zmq::socket_type::pub);
  commands->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  commands->set(zmq::sockopt::linger, 0);
  telemetry->set(zmq::sockopt::linger, 0);
  commands->bind(control_endpoint_);
  telemetry->bind(telemetry_endpoint_);

  context_ = std::move(context);
  cmd_socket_ = std::move(commands);
  pub_socket_ = std::move(telemetry);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[ControlServer] serving commands on " << control_endpoint_
            << ", telemetry on " << telemetry_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): the thread may already have exited on a socket error, so join
// whenever it is joinable and release the sockets once.
// -----------------------------------------------------------------------------
void ControlServer::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
  if (!context_) {
    return;
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();
  std::cout << "[ControlServer] stopped.\n";
}

void ControlServer::pushTelemetry(Telemetry event) {
  telemetry_queue_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// run(): server thread. Each pass publishes queued telemetry, then waits up
// to kPollTimeoutMs for one command.
// -----------------------------------------------------------------------------
void ControlServer::run() {
  try {
    while (running_.load()) {
      processTelemetry();
      processCommands();
    }
    // Publishes what the agent queued on its way to Stopped.
    processTelemetry();
  } catch (const zmq::error_t& e) {
    std::cerr << "[ControlServer] socket error: " << e.what()
              << "; server thread exiting.\n";
    running_.store(false);
  }
}

void ControlServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    const std::string payload = formatTelemetry(*event);
    if (!pub_socket_->send(zmq::buffer(payload), zmq::send_flags::dontwait)) {
      std::cerr << "[ControlServer] telemetry dropped (socket busy).\n";
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): answer at most one request. A REP socket must reply
// before it can receive again, so a throwing handler still gets an error
// reply.
// -----------------------------------------------------------------------------
void ControlServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t received;
  try {
    received = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() != EINTR) {
      throw;
    }
  }
  if (!received) {
    return;  // timed out
  }

  const std::string command = request.to_string();
  std::string reply;
  try {
    reply = command_handler_(command);
  } catch (const std::exception& e) {
    reply = errorReply(command, e.what());
  } catch (...) {
    reply = errorReply(command, "unknown exception");
  }

  if (!cmd_socket_->send(zmq::buffer(reply), zmq::send_flags::none)) {
    std::cerr << "[ControlServer] reply to '" << command << "' not sent.\n";
  }
}

std::string ControlServer::errorReply(const std::string& command,
                                      const std::string& reason) {
  std::cerr << "[ControlServer] command '" << command
            << "' failed: " << reason << "\n";
  return nlohmann::json{{"status", "error"},
                        {"response", "Command failed: " + reason}}
      .dump();
}

// -----------------------------------------------------------------------------
// formatTelemetry()
// -----------------------------------------------------------------------------
std::string ControlServer::formatTelemetry(const Telemetry& event) {
  nlohmann::json j;
  if (const auto* r = std::get_if<AgentResponse>(&event)) {
    j["type"] = "agent_response";
    j["agent"] = r->agent;
    j["event_id"] = r->event_id;
    j["event"] = r->event_name;
    j["text"] = r->text;
  } else {
    const auto& s = std::get<AgentStateChanged>(event);
    j["type"] = "state_changed";
    j["agent"] = s.agent;
    j["from"] = to_string(s.from);
    j["to"] = to_string(s.to);
  }
  return j.dump();
}

// -----------------------------------------------------------------------------
// bind_telemetry(): agent bus -> server queue
// -----------------------------------------------------------------------------
Result<Unit, AgentError> bind_telemetry(Agent& agent, ControlServer& server) {
  auto responses = agent.register_handler<AgentResponse>(
      [&server](const AgentResponse& e) { server.pushTelemetry(e); });
  if (responses.failed()) {
    return Result<Unit, AgentError>::failure(*responses.error);
  }

  auto states = agent.register_handler<AgentStateChanged>(
      [&server](const AgentStateChanged& e) { server.pushTelemetry(e); });
  if (states.failed()) {
    return Result<Unit, AgentError>::failure(*states.error);
  }
  return Result<Unit, AgentError>::success(Unit{});
}

}  // namespace amico
