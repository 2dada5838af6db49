#include "amico/gateway/zmq_event_source.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace amico {

ZmqEventSource::ZmqEventSource(std::string endpoint, std::string name,
                               const ITimeProvider* clock)
    : endpoint_(std::move(endpoint)),
      name_(std::move(name)),
      clock_(clock != nullptr ? clock : &live_clock_) {}

// -----------------------------------------------------------------------------
// decode(): one JSON payload -> AgentEvent
// -----------------------------------------------------------------------------
AgentEvent ZmqEventSource::decode(const std::string& payload,
                                  const std::string& default_source,
                                  std::int64_t now_ms) {
  const nlohmann::json j = nlohmann::json::parse(payload);

  AgentEvent event;
  event.name = j.at("name").get<std::string>();
  event.source = j.value("source", default_source);

  auto content = j.find("content");
  if (content != j.end() && !content->is_null()) {
    event.content = *content;
  }

  auto instruction = j.find("instruction");
  if (instruction != j.end() && !instruction->is_null()) {
    const std::string text = instruction->get<std::string>();
    event.instruction = instruction_from_string(text);
    if (!event.instruction) {
      throw std::invalid_argument("unknown instruction '" + text + "'");
    }
  }

  auto lifetime = j.find("lifetime_ms");
  if (lifetime != j.end() && !lifetime->is_null()) {
    event.expiry_ms = now_ms + lifetime->get<std::int64_t>();
  }
  return event;
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop on the source thread
// -----------------------------------------------------------------------------
void ZmqEventSource::run(const Sink& sink) {
  if (stop_requested_.load()) {
    return;
  }

  zmq::context_t context(1);
  zmq::socket_t socket(context, zmq::socket_type::sub);
  socket.set(zmq::sockopt::subscribe, "");
  socket.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket.set(zmq::sockopt::linger, 0);
  socket.connect(endpoint_);

  std::cout << "[ZmqEventSource] '" << name_ << "' listening on " << endpoint_
            << "\n";

  while (!stop_requested_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }

    if (!result.has_value()) {
      continue;
    }

    std::string payload = msg.to_string();
    try {
      sink(decode(payload, name_, clock_->now_ms()));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[ZmqEventSource] JSON error: " << e.what()
                << " payload: " << payload << "\n";
    } catch (const std::invalid_argument& e) {
      std::cerr << "[ZmqEventSource] rejected message: " << e.what()
                << " payload: " << payload << "\n";
    }
  }

  std::cout << "[ZmqEventSource] '" << name_ << "' recv loop exited.\n";
}

void ZmqEventSource::stop() { stop_requested_.store(true); }

}  // namespace amico
