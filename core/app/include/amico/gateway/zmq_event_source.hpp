#pragma once

#include "amico/events/agent_event.hpp"
#include "amico/source/event_source.hpp"
#include "amico/time/i_time_provider.hpp"
#include "amico/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <string>

namespace amico {

// -----------------------------------------------------------------------------
// ZmqEventSource: ZeroMQ SUB socket feeding AgentEvents
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to a ZeroMQ PUB endpoint and turns every JSON message
//         into an AgentEvent for the agent's merged stream.
//
// @details
// Message format (one JSON object per ZeroMQ message):
//
//   {"name": "chat",                 required
//    "source": "telegram",           optional, defaults to name()
//    "content": {...},               optional, any JSON
//    "instruction": "terminate",     optional
//    "lifetime_ms": 5000}            optional, expiry = now + lifetime
//
// Malformed messages (invalid JSON, missing "name", wrong field types,
// unknown instruction) are logged to std::cerr and skipped. Any other ZeroMQ
// error except EINTR propagates out of run(), which the Agent reports as
// AgentError::SourceFailure. That includes a bad endpoint, since the socket
// is created and connected inside run().
//
// The source never exhausts on its own; run() returns only after stop().
//
// Thread model:
//   run() owns the socket and executes on the SourceThread. stop() sets an
//   atomic flag checked every kRecvTimeoutMs.
// -----------------------------------------------------------------------------
class ZmqEventSource : public EventSource {
 public:
  // `clock` (optional, must outlive the source) stamps lifetime_ms expiries.
  explicit ZmqEventSource(std::string endpoint, std::string name = "zmq",
                          const ITimeProvider* clock = nullptr);

  std::string name() const override { return name_; }
  void run(const Sink& sink) override;
  void stop() override;

  const std::string& endpoint() const { return endpoint_; }

  // Decodes one message payload. Throws nlohmann::json::exception on
  // malformed JSON or fields, std::invalid_argument on an unknown
  // instruction.
  static AgentEvent decode(const std::string& payload,
                           const std::string& default_source,
                           std::int64_t now_ms);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  const std::string endpoint_;
  const std::string name_;
  LiveTimeProvider live_clock_;
  const ITimeProvider* clock_;

  std::atomic<bool> stop_requested_{false};
};

}  // namespace amico
