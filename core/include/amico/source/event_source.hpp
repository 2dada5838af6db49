#pragma once

#include "amico/events/agent_event.hpp"

#include <functional>
#include <string>

namespace amico {

// What the Agent does when a source's run() returns normally.
enum class OnFinish {
  Continue,  // keep running on the remaining sources
  Stop,      // inject a Terminate instruction; the agent drains and stops
};

const char* to_string(OnFinish policy);

// -----------------------------------------------------------------------------
// EventSource
// -----------------------------------------------------------------------------
//
// @brief  Producer of AgentEvents for one Agent.
//
// @details
// run() blocks, handing every produced event to `sink`, until the source is
// exhausted or stop() is called. It throws (any std::exception) on an
// unrecoverable I/O failure; the Agent then moves to Failed and reports
// AgentError::SourceFailure.
//
// Thread model:
//   run() executes on a dedicated SourceThread. stop() is called from another
//   thread (the agent loop during draining, or the owner) and must make run()
//   return promptly. The sink is thread-safe.
// -----------------------------------------------------------------------------
class EventSource {
 public:
  using Sink = std::function<void(AgentEvent)>;

  virtual ~EventSource() = default;

  virtual std::string name() const = 0;
  virtual void run(const Sink& sink) = 0;
  virtual void stop() = 0;
};

}  // namespace amico
