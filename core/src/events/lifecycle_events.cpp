#include "amico/events/lifecycle_events.hpp"

namespace amico {

const char* to_string(AgentState state) {
  switch (state) {
    case AgentState::Idle:     return "Idle";
    case AgentState::Running:  return "Running";
    case AgentState::Draining: return "Draining";
    case AgentState::Stopped:  return "Stopped";
    case AgentState::Failed:   return "Failed";
  }
  return "Unknown";
}

}  // namespace amico
