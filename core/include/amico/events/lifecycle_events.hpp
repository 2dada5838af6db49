#pragma once

#include <cstdint>
#include <string>

namespace amico {

// Agent loop states: Idle -> Running -> {Draining -> Stopped | Failed}.
enum class AgentState {
  Idle,
  Running,
  Draining,
  Stopped,
  Failed,
};

const char* to_string(AgentState state);

inline bool is_terminal(AgentState state) {
  return state == AgentState::Stopped || state == AgentState::Failed;
}

// -----------------------------------------------------------------------------
// Broadcast events published by the Agent on its own bus
// -----------------------------------------------------------------------------

// Every lifecycle transition, in order. Published on the thread that performs
// the transition (the caller of start()/shutdown() or the loop thread).
struct AgentStateChanged {
  static constexpr const char* kName = "AgentStateChanged";
  std::string agent;
  AgentState from{AgentState::Idle};
  AgentState to{AgentState::Idle};
};

// The human-readable response a Strategy attached to its result.
struct AgentResponse {
  static constexpr const char* kName = "AgentResponse";
  std::string agent;
  std::uint64_t event_id{0};
  std::string event_name;
  std::string text;
};

}  // namespace amico
