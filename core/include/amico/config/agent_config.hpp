#pragma once

#include "amico/common/result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace amico {

// -----------------------------------------------------------------------------
// AgentConfig: runtime parameters of one Agent
// -----------------------------------------------------------------------------
//
// @brief  Plain value struct copied into the Agent at construction.
//
// @details
// Every field has a default, so `AgentConfig{}` is a working configuration
// for tests and embedding. The daemon fills it from JSON text:
//
//   {
//     "name": "amico",
//     "executor_workers": 2,
//     "max_execution_history": 1024,
//     "poll_interval_ms": 20,
//     "drain_timeout_ms": 5000,
//     "system_wait_timeout_ms": 30000,
//     "default_event_lifetime_ms": 60000,
//     "heartbeat_interval_ms": 0,
//     "event_endpoint": "tcp://127.0.0.1:5555",
//     "control_endpoint": "tcp://*:5556",
//     "telemetry_endpoint": "tcp://*:5557"
//   }
//
// Missing keys keep their defaults. Empty endpoints disable the matching
// ZeroMQ adapter; a zero heartbeat interval disables the heartbeat timer.
//
// Thread model:
//   Value semantics; never shared mutably.
// -----------------------------------------------------------------------------
struct AgentConfig {
  std::string name{"amico"};

  /// Worker threads of the SystemExecutor. Must be at least 1.
  std::size_t executor_workers{2};

  /// Bound of the execution history (oldest records evicted first).
  std::size_t max_execution_history{1024};

  /// How long the loop blocks on the event queue before re-checking its
  /// shutdown and failure flags.
  std::chrono::milliseconds poll_interval{20};

  /// Draining waits this long for in-flight system executions.
  std::chrono::milliseconds drain_timeout{5000};

  /// Upper bound for ExecuteSystem actions that wait for their result.
  std::chrono::milliseconds system_wait_timeout{30000};

  /// Stamped as expiry on events that arrive without one.
  std::optional<std::chrono::milliseconds> default_event_lifetime;

  std::chrono::milliseconds heartbeat_interval{0};

  std::string event_endpoint;
  std::string control_endpoint;
  std::string telemetry_endpoint;
};

void to_json(nlohmann::json& j, const AgentConfig& config);

// Throws nlohmann::json::exception on a field of the wrong type.
void from_json(const nlohmann::json& j, AgentConfig& config);

// Parses and validates JSON text. Syntax, type and range errors come back as
// a failure message; nothing throws.
Result<AgentConfig, std::string> parse_agent_config(const std::string& text);

// Range checks shared by parse_agent_config and the Agent constructor.
std::optional<std::string> validate(const AgentConfig& config);

}  // namespace amico
