#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace amico {

// Control instructions carried by an AgentEvent instead of content.
enum class AgentInstruction {
  Terminate,  // stop pulling events; drain and stop the agent
};

const char* to_string(AgentInstruction instruction);
std::optional<AgentInstruction> instruction_from_string(const std::string& s);

// -----------------------------------------------------------------------------
// AgentEvent
// -----------------------------------------------------------------------------
//
// @brief  One item of the agent's merged external event stream.
//
// @details
// Event sources (timers, ZeroMQ feeds, tests) produce AgentEvents; the agent
// loop hands each one to the Strategy. An event carries either JSON content,
// an instruction, or neither (a bare named signal).
//
//   id           Assigned by the Agent when the event enters the stream;
//                0 until then.
//   name         Routing key for strategies (e.g. "heartbeat", "chat").
//   source       Name of the producing EventSource.
//   content      Optional JSON payload.
//   instruction  Optional control instruction (Terminate).
//   expiry_ms    Optional absolute expiry (epoch ms). The loop drops the
//                event if it is pulled at or after this time.
//
// JSON form (see to_json / from_json):
//   {"id": 7, "name": "chat", "source": "zmq",
//    "content": {...}, "instruction": "terminate", "expiry_ms": 1700000000000}
// Only "name" is required when decoding.
// -----------------------------------------------------------------------------
struct AgentEvent {
  static constexpr const char* kName = "AgentEvent";

  std::uint64_t id{0};
  std::string name;
  std::string source;
  std::optional<nlohmann::json> content;
  std::optional<AgentInstruction> instruction;
  std::optional<std::int64_t> expiry_ms;

  static AgentEvent make(std::string name, std::string source,
                         std::optional<nlohmann::json> content = std::nullopt);

  // Terminate instruction event, emitted e.g. when a source configured with
  // OnFinish::Stop is exhausted.
  static AgentEvent terminate(std::string source);

  bool is_terminate() const {
    return instruction == AgentInstruction::Terminate;
  }

  bool is_expired(std::int64_t now_ms) const {
    return expiry_ms.has_value() && now_ms >= *expiry_ms;
  }

  // Content converted to T, or std::nullopt when there is no content or it
  // does not convert.
  template <typename T>
  std::optional<T> content_as() const {
    if (!content) {
      return std::nullopt;
    }
    try {
      return content->get<T>();
    } catch (const nlohmann::json::exception&) {
      return std::nullopt;
    }
  }

  // content[key] converted to T. std::nullopt when the content is not an
  // object, the key is missing or the value does not convert.
  template <typename T>
  std::optional<T> content_field(const std::string& key) const {
    if (!content || !content->is_object()) {
      return std::nullopt;
    }
    auto it = content->find(key);
    if (it == content->end()) {
      return std::nullopt;
    }
    try {
      return it->template get<T>();
    } catch (const nlohmann::json::exception&) {
      return std::nullopt;
    }
  }
};

void to_json(nlohmann::json& j, const AgentEvent& event);

// Throws nlohmann::json::exception when "name" is missing or a field has the
// wrong type, and std::invalid_argument for an unknown instruction.
void from_json(const nlohmann::json& j, AgentEvent& event);

}  // namespace amico
