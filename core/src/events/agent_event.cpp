#include "amico/events/agent_event.hpp"

#include <stdexcept>
#include <utility>

namespace amico {

const char* to_string(AgentInstruction instruction) {
  switch (instruction) {
    case AgentInstruction::Terminate: return "terminate";
  }
  return "unknown";
}

std::optional<AgentInstruction> instruction_from_string(const std::string& s) {
  if (s == "terminate" || s == "Terminate") {
    return AgentInstruction::Terminate;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Factories
// -----------------------------------------------------------------------------
AgentEvent AgentEvent::make(std::string name, std::string source,
                            std::optional<nlohmann::json> content) {
  AgentEvent event;
  event.name = std::move(name);
  event.source = std::move(source);
  event.content = std::move(content);
  return event;
}

AgentEvent AgentEvent::terminate(std::string source) {
  AgentEvent event;
  event.name = "terminate";
  event.source = std::move(source);
  event.instruction = AgentInstruction::Terminate;
  return event;
}

// -----------------------------------------------------------------------------
// JSON conversion
// -----------------------------------------------------------------------------
void to_json(nlohmann::json& j, const AgentEvent& event) {
  j = nlohmann::json{{"id", event.id},
                     {"name", event.name},
                     {"source", event.source}};
  if (event.content) {
    j["content"] = *event.content;
  }
  if (event.instruction) {
    j["instruction"] = to_string(*event.instruction);
  }
  if (event.expiry_ms) {
    j["expiry_ms"] = *event.expiry_ms;
  }
}

void from_json(const nlohmann::json& j, AgentEvent& event) {
  event.name = j.at("name").get<std::string>();
  event.id = j.value("id", std::uint64_t{0});
  event.source = j.value("source", std::string{});

  if (auto it = j.find("content"); it != j.end() && !it->is_null()) {
    event.content = *it;
  } else {
    event.content.reset();
  }

  if (auto it = j.find("instruction"); it != j.end() && !it->is_null()) {
    const auto text = it->get<std::string>();
    auto instruction = instruction_from_string(text);
    if (!instruction) {
      throw std::invalid_argument("unknown instruction: " + text);
    }
    event.instruction = *instruction;
  } else {
    event.instruction.reset();
  }

  if (auto it = j.find("expiry_ms"); it != j.end() && !it->is_null()) {
    event.expiry_ms = it->get<std::int64_t>();
  } else {
    event.expiry_ms.reset();
  }
}

}  // namespace amico
