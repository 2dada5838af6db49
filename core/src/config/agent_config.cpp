#include "amico/config/agent_config.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>

namespace amico {

namespace {

using Millis = std::chrono::milliseconds;

void read_millis(const nlohmann::json& j, const char* key, Millis& out) {
  auto it = j.find(key);
  if (it != j.end()) {
    out = Millis(it->get<std::int64_t>());
  }
}

// Counts are read signed so a negative value cannot wrap to a huge size_t;
// anything below 1 is stored as 0 and reported by validate().
void read_count(const nlohmann::json& j, const char* key, std::size_t& out) {
  auto it = j.find(key);
  if (it != j.end()) {
    const auto value = it->get<std::int64_t>();
    out = value < 1 ? 0 : static_cast<std::size_t>(value);
  }
}

template <typename T>
void read_value(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end()) {
    out = it->get<T>();
  }
}

}  // namespace

void to_json(nlohmann::json& j, const AgentConfig& config) {
  j = nlohmann::json{
      {"name", config.name},
      {"executor_workers", config.executor_workers},
      {"max_execution_history", config.max_execution_history},
      {"poll_interval_ms", config.poll_interval.count()},
      {"drain_timeout_ms", config.drain_timeout.count()},
      {"system_wait_timeout_ms", config.system_wait_timeout.count()},
      {"heartbeat_interval_ms", config.heartbeat_interval.count()},
      {"event_endpoint", config.event_endpoint},
      {"control_endpoint", config.control_endpoint},
      {"telemetry_endpoint", config.telemetry_endpoint},
  };
  if (config.default_event_lifetime) {
    j["default_event_lifetime_ms"] = config.default_event_lifetime->count();
  } else {
    j["default_event_lifetime_ms"] = nullptr;
  }
}

void from_json(const nlohmann::json& j, AgentConfig& config) {
  read_value(j, "name", config.name);
  read_count(j, "executor_workers", config.executor_workers);
  read_count(j, "max_execution_history", config.max_execution_history);
  read_millis(j, "poll_interval_ms", config.poll_interval);
  read_millis(j, "drain_timeout_ms", config.drain_timeout);
  read_millis(j, "system_wait_timeout_ms", config.system_wait_timeout);
  read_millis(j, "heartbeat_interval_ms", config.heartbeat_interval);
  read_value(j, "event_endpoint", config.event_endpoint);
  read_value(j, "control_endpoint", config.control_endpoint);
  read_value(j, "telemetry_endpoint", config.telemetry_endpoint);

  auto lifetime = j.find("default_event_lifetime_ms");
  if (lifetime != j.end()) {
    if (lifetime->is_null()) {
      config.default_event_lifetime.reset();
    } else {
      config.default_event_lifetime = Millis(lifetime->get<std::int64_t>());
    }
  }
}

std::optional<std::string> validate(const AgentConfig& config) {
  if (config.name.empty()) {
    return std::string("name must not be empty");
  }
  if (config.executor_workers == 0) {
    return std::string("executor_workers must be at least 1");
  }
  if (config.max_execution_history == 0) {
    return std::string("max_execution_history must be at least 1");
  }
  if (config.poll_interval.count() <= 0) {
    return std::string("poll_interval_ms must be positive");
  }
  if (config.drain_timeout.count() < 0 ||
      config.system_wait_timeout.count() < 0 ||
      config.heartbeat_interval.count() < 0) {
    return std::string("timeouts and intervals must not be negative");
  }
  if (config.default_event_lifetime &&
      config.default_event_lifetime->count() <= 0) {
    return std::string("default_event_lifetime_ms must be positive");
  }
  return std::nullopt;
}

Result<AgentConfig, std::string> parse_agent_config(const std::string& text) {
  using Out = Result<AgentConfig, std::string>;

  AgentConfig config;
  try {
    const nlohmann::json j = nlohmann::json::parse(text);
    if (!j.is_object()) {
      return Out::failure("config must be a JSON object");
    }
    config = j.get<AgentConfig>();
  } catch (const nlohmann::json::exception& e) {
    return Out::failure(std::string("invalid config: ") + e.what());
  }

  if (auto problem = validate(config)) {
    return Out::failure(*problem);
  }
  return Out::success(std::move(config));
}

}  // namespace amico
