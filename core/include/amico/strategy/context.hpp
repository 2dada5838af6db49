#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace amico {

// -----------------------------------------------------------------------------
// Context
// -----------------------------------------------------------------------------
//
// @brief  The agent's mutable key/value state, handed to the Strategy on
//         every event.
//
// @details
// Values are JSON so strategies can keep arbitrary structured state without
// the core knowing its shape. The Agent owns exactly one Context; only the
// loop thread mutates it (Strategy calls and UpdateContext actions), and
// Agent::context_snapshot() copies it under the agent's lock for readers on
// other threads.
// -----------------------------------------------------------------------------
class Context {
 public:
  void set(const std::string& key, nlohmann::json value);

  // nullptr when absent. The pointer is invalidated by the next mutation.
  const nlohmann::json* find(const std::string& key) const;

  std::optional<nlohmann::json> get(const std::string& key) const;

  // Value converted to T; std::nullopt when absent or not convertible.
  template <typename T>
  std::optional<T> get_as(const std::string& key) const {
    const nlohmann::json* value = find(key);
    if (value == nullptr) {
      return std::nullopt;
    }
    try {
      return value->get<T>();
    } catch (const nlohmann::json::exception&) {
      return std::nullopt;
    }
  }

  bool contains(const std::string& key) const;
  bool erase(const std::string& key);
  void clear() { values_.clear(); }

  std::size_t size() const { return values_.size(); }
  bool empty() const { return values_.empty(); }
  std::vector<std::string> keys() const;

  // The whole context as one JSON object.
  nlohmann::json to_json() const;

 private:
  std::map<std::string, nlohmann::json> values_;
};

}  // namespace amico
