#include "amico/strategy/context.hpp"

#include <utility>

namespace amico {

void Context::set(const std::string& key, nlohmann::json value) {
  values_[key] = std::move(value);
}

const nlohmann::json* Context::find(const std::string& key) const {
  auto it = values_.find(key);
  return it == values_.end() ? nullptr : &it->second;
}

std::optional<nlohmann::json> Context::get(const std::string& key) const {
  if (const nlohmann::json* value = find(key)) {
    return *value;
  }
  return std::nullopt;
}

bool Context::contains(const std::string& key) const {
  return values_.count(key) != 0;
}

bool Context::erase(const std::string& key) { return values_.erase(key) != 0; }

std::vector<std::string> Context::keys() const {
  std::vector<std::string> out;
  out.reserve(values_.size());
  for (const auto& [key, value] : values_) {
    out.push_back(key);
  }
  return out;
}

nlohmann::json Context::to_json() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& [key, value] : values_) {
    j[key] = value;
  }
  return j;
}

}  // namespace amico
