#include "amico/eventbus/handler_registry.hpp"

namespace amico {

std::size_t HandlerRegistry::size() const {
  std::lock_guard lock(mutex_);
  std::size_t total = 0;
  for (const auto& [type, slot] : slots_) {
    total += slot->size();
  }
  return total;
}

std::size_t HandlerRegistry::event_type_count() const {
  std::lock_guard lock(mutex_);
  return slots_.size();
}

}  // namespace amico
