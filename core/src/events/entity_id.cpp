#include "amico/events/entity_id.hpp"

#include <atomic>

namespace amico {

// The counter is the one piece of process-wide state in the library: entity
// ids must stay unique across every bus and agent in the process.
EntityId EntityId::allocate() {
  static std::atomic<std::uint64_t> next_value{1};
  return EntityId{next_value.fetch_add(1, std::memory_order_relaxed)};
}

}  // namespace amico
