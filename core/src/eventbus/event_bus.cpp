#include "amico/eventbus/event_bus.hpp"

namespace amico {

// -----------------------------------------------------------------------------
// create_entity(): process-unique routing key
// -----------------------------------------------------------------------------
EntityId EventBus::create_entity() { return EntityId::allocate(); }

}  // namespace amico
