#pragma once

#include "amico/common/result.hpp"
#include "amico/events/entity_id.hpp"

#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace amico {

// -----------------------------------------------------------------------------
// Event model
// -----------------------------------------------------------------------------
//
// @brief  Compile-time description of event types dispatched by the EventBus.
//
// @details
// An event type is any copyable struct. Its properties are declared on the
// type itself and read here at compile time, never from a payload:
//
//   struct Tick {
//     using Response = int;                     // optional; default Unit
//     static constexpr const char* kName = "Tick";  // optional; diagnostics
//     int value{0};
//   };
//
//   struct Ping : TargetedEvent {               // targeted: carries `target`
//     using Response = std::string;
//   };
//
// Broadcast events (plain structs) reach every handler registered for their
// type, in registration order. Targeted events (deriving from TargetedEvent)
// reach only the handler bound to `target`.
// -----------------------------------------------------------------------------

// Base for targeted events: the destination entity.
struct TargetedEvent {
  EntityId target;
};

namespace detail {

template <typename E, typename = void>
struct response_of {
  using type = Unit;
};

template <typename E>
struct response_of<E, std::void_t<typename E::Response>> {
  using type = typename E::Response;
};

template <typename E, typename = void>
struct has_event_name : std::false_type {};

template <typename E>
struct has_event_name<E, std::void_t<decltype(E::kName)>> : std::true_type {};

}  // namespace detail

// Declared response type of event E (Unit when E declares none).
template <typename E>
using response_t = typename detail::response_of<E>::type;

template <typename E>
inline constexpr bool is_targeted_v = std::is_base_of_v<TargetedEvent, E>;

// Ordered responses of one send(): one element per handler that succeeded,
// in dispatch order. Targeted sends yield at most one element.
template <typename E>
using AggregatedResponse = std::vector<response_t<E>>;

// Human-readable name of event type E: E::kName when declared, otherwise the
// implementation's type name.
template <typename E>
std::string event_name() {
  if constexpr (detail::has_event_name<E>::value) {
    return E::kName;
  } else {
    return typeid(E).name();
  }
}

}  // namespace amico
