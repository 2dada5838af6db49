#pragma once

#include "amico/common/errors.hpp"
#include "amico/common/result.hpp"
#include "amico/eventbus/event_bus.hpp"
#include "amico/events/entity_id.hpp"
#include "amico/events/event_traits.hpp"
#include "amico/system/system_executor.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <variant>

namespace amico {

// -----------------------------------------------------------------------------
// AgentAction
// -----------------------------------------------------------------------------
//
// @brief  One step a Strategy asks the Agent to perform.
//
// @details
// A closed variant of three alternatives, applied by the agent loop strictly
// in the order the Strategy emitted them:
//
//   ExecuteSystem   start a system invocation (optionally wait for it)
//   SendEvent       dispatch an event on the agent's bus
//   UpdateContext   set one context key
//
// ExecuteSystem and SendEvent are built through typed factories. The factory
// captures the payload in a closure that calls the executor or the bus with
// the concrete types, so a mismatched input, system or event fails to
// compile at the point where the Strategy builds the action.
//
//   result.actions.push_back(ExecuteSystem::of<EchoSystem>("ping"));
//   result.actions.push_back(SendEvent::of(Tick{3}));
//   result.actions.push_back(UpdateContext{"last", 3});
// -----------------------------------------------------------------------------

// What the loop receives after dispatching an ExecuteSystem: the execution
// id and a way to wait for its output (as JSON when the output type
// converts, null otherwise).
struct ExecutionTicket {
  ExecutionId id{0};
  std::function<Result<nlohmann::json, SystemError>(std::chrono::milliseconds)>
      await;
};

struct ExecuteSystem {
  std::string system_name;
  int priority{0};

  // When set, the loop waits for the invocation to finish before applying
  // the next action.
  bool wait{false};

  // With `wait`, a successful output is stored in the context under this key.
  std::optional<std::string> result_key;

  std::function<Result<ExecutionTicket, SystemError>(SystemExecutor&)> dispatch;

  template <typename S>
  static ExecuteSystem of(typename S::Input input, int priority = 0) {
    using Out = typename S::Output;

    ExecuteSystem action;
    action.system_name = typeid(S).name();
    action.priority = priority;
    action.dispatch = [input = std::move(input),
                       priority](SystemExecutor& executor)
        -> Result<ExecutionTicket, SystemError> {
      auto submitted = executor.execute<S>(input, priority);
      if (submitted.failed()) {
        return Result<ExecutionTicket, SystemError>::failure(*submitted.error);
      }
      Handle<Out> handle = *submitted.value;

      ExecutionTicket ticket;
      ticket.id = handle.id();
      ticket.await = [handle](std::chrono::milliseconds timeout)
          -> Result<nlohmann::json, SystemError> {
        auto outcome = handle.wait_for(timeout);
        if (outcome.failed()) {
          return Result<nlohmann::json, SystemError>::failure(*outcome.error);
        }
        if constexpr (std::is_constructible_v<nlohmann::json, const Out&>) {
          return Result<nlohmann::json, SystemError>::success(
              nlohmann::json(*outcome.value));
        } else {
          return Result<nlohmann::json, SystemError>::success(nullptr);
        }
      };
      return Result<ExecutionTicket, SystemError>::success(std::move(ticket));
    };
    return action;
  }

  // Copy of this action that the loop waits on; the output is stored under
  // `key` when one is given.
  ExecuteSystem awaiting(std::optional<std::string> key = std::nullopt) const {
    ExecuteSystem copy = *this;
    copy.wait = true;
    copy.result_key = std::move(key);
    return copy;
  }
};

struct SendEvent {
  std::string event_name;
  std::optional<EntityId> target;

  // Returns how many handlers produced a response.
  std::function<Result<std::size_t, EventError>(EventBus&)> dispatch;

  // Broadcast event, or targeted event addressed through its own `target`.
  template <typename E>
  static SendEvent of(E event) {
    SendEvent action;
    action.event_name = amico::event_name<E>();
    if constexpr (is_targeted_v<E>) {
      action.target = event.target;
    }
    action.dispatch = [event = std::move(event)](EventBus& bus)
        -> Result<std::size_t, EventError> {
      auto sent = bus.send(event);
      if (sent.failed()) {
        return Result<std::size_t, EventError>::failure(*sent.error);
      }
      return Result<std::size_t, EventError>::success(sent.value->size());
    };
    return action;
  }

  // Targeted event readdressed to `target`.
  template <typename E>
  static SendEvent to(EntityId target, E event) {
    static_assert(is_targeted_v<E>,
                  "only events deriving from TargetedEvent take a target");
    event.target = target;
    return of(std::move(event));
  }
};

struct UpdateContext {
  std::string key;
  nlohmann::json value;
};

using AgentAction = std::variant<ExecuteSystem, SendEvent, UpdateContext>;

}  // namespace amico
