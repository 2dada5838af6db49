#pragma once

#include "amico/common/errors.hpp"
#include "amico/common/result.hpp"
#include "amico/eventbus/handler_entry.hpp"
#include "amico/eventbus/handler_registry.hpp"
#include "amico/events/entity_id.hpp"
#include "amico/events/event_traits.hpp"
#include "amico/time/time_utils.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace amico {

namespace detail {

// Adapts a user callable into HandlerEntry<E>::SyncFn. Accepted shapes:
//   HandlerResult<E>(const E&)   used as is
//   void(const E&)               only when E's Response is Unit
//   R(const E&)                  R convertible to E's Response
template <typename E, typename F>
typename HandlerEntry<E>::SyncFn make_sync_fn(F&& f) {
  using R = std::invoke_result_t<std::decay_t<F>&, const E&>;
  using Response = response_t<E>;

  if constexpr (std::is_same_v<R, HandlerResult<E>>) {
    return std::forward<F>(f);
  } else if constexpr (std::is_void_v<R>) {
    static_assert(std::is_same_v<Response, Unit>,
                  "a handler returning void needs an event without Response");
    return [fn = std::forward<F>(f)](const E& event) mutable {
      fn(event);
      return HandlerResult<E>::success(Unit{});
    };
  } else {
    static_assert(std::is_convertible_v<R, Response>,
                  "handler return type must convert to the event's Response");
    return [fn = std::forward<F>(f)](const E& event) mutable {
      return HandlerResult<E>::success(Response(fn(event)));
    };
  }
}

template <typename E, typename F>
typename HandlerEntry<E>::SuspendingFn make_suspending_fn(F&& f) {
  using R = std::invoke_result_t<std::decay_t<F>&, const E&>;
  static_assert(std::is_same_v<R, std::future<HandlerResult<E>>>,
                "a suspending handler must return std::future<HandlerResult<E>>");
  return std::forward<F>(f);
}

}  // namespace detail

// -----------------------------------------------------------------------------
// EventBus
// -----------------------------------------------------------------------------
//
// @brief  Typed dispatch of events to registered handlers, collecting each
//         handler's declared Response.
//
// @details
// Broadcast events (plain structs) go to every handler registered for their
// type, in registration order. Targeted events (deriving from TargetedEvent)
// go to the single handler bound to `event.target`:
//
//   EventBus bus;
//   bus.register_handler<Tick>([](const Tick& t) { ... });          // A
//   bus.register_handler<Tick>([](const Tick& t) { ... });          // B
//   bus.send(Tick{1});                                              // A, B
//
//   EntityId echo = bus.create_entity();
//   bus.register_handler<Ping>(echo, [](const Ping& p) { return p.text; });
//   auto r = bus.send(Ping{{echo}, "hi"});   // r.value == {"hi"}
//
// Registering a broadcast handler for a targeted type, or a targeted handler
// for a broadcast type, does not compile.
//
// Outcomes of send():
//   - broadcast, no handlers         success, empty response vector
//   - broadcast, some handlers fail  PartialFailure{succeeded, failed}; every
//                                    handler still runs
//   - targeted, nothing bound        NoHandler
//   - targeted, handler fails        HandlerFailed
//
// A handler fails by returning a failed HandlerResult or by throwing a
// std::exception; both are captured here and never escape send().
//
// Thread model: Registration and send() are safe from any thread. Handlers
// run on the thread that calls send(), one at a time; send() returns only
// after every handler (including suspending ones) has completed or failed.
// The handler list is copied under the registry lock and invoked without it,
// so a handler may call send() re-entrantly.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;
  EventBus(EventBus&&) = delete;
  EventBus& operator=(EventBus&&) = delete;

  // Allocates a fresh process-unique EntityId for targeted routing.
  EntityId create_entity();

  // -------------------------------------------------------------------------
  // register_handler<E>(handler): broadcast
  // -------------------------------------------------------------------------
  template <typename E, typename F>
  Result<HandlerId, EventError> register_handler(F&& handler) {
    static_assert(!is_targeted_v<E>,
                  "targeted events need an EntityId: register_handler<E>(id, f)");
    return registry_.add<E>(std::nullopt,
                            detail::make_sync_fn<E>(std::forward<F>(handler)));
  }

  // -------------------------------------------------------------------------
  // register_handler<E>(entity, handler): targeted
  // -------------------------------------------------------------------------
  // Fails with DuplicateBinding if a handler is already bound for (E, entity).
  // -------------------------------------------------------------------------
  template <typename E, typename F>
  Result<HandlerId, EventError> register_handler(EntityId entity, F&& handler) {
    static_assert(is_targeted_v<E>,
                  "only events deriving from TargetedEvent bind to an entity");
    return registry_.add<E>(entity,
                            detail::make_sync_fn<E>(std::forward<F>(handler)));
  }

  // -------------------------------------------------------------------------
  // register_suspending_handler<E>(handler) / (entity, handler)
  // -------------------------------------------------------------------------
  // The handler returns std::future<HandlerResult<E>>; send() blocks on it
  // before invoking the next handler.
  // -------------------------------------------------------------------------
  template <typename E, typename F>
  Result<HandlerId, EventError> register_suspending_handler(F&& handler) {
    static_assert(!is_targeted_v<E>,
                  "targeted events need an EntityId");
    return registry_.add<E>(
        std::nullopt, detail::make_suspending_fn<E>(std::forward<F>(handler)));
  }

  template <typename E, typename F>
  Result<HandlerId, EventError> register_suspending_handler(EntityId entity,
                                                            F&& handler) {
    static_assert(is_targeted_v<E>,
                  "only events deriving from TargetedEvent bind to an entity");
    return registry_.add<E>(
        entity, detail::make_suspending_fn<E>(std::forward<F>(handler)));
  }

  // -------------------------------------------------------------------------
  // send(event)
  // -------------------------------------------------------------------------
  //
  // @brief  Dispatches one event and aggregates the handlers' responses.
  //
  // @return Responses in dispatch order, or an EventError (see class doc).
  // -------------------------------------------------------------------------
  template <typename E>
  Result<AggregatedResponse<E>, EventError> send(const E& event) {
    using Out = Result<AggregatedResponse<E>, EventError>;

    if constexpr (is_targeted_v<E>) {
      auto entry = registry_.targeted_handler<E>(event.target);
      if (!entry) {
        return Out::failure(
            EventError::noHandler(event_name<E>(), event.target.value()));
      }
      HandlerResult<E> outcome = invoke(*entry, event);
      if (outcome.failed()) {
        return Out::failure(
            EventError::handlerFailed(event_name<E>(), *outcome.error));
      }
      AggregatedResponse<E> responses;
      responses.push_back(std::move(*outcome.value));
      return Out::success(std::move(responses));
    } else {
      const auto entries = registry_.broadcast_handlers<E>();
      AggregatedResponse<E> responses;
      std::vector<std::string> failures;

      for (const auto& entry : entries) {
        HandlerResult<E> outcome = invoke(entry, event);
        if (outcome.ok()) {
          responses.push_back(std::move(*outcome.value));
        } else {
          failures.push_back(*outcome.error);
        }
      }

      if (!failures.empty()) {
        return Out::failure(EventError::partialFailure(
            event_name<E>(), responses.size(), std::move(failures)));
      }
      return Out::success(std::move(responses));
    }
  }

  template <typename E>
  std::size_t handler_count() const {
    return registry_.handler_count<E>();
  }

  template <typename E>
  std::vector<HandlerInfo> handlers() const {
    return registry_.describe<E>();
  }

  const HandlerRegistry& registry() const { return registry_; }

 private:
  // Runs one handler and converts anything it throws (including what
  // future::get() rethrows) into a failed HandlerResult.
  template <typename E>
  static HandlerResult<E> invoke(const HandlerEntry<E>& entry, const E& event) {
    using SyncFn = typename HandlerEntry<E>::SyncFn;
    using SuspendingFn = typename HandlerEntry<E>::SuspendingFn;

    entry.stats->invocations.fetch_add(1, std::memory_order_relaxed);
    entry.stats->last_invoked_ms.store(
        timestamp_to_ms(std::chrono::system_clock::now()),
        std::memory_order_relaxed);

    HandlerResult<E> outcome;
    try {
      if (const auto* fn = std::get_if<SyncFn>(&entry.body)) {
        outcome = (*fn)(event);
      } else {
        std::future<HandlerResult<E>> pending =
            std::get<SuspendingFn>(entry.body)(event);
        outcome = pending.get();
      }
    } catch (const std::exception& e) {
      outcome = HandlerResult<E>::failure(e.what());
    } catch (...) {
      outcome = HandlerResult<E>::failure("unknown exception");
    }

    if (!outcome.ok() && !outcome.failed()) {
      outcome = HandlerResult<E>::failure("handler returned an empty result");
    }
    if (outcome.failed()) {
      entry.stats->failures.fetch_add(1, std::memory_order_relaxed);
    }
    return outcome;
  }

  HandlerRegistry registry_;
};

}  // namespace amico
