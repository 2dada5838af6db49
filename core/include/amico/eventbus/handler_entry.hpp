#pragma once

#include "amico/common/result.hpp"
#include "amico/events/entity_id.hpp"
#include "amico/events/event_traits.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace amico {

using HandlerId = std::uint64_t;

// Capability tag of a registered handler.
enum class HandlerMode {
  Sync,        // runs to completion inside send()
  Suspending,  // returns a future; send() waits on it before moving on
};

inline const char* to_string(HandlerMode mode) {
  return mode == HandlerMode::Sync ? "Sync" : "Suspending";
}

// What a handler for event E produces: its declared Response, or a failure
// message.
template <typename E>
using HandlerResult = Result<response_t<E>, std::string>;

// Invocation bookkeeping. Shared by every snapshot copy of one entry, so
// counts survive the copy-out done by EventBus::send().
struct HandlerStats {
  std::atomic<std::uint64_t> invocations{0};
  std::atomic<std::uint64_t> failures{0};
  std::atomic<std::int64_t> last_invoked_ms{0};
};

// -----------------------------------------------------------------------------
// HandlerEntry<E>
// -----------------------------------------------------------------------------
//
// @brief  One handler bound to event type E.
//
// @details
// Holds the capability tag (through the alternative held by `body`), the
// handler closure, its registration order and, for targeted events, the
// entity it is bound to. Entries are never modified after registration; only
// the shared HandlerStats counters move.
// -----------------------------------------------------------------------------
template <typename E>
struct HandlerEntry {
  using Response = response_t<E>;
  using SyncFn = std::function<HandlerResult<E>(const E&)>;
  using SuspendingFn = std::function<std::future<HandlerResult<E>>(const E&)>;
  using Body = std::variant<SyncFn, SuspendingFn>;

  HandlerId id{0};
  std::size_t order{0};
  std::optional<EntityId> entity;
  Body body;
  std::shared_ptr<HandlerStats> stats = std::make_shared<HandlerStats>();

  HandlerMode mode() const {
    return std::holds_alternative<SyncFn>(body) ? HandlerMode::Sync
                                                : HandlerMode::Suspending;
  }
};

// Read-only description of a registered handler, for inspection and tests.
struct HandlerInfo {
  HandlerId id{0};
  std::size_t order{0};
  HandlerMode mode{HandlerMode::Sync};
  std::optional<EntityId> entity;
  std::uint64_t invocations{0};
  std::uint64_t failures{0};
  std::int64_t last_invoked_ms{0};
};

}  // namespace amico
