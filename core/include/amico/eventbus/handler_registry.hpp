#pragma once

#include "amico/common/errors.hpp"
#include "amico/common/result.hpp"
#include "amico/concurrent/sequence_generator.hpp"
#include "amico/eventbus/handler_entry.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace amico {

// -----------------------------------------------------------------------------
// HandlerRegistry
// -----------------------------------------------------------------------------
//
// @brief  Type-indexed storage of handlers, keyed by the declared event type.
//
// @details
// Each event type E owns one Slot<E>:
//   - `broadcast`: handlers in registration order (the dispatch order);
//   - `targeted`:  at most one handler per EntityId.
//
// The key is std::type_index(typeid(E)) of the template argument, so lookup
// never inspects an event instance. The only type erasure is SlotBase; every
// access casts back to the Slot<E> recorded under typeid(E).
//
// add() is the only mutator. Lookups return copies of the entries so the
// caller can invoke handlers without holding the registry lock (a handler may
// send further events through the same bus).
//
// Thread model: All methods are safe from any thread.
// -----------------------------------------------------------------------------
class HandlerRegistry {
 public:
  HandlerRegistry() = default;

  HandlerRegistry(const HandlerRegistry&) = delete;
  HandlerRegistry& operator=(const HandlerRegistry&) = delete;

  // -------------------------------------------------------------------------
  // add<E>(entity, body)
  // -------------------------------------------------------------------------
  //
  // @brief  Stores a new handler for E.
  //
  // @param  entity  Target entity for targeted events; must be empty for
  //                 broadcast events.
  // @param  body    Sync or suspending closure.
  //
  // @return The new HandlerId, or EventError::DuplicateBinding when a
  //         targeted handler for (E, entity) already exists.
  // -------------------------------------------------------------------------
  template <typename E>
  Result<HandlerId, EventError> add(std::optional<EntityId> entity,
                                    typename HandlerEntry<E>::Body body) {
    std::lock_guard lock(mutex_);
    Slot<E>& slot = slot_for<E>();

    HandlerEntry<E> entry;
    entry.order = next_order_;
    entry.entity = entity;
    entry.body = std::move(body);

    if (entity.has_value()) {
      if (slot.targeted.count(*entity) != 0) {
        return Result<HandlerId, EventError>::failure(
            EventError::duplicateBinding(event_name<E>(), entity->value()));
      }
      entry.id = handler_ids_.next_id();
      ++next_order_;
      const HandlerId id = entry.id;
      slot.targeted.emplace(*entity, std::move(entry));
      return Result<HandlerId, EventError>::success(id);
    }

    entry.id = handler_ids_.next_id();
    ++next_order_;
    const HandlerId id = entry.id;
    slot.broadcast.push_back(std::move(entry));
    return Result<HandlerId, EventError>::success(id);
  }

  // Snapshot of E's broadcast handlers in registration order.
  template <typename E>
  std::vector<HandlerEntry<E>> broadcast_handlers() const {
    std::lock_guard lock(mutex_);
    if (const Slot<E>* slot = find_slot<E>()) {
      return slot->broadcast;
    }
    return {};
  }

  // Copy of the handler bound to `entity` for E, if any.
  template <typename E>
  std::optional<HandlerEntry<E>> targeted_handler(EntityId entity) const {
    std::lock_guard lock(mutex_);
    if (const Slot<E>* slot = find_slot<E>()) {
      auto it = slot->targeted.find(entity);
      if (it != slot->targeted.end()) {
        return it->second;
      }
    }
    return std::nullopt;
  }

  template <typename E>
  std::size_t handler_count() const {
    std::lock_guard lock(mutex_);
    const Slot<E>* slot = find_slot<E>();
    return slot ? slot->size() : 0;
  }

  // Descriptions of every handler for E, ordered by registration.
  template <typename E>
  std::vector<HandlerInfo> describe() const {
    std::vector<HandlerInfo> out;
    std::lock_guard lock(mutex_);
    const Slot<E>* slot = find_slot<E>();
    if (slot == nullptr) {
      return out;
    }
    auto info = [](const HandlerEntry<E>& e) {
      HandlerInfo i;
      i.id = e.id;
      i.order = e.order;
      i.mode = e.mode();
      i.entity = e.entity;
      i.invocations = e.stats->invocations.load();
      i.failures = e.stats->failures.load();
      i.last_invoked_ms = e.stats->last_invoked_ms.load();
      return i;
    };
    for (const auto& e : slot->broadcast) {
      out.push_back(info(e));
    }
    for (const auto& [entity, e] : slot->targeted) {
      out.push_back(info(e));
    }
    std::sort(out.begin(), out.end(),
              [](const HandlerInfo& a, const HandlerInfo& b) {
                return a.order < b.order;
              });
    return out;
  }

  // Total handlers across all event types.
  std::size_t size() const;

  // Number of distinct event types with at least one slot.
  std::size_t event_type_count() const;

 private:
  struct SlotBase {
    virtual ~SlotBase() = default;
    virtual std::size_t size() const = 0;
  };

  template <typename E>
  struct Slot final : SlotBase {
    std::vector<HandlerEntry<E>> broadcast;
    std::unordered_map<EntityId, HandlerEntry<E>> targeted;

    std::size_t size() const override {
      return broadcast.size() + targeted.size();
    }
  };

  // Caller holds mutex_.
  template <typename E>
  Slot<E>& slot_for() {
    auto& base = slots_[std::type_index(typeid(E))];
    if (!base) {
      base = std::make_unique<Slot<E>>();
    }
    return static_cast<Slot<E>&>(*base);
  }

  // Caller holds mutex_.
  template <typename E>
  const Slot<E>* find_slot() const {
    auto it = slots_.find(std::type_index(typeid(E)));
    if (it == slots_.end()) {
      return nullptr;
    }
    return static_cast<const Slot<E>*>(it->second.get());
  }

  mutable std::mutex mutex_;
  std::unordered_map<std::type_index, std::unique_ptr<SlotBase>> slots_;
  SequenceGenerator handler_ids_;
  std::size_t next_order_{0};
};

}  // namespace amico
