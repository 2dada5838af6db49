#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace amico {

// -----------------------------------------------------------------------------
// EntityId
// -----------------------------------------------------------------------------
//
// @brief  Opaque routing key for targeted events.
//
// @details
// An EntityId names an addressable unit (a plugged-in capability, a
// sub-agent) so targeted events can reach the one handler bound to it.
// Ids come from allocate(), which draws from a single process-wide counter:
// values start at 1, increase monotonically and are never reused while the
// process lives. A default-constructed EntityId (value 0) is "unset".
//
// EntityId carries no ownership: dropping the last copy frees nothing, and a
// handler bound to an entity stays bound for the lifetime of its registry.
// -----------------------------------------------------------------------------
class EntityId {
 public:
  constexpr EntityId() = default;
  constexpr explicit EntityId(std::uint64_t value) : value_(value) {}

  // Next process-unique id. Safe from any thread.
  static EntityId allocate();

  constexpr std::uint64_t value() const { return value_; }
  constexpr bool valid() const { return value_ != 0; }

  constexpr bool operator==(const EntityId& other) const {
    return value_ == other.value_;
  }
  constexpr bool operator!=(const EntityId& other) const {
    return value_ != other.value_;
  }
  constexpr bool operator<(const EntityId& other) const {
    return value_ < other.value_;
  }

 private:
  std::uint64_t value_{0};
};

}  // namespace amico

namespace std {

template <>
struct hash<amico::EntityId> {
  size_t operator()(const amico::EntityId& id) const noexcept {
    return hash<uint64_t>{}(id.value());
  }
};

}  // namespace std
