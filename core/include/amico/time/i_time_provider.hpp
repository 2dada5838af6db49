#pragma once

#include <cstdint>

namespace amico {

// -----------------------------------------------------------------------------
// ITimeProvider: abstract wall-clock source
// -----------------------------------------------------------------------------
//
// @brief  Supplies "now" as epoch milliseconds to every component that stamps
//         or checks event expiry.
//
// @details
// AgentEvent expiry is an absolute epoch-ms value. The agent loop compares it
// against now_ms() when the event is pulled from the merged stream, and event
// sources use now_ms() to turn a relative lifetime into an expiry.
//
//   - LiveTimeProvider        delegates to std::chrono::system_clock.
//   - SimulationTimeProvider  returns a value set explicitly, so tests can
//                             expire events without sleeping.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads from any thread.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since 1970-01-01 00:00:00 UTC.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace amico
