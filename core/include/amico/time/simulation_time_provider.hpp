#pragma once

#include "amico/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace amico {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is set by the caller.
//
// @details
// Lets tests and replay harnesses decide when an event is considered expired:
// push an event with expiry T, advance the clock past T, and the agent loop
// drops the event when it reaches it.
//
// Thread model:
//   advance_time() and now_ms() are atomic and may be called from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock. Monotonicity is the caller's responsibility.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace amico
