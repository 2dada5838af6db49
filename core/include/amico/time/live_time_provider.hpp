#pragma once

#include "amico/time/i_time_provider.hpp"

namespace amico {

// -----------------------------------------------------------------------------
// LiveTimeProvider: system_clock-backed ITimeProvider
// -----------------------------------------------------------------------------
// Default clock of an Agent that was not handed one explicitly.
// Stateless; safe from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace amico
