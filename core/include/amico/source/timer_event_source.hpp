#pragma once

#include "amico/source/event_source.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace amico {

// -----------------------------------------------------------------------------
// TimerEventSource
// -----------------------------------------------------------------------------
// Emits AgentEvent{name, content {"tick": n}} every `interval`, n counting
// from 1. With `max_ticks` set, run() returns after that many ticks (the
// source is then exhausted); otherwise it runs until stop(). The first tick
// fires one interval after run() starts.
// -----------------------------------------------------------------------------
class TimerEventSource : public EventSource {
 public:
  TimerEventSource(std::string event_name, std::chrono::milliseconds interval,
                   std::optional<std::uint64_t> max_ticks = std::nullopt);

  std::string name() const override { return "timer:" + event_name_; }
  void run(const Sink& sink) override;
  void stop() override;

  std::uint64_t ticks() const;

 private:
  const std::string event_name_;
  const std::chrono::milliseconds interval_;
  const std::optional<std::uint64_t> max_ticks_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_{false};
  std::uint64_t ticks_{0};
};

}  // namespace amico
