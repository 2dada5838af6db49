#include "amico/source/timer_event_source.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace amico {

TimerEventSource::TimerEventSource(std::string event_name,
                                   std::chrono::milliseconds interval,
                                   std::optional<std::uint64_t> max_ticks)
    : event_name_(std::move(event_name)),
      interval_(interval),
      max_ticks_(max_ticks) {}

void TimerEventSource::run(const Sink& sink) {
  auto next = std::chrono::steady_clock::now() + interval_;
  for (;;) {
    std::uint64_t tick = 0;
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_until(lock, next, [this] { return stopped_; })) {
        return;
      }
      if (max_ticks_ && ticks_ >= *max_ticks_) {
        return;
      }
      tick = ++ticks_;
    }

    sink(AgentEvent::make(event_name_, name(), nlohmann::json{{"tick", tick}}));

    if (max_ticks_ && tick >= *max_ticks_) {
      return;
    }
    next += interval_;
  }
}

void TimerEventSource::stop() {
  {
    std::lock_guard lock(mutex_);
    stopped_ = true;
  }
  cv_.notify_all();
}

std::uint64_t TimerEventSource::ticks() const {
  std::lock_guard lock(mutex_);
  return ticks_;
}

}  // namespace amico
