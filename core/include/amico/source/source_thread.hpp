#pragma once

#include "amico/source/event_source.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace amico {

// -----------------------------------------------------------------------------
// SourceThread: dedicated thread running one EventSource
// -----------------------------------------------------------------------------
//
// @brief  Runs EventSource::run() on its own std::thread, feeding the
//         agent's merged event queue through the sink.
//
// @details
// Event sources own blocking receive loops (a timer wait, a ZeroMQ recv with
// a timeout), so they get a raw thread rather than a queue consumer.
//
// When run() returns normally and the thread was not asked to stop, the
// OnFinish policy applies: Stop pushes AgentEvent::terminate(name) into the
// sink. When run() throws, the failure callback receives the source name and
// the exception message; the thread then exits.
//
// Thread model:
//   start()/stop() are called by the Agent (start on the caller of
//   Agent::start, stop on the loop thread while draining or on destruction).
//   The sink and the failure callback run on the internal thread.
//
// Ownership:
//   Owned by the Agent via std::unique_ptr. Owns its EventSource.
// -----------------------------------------------------------------------------
class SourceThread {
 public:
  using FailureCallback =
      std::function<void(const std::string& source, const std::string& reason)>;

  SourceThread(std::unique_ptr<EventSource> source, OnFinish on_finish,
               EventSource::Sink sink, FailureCallback on_failure);

  // RAII: stop() joins the thread.
  ~SourceThread();

  SourceThread(const SourceThread&) = delete;
  SourceThread& operator=(const SourceThread&) = delete;
  SourceThread(SourceThread&&) = delete;
  SourceThread& operator=(SourceThread&&) = delete;

  // Spawns the thread. Idempotent.
  void start();

  // Signals the source and joins the thread. Idempotent; safe if never
  // started.
  void stop();

  std::string name() const { return name_; }
  OnFinish on_finish() const { return on_finish_; }
  bool finished() const { return finished_.load(); }

 private:
  void run();

  std::unique_ptr<EventSource> source_;
  const std::string name_;
  const OnFinish on_finish_;
  EventSource::Sink sink_;
  FailureCallback on_failure_;

  std::atomic<bool> stopping_{false};
  std::atomic<bool> finished_{false};
  std::thread thread_;
};

}  // namespace amico
