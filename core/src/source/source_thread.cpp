#include "amico/source/source_thread.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace amico {

const char* to_string(OnFinish policy) {
  switch (policy) {
    case OnFinish::Continue: return "continue";
    case OnFinish::Stop: return "stop";
  }
  return "unknown";
}

SourceThread::SourceThread(std::unique_ptr<EventSource> source,
                           OnFinish on_finish, EventSource::Sink sink,
                           FailureCallback on_failure)
    : source_(std::move(source)),
      name_(source_->name()),
      on_finish_(on_finish),
      sink_(std::move(sink)),
      on_failure_(std::move(on_failure)) {}

SourceThread::~SourceThread() { stop(); }

void SourceThread::start() {
  if (thread_.joinable()) {
    return;
  }
  stopping_.store(false);
  finished_.store(false);
  thread_ = std::thread([this] { run(); });
}

void SourceThread::stop() {
  stopping_.store(true);
  source_->stop();
  if (thread_.joinable()) {
    thread_.join();
  }
}

// -----------------------------------------------------------------------------
// run(): body of the source thread
// -----------------------------------------------------------------------------
void SourceThread::run() {
  std::cout << "[SourceThread] '" << name_ << "' started.\n";
  std::optional<std::string> failure;
  try {
    source_->run(sink_);
  } catch (const std::exception& e) {
    failure = e.what();
  } catch (...) {
    failure = "unknown exception";
  }

  if (failure) {
    std::cerr << "[SourceThread] '" << name_ << "' failed: " << *failure
              << "\n";
    finished_.store(true);
    if (on_failure_) {
      on_failure_(name_, *failure);
    }
    return;
  }

  finished_.store(true);
  std::cout << "[SourceThread] '" << name_ << "' finished.\n";

  if (!stopping_.load() && on_finish_ == OnFinish::Stop) {
    sink_(AgentEvent::terminate(name_));
  }
}

}  // namespace amico
