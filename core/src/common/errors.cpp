#include "amico/common/errors.hpp"

#include <utility>

namespace amico {

// -----------------------------------------------------------------------------
// EventError factories
// -----------------------------------------------------------------------------
EventError EventError::noHandler(const std::string& event_name,
                                 std::uint64_t entity) {
  EventError e;
  e.kind = Kind::NoHandler;
  e.message = "no handler bound for " + event_name + " on entity " +
              std::to_string(entity);
  return e;
}

EventError EventError::handlerFailed(const std::string& event_name,
                                     const std::string& reason) {
  EventError e;
  e.kind = Kind::HandlerFailed;
  e.message = "handler for " + event_name + " failed: " + reason;
  e.failed = 1;
  e.failures.push_back(reason);
  return e;
}

EventError EventError::partialFailure(const std::string& event_name,
                                      std::size_t succeeded,
                                      std::vector<std::string> failures) {
  EventError e;
  e.kind = Kind::PartialFailure;
  e.succeeded = succeeded;
  e.failed = failures.size();
  e.message = std::to_string(e.failed) + " of " +
              std::to_string(succeeded + e.failed) + " handlers for " +
              event_name + " failed";
  e.failures = std::move(failures);
  return e;
}

EventError EventError::duplicateBinding(const std::string& event_name,
                                        std::uint64_t entity) {
  EventError e;
  e.kind = Kind::DuplicateBinding;
  e.message = "a handler for " + event_name + " is already bound to entity " +
              std::to_string(entity);
  return e;
}

// -----------------------------------------------------------------------------
// SystemError factories
// -----------------------------------------------------------------------------
SystemError SystemError::executionFailed(const std::string& reason) {
  return SystemError{Kind::ExecutionFailed, reason};
}

SystemError SystemError::notFound(const std::string& what) {
  return SystemError{Kind::NotFound, what + " not found"};
}

SystemError SystemError::timeout(const std::string& what) {
  return SystemError{Kind::Timeout, what + " timed out"};
}

// -----------------------------------------------------------------------------
// StrategyError factories
// -----------------------------------------------------------------------------
StrategyError StrategyError::recoverable(std::string message) {
  return StrategyError{Kind::Recoverable, std::move(message)};
}

StrategyError StrategyError::fatal(std::string message) {
  return StrategyError{Kind::Fatal, std::move(message)};
}

// -----------------------------------------------------------------------------
// AgentError factories
// -----------------------------------------------------------------------------
AgentError AgentError::sourceFailure(const std::string& source,
                                     const std::string& reason) {
  AgentError e;
  e.kind = Kind::SourceFailure;
  e.message = "event source '" + source + "' failed: " + reason;
  return e;
}

AgentError AgentError::buildError(BuildKind build, std::string message) {
  AgentError e;
  e.kind = Kind::BuildError;
  e.build = build;
  e.message = std::move(message);
  return e;
}

// -----------------------------------------------------------------------------
// to_string overloads
// -----------------------------------------------------------------------------
const char* to_string(EventError::Kind kind) {
  using K = EventError::Kind;
  switch (kind) {
    case K::NoHandler:        return "NoHandler";
    case K::HandlerFailed:    return "HandlerFailed";
    case K::PartialFailure:   return "PartialFailure";
    case K::DuplicateBinding: return "DuplicateBinding";
  }
  return "Unknown";
}

const char* to_string(SystemError::Kind kind) {
  using K = SystemError::Kind;
  switch (kind) {
    case K::ExecutionFailed: return "ExecutionFailed";
    case K::NotFound:        return "NotFound";
    case K::Timeout:         return "Timeout";
  }
  return "Unknown";
}

const char* to_string(StrategyError::Kind kind) {
  switch (kind) {
    case StrategyError::Kind::Recoverable: return "Recoverable";
    case StrategyError::Kind::Fatal:       return "Fatal";
  }
  return "Unknown";
}

const char* to_string(AgentError::Kind kind) {
  switch (kind) {
    case AgentError::Kind::SourceFailure: return "SourceFailure";
    case AgentError::Kind::BuildError:    return "BuildError";
  }
  return "Unknown";
}

const char* to_string(AgentError::BuildKind kind) {
  using B = AgentError::BuildKind;
  switch (kind) {
    case B::None:             return "None";
    case B::AlreadyRunning:   return "AlreadyRunning";
    case B::DuplicateBinding: return "DuplicateBinding";
    case B::MissingStrategy:  return "MissingStrategy";
    case B::InvalidConfig:    return "InvalidConfig";
    case B::NotStarted:       return "NotStarted";
  }
  return "Unknown";
}

}  // namespace amico
