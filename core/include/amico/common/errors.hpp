#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace amico {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Typed errors reported through Result<T, E> by the event bus, the
//         system executor, strategies and the agent loop.
//
// @details
// Each error is a plain struct holding a Kind discriminator and a
// human-readable message. Factory functions build the common cases so call
// sites read like `SystemError::notFound("Echo")`.
//
// Thread model: Value types; copied freely across threads.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// EventError: failures of EventBus registration and dispatch
// -----------------------------------------------------------------------------
struct EventError {
  enum class Kind {
    NoHandler,         // targeted event with no handler bound to its entity
    HandlerFailed,     // the single targeted handler failed
    PartialFailure,    // one or more broadcast handlers failed
    DuplicateBinding,  // a targeted handler already bound for (type, entity)
  };

  Kind kind{Kind::HandlerFailed};
  std::string message;

  // PartialFailure only: how many broadcast handlers succeeded / failed, and
  // the failure message of each failed handler in dispatch order.
  std::size_t succeeded{0};
  std::size_t failed{0};
  std::vector<std::string> failures;

  static EventError noHandler(const std::string& event_name,
                              std::uint64_t entity);
  static EventError handlerFailed(const std::string& event_name,
                                  const std::string& reason);
  static EventError partialFailure(const std::string& event_name,
                                   std::size_t succeeded,
                                   std::vector<std::string> failures);
  static EventError duplicateBinding(const std::string& event_name,
                                     std::uint64_t entity);
};

// -----------------------------------------------------------------------------
// SystemError: failures of SystemExecutor::execute and Handle::wait
// -----------------------------------------------------------------------------
struct SystemError {
  enum class Kind {
    ExecutionFailed,  // the system body returned an error or threw
    NotFound,         // no system bound for the requested type pair / id
    Timeout,          // wait_for() elapsed before the body resolved
  };

  Kind kind{Kind::ExecutionFailed};
  std::string message;

  static SystemError executionFailed(const std::string& reason);
  static SystemError notFound(const std::string& what);
  static SystemError timeout(const std::string& what);
};

// -----------------------------------------------------------------------------
// StrategyError: classification of a failed Strategy::process_event
// -----------------------------------------------------------------------------
struct StrategyError {
  enum class Kind {
    Recoverable,  // logged; the loop continues with the next event
    Fatal,        // the loop drains and stops
  };

  Kind kind{Kind::Recoverable};
  std::string message;

  static StrategyError recoverable(std::string message);
  static StrategyError fatal(std::string message);
};

// -----------------------------------------------------------------------------
// AgentError: failures surfaced by the Agent lifecycle API
// -----------------------------------------------------------------------------
struct AgentError {
  enum class Kind {
    SourceFailure,  // an event source hit an unrecoverable I/O failure
    BuildError,     // the agent could not be assembled or started
  };

  enum class BuildKind {
    None,
    AlreadyRunning,    // registration or start() outside the Idle state
    DuplicateBinding,  // handler binding rejected by the bus
    MissingStrategy,   // constructed without a strategy
    InvalidConfig,     // AgentConfig failed validation
    NotStarted,        // wait() on an agent that was never started
  };

  Kind kind{Kind::BuildError};
  BuildKind build{BuildKind::None};
  std::string message;

  static AgentError sourceFailure(const std::string& source,
                                  const std::string& reason);
  static AgentError buildError(BuildKind build, std::string message);
};

const char* to_string(EventError::Kind kind);
const char* to_string(SystemError::Kind kind);
const char* to_string(StrategyError::Kind kind);
const char* to_string(AgentError::Kind kind);
const char* to_string(AgentError::BuildKind kind);

}  // namespace amico
