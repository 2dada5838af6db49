#pragma once

#include "amico/common/errors.hpp"
#include "amico/common/result.hpp"
#include "amico/events/agent_event.hpp"
#include "amico/strategy/agent_action.hpp"
#include "amico/strategy/context.hpp"
#include "amico/system/system_executor.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace amico {

// -----------------------------------------------------------------------------
// StrategyResult
// -----------------------------------------------------------------------------
// Decision output of one Strategy call: an optional response text, the
// ordered actions to apply, and whether the agent should keep going.
// -----------------------------------------------------------------------------
struct StrategyResult {
  std::optional<std::string> response;
  std::vector<AgentAction> actions;
  bool should_continue{true};

  static StrategyResult proceed() { return StrategyResult{}; }

  static StrategyResult finish() {
    StrategyResult r;
    r.should_continue = false;
    return r;
  }

  StrategyResult& respond(std::string text) {
    response = std::move(text);
    return *this;
  }

  StrategyResult& then(AgentAction action) {
    actions.push_back(std::move(action));
    return *this;
  }
};

using StrategyOutcome = Result<StrategyResult, StrategyError>;

// -----------------------------------------------------------------------------
// Strategy
// -----------------------------------------------------------------------------
//
// @brief  Decision component: maps one external event plus the agent's
//         context to a StrategyResult.
//
// @details
// The returned action list is the only channel through which a Strategy
// causes side effects: systems run and events are sent when the Agent
// applies the actions, in order, after process_event() returns. The executor
// is passed read-only so a Strategy can look at earlier invocations
// (get_execution_status, get_system_metrics) while deciding.
//
// All state that must survive between events lives in `context`; a Strategy
// must not keep hidden mutable state of its own. Neither `context` nor
// `executor` may be retained past the call.
//
// Errors: StrategyError::Recoverable skips the event; StrategyError::Fatal
// drains and stops the agent. A std::exception escaping process_event() is
// treated as Fatal.
//
// Thread model: Called only on the agent loop thread, one event at a time.
// -----------------------------------------------------------------------------
class Strategy {
 public:
  virtual ~Strategy() = default;

  virtual StrategyOutcome process_event(const AgentEvent& event,
                                        Context& context,
                                        const SystemExecutor& executor) = 0;

  virtual std::string name() const { return "strategy"; }
};

}  // namespace amico
