#pragma once

#include "amico/strategy/strategy.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace amico {

// -----------------------------------------------------------------------------
// RuleStrategy
// -----------------------------------------------------------------------------
//
// @brief  Strategy that dispatches on AgentEvent::name to a table of rules.
//
// @details
// Each rule is a callable with the Strategy::process_event signature. Events
// carrying the Terminate instruction, or named "terminate", finish the agent
// unless a rule for "terminate" is installed. An event without a matching
// rule goes to the fallback when one is set and is otherwise rejected with a
// Recoverable error, so the loop logs it and moves on.
//
//   auto s = std::make_unique<RuleStrategy>("echo");
//   s->on("chat", [](const AgentEvent& e, Context& ctx, const SystemExecutor&) {
//     return StrategyOutcome::success(StrategyResult::proceed().respond("hi"));
//   });
//
// Rules are installed before the strategy is handed to the Agent; the table
// is not synchronized.
// -----------------------------------------------------------------------------
class RuleStrategy : public Strategy {
 public:
  using Rule = std::function<StrategyOutcome(const AgentEvent&, Context&,
                                             const SystemExecutor&)>;

  static constexpr const char* kTerminateEvent = "terminate";

  explicit RuleStrategy(std::string name = "rules");

  // Installs (or replaces) the rule for events named `event_name`.
  RuleStrategy& on(const std::string& event_name, Rule rule);

  // Rule for events no other rule matches.
  RuleStrategy& otherwise(Rule rule);

  bool handles(const std::string& event_name) const;

  StrategyOutcome process_event(const AgentEvent& event, Context& context,
                                const SystemExecutor& executor) override;

  std::string name() const override { return name_; }

 private:
  std::string name_;
  std::unordered_map<std::string, Rule> rules_;
  std::optional<Rule> fallback_;
};

}  // namespace amico
