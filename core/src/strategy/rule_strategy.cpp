#include "amico/strategy/rule_strategy.hpp"

#include <utility>

namespace amico {

RuleStrategy::RuleStrategy(std::string name) : name_(std::move(name)) {}

RuleStrategy& RuleStrategy::on(const std::string& event_name, Rule rule) {
  rules_[event_name] = std::move(rule);
  return *this;
}

RuleStrategy& RuleStrategy::otherwise(Rule rule) {
  fallback_ = std::move(rule);
  return *this;
}

bool RuleStrategy::handles(const std::string& event_name) const {
  return rules_.count(event_name) != 0 || fallback_.has_value();
}

StrategyOutcome RuleStrategy::process_event(const AgentEvent& event,
                                            Context& context,
                                            const SystemExecutor& executor) {
  auto it = rules_.find(event.name);
  if (it != rules_.end()) {
    return it->second(event, context, executor);
  }

  if (event.is_terminate() || event.name == kTerminateEvent) {
    return StrategyOutcome::success(StrategyResult::finish());
  }

  if (fallback_) {
    return (*fallback_)(event, context, executor);
  }

  return StrategyOutcome::failure(StrategyError::recoverable(
      name_ + ": no rule for event '" + event.name + "'"));
}

}  // namespace amico
