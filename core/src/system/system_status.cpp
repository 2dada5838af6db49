#include "amico/system/system_status.hpp"

namespace amico {

// -----------------------------------------------------------------------------
// Free functions: state names and the transition table
// -----------------------------------------------------------------------------
const char* to_string(SystemState state) {
  switch (state) {
    case SystemState::Pending:   return "Pending";
    case SystemState::Running:   return "Running";
    case SystemState::Completed: return "Completed";
    case SystemState::Failed:    return "Failed";
  }
  return "Unknown";
}

bool is_legal_transition(SystemState from, SystemState to) {
  using S = SystemState;

  switch (from) {
    case S::Pending:
      return to == S::Running || to == S::Failed;

    case S::Running:
      return to == S::Completed || to == S::Failed;

    case S::Completed:
    case S::Failed:
      return false;
  }
  return false;
}

}  // namespace amico
