#pragma once

#include "amico/common/errors.hpp"
#include "amico/common/result.hpp"
#include "amico/system/system_status.hpp"

#include <chrono>
#include <future>
#include <string>
#include <utility>

namespace amico {

// -----------------------------------------------------------------------------
// Handle<Out>
// -----------------------------------------------------------------------------
//
// @brief  Reference to one system invocation returned by
//         SystemExecutor::execute().
//
// @details
// wait() blocks the caller until the body has resolved and returns its
// outcome. Handles are cheap to copy (they share one std::shared_future);
// dropping every copy leaves the invocation running, its result simply goes
// unobserved.
//
// The executor records the terminal status before it resolves the handle, so
// once wait() returns, get_execution_status(id()) already reads Completed or
// Failed.
// -----------------------------------------------------------------------------
template <typename Out>
class Handle {
 public:
  using Output = Out;
  using Outcome = Result<Out, SystemError>;

  Handle() = default;
  Handle(ExecutionId id, std::shared_future<Outcome> future)
      : id_(id), future_(std::move(future)) {}

  ExecutionId id() const { return id_; }
  bool valid() const { return future_.valid(); }

  bool ready() const {
    return valid() && future_.wait_for(std::chrono::seconds(0)) ==
                          std::future_status::ready;
  }

  // Blocks until the invocation resolves.
  Outcome wait() const {
    if (!valid()) {
      return Outcome::failure(
          SystemError::notFound("execution #" + std::to_string(id_)));
    }
    try {
      return future_.get();
    } catch (const std::future_error& e) {
      return Outcome::failure(SystemError::executionFailed(e.what()));
    }
  }

  // Like wait(), but gives up after `timeout` with SystemError::Timeout.
  template <typename Rep, typename Period>
  Outcome wait_for(std::chrono::duration<Rep, Period> timeout) const {
    if (valid() &&
        future_.wait_for(timeout) != std::future_status::ready) {
      return Outcome::failure(
          SystemError::timeout("execution #" + std::to_string(id_)));
    }
    return wait();
  }

 private:
  ExecutionId id_{0};
  std::shared_future<Outcome> future_;
};

}  // namespace amico
